#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <utility>
#include <telescore/logging.hpp>

namespace telescore {

void init_logging(const std::string& process_name, const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str falls back to "off" for unknown names
  if (parsed == spdlog::level::off && level != "off") {
    throw std::runtime_error(fmt::format("Unknown log level '{}'", level));
  }

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(process_name, sink);
  logger->set_level(parsed);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

  spdlog::set_default_logger(std::move(logger));
}

}  // namespace telescore
