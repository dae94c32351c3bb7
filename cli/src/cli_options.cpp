#include "cli_options.hpp"

#include <boost/program_options.hpp>
#include <sstream>
#include <stdexcept>
#include <telescore/errors.hpp>
#include <utility>

namespace po = boost::program_options;

namespace telescore::cli {

Invocation parse_command_line(int argc, const char* const argv[], RuntimeConfig base) {
  Invocation inv{.config = std::move(base)};
  auto& config = inv.config;

  std::string inference = std::string(to_string(config.inference));
  po::options_description description("Options");
  description.add_options()
      ("help,h", "Show this help")
      ("artifact,a", po::value(&config.artifact_path)->default_value(config.artifact_path),
       "Scoring artifact (JSON, or MessagePack for .msgpack/.mpk/.bin)")
      ("log-level", po::value(&config.log_level)->default_value(config.log_level),
       "trace|debug|info|warn|error|critical|off")
      ("inference", po::value(&inference)->default_value(inference),
       "sequential|concurrent")
      ("pretty", po::bool_switch(&config.pretty)->default_value(config.pretty),
       "Indent JSON output");

  po::options_description hidden;
  hidden.add_options()
      ("command", po::value(&inv.command))
      ("input", po::value(&inv.input));

  po::options_description all;
  all.add(description).add(hidden);

  po::positional_options_description positional;
  positional.add("command", 1).add("input", 1);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::ostringstream help;
    help << USAGE << '\n' << description;
    inv.show_help = true;
    inv.help_text = help.str();
    return inv;
  }

  config.inference = parse_inference_mode(inference);
  config.validate();

  if (inv.command != "info" && inv.command != "score") {
    throw std::invalid_argument(inv.command.empty() ? "missing command"
                                                    : "unknown command '" + inv.command + "'");
  }
  if (inv.command == "score" && inv.input.empty()) {
    throw std::invalid_argument("score: missing FILE (use - for stdin)");
  }
  return inv;
}

int exit_code_for(const std::exception& e) noexcept {
  if (dynamic_cast<const ValidationError*>(&e)) return EXIT_USAGE;
  if (dynamic_cast<const ModelLoadError*>(&e)) return EXIT_LOAD_FAILURE;
  return EXIT_SCORING_FAILURE;
}

}  // namespace telescore::cli
