#include <spdlog/spdlog.h>

#include "cli_options.hpp"
#include <expected>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>
#include <telescore/config.hpp>
#include <telescore/errors.hpp>
#include <telescore/logging.hpp>
#include <telescore/model_registry.hpp>
#include <telescore/record_json.hpp>
#include <telescore/scoring.hpp>
#include <utility>
#include <vector>

using namespace telescore;

namespace {

nlohmann::json read_input(const std::string& source) {
  std::string text;
  if (source == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream file(source);
    if (!file) throw ValidationError("input", "cannot open input file: " + source);
    text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) throw ValidationError("input", "input is not valid JSON");
  return parsed;
}

void print(const nlohmann::json& j, bool pretty) {
  std::cout << (pretty ? j.dump(2) : j.dump()) << '\n';
}

// A single object prints one prediction (validation errors abort); an array prints
// the batch envelope with per-record failures inlined.
int run_score(const ModelRegistry& registry, const RuntimeConfig& config,
              const std::string& source) {
  auto input = read_input(source);
  auto options = config.scoring_options();

  if (input.is_object()) {
    print(to_json(score_customer(registry, parse_customer_record(input), options)), config.pretty);
    return cli::EXIT_OK;
  }
  if (!input.is_array()) throw ValidationError("input", "expected a JSON object or array");

  std::vector<ScoreOutcome> outcomes(input.size());
  std::vector<CustomerRecord> records;
  std::vector<std::size_t> slots;
  for (std::size_t i = 0; i < input.size(); ++i) {
    try {
      records.push_back(parse_customer_record(input[i]));
      slots.push_back(i);
    } catch (const ValidationError& e) {
      spdlog::debug("Record {} rejected: {}", i, e.what());
      outcomes[i] = std::unexpected(ScoringFailure{FailureKind::Validation, e.field(), e.what()});
    }
  }

  auto scored = score_batch(registry, records, options);
  for (std::size_t k = 0; k < scored.size(); ++k) outcomes[slots[k]] = std::move(scored[k]);

  print(to_json(outcomes), config.pretty);
  return cli::EXIT_OK;
}

}  // namespace

int main(int argc, char* argv[]) {
  cli::Invocation inv;
  try {
    inv = cli::parse_command_line(argc, argv, RuntimeConfig::load_from_env());
    if (inv.show_help) {
      std::cout << inv.help_text;
      return cli::EXIT_OK;
    }
    init_logging("telescore", inv.config.log_level);
  } catch (const std::exception& e) {
    std::cerr << "telescore: " << e.what() << '\n' << cli::USAGE;
    return cli::EXIT_USAGE;
  }
  const auto& config = inv.config;

  auto registry = ModelRegistry::try_load(config.artifact_path);
  if (!registry) {
    spdlog::critical("Failed to load scoring artifact: {}", registry.error());
    return cli::EXIT_LOAD_FAILURE;
  }

  try {
    if (inv.command == "info") {
      print(to_json((*registry)->summary()), config.pretty);
      return cli::EXIT_OK;
    }
    return run_score(**registry, config, inv.input);
  } catch (const ValidationError& e) {
    spdlog::error("Invalid input ({}): {}", e.field(), e.what());
    return cli::exit_code_for(e);
  } catch (const std::exception& e) {
    spdlog::critical("Scoring failed: {}", e.what());
    return cli::exit_code_for(e);
  }
}
