#include <benchmark/benchmark.h>

#include <cstdint>
#include <random>
#include <string>
#include <telescore/artifact.hpp>
#include <telescore/feature_encoder.hpp>
#include <telescore/model_registry.hpp>
#include <telescore/scoring.hpp>
#include <vector>

#include "bench_utils.hpp"

using namespace telescore;

namespace {

std::vector<CustomerRecord> generate_records(size_t n, uint32_t seed = 42) {
  static const std::vector<std::string> states = {"CA", "NY", "TX", "OH", "WA", "NJ"};
  static const std::vector<std::string> area_codes = {"408", "415", "510"};

  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> minutes(0.0, 350.0);
  std::uniform_int_distribution<int> calls(0, 160);
  std::uniform_int_distribution<int> service(0, 9);
  std::uniform_int_distribution<size_t> pick(0, 1000);

  std::vector<CustomerRecord> records(n);
  for (auto& r : records) {
    r.account_length = calls(rng);
    r.state = states[pick(rng) % states.size()];
    r.area_code = area_codes[pick(rng) % area_codes.size()];
    r.international_plan = pick(rng) % 10 == 0;
    r.voicemail_plan = pick(rng) % 4 == 0;
    r.voicemail_messages = r.voicemail_plan ? calls(rng) % 50 : 0;
    for (CallUsage* u : {&r.day, &r.evening, &r.night}) {
      u->minutes = minutes(rng);
      u->calls = calls(rng);
      u->charge = u->minutes * 0.1;
    }
    r.international = CallUsage{.minutes = minutes(rng) / 20.0, .calls = calls(rng) % 20,
                                .charge = 0.0};
    r.international.charge = r.international.minutes * 0.27;
    r.customer_service_calls = service(rng);
  }
  return records;
}

}  // namespace

// =============================================================================
// Artifact Loading Benchmarks
// =============================================================================

static void BM_ArtifactLoad_Json(benchmark::State& state) {
  const auto path = bench_utils::GetFixturePath("telelink_artifact.json");
  for (auto _ : state) {
    auto artifact = ScoringArtifact::from_json(path);
    benchmark::DoNotOptimize(artifact);
  }
}
BENCHMARK(BM_ArtifactLoad_Json)->Unit(benchmark::kMicrosecond);

static void BM_RegistryBuild(benchmark::State& state) {
  const auto artifact = ScoringArtifact::from_json(bench_utils::GetFixturePath("telelink_artifact.json"));
  for (auto _ : state) {
    auto registry = ModelRegistry::from_artifact(artifact);
    benchmark::DoNotOptimize(registry);
  }
}
BENCHMARK(BM_RegistryBuild)->Unit(benchmark::kMicrosecond);

// =============================================================================
// Scoring Benchmarks
// =============================================================================

static void BM_Encode(benchmark::State& state) {
  auto registry = ModelRegistry::load(bench_utils::GetFixturePath("telelink_artifact.json"));
  auto records = generate_records(1);
  FeatureEncoder encoder(registry->feature_spec());
  for (auto _ : state) {
    auto x = encoder.encode(records[0]);
    benchmark::DoNotOptimize(x);
  }
}
BENCHMARK(BM_Encode);

static void BM_ScoreCustomer(benchmark::State& state) {
  auto registry = ModelRegistry::load(bench_utils::GetFixturePath("telelink_artifact.json"));
  auto records = generate_records(1);
  ScoringOptions options{.inference = state.range(0) ? InferenceMode::Concurrent
                                                     : InferenceMode::Sequential};
  for (auto _ : state) {
    auto result = score_customer(*registry, records[0], options);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_ScoreCustomer)->Arg(0)->Arg(1)->ArgNames({"concurrent"});

static void BM_ScoreBatch(benchmark::State& state) {
  auto registry = ModelRegistry::load(bench_utils::GetFixturePath("telelink_artifact.json"));
  auto records = generate_records(static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto results = score_batch(*registry, records);
    benchmark::DoNotOptimize(results);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ScoreBatch)->Arg(100)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);
