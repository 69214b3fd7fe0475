#include "flagpole/core/flag_registry.h"
#include <benchmark/benchmark.h>
#include <memory>
#include <string>
#include <vector>

using namespace flagpole::core;
using json = nlohmann::json;

namespace {

std::vector<std::string> flagNames(int count) {
    std::vector<std::string> names;
    for (int i = 0; i < count; ++i) {
        names.push_back("FLAG_" + std::to_string(i));
    }
    return names;
}

// Benchmark fixture: state.range(0) flags, each handler depending on the
// flag state.range(1) positions before it (0 means no dependencies)
class FlagRegistryBenchmark : public benchmark::Fixture {
protected:
    void SetUp(const benchmark::State& state) override {
        const int numFlags = static_cast<int>(state.range(0));
        const int stride = static_cast<int>(state.range(1));

        space_ = std::make_unique<FlagSpace>(flagNames(numFlags));
        registry_ = std::make_unique<FlagRegistry>(*space_);

        for (int i = 0; i < numFlags; ++i) {
            FlagMask flag = FlagMask{1} << i;
            FlagMask dependsOn = (stride > 0 && i >= stride) ? FlagMask{1} << (i - stride) : 0;
            std::string key = "key_" + std::to_string(i);
            registry_->registerHandler(flag, [i](const HandlerCall&) { return json(i); },
                                       key, dependsOn);
        }
    }

    void TearDown(const benchmark::State&) override {
        registry_.reset();
        space_.reset();
    }

    std::unique_ptr<FlagSpace> space_;
    std::unique_ptr<FlagRegistry> registry_;
};

} // namespace

// Benchmark dependency resolution alone
BENCHMARK_DEFINE_F(FlagRegistryBenchmark, Plan)(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(registry_->plan(space_->all()));
    }
}
BENCHMARK_REGISTER_F(FlagRegistryBenchmark, Plan)
    ->Args({8, 0})
    ->Args({32, 1})
    ->Args({64, 1})
    ->Args({64, 4})
    ->Unit(benchmark::kMicrosecond);

// Benchmark a full build into a fresh structure
BENCHMARK_DEFINE_F(FlagRegistryBenchmark, BuildAll)(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(registry_->build(space_->all()));
    }
}
BENCHMARK_REGISTER_F(FlagRegistryBenchmark, BuildAll)
    ->Args({8, 0})
    ->Args({32, 1})
    ->Args({64, 1})
    ->Args({64, 4})
    ->Unit(benchmark::kMicrosecond);

// Benchmark requesting the last flag of a dependency chain
BENCHMARK_DEFINE_F(FlagRegistryBenchmark, BuildChainTail)(benchmark::State& state) {
    FlagMask tail = FlagMask{1} << (state.range(0) - 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(registry_->build(tail));
    }
}
BENCHMARK_REGISTER_F(FlagRegistryBenchmark, BuildChainTail)
    ->Args({32, 1})
    ->Args({64, 1})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
