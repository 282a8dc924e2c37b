#include <benchmark/benchmark.h>
#include "wccforest/engine/forest_engine.h"
#include "wccforest/storage/memory_graph_store.h"
#include "wccforest/common/logger.h"
#include <random>

namespace wccforest {
namespace bench {
namespace {

constexpr core::Timestamp kStart = 1700000000000;

// Events over a pool of shared cards and devices so components form
std::vector<core::Entity> RandomEntities(std::mt19937_64& gen, int64_t pool) {
    std::uniform_int_distribution<int64_t> pick(0, pool - 1);
    return {core::Entity(core::EntityType::CREDIT_CARD, "card-" + std::to_string(pick(gen))),
            core::Entity(core::EntityType::DEVICE, "dev-" + std::to_string(pick(gen)))};
}

std::unique_ptr<engine::ForestEngine> BuildEngine(int64_t events, int64_t pool) {
    auto engine = std::make_unique<engine::ForestEngine>(std::make_shared<storage::MemoryGraphStore>());
    core::ForestConfig config = core::ForestConfig::Default();
    config.batch.shuffle_seed = 1;
    if (!engine->init(config).ok()) {
        return nullptr;
    }
    std::mt19937_64 gen(42);
    for (int64_t i = 0; i < events; ++i) {
        core::Event event(static_cast<core::EventId>(i + 1), kStart + i * 1000, "txn");
        if (!engine->ingest(event, RandomEntities(gen, pool)).ok()) {
            return nullptr;
        }
    }
    if (!engine->process().ok()) {
        return nullptr;
    }
    return engine;
}

static void BM_ProcessBatch(benchmark::State& state) {
    common::Logger::SetLevel(spdlog::level::warn);
    for (auto _ : state) {
        auto engine = BuildEngine(state.range(0), state.range(0) / 4);
        if (!engine) {
            state.SkipWithError("engine setup failed");
            break;
        }
        benchmark::DoNotOptimize(engine->stats());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_RealtimeScore(benchmark::State& state) {
    common::Logger::SetLevel(spdlog::level::warn);
    const int64_t events = state.range(0);
    auto engine = BuildEngine(events, events / 4);
    if (!engine) {
        state.SkipWithError("engine setup failed");
        return;
    }
    std::mt19937_64 gen(7);
    core::EventId next = static_cast<core::EventId>(events + 1);
    for (auto _ : state) {
        core::Event incoming(next, kStart + events * 1000, "txn");
        auto features = engine->score(incoming, RandomEntities(gen, events / 4));
        if (!features.ok()) {
            state.SkipWithError(features.error().c_str());
            break;
        }
        benchmark::DoNotOptimize(features.value());
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_TrainingSet(benchmark::State& state) {
    common::Logger::SetLevel(spdlog::level::warn);
    const int64_t events = state.range(0);
    auto engine = BuildEngine(events, events / 4);
    if (!engine) {
        state.SkipWithError("engine setup failed");
        return;
    }
    for (auto _ : state) {
        auto records = engine->training_set(kStart + events * 1000);
        if (!records.ok()) {
            state.SkipWithError(records.error().c_str());
            break;
        }
        benchmark::DoNotOptimize(records.value().size());
    }
    state.SetItemsProcessed(state.iterations() * events);
}

BENCHMARK(BM_ProcessBatch)->Arg(1000)->Arg(10000);
BENCHMARK(BM_RealtimeScore)->Arg(1000)->Arg(10000);
BENCHMARK(BM_TrainingSet)->Arg(1000)->Arg(10000);

} // namespace
} // namespace bench
} // namespace wccforest

BENCHMARK_MAIN();
