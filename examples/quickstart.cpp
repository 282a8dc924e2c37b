#include "wccforest/engine/forest_engine.h"
#include "wccforest/storage/memory_graph_store.h"
#include "wccforest/common/logger.h"
#include "wccforest/config.h"
#include <iostream>

using namespace wccforest;

namespace {

void print_features(const core::FeatureRecord& record) {
    std::cout << "  " << record.to_string() << std::endl;
}

} // namespace

int main() {
    common::Logger::Init();
    
    std::cout << "=== wccforest " << WCCFOREST_VERSION << " Quick Start Example ===" << std::endl;
    
    auto store = std::make_shared<storage::MemoryGraphStore>();
    engine::ForestEngine engine(store);
    
    core::ForestConfig config = core::ForestConfig::Default();
    config.batch.num_workers = 2;
    config.batch.shuffle_seed = 42;
    
    auto init_result = engine.init(config);
    if (!init_result.ok()) {
        std::cerr << "Init failed: " << init_result.error() << std::endl;
        return 1;
    }
    std::cout << "✅ Engine initialized" << std::endl;
    
    // a1 -ip- a2 -email- a3 -device- a4, one minute apart
    const core::Timestamp t0 = 1700000000000;
    const core::Entity ip{core::EntityType::IP_ADDRESS, "10.0.0.1"};
    const core::Entity email{core::EntityType::EMAIL, "alice@example.com"};
    const core::Entity device{core::EntityType::DEVICE, "dev-7"};
    
    struct Ingest {
        core::Event event;
        std::vector<core::Entity> entities;
    };
    std::vector<Ingest> batch = {
        {core::Event(1, t0, "login"), {ip}},
        {core::Event(2, t0 + 60000, "purchase", 25.0), {ip, email}},
        {core::Event(3, t0 + 120000, "purchase", 40.0), {email, device}},
        {core::Event(4, t0 + 180000, "purchase", 99.0), {device}},
    };
    for (const auto& item : batch) {
        auto ingest_result = engine.ingest(item.event, item.entities);
        if (!ingest_result.ok()) {
            std::cerr << "Ingest failed: " << ingest_result.error() << std::endl;
            return 1;
        }
    }
    std::cout << "✅ Ingested " << batch.size() << " events" << std::endl;
    
    auto process_result = engine.process();
    if (!process_result.ok()) {
        std::cerr << "Process failed: " << process_result.error() << std::endl;
        return 1;
    }
    std::cout << "✅ Processed: " << process_result.value().batch.to_string() << std::endl;
    
    auto metrics = store->get_metrics(4);
    if (metrics.ok() && metrics.value()) {
        const auto& m = *metrics.value();
        std::cout << "Component at event 4: size=" << m.size
                  << " diameter=" << (m.diameter ? std::to_string(*m.diameter) : "n/a")
                  << " velocity=" << m.velocity << "/s" << std::endl;
    }
    
    // Score a new event sharing the device
    core::Event incoming(5, t0 + 240000, "purchase", 500.0);
    auto score_result = engine.score(incoming, {device});
    if (!score_result.ok()) {
        std::cerr << "Scoring failed: " << score_result.error() << std::endl;
        return 1;
    }
    std::cout << "Real-time features:" << std::endl;
    print_features(score_result.value());
    
    auto training = engine.training_set(t0 + 180000);
    if (training.ok()) {
        std::cout << "Training features (" << training.value().size() << " events):" << std::endl;
        for (const auto& record : training.value()) {
            print_features(record);
        }
    } else {
        std::cerr << "Training extraction failed: " << training.error() << std::endl;
    }
    
    std::cout << "Store: " << engine.stats().to_string() << std::endl;
    std::cout << "✅ Quick start complete!" << std::endl;
    return 0;
}
