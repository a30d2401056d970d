/**
 * @file product_count.cpp
 * @brief Example: count orders per product and query the counts
 *
 * orders -> by-product -> count(prod-id-count-store) -> sink
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "streamiq/streamiq.hpp"

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*signal*/) {
    g_shutdown.store(true);
}

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "=== StreamIQ Product Count ===" << std::endl;
    std::cout << "Version: " << streamiq::VERSION << std::endl;

    streamiq::Properties props{
        {"streamiq.binder.application-id", "product-count"},
        {"streamiq.binder.state-store-retry.max-attempts", "10"},
        {"streamiq.binder.state-store-retry.backoff-period", "200"},
        {"streamiq.binder.log-level", "info"},
        {"streamiq.binder.configuration.application.server", "localhost:8080"},
        {"streamiq.binder.configuration.num.stream.threads", "2"},
    };

    try {
        auto binder = streamiq::BinderConfig::from_properties(props);
        streamiq::set_log_level(binder.log_level);

        constexpr std::uint64_t ORDERS = 10000;

        streamiq::SequenceSource::Config source_config;
        source_config.start = 1;
        source_config.count = ORDERS;
        source_config.delay = std::chrono::microseconds(50);

        std::atomic<std::uint64_t> counted{0};

        streamiq::TopologyBuilder builder;
        builder
            .add_source(std::make_unique<streamiq::SequenceSource>("orders", source_config))
            .add_processor(streamiq::make_key_selector("by-product", [](const streamiq::Record& order) {
                return streamiq::Payload{120 + order.get<std::int64_t>() % 10};
            }))
            .add_processor(std::make_unique<streamiq::CountProcessor>("count", "prod-id-count-store"))
            .add_sink(streamiq::make_sink("sink", [&counted](const streamiq::Record&) { counted++; }))
            .connect("orders", "by-product")
            .connect("by-product", "count")
            .connect("count", "sink")
            .add_state_store({"prod-id-count-store", streamiq::StoreType::KeyValue}, {"count"});

        streamiq::StreamsBinderMetrics metrics;
        streamiq::StreamsRegistry registry(&metrics);
        streamiq::StreamsEngine engine(std::move(builder), binder.streams_config());
        registry.register_instance(engine);
        engine.start();

        streamiq::InteractiveQueryService service(registry, binder);
        auto counts = service.get_queryable_store(
            "prod-id-count-store", streamiq::queryable_store_types::key_value_store());

        auto started = std::chrono::steady_clock::now();
        while (!g_shutdown.load() && counted.load() < ORDERS) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));

            auto count = counts.get(std::int64_t{123});
            std::cout << "\rproduct 123: " << (count ? streamiq::to_string(*count) : "-")
                      << " | " << metrics.format() << std::flush;

            if (std::chrono::steady_clock::now() - started > std::chrono::seconds(30)) {
                std::cout << "\nTimeout reached, stopping..." << std::endl;
                break;
            }
        }
        std::cout << std::endl;

        std::cout << "\n=== Counts ===" << std::endl;
        for (const auto& [product, count] : counts.all()) {
            std::cout << "product " << streamiq::to_string(product)
                      << ": " << streamiq::to_string(count) << std::endl;
        }

        auto host = service.get_host_info<std::int64_t>(
            "prod-id-count-store", 123, streamiq::LongSerializer{});
        if (host) {
            std::cout << "product 123 is served by " << host->to_string() << std::endl;
        }

        engine.close();
        registry.unregister_instance(engine);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
