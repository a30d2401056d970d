/**
 * @file query_benchmark.cpp
 * @brief Lookup and partitioning benchmarks for StreamIQ
 */

#include <benchmark/benchmark.h>

#include "streamiq/streamiq.hpp"

using namespace streamiq;

namespace {

std::shared_ptr<KeyValueStore> filled_store(std::int64_t entries) {
    auto store = std::make_shared<KeyValueStore>("counts");
    for (std::int64_t i = 0; i < entries; i++) {
        store->put(i, i);
    }
    store->mark_running();
    return store;
}

/**
 * @brief Minimal always-running instance serving one store
 */
class StaticInstance : public StreamsInstance {
public:
    explicit StaticInstance(std::shared_ptr<StateStore> store)
        : store_(std::move(store)) {}

    const std::string& application_id() const noexcept override { return app_id_; }
    StreamsState state() const override { return StreamsState::Running; }

    StoreLookupResult store(const std::string& name, StoreType type) override {
        if (name != store_->name() || type != store_->type()) {
            return StoreLookupError::permanent("not hosted");
        }
        return store_;
    }

    std::optional<StreamsMetadata> metadata_for_key(const std::string&, const Bytes&) const override {
        return std::nullopt;
    }
    std::vector<StreamsMetadata> all_metadata_for_store(const std::string&) const override { return {}; }
    std::optional<HostInfo> application_server() const override { return std::nullopt; }
    StreamsState add_state_listener(StateListener) override { return StreamsState::Running; }

private:
    std::string app_id_{"bench"};
    std::shared_ptr<StateStore> store_;
};

} // namespace

static void BM_KeyValueGet(benchmark::State& state) {
    auto store = filled_store(state.range(0));

    std::int64_t i = 0;
    for (auto _ : state) {
        auto result = store->get(i++ % state.range(0));
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_KeyValueGet)->Arg(1000)->Arg(100000);

static void BM_KeyValuePut(benchmark::State& state) {
    KeyValueStore store("counts");

    std::int64_t i = 0;
    for (auto _ : state) {
        store.put(i % 1024, i);
        i++;
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_KeyValuePut);

static void BM_QueryableStoreLookup(benchmark::State& state) {
    StaticInstance instance(filled_store(1000));
    StreamsRegistry registry;
    registry.register_instance(instance);
    InteractiveQueryService service(registry, BinderConfig{});

    for (auto _ : state) {
        auto handle = service.get_queryable_store("counts", queryable_store_types::key_value_store());
        benchmark::DoNotOptimize(handle);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueryableStoreLookup);

static void BM_QueryHandleGet(benchmark::State& state) {
    StaticInstance instance(filled_store(1000));
    StreamsRegistry registry;
    registry.register_instance(instance);
    InteractiveQueryService service(registry, BinderConfig{});
    auto counts = service.get_queryable_store("counts", queryable_store_types::key_value_store());

    std::int64_t i = 0;
    for (auto _ : state) {
        auto result = counts.get(i++ % 1000);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueryHandleGet);

static void BM_Murmur2(benchmark::State& state) {
    Bytes key(static_cast<std::size_t>(state.range(0)), std::byte{0x5a});

    for (auto _ : state) {
        auto hash = murmur2(key);
        benchmark::DoNotOptimize(hash);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Murmur2)->Arg(8)->Arg(64)->Arg(1024);

static void BM_PartitionForLongKey(benchmark::State& state) {
    LongSerializer serializer;

    std::int64_t i = 0;
    for (auto _ : state) {
        auto partition = partition_for(serializer.serialize(i++), 12);
        benchmark::DoNotOptimize(partition);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PartitionForLongKey);

static void BM_WindowedCount(benchmark::State& state) {
    auto store = std::make_shared<WindowStore>("windowed", std::chrono::hours(1));
    ProcessorContext ctx("count", "bench");
    ctx.connect_store(store);
    WindowedCountProcessor count("count", "windowed", std::chrono::seconds(1));
    count.init(ctx);

    Timestamp ts = 0;
    for (auto _ : state) {
        Record record{std::int64_t{ts % 16}, std::int64_t{1}, RecordMetadata{ts}};
        count.process(record, ctx);
        ts += 10;
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WindowedCount);

BENCHMARK_MAIN();
