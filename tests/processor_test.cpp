/**
 * @file processor_test.cpp
 * @brief Unit tests for processors
 */

#include <gtest/gtest.h>

#include "streamiq/streamiq.hpp"

using namespace streamiq;
using namespace std::chrono_literals;

class ProcessorTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordQueue> output_ = std::make_shared<RecordQueue>();
    ProcessorContext ctx_{"test", "test-app"};

    void SetUp() override {
        ctx_.add_output(output_);
    }

    static Record at(Payload key, Payload value, Timestamp ts) {
        return Record{std::move(key), std::move(value), RecordMetadata{ts}};
    }
};

TEST_F(ProcessorTest, MapValueKeepsKey) {
    auto square = make_map("square", [](const Payload& p) -> Payload {
        auto x = std::get<std::int64_t>(p);
        return x * x;
    });

    Record input{std::string("k"), std::int64_t{5}};
    square->process(input, ctx_);

    auto result = output_->try_pop();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<std::string>(result->key()), "k");
    EXPECT_EQ(result->get<std::int64_t>(), 25);
    EXPECT_EQ(square->stats().records_forwarded.load(), 1u);
}

TEST_F(ProcessorTest, KeySelectorRekeys) {
    auto by_product = make_key_selector("by-product", [](const Record& r) -> Payload {
        return r.get<std::int64_t>() / 100;
    });

    Record input{std::int64_t{12345}};
    by_product->process(input, ctx_);

    auto result = output_->try_pop();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<std::int64_t>(result->key()), 123);
    EXPECT_EQ(result->get<std::int64_t>(), 12345);
}

TEST_F(ProcessorTest, FilterDropsNonMatching) {
    auto even = make_filter("even", [](const Payload& p) {
        auto* x = std::get_if<std::int64_t>(&p);
        return x && *x % 2 == 0;
    });

    for (std::int64_t i = 1; i <= 5; i++) {
        Record r{i};
        even->process(r, ctx_);
    }

    std::vector<std::int64_t> forwarded;
    while (auto r = output_->try_pop()) {
        forwarded.push_back(r->get<std::int64_t>());
    }
    EXPECT_EQ(forwarded, (std::vector<std::int64_t>{2, 4}));
    EXPECT_EQ(even->stats().records_received.load(), 5u);
    EXPECT_EQ(even->stats().records_dropped.load(), 3u);
}

TEST_F(ProcessorTest, FilterOnRecord) {
    auto keyed = make_filter("keyed", [](const Record& r) { return r.has_key(); });

    Record unkeyed{std::int64_t{1}};
    Record with_key{std::int64_t{7}, std::int64_t{1}};
    keyed->process(unkeyed, ctx_);
    keyed->process(with_key, ctx_);

    EXPECT_EQ(output_->size(), 1u);
}

TEST_F(ProcessorTest, SequenceSourceCyclesKeys) {
    SequenceSource::Config config;
    config.start = 10;
    config.count = 4;
    config.key_modulo = 3;
    SequenceSource source("seq", config);

    while (source.generate(ctx_)) {}

    std::vector<std::int64_t> keys;
    std::vector<std::int64_t> values;
    while (auto r = output_->try_pop()) {
        keys.push_back(std::get<std::int64_t>(r->key()));
        values.push_back(r->get<std::int64_t>());
    }
    EXPECT_EQ(values, (std::vector<std::int64_t>{10, 11, 12, 13}));
    EXPECT_EQ(keys, (std::vector<std::int64_t>{1, 2, 0, 1}));
    EXPECT_EQ(source.generated(), 4u);
}

TEST_F(ProcessorTest, SequenceSourceDefaults) {
    SequenceSource source("seq");

    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(source.generate(ctx_));
    }

    auto first = output_->try_pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->get<std::int64_t>(), 0);
    EXPECT_EQ(std::get<std::int64_t>(first->key()), 0);
    EXPECT_EQ(output_->size(), 2u);

    source.request_stop();
    EXPECT_FALSE(source.generate(ctx_));
}

TEST_F(ProcessorTest, FeedSourceStopsWhenFeedDrained) {
    auto feed = std::make_shared<RecordFeed>();
    FeedSource source("feed", feed);

    ASSERT_TRUE(feed->send(std::string("a"), std::int64_t{1}));
    ASSERT_TRUE(feed->send(std::string("b"), std::int64_t{2}));
    feed->close();
    EXPECT_FALSE(feed->send(std::string("c"), std::int64_t{3}));

    int calls = 0;
    while (source.generate(ctx_) && calls < 10) {
        calls++;
    }

    EXPECT_EQ(output_->size(), 2u);
    EXPECT_TRUE(feed->exhausted());
}

TEST_F(ProcessorTest, CountProcessorCountsPerKey) {
    auto store = std::make_shared<KeyValueStore>("counts");
    store->mark_running();
    ctx_.connect_store(store);

    CountProcessor count("count", "counts");
    count.init(ctx_);

    for (std::int64_t key : {123, 456, 123}) {
        Record r{key, std::string("order")};
        count.process(r, ctx_);
    }
    Record unkeyed{std::string("no key")};
    count.process(unkeyed, ctx_);

    EXPECT_EQ(store->get(std::int64_t{123}), Payload{std::int64_t{2}});
    EXPECT_EQ(store->get(std::int64_t{456}), Payload{std::int64_t{1}});
    EXPECT_EQ(store->approximate_num_entries(), 2u);
    EXPECT_EQ(output_->size(), 3u);
    EXPECT_EQ(count.stats().records_dropped.load(), 1u);
}

TEST_F(ProcessorTest, CountProcessorRequiresConnectedStore) {
    CountProcessor count("count", "missing");
    EXPECT_THROW(count.init(ctx_), std::runtime_error);
}

TEST_F(ProcessorTest, CountProcessorRejectsWrongStoreType) {
    ctx_.connect_store(std::make_shared<WindowStore>("counts", 1h));
    CountProcessor count("count", "counts");
    EXPECT_THROW(count.init(ctx_), std::runtime_error);
}

TEST_F(ProcessorTest, WindowedCountUsesTumblingWindows) {
    auto store = std::make_shared<WindowStore>("windowed", 1h);
    ctx_.connect_store(store);

    WindowedCountProcessor count("count", "windowed", 1000ms);
    count.init(ctx_);

    for (Timestamp ts : {100, 999, 1000, 2500}) {
        auto r = at(std::string("k"), std::int64_t{1}, ts);
        count.process(r, ctx_);
    }

    EXPECT_EQ(store->fetch(std::string("k"), 0), Payload{std::int64_t{2}});
    EXPECT_EQ(store->fetch(std::string("k"), 1000), Payload{std::int64_t{1}});
    EXPECT_EQ(store->fetch(std::string("k"), 2000), Payload{std::int64_t{1}});
    EXPECT_EQ(store->fetch(std::string("k"), 0, 3000).size(), 3u);
}

TEST_F(ProcessorTest, SessionCountMergesWithinGap) {
    auto store = std::make_shared<SessionStore>("sessions", 1h);
    ctx_.connect_store(store);

    SessionCountProcessor count("count", "sessions", 100ms);
    count.init(ctx_);

    // Two sessions, then a record bridging them
    for (Timestamp ts : {1000, 1050, 1200, 1130}) {
        auto r = at(std::string("user"), std::int64_t{1}, ts);
        count.process(r, ctx_);
    }

    auto sessions = store->fetch(std::string("user"));
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].window, (SessionWindow{1000, 1200}));
    EXPECT_EQ(sessions[0].value, Payload{std::int64_t{4}});
}

TEST_F(ProcessorTest, SessionCountKeepsDistantSessionsApart) {
    auto store = std::make_shared<SessionStore>("sessions", 1h);
    ctx_.connect_store(store);

    SessionCountProcessor count("count", "sessions", 100ms);
    count.init(ctx_);

    for (Timestamp ts : {1000, 1500}) {
        auto r = at(std::string("user"), std::int64_t{1}, ts);
        count.process(r, ctx_);
    }

    auto sessions = store->fetch(std::string("user"));
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].window, (SessionWindow{1000, 1000}));
    EXPECT_EQ(sessions[1].window, (SessionWindow{1500, 1500}));
}

TEST_F(ProcessorTest, CollectingSinkWaitsForRecords) {
    CollectingSink sink("sink");

    std::thread producer([&]() {
        for (std::int64_t i = 0; i < 3; i++) {
            Record r{i};
            sink.process(r, ctx_);
        }
    });

    EXPECT_TRUE(sink.wait_for(3, 2s));
    producer.join();
    EXPECT_EQ(sink.count(), 3u);
    EXPECT_FALSE(sink.wait_for(4, 10ms));
    EXPECT_EQ(sink.stats().records_received.load(), 3u);
}

TEST_F(ProcessorTest, FunctionSinkCallsFunction) {
    std::vector<Payload> keys;
    auto sink = make_sink("collect-keys", [&keys](const Record& r) { keys.push_back(r.key()); });

    Record a{std::string("a"), std::int64_t{1}};
    Record b{std::string("b"), std::int64_t{2}};
    sink->process(a, ctx_);
    sink->process(b, ctx_);

    EXPECT_EQ(keys, (std::vector<Payload>{std::string("a"), std::string("b")}));
    EXPECT_EQ(sink->stats().records_received.load(), 2u);
    EXPECT_EQ(output_->size(), 0u);
}

TEST_F(ProcessorTest, LoggingSinkConsumesWithoutForwarding) {
    set_log_level("debug");
    LoggingSink sink("log");

    Record keyed{std::int64_t{123}, std::string("order")};
    Record unkeyed{std::int64_t{7}};
    EXPECT_NO_THROW(sink.process(keyed, ctx_));
    EXPECT_NO_THROW(sink.process(unkeyed, ctx_));

    EXPECT_EQ(sink.stats().records_received.load(), 2u);
    EXPECT_EQ(output_->size(), 0u);
    set_log_level("info");
}

TEST_F(ProcessorTest, ChainedProcessors) {
    auto square = make_map("square", [](const Payload& p) -> Payload {
        auto x = std::get<std::int64_t>(p);
        return x * x;
    });
    auto even = make_filter("even", [](const Payload& p) {
        return std::get<std::int64_t>(p) % 2 == 0;
    });

    auto mid = std::make_shared<RecordQueue>();
    ProcessorContext square_ctx("square", "test-app");
    square_ctx.add_output(mid);

    for (std::int64_t i = 1; i <= 5; i++) {
        Record r{i};
        square->process(r, square_ctx);
    }
    while (auto r = mid->try_pop()) {
        even->process(*r, ctx_);
    }

    auto r1 = output_->try_pop();
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(r1->get<std::int64_t>(), 4);

    auto r2 = output_->try_pop();
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(r2->get<std::int64_t>(), 16);
    EXPECT_FALSE(output_->try_pop().has_value());
}
