/**
 * @file interactive_query_service_test.cpp
 * @brief Store lookup retries and host lookups against scripted instances
 */

#include <gtest/gtest.h>

#include "mocks/mock_streams_instance.hpp"
#include "streamiq/iq/interactive_query_service.hpp"

using namespace streamiq;
using namespace std::chrono_literals;
using streamiq::testing::MockStreamsInstance;

class InteractiveQueryServiceTest : public ::testing::Test {
protected:
    StreamsRegistry registry_;
    std::vector<std::chrono::milliseconds> sleeps_;

    InteractiveQueryService service(int max_attempts = 3, std::chrono::milliseconds backoff = 1000ms) {
        BinderConfig config;
        config.application_id = "products";
        config.state_store_retry.max_attempts = max_attempts;
        config.state_store_retry.backoff_period = backoff;
        return InteractiveQueryService(registry_, std::move(config), recording_sleeper());
    }

    Sleeper recording_sleeper() {
        return [this](std::chrono::milliseconds duration) { sleeps_.push_back(duration); };
    }

    static std::shared_ptr<KeyValueStore> running_store(const std::string& name) {
        auto store = std::make_shared<KeyValueStore>(name);
        store->mark_running();
        return store;
    }

    static StoreLookupError transient() {
        return StoreLookupError::transient("store is restoring");
    }

    static StoreLookupError permanent() {
        return StoreLookupError::permanent("store is not defined");
    }
};

TEST_F(InteractiveQueryServiceTest, ReturnsStoreFromRunningInstance) {
    MockStreamsInstance instance;
    auto store = running_store("prod-id-count-store");
    store->put(std::int64_t{123}, std::int64_t{1});
    instance.set_fallback(store);
    registry_.register_instance(instance);

    auto handle = service().get_queryable_store(
        "prod-id-count-store", queryable_store_types::key_value_store());

    EXPECT_EQ(handle.get(std::int64_t{123}), Payload{std::int64_t{1}});
    EXPECT_EQ(instance.store_calls(), 1);
    EXPECT_EQ(instance.last_store_name(), "prod-id-count-store");
    EXPECT_EQ(instance.last_store_type(), StoreType::KeyValue);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(InteractiveQueryServiceTest, TransientFailuresExhaustExactlyMaxAttempts) {
    MockStreamsInstance instance;
    instance.set_fallback(transient());
    registry_.register_instance(instance);

    try {
        (void)service(3).get_queryable_store("counts", queryable_store_types::key_value_store());
        FAIL() << "expected StoreRetriesExhaustedError";
    } catch (const StoreRetriesExhaustedError& e) {
        EXPECT_EQ(e.store_name(), "counts");
        EXPECT_EQ(e.attempts(), 3);
        EXPECT_NE(std::string(e.what()).find("after 3 attempt(s)"), std::string::npos);
    }

    EXPECT_EQ(instance.store_calls(), 3);
}

TEST_F(InteractiveQueryServiceTest, SleepsBetweenAttemptsButNotAfterLast) {
    MockStreamsInstance instance;
    instance.set_fallback(transient());
    registry_.register_instance(instance);

    EXPECT_THROW((void)service(4, 250ms).get_queryable_store(
        "counts", queryable_store_types::key_value_store()), StoreRetriesExhaustedError);

    EXPECT_EQ(sleeps_, (std::vector<std::chrono::milliseconds>{250ms, 250ms, 250ms}));
}

TEST_F(InteractiveQueryServiceTest, SingleAttemptNeverSleeps) {
    MockStreamsInstance instance;
    instance.set_fallback(transient());
    registry_.register_instance(instance);

    EXPECT_THROW((void)service(1).get_queryable_store(
        "counts", queryable_store_types::key_value_store()), StoreRetriesExhaustedError);

    EXPECT_EQ(instance.store_calls(), 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(InteractiveQueryServiceTest, ExponentialBackoff) {
    MockStreamsInstance instance;
    instance.set_fallback(transient());
    registry_.register_instance(instance);

    BinderConfig config;
    config.state_store_retry.max_attempts = 4;
    config.state_store_retry.backoff_period = 100ms;
    config.state_store_retry.multiplier = 2.0;
    config.state_store_retry.max_backoff = 300ms;
    InteractiveQueryService exponential(registry_, config, recording_sleeper());

    EXPECT_THROW((void)exponential.get_queryable_store(
        "counts", queryable_store_types::key_value_store()), StoreRetriesExhaustedError);

    EXPECT_EQ(sleeps_, (std::vector<std::chrono::milliseconds>{100ms, 200ms, 300ms}));
}

TEST_F(InteractiveQueryServiceTest, PermanentFailureIsNotRetried) {
    MockStreamsInstance instance;
    instance.set_fallback(permanent());
    registry_.register_instance(instance);

    try {
        (void)service(5).get_queryable_store(
            "prod-id-count-store-nonexistent", queryable_store_types::key_value_store());
        FAIL() << "expected StoreNotFoundError";
    } catch (const StoreNotFoundError& e) {
        EXPECT_EQ(e.store_name(), "prod-id-count-store-nonexistent");
    }

    EXPECT_EQ(instance.store_calls(), 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(InteractiveQueryServiceTest, NotFoundIsDistinctFromExhaustion) {
    MockStreamsInstance instance;
    registry_.register_instance(instance);

    EXPECT_THROW((void)service().get_queryable_store(
        "missing", queryable_store_types::key_value_store()), StoreNotFoundError);

    // Both are store access failures
    EXPECT_THROW((void)service().get_queryable_store(
        "missing", queryable_store_types::key_value_store()), InvalidStateStoreError);
}

TEST_F(InteractiveQueryServiceTest, TransientThenSuccess) {
    MockStreamsInstance instance;
    instance.push_result(transient());
    instance.push_result(transient());
    instance.set_fallback(running_store("counts"));
    registry_.register_instance(instance);

    auto handle = service(3).get_queryable_store("counts", queryable_store_types::key_value_store());

    EXPECT_EQ(handle.name(), "counts");
    EXPECT_EQ(instance.store_calls(), 3);
    EXPECT_EQ(sleeps_.size(), 2u);
}

TEST_F(InteractiveQueryServiceTest, SkipsInstancesNotHostingTheStore) {
    MockStreamsInstance orders("orders");
    MockStreamsInstance products("products");
    orders.set_fallback(permanent());
    products.set_fallback(running_store("prod-id-count-store"));
    registry_.register_instance(orders);
    registry_.register_instance(products);

    auto handle = service().get_queryable_store(
        "prod-id-count-store", queryable_store_types::key_value_store());

    EXPECT_EQ(handle.name(), "prod-id-count-store");
    EXPECT_EQ(orders.store_calls(), 1);
    EXPECT_EQ(products.store_calls(), 1);
}

TEST_F(InteractiveQueryServiceTest, TransientOnOneInstanceKeepsRetrying) {
    MockStreamsInstance orders("orders");
    MockStreamsInstance products("products");
    orders.set_fallback(permanent());
    products.push_result(transient());
    products.set_fallback(running_store("counts"));
    registry_.register_instance(orders);
    registry_.register_instance(products);

    auto handle = service().get_queryable_store("counts", queryable_store_types::key_value_store());

    EXPECT_EQ(handle.name(), "counts");
    EXPECT_EQ(orders.store_calls(), 2);
    EXPECT_EQ(products.store_calls(), 2);
}

TEST_F(InteractiveQueryServiceTest, FirstInstanceServingTheStoreWins) {
    MockStreamsInstance first("first");
    MockStreamsInstance second("second");
    first.set_fallback(running_store("counts"));
    second.set_fallback(running_store("counts"));
    registry_.register_instance(first);
    registry_.register_instance(second);

    (void)service().get_queryable_store("counts", queryable_store_types::key_value_store());

    EXPECT_EQ(first.store_calls(), 1);
    EXPECT_EQ(second.store_calls(), 0);
}

TEST_F(InteractiveQueryServiceTest, EmptyRegistryIsRetried) {
    EXPECT_THROW((void)service(3, 10ms).get_queryable_store(
        "counts", queryable_store_types::key_value_store()), StoreRetriesExhaustedError);
    EXPECT_EQ(sleeps_.size(), 2u);
}

TEST_F(InteractiveQueryServiceTest, InstanceRegisteredDuringRetryIsFound) {
    MockStreamsInstance late;
    late.set_fallback(running_store("counts"));

    BinderConfig config;
    config.state_store_retry.max_attempts = 3;
    InteractiveQueryService racing(registry_, config, [&](std::chrono::milliseconds) {
        registry_.register_instance(late);
    });

    auto handle = racing.get_queryable_store("counts", queryable_store_types::key_value_store());
    EXPECT_EQ(handle.name(), "counts");
    EXPECT_EQ(late.store_calls(), 1);
}

TEST_F(InteractiveQueryServiceTest, WrongStoreTypeFromInstanceIsSkipped) {
    MockStreamsInstance instance;
    instance.set_fallback(running_store("counts"));
    registry_.register_instance(instance);

    EXPECT_THROW((void)service().get_queryable_store(
        "counts", queryable_store_types::window_store()), StoreNotFoundError);
    EXPECT_EQ(instance.last_store_type(), StoreType::Window);
}

TEST_F(InteractiveQueryServiceTest, InvalidRetryPolicyRejected) {
    BinderConfig config;
    config.state_store_retry.max_attempts = 0;
    EXPECT_THROW((void)InteractiveQueryService(registry_, config), ConfigError);
}

TEST_F(InteractiveQueryServiceTest, CurrentHostInfo) {
    BinderConfig config;
    config.configuration["application.server"] = "127.0.0.1:9092";
    InteractiveQueryService configured(registry_, config);

    auto info = configured.get_current_host_info();
    EXPECT_EQ(info.host, "127.0.0.1");
    EXPECT_EQ(info.port, 9092);
    EXPECT_EQ(info.to_string(), "127.0.0.1:9092");
}

TEST_F(InteractiveQueryServiceTest, CurrentHostInfoRequiresConfiguration) {
    EXPECT_THROW((void)service().get_current_host_info(), ConfigError);

    BinderConfig config;
    config.configuration["application.server"] = "no-port";
    InteractiveQueryService malformed(registry_, config);
    EXPECT_THROW((void)malformed.get_current_host_info(), ConfigError);
}

TEST_F(InteractiveQueryServiceTest, HostInfoForKey) {
    MockStreamsInstance instance;
    instance.set_metadata("prod-id-count-store",
        StreamsMetadata{HostInfo{"10.0.0.7", 8080}, {"prod-id-count-store"}, {0}});
    registry_.register_instance(instance);

    auto info = service().get_host_info<std::int64_t>("prod-id-count-store", 123, LongSerializer{});

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(*info, (HostInfo{"10.0.0.7", 8080}));
    EXPECT_EQ(instance.last_key(), LongSerializer{}.serialize(123));
}

TEST_F(InteractiveQueryServiceTest, HostInfoForUnknownStoreIsAbsent) {
    MockStreamsInstance first;
    MockStreamsInstance second;
    registry_.register_instance(first);
    registry_.register_instance(second);

    auto info = service().get_host_info<std::string>("unknown", "key", StringSerializer{});

    EXPECT_FALSE(info.has_value());
    EXPECT_EQ(first.metadata_calls(), 1);
    EXPECT_EQ(second.metadata_calls(), 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(InteractiveQueryServiceTest, HostInfoFromSecondInstance) {
    MockStreamsInstance first;
    MockStreamsInstance second;
    second.set_metadata("counts", StreamsMetadata{HostInfo{"b", 2}, {"counts"}, {}});
    registry_.register_instance(first);
    registry_.register_instance(second);

    auto info = service().get_host_info<std::string>("counts", "key", StringSerializer{});
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->host, "b");
}

TEST_F(InteractiveQueryServiceTest, AllHostInfoIsDeduplicated) {
    MockStreamsInstance first;
    MockStreamsInstance second;
    first.set_metadata("counts", StreamsMetadata{HostInfo{"a", 1}, {"counts"}, {}});
    second.set_metadata("counts", StreamsMetadata{HostInfo{"a", 1}, {"counts"}, {}});
    registry_.register_instance(first);
    registry_.register_instance(second);

    auto hosts = service().get_all_host_info("counts");
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0], (HostInfo{"a", 1}));
    EXPECT_TRUE(service().get_all_host_info("missing").empty());
}
