/**
 * @file streams_registry_test.cpp
 * @brief Instance registration and binder metrics
 */

#include <gtest/gtest.h>
#include <thread>

#include "mocks/mock_streams_instance.hpp"
#include "streamiq/iq/streams_registry.hpp"

using namespace streamiq;
using streamiq::testing::MockStreamsInstance;

TEST(StreamsRegistryTest, RegistersInOrder) {
    StreamsRegistry registry;
    MockStreamsInstance first("first");
    MockStreamsInstance second("second");

    EXPECT_TRUE(registry.instances().empty());

    registry.register_instance(first);
    registry.register_instance(second);

    auto instances = registry.instances();
    ASSERT_EQ(instances.size(), 2u);
    EXPECT_EQ(instances[0], &first);
    EXPECT_EQ(instances[1], &second);
}

TEST(StreamsRegistryTest, DuplicateRegistrationIsNoOp) {
    StreamsBinderMetrics metrics;
    StreamsRegistry registry(&metrics);
    MockStreamsInstance instance;

    registry.register_instance(instance);
    registry.register_instance(instance);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(metrics.registered_instances().value(), 1);
    EXPECT_EQ(instance.listener_count(), 1u);
}

TEST(StreamsRegistryTest, SnapshotIsUnaffectedByLaterRegistration) {
    StreamsRegistry registry;
    MockStreamsInstance first;
    MockStreamsInstance second;

    registry.register_instance(first);
    auto snapshot = registry.instances();
    registry.register_instance(second);

    EXPECT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(StreamsRegistryTest, Unregister) {
    StreamsRegistry registry;
    MockStreamsInstance first;
    MockStreamsInstance second;

    registry.register_instance(first);
    registry.register_instance(second);

    EXPECT_TRUE(registry.unregister_instance(first));
    EXPECT_FALSE(registry.unregister_instance(first));
    ASSERT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.instances()[0], &second);
}

TEST(StreamsRegistryTest, ConcurrentRegistration) {
    StreamsRegistry registry;
    std::vector<std::unique_ptr<MockStreamsInstance>> instances;
    for (int i = 0; i < 64; i++) {
        instances.push_back(std::make_unique<MockStreamsInstance>("app-" + std::to_string(i)));
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&]() {
            // Every thread registers every instance
            for (auto& instance : instances) {
                registry.register_instance(*instance);
                (void)registry.instances();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry.size(), instances.size());
}

TEST(StreamsBinderMetricsTest, TracksStateTransitions) {
    StreamsBinderMetrics metrics;
    StreamsRegistry registry(&metrics);
    MockStreamsInstance orders("orders");
    MockStreamsInstance payments("payments");
    payments.transition(StreamsState::Rebalancing);

    registry.register_instance(orders);
    registry.register_instance(payments);

    EXPECT_EQ(metrics.registered_instances().value(), 2);
    EXPECT_EQ(metrics.running_instances().value(), 1);

    payments.transition(StreamsState::Running);
    orders.transition(StreamsState::Rebalancing);
    orders.transition(StreamsState::Running);
    orders.transition(StreamsState::PendingShutdown);

    EXPECT_EQ(metrics.running_instances().value(), 1);
    EXPECT_EQ(metrics.state_transitions().value(), 4u);

    auto snapshot = metrics.snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].application_id, "orders");
    EXPECT_EQ(snapshot[0].state, StreamsState::PendingShutdown);
    EXPECT_EQ(snapshot[0].transitions, 3u);
    EXPECT_EQ(snapshot[1].state, StreamsState::Running);

    EXPECT_EQ(metrics.format(),
        "Instances: 2 | Running: 1 | Transitions: 4 | orders=PENDING_SHUTDOWN | payments=RUNNING");
}

TEST(StreamsBinderMetricsTest, TransitionDuringSubscriptionIsKept) {
    StreamsBinderMetrics metrics;
    StreamsRegistry registry(&metrics);
    MockStreamsInstance orders("orders");
    orders.transition(StreamsState::Rebalancing);

    // Restore finishes while the registry is still binding the instance
    orders.transition_on_subscribe(StreamsState::Running);
    registry.register_instance(orders);

    EXPECT_EQ(metrics.running_instances().value(), 1);
    ASSERT_EQ(metrics.snapshot().size(), 1u);
    EXPECT_EQ(metrics.snapshot()[0].state, StreamsState::Running);

    orders.transition(StreamsState::PendingShutdown);
    orders.transition(StreamsState::NotRunning);

    EXPECT_EQ(metrics.running_instances().value(), 0);
    EXPECT_EQ(metrics.state_transitions().value(), 3u);
    EXPECT_EQ(metrics.snapshot()[0].state, StreamsState::NotRunning);
}

TEST(StreamsBinderMetricsTest, BindingRunningInstanceCountsIt) {
    StreamsBinderMetrics metrics;
    MockStreamsInstance orders("orders");

    metrics.bind_instance(orders);
    EXPECT_EQ(metrics.running_instances().value(), 1);
    EXPECT_EQ(metrics.state_transitions().value(), 0u);

    orders.transition(StreamsState::Rebalancing);
    EXPECT_EQ(metrics.running_instances().value(), 0);
}
