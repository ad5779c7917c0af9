// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/connection_manager.hpp"
#include "mqttlog/errors.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

namespace mqttlog::test {

using std::chrono::milliseconds;

class ConnectionManagerTest : public ::testing::Test {
protected:
    using Clock = ConnectionManager::Clock;

    void SetUp() override {
        broker_ = std::make_shared<FakeBroker>();
        backoff_.base = milliseconds(100);
        backoff_.cap = milliseconds(30000);
        t0_ = Clock::now();
    }

    std::unique_ptr<ConnectionManager> make_manager() {
        return std::make_unique<ConnectionManager>(std::make_unique<FakeTransport>(broker_),
                                                   backoff_);
    }

    static std::vector<EncodedMessage> batch_of(size_t n) {
        std::vector<EncodedMessage> batch(n);
        for (size_t i = 0; i < n; ++i) {
            batch[i].topic = "t/" + std::to_string(i);
        }
        return batch;
    }

    std::shared_ptr<FakeBroker> broker_;
    BackoffPolicy backoff_;
    Clock::time_point t0_;
};

// =============================================================================
// BackoffPolicy
// =============================================================================

TEST_F(ConnectionManagerTest, Backoff_DoublesUntilCap) {
    EXPECT_EQ(backoff_.delay(0), milliseconds(100));
    EXPECT_EQ(backoff_.delay(1), milliseconds(200));
    EXPECT_EQ(backoff_.delay(3), milliseconds(800));
    EXPECT_EQ(backoff_.delay(8), milliseconds(25600));
    EXPECT_EQ(backoff_.delay(9), milliseconds(30000));
    EXPECT_EQ(backoff_.delay(1000), milliseconds(30000));
}

TEST_F(ConnectionManagerTest, Backoff_BoundHoldsForEveryFailureCount) {
    broker_->reachable = false;
    auto manager = make_manager();

    auto now = t0_;
    for (uint32_t n = 1; n <= 20; ++n) {
        ASSERT_FALSE(manager->connect(now));
        ASSERT_EQ(manager->consecutive_failures(), n);

        auto bound = std::min<milliseconds>(milliseconds(100) * (1LL << n), milliseconds(30000));
        EXPECT_EQ(manager->next_attempt() - now, bound) << "after " << n << " failures";
        now = manager->next_attempt();
    }
}

// =============================================================================
// Connect schedule
// =============================================================================

TEST_F(ConnectionManagerTest, InitialState) {
    auto manager = make_manager();
    EXPECT_EQ(manager->state(), ConnectionState::Disconnected);
    EXPECT_FALSE(manager->connected());
    EXPECT_EQ(manager->consecutive_failures(), 0u);
    EXPECT_STREQ(to_string(manager->state()), "DISCONNECTED");
}

TEST_F(ConnectionManagerTest, FirstPollConnectsImmediately) {
    auto manager = make_manager();
    EXPECT_TRUE(manager->poll(t0_));
    EXPECT_EQ(manager->state(), ConnectionState::Connected);
    EXPECT_EQ(manager->stats().connects, 1u);
}

TEST_F(ConnectionManagerTest, PollWaitsForBackoff) {
    broker_->refuse_connects = 2;
    auto manager = make_manager();

    EXPECT_FALSE(manager->poll(t0_));
    EXPECT_EQ(broker_->attempts_to_connect(), 1);
    EXPECT_EQ(manager->next_attempt(), t0_ + milliseconds(200));

    // Not due yet
    EXPECT_FALSE(manager->poll(t0_ + milliseconds(199)));
    EXPECT_EQ(broker_->attempts_to_connect(), 1);

    EXPECT_FALSE(manager->poll(t0_ + milliseconds(200)));
    EXPECT_EQ(broker_->attempts_to_connect(), 2);
    EXPECT_EQ(manager->next_attempt(), t0_ + milliseconds(600));

    EXPECT_TRUE(manager->poll(t0_ + milliseconds(600)));
    EXPECT_EQ(broker_->attempts_to_connect(), 3);

    auto stats = manager->stats();
    EXPECT_EQ(stats.connect_attempts, 3u);
    EXPECT_EQ(stats.connect_failures, 2u);
    EXPECT_EQ(stats.connects, 1u);
}

TEST_F(ConnectionManagerTest, FailuresResetAfterStableConnection) {
    broker_->refuse_connects = 2;
    auto manager = make_manager();

    manager->connect(t0_);
    manager->connect(t0_ + milliseconds(200));
    auto connected_at = t0_ + milliseconds(600);
    ASSERT_TRUE(manager->connect(connected_at));
    EXPECT_EQ(manager->consecutive_failures(), 2u);

    // The preceding delay was 400ms; the count survives until that is exceeded
    EXPECT_TRUE(manager->poll(connected_at + milliseconds(300)));
    EXPECT_EQ(manager->consecutive_failures(), 2u);

    EXPECT_TRUE(manager->poll(connected_at + milliseconds(401)));
    EXPECT_EQ(manager->consecutive_failures(), 0u);
}

TEST_F(ConnectionManagerTest, FlappingConnectionKeepsBackingOff) {
    broker_->refuse_connects = 1;
    auto manager = make_manager();

    ASSERT_FALSE(manager->connect(t0_));
    auto connected_at = t0_ + milliseconds(200);
    ASSERT_TRUE(manager->connect(connected_at));

    // Lost before the 200ms hold threshold: failure count is kept
    broker_->drop_connection = true;
    EXPECT_FALSE(manager->poll(connected_at + milliseconds(50)));
    EXPECT_EQ(manager->state(), ConnectionState::Disconnected);
    EXPECT_EQ(manager->consecutive_failures(), 1u);
    EXPECT_EQ(manager->next_attempt(), connected_at + milliseconds(50) + milliseconds(200));
    EXPECT_EQ(manager->stats().disconnects, 1u);
}

TEST_F(ConnectionManagerTest, ReconnectsAfterLoss) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->connect(t0_));

    broker_->drop_connection = true;
    auto lost_at = t0_ + milliseconds(5000);
    EXPECT_FALSE(manager->poll(lost_at));
    EXPECT_FALSE(manager->connected());

    EXPECT_FALSE(manager->poll(lost_at + milliseconds(50)));
    EXPECT_TRUE(manager->poll(lost_at + milliseconds(100)));
    EXPECT_EQ(manager->stats().connects, 2u);
}

// =============================================================================
// Publish
// =============================================================================

TEST_F(ConnectionManagerTest, PublishRequiresConnection) {
    auto manager = make_manager();
    EXPECT_THROW(manager->publish(batch_of(1)), NotConnectedError);
}

TEST_F(ConnectionManagerTest, PublishFromOffset) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->connect(t0_));

    auto outcome = manager->publish(batch_of(5), 2);
    EXPECT_EQ(outcome.sent, 3u);
    EXPECT_EQ(outcome.rejected, 0u);
    auto published = broker_->published_messages();
    ASSERT_EQ(published.size(), 3u);
    EXPECT_EQ(published[0].topic, "t/2");
    EXPECT_EQ(published[2].topic, "t/4");
}

TEST_F(ConnectionManagerTest, PublishFailureThatDropsConnection) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->connect(t0_));

    broker_->fail_publish = true;
    broker_->drop_on_publish_failure = true;
    EXPECT_EQ(manager->publish(batch_of(3)).consumed(), 0u);
    EXPECT_EQ(manager->state(), ConnectionState::Disconnected);
    EXPECT_EQ(manager->stats().disconnects, 1u);
}

TEST_F(ConnectionManagerTest, PublishFailureKeepingConnection) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->connect(t0_));

    broker_->fail_publish = true;
    EXPECT_EQ(manager->publish(batch_of(3)).consumed(), 0u);
    EXPECT_TRUE(manager->connected());
}

TEST_F(ConnectionManagerTest, RejectedMessageDoesNotStopTheBatch) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->connect(t0_));

    broker_->reject_topic_marker = "#";
    auto batch = batch_of(4);
    batch[1].topic = "sensor#1";

    auto outcome = manager->publish(batch);
    EXPECT_EQ(outcome.sent, 3u);
    EXPECT_EQ(outcome.rejected, 1u);
    EXPECT_EQ(outcome.consumed(), 4u);
    EXPECT_TRUE(manager->connected());

    auto published = broker_->published_messages();
    ASSERT_EQ(published.size(), 3u);
    EXPECT_EQ(published[0].topic, "t/0");
    EXPECT_EQ(published[1].topic, "t/2");
    EXPECT_EQ(published[2].topic, "t/3");
}

// =============================================================================
// Slow connects
// =============================================================================

TEST_F(ConnectionManagerTest, ConnectTimeoutCapsSlowTransport) {
    broker_->connect_delay = milliseconds(3000);
    auto manager = make_manager();

    auto start = Clock::now();
    EXPECT_FALSE(manager->connect(start, milliseconds(50)));
    EXPECT_LT(Clock::now() - start, milliseconds(1500));
    EXPECT_EQ(manager->state(), ConnectionState::Disconnected);
}

TEST_F(ConnectionManagerTest, InterruptAbortsConnectInProgress) {
    broker_->connect_delay = milliseconds(5000);
    auto manager = make_manager();

    bool connected = true;
    auto start = Clock::now();
    std::thread connector([&] { connected = manager->connect(); });
    ASSERT_TRUE(broker_->wait_for_connect_attempts(1, milliseconds(5000)));

    manager->interrupt();
    connector.join();
    EXPECT_FALSE(connected);
    EXPECT_LT(Clock::now() - start, milliseconds(2500));

    // Attempts fail fast until resumed
    broker_->script([](FakeBroker& b) { b.connect_delay = milliseconds(0); });
    EXPECT_FALSE(manager->connect());
    manager->resume();
    EXPECT_TRUE(manager->connect());
}

// =============================================================================
// Close
// =============================================================================

TEST_F(ConnectionManagerTest, CloseIsTerminal) {
    auto manager = make_manager();
    ASSERT_TRUE(manager->connect(t0_));

    manager->close();
    EXPECT_EQ(manager->state(), ConnectionState::Closed);
    EXPECT_FALSE(manager->connect(t0_ + milliseconds(1)));
    EXPECT_FALSE(manager->poll(t0_ + milliseconds(100000)));
    EXPECT_THROW(manager->publish(batch_of(1)), NotConnectedError);

    // Idempotent
    manager->close();
    EXPECT_EQ(manager->state(), ConnectionState::Closed);
}

}  // namespace mqttlog::test
