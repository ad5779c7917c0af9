// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file mqtt_transport_test.cpp
/// @brief libmosquitto transport, offline and against a live broker

#include "mqttlog/mqtt_transport.hpp"
#include "mqttlog/pipeline_registry.hpp"
#include "mqtt_test_fixture.hpp"

#include <gtest/gtest.h>
#include <glog/logging.h>
#include <mosquitto.h>

#include <condition_variable>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace mqttlog::test {

using std::chrono::milliseconds;

// =============================================================================
// Offline
// =============================================================================

TEST(MqttTransportOfflineTest, ConfigFromPipeline) {
    PipelineConfig config;
    config.hostname = "broker.local";
    config.port = 8883;
    config.client_id = "gw-1";
    config.keepalive = std::chrono::seconds(15);
    config.connect_timeout = milliseconds(750);

    auto transport = transport_config_from(config);
    EXPECT_EQ(transport.broker_host, "broker.local");
    EXPECT_EQ(transport.broker_port, 8883);
    EXPECT_EQ(transport.client_id, "gw-1");
    EXPECT_EQ(transport.keepalive_sec, 15);
    EXPECT_EQ(transport.connect_timeout, milliseconds(750));
}

TEST(MqttTransportOfflineTest, RefusedConnectionFails) {
    MqttTransportConfig config;
    config.broker_host = "127.0.0.1";
    config.broker_port = 1;  // nothing listens here
    config.connect_timeout = milliseconds(500);

    MqttTransport transport(config);
    EXPECT_FALSE(transport.connect(config.connect_timeout));
    EXPECT_FALSE(transport.connected());
    EXPECT_EQ(transport.stats().connect_failures, 1u);
    EXPECT_EQ(transport.name(), "mqtt");

    EncodedMessage msg;
    msg.topic = "never/sent";
    EXPECT_EQ(transport.publish(msg), PublishResult::Failed);
    EXPECT_FALSE(transport.poll(milliseconds(0)));
    EXPECT_EQ(transport.stats().messages_failed, 1u);
}

TEST(MqttTransportOfflineTest, InterruptedOrZeroBudgetConnectFailsAtOnce) {
    MqttTransportConfig config;
    config.broker_host = "127.0.0.1";
    config.broker_port = 1;
    config.connect_timeout = milliseconds(5000);
    MqttTransport transport(config);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(transport.connect(milliseconds(0)));

    transport.set_interrupted(true);
    EXPECT_FALSE(transport.connect(milliseconds(5000)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(1000));
    EXPECT_EQ(transport.stats().connect_failures, 2u);
}

// =============================================================================
// Live broker
// =============================================================================

/// Plain libmosquitto subscriber collecting payloads
class Subscriber {
public:
    Subscriber(const std::string& host, int port, const std::string& filter) {
        mosquitto_lib_init();
        mosq_ = mosquitto_new(nullptr, true, this);
        mosquitto_message_callback_set(mosq_, &Subscriber::on_message);
        connected_ = mosquitto_connect(mosq_, host.c_str(), port, 30) == MOSQ_ERR_SUCCESS &&
                     mosquitto_subscribe(mosq_, nullptr, filter.c_str(), 1) == MOSQ_ERR_SUCCESS &&
                     mosquitto_loop_start(mosq_) == MOSQ_ERR_SUCCESS;
    }

    ~Subscriber() {
        mosquitto_disconnect(mosq_);
        mosquitto_loop_stop(mosq_, true);
        mosquitto_destroy(mosq_);
        mosquitto_lib_cleanup();
    }

    bool connected() const { return connected_; }

    bool wait_for(size_t count, milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return received_.size() >= count; });
    }

    std::vector<std::pair<std::string, std::string>> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    static void on_message(struct mosquitto*, void* obj, const struct mosquitto_message* msg) {
        auto* self = static_cast<Subscriber*>(obj);
        std::lock_guard<std::mutex> lock(self->mutex_);
        self->received_.emplace_back(
            msg->topic, std::string(static_cast<const char*>(msg->payload), msg->payloadlen));
        self->cv_.notify_all();
    }

    struct mosquitto* mosq_ = nullptr;
    bool connected_ = false;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::pair<std::string, std::string>> received_;
};

class MqttTransportTest : public MqttTestFixture {
protected:
    void SetUp() override {
        MqttTestFixture::SetUp();
        std::random_device rd;
        prefix_ = "mqttlog_test_" + std::to_string(rd() % 100000);
    }

    std::string prefix_;
};

TEST_F(MqttTransportTest, ConnectPublishDisconnect) {
    Subscriber subscriber(broker_host_, broker_port_, prefix_ + "/#");
    ASSERT_TRUE(subscriber.connected());
    std::this_thread::sleep_for(milliseconds(200));

    MqttTransport transport(transport_config_from(broker_config()));
    ASSERT_TRUE(transport.connect(milliseconds(5000)));
    EXPECT_TRUE(transport.connected());

    EncodedMessage msg;
    msg.topic = prefix_ + "/direct";
    std::string body = "raw payload";
    msg.payload.assign(body.begin(), body.end());
    msg.qos = 1;
    ASSERT_EQ(transport.publish(msg), PublishResult::Sent);

    for (int i = 0; i < 20 && !subscriber.wait_for(1, milliseconds(50)); ++i) {
        transport.poll(milliseconds(10));
    }
    ASSERT_TRUE(subscriber.wait_for(1, milliseconds(2000)));
    EXPECT_EQ(subscriber.received()[0].first, prefix_ + "/direct");
    EXPECT_EQ(subscriber.received()[0].second, "raw payload");

    auto stats = transport.stats();
    EXPECT_EQ(stats.messages_sent, 1u);
    EXPECT_EQ(stats.bytes_sent, body.size());
    EXPECT_GT(stats.last_send_timestamp_ns, 0);

    transport.disconnect();
    EXPECT_FALSE(transport.connected());
}

TEST_F(MqttTransportTest, WildcardTopicRejectedConnectionKept) {
    MqttTransport transport(transport_config_from(broker_config()));
    ASSERT_TRUE(transport.connect(milliseconds(5000)));

    EncodedMessage msg;
    msg.topic = prefix_ + "/sensor#1";
    msg.qos = 1;
    EXPECT_EQ(transport.publish(msg), PublishResult::Rejected);
    EXPECT_TRUE(transport.connected());

    msg.topic = prefix_ + "/sensor1";
    EXPECT_EQ(transport.publish(msg), PublishResult::Sent);
    transport.disconnect();
}

TEST_F(MqttTransportTest, PipelineDeliversThroughBroker) {
    Subscriber subscriber(broker_host_, broker_port_, prefix_ + "/#");
    ASSERT_TRUE(subscriber.connected());
    std::this_thread::sleep_for(milliseconds(200));

    auto config = broker_config();
    config.topic_template = prefix_ + "/{loggerPath}";
    config.retain = false;
    config.batch_interval = milliseconds(20);

    PipelineRegistry registry;
    auto pipeline = registry.get_or_create("vehicle.gateway", config);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(pipeline->info("live " + std::to_string(i), {{"seq", std::to_string(i)}}));
    }

    ASSERT_TRUE(subscriber.wait_for(5, milliseconds(10000)));
    auto received = subscriber.received();
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(received[i].first, prefix_ + "/vehicle/gateway");
        EXPECT_NE(received[i].second.find("\"message\":\"live " + std::to_string(i) + "\""),
                  std::string::npos);
    }

    EXPECT_TRUE(pipeline->healthy());
    registry.shutdown_all();
    EXPECT_EQ(pipeline->stats().delivery.messages_published, 5u);
}

TEST_F(MqttTransportTest, ShutdownFlushesQueuedRecords) {
    Subscriber subscriber(broker_host_, broker_port_, prefix_ + "/#");
    ASSERT_TRUE(subscriber.connected());
    std::this_thread::sleep_for(milliseconds(200));

    auto config = broker_config();
    config.topic_template = prefix_ + "/{level}";
    config.retain = false;
    config.batch_interval = milliseconds(1000);

    PipelineRegistry registry;
    auto pipeline = registry.get_or_create("flush", config);
    ASSERT_TRUE(pipeline->error("last words"));
    registry.shutdown("flush");

    ASSERT_TRUE(subscriber.wait_for(1, milliseconds(5000)));
    EXPECT_EQ(subscriber.received()[0].first, prefix_ + "/ERROR");
}

}  // namespace mqttlog::test
