/**
 * @file zmq_round_trip_test.cpp
 * @brief End-to-end echo round trip over ZeroMQ on the loopback interface.
 */

#include <gtest/gtest.h>

#include "capabilities/archive/ArchiveAdaptor.hpp"
#include "capabilities/builtins/EchoCapability.hpp"
#include "worker/pool/WorkerPool.hpp"
#include "logger.hpp"

#include <zmq.hpp>
#include <zmq_addon.hpp>

#include <chrono>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

using namespace CortexWorker;

class ZmqRoundTripTest : public ::testing::Test {
protected:
    void SetUp() override {
        router_.set(zmq::sockopt::rcvtimeo, 10000);
        router_.set(zmq::sockopt::linger, 0);
        router_.bind("tcp://127.0.0.1:*");
        pull_.set(zmq::sockopt::rcvtimeo, 10000);
        pull_.set(zmq::sockopt::linger, 0);
        pull_.bind("tcp://127.0.0.1:*");
        staging_ = Archive::ScopedDirectory::create(std::filesystem::temp_directory_path(), "cortex_zmq_test_");
    }

    WorkerConfiguration make_config() {
        WorkerConfiguration config;
        config.service = "echo_service";
        config.source_address = router_.get(zmq::sockopt::last_endpoint);
        config.sink_address = pull_.get(zmq::sockopt::last_endpoint);
        config.message_size = 4;
        config.limit = 1;
        config.cooldown = std::chrono::milliseconds(0);
        config.grace = std::chrono::milliseconds(100);
        config.staging_dir = staging_.path();
        return config;
    }

    std::vector<std::string> receive_all(zmq::socket_t& socket) {
        std::vector<zmq::message_t> parts;
        const auto received = zmq::recv_multipart(socket, std::back_inserter(parts));
        std::vector<std::string> frames;
        if (!received) return frames;
        for (const auto& p : parts) frames.push_back(p.to_string());
        return frames;
    }

    zmq::context_t context_;
    zmq::socket_t router_{context_, zmq::socket_type::router};
    zmq::socket_t pull_{context_, zmq::socket_type::pull};
    Archive::ScopedDirectory staging_;
};

TEST_F(ZmqRoundTripTest, EchoesTaskThroughDispatcherAndSink) {
    auto logger = std::make_shared<Logger>("Worker");
    WorkerPool pool(make_config(), std::make_shared<Capabilities::EchoCapability>(), "loopback", logger);

    PoolReport report;
    std::thread worker([&] { report = pool.run(); });
    // Joined on every exit path, including a failed assertion below.
    struct Joiner {
        std::thread& t;
        ~Joiner() { if (t.joinable()) t.join(); }
    } joiner{worker};

    auto request = receive_all(router_);
    ASSERT_EQ(request.size(), 2u);
    EXPECT_EQ(request[0], "loopback:echo_service:00");
    EXPECT_EQ(request[1], "echo_service");

    std::vector<zmq::const_buffer> reply{
        zmq::buffer(request[0]), zmq::buffer(std::string_view("42")), zmq::buffer(std::string_view("PK\x03\x04-payload"))};
    ASSERT_TRUE(zmq::send_multipart(router_, reply));

    auto delivered = receive_all(pull_);
    worker.join();

    ASSERT_GE(delivered.size(), 4u);
    EXPECT_EQ(delivered[0], "loopback:echo_service:00");
    EXPECT_EQ(delivered[1], "echo_service");
    EXPECT_EQ(delivered[2], "42");
    std::string payload;
    for (std::size_t i = 3; i < delivered.size(); ++i) {
        if (i + 1 < delivered.size()) EXPECT_EQ(delivered[i].size(), 4u);
        payload += delivered[i];
    }
    EXPECT_EQ(payload, "PK\x03\x04-payload");
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.totals.delivered, 1u);
}
