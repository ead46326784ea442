/**
 * @file endpoint_manager_test.cpp
 * @brief Unit tests for listener and worker lifecycle management
 *
 * @see include/pacs/forward/relay/endpoint_manager.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "pacs/forward/relay/endpoint_manager.h"

#include "utils/test_helpers.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

namespace pacs::forward::relay {
namespace {

using namespace ::testing;
using namespace pacs::forward::test;
using namespace std::chrono_literals;

// =============================================================================
// Test Doubles
// =============================================================================

/**
 * @brief Launcher that records calls instead of spawning storescp
 */
class fake_launcher : public listener_launcher {
public:
    std::expected<listener_handle, integration::process_error> start(
        const config::listener_config& listener) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_start_.contains(listener.name)) {
            return std::unexpected(integration::process_error::spawn_failed);
        }
        started_.push_back(listener.name);
        return listener_handle{.name = listener.name, .process = {}};
    }

    std::expected<void, integration::process_error> stop(
        listener_handle& handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.push_back(handle.name);
        if (fail_stop_) {
            return std::unexpected(integration::process_error::signal_failed);
        }
        return {};
    }

    void fail_start_of(const std::string& name) { fail_start_.insert(name); }
    void fail_stop() { fail_stop_ = true; }

    std::vector<std::string> started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }
    std::vector<std::string> stopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> fail_start_;
    bool fail_stop_ = false;
    std::vector<std::string> started_;
    std::vector<std::string> stopped_;
};

/**
 * @brief Stop channel rejecting the first @c failures sends
 */
class flaky_channel : public stop_channel {
public:
    explicit flaky_channel(size_t failures) : failures_(failures) {}

    std::expected<void, channel_error> send_stop() override {
        size_t attempt = ++attempts_;
        if (attempt <= failures_) {
            return std::unexpected(channel_error::send_rejected);
        }
        return stop_channel::send_stop();
    }

    size_t attempts() const { return attempts_.load(); }

private:
    size_t failures_;
    std::atomic<size_t> attempts_{0};
};

class flaky_channel_factory : public stop_channel_factory {
public:
    explicit flaky_channel_factory(size_t failures) : failures_(failures) {}

    std::shared_ptr<stop_channel> create(const std::string& /*route_name*/) override {
        auto channel = std::make_shared<flaky_channel>(failures_);
        channels.push_back(channel);
        return channel;
    }

    std::vector<std::shared_ptr<flaky_channel>> channels;

private:
    size_t failures_;
};

/**
 * @brief Factory whose Nth create() throws, as thread exhaustion would
 */
class failing_channel_factory : public stop_channel_factory {
public:
    explicit failing_channel_factory(size_t fail_at) : fail_at_(fail_at) {}

    std::shared_ptr<stop_channel> create(const std::string& /*route_name*/) override {
        if (++created_ == fail_at_) {
            throw std::system_error(
                std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        auto channel = std::make_shared<stop_channel>();
        channels.push_back(channel);
        return channel;
    }

    std::vector<std::shared_ptr<stop_channel>> channels;

private:
    size_t fail_at_;
    size_t created_ = 0;
};

/**
 * @brief Sender that blocks every delivery until released
 */
class blocking_sender : public delivery::network_sender {
public:
    delivery::delivery_result send(const std::filesystem::path& /*object*/,
                                   const config::network_endpoint& /*target*/) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_;
        cv_.wait(lock, [this] { return released_; });
        return {};
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    int waiting() {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
    int waiting_ = 0;
};

// =============================================================================
// Fixture
// =============================================================================

class EndpointManagerTest : public pacs_forward_test {
protected:
    void SetUp() override {
        pacs_forward_test::SetUp();
        launcher_ = std::make_shared<fake_launcher>();
        mirror_ = make_dir("mirror");
    }

    config::forward_config make_config() {
        config::forward_config config;
        config.listeners = {{.name = "L1",
                             .port = 11112,
                             .ae_title = "LISTENER",
                             .output_dir = (root() / "incoming" / "L1").string()}};
        config.endpoints = {
            config::directory_endpoint{.name = "E1", .path = mirror_.string()}};
        config.routes = {{.name = "L1", .endpoints = {"E1"}}};
        config.worker.minimum_age = 1000ms;
        config.worker.idle_backoff = 20ms;
        config.worker.max_parallel_deliveries = 2;
        return config;
    }

    manager_dependencies deps(std::shared_ptr<stop_channel_factory> factory = {},
                              std::shared_ptr<delivery::network_sender> sender = {}) {
        return manager_dependencies{.launcher = launcher_,
                                    .sender = std::move(sender),
                                    .channel_factory = std::move(factory)};
    }

    std::shared_ptr<fake_launcher> launcher_;
    std::filesystem::path mirror_;
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(EndpointManagerTest, StartAndStop) {
    auto config = make_config();
    endpoint_manager manager(config, deps());

    ASSERT_TRUE(manager.start().has_value());
    EXPECT_TRUE(manager.is_running());
    EXPECT_TRUE(std::filesystem::is_directory(config.listeners[0].output_dir));
    EXPECT_THAT(launcher_->started(), ElementsAre("L1"));
    ASSERT_EQ(manager.routes().size(), 1u);

    auto stopped = manager.stop();
    EXPECT_TRUE(stopped.has_value());
    EXPECT_FALSE(manager.is_running());
    EXPECT_THAT(launcher_->stopped(), ElementsAre("L1"));
}

TEST_F(EndpointManagerTest, SecondStartFails) {
    endpoint_manager manager(make_config(), deps());
    ASSERT_TRUE(manager.start().has_value());

    auto again = manager.start();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), manager_error::already_running);
    EXPECT_THAT(launcher_->started(), ElementsAre("L1"));

    EXPECT_TRUE(manager.stop().has_value());
}

TEST_F(EndpointManagerTest, StopWhileNotRunningFails) {
    endpoint_manager manager(make_config(), deps());
    auto result = manager.stop();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), manager_error::not_running);
}

TEST_F(EndpointManagerTest, InvalidConfigurationStartsNothing) {
    auto config = make_config();
    config.routes[0].endpoints = {"UNDECLARED"};
    endpoint_manager manager(config, deps());

    auto result = manager.start();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), manager_error::invalid_configuration);
    EXPECT_FALSE(manager.is_running());
    EXPECT_TRUE(launcher_->started().empty());
}

TEST_F(EndpointManagerTest, ListenerStartFailureRollsBack) {
    auto config = make_config();
    config.listeners.push_back({.name = "L2",
                                .port = 11113,
                                .ae_title = "LISTENER2",
                                .output_dir = (root() / "incoming" / "L2").string()});
    launcher_->fail_start_of("L2");
    endpoint_manager manager(config, deps());

    auto result = manager.start();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), manager_error::listener_start_failed);
    EXPECT_FALSE(manager.is_running());
    EXPECT_THAT(launcher_->stopped(), ElementsAre("L1"));
}

TEST_F(EndpointManagerTest, WorkerSpawnFailureRollsBack) {
    auto config = make_config();
    config.listeners.push_back({.name = "L2",
                                .port = 11113,
                                .ae_title = "LISTENER2",
                                .output_dir = (root() / "incoming" / "L2").string()});
    config.routes.push_back({.name = "L2", .endpoints = {"E1"}});
    auto factory = std::make_shared<failing_channel_factory>(2);
    endpoint_manager manager(config, deps(factory));

    auto result = manager.start();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), manager_error::worker_start_failed);
    EXPECT_FALSE(manager.is_running());
    EXPECT_THAT(launcher_->stopped(), UnorderedElementsAre("L1", "L2"));
    ASSERT_EQ(factory->channels.size(), 1u);
    EXPECT_TRUE(factory->channels[0]->stop_requested());
}

TEST_F(EndpointManagerTest, ListenerStopFailureIsReported) {
    launcher_->fail_stop();
    endpoint_manager manager(make_config(), deps());
    ASSERT_TRUE(manager.start().has_value());

    auto result = manager.stop();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), manager_error::listener_stop_failed);
    EXPECT_FALSE(manager.is_running());
}

TEST_F(EndpointManagerTest, DestructorStopsRunningManager) {
    {
        endpoint_manager manager(make_config(), deps());
        ASSERT_TRUE(manager.start().has_value());
    }
    EXPECT_THAT(launcher_->stopped(), ElementsAre("L1"));
}

// =============================================================================
// Forwarding
// =============================================================================

TEST_F(EndpointManagerTest, ForwardsStoredObjects) {
    auto config = make_config();
    endpoint_manager manager(config, deps());
    ASSERT_TRUE(manager.start().has_value());

    auto incoming = std::filesystem::path(config.listeners[0].output_dir);
    write_aged_file(incoming / "f.bin", std::string(32, 'z'), 10s);

    EXPECT_TRUE(wait_for([&] {
        return std::filesystem::exists(mirror_ / "f.bin") &&
               !std::filesystem::exists(incoming / "f.bin");
    }));
    EXPECT_EQ(read_file(mirror_ / "f.bin"), std::string(32, 'z'));

    ASSERT_TRUE(manager.stop().has_value());
    auto stats = manager.get_statistics();
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].route_name, "L1");
    EXPECT_EQ(stats[0].worker.objects_delivered, 1u);
}

TEST_F(EndpointManagerTest, RoutesProgressIndependently) {
    auto config = make_config();
    config.listeners.push_back({.name = "SLOW",
                                .port = 11113,
                                .ae_title = "SLOW",
                                .output_dir = (root() / "incoming" / "SLOW").string()});
    config.endpoints.push_back(config::network_endpoint{.name = "HANG",
                                                        .address = "127.0.0.1",
                                                        .port = 104,
                                                        .calling_ae = "FORWARD",
                                                        .called_ae = "HANG"});
    config.routes.push_back({.name = "SLOW", .endpoints = {"HANG"}});

    auto sender = std::make_shared<blocking_sender>();
    endpoint_manager manager(config, deps({}, sender));
    ASSERT_TRUE(manager.start().has_value());

    auto slow_dir = std::filesystem::path(config.listeners[1].output_dir);
    auto fast_dir = std::filesystem::path(config.listeners[0].output_dir);
    write_aged_file(slow_dir / "stuck.bin", "stuck", 10s);
    ASSERT_TRUE(wait_for([&] { return sender->waiting() >= 1; }));

    write_aged_file(fast_dir / "f.bin", "fast", 10s);
    EXPECT_TRUE(wait_for([&] { return std::filesystem::exists(mirror_ / "f.bin"); },
                         3000ms));
    EXPECT_TRUE(std::filesystem::exists(slow_dir / "stuck.bin"));

    sender->release();
    EXPECT_TRUE(manager.stop().has_value());
}

TEST_F(EndpointManagerTest, StopWaitsForInFlightDelivery) {
    auto config = make_config();
    config.endpoints.push_back(config::network_endpoint{.name = "SLOW",
                                                        .address = "127.0.0.1",
                                                        .port = 104,
                                                        .calling_ae = "FORWARD",
                                                        .called_ae = "SLOW"});
    config.routes[0].endpoints = {"SLOW", "E1"};
    auto sender = std::make_shared<blocking_sender>();
    endpoint_manager manager(config, deps({}, sender));
    ASSERT_TRUE(manager.start().has_value());

    auto incoming = std::filesystem::path(config.listeners[0].output_dir);
    write_aged_file(incoming / "f.bin", "payload", 10s);
    ASSERT_TRUE(wait_for([&] { return sender->waiting() >= 1; }));

    std::thread releaser([&sender] {
        std::this_thread::sleep_for(100ms);
        sender->release();
    });
    auto stopped = manager.stop();
    releaser.join();

    EXPECT_TRUE(stopped.has_value());
    EXPECT_EQ(read_file(mirror_ / "f.bin"), "payload");
    EXPECT_FALSE(std::filesystem::exists(incoming / "f.bin"));
    auto stats = manager.get_statistics();
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].worker.objects_delivered, 1u);
}

// =============================================================================
// Bounded Shutdown
// =============================================================================

TEST_F(EndpointManagerTest, StopSucceedsAfterRejectedSignals) {
    auto config = make_config();
    config.manager.max_stop_attempts = 5;
    auto factory = std::make_shared<flaky_channel_factory>(4);
    endpoint_manager manager(config, deps(factory));
    ASSERT_TRUE(manager.start().has_value());

    auto result = manager.stop();
    EXPECT_TRUE(result.has_value());
    ASSERT_EQ(factory->channels.size(), 1u);
    EXPECT_EQ(factory->channels[0]->attempts(), 5u);
    EXPECT_FALSE(manager.is_running());
}

TEST_F(EndpointManagerTest, StopGivesUpAfterMaxAttempts) {
    auto config = make_config();
    config.manager.max_stop_attempts = 7;
    auto factory = std::make_shared<flaky_channel_factory>(1000);
    endpoint_manager manager(config, deps(factory));
    ASSERT_TRUE(manager.start().has_value());

    auto result = manager.stop();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), manager_error::workers_not_stopped);
    EXPECT_EQ(factory->channels[0]->attempts(), 7u);
    EXPECT_FALSE(manager.is_running());
}

TEST_F(EndpointManagerTest, UnstoppedWorkersTakePrecedenceOverListenerFailure) {
    auto config = make_config();
    config.manager.max_stop_attempts = 2;
    launcher_->fail_stop();
    auto factory = std::make_shared<flaky_channel_factory>(1000);
    endpoint_manager manager(config, deps(factory));
    ASSERT_TRUE(manager.start().has_value());

    auto result = manager.stop();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), manager_error::workers_not_stopped);
}

TEST_F(EndpointManagerTest, ManagerCanRestartAfterStop) {
    endpoint_manager manager(make_config(), deps());
    ASSERT_TRUE(manager.start().has_value());
    ASSERT_TRUE(manager.stop().has_value());
    ASSERT_TRUE(manager.start().has_value());
    EXPECT_TRUE(manager.stop().has_value());
    EXPECT_EQ(launcher_->started().size(), 2u);
}

TEST_F(EndpointManagerTest, ErrorCodesInAllocatedRange) {
    EXPECT_EQ(to_error_code(manager_error::already_running), -1000);
    EXPECT_EQ(to_error_code(manager_error::workers_not_stopped), -1006);
    EXPECT_EQ(to_error_code(channel_error::closed), -990);
}

}  // namespace
}  // namespace pacs::forward::relay
