/**
 * @file stop_channel.cpp
 * @brief Stop channel implementation
 */

#include "pacs/forward/relay/stop_channel.h"

namespace pacs::forward::relay {

std::expected<void, channel_error> stop_channel::send_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return std::unexpected(channel_error::closed);
        }
    }
    signal();
    return {};
}

void stop_channel::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool stop_channel::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_ || closed_;
}

bool stop_channel::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return stop_ || closed_; });
}

bool stop_channel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void stop_channel::signal() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
}

std::shared_ptr<stop_channel> default_stop_channel_factory::create(
    const std::string& /*route_name*/) {
    return std::make_shared<stop_channel>();
}

}  // namespace pacs::forward::relay
