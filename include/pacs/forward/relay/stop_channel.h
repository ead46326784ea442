#ifndef PACS_FORWARD_RELAY_STOP_CHANNEL_H
#define PACS_FORWARD_RELAY_STOP_CHANNEL_H

/**
 * @file stop_channel.h
 * @brief Per-worker stop signalling
 *
 * The manager owns the sending side; the worker polls it at its safe
 * points and waits on it while idle. A closed channel reads as a stop
 * request, so a worker never outlives its manager.
 */

#include <chrono>
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <string>

namespace pacs::forward::relay {

// =============================================================================
// Error Codes (-990 to -999)
// =============================================================================

/**
 * @brief Stop channel error codes
 *
 * Allocated range: -990 to -999
 */
enum class channel_error : int {
    /** Channel was already closed */
    closed = -990,

    /** Receiver did not accept the signal */
    send_rejected = -991
};

/**
 * @brief Convert channel_error to error code integer
 */
[[nodiscard]] constexpr int to_error_code(channel_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description of channel error
 */
[[nodiscard]] constexpr const char* to_string(channel_error error) noexcept {
    switch (error) {
        case channel_error::closed:
            return "Stop channel is closed";
        case channel_error::send_rejected:
            return "Stop signal was not accepted";
        default:
            return "Unknown channel error";
    }
}

/**
 * @brief Stop channel between the manager and one worker
 *
 * The default implementation never rejects a send on an open channel.
 * Sends are virtual so tests can inject failing channels.
 */
class stop_channel {
public:
    stop_channel() = default;
    virtual ~stop_channel() = default;

    stop_channel(const stop_channel&) = delete;
    stop_channel& operator=(const stop_channel&) = delete;

    /**
     * @brief Ask the worker to stop at its next safe point
     */
    [[nodiscard]] virtual std::expected<void, channel_error> send_stop();

    /**
     * @brief Drop the sending side
     *
     * Wakes a waiting worker; stop_requested() is true from now on.
     */
    virtual void close() noexcept;

    /**
     * @brief Non-blocking check used at the worker's safe points
     */
    [[nodiscard]] bool stop_requested() const;

    /**
     * @brief Wait up to @p timeout for a stop request or close
     * @return true if stop was requested
     */
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_closed() const;

protected:
    /**
     * @brief Record the stop request and wake the worker
     */
    void signal();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    bool closed_ = false;
};

/**
 * @brief Creates the channel for a route's worker
 */
class stop_channel_factory {
public:
    virtual ~stop_channel_factory() = default;

    [[nodiscard]] virtual std::shared_ptr<stop_channel> create(
        const std::string& route_name) = 0;
};

/**
 * @brief Factory producing plain stop_channel instances
 */
class default_stop_channel_factory : public stop_channel_factory {
public:
    [[nodiscard]] std::shared_ptr<stop_channel> create(
        const std::string& route_name) override;
};

}  // namespace pacs::forward::relay

#endif  // PACS_FORWARD_RELAY_STOP_CHANNEL_H
