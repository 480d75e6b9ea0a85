#pragma once
/**
 * @file consumer_loop.hpp
 * @brief Long-lived per-topic read loops and their supervisor.
 * @details One loop per topic, each on its own std::jthread, all sharing one
 *          consumer group. A read error ends only that topic's loop. With
 *          RestartPolicy::enabled the supervisor recreates the source after an
 *          exponential backoff instead; the default is to stay degraded.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "strangler/config/constants.hpp"
#include "strangler/events/broker.hpp"

namespace strangler::events {

/** @struct RestartPolicy
 *  @brief Supervision of failed loops.
 */
struct RestartPolicy {
    bool     enabled{strangler::config::constants::CONSUMER_DEFAULT_RESTART};           ///< Off: terminate and continue degraded
    uint32_t backoff_ms{strangler::config::constants::CONSUMER_RESTART_BACKOFF_MS};     ///< First delay, doubled per consecutive failure
    uint32_t max_backoff_ms{strangler::config::constants::CONSUMER_RESTART_MAX_BACKOFF_MS};
};

/// Why a loop returned.
enum class LoopExit : uint8_t {
    Stopped,     ///< Stop requested
    ReadError,   ///< read() failed
    SourceError  ///< Source could not be created
};

std::string_view to_string(LoopExit e) noexcept;

/// Called for every message; the default logs topic, partition, offset, key and value.
using MessageSink = std::function<void(const BrokerMessage&)>;

void log_message(const BrokerMessage& m);

/**
 * @brief Read from @p src until a read error or a stop request.
 * @param delivered Incremented per message if non-null.
 */
LoopExit run_consumer_loop(std::string_view topic, MessageSource& src, const MessageSink& sink,
                           std::stop_token st, std::atomic<uint64_t>* delivered = nullptr);

/** @struct LoopStatus
 *  @brief Snapshot of one topic's loop.
 */
struct LoopStatus {
    std::string             topic;
    bool                    running{false};
    uint64_t                delivered{0};
    uint32_t                restarts{0};
    std::optional<LoopExit> last_exit;
};

/** @class ConsumerSupervisor
 *  @brief Owns the per-topic threads. Destruction stops and joins them.
 */
class ConsumerSupervisor {
public:
    ConsumerSupervisor(MessageSourceFactory factory, RestartPolicy policy, MessageSink sink = log_message);
    ~ConsumerSupervisor();

    ConsumerSupervisor(const ConsumerSupervisor&)            = delete;
    ConsumerSupervisor& operator=(const ConsumerSupervisor&) = delete;

    /// Launch one loop per topic. Call once.
    void start(const std::vector<std::string>& topics);

    /// Block until every loop has exited.
    void wait();

    /// Ask every loop (and any pending backoff) to stop.
    void request_stop() noexcept;

    std::vector<LoopStatus> status() const;

private:
    struct Slot {
        std::string           topic;
        std::atomic<bool>     running{false};
        std::atomic<uint64_t> delivered{0};
        std::atomic<uint32_t> restarts{0};
        std::atomic<int>      last_exit{-1};
    };

    void supervise(std::stop_token st, Slot& slot);
    /// Sleep for @p ms unless stopped first. @return false if stopped.
    bool backoff(std::stop_token st, uint32_t ms);

    MessageSourceFactory               factory_;
    RestartPolicy                      policy_;
    MessageSink                        sink_;
    std::vector<std::unique_ptr<Slot>> slots_;
    std::mutex                         mu_;
    std::condition_variable_any        cv_;
    std::vector<std::jthread>          threads_;  ///< Last: joined before the members above go away
};

} // namespace strangler::events
