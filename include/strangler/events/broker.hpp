#pragma once
/**
 * @file broker.hpp
 * @brief Broker seams: a shared publisher for the HTTP side and one blocking
 *        message source per consumer loop.
 * @details Kafka implementations live in kafka_broker.hpp; tests use in-memory fakes.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "strangler/compat/expected.hpp"

namespace strangler::events {

/** @struct BrokerMessage
 *  @brief One record read from a topic. Producers leave the key unset.
 */
struct BrokerMessage {
    std::string                topic;
    int32_t                    partition{-1};
    int64_t                    offset{-1};
    std::optional<std::string> key;
    std::string                value;
};

/** @enum BrokerErrc
 *  @brief Coarse failure classes. Transient and permanent are not distinguished.
 */
enum class BrokerErrc : uint8_t {
    Config,   ///< Client could not be created / subscribed
    Publish,  ///< Write not acknowledged
    Read,     ///< Read failed; ends the consumer loop
    Stopped   ///< Read interrupted by a stop request
};

struct BrokerError {
    BrokerErrc  code{BrokerErrc::Read};
    std::string detail;
};

/** @class EventPublisher
 *  @brief Synchronous topic writer shared by all request handlers.
 *  @note Implementations are internally synchronized.
 */
class EventPublisher {
public:
    virtual ~EventPublisher() = default;

    /**
     * @brief Write @p payload to @p topic and wait for the acknowledgment.
     * @return Empty on ack; BrokerError otherwise. Never retried here.
     */
    virtual strangler_detail::expected<void, BrokerError> publish(std::string_view topic,
                                                                  const std::string& payload) = 0;
};

/** @class MessageSource
 *  @brief Blocking reader bound to one topic.
 */
class MessageSource {
public:
    virtual ~MessageSource() = default;

    /**
     * @brief Block until a message arrives, the read fails, or @p st is signalled.
     * @return Message, or BrokerError (BrokerErrc::Stopped when interrupted).
     */
    virtual strangler_detail::expected<BrokerMessage, BrokerError> read(std::stop_token st) = 0;
};

/// Creates a source for a topic; called once per loop start (and per restart).
using MessageSourceFactory =
    std::function<strangler_detail::expected<std::unique_ptr<MessageSource>, BrokerError>(std::string_view topic)>;

} // namespace strangler::events
