#pragma once
/**
 * @file kafka_broker.hpp
 * @brief librdkafka implementations of EventPublisher and MessageSource.
 */

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <librdkafka/rdkafkacpp.h>

#include "strangler/compat/expected.hpp"
#include "strangler/events/broker.hpp"

namespace strangler::events {

/** @class KafkaPublisher
 *  @brief One producer shared by every handler; publish() blocks until the
 *         delivery report for that message arrives.
 *  @details A background thread pumps delivery reports. librdkafka's producer
 *           is thread-safe, so no external locking is needed.
 */
class KafkaPublisher final : public EventPublisher {
public:
    /// Build the producer. @return BrokerErrc::Config on bad settings.
    static strangler_detail::expected<std::unique_ptr<KafkaPublisher>, BrokerError>
    create(const std::string& brokers);

    ~KafkaPublisher() override;

    KafkaPublisher(const KafkaPublisher&)            = delete;
    KafkaPublisher& operator=(const KafkaPublisher&) = delete;

    strangler_detail::expected<void, BrokerError> publish(std::string_view topic,
                                                          const std::string& payload) override;

private:
    class DeliveryReport;

    KafkaPublisher(std::unique_ptr<DeliveryReport> dr, std::unique_ptr<RdKafka::Producer> producer);

    std::unique_ptr<DeliveryReport>    dr_;        ///< Must outlive producer_
    std::unique_ptr<RdKafka::Producer> producer_;
    std::jthread                       poller_;
};

/** @class KafkaMessageSource
 *  @brief Group consumer subscribed to a single topic.
 */
class KafkaMessageSource final : public MessageSource {
public:
    static strangler_detail::expected<std::unique_ptr<MessageSource>, BrokerError>
    create(const std::string& brokers, const std::string& group_id, std::string_view topic);

    ~KafkaMessageSource() override;

    KafkaMessageSource(const KafkaMessageSource&)            = delete;
    KafkaMessageSource& operator=(const KafkaMessageSource&) = delete;

    strangler_detail::expected<BrokerMessage, BrokerError> read(std::stop_token st) override;

private:
    explicit KafkaMessageSource(std::unique_ptr<RdKafka::KafkaConsumer> consumer)
        : consumer_(std::move(consumer)) {}

    std::unique_ptr<RdKafka::KafkaConsumer> consumer_;
};

/**
 * @brief Set the value of a promise whose owner may destroy it as soon as the
 *        value is ready (the delivery-report handoff).
 * @details The promise is moved onto this frame first, so set_value never
 *          touches the caller's object.
 */
template <class T>
void fulfil_and_release(std::promise<T>& owned_by_waiter, T value) {
    std::promise<T> local = std::move(owned_by_waiter);
    local.set_value(std::move(value));
}

/// What read() does with an error reported through consume().
enum class ConsumeDisposition : uint8_t {
    Idle,       ///< Nothing to deliver (poll timeout, end of partition)
    Transient,  ///< Logged; librdkafka recovers on its own (broker down, topic not yet created)
    Fatal       ///< Ends the loop
};

/**
 * @brief Classify a consumer error.
 * @param fatal_flag True when the client reported a fatal error (ERR__FATAL).
 */
ConsumeDisposition classify_consume_error(RdKafka::ErrorCode err, bool fatal_flag) noexcept;

/// Factory binding brokers and group id, for ConsumerSupervisor.
MessageSourceFactory kafka_source_factory(std::string brokers, std::string group_id);

} // namespace strangler::events
