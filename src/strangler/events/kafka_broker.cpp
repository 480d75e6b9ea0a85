/**
 * @file kafka_broker.cpp
 * @brief librdkafka producer/consumer adapters.
 */
#include "strangler/events/kafka_broker.hpp"
#include "strangler/config/constants.hpp"

#include <future>
#include <utility>

#include <spdlog/spdlog.h>

namespace strangler::events {

using namespace strangler::config::constants;
using strangler_detail::unexpected;

namespace {

/// Outcome handed from the delivery-report callback to the waiting publisher.
struct Delivery {
    RdKafka::ErrorCode err{RdKafka::ERR_NO_ERROR};
    std::string        detail;
};

bool set_conf(RdKafka::Conf& conf, const std::string& key, const std::string& value, std::string& err) {
    if (conf.set(key, value, err) != RdKafka::Conf::CONF_OK) {
        err = key + ": " + err;
        return false;
    }
    return true;
}

} // namespace

class KafkaPublisher::DeliveryReport final : public RdKafka::DeliveryReportCb {
public:
    void dr_cb(RdKafka::Message& message) override {
        auto* done = static_cast<std::promise<Delivery>*>(message.msg_opaque());
        if (!done) return;
        // publish() destroys *done once the value is ready.
        fulfil_and_release(*done, Delivery{message.err(), message.errstr()});
    }
};

// ---------------------------------------------------------------- publisher --

strangler_detail::expected<std::unique_ptr<KafkaPublisher>, BrokerError>
KafkaPublisher::create(const std::string& brokers) {
    std::string err;
    auto dr = std::make_unique<DeliveryReport>();
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));

    if (!set_conf(*conf, "bootstrap.servers", brokers, err) ||
        !set_conf(*conf, "message.timeout.ms", std::to_string(PRODUCER_MESSAGE_TIMEOUT_MS), err)) {
        return unexpected(BrokerError{BrokerErrc::Config, err});
    }
    if (conf->set("dr_cb", dr.get(), err) != RdKafka::Conf::CONF_OK) {
        return unexpected(BrokerError{BrokerErrc::Config, "dr_cb: " + err});
    }

    std::unique_ptr<RdKafka::Producer> producer(RdKafka::Producer::create(conf.get(), err));
    if (!producer) return unexpected(BrokerError{BrokerErrc::Config, "producer: " + err});

    return std::unique_ptr<KafkaPublisher>(new KafkaPublisher(std::move(dr), std::move(producer)));
}

KafkaPublisher::KafkaPublisher(std::unique_ptr<DeliveryReport> dr, std::unique_ptr<RdKafka::Producer> producer)
    : dr_(std::move(dr)), producer_(std::move(producer)) {
    poller_ = std::jthread([p = producer_.get()](std::stop_token st) {
        while (!st.stop_requested()) p->poll(PRODUCER_POLL_INTERVAL_MS);
    });
}

KafkaPublisher::~KafkaPublisher() {
    const auto rc = producer_->flush(PRODUCER_FLUSH_TIMEOUT_MS);
    if (rc != RdKafka::ERR_NO_ERROR) {
        spdlog::warn("Producer flush incomplete: {} message(s) pending ({})",
                     producer_->outq_len(), RdKafka::err2str(rc));
    }
    poller_.request_stop();
    if (poller_.joinable()) poller_.join();
}

strangler_detail::expected<void, BrokerError>
KafkaPublisher::publish(std::string_view topic, const std::string& payload) {
    std::promise<Delivery> done;
    auto fut = done.get_future();

    // Key left unset: the partitioner spreads messages, no per-entity ordering.
    const RdKafka::ErrorCode rc = producer_->produce(
        std::string(topic), RdKafka::Topic::PARTITION_UA, RdKafka::Producer::RK_MSG_COPY,
        const_cast<char*>(payload.data()), payload.size(),
        nullptr, 0, 0, &done);
    if (rc != RdKafka::ERR_NO_ERROR) {
        return unexpected(BrokerError{BrokerErrc::Publish, RdKafka::err2str(rc)});
    }

    // librdkafka reports every accepted message within message.timeout.ms.
    const Delivery d = fut.get();
    if (d.err != RdKafka::ERR_NO_ERROR) {
        return unexpected(BrokerError{BrokerErrc::Publish, d.detail});
    }
    return {};
}

// ------------------------------------------------------------------- source --

strangler_detail::expected<std::unique_ptr<MessageSource>, BrokerError>
KafkaMessageSource::create(const std::string& brokers, const std::string& group_id, std::string_view topic) {
    std::string err;
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));

    if (!set_conf(*conf, "bootstrap.servers", brokers, err) ||
        !set_conf(*conf, "group.id", group_id, err) ||
        !set_conf(*conf, "auto.offset.reset", "earliest", err) ||
        !set_conf(*conf, "fetch.min.bytes", std::to_string(CONSUMER_FETCH_MIN_BYTES), err) ||
        !set_conf(*conf, "fetch.max.bytes", std::to_string(CONSUMER_FETCH_MAX_BYTES), err)) {
        return unexpected(BrokerError{BrokerErrc::Config, err});
    }

    std::unique_ptr<RdKafka::KafkaConsumer> consumer(RdKafka::KafkaConsumer::create(conf.get(), err));
    if (!consumer) return unexpected(BrokerError{BrokerErrc::Config, "consumer: " + err});

    const RdKafka::ErrorCode rc = consumer->subscribe({std::string(topic)});
    if (rc != RdKafka::ERR_NO_ERROR) {
        consumer->close();
        return unexpected(BrokerError{BrokerErrc::Config, "subscribe " + std::string(topic) + ": " +
                                                          RdKafka::err2str(rc)});
    }

    return std::unique_ptr<MessageSource>(new KafkaMessageSource(std::move(consumer)));
}

KafkaMessageSource::~KafkaMessageSource() {
    consumer_->close();
}

strangler_detail::expected<BrokerMessage, BrokerError> KafkaMessageSource::read(std::stop_token st) {
    // Poll in slices so a stop request is noticed without a broker round trip.
    while (!st.stop_requested()) {
        std::unique_ptr<RdKafka::Message> msg(consumer_->consume(CONSUMER_POLL_TIMEOUT_MS));
        if (!msg) continue;

        if (msg->err() == RdKafka::ERR_NO_ERROR) {
            BrokerMessage out;
            out.topic     = msg->topic_name();
            out.partition = msg->partition();
            out.offset    = msg->offset();
            if (const std::string* k = msg->key()) out.key = *k;
            if (msg->payload() != nullptr) {
                out.value.assign(static_cast<const char*>(msg->payload()), msg->len());
            }
            return out;
        }

        std::string fatal_detail;
        const bool fatal_flag = consumer_->fatal_error(fatal_detail) != RdKafka::ERR_NO_ERROR;
        switch (classify_consume_error(msg->err(), fatal_flag)) {
            case ConsumeDisposition::Idle:
                continue;
            case ConsumeDisposition::Transient:
                spdlog::warn("Consumer error on topic {} (retrying): {}", msg->topic_name(), msg->errstr());
                continue;
            case ConsumeDisposition::Fatal:
                return unexpected(BrokerError{BrokerErrc::Read, fatal_detail.empty() ? msg->errstr() : fatal_detail});
        }
    }
    return unexpected(BrokerError{BrokerErrc::Stopped, "stop requested"});
}

ConsumeDisposition classify_consume_error(RdKafka::ErrorCode err, bool fatal_flag) noexcept {
    if (fatal_flag) return ConsumeDisposition::Fatal;
    switch (err) {
        case RdKafka::ERR__TIMED_OUT:
        case RdKafka::ERR__PARTITION_EOF:
            return ConsumeDisposition::Idle;
        case RdKafka::ERR__FATAL:
        case RdKafka::ERR__INVALID_ARG:
        case RdKafka::ERR_TOPIC_AUTHORIZATION_FAILED:
        case RdKafka::ERR_GROUP_AUTHORIZATION_FAILED:
            return ConsumeDisposition::Fatal;
        default:
            // Transport errors, all brokers down, unknown topic before its first
            // produce, rebalances: the client keeps retrying internally.
            return ConsumeDisposition::Transient;
    }
}

MessageSourceFactory kafka_source_factory(std::string brokers, std::string group_id) {
    return [brokers = std::move(brokers), group_id = std::move(group_id)](std::string_view topic) {
        return KafkaMessageSource::create(brokers, group_id, topic);
    };
}

} // namespace strangler::events
