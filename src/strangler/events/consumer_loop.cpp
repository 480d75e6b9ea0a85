/**
 * @file consumer_loop.cpp
 * @brief Consumer loops and restart supervision.
 */
#include "strangler/events/consumer_loop.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

namespace strangler::events {

std::string_view to_string(LoopExit e) noexcept {
    switch (e) {
        case LoopExit::Stopped:     return "stopped";
        case LoopExit::ReadError:   return "read_error";
        case LoopExit::SourceError: return "source_error";
    }
    return "unknown";
}

void log_message(const BrokerMessage& m) {
    spdlog::info("[CONSUMER] Received message from topic {} partition {} at offset {}: {} = {}",
                 m.topic, m.partition, m.offset, m.key.value_or(""), m.value);
}

LoopExit run_consumer_loop(std::string_view topic, MessageSource& src, const MessageSink& sink,
                           std::stop_token st, std::atomic<uint64_t>* delivered) {
    while (!st.stop_requested()) {
        auto msg = src.read(st);
        if (!msg) {
            if (msg.error().code == BrokerErrc::Stopped) return LoopExit::Stopped;
            spdlog::error("Error reading message from topic {}: {}", topic, msg.error().detail);
            return LoopExit::ReadError;
        }
        if (sink) sink(*msg);
        if (delivered) delivered->fetch_add(1, std::memory_order_relaxed);
    }
    return LoopExit::Stopped;
}

ConsumerSupervisor::ConsumerSupervisor(MessageSourceFactory factory, RestartPolicy policy, MessageSink sink)
    : factory_(std::move(factory)), policy_(policy), sink_(std::move(sink)) {}

ConsumerSupervisor::~ConsumerSupervisor() {
    request_stop();
    wait();
}

void ConsumerSupervisor::start(const std::vector<std::string>& topics) {
    slots_.reserve(topics.size());
    threads_.reserve(topics.size());
    for (const auto& t : topics) {
        auto slot = std::make_unique<Slot>();
        slot->topic = t;
        slot->running.store(true, std::memory_order_relaxed);
        Slot& ref = *slot;
        slots_.push_back(std::move(slot));
        threads_.emplace_back([this, &ref](std::stop_token st) { supervise(st, ref); });
    }
}

void ConsumerSupervisor::wait() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void ConsumerSupervisor::request_stop() noexcept {
    for (auto& t : threads_) t.request_stop();
    std::lock_guard<std::mutex> lk(mu_);
    cv_.notify_all();
}

std::vector<LoopStatus> ConsumerSupervisor::status() const {
    std::vector<LoopStatus> out;
    out.reserve(slots_.size());
    for (const auto& s : slots_) {
        LoopStatus ls;
        ls.topic     = s->topic;
        ls.running   = s->running.load(std::memory_order_acquire);
        ls.delivered = s->delivered.load(std::memory_order_relaxed);
        ls.restarts  = s->restarts.load(std::memory_order_relaxed);
        const int last = s->last_exit.load(std::memory_order_acquire);
        if (last >= 0) ls.last_exit = static_cast<LoopExit>(last);
        out.push_back(std::move(ls));
    }
    return out;
}

bool ConsumerSupervisor::backoff(std::stop_token st, uint32_t ms) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, st, std::chrono::milliseconds(ms), [] { return false; });
    return !st.stop_requested();
}

void ConsumerSupervisor::supervise(std::stop_token st, Slot& slot) {
    uint32_t delay = policy_.backoff_ms;

    while (!st.stop_requested()) {
        const uint64_t before = slot.delivered.load(std::memory_order_relaxed);
        LoopExit exit = LoopExit::SourceError;

        auto src = factory_(slot.topic);
        if (!src) {
            spdlog::error("Failed to start consumer for topic {}: {}", slot.topic, src.error().detail);
        } else {
            spdlog::info("Consumer started for topic {}", slot.topic);
            exit = run_consumer_loop(slot.topic, **src, sink_, st, &slot.delivered);
        }
        slot.last_exit.store(static_cast<int>(exit), std::memory_order_release);

        if (exit == LoopExit::Stopped || !policy_.enabled) break;

        // A loop that made progress starts the backoff over.
        if (slot.delivered.load(std::memory_order_relaxed) != before) delay = policy_.backoff_ms;

        spdlog::warn("Restarting consumer for topic {} in {} ms", slot.topic, delay);
        if (!backoff(st, delay)) break;
        delay = std::min(delay * 2, policy_.max_backoff_ms);
        slot.restarts.fetch_add(1, std::memory_order_relaxed);
    }

    slot.running.store(false, std::memory_order_release);
    spdlog::info("Consumer for topic {} exited", slot.topic);
}

} // namespace strangler::events
