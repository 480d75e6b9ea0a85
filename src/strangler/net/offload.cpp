/**
 * @file offload.cpp
 * @brief Offload implementation.
 */
#include "strangler/net/offload.hpp"

#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace strangler::net {

Offload::~Offload() {
    drain();
}

bool Offload::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++active_;
    }
    try {
        std::thread([this, job = std::move(job)] {
            try {
                job();
            } catch (const std::exception& e) {
                spdlog::error("Offloaded job failed: {}", e.what());
            }
            std::lock_guard<std::mutex> lk(mu_);
            --active_;
            idle_.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::error("Cannot start worker thread: {}", e.what());
        std::lock_guard<std::mutex> lk(mu_);
        --active_;
        idle_.notify_all();
        return false;
    }
    return true;
}

std::size_t Offload::in_flight() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

void Offload::drain() {
    std::unique_lock<std::mutex> lk(mu_);
    idle_.wait(lk, [this] { return active_ == 0; });
}

} // namespace strangler::net
