#pragma once
/**
 * @file offload.hpp
 * @brief Runs blocking request work off the HTTP server's worker pool.
 * @details Each job gets its own thread, so a slow origin holds only the
 *          connection it was asked for. Destruction waits for running jobs.
 */

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace strangler::net {

/** @class Offload
 *  @brief Thread-per-job executor with a drain-on-destroy guarantee.
 */
class Offload {
public:
    Offload() = default;
    ~Offload();

    Offload(const Offload&)            = delete;
    Offload& operator=(const Offload&) = delete;

    /**
     * @brief Start @p job on a new thread.
     * @return false if the thread could not be created; @p job was not run.
     */
    bool submit(std::function<void()> job);

    /// Jobs started and not yet finished.
    std::size_t in_flight() const;

    /// Block until no job is running.
    void drain();

private:
    mutable std::mutex      mu_;
    std::condition_variable idle_;
    std::size_t             active_{0};
};

} // namespace strangler::net
