#pragma once
/**
 * @file ingest_handler.hpp
 * @brief Producer-side HTTP contract for one event kind.
 * @details POST only; decode, re-serialize, publish, then acknowledge.
 *          Delivery is at-most-once from the caller's point of view.
 */

#include <string_view>

#include "strangler/events/broker.hpp"
#include "strangler/events/event_types.hpp"
#include "strangler/proxy/http_types.hpp"

namespace strangler::events {

/** @class IngestEndpoint
 *  @brief Maps (method, body) to a response and at most one publish.
 */
class IngestEndpoint {
public:
    /**
     * @param kind Event kind served by this endpoint.
     * @param publisher Shared writer; must outlive the endpoint.
     */
    IngestEndpoint(EventKind kind, EventPublisher& publisher) noexcept
        : kind_(kind), publisher_(&publisher) {}

    /// 201 on publish, 400 on decode failure, 405 on non-POST, 500 on broker failure.
    proxy::HttpResponse handle(std::string_view method, std::string_view body) const;

    EventKind kind() const noexcept { return kind_; }

    /// Liveness only; does not touch the broker.
    static proxy::HttpResponse health();

private:
    EventKind       kind_;
    EventPublisher* publisher_;
};

} // namespace strangler::events
