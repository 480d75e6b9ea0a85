/**
 * @file event_codec.cpp
 * @brief nlohmann::json based event codec.
 */
#include "strangler/events/event_codec.hpp"

#include <cstdint>
#include <limits>
#include <optional>

#include <nlohmann/json.hpp>

namespace strangler::events {

using nlohmann::json;
using strangler_detail::unexpected;

namespace {

using FieldError = std::optional<DecodeError>;

DecodeError type_error(const char* key, const char* want, const json& got) {
    return DecodeError{std::string("json: cannot unmarshal ") + got.type_name() +
                       " into field " + key + " of type " + want};
}

FieldError read_field(const json& obj, const char* key, std::int64_t& out) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (it->is_number_unsigned()) {
        const auto u = it->get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return DecodeError{std::string("json: value of field ") + key + " overflows int"};
        }
        out = static_cast<std::int64_t>(u);
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        out = it->get<std::int64_t>();
        return std::nullopt;
    }
    return type_error(key, "int", *it);
}

FieldError read_field(const json& obj, const char* key, double& out) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_number()) return type_error(key, "float64", *it);
    out = it->get<double>();
    return std::nullopt;
}

FieldError read_field(const json& obj, const char* key, std::string& out) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) return type_error(key, "string", *it);
    out = it->get<std::string>();
    return std::nullopt;
}

FieldError read_timestamp(const json& obj, const char* key, std::string& out) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) return type_error(key, "time.Time", *it);
    auto s = it->get<std::string>();
    if (!is_rfc3339(s)) {
        return DecodeError{"parsing time \"" + s + "\" as RFC 3339 failed"};
    }
    out = std::move(s);
    return std::nullopt;
}

strangler_detail::expected<json, DecodeError> parse_object(std::string_view body) {
    json j;
    try {
        j = json::parse(body.begin(), body.end());
    } catch (const json::parse_error& e) {
        return unexpected(DecodeError{body.empty() ? std::string("EOF") : std::string(e.what())});
    }
    if (!j.is_object()) {
        return unexpected(DecodeError{std::string("json: cannot unmarshal ") + j.type_name() + " into event object"});
    }
    return j;
}

bool digits(std::string_view s, std::size_t pos, std::size_t n) noexcept {
    if (pos + n > s.size()) return false;
    for (std::size_t i = pos; i < pos + n; ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

int number(std::string_view s, std::size_t pos, std::size_t n) noexcept {
    int v = 0;
    for (std::size_t i = pos; i < pos + n; ++i) v = v * 10 + (s[i] - '0');
    return v;
}

int days_in_month(int year, int month) noexcept {
    static constexpr int Days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : Days[month - 1];
}

} // namespace

bool is_rfc3339(std::string_view s) noexcept {
    // 2006-01-02T15:04:05
    if (s.size() < 20) return false;
    if (!digits(s, 0, 4) || s[4] != '-' || !digits(s, 5, 2) || s[7] != '-' || !digits(s, 8, 2)) return false;
    if (s[10] != 'T' || !digits(s, 11, 2) || s[13] != ':' || !digits(s, 14, 2) || s[16] != ':' || !digits(s, 17, 2)) {
        return false;
    }
    const int year = number(s, 0, 4), month = number(s, 5, 2), day = number(s, 8, 2);
    const int hour = number(s, 11, 2), minute = number(s, 14, 2), second = number(s, 17, 2);
    if (month < 1 || month > 12 || hour > 23 || minute > 59 || second > 59) return false;
    if (day < 1 || day > days_in_month(year, month)) return false;

    std::size_t pos = 19;
    if (s[pos] == '.') {
        const std::size_t start = ++pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
        if (pos == start) return false;
    }
    if (pos >= s.size()) return false;
    if (s[pos] == 'Z') return pos + 1 == s.size();
    if (s[pos] != '+' && s[pos] != '-') return false;
    if (pos + 6 != s.size() || !digits(s, pos + 1, 2) || s[pos + 3] != ':' || !digits(s, pos + 4, 2)) return false;
    return number(s, pos + 1, 2) <= 23 && number(s, pos + 4, 2) <= 59;
}

strangler_detail::expected<MovieEvent, DecodeError> decode_movie(std::string_view body) {
    auto j = parse_object(body);
    if (!j) return unexpected(j.error());
    MovieEvent e;
    for (auto err : {read_field(*j, "movie_id", e.movie_id), read_field(*j, "title", e.title),
                     read_field(*j, "action", e.action), read_field(*j, "user_id", e.user_id)}) {
        if (err) return unexpected(*err);
    }
    return e;
}

strangler_detail::expected<UserEvent, DecodeError> decode_user(std::string_view body) {
    auto j = parse_object(body);
    if (!j) return unexpected(j.error());
    UserEvent e;
    for (auto err : {read_field(*j, "user_id", e.user_id), read_field(*j, "username", e.username),
                     read_field(*j, "action", e.action), read_timestamp(*j, "timestamp", e.timestamp)}) {
        if (err) return unexpected(*err);
    }
    return e;
}

strangler_detail::expected<PaymentEvent, DecodeError> decode_payment(std::string_view body) {
    auto j = parse_object(body);
    if (!j) return unexpected(j.error());
    PaymentEvent e;
    for (auto err : {read_field(*j, "payment_id", e.payment_id), read_field(*j, "user_id", e.user_id),
                     read_field(*j, "amount", e.amount), read_field(*j, "status", e.status),
                     read_timestamp(*j, "timestamp", e.timestamp)}) {
        if (err) return unexpected(*err);
    }
    return e;
}

std::string encode(const MovieEvent& e) {
    nlohmann::ordered_json j;
    j["movie_id"] = e.movie_id;
    j["title"]    = e.title;
    j["action"]   = e.action;
    j["user_id"]  = e.user_id;
    return j.dump();
}

std::string encode(const UserEvent& e) {
    nlohmann::ordered_json j;
    j["user_id"]   = e.user_id;
    j["username"]  = e.username;
    j["action"]    = e.action;
    j["timestamp"] = e.timestamp;
    return j.dump();
}

std::string encode(const PaymentEvent& e) {
    nlohmann::ordered_json j;
    j["payment_id"] = e.payment_id;
    j["user_id"]    = e.user_id;
    j["amount"]     = e.amount;
    j["status"]     = e.status;
    j["timestamp"]  = e.timestamp;
    return j.dump();
}

strangler_detail::expected<std::string, DecodeError> reencode(EventKind kind, std::string_view body) {
    switch (kind) {
        case EventKind::Movie: {
            auto e = decode_movie(body);
            if (!e) return unexpected(e.error());
            return encode(*e);
        }
        case EventKind::User: {
            auto e = decode_user(body);
            if (!e) return unexpected(e.error());
            return encode(*e);
        }
        case EventKind::Payment: {
            auto e = decode_payment(body);
            if (!e) return unexpected(e.error());
            return encode(*e);
        }
    }
    return unexpected(DecodeError{"Unknown event type"});
}

} // namespace strangler::events
