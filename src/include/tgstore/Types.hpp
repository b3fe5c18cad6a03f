#pragma once

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tgstore {

using ChatId = std::int64_t;
using MessageId = std::int64_t;

// A destination as configured: a numeric chat id, or a string that may be a
// numeric-looking id, an @handle or an invite link.
using ChatIdentifier = std::variant<ChatId, std::string>;

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

enum class TransportMode { Bot, Session };

constexpr std::string_view toString(const TransportMode mode) {
    switch (mode) {
        case TransportMode::Bot:
            return "bot";
        case TransportMode::Session:
            return "session";
    }
    return "unknown";
}

inline std::string toString(const ChatIdentifier& identifier) {
    if (const auto* id = std::get_if<ChatId>(&identifier)) {
        return std::to_string(*id);
    }
    return std::get<std::string>(identifier);
}

}  // namespace tgstore

template <>
struct fmt::formatter<tgstore::ChatIdentifier> : formatter<std::string_view> {
    auto format(const tgstore::ChatIdentifier& identifier,
                format_context& ctx) const -> format_context::iterator {
        return formatter<std::string_view>::format(tgstore::toString(identifier),
                                                   ctx);
    }
};

template <>
struct fmt::formatter<tgstore::TransportMode> : formatter<std::string_view> {
    auto format(const tgstore::TransportMode mode, format_context& ctx) const
        -> format_context::iterator {
        return formatter<std::string_view>::format(tgstore::toString(mode), ctx);
    }
};
