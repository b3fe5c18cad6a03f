#pragma once

#include <absl/status/statusor.h>

#include <optional>
#include <string_view>

#include "SessionApi.hpp"
#include "Types.hpp"

namespace tgstore {

/**
 * @brief A destination the session transport can send to.
 *
 * Only valid for the lifetime of the session that produced it; usernames can
 * be reassigned, so it is never persisted.
 */
struct PeerHandle {
    // How the handle was obtained.
    enum class Source {
        Direct,              // Looked up as configured
        NumericRetry,        // Numeric-looking string looked up as an integer
        JoinedThenResolved,  // Looked up after joining
        Unresolved,          // Every strategy failed; identifier passed as is
    };

    ChatIdentifier target;
    Source source = Source::Unresolved;
    // The chat, when the lookup confirmed it.
    std::optional<ChatInfo> chat;

    [[nodiscard]] bool confirmed() const {
        return source != Source::Unresolved;
    }
};

std::string_view toString(PeerHandle::Source source);

/**
 * @brief Turns a configured destination into a sendable peer handle.
 *
 * Strategies are tried in order and the first success wins:
 *   1. Direct lookup of the identifier as given.
 *   2. For numeric-looking strings, lookup of the integer value.
 *   3. For @handles and invite links, a join followed by one more lookup.
 * When all of them fail the normalized identifier is returned unconfirmed,
 * with a warning, so a send can still be attempted. A confirmed handle always
 * targets the chat's numeric id.
 */
class PeerResolver {
   public:
    explicit PeerResolver(SessionApi::Ptr api) : _api(api) {}

    /**
     * @brief Resolves a destination identifier.
     *
     * @param identifier Numeric id, numeric-looking string, @handle or invite
     * link.
     * @return The handle; ResolutionError only if the identifier is empty.
     */
    absl::StatusOr<PeerHandle> resolve(const ChatIdentifier& identifier) const;

    // Integers pass through, strings are trimmed.
    static ChatIdentifier normalize(const ChatIdentifier& identifier);

    // Parses an optionally '-'-prefixed decimal string.
    static std::optional<ChatId> parseNumeric(std::string_view identifier);

    // @handles and t.me / tg://join style links.
    static bool looksJoinable(std::string_view identifier);

   private:
    SessionApi::Ptr _api;
};

}  // namespace tgstore

template <>
struct fmt::formatter<tgstore::PeerHandle::Source>
    : formatter<std::string_view> {
    auto format(const tgstore::PeerHandle::Source source,
                format_context& ctx) const -> format_context::iterator {
        return formatter<std::string_view>::format(tgstore::toString(source),
                                                   ctx);
    }
};
