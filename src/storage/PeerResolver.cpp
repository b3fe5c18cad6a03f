#include <absl/log/log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <fmt/format.h>

#include <algorithm>

#include <tgstore/Errors.hpp>
#include <tgstore/PeerResolver.hpp>

namespace tgstore {

std::string_view toString(const PeerHandle::Source source) {
    switch (source) {
        case PeerHandle::Source::Direct:
            return "direct";
        case PeerHandle::Source::NumericRetry:
            return "numeric-retry";
        case PeerHandle::Source::JoinedThenResolved:
            return "joined";
        case PeerHandle::Source::Unresolved:
            return "unresolved";
    }
    return "unknown";
}

ChatIdentifier PeerResolver::normalize(const ChatIdentifier& identifier) {
    if (const auto* str = std::get_if<std::string>(&identifier)) {
        return std::string(absl::StripAsciiWhitespace(*str));
    }
    return identifier;
}

std::optional<ChatId> PeerResolver::parseNumeric(std::string_view identifier) {
    std::string_view digits = identifier;
    if (absl::StartsWith(digits, "-")) {
        digits.remove_prefix(1);
    }
    const auto isDigit = [](char c) { return absl::ascii_isdigit(c); };
    if (digits.empty() || !std::ranges::all_of(digits, isDigit)) {
        return std::nullopt;
    }
    ChatId value = 0;
    if (!absl::SimpleAtoi(identifier, &value)) {
        return std::nullopt;
    }
    return value;
}

bool PeerResolver::looksJoinable(std::string_view identifier) {
    return absl::StartsWith(identifier, "@") ||
           absl::StartsWith(identifier, "https://") ||
           absl::StartsWith(identifier, "http://") ||
           absl::StartsWith(identifier, "t.me/") ||
           absl::StartsWith(identifier, "tg://join");
}

absl::StatusOr<PeerHandle> PeerResolver::resolve(
    const ChatIdentifier& identifier) const {
    const ChatIdentifier normalized = normalize(identifier);
    const auto* str = std::get_if<std::string>(&normalized);
    if (str != nullptr && str->empty()) {
        return ResolutionError("Destination identifier is empty");
    }

    const auto confirmedHandle = [](const ChatInfo& chat,
                                    PeerHandle::Source source) {
        LOG(INFO) << fmt::format("Resolved destination to chat {} ({}) via {}",
                                 chat.id, chat.title, source);
        return PeerHandle{ChatId{chat.id}, source, chat};
    };

    auto direct = _api->getChat(normalized);
    if (direct.ok()) {
        return confirmedHandle(*direct, PeerHandle::Source::Direct);
    }
    LOG(INFO) << fmt::format("Direct lookup of {} failed: {}", normalized,
                             direct.status().message());

    if (str != nullptr) {
        if (const auto numeric = parseNumeric(*str); numeric) {
            auto retried = _api->getChat(ChatIdentifier{*numeric});
            if (retried.ok()) {
                return confirmedHandle(*retried,
                                       PeerHandle::Source::NumericRetry);
            }
            LOG(INFO) << fmt::format("Numeric lookup of {} failed: {}",
                                     *numeric, retried.status().message());
        } else if (looksJoinable(*str)) {
            if (auto joined = _api->joinChat(*str); !joined.ok()) {
                LOG(INFO) << fmt::format("Joining {} failed: {}", *str,
                                         joined.message());
            }
            // The join may fail because we are already a member, so look up
            // once more regardless.
            auto afterJoin = _api->getChat(normalized);
            if (afterJoin.ok()) {
                return confirmedHandle(*afterJoin,
                                       PeerHandle::Source::JoinedThenResolved);
            }
            LOG(INFO) << fmt::format("Lookup of {} after join failed: {}",
                                     *str, afterJoin.status().message());
        }
    }

    LOG(WARNING) << fmt::format(
        "Could not confirm destination {}; sending to it unresolved. Sends "
        "may fail if the session has no access to it.",
        normalized);
    return PeerHandle{normalized, PeerHandle::Source::Unresolved,
                      std::nullopt};
}

}  // namespace tgstore
