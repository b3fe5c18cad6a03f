#pragma once

#include <absl/container/flat_hash_map.h>

#include <cstddef>
#include <optional>
#include <utility>

namespace tgstore {

/**
 * @brief Outcomes of outgoing sends, kept only for sends someone waits on.
 *
 * A key is registered with expect() before its outcome can arrive. complete()
 * drops outcomes for keys that were never registered or were abandoned, so
 * updates about unrelated messages do not accumulate.
 *
 * Not thread safe; the owner serializes access.
 */
template <typename Key, typename Outcome>
class SendRegistry {
   public:
    void expect(const Key& key) { _entries.try_emplace(key); }

    // Returns false if nobody waits for key.
    bool complete(const Key& key, Outcome outcome) {
        auto it = _entries.find(key);
        if (it == _entries.end() || it->second.has_value()) {
            return false;
        }
        it->second = std::move(outcome);
        return true;
    }

    [[nodiscard]] bool ready(const Key& key) const {
        auto it = _entries.find(key);
        return it != _entries.end() && it->second.has_value();
    }

    // Removes key and returns its outcome if one arrived.
    std::optional<Outcome> take(const Key& key) {
        auto it = _entries.find(key);
        if (it == _entries.end()) {
            return std::nullopt;
        }
        std::optional<Outcome> outcome = std::move(it->second);
        _entries.erase(it);
        return outcome;
    }

    void clear() { _entries.clear(); }

    [[nodiscard]] std::size_t size() const { return _entries.size(); }

   private:
    absl::flat_hash_map<Key, std::optional<Outcome>> _entries;
};

}  // namespace tgstore
