#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace tgstore {

// A C++-like interface for manipulating environment variables.
class Env {
   public:
    Env() = default;

    class ValueEntry {
        std::string _key;

       public:
        explicit ValueEntry(const std::string_view key) : _key(key) {}
        // Aka, setenv
        const Env::ValueEntry& operator=(const std::string_view value) const;
        // Aka, unsetenv
        void clear() const;
        // Aka, getenv
        [[nodiscard]] std::string get() const;

        [[nodiscard]] bool has() const;

        bool assign(std::string& ref) const {
            if (has()) {
                ref = get();
                return true;
            }
            return false;
        }
        [[nodiscard]] std::string_view key() const { return _key; }

        ValueEntry() = delete;
        ~ValueEntry() = default;
    };

    ValueEntry operator[](const std::string_view key) const {
        return ValueEntry{key};
    }
};

inline std::ostream& operator<<(std::ostream& o, const Env::ValueEntry& entry) {
    if (entry.has()) {
        o << entry.get();
    } else {
        o << "(nonexistent variable " << entry.key() << ")";
    }
    return o;
}

}  // namespace tgstore
