#pragma once

#include <algorithm>
#include <array>
#include <boost/program_options/options_description.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "CommandLine.hpp"

namespace tgstore {

// Abstract manager for config loader
// Currently have three sources, cmdline, env and file
class ConfigManager {
   public:
    enum class Configs {
        UPLOAD_MODE,
        TOKEN,
        CHAT_ID,
        API_ID,
        API_HASH,
        SESSION_DIR,
        UPLOAD_TIMEOUT_SECONDS,
        HTTP_TIMEOUT_SECONDS,
        SESSION_MAX_UPLOAD,
        LOG_FILE,
        HELP,
        MAX
    };
    static constexpr size_t CONFIG_MAX = static_cast<int>(Configs::MAX);
    static constexpr std::string_view kConfigFileName = "tgstore.ini";

    /**
     * get - Function used to retrieve the value of a specific
     * configuration.
     *
     * @param config The configuration for which the value is to be retrieved.
     * @return A std::optional containing the value of the specified
     * configuration, or std::nullopt if the configuration is not found.
     */
    std::optional<std::string> get(Configs config) const;

    // Whether the flag-like config (e.g. HELP) was given on the command line.
    [[nodiscard]] bool has(Configs config) const;

    /**
     * serializeHelpToOStream - Function used to serialize the help information
     * to an output stream.
     *
     * @param out The output stream to which the help information will be
     * serialized.
     */
    static void serializeHelpToOStream(std::ostream& out);

    // Every config as a command line option, HELP included.
    static boost::program_options::options_description describe();

    // Reads ~/tgstore.ini as the file backend.
    explicit ConfigManager(CommandLine line);
    // Reads configFile as the file backend.
    ConfigManager(CommandLine line, std::filesystem::path configFile);

    struct Entry {
        static constexpr char ALIAS_NONE = '\0';

        Configs config;
        std::string_view name;
        std::string_view description;
        char alias;
        enum class ArgType { NONE, STRING } type;
    };

    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {
        Entry{
            Configs::UPLOAD_MODE,
            "UPLOAD_MODE",
            "Transport to use (bot/session)",
            'm',
            Entry::ArgType::STRING,
        },
        {
            Configs::TOKEN,
            "TOKEN",
            "Telegram bot token",
            't',
            Entry::ArgType::STRING,
        },
        {
            Configs::CHAT_ID,
            "CHAT_ID",
            "Destination chat (id, @handle or invite link)",
            'c',
            Entry::ArgType::STRING,
        },
        {
            Configs::API_ID,
            "API_ID",
            "Application id for session mode",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::API_HASH,
            "API_HASH",
            "Application hash for session mode",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::SESSION_DIR,
            "SESSION_DIR",
            "Authorized session database directory",
            's',
            Entry::ArgType::STRING,
        },
        {
            Configs::UPLOAD_TIMEOUT_SECONDS,
            "UPLOAD_TIMEOUT_SECONDS",
            "Deadline for a whole transfer",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::HTTP_TIMEOUT_SECONDS,
            "HTTP_TIMEOUT_SECONDS",
            "Bot API request timeout",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::SESSION_MAX_UPLOAD,
            "SESSION_MAX_UPLOAD",
            "Upload size ceiling in session mode (bytes)",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::LOG_FILE,
            "LOG_FILE",
            "Log file path",
            'f',
            Entry::ArgType::STRING,
        },
        {
            Configs::HELP,
            "HELP",
            "Display help information",
            'h',
            Entry::ArgType::NONE,
        },
    };

    static constexpr std::string_view nameOf(const Configs config) {
        return std::ranges::find_if(kConfigMap,
                                    [config](const Entry& entry) {
                                        return entry.config == config;
                                    })
            ->name;
    }

    struct Backend {
        virtual ~Backend() = default;

        virtual bool load() { return true; }
        virtual std::optional<std::string> get(const std::string_view name) = 0;
        virtual bool has(const std::string_view /*name*/) { return false; }

        /**
         * @brief This field stores the name of the backend.
         *
         * This field stores the name of the backend, such as "Command line" or
         * "File". This field is used for logging purposes.
         */
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

   private:
    enum class BackendType { COMMAND_LINE, ENV, FILE, MAX };

    class BackendStorage {
        std::array<std::unique_ptr<Backend>, static_cast<int>(BackendType::MAX)>
            backends;

       public:
        std::unique_ptr<Backend>& operator[](const BackendType type) {
            return backends[static_cast<int>(type)];
        }

        [[nodiscard]] decltype(backends)::const_iterator begin() const {
            return backends.cbegin();
        }

        [[nodiscard]] decltype(backends)::const_iterator end() const {
            return backends.cend();
        }

        [[nodiscard]] size_t size() const {
            return std::ranges::count_if(
                backends, [](const auto& ent) { return ent != nullptr; });
        }
    } storage;
    // CommandLine, Env, File
};

}  // namespace tgstore
