#include <absl/log/log.h>
#include <fmt/format.h>

#include <algorithm>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>

#include "CommandLine.hpp"
#include "ConfigManager.hpp"
#include "Env.hpp"

namespace po = boost::program_options;

namespace tgstore {

namespace {

template <typename T, ConfigManager::Configs config>
void AddOption(po::options_description &desc) {
    auto index = std::ranges::find_if(ConfigManager::kConfigMap,
                                      [](const ConfigManager::Entry &entry) {
                                          return entry.config == config;
                                      });
    if constexpr (std::is_same_v<T, void>) {
        if (index->alias != ConfigManager::Entry::ALIAS_NONE) {
            desc.add_options()(
                fmt::format("{},{}", index->name, index->alias).c_str(),
                index->description.data());
        } else {
            desc.add_options()(index->name.data(), index->description.data());
        }
    } else {
        if (index->alias != ConfigManager::Entry::ALIAS_NONE) {
            desc.add_options()(
                fmt::format("{},{}", index->name, index->alias).c_str(),
                po::value<T>(), index->description.data());
        } else {
            desc.add_options()(index->name.data(), po::value<T>(),
                               index->description.data());
        }
    }
}

struct ConfigBackendEnv : public ConfigManager::Backend {
    ~ConfigBackendEnv() override = default;
    ConfigBackendEnv() = default;

    std::optional<std::string> get(const std::string_view name) override {
        Env env;
        if (env[name].has()) {
            return env[name].get();
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string_view name() const override { return "Env"; }
};

template <ConfigManager::Entry::ArgType type>
struct ArgTypeDeducer {};

template <>
struct ArgTypeDeducer<ConfigManager::Entry::ArgType::STRING> {
    using Type = std::string;
};

template <>
struct ArgTypeDeducer<ConfigManager::Entry::ArgType::NONE> {
    using Type = void;
};

template <ConfigManager::Configs config>
void verifyUniqueConfig() {
    constexpr auto count = std::ranges::count_if(
        ConfigManager::kConfigMap,
        [](const auto &entry) { return entry.config == config; });
    static_assert(count == 1,
                  "kConfigMap must and only contain one of each configs");
}

template <size_t index>
void addIndexConfig(po::options_description &desc) {
    constexpr auto config = static_cast<ConfigManager::Configs>(index);

    // Handle special cases.
    if constexpr (config == ConfigManager::Configs::HELP ||
                  config == ConfigManager::Configs::MAX) {
        return;
    } else {
        constexpr auto argtype =
            std::ranges::find_if(ConfigManager::kConfigMap,
                                 [](const auto &entry) {
                                     return entry.config == config;
                                 })
                ->type;
        verifyUniqueConfig<config>();
        using ArgType = ArgTypeDeducer<argtype>::Type;
        AddOption<ArgType, config>(desc);
    }
}

template <size_t... index>
void addAll(po::options_description &desc,
            const std::index_sequence<index...> /*indexs*/) {
    (addIndexConfig<index>(desc), ...);
}

struct ConfigBackendBoostPOBase : public ConfigManager::Backend {
    static po::options_description getTgStoreOptionsDesc() {
        po::options_description desc("TgStore Configs");
        addAll(desc, std::make_index_sequence<ConfigManager::CONFIG_MAX>());
        return desc;
    }

    std::optional<std::string> get(const std::string_view name) override {
        if (const auto it = mp.find(std::string(name));
            it != mp.end() && !it->second.empty()) {
            return it->second.as<std::string>();
        }
        return std::nullopt;
    }

    bool has(const std::string_view name) override {
        return mp.count(std::string(name)) != 0;
    }

    ConfigBackendBoostPOBase() = default;
    ~ConfigBackendBoostPOBase() override = default;

   protected:
    po::variables_map mp;
};

struct ConfigBackendFile : public ConfigBackendBoostPOBase {
    std::filesystem::path _confPath;

    bool load() override {
        std::ifstream ifs(_confPath);
        if (ifs.fail()) {
            LOG(INFO) << "Opening " << _confPath << " failed";
            return false;
        }
        try {
            po::store(po::parse_config_file(ifs, getTgStoreOptionsDesc()), mp);
        } catch (const boost::program_options::error &e) {
            LOG(ERROR) << "File backend failed to parse: " << e.what();
            return false;
        }
        po::notify(mp);

        LOG(INFO) << "Loaded " << mp.size() << " entries from " << _confPath;
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "File"; }

    explicit ConfigBackendFile(std::filesystem::path confPath)
        : _confPath(std::move(confPath)) {}
    ~ConfigBackendFile() override = default;
};

struct ConfigBackendCmdline : public ConfigBackendBoostPOBase {
    CommandLine _line;

    static po::options_description getTgStoreOptionsDesc() {
        auto desc = ConfigBackendBoostPOBase::getTgStoreOptionsDesc();

        AddOption<void, ConfigManager::Configs::HELP>(desc);
        return desc;
    }

    bool load() override {
        try {
            // Subcommand arguments are parsed by the caller.
            po::store(po::command_line_parser(_line.argc(), _line.argv())
                          .options(getTgStoreOptionsDesc())
                          .allow_unregistered()
                          .run(),
                      mp);
        } catch (const boost::program_options::error &e) {
            LOG(ERROR) << "Cmdline backend failed to parse: " << e.what();
            return false;
        }
        po::notify(mp);

        DLOG(INFO) << "Loaded " << mp.size() << " entries (cmdline)";
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "Cmdline"; }

    explicit ConfigBackendCmdline(CommandLine line) : _line(std::move(line)) {}
    ~ConfigBackendCmdline() override = default;
};

std::filesystem::path defaultConfigFile() {
    Env env;
    if (!env["HOME"].has()) {
        LOG(WARNING) << "HOME is not set, no config file will be read";
        return {};
    }
    return std::filesystem::path(env["HOME"].get()) /
           ConfigManager::kConfigFileName;
}

}  // namespace

ConfigManager::ConfigManager(CommandLine line)
    : ConfigManager(std::move(line), defaultConfigFile()) {}

ConfigManager::ConfigManager(CommandLine line,
                             std::filesystem::path configFile) {
    auto cmdline = std::make_unique<ConfigBackendCmdline>(std::move(line));
    if (cmdline->load()) {
        storage[BackendType::COMMAND_LINE] = std::move(cmdline);
    }
    auto env = std::make_unique<ConfigBackendEnv>();
    if (env->load()) {
        storage[BackendType::ENV] = std::move(env);
    }
    if (!configFile.empty()) {
        auto file = std::make_unique<ConfigBackendFile>(std::move(configFile));
        if (file->load()) {
            storage[BackendType::FILE] = std::move(file);
        }
    }
    DLOG(INFO) << "Loaded " << storage.size() << " config sources";
}

std::optional<std::string> ConfigManager::get(Configs config) const {
    const std::string_view name = nameOf(config);

    for (const auto &bit : storage) {
        if (!bit) {
            continue;
        }
        const auto &result = bit->get(name);
        if (result.has_value()) {
            DLOG(INFO) << fmt::format("Used '{}' backend for variable {}",
                                      bit->name(), name);
            return result;
        }
    }

    return std::nullopt;
}

bool ConfigManager::has(Configs config) const {
    const std::string_view name = nameOf(config);
    return std::ranges::any_of(storage, [name](const auto &bit) {
        return bit && bit->has(name);
    });
}

po::options_description ConfigManager::describe() {
    return ConfigBackendCmdline::getTgStoreOptionsDesc();
}

void ConfigManager::serializeHelpToOStream(std::ostream &out) {
    out << describe() << std::endl;
}

}  // namespace tgstore
