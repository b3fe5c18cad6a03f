#include <absl/log/log.h>
#include <fcntl.h>
#include <fmt/format.h>
#include <unistd.h>

#include <CommandLine.hpp>
#include <ConfigManager.hpp>
#include <array>
#include <boost/program_options.hpp>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <logging/AbslLogInit.hpp>
#include <optional>
#include <string>
#include <tgstore/ByteSource.hpp>
#include <tgstore/Errors.hpp>
#include <tgstore/StorageClient.hpp>
#include <tgstore/StorageConfig.hpp>
#include <tgstore/StorageReference.hpp>

namespace po = boost::program_options;
using namespace tgstore;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

constexpr std::string_view kUsage =
    "Usage:\n"
    "  tgstore [configs] upload <path> [--name N] [--content-type T]\n"
    "  tgstore [configs] download --external-id ID [--chat-ref C "
    "--message-ref M]\n"
    "                             [--name N] [--size S] -o <path|->\n"
    "  tgstore [configs] resolve\n";

po::options_description commandOptions() {
    po::options_description desc("Command options");
    desc.add_options()("name", po::value<std::string>(), "Stored file name")(
        "content-type", po::value<std::string>(), "MIME type of the upload")(
        "external-id", po::value<std::string>(), "Stored file id")(
        "chat-ref", po::value<std::string>(), "Stored chat reference")(
        "message-ref", po::value<std::int64_t>(), "Stored message reference")(
        "size", po::value<std::uint64_t>(), "Stored file size")(
        "output,o", po::value<std::string>(), "Download destination");
    return desc;
}

int reportError(const absl::Status& status) {
    std::cerr << "error=" << errorKindOf(status) << std::endl;
    std::cerr << "message=" << status.message() << std::endl;
    return kExitFailure;
}

template <typename T>
std::optional<T> optionalOf(const po::variables_map& vm,
                            const std::string& key) {
    if (vm.count(key) == 0) {
        return std::nullopt;
    }
    return vm[key].as<T>();
}

int doUpload(StorageClient& client, const po::variables_map& vm) {
    if (vm.count("path") == 0) {
        std::cerr << kUsage;
        return kExitUsage;
    }
    const std::filesystem::path path = vm["path"].as<std::string>();
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        LOG(ERROR) << "Cannot stat " << path << ": " << ec.message();
        return reportError(NotFoundError(ec.message()));
    }
    const int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!isValidFd(fd)) {
        PLOG(ERROR) << "Cannot open " << path;
        return reportError(
            NotFoundError(fmt::format("Cannot open {}", path.string())));
    }
    FdByteSource source(fd, FdByteSource::Ownership::Owned, size);
    const std::string name =
        optionalOf<std::string>(vm, "name").value_or(path.filename().string());
    const std::string contentType =
        optionalOf<std::string>(vm, "content-type").value_or("");

    auto reference = client.upload(source, name, contentType, size);
    if (!reference.ok()) {
        return reportError(reference.status());
    }
    std::cout << *reference;
    return EXIT_SUCCESS;
}

absl::Status drain(ByteStream& stream, std::ostream& out,
                   std::uint64_t& written) {
    std::array<char, ByteStream::kChunkSize> buffer{};
    while (true) {
        auto n = stream.read(buffer);
        if (!n.ok()) {
            return n.status();
        }
        if (*n == 0) {
            return absl::OkStatus();
        }
        out.write(buffer.data(), static_cast<std::streamsize>(*n));
        if (!out) {
            stream.abort();
            return absl::InternalError("Writing the output failed");
        }
        written += *n;
    }
}

int doDownload(StorageClient& client, const po::variables_map& vm) {
    const auto output = optionalOf<std::string>(vm, "output");
    if (!output) {
        std::cerr << kUsage;
        return kExitUsage;
    }
    const auto reference = StorageReference::fromRecord(
        optionalOf<std::string>(vm, "external-id").value_or(""),
        optionalOf<std::string>(vm, "name").value_or(""),
        optionalOf<std::uint64_t>(vm, "size").value_or(0),
        optionalOf<std::string>(vm, "chat-ref"),
        optionalOf<std::int64_t>(vm, "message-ref"));

    auto download = client.download(reference);
    if (!download.ok()) {
        return reportError(download.status());
    }

    std::uint64_t written = 0;
    absl::Status status;
    if (*output == "-") {
        status = drain(*download->stream, std::cout, written);
    } else {
        std::ofstream ofs(*output, std::ios::binary | std::ios::out);
        if (!ofs.is_open()) {
            LOG(ERROR) << "Failed to open file for writing: " << *output;
            download->stream->abort();
            return reportError(absl::InternalError(
                fmt::format("Cannot open {} for writing", *output)));
        }
        status = drain(*download->stream, ofs, written);
    }
    if (!status.ok()) {
        return reportError(status);
    }
    if (*output != "-") {
        std::cout << "name=" << download->name << std::endl;
        std::cout << "size=" << download->size << std::endl;
        std::cout << "written=" << written << std::endl;
    }
    return EXIT_SUCCESS;
}

int doResolve(StorageClient& client) {
    auto diagnostics = client.diagnose();
    if (!diagnostics.ok()) {
        return reportError(diagnostics.status());
    }
    const auto& account = diagnostics->account;
    const auto& peer = diagnostics->peer;
    std::cout << "account_id=" << account.id << std::endl;
    std::cout << "username=" << account.username << std::endl;
    std::cout << "phone=" << account.phoneNumber << std::endl;
    std::cout << "peer=" << toString(peer.target) << std::endl;
    std::cout << "peer_source=" << toString(peer.source) << std::endl;
    if (peer.chat) {
        std::cout << "chat_id=" << peer.chat->id << std::endl;
        std::cout << "chat_title=" << peer.chat->title << std::endl;
    }
    return EXIT_SUCCESS;
}

}  // namespace

int app_main(int argc, char** argv) {
    CommandLine line{argc, argv};
    ConfigManager configMgr(line);

    po::options_description desc = ConfigManager::describe();
    desc.add(commandOptions());
    po::options_description hidden;
    hidden.add_options()("command", po::value<std::string>())(
        "path", po::value<std::string>());
    po::options_description all;
    all.add(desc).add(hidden);
    po::positional_options_description positional;
    positional.add("command", 1).add("path", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << std::endl << kUsage;
        return kExitUsage;
    }

    // Print help and return if help option is set
    if (configMgr.has(ConfigManager::Configs::HELP) ||
        vm.count("command") == 0) {
        std::cout << kUsage << std::endl << desc << std::endl;
        return vm.count("command") == 0 &&
                       !configMgr.has(ConfigManager::Configs::HELP)
                   ? kExitUsage
                   : EXIT_SUCCESS;
    }

    auto config = StorageConfig::load(configMgr);
    if (!config.ok()) {
        LOG(ERROR) << config.status();
        reportError(config.status());
        return kExitUsage;
    }
    if (config->logFile && !TgStore_AbslLogAddFileSink(*config->logFile)) {
        LOG(WARNING) << "Continuing without the log file";
    }

    auto client = StorageClient::create(*config);
    if (!client.ok()) {
        reportError(client.status());
        return kExitUsage;
    }

    const auto command = vm["command"].as<std::string>();
    int ret = kExitUsage;
    if (command == "upload") {
        ret = doUpload(**client, vm);
    } else if (command == "download") {
        ret = doDownload(**client, vm);
    } else if (command == "resolve") {
        ret = doResolve(**client);
    } else {
        std::cerr << "Unknown command: " << command << std::endl << kUsage;
    }
    (*client)->shutdown();
    return ret;
}
