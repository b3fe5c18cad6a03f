#include <absl/log/log.h>
#include <fmt/format.h>

#include <algorithm>
#include <tgstore/Errors.hpp>
#include <tgstore/TransferController.hpp>
#include <utility>
#include <vector>

namespace tgstore {

std::chrono::milliseconds TransferBudget::remaining() const {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds::zero());
}

TransferController::TransferController(size_t chunkSize)
    : _chunkSize(chunkSize == 0 ? kChunkSize : chunkSize) {}

absl::StatusOr<SpoolResult> TransferController::spool(
    ByteSource& source, Deadline deadline,
    std::optional<std::uint64_t> sizeLimit,
    const std::string_view spoolName) const {
    TransferBudget budget{.deadline = deadline, .limit = sizeLimit};

    if (budget.limit && source.sizeHint() &&
        *source.sizeHint() > *budget.limit) {
        LOG(WARNING) << fmt::format(
            "Rejecting upload of {} bytes, limit is {} bytes",
            *source.sizeHint(), *budget.limit);
        return SizeLimitExceededError(
            fmt::format("File exceeds the upload limit of {} bytes (got {})",
                        *budget.limit, *source.sizeHint()));
    }

    auto spool = SpoolFile::create(spoolName);
    if (!spool.ok()) {
        return spool.status();
    }

    std::vector<char> buffer(_chunkSize);
    while (true) {
        if (budget.expired()) {
            LOG(WARNING) << "Transfer deadline reached after "
                         << budget.bytesTransferred << " bytes";
            return TimeoutError(fmt::format(
                "Upload timed out after receiving {} bytes",
                budget.bytesTransferred));
        }
        auto n = source.read(buffer, budget.remaining());
        if (!n.ok()) {
            if (errorKindOf(n.status()) == ErrorKind::kTimeout) {
                LOG(WARNING) << "Source stalled after "
                             << budget.bytesTransferred << " bytes";
                return TimeoutError(fmt::format(
                    "Upload timed out after receiving {} bytes: {}",
                    budget.bytesTransferred, n.status().message()));
            }
            return withContext(
                n.status(), fmt::format("Reading source after {} bytes",
                                        budget.bytesTransferred));
        }
        if (*n == 0) {
            break;
        }
        if (budget.wouldExceed(*n)) {
            LOG(WARNING) << fmt::format(
                "Upload exceeded limit of {} bytes, aborting",
                *budget.limit);
            return SizeLimitExceededError(fmt::format(
                "File exceeds the upload limit of {} bytes (got at least {})",
                *budget.limit, budget.bytesTransferred + *n));
        }
        if (auto status = spool->write({buffer.data(), *n}); !status.ok()) {
            return status;
        }
        budget.bytesTransferred += *n;
    }

    if (auto status = spool->finalize(); !status.ok()) {
        return status;
    }
    DLOG(INFO) << "Spooled " << budget.bytesTransferred << " bytes to "
               << spool->path();
    return SpoolResult{.file = std::move(*spool),
                       .totalBytes = budget.bytesTransferred};
}

}  // namespace tgstore
