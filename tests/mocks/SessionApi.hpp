#pragma once

#include <gmock/gmock.h>

#include <tgstore/SessionApi.hpp>

class MockSessionApi : public tgstore::SessionApi {
   public:
    MockSessionApi() = default;

    MOCK_METHOD(absl::Status, connect_impl, (), (override));
    MOCK_METHOD(void, disconnect_impl, (), (override));
    MOCK_METHOD(absl::StatusOr<tgstore::AccountInfo>, getMe_impl, (),
                (override));
    MOCK_METHOD(absl::StatusOr<tgstore::ChatInfo>, getChat_impl,
                (const tgstore::ChatIdentifier& chat), (override));
    MOCK_METHOD(absl::Status, joinChat_impl, (std::string_view target),
                (override));
    MOCK_METHOD(absl::StatusOr<tgstore::SentDocument>, sendDocument_impl,
                (const tgstore::ChatIdentifier& chat,
                 const std::filesystem::path& file, std::string_view filename,
                 std::string_view contentType, tgstore::Deadline deadline),
                (override));
    MOCK_METHOD(absl::StatusOr<tgstore::SpoolFile>,
                downloadMessageDocument_impl,
                (tgstore::ChatId chat, tgstore::MessageId message),
                (override));
    MOCK_METHOD(absl::StatusOr<tgstore::SpoolFile>, downloadRemoteFile_impl,
                (std::string_view remoteFileId), (override));
};
