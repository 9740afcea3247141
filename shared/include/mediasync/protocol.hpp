/**
 * MediaSync - Device protocol schema and serialization helpers.
 *
 * Every remote device speaks this request/response protocol: a liveness probe
 * (STATUS), a catalog listing (LIST_MEDIA) and chunked byte transfer in both
 * directions (DOWNLOAD_* and UPLOAD_*).
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediasync/device.hpp"
#include "mediasync/error_codes.hpp"
#include "mediasync/media.hpp"

namespace mediasync::protocol
{

    enum class Command : std::uint8_t
    {
        Authenticate,
        Status,
        ListMedia,
        DownloadInit,
        DownloadChunk,
        UploadInit,
        UploadChunk,
        UploadCommit,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id);
    ResponseEnvelope make_error_response(ErrorCode code, std::string message,
                                         const std::optional<std::string> &request_id);

    struct AuthenticateRequest
    {
        std::string device_id;
        std::string api_key;
    };

    void to_json(nlohmann::json &json, const AuthenticateRequest &request);
    void from_json(const nlohmann::json &json, AuthenticateRequest &request);

    struct StatusResponse
    {
        std::string device_id;
        std::string name;
        DeviceType type{DeviceType::Nas};
        std::string media_root;
        std::uint64_t item_count{};
        bool authentication_required{};
        std::string version;
    };

    void to_json(nlohmann::json &json, const StatusResponse &response);
    void from_json(const nlohmann::json &json, StatusResponse &response);

    struct MediaListResponse
    {
        std::vector<MediaItem> media_items;
    };

    void to_json(nlohmann::json &json, const MediaListResponse &response);
    void from_json(const nlohmann::json &json, MediaListResponse &response);

    struct TransferDescriptor
    {
        std::string transfer_id;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::optional<std::string> root_hash{};
    };

    void to_json(nlohmann::json &json, const TransferDescriptor &descriptor);
    void from_json(const nlohmann::json &json, TransferDescriptor &descriptor);

    struct DownloadInitRequest
    {
        std::string item_id;
    };

    void to_json(nlohmann::json &json, const DownloadInitRequest &request);
    void from_json(const nlohmann::json &json, DownloadInitRequest &request);

    struct DownloadChunkRequest
    {
        std::string transfer_id;
        std::uint64_t offset{};
        std::uint64_t max_bytes{};
    };

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request);
    void from_json(const nlohmann::json &json, DownloadChunkRequest &request);

    struct DownloadChunkResponse
    {
        std::string transfer_id;
        std::uint64_t offset{};
        std::uint64_t bytes{};
        bool done{};
        std::string data_base64;
        std::string chunk_hash;
    };

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response);
    void from_json(const nlohmann::json &json, DownloadChunkResponse &response);

    struct UploadInitRequest
    {
        MediaItem metadata;
        std::string relative_path;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::string root_hash;
        // When false an occupied destination is rejected with already_exists
        // instead of receiving a " (n)" suffix.
        bool rename_on_conflict{true};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadChunkRequest
    {
        std::string transfer_id;
        std::uint64_t offset{};
        std::string data_base64;
        std::string chunk_hash;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadCommitRequest
    {
        std::string transfer_id;
        std::string final_hash;
    };

    void to_json(nlohmann::json &json, const UploadCommitRequest &request);
    void from_json(const nlohmann::json &json, UploadCommitRequest &request);

} // namespace mediasync::protocol
