#include "mediasync/protocol.hpp"

#include <array>
#include <stdexcept>

namespace mediasync::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 9> kCommandMappings{{
            {Command::Authenticate, "AUTHENTICATE"},
            {Command::Status, "STATUS"},
            {Command::ListMedia, "LIST_MEDIA"},
            {Command::DownloadInit, "DOWNLOAD_INIT"},
            {Command::DownloadChunk, "DOWNLOAD_CHUNK"},
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadCommit, "UPLOAD_COMMIT"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end() && !it->is_null())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        const auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        const auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        envelope.error = error_code_from_int(json.value("error", std::uint16_t{0}));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Ok;
        envelope.error = ErrorCode::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        return envelope;
    }

    ResponseEnvelope make_error_response(ErrorCode code, std::string message,
                                         const std::optional<std::string> &request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = request_id;
        return envelope;
    }

    void to_json(nlohmann::json &json, const AuthenticateRequest &request)
    {
        json = {
            {"device_id", request.device_id},
            {"api_key", request.api_key},
        };
    }

    void from_json(const nlohmann::json &json, AuthenticateRequest &request)
    {
        request.device_id = json.value("device_id", std::string{});
        request.api_key = json.value("api_key", std::string{});
    }

    void to_json(nlohmann::json &json, const StatusResponse &response)
    {
        json = {
            {"device_id", response.device_id},
            {"name", response.name},
            {"type", to_string(response.type)},
            {"media_root", response.media_root},
            {"item_count", response.item_count},
            {"authentication_required", response.authentication_required},
            {"version", response.version},
        };
    }

    void from_json(const nlohmann::json &json, StatusResponse &response)
    {
        response.device_id = json.at("device_id").get<std::string>();
        response.name = json.value("name", std::string{});
        response.type = device_type_from_string(json.value("type", std::string{"nas"})).value_or(DeviceType::Nas);
        response.media_root = json.value("media_root", std::string{});
        response.item_count = json.value("item_count", 0ULL);
        response.authentication_required = json.value("authentication_required", false);
        response.version = json.value("version", std::string{});
    }

    void to_json(nlohmann::json &json, const MediaListResponse &response)
    {
        json = {{"media_items", response.media_items}};
    }

    void from_json(const nlohmann::json &json, MediaListResponse &response)
    {
        response.media_items = json.value("media_items", std::vector<MediaItem>{});
    }

    void to_json(nlohmann::json &json, const TransferDescriptor &descriptor)
    {
        json = {
            {"transfer_id", descriptor.transfer_id},
            {"total_size", descriptor.total_size},
            {"chunk_size", descriptor.chunk_size},
        };
        if (descriptor.root_hash)
        {
            json["root_hash"] = *descriptor.root_hash;
        }
    }

    void from_json(const nlohmann::json &json, TransferDescriptor &descriptor)
    {
        descriptor.transfer_id = json.at("transfer_id").get<std::string>();
        descriptor.total_size = json.value("total_size", 0ULL);
        descriptor.chunk_size = json.value("chunk_size", 0ULL);
        if (auto it = json.find("root_hash"); it != json.end() && !it->is_null())
        {
            descriptor.root_hash = it->get<std::string>();
        }
        else
        {
            descriptor.root_hash.reset();
        }
    }

    void to_json(nlohmann::json &json, const DownloadInitRequest &request)
    {
        json = {{"item_id", request.item_id}};
    }

    void from_json(const nlohmann::json &json, DownloadInitRequest &request)
    {
        request.item_id = json.at("item_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request)
    {
        json = {
            {"transfer_id", request.transfer_id},
            {"offset", request.offset},
            {"max_bytes", request.max_bytes},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
        request.offset = json.value("offset", 0ULL);
        request.max_bytes = json.value("max_bytes", 0ULL);
    }

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response)
    {
        json = {
            {"transfer_id", response.transfer_id},
            {"offset", response.offset},
            {"bytes", response.bytes},
            {"done", response.done},
            {"data", response.data_base64},
            {"chunk_hash", response.chunk_hash},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkResponse &response)
    {
        response.transfer_id = json.at("transfer_id").get<std::string>();
        response.offset = json.value("offset", 0ULL);
        response.bytes = json.value("bytes", 0ULL);
        response.done = json.value("done", false);
        response.data_base64 = json.value("data", std::string{});
        response.chunk_hash = json.value("chunk_hash", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"metadata", request.metadata},
            {"relative_path", request.relative_path},
            {"file_size", request.file_size},
            {"chunk_size", request.chunk_size},
            {"root_hash", request.root_hash},
            {"rename_on_conflict", request.rename_on_conflict},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.metadata = json.at("metadata").get<MediaItem>();
        request.relative_path = json.value("relative_path", std::string{});
        request.file_size = json.value("file_size", 0ULL);
        request.chunk_size = json.value("chunk_size", 0ULL);
        request.root_hash = json.at("root_hash").get<std::string>();
        request.rename_on_conflict = json.value("rename_on_conflict", true);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"transfer_id", request.transfer_id},
            {"offset", request.offset},
            {"data", request.data_base64},
            {"chunk_hash", request.chunk_hash},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
        request.offset = json.value("offset", 0ULL);
        request.data_base64 = json.value("data", std::string{});
        request.chunk_hash = json.value("chunk_hash", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadCommitRequest &request)
    {
        json = {
            {"transfer_id", request.transfer_id},
            {"final_hash", request.final_hash},
        };
    }

    void from_json(const nlohmann::json &json, UploadCommitRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
        request.final_hash = json.at("final_hash").get<std::string>();
    }

} // namespace mediasync::protocol
