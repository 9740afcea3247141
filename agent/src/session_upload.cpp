#include "mediasync/agent/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mediasync/encoding/base64.hpp"

namespace mediasync::agent
{

    namespace
    {
        ErrorCode commit_error_code(const std::string &message)
        {
            if (message == "File hash mismatch")
            {
                return ErrorCode::IntegrityError;
            }
            if (message == "Destination was taken during upload")
            {
                return ErrorCode::AlreadyExists;
            }
            if (message == "Unknown transfer")
            {
                return ErrorCode::NotFound;
            }
            return ErrorCode::InvalidPayload;
        }
    } // namespace

    void Session::handle_upload_init(const protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            services_.transfer_registry.cleanup_expired(services_.config.upload_timeout);
            const auto request = envelope.payload.get<protocol::UploadInitRequest>();
            if (request.root_hash.empty())
            {
                send_error(ErrorCode::InvalidPayload, "Missing content hash", envelope.request_id);
                return;
            }
            const auto relative = request.relative_path.empty() ? placement_path(request.metadata).generic_string()
                                                                : request.relative_path;
            const auto target = services_.media_store.reserve_path(relative, request.rename_on_conflict);
            const auto state = services_.transfer_registry.create(target, request.file_size, request.chunk_size,
                                                                  request.root_hash, request.metadata);

            protocol::TransferDescriptor descriptor{
                .transfer_id = state.transfer_id,
                .total_size = state.file_size,
                .chunk_size = state.chunk_size,
                .root_hash = state.root_hash,
            };
            spdlog::info("Receiving {} ({} bytes) into {}", request.metadata.title, request.file_size,
                         target.string());
            send_response(protocol::make_ok_response(descriptor, envelope.request_id));
        }
        catch (const StoreError &store)
        {
            send_error(store.code(), store.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::invalid_argument &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::IoError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_upload_chunk(const protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<protocol::UploadChunkRequest>();
            const auto data = encoding::decode_base64(request.data_base64);
            if (!data)
            {
                send_error(ErrorCode::InvalidPayload, "Invalid chunk data", envelope.request_id);
                return;
            }
            std::string error_message;
            if (!services_.transfer_registry.append_chunk(request.transfer_id, request.offset, *data, request.chunk_hash,
                                                          error_message))
            {
                send_error(ErrorCode::InvalidPayload, error_message, envelope.request_id);
                return;
            }
            send_response(protocol::make_ok_response({{"bytes", data->size()}}, envelope.request_id));
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::IoError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_upload_commit(const protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<protocol::UploadCommitRequest>();
            std::string error_message;
            const auto state = services_.transfer_registry.commit(request.transfer_id, request.final_hash, error_message);
            if (!state)
            {
                send_error(commit_error_code(error_message), error_message, envelope.request_id);
                return;
            }
            const auto stored = services_.media_store.adopt(state->final_path, state->metadata);
            spdlog::info("Stored {} as {}", stored.title, stored.relative_path);
            send_response(protocol::make_ok_response(stored, envelope.request_id));
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::IoError, ex.what(), envelope.request_id);
        }
    }

} // namespace mediasync::agent
