#include "mediasync/agent/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mediasync/crypto.hpp"
#include "mediasync/version.hpp"

namespace mediasync::agent
{

    void Session::handle_authenticate(const protocol::RequestEnvelope &envelope)
    {
        if (authenticated_)
        {
            send_error(ErrorCode::Conflict, "Already authenticated", envelope.request_id);
            return;
        }

        protocol::AuthenticateRequest request;
        try
        {
            request = envelope.payload.get<protocol::AuthenticateRequest>();
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
            return;
        }

        if (services_.api_key_hash && !crypto::verify_password(request.api_key, *services_.api_key_hash))
        {
            spdlog::warn("Rejected credentials from {} ({})", remote_endpoint(),
                         request.device_id.empty() ? "anonymous" : request.device_id);
            send_error(ErrorCode::AuthenticationFailed, "Invalid API key", envelope.request_id);
            return;
        }

        authenticated_ = true;
        peer_device_id_ = request.device_id;
        send_response(protocol::make_ok_response({{"device_id", services_.config.device_id}}, envelope.request_id));
        spdlog::info("Session {} authenticated as {}", remote_endpoint(),
                     peer_device_id_.empty() ? "anonymous" : peer_device_id_);
    }

    void Session::handle_status(const protocol::RequestEnvelope &envelope)
    {
        try
        {
            protocol::StatusResponse status{
                .device_id = services_.config.device_id,
                .name = services_.config.name,
                .type = services_.config.device_type,
                .media_root = services_.media_store.root().string(),
                .item_count = services_.media_store.item_count(),
                .authentication_required = services_.api_key_hash.has_value(),
                .version = std::string(mediasync::version()),
            };
            send_response(protocol::make_ok_response(status, envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

} // namespace mediasync::agent
