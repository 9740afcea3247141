#include "mediasync/agent/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mediasync::agent
{

    void Session::handle_list_media(const protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            protocol::MediaListResponse response{.media_items = services_.media_store.rescan()};
            spdlog::info("Listing {} item(s) for {}", response.media_items.size(), remote_endpoint());
            send_response(protocol::make_ok_response(response, envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::IoError, ex.what(), envelope.request_id);
        }
    }

} // namespace mediasync::agent
