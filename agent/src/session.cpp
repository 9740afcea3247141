#include "mediasync/agent/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mediasync/framing.hpp"

namespace mediasync::agent
{

    Session::Session(asio::ip::tcp::socket socket, AgentServices services)
        : socket_(std::move(socket)), services_(services) {}

    void Session::start()
    {
        spdlog::info("Engine connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        std::error_code ec;
        spdlog::debug("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = protocol::decode_frame_header(header_buffer_);
                             }
                             catch (const protocol::FrameError &ex)
                             {
                                 spdlog::warn("Dropping {}: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const auto json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(ErrorCode::InvalidPayload, ex.what());
                             }
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case protocol::Command::Authenticate:
            handle_authenticate(envelope);
            break;
        case protocol::Command::Status:
            handle_status(envelope);
            break;
        case protocol::Command::Ping:
            send_response(protocol::make_ok_response({{"pong", true}}, envelope.request_id));
            break;
        case protocol::Command::ListMedia:
            handle_list_media(envelope);
            break;
        case protocol::Command::DownloadInit:
            handle_download_init(envelope);
            break;
        case protocol::Command::DownloadChunk:
            handle_download_chunk(envelope);
            break;
        case protocol::Command::UploadInit:
            handle_upload_init(envelope);
            break;
        case protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case protocol::Command::UploadCommit:
            handle_upload_commit(envelope);
            break;
        default:
            send_error(ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    bool Session::require_authentication(const protocol::RequestEnvelope &envelope)
    {
        if (!services_.api_key_hash || authenticated_)
        {
            return true;
        }
        send_error(ErrorCode::AuthenticationRequired, "Authentication required", envelope.request_id);
        return false;
    }

    void Session::send_response(const protocol::ResponseEnvelope &envelope)
    {
        try
        {
            const auto json = nlohmann::json(envelope);
            auto frame = std::make_shared<std::vector<std::uint8_t>>(protocol::encode_frame(json));
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(*frame),
                              [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                              {
                                  if (ec)
                                  {
                                      stop();
                                  }
                              });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
        }
    }

    void Session::send_error(ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        spdlog::debug("{} <- error {} ({})", remote_endpoint(), mediasync::to_string(code), message);
        send_response(protocol::make_error_response(code, std::move(message), request_id));
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ':' + std::to_string(endpoint.port());
    }

} // namespace mediasync::agent
