#include "mediasync/engine/framed_transport.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "mediasync/framing.hpp"

namespace mediasync::engine
{

    TransportError::TransportError(mediasync::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    FramedDeviceChannel::FramedDeviceChannel(const Device &device, std::chrono::milliseconds connect_timeout,
                                             std::optional<std::chrono::milliseconds> request_timeout)
        : device_id_(device.id),
          host_(device.host),
          port_(device.port),
          request_timeout_(request_timeout),
          socket_(io_context_)
    {
        connect(connect_timeout);
        if (device.api_key && !device.api_key->empty())
        {
            authenticate(*device.api_key);
        }
    }

    FramedDeviceChannel::~FramedDeviceChannel()
    {
        std::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    void FramedDeviceChannel::connect(std::chrono::milliseconds timeout)
    {
        asio::ip::tcp::resolver resolver(io_context_);
        std::error_code result = asio::error::would_block;
        resolver.async_resolve(host_, std::to_string(port_),
                               [&](const std::error_code &resolve_ec, asio::ip::tcp::resolver::results_type results)
                               {
                                   if (resolve_ec)
                                   {
                                       result = resolve_ec;
                                       return;
                                   }
                                   asio::async_connect(socket_, results,
                                                       [&](const std::error_code &connect_ec, const asio::ip::tcp::endpoint &)
                                                       { result = connect_ec; });
                               });

        io_context_.restart();
        io_context_.run_for(timeout);
        if (result == asio::error::would_block)
        {
            resolver.cancel();
            std::error_code ignored;
            socket_.close(ignored);
            io_context_.restart();
            io_context_.run();
            throw TransportError(ErrorCode::Timeout, "connect to " + host_ + ':' + std::to_string(port_) + " timed out");
        }
        if (result)
        {
            throw TransportError(ErrorCode::Unreachable,
                                 "cannot reach " + host_ + ':' + std::to_string(port_) + ": " + result.message());
        }
        spdlog::debug("connected to device {} at {}:{}", device_id_, host_, port_);
    }

    void FramedDeviceChannel::authenticate(const std::string &api_key)
    {
        protocol::AuthenticateRequest request{};
        request.device_id = device_id_;
        request.api_key = api_key;
        rpc(protocol::Command::Authenticate, request);
    }

    std::string FramedDeviceChannel::next_request_id()
    {
        return device_id_ + '-' + std::to_string(++request_counter_);
    }

    void FramedDeviceChannel::run_pending(const char *what)
    {
        io_context_.restart();
        if (!request_timeout_)
        {
            io_context_.run();
            return;
        }
        io_context_.run_for(*request_timeout_);
        if (!io_context_.stopped())
        {
            std::error_code ignored;
            socket_.close(ignored);
            io_context_.restart();
            io_context_.run();
            throw TransportError(ErrorCode::Timeout, std::string(what) + " to device " + device_id_ + " timed out");
        }
    }

    nlohmann::json FramedDeviceChannel::rpc(protocol::Command command, const nlohmann::json &payload)
    {
        if (!socket_.is_open())
        {
            throw TransportError(ErrorCode::Unreachable, "connection to device " + device_id_ + " is closed");
        }

        protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        const auto frame = protocol::encode_frame(nlohmann::json(envelope));
        std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
        std::vector<char> body;
        std::error_code result;
        bool oversized = false;

        asio::async_write(socket_, asio::buffer(frame),
                          [&](const std::error_code &write_ec, std::size_t)
                          {
                              if (write_ec)
                              {
                                  result = write_ec;
                                  return;
                              }
                              asio::async_read(socket_, asio::buffer(header),
                                               [&](const std::error_code &header_ec, std::size_t)
                                               {
                                                   if (header_ec)
                                                   {
                                                       result = header_ec;
                                                       return;
                                                   }
                                                   std::uint32_t size = 0;
                                                   try
                                                   {
                                                       size = protocol::decode_frame_header(header);
                                                   }
                                                   catch (const protocol::FrameError &)
                                                   {
                                                       oversized = true;
                                                       return;
                                                   }
                                                   body.resize(size);
                                                   asio::async_read(socket_, asio::buffer(body),
                                                                    [&](const std::error_code &body_ec, std::size_t)
                                                                    { result = body_ec; });
                                               });
                          });

        run_pending(protocol::to_string(command).data());

        if (oversized)
        {
            throw TransportError(ErrorCode::IoError, "device " + device_id_ + " sent an oversized frame");
        }
        if (result)
        {
            throw TransportError(ErrorCode::IoError, "device " + device_id_ + " i/o failure: " + result.message());
        }

        protocol::ResponseEnvelope response;
        try
        {
            response = nlohmann::json::parse(body.begin(), body.end()).get<protocol::ResponseEnvelope>();
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("device {} sent an undecodable response: {}", device_id_, ex.what());
            throw TransportError(ErrorCode::InvalidPayload, "failed to decode response from device " + device_id_);
        }

        if (response.kind == protocol::ResponseKind::Error)
        {
            spdlog::debug("device {} rejected {}: {} ({})", device_id_, protocol::to_string(command),
                          response.message, mediasync::to_string(response.error));
            auto message = response.message.empty() ? std::string(mediasync::to_string(response.error)) : response.message;
            throw TransportError(response.error, std::move(message));
        }
        return response.payload;
    }

    protocol::StatusResponse FramedDeviceChannel::status()
    {
        return rpc(protocol::Command::Status).get<protocol::StatusResponse>();
    }

    std::vector<MediaItem> FramedDeviceChannel::list_media()
    {
        const auto payload = rpc(protocol::Command::ListMedia);
        try
        {
            return payload.get<protocol::MediaListResponse>().media_items;
        }
        catch (const std::exception &ex)
        {
            throw TransportError(ErrorCode::InvalidPayload,
                                 "device " + device_id_ + " returned a malformed catalog: " + ex.what());
        }
    }

    protocol::TransferDescriptor FramedDeviceChannel::open_download(const std::string &item_id)
    {
        protocol::DownloadInitRequest request{};
        request.item_id = item_id;
        return rpc(protocol::Command::DownloadInit, request).get<protocol::TransferDescriptor>();
    }

    protocol::DownloadChunkResponse FramedDeviceChannel::read_chunk(const protocol::DownloadChunkRequest &request)
    {
        return rpc(protocol::Command::DownloadChunk, request).get<protocol::DownloadChunkResponse>();
    }

    protocol::TransferDescriptor FramedDeviceChannel::open_upload(const protocol::UploadInitRequest &request)
    {
        return rpc(protocol::Command::UploadInit, request).get<protocol::TransferDescriptor>();
    }

    void FramedDeviceChannel::write_chunk(const protocol::UploadChunkRequest &request)
    {
        rpc(protocol::Command::UploadChunk, request);
    }

    MediaItem FramedDeviceChannel::commit_upload(const protocol::UploadCommitRequest &request)
    {
        return rpc(protocol::Command::UploadCommit, request).get<MediaItem>();
    }

    FramedDeviceTransport::FramedDeviceTransport(std::chrono::milliseconds connect_timeout)
        : connect_timeout_(connect_timeout) {}

    bool FramedDeviceTransport::probe(const Device &device, std::chrono::milliseconds timeout)
    {
        try
        {
            FramedDeviceChannel channel(device, timeout, timeout);
            const auto status = channel.status();
            if (!status.device_id.empty() && status.device_id != device.id)
            {
                spdlog::warn("device {} answered as '{}'", device.id, status.device_id);
            }
            return true;
        }
        catch (const TransportError &ex)
        {
            spdlog::info("probe of device {} failed: {}", device.id, ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("probe of device {} failed unexpectedly: {}", device.id, ex.what());
        }
        return false;
    }

    std::unique_ptr<DeviceChannel> FramedDeviceTransport::connect(const Device &device)
    {
        return std::make_unique<FramedDeviceChannel>(device, connect_timeout_);
    }

} // namespace mediasync::engine
