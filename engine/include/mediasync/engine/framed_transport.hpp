#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "mediasync/engine/device_transport.hpp"
#include "mediasync/protocol.hpp"

namespace mediasync::engine
{

    // One TCP connection to a device agent speaking length-prefixed JSON.
    class FramedDeviceChannel : public DeviceChannel
    {
    public:
        FramedDeviceChannel(const Device &device, std::chrono::milliseconds connect_timeout,
                            std::optional<std::chrono::milliseconds> request_timeout = std::nullopt);
        ~FramedDeviceChannel() override;

        protocol::StatusResponse status() override;
        std::vector<MediaItem> list_media() override;
        protocol::TransferDescriptor open_download(const std::string &item_id) override;
        protocol::DownloadChunkResponse read_chunk(const protocol::DownloadChunkRequest &request) override;
        protocol::TransferDescriptor open_upload(const protocol::UploadInitRequest &request) override;
        void write_chunk(const protocol::UploadChunkRequest &request) override;
        MediaItem commit_upload(const protocol::UploadCommitRequest &request) override;

    private:
        void connect(std::chrono::milliseconds timeout);
        void authenticate(const std::string &api_key);

        // Sends one request and waits for its response; ERROR responses are
        // raised as TransportError carrying the remote error code.
        nlohmann::json rpc(protocol::Command command, const nlohmann::json &payload = nlohmann::json::object());
        void run_pending(const char *what);
        std::string next_request_id();

        std::string device_id_;
        std::string host_;
        std::uint16_t port_;
        std::optional<std::chrono::milliseconds> request_timeout_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::uint64_t request_counter_{0};
    };

    class FramedDeviceTransport : public DeviceTransport
    {
    public:
        explicit FramedDeviceTransport(std::chrono::milliseconds connect_timeout);

        bool probe(const Device &device, std::chrono::milliseconds timeout) override;
        std::unique_ptr<DeviceChannel> connect(const Device &device) override;

    private:
        std::chrono::milliseconds connect_timeout_;
    };

} // namespace mediasync::engine
