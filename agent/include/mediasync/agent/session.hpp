#pragma once

#include <asio/ip/tcp.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mediasync/agent/config.hpp"
#include "mediasync/agent/media_store.hpp"
#include "mediasync/agent/transfer_registry.hpp"
#include "mediasync/error_codes.hpp"
#include "mediasync/protocol.hpp"

namespace mediasync::agent
{

    struct AgentServices
    {
        MediaStore &media_store;
        TransferRegistry &transfer_registry;
        const AgentConfig &config;
        const std::optional<std::string> &api_key_hash;
    };

    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, AgentServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const protocol::ResponseEnvelope &envelope);
        void send_error(ErrorCode code, std::string message, std::optional<std::string> request_id = std::nullopt);
        bool require_authentication(const protocol::RequestEnvelope &envelope);

        // Command handlers
        void handle_authenticate(const protocol::RequestEnvelope &envelope);
        void handle_status(const protocol::RequestEnvelope &envelope);
        void handle_list_media(const protocol::RequestEnvelope &envelope);
        void handle_download_init(const protocol::RequestEnvelope &envelope);
        void handle_download_chunk(const protocol::RequestEnvelope &envelope);
        void handle_upload_init(const protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const protocol::RequestEnvelope &envelope);
        void handle_upload_commit(const protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        AgentServices services_;

        std::array<std::uint8_t, 4> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool authenticated_{false};
        std::string peer_device_id_;

        struct DownloadTransfer
        {
            std::filesystem::path path;
            std::uint64_t total_size{};
            std::uint64_t chunk_size{};
        };
        std::unordered_map<std::string, DownloadTransfer> downloads_;
        std::uint64_t download_counter_{0};
    };

} // namespace mediasync::agent
