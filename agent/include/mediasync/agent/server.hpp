#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "mediasync/agent/config.hpp"
#include "mediasync/agent/media_store.hpp"
#include "mediasync/agent/transfer_registry.hpp"

namespace mediasync::agent
{

    class Session;

    class Server
    {
    public:
        explicit Server(AgentConfig config);

        // Blocks until a signal arrives or stop() is called.
        void run();

        // Safe to call from any thread.
        void stop();

        // Bound port; differs from the configured one when that was 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void shutdown();

        AgentConfig config_;
        std::optional<std::string> api_key_hash_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        MediaStore media_store_;
        TransferRegistry transfer_registry_;

        std::vector<std::thread> workers_;
    };

} // namespace mediasync::agent
