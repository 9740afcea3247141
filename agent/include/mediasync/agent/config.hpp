#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "mediasync/device.hpp"

namespace mediasync::agent
{

    struct AgentConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::string device_id;
        std::string name;
        DeviceType device_type{DeviceType::Nas};
        std::size_t worker_threads{0};
        std::chrono::seconds upload_timeout{std::chrono::seconds{3600}};
        std::optional<std::string> api_key;
        std::optional<std::filesystem::path> log_file;
    };

} // namespace mediasync::agent
