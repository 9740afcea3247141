#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mediasync::engine
{

    // What to do when the placement path on a target is already taken by a
    // file with different content.
    enum class CollisionPolicy : std::uint8_t
    {
        Rename,
        Fail
    };

    std::string_view to_string(CollisionPolicy policy) noexcept;
    std::optional<CollisionPolicy> collision_policy_from_string(std::string_view value) noexcept;

    struct EngineConfig
    {
        std::filesystem::path data_dir{"data"};
        std::chrono::milliseconds probe_timeout{std::chrono::seconds{10}};
        std::size_t chunk_size{1024 * 1024};
        std::chrono::seconds auto_sync_interval{std::chrono::seconds{3600}};
        std::chrono::seconds auto_sync_retry_delay{std::chrono::seconds{60}};
        CollisionPolicy collision_policy{CollisionPolicy::Rename};

        std::filesystem::path registry_file() const { return data_dir / "devices.json"; }
    };

    struct ShellConfig
    {
        EngineConfig engine;
        std::optional<std::filesystem::path> log_file;
        bool auto_sync{false};
        bool verbose{false};
    };

    // Throws std::runtime_error on unknown or malformed arguments.
    ShellConfig parse_arguments(int argc, char *argv[]);

    // Plain decimal digits only; signs, blanks and overflow yield nullopt.
    std::optional<std::uint64_t> parse_unsigned(std::string_view value) noexcept;

    // "-" means no port and maps to 0. Values above 65535 yield nullopt.
    std::optional<std::uint16_t> parse_port(std::string_view value) noexcept;

} // namespace mediasync::engine
