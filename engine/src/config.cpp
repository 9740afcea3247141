#include "mediasync/engine/config.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>

namespace mediasync::engine
{

    namespace
    {

        const char *require_value(int argc, char *argv[], int &index, const std::string &option)
        {
            if (index >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            return argv[index++];
        }

        std::uint64_t parse_positive(const std::string &option, const std::string &value)
        {
            const auto parsed = parse_unsigned(value);
            if (!parsed || *parsed == 0)
            {
                throw std::runtime_error(option + " expects a positive number, got '" + value + "'");
            }
            return *parsed;
        }

    } // namespace

    std::optional<std::uint64_t> parse_unsigned(std::string_view value) noexcept
    {
        if (value.empty())
        {
            return std::nullopt;
        }
        std::uint64_t parsed = 0;
        const auto *end = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
        if (ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        return parsed;
    }

    std::optional<std::uint16_t> parse_port(std::string_view value) noexcept
    {
        if (value == "-")
        {
            return std::uint16_t{0};
        }
        const auto parsed = parse_unsigned(value);
        if (!parsed || *parsed > std::numeric_limits<std::uint16_t>::max())
        {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(*parsed);
    }

    std::string_view to_string(CollisionPolicy policy) noexcept
    {
        switch (policy)
        {
        case CollisionPolicy::Rename:
            return "rename";
        case CollisionPolicy::Fail:
            return "fail";
        }
        return "rename";
    }

    std::optional<CollisionPolicy> collision_policy_from_string(std::string_view value) noexcept
    {
        if (value == "rename")
        {
            return CollisionPolicy::Rename;
        }
        if (value == "fail")
        {
            return CollisionPolicy::Fail;
        }
        return std::nullopt;
    }

    ShellConfig parse_arguments(int argc, char *argv[])
    {
        ShellConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--data-dir")
            {
                config.engine.data_dir = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--probe-timeout")
            {
                config.engine.probe_timeout =
                    std::chrono::seconds{parse_positive(arg, require_value(argc, argv, index, arg))};
            }
            else if (arg == "--chunk-size")
            {
                config.engine.chunk_size =
                    static_cast<std::size_t>(parse_positive(arg, require_value(argc, argv, index, arg)));
            }
            else if (arg == "--auto-sync")
            {
                config.engine.auto_sync_interval =
                    std::chrono::seconds{parse_positive(arg, require_value(argc, argv, index, arg))};
                config.auto_sync = true;
            }
            else if (arg == "--on-collision")
            {
                const std::string value = require_value(argc, argv, index, arg);
                const auto policy = collision_policy_from_string(value);
                if (!policy)
                {
                    throw std::runtime_error("--on-collision expects 'rename' or 'fail'");
                }
                config.engine.collision_policy = *policy;
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }
        return config;
    }

} // namespace mediasync::engine
