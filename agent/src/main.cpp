#include <asio/ip/host_name.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "mediasync/agent/server.hpp"
#include "mediasync/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "MediaSync agent " << mediasync::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <MEDIA_ROOT> [--address <ADDRESS>] [--device-id <ID>] [--name <NAME>]\n"
                     "       [--type nas|pc|mobile] [--threads <N>] [--upload-timeout <seconds>] [--api-key <KEY>]\n"
                     "       [--log <FILE>]\n"
                     "The API key may also be given through MEDIASYNC_API_KEY.\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::string default_device_id()
    {
        std::error_code ec;
        auto host = asio::ip::host_name(ec);
        return ec || host.empty() ? std::string("agent") : host;
    }

} // namespace

int main(int argc, char *argv[])
{
    using mediasync::agent::AgentConfig;
    using mediasync::agent::Server;

    AgentConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        const bool takes_value = arg == "--port" || arg == "--root" || arg == "--address" || arg == "--threads" ||
                                 arg == "--upload-timeout" || arg == "--log" || arg == "--device-id" ||
                                 arg == "--name" || arg == "--type" || arg == "--api-key";
        if (!takes_value)
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        try
        {
            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--upload-timeout")
            {
                config.upload_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--device-id")
            {
                config.device_id = *value;
            }
            else if (arg == "--name")
            {
                config.name = *value;
            }
            else if (arg == "--type")
            {
                const auto type = mediasync::device_type_from_string(*value);
                if (!type)
                {
                    std::cerr << "Unknown device type: " << *value << std::endl;
                    return EXIT_FAILURE;
                }
                config.device_type = *type;
            }
            else
            {
                config.api_key = *value;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Invalid value for " << arg << ": " << *value << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (!config.api_key)
    {
        if (const char *env = std::getenv("MEDIASYNC_API_KEY"); env && *env)
        {
            config.api_key = std::string(env);
        }
    }
    if (config.device_id.empty())
    {
        config.device_id = default_device_id();
    }
    if (config.name.empty())
    {
        config.name = config.device_id;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("agent", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting MediaSync agent {} as {}", mediasync::version(), config.device_id);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Agent failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
