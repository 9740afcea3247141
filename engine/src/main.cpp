#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <vector>

#include "mediasync/engine/config.hpp"
#include "mediasync/engine/framed_transport.hpp"
#include "mediasync/engine/shell.hpp"
#include "mediasync/engine/sync_engine.hpp"
#include "mediasync/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "MediaSync engine " << mediasync::version() << "\n"
                  << "Usage: " << program_name
                  << " [--data-dir <DIR>] [--log <FILE>] [--probe-timeout <seconds>] [--chunk-size <bytes>]"
                     " [--auto-sync <seconds>] [--on-collision rename|fail] [--verbose]\n";
    }

    void configure_logging(const mediasync::engine::ShellConfig &config)
    {
        // The console belongs to the shell, so log lines go to stderr.
        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(config.verbose ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console);
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("mediasync", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace mediasync::engine;

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
    }

    ShellConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        configure_logging(config);
        spdlog::info("Starting MediaSync engine {} with data dir {}", mediasync::version(),
                     config.engine.data_dir.string());

        FramedDeviceTransport transport(config.engine.probe_timeout);
        SyncEngine engine(config.engine, transport);
        if (config.auto_sync)
        {
            engine.start_auto_sync();
        }

        Shell shell(engine, std::cin, std::cout);
        return shell.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
