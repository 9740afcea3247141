#include "mediasync/engine/shell.hpp"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "mediasync/engine/config.hpp"
#include "mediasync/engine/device_transport.hpp"

namespace mediasync::engine
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        constexpr std::uint64_t kMaxWaitSeconds = 24 * 60 * 60;

        // "-" stands for an absent host or storage path.
        std::string optional_token(const std::string &token)
        {
            return token == "-" ? std::string{} : token;
        }

    } // namespace

    Shell::Shell(SyncEngine &engine, std::istream &in, std::ostream &out)
        : engine_(engine),
          in_(in),
          out_(out) {}

    int Shell::run()
    {
        while (true)
        {
            out_ << "mediasync> " << std::flush;
            std::string line;
            if (!std::getline(in_, line))
            {
                out_ << std::endl;
                break;
            }
            if (!execute_line(line))
            {
                break;
            }
        }
        return 0;
    }

    bool Shell::execute_line(const std::string &raw)
    {
        const auto line = trim(raw);
        if (line.empty())
        {
            return true;
        }
        spdlog::debug("shell: {}", line);

        const auto tokens = split_tokens(line);
        const auto command = to_upper(tokens[0]);
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

        if (command == "EXIT" || command == "QUIT")
        {
            print_ok();
            return false;
        }
        if (command == "HELP")
        {
            print_help();
            return true;
        }

        try
        {
            if (!dispatch(command, args))
            {
                print_error("unsupported_command");
            }
        }
        catch (const TransportError &ex)
        {
            print_error(mediasync::to_string(ex.code()), ex.what());
        }
        catch (const std::invalid_argument &ex)
        {
            print_error("invalid_payload", ex.what());
        }
        catch (const std::exception &ex)
        {
            print_error("internal_error", ex.what());
            spdlog::error("command '{}' failed: {}", command, ex.what());
        }
        return true;
    }

    bool Shell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "ADD")
        {
            handle_add(args);
        }
        else if (command == "REMOVE")
        {
            handle_remove(args);
        }
        else if (command == "DEVICES")
        {
            handle_devices();
        }
        else if (command == "PROBE")
        {
            handle_probe(args);
        }
        else if (command == "SCAN")
        {
            handle_scan(args);
        }
        else if (command == "SYNC")
        {
            handle_sync(args);
        }
        else if (command == "PROGRESS")
        {
            handle_progress(args);
        }
        else if (command == "OPS")
        {
            handle_operations();
        }
        else if (command == "PAUSE")
        {
            engine_.pause() ? print_ok() : print_error("conflict", "no running operation to pause");
        }
        else if (command == "RESUME")
        {
            engine_.resume() ? print_ok() : print_error("conflict", "no paused operation");
        }
        else if (command == "CANCEL")
        {
            engine_.cancel() ? print_ok() : print_error("conflict", "no active operation");
        }
        else if (command == "WAIT")
        {
            handle_wait(args);
        }
        else if (command == "CLEAR")
        {
            const auto removed = engine_.clear_history();
            print_ok();
            out_ << removed << " operation(s) cleared" << std::endl;
        }
        else if (command == "STATUS")
        {
            print_ok();
            out_ << nlohmann::json(engine_.status()).dump(2) << std::endl;
        }
        else if (command == "AUTO")
        {
            handle_auto(args);
        }
        else
        {
            return false;
        }
        return true;
    }

    void Shell::handle_add(const std::vector<std::string> &args)
    {
        if (args.size() < 6 || args.size() > 7)
        {
            print_error("invalid_payload", "usage: ADD <id> <name> <type> <host> <port> <storage_path> [api_key]");
            return;
        }
        const auto type = device_type_from_string(args[2]);
        if (!type)
        {
            print_error("invalid_payload", "unknown device type '" + args[2] + "'");
            return;
        }
        const auto port = parse_port(args[4]);
        if (!port)
        {
            print_error("invalid_payload", "port must be 0-65535 or -, got '" + args[4] + "'");
            return;
        }

        Device device;
        device.id = args[0];
        device.name = args[1];
        device.type = *type;
        device.host = optional_token(args[3]);
        device.port = *port;
        device.storage_path = optional_token(args[5]);
        if (args.size() == 7)
        {
            device.api_key = args[6];
        }

        if (!engine_.add_device(std::move(device)))
        {
            print_error("unreachable", "device " + args[0] + " did not answer its probe");
            return;
        }
        print_ok();
    }

    void Shell::handle_remove(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_error("invalid_payload", "usage: REMOVE <id>");
            return;
        }
        engine_.remove_device(args[0]) ? print_ok() : print_error("not_found", "unknown device " + args[0]);
    }

    void Shell::handle_devices()
    {
        print_ok();
        for (const auto &device : engine_.devices())
        {
            out_ << std::left << std::setw(16) << device.id << ' ' << std::setw(12) << to_string(device.type) << ' '
                 << std::setw(8) << (device.online ? "online" : "offline") << ' ';
            if (is_directly_managed(device))
            {
                out_ << device.storage_path;
            }
            else
            {
                out_ << device.host << ':' << device.port;
            }
            out_ << "  " << device.name << std::endl;
        }
    }

    void Shell::handle_probe(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_error("invalid_payload", "usage: PROBE <id>");
            return;
        }
        if (!engine_.find_device(args[0]))
        {
            print_error("not_found", "unknown device " + args[0]);
            return;
        }
        const bool online = engine_.probe_device(args[0]);
        print_ok();
        out_ << args[0] << (online ? " online" : " offline") << std::endl;
    }

    void Shell::handle_scan(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_error("invalid_payload", "usage: SCAN <id>");
            return;
        }
        if (!engine_.find_device(args[0]))
        {
            print_error("not_found", "unknown device " + args[0]);
            return;
        }
        const auto catalog = engine_.scan_device(args[0]);
        print_ok();
        for (const auto &item : catalog->items())
        {
            out_ << item.digest.substr(0, 16) << "  " << std::setw(6) << to_string(item.category) << ' '
                 << std::right << std::setw(12) << item.size << std::left << "  "
                 << (item.relative_path.empty() ? item.path : item.relative_path) << std::endl;
        }
        out_ << catalog->size() << " item(s)" << std::endl;
    }

    void Shell::handle_sync(const std::vector<std::string> &args)
    {
        if (args.size() < 2)
        {
            print_error("invalid_payload", "usage: SYNC <source> <target>...");
            return;
        }
        const std::vector<std::string> targets(args.begin() + 1, args.end());
        const auto result = engine_.start_sync(args[0], targets);
        switch (result.status)
        {
        case StartStatus::Started:
            print_ok();
            out_ << result.operation_id << std::endl;
            break;
        case StartStatus::AlreadyRunning:
            print_error("busy", result.message);
            break;
        case StartStatus::UnknownSource:
        case StartStatus::UnknownTarget:
            print_error("not_found", result.message);
            break;
        case StartStatus::NoTargets:
            print_error("invalid_payload", result.message);
            break;
        }
    }

    void Shell::handle_progress(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_error("invalid_payload", "usage: PROGRESS <operation>");
            return;
        }
        const auto snapshot = engine_.get_progress(args[0]);
        if (!snapshot)
        {
            print_error("not_found", "unknown operation " + args[0]);
            return;
        }
        print_ok();
        out_ << nlohmann::json(*snapshot).dump(2) << std::endl;
    }

    void Shell::handle_operations()
    {
        print_ok();
        for (const auto &snapshot : engine_.list_operations())
        {
            out_ << snapshot.id << "  " << std::setw(8) << to_string(snapshot.status) << ' ' << std::fixed
                 << std::setprecision(1) << snapshot.progress << "%  " << snapshot.processed_files << '/'
                 << snapshot.total_planned_files << " file(s), " << snapshot.errors.size() << " error(s)" << std::endl;
        }
    }

    void Shell::handle_wait(const std::vector<std::string> &args)
    {
        std::optional<std::chrono::milliseconds> timeout;
        if (!args.empty())
        {
            const auto seconds = parse_unsigned(args[0]);
            if (!seconds || *seconds > kMaxWaitSeconds)
            {
                print_error("invalid_payload", "WAIT expects 0-" + std::to_string(kMaxWaitSeconds) + " seconds");
                return;
            }
            timeout = std::chrono::seconds{*seconds};
        }
        engine_.wait_until_idle(timeout) ? print_ok() : print_error("timeout", "operation still running");
    }

    void Shell::handle_auto(const std::vector<std::string> &args)
    {
        const auto mode = args.empty() ? std::string{} : to_upper(args[0]);
        if (mode == "START")
        {
            engine_.start_auto_sync();
            print_ok();
        }
        else if (mode == "STOP")
        {
            engine_.stop_auto_sync();
            print_ok();
        }
        else
        {
            print_error("invalid_payload", "usage: AUTO START|STOP");
        }
    }

    void Shell::print_ok() const
    {
        out_ << "OK" << std::endl;
    }

    void Shell::print_error(std::string_view code, const std::string &message) const
    {
        out_ << "ERROR: " << code << std::endl;
        if (!message.empty())
        {
            out_ << message << std::endl;
        }
    }

    void Shell::print_help() const
    {
        out_ << "Available commands:" << std::endl;
        out_ << "  ADD <id> <name> <type> <host> <port> <path> [key]  Register a device (use - for unused fields)"
             << std::endl;
        out_ << "  REMOVE <id>                Forget a device" << std::endl;
        out_ << "  DEVICES                    List registered devices" << std::endl;
        out_ << "  PROBE <id>                 Re-check a device's liveness" << std::endl;
        out_ << "  SCAN <id>                  Rescan a device's media catalog" << std::endl;
        out_ << "  SYNC <source> <target>...  Start a one-way sync" << std::endl;
        out_ << "  PROGRESS <operation>       Show an operation's progress" << std::endl;
        out_ << "  OPS                        List operations" << std::endl;
        out_ << "  PAUSE | RESUME | CANCEL    Control the running operation" << std::endl;
        out_ << "  WAIT [seconds]             Block until no operation is running" << std::endl;
        out_ << "  CLEAR                      Drop finished operations from history" << std::endl;
        out_ << "  STATUS                     Engine summary and statistics" << std::endl;
        out_ << "  AUTO START|STOP            Toggle periodic auto-sync" << std::endl;
        out_ << "  HELP                       Show this help" << std::endl;
        out_ << "  EXIT                       Leave the shell" << std::endl;
    }

} // namespace mediasync::engine
