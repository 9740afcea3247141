#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "mediasync/engine/sync_engine.hpp"

namespace mediasync::engine
{

    // Line-oriented operator console over a SyncEngine. Every command answers
    // with "OK" or "ERROR: <code>" followed by optional detail lines.
    class Shell
    {
    public:
        Shell(SyncEngine &engine, std::istream &in, std::ostream &out);

        // Reads commands until EXIT or end of input.
        int run();

        // Returns false when the line asks the shell to stop.
        bool execute_line(const std::string &line);

    private:
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        void handle_add(const std::vector<std::string> &args);
        void handle_remove(const std::vector<std::string> &args);
        void handle_devices();
        void handle_probe(const std::vector<std::string> &args);
        void handle_scan(const std::vector<std::string> &args);
        void handle_sync(const std::vector<std::string> &args);
        void handle_progress(const std::vector<std::string> &args);
        void handle_operations();
        void handle_wait(const std::vector<std::string> &args);
        void handle_auto(const std::vector<std::string> &args);

        void print_help() const;
        void print_error(std::string_view code, const std::string &message = {}) const;
        void print_ok() const;

        SyncEngine &engine_;
        std::istream &in_;
        std::ostream &out_;
    };

} // namespace mediasync::engine
