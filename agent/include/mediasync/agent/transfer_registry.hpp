#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

#include "mediasync/media.hpp"

namespace mediasync::agent
{

    struct UploadState
    {
        std::string transfer_id;
        std::filesystem::path final_path;
        std::filesystem::path temp_path;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::uint64_t bytes_written{};
        std::string root_hash;
        MediaItem metadata;
        std::chrono::system_clock::time_point last_update{};
    };

    // Uploads in flight, each persisted as a JSON state file next to the
    // other agent bookkeeping so that an interrupted agent can expire them.
    class TransferRegistry
    {
    public:
        explicit TransferRegistry(std::filesystem::path storage_root);

        UploadState create(const std::filesystem::path &target_path, std::uint64_t file_size,
                           std::uint64_t chunk_size, const std::string &root_hash, const MediaItem &metadata);

        bool append_chunk(const std::string &transfer_id, std::uint64_t offset, std::span<const std::byte> data,
                          const std::string &chunk_hash, std::string &error_message);

        // Moves the staged file into place. Returns the committed state.
        std::optional<UploadState> commit(const std::string &transfer_id, const std::string &final_hash,
                                          std::string &error_message);

        std::optional<UploadState> find(const std::string &transfer_id) const;

        void cleanup_expired(std::chrono::seconds max_age);

        std::size_t active_count() const;

    private:
        std::filesystem::path metadata_path(const std::string &transfer_id) const;

        void load_existing();
        void persist_state(const UploadState &state) const;
        void remove_state(const std::string &transfer_id);
        void discard_locked(const std::string &transfer_id);

        std::string generate_transfer_id();

        std::filesystem::path registry_dir_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadState> uploads_;
    };

} // namespace mediasync::agent
