#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "mediasync/error_codes.hpp"
#include "mediasync/media.hpp"

namespace mediasync::agent
{

    class StoreError : public std::runtime_error
    {
    public:
        StoreError(mediasync::ErrorCode code, std::string message);

        mediasync::ErrorCode code() const noexcept { return code_; }

    private:
        mediasync::ErrorCode code_;
    };

    // The media root served by an agent, indexed by content digest.
    class MediaStore
    {
    public:
        explicit MediaStore(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }

        // Walks the root and rebuilds the digest index.
        std::vector<MediaItem> rescan();

        // Absolute path of the file holding digest. Rescans once on a miss.
        std::filesystem::path locate(const std::string &digest);

        // Free path under the root for an incoming file. A taken path gets a
        // " (n)" suffix, or StoreError(AlreadyExists) when renaming is off.
        std::filesystem::path reserve_path(const std::string &relative, bool rename_on_conflict) const;

        // Records a file that just landed in the root and describes it.
        MediaItem adopt(const std::filesystem::path &path, const MediaItem &metadata);

        std::size_t item_count();

    private:
        std::filesystem::path sanitize(const std::string &requested) const;
        std::vector<MediaItem> rescan_locked();

        std::filesystem::path root_;
        std::mutex mutex_;
        bool scanned_{false};
        std::unordered_map<std::string, std::filesystem::path> index_;
    };

} // namespace mediasync::agent
