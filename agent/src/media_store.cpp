#include "mediasync/agent/media_store.hpp"

#include <spdlog/spdlog.h>

#include "mediasync/crypto.hpp"
#include "mediasync/media_scanner.hpp"

namespace mediasync::agent
{

    StoreError::StoreError(mediasync::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    MediaStore::MediaStore(std::filesystem::path root)
        : root_(std::move(root))
    {
        std::filesystem::create_directories(root_);
        std::filesystem::create_directories(root_ / kMetadataDirName);
    }

    std::vector<MediaItem> MediaStore::rescan()
    {
        std::lock_guard lock(mutex_);
        return rescan_locked();
    }

    std::vector<MediaItem> MediaStore::rescan_locked()
    {
        ScanSummary summary;
        auto items = scan_media_root(root_, &summary);
        index_.clear();
        for (const auto &item : items)
        {
            index_.emplace(item.digest, std::filesystem::path(item.path));
        }
        scanned_ = true;
        spdlog::debug("Indexed {} item(s) under {} ({} skipped, {} duplicate(s))", items.size(), root_.string(),
                      summary.skipped_unrecognized, summary.duplicates_collapsed);
        return items;
    }

    std::filesystem::path MediaStore::locate(const std::string &digest)
    {
        std::lock_guard lock(mutex_);
        if (!scanned_)
        {
            rescan_locked();
        }
        auto it = index_.find(digest);
        std::error_code ec;
        if (it == index_.end() || !std::filesystem::is_regular_file(it->second, ec))
        {
            rescan_locked();
            it = index_.find(digest);
        }
        if (it == index_.end())
        {
            throw StoreError(ErrorCode::NotFound, "No media item with id " + digest);
        }
        return it->second;
    }

    std::filesystem::path MediaStore::sanitize(const std::string &requested) const
    {
        std::filesystem::path relative = requested;
        if (!requested.empty() && relative.is_absolute())
        {
            relative = relative.lexically_relative("/");
        }

        std::filesystem::path sanitized = root_;
        bool has_name = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == "." || part_string == "/")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw StoreError(ErrorCode::PermissionDenied, "Path traversal detected");
            }
            if (part_string == kMetadataDirName)
            {
                throw StoreError(ErrorCode::PermissionDenied, "Reserved path component");
            }
            sanitized /= part;
            has_name = true;
        }
        if (!has_name)
        {
            throw StoreError(ErrorCode::InvalidPayload, "Empty destination path");
        }
        return sanitized;
    }

    std::filesystem::path MediaStore::reserve_path(const std::string &relative, bool rename_on_conflict) const
    {
        const auto primary = sanitize(relative);
        const auto taken = [](const std::filesystem::path &candidate)
        {
            std::error_code ec;
            auto staging = candidate;
            staging += ".part";
            return std::filesystem::exists(candidate, ec) || std::filesystem::exists(staging, ec);
        };

        if (!taken(primary))
        {
            return primary;
        }
        if (!rename_on_conflict)
        {
            throw StoreError(ErrorCode::AlreadyExists, "Destination already exists: " + relative);
        }
        const auto parent = primary.parent_path();
        const auto stem = primary.stem().string();
        const auto extension = primary.extension().string();
        for (std::size_t counter = 1;; ++counter)
        {
            auto candidate = parent / (stem + " (" + std::to_string(counter) + ")" + extension);
            if (!taken(candidate))
            {
                return candidate;
            }
        }
    }

    MediaItem MediaStore::adopt(const std::filesystem::path &path, const MediaItem &metadata)
    {
        MediaItem item = metadata;
        item.digest = crypto::hash_file(path);
        item.path = path.string();
        item.relative_path = path.lexically_relative(root_).generic_string();
        if (item.title.empty())
        {
            item.title = path.stem().string();
        }
        if (const auto category = classify_extension(path))
        {
            item.category = *category;
        }
        item.size = std::filesystem::file_size(path);
        item.last_modified = from_file_time(std::filesystem::last_write_time(path));

        std::lock_guard lock(mutex_);
        index_.emplace(item.digest, path);
        return item;
    }

    std::size_t MediaStore::item_count()
    {
        std::lock_guard lock(mutex_);
        if (!scanned_)
        {
            rescan_locked();
        }
        return index_.size();
    }

} // namespace mediasync::agent
