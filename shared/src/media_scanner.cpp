#include "mediasync/media_scanner.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "mediasync/crypto.hpp"

namespace mediasync
{

    std::vector<MediaItem> scan_media_root(const std::filesystem::path &root, ScanSummary *summary)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec))
        {
            throw std::runtime_error("Media root is not a directory: " + root.string());
        }

        ScanSummary local_summary;
        std::vector<std::filesystem::path> candidates;
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        for (auto it = std::filesystem::recursive_directory_iterator(root, options, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
        {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec) && it->path().filename() == kMetadataDirName)
            {
                it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file(entry_ec))
            {
                continue;
            }
            ++local_summary.files_seen;
            if (!classify_extension(it->path()))
            {
                ++local_summary.skipped_unrecognized;
                continue;
            }
            candidates.push_back(it->path());
        }
        if (ec)
        {
            throw std::runtime_error("Failed to walk " + root.string() + ": " + ec.message());
        }
        std::sort(candidates.begin(), candidates.end());

        std::vector<MediaItem> items;
        std::unordered_set<std::string> seen;
        for (const auto &path : candidates)
        {
            MediaItem item;
            try
            {
                item.digest = crypto::hash_file(path);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Skipping unreadable file {}: {}", path.string(), ex.what());
                ++local_summary.skipped_unreadable;
                continue;
            }
            if (!seen.insert(item.digest).second)
            {
                ++local_summary.duplicates_collapsed;
                continue;
            }
            item.title = path.stem().string();
            item.path = path.string();
            item.relative_path = path.lexically_relative(root).generic_string();
            item.category = *classify_extension(path);
            item.size = std::filesystem::file_size(path, ec);
            if (ec)
            {
                item.size = 0;
            }
            const auto modified = std::filesystem::last_write_time(path, ec);
            if (!ec)
            {
                item.last_modified = from_file_time(modified);
            }
            items.push_back(std::move(item));
        }

        if (summary)
        {
            *summary = local_summary;
        }
        return items;
    }

} // namespace mediasync
