#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "mediasync/media.hpp"

namespace mediasync
{

    struct ScanSummary
    {
        std::size_t files_seen{};
        std::size_t skipped_unrecognized{};
        std::size_t skipped_unreadable{};
        std::size_t duplicates_collapsed{};
    };

    // Walks root recursively and digests every allow-listed file. Paths are
    // visited in lexical order and the first path of a duplicated digest wins.
    // Throws std::runtime_error when root is not a directory.
    std::vector<MediaItem> scan_media_root(const std::filesystem::path &root, ScanSummary *summary = nullptr);

    // Directory name reserved for engine and agent bookkeeping inside a root.
    inline constexpr auto kMetadataDirName = ".mediasync";

} // namespace mediasync
