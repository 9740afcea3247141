/**
 * MediaSync - Media item model.
 *
 * A MediaItem is identified by the digest of its bytes, never by its name or
 * path: two files with identical content are the same item.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mediasync/time_format.hpp"

namespace mediasync
{

    enum class MediaCategory : std::uint8_t
    {
        Video,
        Audio,
        Image
    };

    std::string_view to_string(MediaCategory category) noexcept;
    std::optional<MediaCategory> media_category_from_string(std::string_view value) noexcept;

    // Case-insensitive extension allow-list lookup; std::nullopt for files the
    // catalog skips.
    std::optional<MediaCategory> classify_extension(const std::filesystem::path &path);

    struct MediaItem
    {
        std::string digest;
        std::string title;
        std::string path;          // absolute path on the owning device
        std::string relative_path; // relative to the owning device's media root
        std::uint64_t size{};
        MediaCategory category{MediaCategory::Video};
        std::optional<Timestamp> last_modified{};
        std::uint64_t play_count{};
        std::optional<Timestamp> last_played{};
        double rating{};
    };

    // Throws std::invalid_argument when the digest or path is missing.
    void validate(const MediaItem &item);

    // Name used when the item is placed on another device.
    std::filesystem::path placement_path(const MediaItem &item);

    void to_json(nlohmann::json &json, const MediaItem &item);
    void from_json(const nlohmann::json &json, MediaItem &item);

} // namespace mediasync
