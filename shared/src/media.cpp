#include "mediasync/media.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace mediasync
{

    namespace
    {

        struct CategoryMapping
        {
            MediaCategory category;
            std::string_view label;
        };

        constexpr std::array<CategoryMapping, 3> kCategoryMappings{{
            {MediaCategory::Video, "video"},
            {MediaCategory::Audio, "audio"},
            {MediaCategory::Image, "image"},
        }};

        struct ExtensionMapping
        {
            std::string_view extension;
            MediaCategory category;
        };

        constexpr std::array<ExtensionMapping, 19> kExtensions{{
            {".mp4", MediaCategory::Video},
            {".mkv", MediaCategory::Video},
            {".avi", MediaCategory::Video},
            {".mov", MediaCategory::Video},
            {".wmv", MediaCategory::Video},
            {".flv", MediaCategory::Video},
            {".webm", MediaCategory::Video},
            {".mp3", MediaCategory::Audio},
            {".flac", MediaCategory::Audio},
            {".wav", MediaCategory::Audio},
            {".aac", MediaCategory::Audio},
            {".ogg", MediaCategory::Audio},
            {".m4a", MediaCategory::Audio},
            {".jpg", MediaCategory::Image},
            {".jpeg", MediaCategory::Image},
            {".png", MediaCategory::Image},
            {".gif", MediaCategory::Image},
            {".bmp", MediaCategory::Image},
            {".webp", MediaCategory::Image},
        }};

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        // Remote devices may report Windows paths; accept both separators.
        std::string last_component(std::string_view path)
        {
            const auto pos = path.find_last_of("/\\");
            return std::string(pos == std::string_view::npos ? path : path.substr(pos + 1));
        }

        std::string stem_of(const std::string &file_name)
        {
            const auto dot = file_name.find_last_of('.');
            if (dot == std::string::npos || dot == 0)
            {
                return file_name;
            }
            return file_name.substr(0, dot);
        }

    } // namespace

    std::string_view to_string(MediaCategory category) noexcept
    {
        for (const auto &mapping : kCategoryMappings)
        {
            if (mapping.category == category)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<MediaCategory> media_category_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCategoryMappings)
        {
            if (mapping.label == value)
            {
                return mapping.category;
            }
        }
        return std::nullopt;
    }

    std::optional<MediaCategory> classify_extension(const std::filesystem::path &path)
    {
        const auto extension = to_lower(path.extension().string());
        for (const auto &mapping : kExtensions)
        {
            if (mapping.extension == extension)
            {
                return mapping.category;
            }
        }
        return std::nullopt;
    }

    void validate(const MediaItem &item)
    {
        if (item.digest.empty())
        {
            throw std::invalid_argument("media item requires a content digest");
        }
        if (item.path.empty() && item.relative_path.empty())
        {
            throw std::invalid_argument("media item " + item.digest + " has no path");
        }
    }

    std::filesystem::path placement_path(const MediaItem &item)
    {
        if (!item.relative_path.empty())
        {
            std::string normalized = item.relative_path;
            std::replace(normalized.begin(), normalized.end(), '\\', '/');
            const auto relative = std::filesystem::path(normalized).lexically_normal();
            const bool escapes = relative.is_absolute() || relative.has_root_name() ||
                                 std::any_of(relative.begin(), relative.end(), [](const auto &part)
                                             { return part == ".."; });
            if (!escapes && !relative.empty() && relative != ".")
            {
                return relative;
            }
        }
        auto name = last_component(item.path.empty() ? item.relative_path : item.path);
        if (name.empty() || name == "." || name == "..")
        {
            name = item.digest;
        }
        return std::filesystem::path(name);
    }

    void to_json(nlohmann::json &json, const MediaItem &item)
    {
        json = {
            {"item_id", item.digest},
            {"file_hash", item.digest},
            {"title", item.title},
            {"file_path", item.path},
            {"relative_path", item.relative_path},
            {"file_size", item.size},
            {"media_type", to_string(item.category)},
            {"last_modified", optional_time_to_json(item.last_modified)},
            {"play_count", item.play_count},
            {"last_played", optional_time_to_json(item.last_played)},
            {"rating", item.rating},
        };
    }

    void from_json(const nlohmann::json &json, MediaItem &item)
    {
        item.digest = json.value("file_hash", std::string{});
        if (item.digest.empty())
        {
            item.digest = json.value("item_id", std::string{});
        }
        item.path = json.value("file_path", std::string{});
        item.relative_path = json.value("relative_path", std::string{});
        item.title = json.value("title", std::string{});
        if (item.title.empty())
        {
            item.title = stem_of(last_component(item.path));
        }
        item.size = json.value("file_size", 0ULL);

        const auto type_label = json.value("media_type", std::string{"video"});
        const auto category = media_category_from_string(type_label);
        if (!category)
        {
            throw std::invalid_argument("Unknown media type: " + type_label);
        }
        item.category = *category;

        item.last_modified = optional_time_from_json(json.value("last_modified", nlohmann::json()));
        item.play_count = json.value("play_count", 0ULL);
        item.last_played = optional_time_from_json(json.value("last_played", nlohmann::json()));
        item.rating = json.value("rating", 0.0);
        validate(item);
    }

} // namespace mediasync
