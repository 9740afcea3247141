#include "mediasync/engine/sync_planner.hpp"

#include <string>
#include <unordered_set>

namespace mediasync::engine::planner
{

    std::vector<MediaItem> diff(std::span<const MediaItem> source, std::span<const MediaItem> target)
    {
        std::unordered_set<std::string> present;
        present.reserve(target.size() + source.size());
        for (const auto &item : target)
        {
            present.insert(item.digest);
        }

        std::vector<MediaItem> missing;
        for (const auto &item : source)
        {
            // Inserting here also collapses duplicates within the source.
            if (present.insert(item.digest).second)
            {
                missing.push_back(item);
            }
        }
        return missing;
    }

    std::vector<MediaItem> diff(const Catalog &source, const Catalog &target)
    {
        return diff(std::span<const MediaItem>(source.items()), std::span<const MediaItem>(target.items()));
    }

} // namespace mediasync::engine::planner
