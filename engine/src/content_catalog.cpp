#include "mediasync/engine/content_catalog.hpp"

#include <unordered_set>

#include <spdlog/spdlog.h>

#include "mediasync/media_scanner.hpp"

namespace mediasync::engine
{

    Catalog::Catalog(std::string device_id, std::vector<MediaItem> items, Timestamp scanned_at)
        : device_id_(std::move(device_id)),
          scanned_at_(scanned_at)
    {
        items_.reserve(items.size());
        for (auto &item : items)
        {
            if (index_.contains(item.digest))
            {
                continue;
            }
            index_.emplace(item.digest, items_.size());
            items_.push_back(std::move(item));
        }
    }

    bool Catalog::contains(const std::string &digest) const
    {
        return index_.contains(digest);
    }

    const MediaItem *Catalog::find(const std::string &digest) const
    {
        const auto it = index_.find(digest);
        return it == index_.end() ? nullptr : &items_[it->second];
    }

    ContentCatalog::ContentCatalog(DeviceTransport &transport)
        : transport_(transport) {}

    CatalogSnapshot ContentCatalog::scan(const Device &device)
    {
        std::vector<MediaItem> items;
        if (is_directly_managed(device))
        {
            ScanSummary summary;
            items = scan_media_root(device.storage_path, &summary);
            spdlog::info("scanned {}: {} item(s), {} skipped, {} unreadable, {} duplicate(s)", device.id,
                         items.size(), summary.skipped_unrecognized, summary.skipped_unreadable,
                         summary.duplicates_collapsed);
        }
        else
        {
            auto channel = transport_.connect(device);
            items = channel->list_media();
            spdlog::info("listed {}: {} item(s)", device.id, items.size());
        }

        auto snapshot = std::make_shared<const Catalog>(device.id, std::move(items), std::chrono::system_clock::now());
        std::lock_guard lock(mutex_);
        snapshots_[device.id] = snapshot;
        return snapshot;
    }

    CatalogSnapshot ContentCatalog::latest(const std::string &device_id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = snapshots_.find(device_id);
        return it == snapshots_.end() ? nullptr : it->second;
    }

    void ContentCatalog::forget(const std::string &device_id)
    {
        std::lock_guard lock(mutex_);
        snapshots_.erase(device_id);
    }

    std::size_t ContentCatalog::distinct_item_count() const
    {
        std::lock_guard lock(mutex_);
        std::unordered_set<std::string> digests;
        for (const auto &[device_id, snapshot] : snapshots_)
        {
            for (const auto &item : snapshot->items())
            {
                digests.insert(item.digest);
            }
        }
        return digests.size();
    }

} // namespace mediasync::engine
