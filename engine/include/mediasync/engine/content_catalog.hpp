#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mediasync/device.hpp"
#include "mediasync/engine/device_transport.hpp"
#include "mediasync/media.hpp"
#include "mediasync/time_format.hpp"

namespace mediasync::engine
{

    // Immutable result of one scan. Digests are unique within a catalog and
    // items keep the order in which the scan produced them.
    class Catalog
    {
    public:
        Catalog(std::string device_id, std::vector<MediaItem> items, Timestamp scanned_at);

        const std::string &device_id() const noexcept { return device_id_; }
        Timestamp scanned_at() const noexcept { return scanned_at_; }
        const std::vector<MediaItem> &items() const noexcept { return items_; }
        std::size_t size() const noexcept { return items_.size(); }
        bool empty() const noexcept { return items_.empty(); }

        bool contains(const std::string &digest) const;
        const MediaItem *find(const std::string &digest) const;

    private:
        std::string device_id_;
        std::vector<MediaItem> items_;
        Timestamp scanned_at_;
        std::unordered_map<std::string, std::size_t> index_;
    };

    using CatalogSnapshot = std::shared_ptr<const Catalog>;

    // Produces and remembers the latest catalog of every device. Directly
    // managed devices are walked on disk, the rest are listed over the
    // transport.
    class ContentCatalog
    {
    public:
        explicit ContentCatalog(DeviceTransport &transport);

        // Throws std::runtime_error or TransportError when the device cannot
        // be enumerated; the previous snapshot is kept in that case.
        CatalogSnapshot scan(const Device &device);

        CatalogSnapshot latest(const std::string &device_id) const;
        void forget(const std::string &device_id);
        std::size_t distinct_item_count() const;

    private:
        DeviceTransport &transport_;
        mutable std::mutex mutex_;
        std::map<std::string, CatalogSnapshot> snapshots_;
    };

} // namespace mediasync::engine
