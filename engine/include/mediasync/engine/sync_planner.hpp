#pragma once

#include <span>
#include <vector>

#include "mediasync/engine/content_catalog.hpp"
#include "mediasync/media.hpp"

namespace mediasync::engine::planner
{

    // Items of source whose digest is absent from target, in source order.
    // Only the first occurrence of a duplicated source digest is kept.
    // Pure: the inputs are never modified.
    std::vector<MediaItem> diff(std::span<const MediaItem> source, std::span<const MediaItem> target);

    std::vector<MediaItem> diff(const Catalog &source, const Catalog &target);

} // namespace mediasync::engine::planner
