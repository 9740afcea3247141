/**
 * MediaSync - Moves one media item from a source device to a target device.
 *
 * Four strategies cover the combinations of directly managed (local) and
 * remote endpoints:
 *   local  -> local   streamed copy into a staging file, then rename
 *   remote -> local   chunked download into a staging file, then rename
 *   local  -> remote  chunked upload and commit
 *   remote -> remote  chunk relay from the source download to the target upload
 *
 * Every strategy verifies the content digest before the file becomes visible
 * on the target, and an existing file is never overwritten.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "mediasync/device.hpp"
#include "mediasync/engine/config.hpp"
#include "mediasync/engine/device_transport.hpp"
#include "mediasync/error_codes.hpp"
#include "mediasync/media.hpp"

namespace mediasync::engine
{

    struct TransferError
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
    };

    struct TransferResult
    {
        std::uint64_t bytes_transferred{};
        std::string destination;
        std::optional<TransferError> error{};

        bool ok() const noexcept { return !error.has_value(); }

        static TransferResult success(std::uint64_t bytes, std::string destination);
        static TransferResult failure(ErrorCode code, std::string message);
    };

    struct TransferOptions
    {
        std::size_t chunk_size{1024 * 1024};
        CollisionPolicy collision_policy{CollisionPolicy::Rename};
    };

    // Picks the path under root where an item placed at relative may be
    // written. Returns std::nullopt when the path is taken and policy is Fail.
    std::optional<std::filesystem::path> choose_destination(const std::filesystem::path &root,
                                                            const std::filesystem::path &relative,
                                                            CollisionPolicy policy);

    class TransferExecutor
    {
    public:
        TransferExecutor(DeviceTransport &transport, TransferOptions options);

        // Never throws: every failure is reported through TransferResult::error.
        TransferResult transfer(const Device &source, const Device &target, const MediaItem &item);

        // Closes the connections kept open between transfers of one operation.
        void release_channels();

        const TransferOptions &options() const noexcept { return options_; }

    private:
        TransferResult copy_local(const Device &source, const Device &target, const MediaItem &item);
        TransferResult download_to_local(const Device &source, const Device &target, const MediaItem &item);
        TransferResult upload_from_local(const Device &source, const Device &target, const MediaItem &item);
        TransferResult relay_remote(const Device &source, const Device &target, const MediaItem &item);

        DeviceChannel &channel_for(const Device &device);

        DeviceTransport &transport_;
        TransferOptions options_;
        std::map<std::string, std::unique_ptr<DeviceChannel>> channels_;
    };

} // namespace mediasync::engine
