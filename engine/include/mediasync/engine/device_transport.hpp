/**
 * MediaSync - Boundary with remote devices.
 *
 * A DeviceTransport reaches devices that the engine does not manage through
 * the local filesystem. Implementations must honour the device protocol
 * contract (status, media listing, chunked download, chunked upload); the
 * framed TCP transport is the production one.
 */
#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "mediasync/device.hpp"
#include "mediasync/error_codes.hpp"
#include "mediasync/media.hpp"
#include "mediasync/protocol.hpp"

namespace mediasync::engine
{

    class TransportError : public std::runtime_error
    {
    public:
        TransportError(mediasync::ErrorCode code, std::string message);

        mediasync::ErrorCode code() const noexcept { return code_; }

    private:
        mediasync::ErrorCode code_;
    };

    // An open conversation with one remote device. Every call either succeeds
    // or throws TransportError.
    class DeviceChannel
    {
    public:
        virtual ~DeviceChannel() = default;

        virtual protocol::StatusResponse status() = 0;

        virtual std::vector<MediaItem> list_media() = 0;

        virtual protocol::TransferDescriptor open_download(const std::string &item_id) = 0;
        virtual protocol::DownloadChunkResponse read_chunk(const protocol::DownloadChunkRequest &request) = 0;

        virtual protocol::TransferDescriptor open_upload(const protocol::UploadInitRequest &request) = 0;
        virtual void write_chunk(const protocol::UploadChunkRequest &request) = 0;
        virtual MediaItem commit_upload(const protocol::UploadCommitRequest &request) = 0;
    };

    class DeviceTransport
    {
    public:
        virtual ~DeviceTransport() = default;

        // Liveness check bounded by timeout. Never throws.
        virtual bool probe(const Device &device, std::chrono::milliseconds timeout) = 0;

        // Throws TransportError when the device cannot be reached.
        virtual std::unique_ptr<DeviceChannel> connect(const Device &device) = 0;
    };

} // namespace mediasync::engine
