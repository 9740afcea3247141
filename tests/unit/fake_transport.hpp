#pragma once

#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "mediasync/crypto.hpp"
#include "mediasync/encoding/base64.hpp"
#include "mediasync/engine/device_transport.hpp"

namespace mediasync::test
{

    inline std::span<const std::byte> bytes_of(const std::string &text)
    {
        return std::as_bytes(std::span(text.data(), text.size()));
    }

    // A remote device simulated in memory.
    struct FakeDevice
    {
        bool online{true};
        std::vector<MediaItem> catalog;
        std::map<std::string, std::string> blobs;
        std::set<std::string> failing_downloads;
        std::vector<MediaItem> received;
    };

    class FakeTransport : public engine::DeviceTransport
    {
    public:
        FakeDevice &device(const std::string &id)
        {
            std::lock_guard lock(mutex_);
            return devices_[id];
        }

        void set_online(const std::string &id, bool online)
        {
            std::lock_guard lock(mutex_);
            devices_[id].online = online;
        }

        MediaItem add_item(const std::string &id, const std::string &relative_path, const std::string &content)
        {
            MediaItem item;
            item.digest = crypto::hash_bytes(bytes_of(content));
            item.relative_path = relative_path;
            item.path = "/srv/" + id + "/" + relative_path;
            item.title = std::filesystem::path(relative_path).stem().string();
            item.size = content.size();

            std::lock_guard lock(mutex_);
            auto &device = devices_[id];
            device.catalog.push_back(item);
            device.blobs[item.digest] = content;
            return item;
        }

        void fail_download(const std::string &id, const std::string &digest)
        {
            std::lock_guard lock(mutex_);
            devices_[id].failing_downloads.insert(digest);
        }

        std::vector<MediaItem> received(const std::string &id)
        {
            std::lock_guard lock(mutex_);
            return devices_[id].received;
        }

        // While closed, every download blocks before its first byte.
        void close_gate()
        {
            std::lock_guard lock(mutex_);
            gate_open_ = false;
        }

        void open_gate()
        {
            {
                std::lock_guard lock(mutex_);
                gate_open_ = true;
            }
            gate_cv_.notify_all();
        }

        bool probe(const Device &device, std::chrono::milliseconds /*timeout*/) override
        {
            std::lock_guard lock(mutex_);
            const auto it = devices_.find(device.id);
            return it != devices_.end() && it->second.online;
        }

        std::unique_ptr<engine::DeviceChannel> connect(const Device &device) override;

    private:
        friend class FakeChannel;

        struct PendingUpload
        {
            std::string device_id;
            MediaItem metadata;
            std::string relative_path;
            std::string data;
        };

        std::mutex mutex_;
        std::condition_variable gate_cv_;
        bool gate_open_{true};
        std::map<std::string, FakeDevice> devices_;
        std::map<std::string, PendingUpload> uploads_;
        std::uint64_t upload_counter_{0};
    };

    class FakeChannel : public engine::DeviceChannel
    {
    public:
        FakeChannel(FakeTransport &transport, std::string device_id)
            : transport_(transport), device_id_(std::move(device_id)) {}

        protocol::StatusResponse status() override
        {
            return protocol::StatusResponse{.device_id = device_id_, .name = device_id_};
        }

        std::vector<MediaItem> list_media() override
        {
            std::lock_guard lock(transport_.mutex_);
            return online_device().catalog;
        }

        protocol::TransferDescriptor open_download(const std::string &item_id) override
        {
            std::unique_lock lock(transport_.mutex_);
            transport_.gate_cv_.wait(lock, [this] { return transport_.gate_open_; });
            auto &device = online_device();
            if (device.failing_downloads.count(item_id) > 0)
            {
                throw engine::TransportError(ErrorCode::IoError, "simulated read failure for " + item_id);
            }
            const auto it = device.blobs.find(item_id);
            if (it == device.blobs.end())
            {
                throw engine::TransportError(ErrorCode::NotFound, "no item " + item_id);
            }
            return protocol::TransferDescriptor{
                .transfer_id = item_id,
                .total_size = it->second.size(),
                .chunk_size = 0,
                .root_hash = item_id,
            };
        }

        protocol::DownloadChunkResponse read_chunk(const protocol::DownloadChunkRequest &request) override
        {
            std::lock_guard lock(transport_.mutex_);
            const auto &blob = online_device().blobs.at(request.transfer_id);
            const auto offset = std::min<std::uint64_t>(request.offset, blob.size());
            const auto window = request.max_bytes == 0 ? blob.size() : request.max_bytes;
            const auto slice = blob.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(window));
            return protocol::DownloadChunkResponse{
                .transfer_id = request.transfer_id,
                .offset = offset,
                .bytes = slice.size(),
                .done = offset + slice.size() >= blob.size(),
                .data_base64 = encoding::encode_base64(bytes_of(slice)),
                .chunk_hash = crypto::hash_bytes(bytes_of(slice)),
            };
        }

        protocol::TransferDescriptor open_upload(const protocol::UploadInitRequest &request) override
        {
            std::lock_guard lock(transport_.mutex_);
            auto &device = online_device();
            const bool occupied = std::any_of(device.catalog.begin(), device.catalog.end(), [&](const MediaItem &item)
                                              { return item.relative_path == request.relative_path; });
            auto relative = request.relative_path;
            if (occupied)
            {
                if (!request.rename_on_conflict)
                {
                    throw engine::TransportError(ErrorCode::AlreadyExists, "occupied: " + request.relative_path);
                }
                const std::filesystem::path path(relative);
                relative = (path.parent_path() / (path.stem().string() + " (1)" + path.extension().string()))
                               .generic_string();
            }
            const auto id = "upload-" + std::to_string(++transport_.upload_counter_);
            transport_.uploads_[id] = FakeTransport::PendingUpload{device_id_, request.metadata, relative, {}};
            return protocol::TransferDescriptor{
                .transfer_id = id,
                .total_size = request.file_size,
                .chunk_size = request.chunk_size,
                .root_hash = request.root_hash,
            };
        }

        void write_chunk(const protocol::UploadChunkRequest &request) override
        {
            const auto data = encoding::decode_base64(request.data_base64);
            if (!data)
            {
                throw engine::TransportError(ErrorCode::InvalidPayload, "bad chunk");
            }
            std::lock_guard lock(transport_.mutex_);
            auto &upload = transport_.uploads_.at(request.transfer_id);
            if (request.offset != upload.data.size())
            {
                throw engine::TransportError(ErrorCode::InvalidPayload, "unexpected offset");
            }
            upload.data.append(reinterpret_cast<const char *>(data->data()), data->size());
        }

        MediaItem commit_upload(const protocol::UploadCommitRequest &request) override
        {
            std::lock_guard lock(transport_.mutex_);
            const auto upload = transport_.uploads_.at(request.transfer_id);
            transport_.uploads_.erase(request.transfer_id);
            if (crypto::hash_bytes(bytes_of(upload.data)) != request.final_hash)
            {
                throw engine::TransportError(ErrorCode::IntegrityError, "final hash mismatch");
            }
            auto item = upload.metadata;
            item.relative_path = upload.relative_path;
            item.path = "/srv/" + device_id_ + "/" + upload.relative_path;
            item.size = upload.data.size();
            auto &device = online_device();
            device.catalog.push_back(item);
            device.blobs[item.digest] = upload.data;
            device.received.push_back(item);
            return item;
        }

    private:
        // Caller holds the transport mutex.
        FakeDevice &online_device()
        {
            auto &device = transport_.devices_[device_id_];
            if (!device.online)
            {
                throw engine::TransportError(ErrorCode::Unreachable, device_id_ + " is offline");
            }
            return device;
        }

        FakeTransport &transport_;
        std::string device_id_;
    };

    inline std::unique_ptr<engine::DeviceChannel> FakeTransport::connect(const Device &device)
    {
        {
            std::lock_guard lock(mutex_);
            const auto it = devices_.find(device.id);
            if (it == devices_.end() || !it->second.online)
            {
                throw engine::TransportError(ErrorCode::Unreachable, device.id + " is offline");
            }
        }
        return std::make_unique<FakeChannel>(*this, device.id);
    }

} // namespace mediasync::test
