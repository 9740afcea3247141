#include "mediasync/engine/transfer_executor.hpp"

#include <fstream>
#include <span>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "mediasync/crypto.hpp"
#include "mediasync/encoding/base64.hpp"

namespace mediasync::engine
{

    namespace
    {

        class TransferFailure : public std::runtime_error
        {
        public:
            TransferFailure(ErrorCode code, const std::string &message)
                : std::runtime_error(message), code_(code) {}

            ErrorCode code() const noexcept { return code_; }

        private:
            ErrorCode code_;
        };

        // Staging file next to the destination; removed unless promoted.
        class StagingFile
        {
        public:
            explicit StagingFile(const std::filesystem::path &destination)
                : path_(destination)
            {
                path_ += ".part";
            }

            ~StagingFile()
            {
                if (!promoted_)
                {
                    std::error_code ec;
                    std::filesystem::remove(path_, ec);
                }
            }

            StagingFile(const StagingFile &) = delete;
            StagingFile &operator=(const StagingFile &) = delete;

            const std::filesystem::path &path() const noexcept { return path_; }

            void promote(const std::filesystem::path &destination)
            {
                if (std::filesystem::exists(destination))
                {
                    throw TransferFailure(ErrorCode::AlreadyExists,
                                          "destination appeared during transfer: " + destination.string());
                }
                std::filesystem::rename(path_, destination);
                promoted_ = true;
            }

        private:
            std::filesystem::path path_;
            bool promoted_{false};
        };

        std::filesystem::path local_source_path(const Device &source, const MediaItem &item)
        {
            if (!item.path.empty())
            {
                return std::filesystem::path(item.path);
            }
            return std::filesystem::path(source.storage_path) / item.relative_path;
        }

        void require_digest(const std::string &actual, const MediaItem &item)
        {
            if (actual != item.digest)
            {
                throw TransferFailure(ErrorCode::IntegrityError,
                                      "content of '" + item.title + "' no longer matches digest " + item.digest);
            }
        }

        // Resolves the local destination for item under the target root.
        // Returns std::nullopt when an identical copy is already in place.
        std::optional<std::filesystem::path> prepare_local_destination(const Device &target, const MediaItem &item,
                                                                       CollisionPolicy policy)
        {
            const std::filesystem::path root(target.storage_path);
            std::error_code ec;
            if (!std::filesystem::is_directory(root, ec))
            {
                throw TransferFailure(ErrorCode::NotFound, "target root " + root.string() + " is not a directory");
            }

            const auto relative = placement_path(item);
            const auto primary = root / relative;
            if (std::filesystem::is_regular_file(primary, ec) && crypto::hash_file(primary) == item.digest)
            {
                return std::nullopt;
            }

            auto destination = choose_destination(root, relative, policy);
            if (!destination)
            {
                throw TransferFailure(ErrorCode::AlreadyExists,
                                      "destination " + primary.string() + " already holds different content");
            }
            std::filesystem::create_directories(destination->parent_path());
            return destination;
        }

        std::vector<std::byte> decode_chunk(const protocol::DownloadChunkResponse &chunk)
        {
            auto data = encoding::decode_base64(chunk.data_base64);
            if (!data || data->size() != chunk.bytes)
            {
                throw TransferFailure(ErrorCode::InvalidPayload, "malformed chunk at offset " +
                                                                     std::to_string(chunk.offset));
            }
            if (!chunk.chunk_hash.empty() && crypto::hash_bytes(*data) != chunk.chunk_hash)
            {
                throw TransferFailure(ErrorCode::IntegrityError, "chunk hash mismatch at offset " +
                                                                     std::to_string(chunk.offset));
            }
            return std::move(*data);
        }

        protocol::UploadInitRequest make_upload_request(const MediaItem &item, std::uint64_t file_size,
                                                        const TransferOptions &options)
        {
            protocol::UploadInitRequest request{};
            request.metadata = item;
            request.relative_path = placement_path(item).generic_string();
            request.metadata.relative_path = request.relative_path;
            request.file_size = file_size;
            request.chunk_size = options.chunk_size;
            request.root_hash = item.digest;
            request.rename_on_conflict = options.collision_policy == CollisionPolicy::Rename;
            return request;
        }

    } // namespace

    TransferResult TransferResult::success(std::uint64_t bytes, std::string destination)
    {
        TransferResult result;
        result.bytes_transferred = bytes;
        result.destination = std::move(destination);
        return result;
    }

    TransferResult TransferResult::failure(ErrorCode code, std::string message)
    {
        TransferResult result;
        result.error = TransferError{code, std::move(message)};
        return result;
    }

    std::optional<std::filesystem::path> choose_destination(const std::filesystem::path &root,
                                                            const std::filesystem::path &relative,
                                                            CollisionPolicy policy)
    {
        const auto primary = root / relative;
        std::error_code ec;
        if (!std::filesystem::exists(primary, ec))
        {
            return primary;
        }
        if (policy == CollisionPolicy::Fail)
        {
            return std::nullopt;
        }

        const auto parent = primary.parent_path();
        const auto stem = primary.stem().string();
        const auto extension = primary.extension().string();
        for (std::size_t counter = 1;; ++counter)
        {
            auto candidate = parent / (stem + " (" + std::to_string(counter) + ")" + extension);
            if (!std::filesystem::exists(candidate, ec))
            {
                return candidate;
            }
        }
    }

    TransferExecutor::TransferExecutor(DeviceTransport &transport, TransferOptions options)
        : transport_(transport),
          options_(options)
    {
        if (options_.chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
    }

    void TransferExecutor::release_channels()
    {
        channels_.clear();
    }

    DeviceChannel &TransferExecutor::channel_for(const Device &device)
    {
        auto it = channels_.find(device.id);
        if (it == channels_.end())
        {
            it = channels_.emplace(device.id, transport_.connect(device)).first;
        }
        return *it->second;
    }

    TransferResult TransferExecutor::transfer(const Device &source, const Device &target, const MediaItem &item)
    {
        const bool source_local = is_directly_managed(source);
        const bool target_local = is_directly_managed(target);
        try
        {
            if (source_local && target_local)
            {
                return copy_local(source, target, item);
            }
            if (target_local)
            {
                return download_to_local(source, target, item);
            }
            if (source_local)
            {
                return upload_from_local(source, target, item);
            }
            return relay_remote(source, target, item);
        }
        catch (const TransferFailure &ex)
        {
            return TransferResult::failure(ex.code(), ex.what());
        }
        catch (const TransportError &ex)
        {
            // The connection may be in an unknown state after a failed exchange.
            channels_.erase(source.id);
            channels_.erase(target.id);
            return TransferResult::failure(ex.code(), ex.what());
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            return TransferResult::failure(ErrorCode::IoError, ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("unexpected failure moving {} from {} to {}: {}", item.digest, source.id, target.id,
                          ex.what());
            return TransferResult::failure(ErrorCode::InternalError, ex.what());
        }
    }

    TransferResult TransferExecutor::copy_local(const Device &source, const Device &target, const MediaItem &item)
    {
        const auto source_path = local_source_path(source, item);
        std::ifstream in(source_path, std::ios::binary);
        if (!in.is_open())
        {
            throw TransferFailure(ErrorCode::NotFound, "cannot open source file " + source_path.string());
        }

        const auto destination = prepare_local_destination(target, item, options_.collision_policy);
        if (!destination)
        {
            return TransferResult::success(0, (std::filesystem::path(target.storage_path) / placement_path(item)).string());
        }

        StagingFile staging(*destination);
        crypto::StreamingDigest digest;
        std::uint64_t copied = 0;
        {
            std::ofstream out(staging.path(), std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw TransferFailure(ErrorCode::IoError, "cannot create " + staging.path().string());
            }
            std::vector<char> buffer(options_.chunk_size);
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = static_cast<std::size_t>(in.gcount());
                if (count == 0)
                {
                    break;
                }
                digest.update(std::as_bytes(std::span(buffer.data(), count)));
                out.write(buffer.data(), static_cast<std::streamsize>(count));
                if (!out)
                {
                    throw TransferFailure(ErrorCode::IoError, "write failed on " + staging.path().string());
                }
                copied += count;
            }
            if (in.bad())
            {
                throw TransferFailure(ErrorCode::IoError, "read failed on " + source_path.string());
            }
        }
        require_digest(digest.finish(), item);
        staging.promote(*destination);
        return TransferResult::success(copied, destination->string());
    }

    TransferResult TransferExecutor::download_to_local(const Device &source, const Device &target,
                                                       const MediaItem &item)
    {
        const auto destination = prepare_local_destination(target, item, options_.collision_policy);
        if (!destination)
        {
            return TransferResult::success(0, (std::filesystem::path(target.storage_path) / placement_path(item)).string());
        }

        auto &channel = channel_for(source);
        const auto descriptor = channel.open_download(item.digest);
        if (descriptor.root_hash && *descriptor.root_hash != item.digest)
        {
            throw TransferFailure(ErrorCode::IntegrityError, "device " + source.id + " now serves different content for " +
                                                                 item.digest);
        }

        StagingFile staging(*destination);
        crypto::StreamingDigest digest;
        std::uint64_t offset = 0;
        {
            std::ofstream out(staging.path(), std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw TransferFailure(ErrorCode::IoError, "cannot create " + staging.path().string());
            }
            while (offset < descriptor.total_size)
            {
                protocol::DownloadChunkRequest request{
                    .transfer_id = descriptor.transfer_id,
                    .offset = offset,
                    .max_bytes = options_.chunk_size,
                };
                const auto chunk = channel.read_chunk(request);
                if (chunk.offset != offset || (chunk.bytes == 0 && !chunk.done))
                {
                    throw TransferFailure(ErrorCode::InvalidPayload, "device " + source.id +
                                                                         " answered out of order at offset " +
                                                                         std::to_string(offset));
                }
                const auto data = decode_chunk(chunk);
                digest.update(data);
                out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!out)
                {
                    throw TransferFailure(ErrorCode::IoError, "write failed on " + staging.path().string());
                }
                offset += data.size();
                if (chunk.done)
                {
                    break;
                }
            }
        }
        if (offset != descriptor.total_size)
        {
            throw TransferFailure(ErrorCode::IoError, "download of " + item.digest + " ended early at byte " +
                                                          std::to_string(offset));
        }
        require_digest(digest.finish(), item);
        staging.promote(*destination);
        return TransferResult::success(offset, destination->string());
    }

    TransferResult TransferExecutor::upload_from_local(const Device &source, const Device &target,
                                                       const MediaItem &item)
    {
        const auto source_path = local_source_path(source, item);
        std::ifstream in(source_path, std::ios::binary);
        if (!in.is_open())
        {
            throw TransferFailure(ErrorCode::NotFound, "cannot open source file " + source_path.string());
        }
        const auto file_size = std::filesystem::file_size(source_path);

        auto &channel = channel_for(target);
        const auto descriptor = channel.open_upload(make_upload_request(item, file_size, options_));

        crypto::StreamingDigest digest;
        std::vector<char> buffer(static_cast<std::size_t>(descriptor.chunk_size ? descriptor.chunk_size
                                                                                 : options_.chunk_size));
        std::uint64_t offset = 0;
        while (in && offset < file_size)
        {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<std::size_t>(in.gcount());
            if (count == 0)
            {
                break;
            }
            const auto bytes = std::as_bytes(std::span(buffer.data(), count));
            digest.update(bytes);
            protocol::UploadChunkRequest chunk{
                .transfer_id = descriptor.transfer_id,
                .offset = offset,
                .data_base64 = encoding::encode_base64(bytes),
                .chunk_hash = crypto::hash_bytes(bytes),
            };
            channel.write_chunk(chunk);
            offset += count;
        }
        if (offset != file_size)
        {
            throw TransferFailure(ErrorCode::IoError, "source file " + source_path.string() + " shrank during upload");
        }
        require_digest(digest.finish(), item);

        const auto stored = channel.commit_upload(protocol::UploadCommitRequest{
            .transfer_id = descriptor.transfer_id,
            .final_hash = item.digest,
        });
        return TransferResult::success(offset, stored.relative_path.empty() ? stored.path : stored.relative_path);
    }

    TransferResult TransferExecutor::relay_remote(const Device &source, const Device &target, const MediaItem &item)
    {
        auto &source_channel = channel_for(source);
        const auto download = source_channel.open_download(item.digest);
        if (download.root_hash && *download.root_hash != item.digest)
        {
            throw TransferFailure(ErrorCode::IntegrityError, "device " + source.id + " now serves different content for " +
                                                                 item.digest);
        }

        auto &target_channel = channel_for(target);
        const auto upload = target_channel.open_upload(make_upload_request(item, download.total_size, options_));

        crypto::StreamingDigest digest;
        const std::uint64_t window = upload.chunk_size ? upload.chunk_size : options_.chunk_size;
        std::uint64_t offset = 0;
        while (offset < download.total_size)
        {
            const auto chunk = source_channel.read_chunk(protocol::DownloadChunkRequest{
                .transfer_id = download.transfer_id,
                .offset = offset,
                .max_bytes = window,
            });
            if (chunk.offset != offset || (chunk.bytes == 0 && !chunk.done))
            {
                throw TransferFailure(ErrorCode::InvalidPayload, "device " + source.id +
                                                                     " answered out of order at offset " +
                                                                     std::to_string(offset));
            }
            const auto data = decode_chunk(chunk);
            if (!data.empty())
            {
                digest.update(data);
                target_channel.write_chunk(protocol::UploadChunkRequest{
                    .transfer_id = upload.transfer_id,
                    .offset = offset,
                    .data_base64 = chunk.data_base64,
                    .chunk_hash = crypto::hash_bytes(data),
                });
            }
            offset += data.size();
            if (chunk.done)
            {
                break;
            }
        }
        if (offset != download.total_size)
        {
            throw TransferFailure(ErrorCode::IoError, "relay of " + item.digest + " ended early at byte " +
                                                          std::to_string(offset));
        }
        require_digest(digest.finish(), item);

        const auto stored = target_channel.commit_upload(protocol::UploadCommitRequest{
            .transfer_id = upload.transfer_id,
            .final_hash = item.digest,
        });
        return TransferResult::success(offset, stored.relative_path.empty() ? stored.path : stored.relative_path);
    }

} // namespace mediasync::engine
