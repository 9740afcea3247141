#include "mediasync/agent/session.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediasync/crypto.hpp"
#include "mediasync/encoding/base64.hpp"

namespace mediasync::agent
{

    namespace
    {
        constexpr std::uint64_t kDefaultChunk = 1 << 20;    // 1 MiB
        constexpr std::uint64_t kMaxChunk = 4 << 20;        // 4 MiB
    } // namespace

    void Session::handle_download_init(const protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<protocol::DownloadInitRequest>();
            const auto path = services_.media_store.locate(request.item_id);
            const auto file_size = std::filesystem::file_size(path);
            protocol::TransferDescriptor descriptor{
                .transfer_id = "download-" + std::to_string(++download_counter_),
                .total_size = file_size,
                .chunk_size = kDefaultChunk,
                .root_hash = crypto::hash_file(path),
            };
            // An empty file is complete at init and never asked for a chunk.
            if (file_size > 0)
            {
                downloads_[descriptor.transfer_id] = DownloadTransfer{
                    .path = path,
                    .total_size = file_size,
                    .chunk_size = descriptor.chunk_size,
                };
            }
            send_response(protocol::make_ok_response(descriptor, envelope.request_id));
        }
        catch (const StoreError &store)
        {
            send_error(store.code(), store.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::IoError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_download_chunk(const protocol::RequestEnvelope &envelope)
    {
        if (!require_authentication(envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<protocol::DownloadChunkRequest>();
            auto it = downloads_.find(request.transfer_id);
            if (it == downloads_.end())
            {
                send_error(ErrorCode::NotFound, "Unknown transfer", envelope.request_id);
                return;
            }
            auto &transfer = it->second;
            if (request.offset > transfer.total_size)
            {
                send_error(ErrorCode::InvalidPayload, "Invalid offset", envelope.request_id);
                return;
            }

            std::ifstream file(transfer.path, std::ios::binary);
            if (!file.is_open())
            {
                send_error(ErrorCode::NotFound, "Media file disappeared", envelope.request_id);
                downloads_.erase(it);
                return;
            }
            file.seekg(static_cast<std::streamoff>(request.offset));
            const auto window = request.max_bytes == 0 ? transfer.chunk_size : std::min(request.max_bytes, kMaxChunk);
            const auto max_bytes = std::min<std::uint64_t>(window, transfer.total_size - request.offset);
            std::vector<std::byte> buffer(static_cast<std::size_t>(max_bytes));
            file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_bytes = static_cast<std::size_t>(file.gcount());
            buffer.resize(read_bytes);

            const bool done = (request.offset + read_bytes) >= transfer.total_size;
            protocol::DownloadChunkResponse chunk{
                .transfer_id = request.transfer_id,
                .offset = request.offset,
                .bytes = static_cast<std::uint64_t>(read_bytes),
                .done = done,
                .data_base64 = encoding::encode_base64(buffer),
                .chunk_hash = crypto::hash_bytes(buffer),
            };
            send_response(protocol::make_ok_response(chunk, envelope.request_id));

            if (done)
            {
                downloads_.erase(it);
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::IoError, ex.what(), envelope.request_id);
        }
    }

} // namespace mediasync::agent
