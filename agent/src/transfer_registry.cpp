#include "mediasync/agent/transfer_registry.hpp"

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mediasync/crypto.hpp"
#include "mediasync/media_scanner.hpp"

namespace mediasync::agent
{

    namespace
    {
        constexpr auto kUploadsDir = "uploads";
        constexpr std::uint64_t kDefaultChunkSize = 1u << 20;
        constexpr std::uint64_t kMaxChunkSize = 4u << 20;

        nlohmann::json state_to_json(const UploadState &state)
        {
            return {
                {"transfer_id", state.transfer_id},
                {"final_path", state.final_path.generic_string()},
                {"temp_path", state.temp_path.generic_string()},
                {"file_size", state.file_size},
                {"chunk_size", state.chunk_size},
                {"bytes_written", state.bytes_written},
                {"root_hash", state.root_hash},
                {"metadata", state.metadata},
                {"last_update", std::chrono::duration_cast<std::chrono::seconds>(state.last_update.time_since_epoch()).count()},
            };
        }

        UploadState state_from_json(const nlohmann::json &json)
        {
            UploadState state{};
            state.transfer_id = json.at("transfer_id").get<std::string>();
            state.final_path = json.at("final_path").get<std::string>();
            state.temp_path = json.at("temp_path").get<std::string>();
            state.file_size = json.value("file_size", 0ULL);
            state.chunk_size = json.value("chunk_size", 0ULL);
            state.bytes_written = json.value("bytes_written", 0ULL);
            state.root_hash = json.value("root_hash", std::string{});
            state.metadata = json.at("metadata").get<MediaItem>();
            const auto seconds = json.value("last_update", 0LL);
            state.last_update = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
            return state;
        }

    } // namespace

    TransferRegistry::TransferRegistry(std::filesystem::path storage_root)
        : registry_dir_(std::move(storage_root) / kMetadataDirName / kUploadsDir)
    {
        std::filesystem::create_directories(registry_dir_);
        load_existing();
    }

    UploadState TransferRegistry::create(const std::filesystem::path &target_path, std::uint64_t file_size,
                                         std::uint64_t chunk_size, const std::string &root_hash,
                                         const MediaItem &metadata)
    {
        std::lock_guard lock(mutex_);

        UploadState state{};
        state.transfer_id = generate_transfer_id();
        state.final_path = target_path;
        state.temp_path = target_path;
        state.temp_path += ".part";
        state.file_size = file_size;
        state.chunk_size = chunk_size == 0 ? kDefaultChunkSize : std::min(chunk_size, kMaxChunkSize);
        state.bytes_written = 0;
        state.root_hash = root_hash;
        state.metadata = metadata;
        state.last_update = std::chrono::system_clock::now();

        std::filesystem::create_directories(state.temp_path.parent_path());
        std::ofstream file(state.temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            throw std::runtime_error("Cannot create staging file " + state.temp_path.string());
        }
        file.close();

        uploads_[state.transfer_id] = state;
        persist_state(state);
        return state;
    }

    bool TransferRegistry::append_chunk(const std::string &transfer_id, std::uint64_t offset,
                                        std::span<const std::byte> data, const std::string &chunk_hash,
                                        std::string &error_message)
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(transfer_id);
        if (it == uploads_.end())
        {
            error_message = "Unknown transfer";
            return false;
        }

        auto &state = it->second;
        if (offset != state.bytes_written)
        {
            error_message = "Unexpected chunk offset";
            return false;
        }

        if (state.bytes_written + static_cast<std::uint64_t>(data.size()) > state.file_size)
        {
            error_message = "Chunk exceeds declared file size";
            return false;
        }

        if (crypto::hash_bytes(data) != chunk_hash)
        {
            error_message = "Chunk hash mismatch";
            return false;
        }

        std::ofstream file(state.temp_path, std::ios::binary | std::ios::app);
        if (!file.is_open())
        {
            error_message = "Staging file is missing";
            return false;
        }
        file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file)
        {
            error_message = "Failed to write staging file";
            return false;
        }

        state.bytes_written += static_cast<std::uint64_t>(data.size());
        state.last_update = std::chrono::system_clock::now();
        persist_state(state);
        return true;
    }

    std::optional<UploadState> TransferRegistry::commit(const std::string &transfer_id, const std::string &final_hash,
                                                        std::string &error_message)
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(transfer_id);
        if (it == uploads_.end())
        {
            error_message = "Unknown transfer";
            return std::nullopt;
        }
        auto state = it->second;
        if (state.bytes_written != state.file_size)
        {
            error_message = "Upload incomplete";
            return std::nullopt;
        }

        const auto staged_hash = crypto::hash_file(state.temp_path);
        if (staged_hash != final_hash || staged_hash != state.root_hash)
        {
            discard_locked(transfer_id);
            error_message = "File hash mismatch";
            return std::nullopt;
        }

        if (std::filesystem::exists(state.final_path))
        {
            discard_locked(transfer_id);
            error_message = "Destination was taken during upload";
            return std::nullopt;
        }
        std::filesystem::rename(state.temp_path, state.final_path);
        remove_state(transfer_id);
        uploads_.erase(it);
        return state;
    }

    std::optional<UploadState> TransferRegistry::find(const std::string &transfer_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(transfer_id);
        if (it != uploads_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::size_t TransferRegistry::active_count() const
    {
        std::lock_guard lock(mutex_);
        return uploads_.size();
    }

    void TransferRegistry::cleanup_expired(std::chrono::seconds max_age)
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        std::vector<std::string> expired;
        for (const auto &[transfer_id, state] : uploads_)
        {
            if (now - state.last_update > max_age)
            {
                expired.push_back(transfer_id);
            }
        }
        for (const auto &transfer_id : expired)
        {
            spdlog::info("Expiring stale upload {}", transfer_id);
            discard_locked(transfer_id);
        }
    }

    void TransferRegistry::discard_locked(const std::string &transfer_id)
    {
        auto it = uploads_.find(transfer_id);
        if (it == uploads_.end())
        {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(it->second.temp_path, ec);
        remove_state(transfer_id);
        uploads_.erase(it);
    }

    std::filesystem::path TransferRegistry::metadata_path(const std::string &transfer_id) const
    {
        return registry_dir_ / (transfer_id + ".json");
    }

    void TransferRegistry::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(registry_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            std::ifstream in(entry.path());
            if (!in.is_open())
            {
                continue;
            }
            try
            {
                nlohmann::json json;
                in >> json;
                auto state = state_from_json(json);
                uploads_[state.transfer_id] = std::move(state);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Ignoring unreadable upload state {}: {}", entry.path().string(), ex.what());
            }
        }
    }

    void TransferRegistry::persist_state(const UploadState &state) const
    {
        std::ofstream out(metadata_path(state.transfer_id), std::ios::trunc);
        out << state_to_json(state).dump(2);
    }

    void TransferRegistry::remove_state(const std::string &transfer_id)
    {
        std::error_code ec;
        std::filesystem::remove(metadata_path(transfer_id), ec);
    }

    std::string TransferRegistry::generate_transfer_id()
    {
        static std::mt19937_64 rng{std::random_device{}()};
        static std::uniform_int_distribution<std::uint64_t> dist;
        std::ostringstream oss;
        oss << std::hex << dist(rng);
        return oss.str();
    }

} // namespace mediasync::agent
