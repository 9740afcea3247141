/**
 * MediaSync - Lifecycle of one sync operation (source -> ordered targets).
 *
 * States: idle (initial and terminal success), syncing, paused, error
 * (terminal failure). Per-file failures are recorded as data and never
 * change the status; only an OrchestrationError ends an operation in error.
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediasync/engine/content_catalog.hpp"
#include "mediasync/engine/device_registry.hpp"
#include "mediasync/engine/transfer_executor.hpp"
#include "mediasync/media.hpp"
#include "mediasync/time_format.hpp"

namespace mediasync::engine
{

    enum class SyncStatus : std::uint8_t
    {
        Idle,
        Syncing,
        Paused,
        Error
    };

    std::string_view to_string(SyncStatus status) noexcept;

    // A failure outside the per-file loop that halts the whole operation.
    class OrchestrationError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct PlannedTransfer
    {
        std::string target_id;
        MediaItem item;
    };

    struct OperationSnapshot
    {
        std::string id;
        std::string source_id;
        std::vector<std::string> target_ids;
        SyncStatus status{SyncStatus::Idle};
        double progress{};
        std::size_t processed_files{};
        std::size_t total_planned_files{};
        std::size_t transferred_files{};
        std::size_t failed_files{};
        std::uint64_t bytes_transferred{};
        std::optional<Timestamp> started_at{};
        std::optional<Timestamp> finished_at{};
        bool finished{};
        std::vector<std::string> errors;
        std::vector<std::string> skipped_targets;
        std::vector<PlannedTransfer> planned;
    };

    void to_json(nlohmann::json &json, const PlannedTransfer &planned);
    void to_json(nlohmann::json &json, const OperationSnapshot &snapshot);

    using ProgressObserver = std::function<void(const OperationSnapshot &)>;

    struct SyncServices
    {
        DeviceRegistry &registry;
        ContentCatalog &catalog;
        TransferExecutor &executor;
        ProgressObserver observer{};
    };

    class SyncOperationTracker
    {
    public:
        SyncOperationTracker(std::string id, std::string source_id, std::vector<std::string> target_ids);

        const std::string &id() const noexcept { return id_; }

        // Runs the operation to completion on the calling thread. Never throws.
        void run(SyncServices services);

        OperationSnapshot snapshot() const;
        SyncStatus status() const;
        bool finished() const;

        // Take effect at the next file boundary.
        bool pause();
        bool resume();
        bool cancel();

    private:
        struct TargetPlan
        {
            Device target;
            std::vector<MediaItem> items;
        };

        void execute(SyncServices &services);
        std::vector<TargetPlan> plan_targets(SyncServices &services, const Device &source, const Catalog &source_catalog);
        void transfer_plan(SyncServices &services, const Device &source, const TargetPlan &plan);

        // Blocks while paused. Returns false once the operation is cancelled.
        bool await_file_boundary();

        void record_error(std::string message);
        void skip_target(const std::string &target_id, std::string reason);
        void notify(const SyncServices &services) const;

        const std::string id_;
        const std::string source_id_;
        const std::vector<std::string> target_ids_;

        mutable std::mutex mutex_;
        std::condition_variable control_cv_;
        bool pause_requested_{false};
        bool cancel_requested_{false};
        OperationSnapshot state_;
    };

} // namespace mediasync::engine
