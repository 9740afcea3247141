/**
 * MediaSync - Engine façade.
 *
 * Owns the registry, the catalogs, the transfer executor and the operation
 * history. Operations run one at a time on a dedicated coordinating thread
 * (an asio io_context), which also hosts the optional auto-sync timer. At most
 * one operation is active for the whole engine; a start request while one is
 * active is rejected, never queued.
 */
#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "mediasync/device.hpp"
#include "mediasync/engine/config.hpp"
#include "mediasync/engine/content_catalog.hpp"
#include "mediasync/engine/device_registry.hpp"
#include "mediasync/engine/device_transport.hpp"
#include "mediasync/engine/sync_operation.hpp"
#include "mediasync/engine/transfer_executor.hpp"

namespace mediasync::engine
{

    enum class StartStatus : std::uint8_t
    {
        Started,
        AlreadyRunning,
        UnknownSource,
        UnknownTarget,
        NoTargets
    };

    std::string_view to_string(StartStatus status) noexcept;

    struct StartResult
    {
        StartStatus status{StartStatus::Started};
        std::string operation_id;
        std::string message;

        bool started() const noexcept { return status == StartStatus::Started; }
    };

    struct SyncStats
    {
        std::uint64_t total_syncs{};
        std::uint64_t successful_syncs{};
        std::uint64_t failed_syncs{};
        std::uint64_t files_transferred{};
        std::uint64_t files_failed{};
        std::uint64_t bytes_transferred{};
        std::optional<Timestamp> last_sync_time{};
    };

    struct EngineStatus
    {
        SyncStatus status{SyncStatus::Idle};
        std::size_t device_count{};
        std::size_t online_devices{};
        std::size_t media_count{};
        std::size_t active_operations{};
        std::optional<std::string> active_operation_id{};
        bool auto_sync_enabled{};
        SyncStats stats{};
    };

    void to_json(nlohmann::json &json, const SyncStats &stats);
    void to_json(nlohmann::json &json, const EngineStatus &status);

    class SyncEngine
    {
    public:
        SyncEngine(EngineConfig config, DeviceTransport &transport);
        ~SyncEngine();

        SyncEngine(const SyncEngine &) = delete;
        SyncEngine &operator=(const SyncEngine &) = delete;

        bool add_device(Device device);
        bool remove_device(const std::string &device_id);
        bool probe_device(const std::string &device_id);
        std::optional<Device> find_device(const std::string &device_id) const;
        std::vector<Device> devices() const;

        // Rescans one device and replaces its catalog. Throws on unknown ids
        // and on enumeration failures.
        CatalogSnapshot scan_device(const std::string &device_id);

        StartResult start_sync(const std::string &source_id, const std::vector<std::string> &target_ids);

        std::optional<OperationSnapshot> get_progress(const std::string &operation_id) const;
        std::vector<OperationSnapshot> list_operations() const;

        // Removes finished operations from the history; returns how many.
        std::size_t clear_history();

        // Act on the active operation, if any.
        bool pause();
        bool resume();
        bool cancel();

        // Returns false when the timeout elapses with an operation still active.
        bool wait_until_idle(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

        EngineStatus status() const;

        void start_auto_sync();
        void stop_auto_sync();
        bool auto_sync_enabled() const;

        void set_progress_observer(ProgressObserver observer);

        const EngineConfig &config() const noexcept { return config_; }

    private:
        void run_operation(const std::shared_ptr<SyncOperationTracker> &operation);
        void record_outcome(const OperationSnapshot &outcome);
        void schedule_auto_sync(std::chrono::seconds delay);
        void on_auto_sync_tick();
        std::string next_operation_id();

        EngineConfig config_;
        DeviceTransport &transport_;
        DeviceRegistry registry_;
        ContentCatalog catalog_;
        TransferExecutor executor_;

        asio::io_context io_context_;
        asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
        asio::steady_timer auto_sync_timer_;

        mutable std::mutex mutex_;
        std::condition_variable idle_cv_;
        std::shared_ptr<SyncOperationTracker> active_;
        std::map<std::string, std::shared_ptr<SyncOperationTracker>> operations_;
        std::vector<std::string> history_order_;
        SyncStats stats_;
        ProgressObserver observer_;
        bool auto_sync_enabled_{false};
        std::uint64_t operation_counter_{0};

        std::thread worker_;
    };

} // namespace mediasync::engine
