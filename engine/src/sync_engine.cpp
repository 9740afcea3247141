#include "mediasync/engine/sync_engine.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace mediasync::engine
{

    std::string_view to_string(StartStatus status) noexcept
    {
        switch (status)
        {
        case StartStatus::Started:
            return "started";
        case StartStatus::AlreadyRunning:
            return "already_running";
        case StartStatus::UnknownSource:
            return "unknown_source";
        case StartStatus::UnknownTarget:
            return "unknown_target";
        case StartStatus::NoTargets:
            return "no_targets";
        }
        return "unknown";
    }

    void to_json(nlohmann::json &json, const SyncStats &stats)
    {
        json = {
            {"total_syncs", stats.total_syncs},
            {"successful_syncs", stats.successful_syncs},
            {"failed_syncs", stats.failed_syncs},
            {"files_transferred", stats.files_transferred},
            {"files_failed", stats.files_failed},
            {"bytes_transferred", stats.bytes_transferred},
            {"last_sync_time", optional_time_to_json(stats.last_sync_time)},
        };
    }

    void to_json(nlohmann::json &json, const EngineStatus &status)
    {
        json = {
            {"status", to_string(status.status)},
            {"is_syncing", status.active_operations > 0},
            {"device_count", status.device_count},
            {"online_devices", status.online_devices},
            {"media_count", status.media_count},
            {"active_operations", status.active_operations},
            {"active_operation", status.active_operation_id ? nlohmann::json(*status.active_operation_id) : nlohmann::json(nullptr)},
            {"auto_sync", status.auto_sync_enabled},
            {"stats", status.stats},
        };
    }

    SyncEngine::SyncEngine(EngineConfig config, DeviceTransport &transport)
        : config_(std::move(config)),
          transport_(transport),
          registry_(config_.registry_file(), transport_, config_.probe_timeout),
          catalog_(transport_),
          executor_(transport_, TransferOptions{config_.chunk_size, config_.collision_policy}),
          work_guard_(asio::make_work_guard(io_context_)),
          auto_sync_timer_(io_context_)
    {
        worker_ = std::thread([this]
                              { io_context_.run(); });
        spdlog::debug("sync engine started with data dir {}", config_.data_dir.string());
    }

    SyncEngine::~SyncEngine()
    {
        stop_auto_sync();
        {
            std::lock_guard lock(mutex_);
            if (active_)
            {
                active_->cancel();
            }
        }
        work_guard_.reset();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    bool SyncEngine::add_device(Device device)
    {
        return registry_.register_device(std::move(device));
    }

    bool SyncEngine::remove_device(const std::string &device_id)
    {
        if (!registry_.remove(device_id))
        {
            return false;
        }
        catalog_.forget(device_id);
        return true;
    }

    bool SyncEngine::probe_device(const std::string &device_id)
    {
        return registry_.probe(device_id);
    }

    std::optional<Device> SyncEngine::find_device(const std::string &device_id) const
    {
        return registry_.find(device_id);
    }

    std::vector<Device> SyncEngine::devices() const
    {
        return registry_.list();
    }

    CatalogSnapshot SyncEngine::scan_device(const std::string &device_id)
    {
        const auto device = registry_.find(device_id);
        if (!device)
        {
            throw std::invalid_argument("unknown device " + device_id);
        }
        return catalog_.scan(*device);
    }

    std::string SyncEngine::next_operation_id()
    {
        return "sync_" + std::to_string(to_unix_seconds(std::chrono::system_clock::now())) + "_" +
               std::to_string(++operation_counter_);
    }

    StartResult SyncEngine::start_sync(const std::string &source_id, const std::vector<std::string> &target_ids)
    {
        std::shared_ptr<SyncOperationTracker> operation;
        {
            std::lock_guard lock(mutex_);
            if (active_)
            {
                return StartResult{StartStatus::AlreadyRunning, active_->id(), "operation " + active_->id() + " is running"};
            }

            if (!registry_.contains(source_id))
            {
                return StartResult{StartStatus::UnknownSource, {}, "unknown source device " + source_id};
            }
            std::vector<std::string> targets;
            for (const auto &target_id : target_ids)
            {
                if (!registry_.contains(target_id))
                {
                    return StartResult{StartStatus::UnknownTarget, {}, "unknown target device " + target_id};
                }
                if (std::find(targets.begin(), targets.end(), target_id) == targets.end())
                {
                    targets.push_back(target_id);
                }
            }
            if (targets.empty())
            {
                return StartResult{StartStatus::NoTargets, {}, "no target devices given"};
            }

            operation = std::make_shared<SyncOperationTracker>(next_operation_id(), source_id, std::move(targets));
            active_ = operation;
            operations_.emplace(operation->id(), operation);
            history_order_.push_back(operation->id());
        }

        asio::post(io_context_, [this, operation]
                   { run_operation(operation); });
        return StartResult{StartStatus::Started, operation->id(), {}};
    }

    void SyncEngine::run_operation(const std::shared_ptr<SyncOperationTracker> &operation)
    {
        ProgressObserver observer;
        {
            std::lock_guard lock(mutex_);
            observer = observer_;
        }
        operation->run(SyncServices{registry_, catalog_, executor_, std::move(observer)});

        const auto outcome = operation->snapshot();
        {
            std::lock_guard lock(mutex_);
            record_outcome(outcome);
            if (active_ == operation)
            {
                active_.reset();
            }
        }
        idle_cv_.notify_all();
    }

    void SyncEngine::record_outcome(const OperationSnapshot &outcome)
    {
        ++stats_.total_syncs;
        if (outcome.status == SyncStatus::Idle)
        {
            ++stats_.successful_syncs;
        }
        else
        {
            ++stats_.failed_syncs;
        }
        stats_.files_transferred += outcome.transferred_files;
        stats_.files_failed += outcome.failed_files;
        stats_.bytes_transferred += outcome.bytes_transferred;
        stats_.last_sync_time = outcome.finished_at;
    }

    std::optional<OperationSnapshot> SyncEngine::get_progress(const std::string &operation_id) const
    {
        std::shared_ptr<SyncOperationTracker> operation;
        {
            std::lock_guard lock(mutex_);
            const auto it = operations_.find(operation_id);
            if (it == operations_.end())
            {
                return std::nullopt;
            }
            operation = it->second;
        }
        return operation->snapshot();
    }

    std::vector<OperationSnapshot> SyncEngine::list_operations() const
    {
        std::vector<std::shared_ptr<SyncOperationTracker>> operations;
        {
            std::lock_guard lock(mutex_);
            operations.reserve(history_order_.size());
            for (const auto &id : history_order_)
            {
                operations.push_back(operations_.at(id));
            }
        }
        std::vector<OperationSnapshot> snapshots;
        snapshots.reserve(operations.size());
        for (const auto &operation : operations)
        {
            snapshots.push_back(operation->snapshot());
        }
        return snapshots;
    }

    std::size_t SyncEngine::clear_history()
    {
        std::lock_guard lock(mutex_);
        std::size_t removed = 0;
        auto keep = history_order_.begin();
        for (auto it = history_order_.begin(); it != history_order_.end(); ++it)
        {
            if (active_ && active_->id() == *it)
            {
                *keep++ = std::move(*it);
                continue;
            }
            operations_.erase(*it);
            ++removed;
        }
        history_order_.erase(keep, history_order_.end());
        return removed;
    }

    bool SyncEngine::pause()
    {
        std::lock_guard lock(mutex_);
        return active_ && active_->pause();
    }

    bool SyncEngine::resume()
    {
        std::lock_guard lock(mutex_);
        return active_ && active_->resume();
    }

    bool SyncEngine::cancel()
    {
        std::lock_guard lock(mutex_);
        return active_ && active_->cancel();
    }

    bool SyncEngine::wait_until_idle(std::optional<std::chrono::milliseconds> timeout)
    {
        std::unique_lock lock(mutex_);
        if (!timeout)
        {
            idle_cv_.wait(lock, [this] { return !active_; });
            return true;
        }
        return idle_cv_.wait_for(lock, *timeout, [this] { return !active_; });
    }

    EngineStatus SyncEngine::status() const
    {
        EngineStatus summary;
        const auto known = registry_.list();
        summary.device_count = known.size();
        summary.online_devices = static_cast<std::size_t>(
            std::count_if(known.begin(), known.end(), [](const Device &device) { return device.online; }));
        summary.media_count = catalog_.distinct_item_count();

        std::lock_guard lock(mutex_);
        summary.stats = stats_;
        summary.auto_sync_enabled = auto_sync_enabled_;
        if (active_)
        {
            summary.status = active_->status();
            summary.active_operations = 1;
            summary.active_operation_id = active_->id();
        }
        return summary;
    }

    void SyncEngine::set_progress_observer(ProgressObserver observer)
    {
        std::lock_guard lock(mutex_);
        observer_ = std::move(observer);
    }

    bool SyncEngine::auto_sync_enabled() const
    {
        std::lock_guard lock(mutex_);
        return auto_sync_enabled_;
    }

    void SyncEngine::start_auto_sync()
    {
        {
            std::lock_guard lock(mutex_);
            if (auto_sync_enabled_)
            {
                return;
            }
            auto_sync_enabled_ = true;
        }
        spdlog::info("auto-sync enabled every {}s", config_.auto_sync_interval.count());
        schedule_auto_sync(config_.auto_sync_interval);
    }

    void SyncEngine::stop_auto_sync()
    {
        {
            std::lock_guard lock(mutex_);
            if (!auto_sync_enabled_)
            {
                return;
            }
            auto_sync_enabled_ = false;
        }
        asio::post(io_context_, [this]
                   { auto_sync_timer_.cancel(); });
        spdlog::info("auto-sync disabled");
    }

    void SyncEngine::schedule_auto_sync(std::chrono::seconds delay)
    {
        // The timer is only touched from the coordinating thread.
        asio::post(io_context_, [this, delay]
                   {
            if (!auto_sync_enabled())
            {
                return;
            }
            auto_sync_timer_.expires_after(delay);
            auto_sync_timer_.async_wait([this](const std::error_code &ec)
                                        {
                if (!ec)
                {
                    on_auto_sync_tick();
                } }); });
    }

    void SyncEngine::on_auto_sync_tick()
    {
        if (!auto_sync_enabled())
        {
            return;
        }
        try
        {
            bool busy = false;
            {
                std::lock_guard lock(mutex_);
                busy = static_cast<bool>(active_);
            }
            const auto known = registry_.list();
            if (busy)
            {
                spdlog::debug("auto-sync tick skipped: an operation is running");
            }
            else if (known.size() >= 2)
            {
                const auto source = std::find_if(known.begin(), known.end(),
                                                 [](const Device &device) { return device.type == DeviceType::Nas; });
                if (source == known.end())
                {
                    spdlog::debug("auto-sync tick skipped: no nas device registered");
                }
                else
                {
                    std::vector<std::string> targets;
                    for (const auto &device : known)
                    {
                        if (device.id != source->id && registry_.probe(device.id))
                        {
                            targets.push_back(device.id);
                        }
                    }
                    if (targets.empty())
                    {
                        spdlog::info("auto-sync tick: no online targets for {}", source->id);
                    }
                    else
                    {
                        const auto result = start_sync(source->id, targets);
                        spdlog::info("auto-sync from {} to {} target(s): {}", source->id, targets.size(),
                                     to_string(result.status));
                    }
                }
            }
            schedule_auto_sync(config_.auto_sync_interval);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("auto-sync tick failed: {}; retrying in {}s", ex.what(), config_.auto_sync_retry_delay.count());
            schedule_auto_sync(config_.auto_sync_retry_delay);
        }
    }

} // namespace mediasync::engine
