#include "mediasync/engine/sync_operation.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "mediasync/engine/sync_planner.hpp"

namespace mediasync::engine
{

    std::string_view to_string(SyncStatus status) noexcept
    {
        switch (status)
        {
        case SyncStatus::Idle:
            return "idle";
        case SyncStatus::Syncing:
            return "syncing";
        case SyncStatus::Paused:
            return "paused";
        case SyncStatus::Error:
            return "error";
        }
        return "idle";
    }

    void to_json(nlohmann::json &json, const PlannedTransfer &planned)
    {
        json = {
            {"target_id", planned.target_id},
            {"item_id", planned.item.digest},
            {"title", planned.item.title},
            {"file_size", planned.item.size},
        };
    }

    void to_json(nlohmann::json &json, const OperationSnapshot &snapshot)
    {
        json = {
            {"operation_id", snapshot.id},
            {"source_device", snapshot.source_id},
            {"target_devices", snapshot.target_ids},
            {"status", to_string(snapshot.status)},
            {"progress", snapshot.progress},
            {"processed_files", snapshot.processed_files},
            {"total_planned_files", snapshot.total_planned_files},
            {"transferred_files", snapshot.transferred_files},
            {"failed_files", snapshot.failed_files},
            {"bytes_transferred", snapshot.bytes_transferred},
            {"start_time", optional_time_to_json(snapshot.started_at)},
            {"end_time", optional_time_to_json(snapshot.finished_at)},
            {"finished", snapshot.finished},
            {"errors", snapshot.errors},
            {"skipped_targets", snapshot.skipped_targets},
            {"media_items", snapshot.planned},
        };
    }

    SyncOperationTracker::SyncOperationTracker(std::string id, std::string source_id,
                                               std::vector<std::string> target_ids)
        : id_(std::move(id)),
          source_id_(std::move(source_id)),
          target_ids_(std::move(target_ids))
    {
        state_.id = id_;
        state_.source_id = source_id_;
        state_.target_ids = target_ids_;
    }

    OperationSnapshot SyncOperationTracker::snapshot() const
    {
        std::lock_guard lock(mutex_);
        return state_;
    }

    SyncStatus SyncOperationTracker::status() const
    {
        std::lock_guard lock(mutex_);
        return state_.status;
    }

    bool SyncOperationTracker::finished() const
    {
        std::lock_guard lock(mutex_);
        return state_.finished;
    }

    bool SyncOperationTracker::pause()
    {
        std::lock_guard lock(mutex_);
        if (state_.finished || cancel_requested_ || pause_requested_)
        {
            return false;
        }
        pause_requested_ = true;
        return true;
    }

    bool SyncOperationTracker::resume()
    {
        {
            std::lock_guard lock(mutex_);
            if (state_.finished || !pause_requested_)
            {
                return false;
            }
            pause_requested_ = false;
        }
        control_cv_.notify_all();
        return true;
    }

    bool SyncOperationTracker::cancel()
    {
        {
            std::lock_guard lock(mutex_);
            if (state_.finished || cancel_requested_)
            {
                return false;
            }
            cancel_requested_ = true;
        }
        control_cv_.notify_all();
        return true;
    }

    bool SyncOperationTracker::await_file_boundary()
    {
        std::unique_lock lock(mutex_);
        if (cancel_requested_)
        {
            return false;
        }
        if (pause_requested_)
        {
            state_.status = SyncStatus::Paused;
            spdlog::info("operation {} paused after {} file(s)", id_, state_.processed_files);
            control_cv_.wait(lock, [this] { return !pause_requested_ || cancel_requested_; });
            if (cancel_requested_)
            {
                return false;
            }
            state_.status = SyncStatus::Syncing;
            spdlog::info("operation {} resumed", id_);
        }
        return true;
    }

    void SyncOperationTracker::record_error(std::string message)
    {
        spdlog::error("operation {}: {}", id_, message);
        std::lock_guard lock(mutex_);
        state_.errors.push_back(std::move(message));
    }

    void SyncOperationTracker::skip_target(const std::string &target_id, std::string reason)
    {
        spdlog::info("operation {}: skipping target {} ({})", id_, target_id, reason);
        std::lock_guard lock(mutex_);
        state_.skipped_targets.push_back(target_id);
    }

    void SyncOperationTracker::notify(const SyncServices &services) const
    {
        if (services.observer)
        {
            services.observer(snapshot());
        }
    }

    void SyncOperationTracker::run(SyncServices services)
    {
        {
            std::lock_guard lock(mutex_);
            state_.status = SyncStatus::Syncing;
            state_.started_at = std::chrono::system_clock::now();
        }
        spdlog::info("operation {} started: {} -> {} target(s)", id_, source_id_, target_ids_.size());

        std::optional<std::string> failure;
        try
        {
            execute(services);
        }
        catch (const OrchestrationError &ex)
        {
            failure = ex.what();
        }
        catch (const std::exception &ex)
        {
            failure = std::string("unexpected failure: ") + ex.what();
        }
        services.executor.release_channels();

        {
            std::lock_guard lock(mutex_);
            state_.finished_at = std::chrono::system_clock::now();
            state_.finished = true;
            if (failure)
            {
                state_.status = SyncStatus::Error;
                state_.errors.push_back(*failure);
            }
            else
            {
                state_.status = SyncStatus::Idle;
                state_.progress = 100.0;
            }
        }
        control_cv_.notify_all();

        if (failure)
        {
            spdlog::error("operation {} failed: {}", id_, *failure);
        }
        else
        {
            const auto final_state = snapshot();
            spdlog::info("operation {} completed: {} transferred, {} failed, {} byte(s)", id_,
                         final_state.transferred_files, final_state.failed_files, final_state.bytes_transferred);
        }
        notify(services);
    }

    void SyncOperationTracker::execute(SyncServices &services)
    {
        if (!services.registry.contains(source_id_))
        {
            throw OrchestrationError("source device " + source_id_ + " is not registered");
        }
        if (!services.registry.probe(source_id_))
        {
            throw OrchestrationError("source device " + source_id_ + " is offline");
        }
        const auto source = services.registry.find(source_id_);
        if (!source)
        {
            throw OrchestrationError("source device " + source_id_ + " was removed");
        }

        CatalogSnapshot source_catalog;
        try
        {
            source_catalog = services.catalog.scan(*source);
        }
        catch (const std::exception &ex)
        {
            throw OrchestrationError("cannot scan source device " + source_id_ + ": " + ex.what());
        }

        const auto plans = plan_targets(services, *source, *source_catalog);
        notify(services);

        for (const auto &plan : plans)
        {
            transfer_plan(services, *source, plan);
        }
    }

    std::vector<SyncOperationTracker::TargetPlan> SyncOperationTracker::plan_targets(SyncServices &services,
                                                                                     const Device &source,
                                                                                     const Catalog &source_catalog)
    {
        std::vector<TargetPlan> plans;
        for (const auto &target_id : target_ids_)
        {
            if (target_id == source.id)
            {
                skip_target(target_id, "same as source");
                continue;
            }
            if (!services.registry.contains(target_id))
            {
                record_error("target device " + target_id + " is not registered");
                skip_target(target_id, "not registered");
                continue;
            }
            if (!services.registry.probe(target_id))
            {
                skip_target(target_id, "offline");
                continue;
            }
            auto target = services.registry.find(target_id);
            if (!target)
            {
                record_error("target device " + target_id + " was removed");
                skip_target(target_id, "removed");
                continue;
            }

            CatalogSnapshot target_catalog;
            try
            {
                target_catalog = services.catalog.scan(*target);
            }
            catch (const std::exception &ex)
            {
                record_error("cannot scan target device " + target_id + ": " + ex.what());
                skip_target(target_id, "scan failed");
                continue;
            }

            auto missing = planner::diff(source_catalog, *target_catalog);
            spdlog::info("operation {}: {} item(s) missing on {}", id_, missing.size(), target_id);
            {
                std::lock_guard lock(mutex_);
                for (const auto &item : missing)
                {
                    state_.planned.push_back(PlannedTransfer{target_id, item});
                }
                state_.total_planned_files += missing.size();
            }
            plans.push_back(TargetPlan{std::move(*target), std::move(missing)});
        }
        return plans;
    }

    void SyncOperationTracker::transfer_plan(SyncServices &services, const Device &source, const TargetPlan &plan)
    {
        for (const auto &item : plan.items)
        {
            if (!await_file_boundary())
            {
                throw OrchestrationError("cancelled");
            }
            if (!services.registry.contains(source.id))
            {
                throw OrchestrationError("source device " + source.id + " was removed during the operation");
            }
            if (!services.registry.contains(plan.target.id))
            {
                record_error("target device " + plan.target.id + " was removed during the operation");
                skip_target(plan.target.id, "removed");
                return;
            }

            const auto result = services.executor.transfer(source, plan.target, item);
            {
                std::lock_guard lock(mutex_);
                ++state_.processed_files;
                if (result.ok())
                {
                    ++state_.transferred_files;
                    state_.bytes_transferred += result.bytes_transferred;
                }
                else
                {
                    ++state_.failed_files;
                }
                if (state_.total_planned_files > 0)
                {
                    const double ratio = static_cast<double>(state_.processed_files) /
                                         static_cast<double>(state_.total_planned_files);
                    state_.progress = std::max(state_.progress, std::min(100.0, ratio * 100.0));
                }
            }

            if (result.ok())
            {
                spdlog::info("operation {}: '{}' -> {} ({} bytes)", id_, item.title, result.destination,
                             result.bytes_transferred);
            }
            else
            {
                record_error("failed to sync '" + item.title + "' to " + plan.target.id + ": " +
                             std::string(mediasync::to_string(result.error->code)) + ": " + result.error->message);
            }
            notify(services);
        }
    }

} // namespace mediasync::engine
