#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "fake_transport.hpp"
#include "mediasync/crypto.hpp"
#include "mediasync/engine/config.hpp"
#include "mediasync/engine/content_catalog.hpp"
#include "mediasync/engine/device_registry.hpp"
#include "mediasync/engine/shell.hpp"
#include "mediasync/engine/sync_engine.hpp"
#include "mediasync/engine/sync_planner.hpp"
#include "mediasync/engine/transfer_executor.hpp"
#include "mediasync/media_scanner.hpp"

using namespace mediasync;
using namespace mediasync::engine;
using mediasync::test::FakeTransport;

namespace
{

    using namespace std::chrono_literals;

    struct TempDir
    {
        explicit TempDir(const std::string &name)
            : path(std::filesystem::temp_directory_path() / name)
        {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
            std::filesystem::create_directories(path);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }

        std::filesystem::path path;
    };

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

    template <typename Predicate>
    bool wait_for(Predicate predicate, std::chrono::milliseconds timeout = 5s)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return predicate();
    }

    Device local_device(const std::string &id, const std::filesystem::path &root)
    {
        Device device;
        device.id = id;
        device.name = id;
        device.type = DeviceType::Workstation;
        device.storage_path = root.string();
        return device;
    }

    Device remote_device(const std::string &id, DeviceType type = DeviceType::Nas)
    {
        Device device;
        device.id = id;
        device.name = id;
        device.type = type;
        device.host = "fake.local";
        device.port = 9000;
        return device;
    }

    MediaItem make_item(const std::string &digest, const std::string &relative_path)
    {
        MediaItem item;
        item.digest = digest;
        item.relative_path = relative_path;
        item.path = "/media/" + relative_path;
        item.title = std::filesystem::path(relative_path).stem().string();
        return item;
    }

    EngineConfig test_config(const TempDir &dir)
    {
        EngineConfig config;
        config.data_dir = dir.path / "data";
        config.probe_timeout = 100ms;
        config.chunk_size = 4;
        config.auto_sync_interval = 1s;
        config.auto_sync_retry_delay = 1s;
        return config;
    }

    OperationSnapshot run_sync(SyncEngine &engine, const std::string &source, const std::vector<std::string> &targets)
    {
        const auto started = engine.start_sync(source, targets);
        assert(started.started());
        assert(engine.wait_until_idle(10s));
        const auto snapshot = engine.get_progress(started.operation_id);
        assert(snapshot.has_value());
        return *snapshot;
    }

    void test_registry_lifecycle()
    {
        TempDir dir("mediasync_registry_test");
        FakeTransport transport;
        transport.device("nas1");
        transport.set_online("mob1", false);
        const auto file = dir.path / "data" / "devices.json";

        {
            DeviceRegistry registry(file, transport, 100ms);
            auto nas = remote_device("nas1");
            nas.api_key = std::string("k1");
            assert(registry.register_device(nas));
            assert(!registry.register_device(remote_device("mob1", DeviceType::Mobile)));
            assert(!registry.contains("mob1"));
            assert(!registry.register_device(local_device("pc0", dir.path / "missing")));
            assert(registry.register_device(local_device("pc1", dir.path)));

            const auto found = registry.find("nas1");
            assert(found.has_value());
            assert(found->online);
            assert(found->last_seen.has_value());

            bool rejected = false;
            try
            {
                (void)registry.register_device(remote_device(""));
            }
            catch (const std::invalid_argument &)
            {
                rejected = true;
            }
            assert(rejected);
        }

        {
            DeviceRegistry reloaded(file, transport, 100ms);
            const auto devices = reloaded.list();
            assert(devices.size() == 2);
            assert(devices[0].id == "nas1");
            assert(devices[1].id == "pc1");
            assert(devices[0].api_key == std::optional<std::string>("k1"));
            assert(!devices[0].online);
            assert(devices[0].last_seen.has_value());

            transport.set_online("nas1", false);
            assert(!reloaded.probe("nas1"));
            assert(!reloaded.find("nas1")->online);
            assert(!reloaded.probe("ghost"));
            assert(reloaded.probe("pc1"));

            assert(reloaded.remove("pc1"));
            assert(!reloaded.remove("pc1"));
            assert(reloaded.size() == 1);

            // A directory in the staging file's place makes every write fail.
            auto staging = file;
            staging += ".tmp";
            std::filesystem::create_directories(staging);
            const auto write_fails = [](auto &&mutation)
            {
                try
                {
                    mutation();
                }
                catch (const std::runtime_error &)
                {
                    return true;
                }
                return false;
            };
            assert(write_fails([&] { (void)reloaded.register_device(local_device("pc2", dir.path)); }));
            assert(!reloaded.contains("pc2"));
            assert(write_fails([&] { (void)reloaded.remove("nas1"); }));
            assert(reloaded.contains("nas1"));
            assert(reloaded.size() == 1);
            std::filesystem::remove_all(staging);

            DeviceRegistry unchanged(file, transport, 100ms);
            assert(unchanged.size() == 1);
            assert(unchanged.contains("nas1"));
        }

        {
            std::ofstream out(file, std::ios::trunc);
            out << "{not json";
        }
        bool rejected = false;
        try
        {
            DeviceRegistry broken(file, transport, 100ms);
            (void)broken.size();
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_catalog_and_planner()
    {
        const auto now = std::chrono::system_clock::now();
        const Catalog nas("nas1", {make_item("d1", "a.mkv"), make_item("d2", "b.mkv"), make_item("d1", "a_again.mkv")},
                          now);
        assert(nas.size() == 2);
        assert(nas.contains("d1"));
        assert(nas.find("d1")->relative_path == "a.mkv");
        assert(nas.find("d9") == nullptr);

        const Catalog pc("pc1", {make_item("d1", "a_copy.mkv")}, now);
        const auto missing = planner::diff(nas, pc);
        assert(missing.size() == 1);
        assert(missing[0].digest == "d2");

        const std::vector<MediaItem> source = {make_item("d3", "c.mkv"), make_item("d2", "b.mkv"),
                                               make_item("d3", "c_dup.mkv"), make_item("d1", "a.mkv")};
        const std::vector<MediaItem> target = {make_item("d1", "x.mkv")};
        const auto ordered = planner::diff(source, target);
        assert(ordered.size() == 2);
        assert(ordered[0].digest == "d3");
        assert(ordered[0].relative_path == "c.mkv");
        assert(ordered[1].digest == "d2");
        assert(planner::diff(source, source).empty());

        FakeTransport transport;
        transport.add_item("nas1", "a.mkv", "alpha");
        transport.add_item("nas1", "b.mkv", "bravo");
        transport.add_item("nas2", "a.mkv", "alpha");
        ContentCatalog catalog(transport);
        assert(catalog.scan(remote_device("nas1"))->size() == 2);
        assert(catalog.scan(remote_device("nas2"))->size() == 1);
        assert(catalog.distinct_item_count() == 2);
        assert(catalog.latest("nas1") != nullptr);
        catalog.forget("nas1");
        assert(catalog.latest("nas1") == nullptr);
        assert(catalog.distinct_item_count() == 1);

        transport.set_online("nas2", false);
        bool rejected = false;
        try
        {
            (void)catalog.scan(remote_device("nas2"));
        }
        catch (const TransportError &ex)
        {
            rejected = ex.code() == ErrorCode::Unreachable;
        }
        assert(rejected);
    }

    void test_choose_destination()
    {
        TempDir dir("mediasync_destination_test");
        const auto relative = std::filesystem::path("b.mkv");
        assert(choose_destination(dir.path, relative, CollisionPolicy::Rename) == dir.path / "b.mkv");

        write_file(dir.path / "b.mkv", "first");
        assert(choose_destination(dir.path, relative, CollisionPolicy::Rename) == dir.path / "b (1).mkv");
        assert(!choose_destination(dir.path, relative, CollisionPolicy::Fail).has_value());

        write_file(dir.path / "b (1).mkv", "second");
        assert(choose_destination(dir.path, relative, CollisionPolicy::Rename) == dir.path / "b (2).mkv");
    }

    void test_executor_local()
    {
        TempDir dir("mediasync_executor_local");
        const auto src = dir.path / "src";
        const auto dst = dir.path / "dst";
        write_file(src / "shows" / "a.mkv", "alpha");
        write_file(src / "b.mkv", "bravo");
        write_file(dst / "b.mkv", "other");

        FakeTransport transport;
        const auto source = local_device("src", src);
        const auto target = local_device("dst", dst);
        TransferExecutor executor(transport, TransferOptions{.chunk_size = 2});
        const auto items = scan_media_root(src);
        assert(items.size() == 2);
        const auto &b = items[0];
        const auto &a = items[1];
        assert(a.relative_path == "shows/a.mkv");

        const auto copied = executor.transfer(source, target, a);
        assert(copied.ok());
        assert(copied.bytes_transferred == 5);
        assert(read_file(dst / "shows" / "a.mkv") == "alpha");

        const auto again = executor.transfer(source, target, a);
        assert(again.ok());
        assert(again.bytes_transferred == 0);
        assert(!std::filesystem::exists(dst / "shows" / "a (1).mkv"));

        const auto renamed = executor.transfer(source, target, b);
        assert(renamed.ok());
        assert(renamed.destination == (dst / "b (1).mkv").string());
        assert(read_file(dst / "b (1).mkv") == "bravo");
        assert(read_file(dst / "b.mkv") == "other");

        TransferExecutor strict(transport, TransferOptions{.chunk_size = 2, .collision_policy = CollisionPolicy::Fail});
        auto fresh = b;
        fresh.relative_path = "b.mkv";
        std::filesystem::remove(dst / "b (1).mkv");
        const auto refused = strict.transfer(source, target, fresh);
        assert(!refused.ok());
        assert(refused.error->code == ErrorCode::AlreadyExists);
        assert(read_file(dst / "b.mkv") == "other");

        auto tampered = b;
        tampered.digest = crypto::hash_bytes(test::bytes_of("something else"));
        const auto corrupt = executor.transfer(source, target, tampered);
        assert(!corrupt.ok());
        assert(corrupt.error->code == ErrorCode::IntegrityError);
        assert(!std::filesystem::exists(dst / "b (1).mkv"));
        assert(!std::filesystem::exists(dst / "b (1).mkv.part"));

        auto vanished = a;
        vanished.path = (src / "gone.mkv").string();
        const auto missing = executor.transfer(source, target, vanished);
        assert(!missing.ok());
        assert(missing.error->code == ErrorCode::NotFound);

        bool rejected = false;
        try
        {
            TransferExecutor invalid(transport, TransferOptions{.chunk_size = 0});
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_executor_remote()
    {
        TempDir dir("mediasync_executor_remote");
        const auto pc_root = dir.path / "pc";
        write_file(pc_root / "c.mkv", "charlie-local");

        FakeTransport transport;
        const auto item = transport.add_item("nas1", "movies/a.mkv", "alpha-remote-bytes");
        transport.device("mob1");
        const auto nas = remote_device("nas1");
        const auto mobile = remote_device("mob1", DeviceType::Mobile);
        const auto pc = local_device("pc1", pc_root);

        TransferExecutor executor(transport, TransferOptions{.chunk_size = 3});

        const auto downloaded = executor.transfer(nas, pc, item);
        assert(downloaded.ok());
        assert(downloaded.bytes_transferred == 18);
        assert(read_file(pc_root / "movies" / "a.mkv") == "alpha-remote-bytes");
        assert(!std::filesystem::exists(pc_root / "movies" / "a.mkv.part"));

        MediaItem local_c;
        for (const auto &candidate : scan_media_root(pc_root))
        {
            if (candidate.relative_path == "c.mkv")
            {
                local_c = candidate;
            }
        }
        assert(!local_c.digest.empty());
        const auto uploaded = executor.transfer(pc, nas, local_c);
        assert(uploaded.ok());
        assert(uploaded.bytes_transferred == 13);
        const auto nas_received = transport.received("nas1");
        assert(nas_received.size() == 1);
        assert(nas_received[0].relative_path == "c.mkv");
        assert(nas_received[0].digest == local_c.digest);

        const auto relayed = executor.transfer(nas, mobile, item);
        assert(relayed.ok());
        const auto mobile_received = transport.received("mob1");
        assert(mobile_received.size() == 1);
        assert(mobile_received[0].relative_path == "movies/a.mkv");

        TransferExecutor strict(transport, TransferOptions{.chunk_size = 3, .collision_policy = CollisionPolicy::Fail});
        const auto refused = strict.transfer(nas, mobile, item);
        assert(!refused.ok());
        assert(refused.error->code == ErrorCode::AlreadyExists);

        const auto renamed = executor.transfer(nas, mobile, item);
        assert(renamed.ok());
        assert(renamed.destination == "movies/a (1).mkv");

        transport.fail_download("nas1", item.digest);
        const auto failed = executor.transfer(nas, mobile, item);
        assert(!failed.ok());
        assert(failed.error->code == ErrorCode::IoError);

        transport.set_online("mob1", false);
        const auto unreachable = executor.transfer(pc, mobile, local_c);
        assert(!unreachable.ok());
        assert(unreachable.error->code == ErrorCode::Unreachable);
        executor.release_channels();
    }

    void test_sync_scenario()
    {
        TempDir dir("mediasync_scenario_test");
        const auto pc_root = dir.path / "Media";
        write_file(pc_root / "a_copy.mkv", "alpha");

        FakeTransport transport;
        transport.add_item("nas1", "a.mkv", "alpha");
        const auto b = transport.add_item("nas1", "b.mkv", "bravo");

        SyncEngine engine(test_config(dir), transport);
        assert(engine.add_device(remote_device("nas1")));
        assert(engine.add_device(local_device("pc1", pc_root)));

        const auto first = run_sync(engine, "nas1", {"pc1"});
        assert(first.status == SyncStatus::Idle);
        assert(first.finished);
        assert(first.processed_files == 1);
        assert(first.total_planned_files == 1);
        assert(first.transferred_files == 1);
        assert(first.progress == 100.0);
        assert(first.bytes_transferred == 5);
        assert(first.errors.empty());
        assert(first.planned.size() == 1);
        assert(first.planned[0].target_id == "pc1");
        assert(first.planned[0].item.digest == b.digest);
        assert(first.started_at.has_value());
        assert(first.finished_at.has_value());

        assert(read_file(pc_root / "b.mkv") == "bravo");
        assert(read_file(pc_root / "a_copy.mkv") == "alpha");
        assert(!std::filesystem::exists(pc_root / "a.mkv"));

        const auto status = engine.status();
        assert(status.status == SyncStatus::Idle);
        assert(status.device_count == 2);
        assert(status.online_devices == 2);
        assert(status.media_count == 2);
        assert(status.active_operations == 0);
        assert(status.stats.total_syncs == 1);
        assert(status.stats.successful_syncs == 1);
        assert(status.stats.files_transferred == 1);
        assert(status.stats.last_sync_time.has_value());

        const auto json = nlohmann::json(status);
        assert(json.at("is_syncing") == false);
        assert(json.at("stats").at("bytes_transferred") == 5);
        assert(nlohmann::json(first).at("operation_id") == first.id);

        const auto second = run_sync(engine, "nas1", {"pc1"});
        assert(second.status == SyncStatus::Idle);
        assert(second.total_planned_files == 0);
        assert(second.processed_files == 0);
        assert(second.progress == 100.0);

        assert(engine.list_operations().size() == 2);
        assert(engine.list_operations()[0].id == first.id);
        assert(engine.clear_history() == 2);
        assert(engine.list_operations().empty());
        assert(!engine.get_progress(first.id).has_value());
        assert(engine.status().stats.total_syncs == 2);
    }

    void test_partial_failure()
    {
        TempDir dir("mediasync_partial_test");
        const auto pc_root = dir.path / "pc";
        std::filesystem::create_directories(pc_root);

        FakeTransport transport;
        std::vector<MediaItem> items;
        for (int i = 1; i <= 5; ++i)
        {
            items.push_back(transport.add_item("nas1", "f" + std::to_string(i) + ".mkv", "file-" + std::to_string(i)));
        }
        transport.fail_download("nas1", items[2].digest);

        SyncEngine engine(test_config(dir), transport);
        assert(engine.add_device(remote_device("nas1")));
        assert(engine.add_device(local_device("pc1", pc_root)));

        std::ostringstream log;
        const auto previous_logger = spdlog::default_logger();
        auto capture = std::make_shared<spdlog::logger>("capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(log));
        capture->set_pattern("%l %v");
        capture->set_level(spdlog::level::info);
        spdlog::set_default_logger(capture);
        const auto result = run_sync(engine, "nas1", {"pc1"});
        spdlog::set_default_logger(previous_logger);

        const auto lines = log.str();
        assert(lines.find("info operation " + result.id + ": 'f1' -> ") != std::string::npos);
        assert(lines.find("error operation " + result.id + ": failed to sync 'f3'") != std::string::npos);
        assert(lines.find("warning") == std::string::npos);

        assert(result.status == SyncStatus::Idle);
        assert(result.processed_files == 5);
        assert(result.transferred_files == 4);
        assert(result.failed_files == 1);
        assert(result.errors.size() == 1);
        assert(result.errors[0].find("f3") != std::string::npos);
        assert(result.errors[0].find("io_error") != std::string::npos);
        assert(std::filesystem::exists(pc_root / "f4.mkv"));
        assert(std::filesystem::exists(pc_root / "f5.mkv"));
        assert(!std::filesystem::exists(pc_root / "f3.mkv"));

        const auto stats = engine.status().stats;
        assert(stats.successful_syncs == 1);
        assert(stats.files_failed == 1);
    }

    void test_offline_targets()
    {
        TempDir dir("mediasync_offline_test");
        const auto pc_root = dir.path / "pc";
        std::filesystem::create_directories(pc_root);

        FakeTransport transport;
        transport.add_item("nas1", "a.mkv", "alpha");
        transport.device("mob1");

        SyncEngine engine(test_config(dir), transport);
        assert(engine.add_device(remote_device("nas1")));
        assert(engine.add_device(remote_device("mob1", DeviceType::Mobile)));
        assert(engine.add_device(local_device("pc1", pc_root)));
        transport.set_online("mob1", false);

        const auto result = run_sync(engine, "nas1", {"mob1", "pc1"});
        assert(result.status == SyncStatus::Idle);
        assert(result.skipped_targets == std::vector<std::string>{"mob1"});
        assert(result.errors.empty());
        assert(result.transferred_files == 1);
        assert(!engine.find_device("mob1")->online);

        transport.set_online("nas1", false);
        const auto offline_source = run_sync(engine, "nas1", {"pc1"});
        assert(offline_source.status == SyncStatus::Error);
        assert(!offline_source.errors.empty());
        assert(engine.status().stats.failed_syncs == 1);
    }

    void test_start_validation()
    {
        TempDir dir("mediasync_start_test");
        FakeTransport transport;
        transport.device("nas1");

        SyncEngine engine(test_config(dir), transport);
        assert(engine.add_device(remote_device("nas1")));
        assert(engine.add_device(local_device("pc1", dir.path)));

        assert(engine.start_sync("ghost", {"pc1"}).status == StartStatus::UnknownSource);
        assert(engine.start_sync("nas1", {"ghost"}).status == StartStatus::UnknownTarget);
        assert(engine.start_sync("nas1", {}).status == StartStatus::NoTargets);
        assert(engine.list_operations().empty());

        const auto result = run_sync(engine, "nas1", {"pc1", "pc1"});
        assert(result.target_ids.size() == 1);
        assert(engine.list_operations().size() == 1);

        bool rejected = false;
        try
        {
            (void)engine.scan_device("ghost");
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_single_active_operation()
    {
        TempDir dir("mediasync_serial_test");
        const auto pc_root = dir.path / "pc";
        std::filesystem::create_directories(pc_root);

        FakeTransport transport;
        transport.add_item("nas1", "a.mkv", "alpha");
        transport.add_item("nas1", "b.mkv", "bravo");

        SyncEngine engine(test_config(dir), transport);
        assert(engine.add_device(remote_device("nas1")));
        assert(engine.add_device(local_device("pc1", pc_root)));

        transport.close_gate();
        const auto first = engine.start_sync("nas1", {"pc1"});
        assert(first.started());

        const auto second = engine.start_sync("nas1", {"pc1"});
        assert(second.status == StartStatus::AlreadyRunning);
        assert(second.operation_id == first.operation_id);
        assert(engine.list_operations().size() == 1);
        assert(engine.status().active_operation_id == first.operation_id);
        assert(!engine.wait_until_idle(50ms));

        transport.open_gate();
        assert(engine.wait_until_idle(10s));
        assert(engine.status().active_operations == 0);
        assert(engine.get_progress(first.operation_id)->transferred_files == 2);
        assert(engine.start_sync("nas1", {"pc1"}).started());
        assert(engine.wait_until_idle(10s));
    }

    void test_progress_is_monotonic()
    {
        TempDir dir("mediasync_progress_test");
        const auto pc_root = dir.path / "pc";
        std::filesystem::create_directories(pc_root);

        FakeTransport transport;
        for (int i = 0; i < 4; ++i)
        {
            transport.add_item("nas1", "clip" + std::to_string(i) + ".mp4", std::string(10 + i, 'x'));
        }

        SyncEngine engine(test_config(dir), transport);
        assert(engine.add_device(remote_device("nas1")));
        assert(engine.add_device(local_device("pc1", pc_root)));

        std::mutex seen_mutex;
        std::vector<OperationSnapshot> seen;
        engine.set_progress_observer([&](const OperationSnapshot &snapshot)
                                     {
            std::lock_guard lock(seen_mutex);
            seen.push_back(snapshot); });

        const auto result = run_sync(engine, "nas1", {"pc1"});
        assert(result.transferred_files == 4);

        std::lock_guard lock(seen_mutex);
        assert(seen.size() >= 5);
        double last = 0.0;
        for (const auto &snapshot : seen)
        {
            assert(snapshot.progress >= last);
            assert(snapshot.progress <= 100.0);
            assert(snapshot.total_planned_files == 4);
            last = snapshot.progress;
        }
        assert(seen.back().finished);
        assert(seen.back().progress == 100.0);
    }

    void test_pause_resume_cancel()
    {
        TempDir dir("mediasync_pause_test");
        const auto pc_root = dir.path / "pc";
        std::filesystem::create_directories(pc_root);

        FakeTransport transport;
        transport.add_item("nas1", "a.mkv", "alpha");
        transport.add_item("nas1", "b.mkv", "bravo");
        transport.add_item("nas1", "c.mkv", "charlie");

        SyncEngine engine(test_config(dir), transport);
        assert(engine.add_device(remote_device("nas1")));
        assert(engine.add_device(local_device("pc1", pc_root)));
        assert(!engine.pause());

        transport.close_gate();
        const auto started = engine.start_sync("nas1", {"pc1"});
        assert(started.started());
        assert(engine.pause());
        assert(!engine.pause());
        transport.open_gate();

        const auto id = started.operation_id;
        assert(wait_for([&]
                        { return engine.get_progress(id)->status == SyncStatus::Paused; }));
        const auto paused = *engine.get_progress(id);
        assert(paused.processed_files <= 1);
        assert(engine.status().status == SyncStatus::Paused);
        std::this_thread::sleep_for(50ms);
        assert(engine.get_progress(id)->processed_files == paused.processed_files);

        assert(engine.resume());
        assert(engine.wait_until_idle(10s));
        const auto resumed = *engine.get_progress(id);
        assert(resumed.status == SyncStatus::Idle);
        assert(resumed.transferred_files == 3);

        transport.add_item("nas1", "d.mkv", "delta");
        transport.add_item("nas1", "e.mkv", "echo");
        transport.close_gate();
        const auto cancelled_start = engine.start_sync("nas1", {"pc1"});
        assert(cancelled_start.started());
        assert(engine.pause());
        transport.open_gate();
        assert(wait_for([&]
                        { return engine.get_progress(cancelled_start.operation_id)->status == SyncStatus::Paused; }));
        assert(engine.cancel());
        assert(engine.wait_until_idle(10s));
        const auto cancelled = *engine.get_progress(cancelled_start.operation_id);
        assert(cancelled.status == SyncStatus::Error);
        assert(cancelled.errors.back() == "cancelled");
        assert(cancelled.transferred_files < 2);
        assert(!engine.cancel());
        assert(!engine.resume());
    }

    void test_removal_during_operation()
    {
        TempDir dir("mediasync_removal_test");
        const auto first_root = dir.path / "pc1";
        const auto second_root = dir.path / "pc2";
        const auto third_root = dir.path / "pc3";
        std::filesystem::create_directories(first_root);
        std::filesystem::create_directories(second_root);
        std::filesystem::create_directories(third_root);

        FakeTransport transport;
        transport.add_item("nas1", "a.mkv", "alpha");
        transport.add_item("nas1", "b.mkv", "bravo");

        SyncEngine engine(test_config(dir), transport);
        assert(engine.add_device(remote_device("nas1")));
        assert(engine.add_device(local_device("pc1", first_root)));
        assert(engine.add_device(local_device("pc2", second_root)));
        assert(engine.add_device(local_device("pc3", third_root)));

        transport.close_gate();
        const auto started = engine.start_sync("nas1", {"pc1", "pc2"});
        assert(engine.pause());
        transport.open_gate();
        assert(wait_for([&]
                        { return engine.get_progress(started.operation_id)->status == SyncStatus::Paused; }));
        assert(engine.remove_device("pc1"));
        assert(engine.resume());
        assert(engine.wait_until_idle(10s));

        const auto result = *engine.get_progress(started.operation_id);
        assert(result.status == SyncStatus::Idle);
        assert(result.errors.size() == 1);
        assert(result.skipped_targets == std::vector<std::string>{"pc1"});
        assert(std::filesystem::exists(second_root / "a.mkv"));
        assert(std::filesystem::exists(second_root / "b.mkv"));

        transport.close_gate();
        const auto doomed = engine.start_sync("nas1", {"pc3"});
        assert(engine.pause());
        transport.open_gate();
        assert(wait_for([&]
                        { return engine.get_progress(doomed.operation_id)->status == SyncStatus::Paused; }));
        assert(engine.remove_device("nas1"));
        assert(engine.resume());
        assert(engine.wait_until_idle(10s));
        const auto failed = *engine.get_progress(doomed.operation_id);
        assert(failed.status == SyncStatus::Error);
        assert(failed.errors.back().find("removed") != std::string::npos);
    }

    void test_auto_sync()
    {
        TempDir dir("mediasync_auto_test");
        const auto pc_root = dir.path / "pc";
        std::filesystem::create_directories(pc_root);

        FakeTransport transport;
        transport.add_item("nas1", "a.mkv", "alpha");

        SyncEngine engine(test_config(dir), transport);
        assert(engine.add_device(local_device("pc1", pc_root)));
        assert(engine.add_device(remote_device("nas1")));

        engine.start_auto_sync();
        assert(engine.auto_sync_enabled());
        assert(wait_for([&]
                        { return !engine.list_operations().empty(); }));
        engine.stop_auto_sync();
        assert(!engine.auto_sync_enabled());
        assert(engine.wait_until_idle(10s));

        const auto operations = engine.list_operations();
        assert(operations[0].source_id == "nas1");
        assert(operations[0].target_ids == std::vector<std::string>{"pc1"});
        assert(std::filesystem::exists(pc_root / "a.mkv"));
    }

    void test_shell()
    {
        TempDir dir("mediasync_shell_test");
        const auto first_root = dir.path / "a";
        const auto second_root = dir.path / "b";
        write_file(first_root / "x.mkv", "x-ray");
        std::filesystem::create_directories(second_root);

        FakeTransport transport;
        SyncEngine engine(test_config(dir), transport);
        std::istringstream in;
        std::ostringstream out;
        Shell shell(engine, in, out);

        const auto run = [&](const std::string &line)
        {
            out.str("");
            out.clear();
            assert(shell.execute_line(line));
            return out.str();
        };
        const auto starts_with = [](const std::string &text, const std::string &prefix)
        { return text.rfind(prefix, 0) == 0; };

        assert(run("ADD pcA Alpha workstation - 0 " + first_root.string()) == "OK\n");
        assert(run("add pcB Beta pc - 0 " + second_root.string()) == "OK\n");
        assert(starts_with(run("ADD bad Bad spaceship - 0 /tmp"), "ERROR: invalid_payload"));
        assert(starts_with(run("ADD ghost Ghost nas host.invalid 80 -"), "ERROR: unreachable"));
        assert(starts_with(run("ADD short"), "ERROR: invalid_payload"));
        assert(run("ADD pcC Gamma workstation - - " + second_root.string()) == "OK\n");
        assert(engine.find_device("pcC")->port == 0);
        assert(run("REMOVE pcC") == "OK\n");
        assert(starts_with(run("ADD far Far nas fake.local 70000 -"), "ERROR: invalid_payload"));
        assert(starts_with(run("ADD far Far nas fake.local -1 -"), "ERROR: invalid_payload"));
        assert(starts_with(run("ADD far Far nas fake.local 80x -"), "ERROR: invalid_payload"));
        assert(!engine.find_device("far").has_value());

        const auto listing = run("DEVICES");
        assert(listing.find("pcA") != std::string::npos);
        assert(listing.find("online") != std::string::npos);

        assert(run("SCAN pcA").find("1 item(s)") != std::string::npos);

        const auto started = run("SYNC pcA pcB");
        assert(starts_with(started, "OK\n"));
        const auto operation_id = started.substr(3, started.size() - 4);
        assert(starts_with(operation_id, "sync_"));
        assert(run("WAIT 10") == "OK\n");
        assert(starts_with(run("WAIT -5"), "ERROR: invalid_payload"));
        assert(starts_with(run("WAIT soon"), "ERROR: invalid_payload"));
        assert(starts_with(run("WAIT 99999999999"), "ERROR: invalid_payload"));
        assert(run("PROGRESS " + operation_id).find("\"status\": \"idle\"") != std::string::npos);
        assert(run("OPS").find(operation_id) != std::string::npos);
        assert(std::filesystem::exists(second_root / "x.mkv"));

        assert(starts_with(run("SYNC pcA ghost"), "ERROR: not_found"));
        assert(starts_with(run("PROGRESS nope"), "ERROR: not_found"));
        assert(starts_with(run("PAUSE"), "ERROR: conflict"));
        assert(starts_with(run("FROB"), "ERROR: unsupported_command"));
        assert(run("STATUS").find("\"device_count\": 2") != std::string::npos);
        assert(starts_with(run("CLEAR"), "OK\n1 operation(s) cleared"));
        assert(run("REMOVE pcB") == "OK\n");
        assert(starts_with(run("REMOVE pcB"), "ERROR: not_found"));
        assert(!shell.execute_line("exit"));

        std::istringstream script("DEVICES\nQUIT\nDEVICES\n");
        std::ostringstream transcript;
        Shell scripted(engine, script, transcript);
        assert(scripted.run() == 0);
        assert(transcript.str().find("mediasync> ") != std::string::npos);
        assert(transcript.str().find("pcA") != std::string::npos);
    }

    void test_parse_arguments()
    {
        std::vector<std::string> args = {"mediasync", "--data-dir", "/tmp/ms", "--probe-timeout", "3",
                                         "--chunk-size", "4096", "--auto-sync", "600", "--on-collision",
                                         "fail", "--verbose"};
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        const auto config = parse_arguments(static_cast<int>(argv.size()), argv.data());
        assert(config.engine.data_dir == "/tmp/ms");
        assert(config.engine.registry_file() == std::filesystem::path("/tmp/ms/devices.json"));
        assert(config.engine.probe_timeout == 3s);
        assert(config.engine.chunk_size == 4096);
        assert(config.engine.auto_sync_interval == 600s);
        assert(config.auto_sync);
        assert(config.verbose);
        assert(config.engine.collision_policy == CollisionPolicy::Fail);
        assert(!config.log_file.has_value());

        std::vector<std::string> bad = {"mediasync", "--on-collision", "overwrite"};
        std::vector<char *> bad_argv;
        for (auto &arg : bad)
        {
            bad_argv.push_back(arg.data());
        }
        bool rejected = false;
        try
        {
            (void)parse_arguments(static_cast<int>(bad_argv.size()), bad_argv.data());
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);

        assert(parse_port("8080") == std::optional<std::uint16_t>(8080));
        assert(parse_port("-") == std::optional<std::uint16_t>(0));
        assert(parse_port("65535") == std::optional<std::uint16_t>(65535));
        assert(!parse_port("65536").has_value());
        assert(!parse_port("").has_value());
        assert(parse_unsigned("0") == std::optional<std::uint64_t>(0));
        assert(!parse_unsigned("-5").has_value());
        assert(!parse_unsigned("+5").has_value());
        assert(!parse_unsigned("99999999999999999999").has_value());

        std::vector<std::string> negative = {"mediasync", "--chunk-size", "-1"};
        std::vector<char *> negative_argv;
        for (auto &arg : negative)
        {
            negative_argv.push_back(arg.data());
        }
        rejected = false;
        try
        {
            (void)parse_arguments(static_cast<int>(negative_argv.size()), negative_argv.data());
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);

        const EngineConfig defaults;
        assert(defaults.chunk_size == 1024 * 1024);
        assert(defaults.collision_policy == CollisionPolicy::Rename);
        assert(defaults.auto_sync_interval == 3600s);
    }

} // namespace

void run_engine_component_tests()
{
    test_registry_lifecycle();
    test_catalog_and_planner();
    test_choose_destination();
    test_executor_local();
    test_executor_remote();
    test_sync_scenario();
    test_partial_failure();
    test_offline_targets();
    test_start_validation();
    test_single_active_operation();
    test_progress_is_monotonic();
    test_pause_resume_cancel();
    test_removal_during_operation();
    test_auto_sync();
    test_shell();
    test_parse_arguments();
}
