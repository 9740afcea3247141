#include "mediasync/engine/device_registry.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mediasync::engine
{

    DeviceRegistry::DeviceRegistry(std::filesystem::path registry_file, DeviceTransport &transport,
                                   std::chrono::milliseconds probe_timeout)
        : registry_file_(std::move(registry_file)),
          transport_(transport),
          probe_timeout_(probe_timeout)
    {
        load();
    }

    bool DeviceRegistry::check_liveness(const Device &device)
    {
        if (is_directly_managed(device))
        {
            std::error_code ec;
            return std::filesystem::is_directory(device.storage_path, ec);
        }
        return transport_.probe(device, probe_timeout_);
    }

    bool DeviceRegistry::register_device(Device device)
    {
        validate(device);

        if (!check_liveness(device))
        {
            spdlog::warn("device {} ({}) failed its registration probe", device.id, device.name);
            return false;
        }
        device.online = true;
        device.last_seen = std::chrono::system_clock::now();

        std::lock_guard lock(mutex_);
        auto updated = devices_;
        auto it = std::find_if(updated.begin(), updated.end(),
                               [&](const Device &existing) { return existing.id == device.id; });
        const bool replaced = it != updated.end();
        const auto device_id = device.id;
        const auto description = std::string(to_string(device.type)) + " device " + device.id + " (" + device.name + ")";
        if (replaced)
        {
            *it = std::move(device);
        }
        else
        {
            updated.push_back(std::move(device));
        }
        // Memory only changes once the file holds the new set.
        persist(updated);
        devices_ = std::move(updated);
        if (replaced)
        {
            spdlog::info("device {} re-registered, replacing previous record", device_id);
        }
        else
        {
            spdlog::info("registered {}", description);
        }
        return true;
    }

    bool DeviceRegistry::remove(const std::string &device_id)
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(devices_.begin(), devices_.end(),
                               [&](const Device &existing) { return existing.id == device_id; });
        if (it == devices_.end())
        {
            return false;
        }
        auto updated = devices_;
        updated.erase(updated.begin() + (it - devices_.begin()));
        persist(updated);
        devices_ = std::move(updated);
        spdlog::info("removed device {}", device_id);
        return true;
    }

    bool DeviceRegistry::probe(const std::string &device_id)
    {
        auto device = find(device_id);
        if (!device)
        {
            return false;
        }

        // The probe may block for the full timeout; it runs unlocked against a copy.
        const bool online = check_liveness(*device);

        std::lock_guard lock(mutex_);
        auto it = std::find_if(devices_.begin(), devices_.end(),
                               [&](const Device &existing) { return existing.id == device_id; });
        if (it == devices_.end())
        {
            return false;
        }
        if (it->online != online)
        {
            spdlog::info("device {} is now {}", device_id, online ? "online" : "offline");
        }
        it->online = online;
        if (online)
        {
            it->last_seen = std::chrono::system_clock::now();
        }
        return online;
    }

    std::optional<Device> DeviceRegistry::find(const std::string &device_id) const
    {
        std::lock_guard lock(mutex_);
        for (const auto &device : devices_)
        {
            if (device.id == device_id)
            {
                return device;
            }
        }
        return std::nullopt;
    }

    bool DeviceRegistry::contains(const std::string &device_id) const
    {
        return find(device_id).has_value();
    }

    std::vector<Device> DeviceRegistry::list() const
    {
        std::lock_guard lock(mutex_);
        return devices_;
    }

    std::size_t DeviceRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return devices_.size();
    }

    void DeviceRegistry::load()
    {
        std::error_code ec;
        if (!std::filesystem::exists(registry_file_, ec))
        {
            return;
        }
        std::ifstream in(registry_file_);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open device registry " + registry_file_.string());
        }

        nlohmann::ordered_json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Corrupt device registry " + registry_file_.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw std::runtime_error("Device registry " + registry_file_.string() + " is not a JSON object");
        }

        for (const auto &[key, value] : json.items())
        {
            try
            {
                auto device = nlohmann::json::parse(value.dump()).get<Device>();
                if (device.id.empty())
                {
                    device.id = key;
                }
                if (const auto it = value.find("api_key"); it != value.end() && it->is_string())
                {
                    device.api_key = it->get<std::string>();
                }
                // Liveness from a previous run is stale until the next probe.
                device.online = false;
                validate(device);
                devices_.push_back(std::move(device));
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("skipping registry entry '{}': {}", key, ex.what());
            }
        }
        spdlog::info("loaded {} device(s) from {}", devices_.size(), registry_file_.string());
    }

    void DeviceRegistry::persist(const std::vector<Device> &devices) const
    {
        nlohmann::ordered_json json = nlohmann::ordered_json::object();
        for (const auto &device : devices)
        {
            auto entry = nlohmann::ordered_json::parse(nlohmann::json(device).dump());
            // The registry file is the only place the credential is written.
            if (device.api_key)
            {
                entry["api_key"] = *device.api_key;
            }
            json[device.id] = std::move(entry);
        }

        if (registry_file_.has_parent_path())
        {
            std::filesystem::create_directories(registry_file_.parent_path());
        }
        auto staging = registry_file_;
        staging += ".tmp";
        {
            std::ofstream out(staging, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot write device registry " + staging.string());
            }
            out << json.dump(2);
        }
        std::filesystem::rename(staging, registry_file_);
    }

} // namespace mediasync::engine
