#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mediasync/device.hpp"
#include "mediasync/engine/device_transport.hpp"

namespace mediasync::engine
{

    // Known devices and their liveness, persisted to a JSON registry file.
    // Callers only ever receive copies of the records.
    class DeviceRegistry
    {
    public:
        DeviceRegistry(std::filesystem::path registry_file, DeviceTransport &transport,
                       std::chrono::milliseconds probe_timeout);

        // Probes the device before accepting it. Returns false when the probe
        // fails; throws std::invalid_argument for malformed records.
        bool register_device(Device device);
        bool remove(const std::string &device_id);

        // Re-checks liveness and updates online/last_seen. False for unknown ids.
        bool probe(const std::string &device_id);

        std::optional<Device> find(const std::string &device_id) const;
        bool contains(const std::string &device_id) const;
        std::vector<Device> list() const;
        std::size_t size() const;

        const std::filesystem::path &registry_file() const noexcept { return registry_file_; }

    private:
        bool check_liveness(const Device &device);
        void load();
        // Writes devices to the registry file; throws if it cannot.
        void persist(const std::vector<Device> &devices) const;

        std::filesystem::path registry_file_;
        DeviceTransport &transport_;
        std::chrono::milliseconds probe_timeout_;

        mutable std::mutex mutex_;
        std::vector<Device> devices_;
    };

} // namespace mediasync::engine
