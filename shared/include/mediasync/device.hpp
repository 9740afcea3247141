/**
 * MediaSync - Device model.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mediasync/time_format.hpp"

namespace mediasync
{

    enum class DeviceType : std::uint8_t
    {
        Nas,
        Workstation,
        Mobile,
        Cloud
    };

    std::string_view to_string(DeviceType type) noexcept;

    // Accepts the legacy label "pc" for workstations.
    std::optional<DeviceType> device_type_from_string(std::string_view value) noexcept;

    inline constexpr std::string_view kDefaultProtocol = "mediasync";

    struct Device
    {
        std::string id;
        std::string name;
        DeviceType type{DeviceType::Nas};
        std::string host;
        std::uint16_t port{};
        std::string protocol{kDefaultProtocol};
        std::optional<std::string> api_key{};
        std::string storage_path;
        std::optional<Timestamp> last_seen{};
        bool online{false};
    };

    // Workstations are read and written through the local filesystem; every
    // other class is reached through the remote transport.
    bool is_directly_managed(const Device &device) noexcept;

    // Throws std::invalid_argument for a record that cannot be used.
    void validate(const Device &device);

    // The access credential is never serialized.
    void to_json(nlohmann::json &json, const Device &device);
    void from_json(const nlohmann::json &json, Device &device);

} // namespace mediasync
