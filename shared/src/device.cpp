#include "mediasync/device.hpp"

#include <array>
#include <stdexcept>

namespace mediasync
{

    namespace
    {
        struct DeviceTypeMapping
        {
            DeviceType type;
            std::string_view label;
        };

        constexpr std::array<DeviceTypeMapping, 4> kDeviceTypeMappings{{
            {DeviceType::Nas, "nas"},
            {DeviceType::Workstation, "workstation"},
            {DeviceType::Mobile, "mobile"},
            {DeviceType::Cloud, "cloud"},
        }};
    } // namespace

    std::string_view to_string(DeviceType type) noexcept
    {
        for (const auto &mapping : kDeviceTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<DeviceType> device_type_from_string(std::string_view value) noexcept
    {
        if (value == "pc")
        {
            return DeviceType::Workstation;
        }
        for (const auto &mapping : kDeviceTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    bool is_directly_managed(const Device &device) noexcept
    {
        return device.type == DeviceType::Workstation;
    }

    void validate(const Device &device)
    {
        if (device.id.empty())
        {
            throw std::invalid_argument("device requires an identifier");
        }
        if (device.name.empty())
        {
            throw std::invalid_argument("device " + device.id + " requires a display name");
        }
        if (is_directly_managed(device))
        {
            if (device.storage_path.empty())
            {
                throw std::invalid_argument("device " + device.id + " requires a storage path");
            }
        }
        else
        {
            if (device.host.empty())
            {
                throw std::invalid_argument("remote device " + device.id + " requires a host");
            }
            if (device.port == 0)
            {
                throw std::invalid_argument("remote device " + device.id + " requires a port");
            }
        }
    }

    void to_json(nlohmann::json &json, const Device &device)
    {
        json = {
            {"device_id", device.id},
            {"name", device.name},
            {"type", to_string(device.type)},
            {"host", device.host},
            {"port", device.port},
            {"protocol", device.protocol},
            {"last_seen", optional_time_to_json(device.last_seen)},
            {"is_online", device.online},
            {"storage_path", device.storage_path},
        };
    }

    void from_json(const nlohmann::json &json, Device &device)
    {
        device.id = json.at("device_id").get<std::string>();
        device.name = json.value("name", device.id);
        const auto type_label = json.at("type").get<std::string>();
        const auto type = device_type_from_string(type_label);
        if (!type)
        {
            throw std::invalid_argument("Unknown device type: " + type_label);
        }
        device.type = *type;
        device.host = json.value("host", std::string{});
        device.port = json.value("port", std::uint16_t{0});
        device.protocol = json.value("protocol", std::string(kDefaultProtocol));
        device.api_key.reset();
        device.last_seen = optional_time_from_json(json.value("last_seen", nlohmann::json()));
        device.online = json.value("is_online", false);
        device.storage_path = json.value("storage_path", std::string{});
        validate(device);
    }

} // namespace mediasync
