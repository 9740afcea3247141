#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mediasync
{

    using Timestamp = std::chrono::system_clock::time_point;

    // UTC, second precision: 2024-01-01T20:00:00Z
    std::string format_iso8601(Timestamp time);

    // Accepts an optional fractional part and an optional 'Z' or +HH:MM/-HH:MM
    // suffix; a value without zone designator is read as UTC.
    std::optional<Timestamp> parse_iso8601(std::string_view text);

    Timestamp from_file_time(std::filesystem::file_time_type time);

    std::uint64_t to_unix_seconds(Timestamp time);

    // JSON null <-> std::nullopt
    nlohmann::json optional_time_to_json(const std::optional<Timestamp> &time);
    std::optional<Timestamp> optional_time_from_json(const nlohmann::json &json);

} // namespace mediasync
