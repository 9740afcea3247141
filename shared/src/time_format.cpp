#include "mediasync/time_format.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mediasync
{

    std::string format_iso8601(Timestamp time)
    {
        const auto seconds = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::optional<Timestamp> parse_iso8601(std::string_view text)
    {
        if (text.size() < 19)
        {
            return std::nullopt;
        }
        std::tm parsed{};
        std::istringstream iss(std::string(text.substr(0, 19)));
        iss >> std::get_time(&parsed, "%Y-%m-%dT%H:%M:%S");
        if (iss.fail())
        {
            return std::nullopt;
        }

        auto rest = text.substr(19);
        if (!rest.empty() && rest.front() == '.')
        {
            std::size_t digits = 1;
            while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits])))
            {
                ++digits;
            }
            rest.remove_prefix(digits);
        }

        long offset_seconds = 0;
        if (rest == "Z" || rest.empty())
        {
            offset_seconds = 0;
        }
        else if (rest.size() == 6 && (rest[0] == '+' || rest[0] == '-') && rest[3] == ':')
        {
            const auto field = [&](std::size_t pos) -> int
            {
                if (!std::isdigit(static_cast<unsigned char>(rest[pos])) ||
                    !std::isdigit(static_cast<unsigned char>(rest[pos + 1])))
                {
                    return -1;
                }
                return (rest[pos] - '0') * 10 + (rest[pos + 1] - '0');
            };
            const int hours = field(1);
            const int minutes = field(4);
            if (hours < 0 || minutes < 0)
            {
                return std::nullopt;
            }
            offset_seconds = (hours * 3600L + minutes * 60L) * (rest[0] == '-' ? -1 : 1);
        }
        else
        {
            return std::nullopt;
        }

        const auto epoch_seconds = timegm(&parsed);
        if (epoch_seconds == static_cast<std::time_t>(-1))
        {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(epoch_seconds - offset_seconds);
    }

    Timestamp from_file_time(std::filesystem::file_time_type time)
    {
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    }

    std::uint64_t to_unix_seconds(Timestamp time)
    {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        return seconds < 0 ? 0 : static_cast<std::uint64_t>(seconds);
    }

    nlohmann::json optional_time_to_json(const std::optional<Timestamp> &time)
    {
        if (!time)
        {
            return nullptr;
        }
        return format_iso8601(*time);
    }

    std::optional<Timestamp> optional_time_from_json(const nlohmann::json &json)
    {
        if (json.is_null())
        {
            return std::nullopt;
        }
        const auto text = json.get<std::string>();
        auto parsed = parse_iso8601(text);
        if (!parsed)
        {
            throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
        }
        return parsed;
    }

} // namespace mediasync
