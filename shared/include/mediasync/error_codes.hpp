/**
 * MediaSync - Error codes shared by the engine, the agent and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace mediasync
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        PermissionDenied = 3,
        NotFound = 4,
        AlreadyExists = 5,
        AuthenticationRequired = 6,
        AuthenticationFailed = 7,
        Conflict = 8,
        Busy = 9,
        Unsupported = 10,
        Timeout = 11,
        Unreachable = 12,
        IoError = 13,
        IntegrityError = 14,
        InternalError = 15
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace mediasync
