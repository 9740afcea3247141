/**
 * MediaSync - Length-prefixed JSON framing.
 *
 * Frame layout: 4-byte big-endian payload length followed by the JSON text.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace mediasync::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    inline constexpr std::uint32_t kMaxFrameSize = 64u * 1024u * 1024u;

    class FrameError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Throws FrameError when the announced size exceeds kMaxFrameSize.
    std::uint32_t decode_frame_header(const std::array<std::uint8_t, kFrameHeaderSize> &header);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace mediasync::protocol
