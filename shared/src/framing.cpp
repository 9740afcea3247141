#include "mediasync/framing.hpp"

#include <algorithm>
#include <string>

namespace mediasync::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t, kFrameHeaderSize> bytes)
        {
            return (static_cast<std::uint32_t>(bytes[0]) << 24) | (static_cast<std::uint32_t>(bytes[1]) << 16) |
                   (static_cast<std::uint32_t>(bytes[2]) << 8) | static_cast<std::uint32_t>(bytes[3]);
        }

        void check_frame_size(std::uint64_t size)
        {
            if (size > kMaxFrameSize)
            {
                throw FrameError("frame of " + std::to_string(size) + " bytes exceeds limit of " +
                                 std::to_string(kMaxFrameSize));
            }
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        check_frame_size(text.size());
        const auto size = static_cast<std::uint32_t>(text.size());
        std::vector<std::uint8_t> frame;
        frame.reserve(kFrameHeaderSize + text.size());
        frame.push_back(static_cast<std::uint8_t>((size >> 24) & 0xFF));
        frame.push_back(static_cast<std::uint8_t>((size >> 16) & 0xFF));
        frame.push_back(static_cast<std::uint8_t>((size >> 8) & 0xFF));
        frame.push_back(static_cast<std::uint8_t>(size & 0xFF));
        frame.insert(frame.end(), text.begin(), text.end());
        return frame;
    }

    std::uint32_t decode_frame_header(const std::array<std::uint8_t, kFrameHeaderSize> &header)
    {
        const auto size = read_u32_be(header);
        check_frame_size(size);
        return size;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = read_u32_be(buffer.first<kFrameHeaderSize>());
        check_frame_size(payload_size);
        if (buffer.size() - kFrameHeaderSize < payload_size)
        {
            return std::nullopt;
        }
        const auto payload = buffer.subspan(kFrameHeaderSize, payload_size);
        return DecodedFrame{
            .message = nlohmann::json::parse(payload.begin(), payload.end()),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
    }

} // namespace mediasync::protocol
