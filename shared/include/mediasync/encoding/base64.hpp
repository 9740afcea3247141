#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediasync::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Returns std::nullopt for malformed input. Whitespace is ignored.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace mediasync::encoding
