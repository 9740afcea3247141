/**
 * MediaSync - Content digests and key hashing built on libsodium.
 *
 * A media item's identity is the BLAKE2b (crypto_generichash) digest of its
 * bytes, rendered as lowercase hex. Files are always digested through a fixed
 * size buffer so memory use does not depend on file size.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

#include <sodium.h>

namespace mediasync::crypto
{

    inline constexpr std::size_t kDigestBufferSize = 64 * 1024;

    void ensure_sodium_init();

    std::string hash_password(std::string_view password);

    bool verify_password(std::string_view password, std::string_view password_hash);

    // Incremental digest for data that arrives in pieces (chunked transfers).
    class StreamingDigest
    {
    public:
        StreamingDigest();

        void update(std::span<const std::byte> data);

        // Finalises the state; further updates are rejected.
        std::string finish();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

} // namespace mediasync::crypto
