#include "mediasync/crypto.hpp"

#include <cstring>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace mediasync::crypto
{

    namespace
    {

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result(data.size() * 2, '0');
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                result[2 * i] = kHexDigits[(data[i] >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[data[i] & 0x0F];
            }
            return result;
        }

        void ensure_initialized_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium initialization failed");
                } });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string hash_password(std::string_view password)
    {
        ensure_initialized_once();
        std::string hash(crypto_pwhash_STRBYTES, '\0');
        if (crypto_pwhash_str(hash.data(), password.data(), password.size(), crypto_pwhash_OPSLIMIT_INTERACTIVE,
                              crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0)
        {
            throw std::runtime_error("crypto_pwhash_str failed");
        }
        hash.resize(std::strlen(hash.c_str()));
        return hash;
    }

    bool verify_password(std::string_view password, std::string_view password_hash)
    {
        ensure_initialized_once();
        const std::string hash_string(password_hash);
        return crypto_pwhash_str_verify(hash_string.c_str(), password.data(), password.size()) == 0;
    }

    StreamingDigest::StreamingDigest()
    {
        ensure_initialized_once();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    void StreamingDigest::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("digest already finalised");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_generichash_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string StreamingDigest::finish()
    {
        if (finished_)
        {
            throw std::logic_error("digest already finalised");
        }
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        finished_ = true;
        return to_hex(digest);
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        StreamingDigest digest;
        digest.update(data);
        return digest.finish();
    }

    std::string hash_stream(std::istream &input)
    {
        StreamingDigest digest;
        std::vector<char> buffer(kDigestBufferSize);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                digest.update(std::as_bytes(std::span(buffer.data(), read_count)));
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("read error while hashing stream");
        }
        return digest.finish();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

} // namespace mediasync::crypto
