#include "keyring/crypto.hpp"
#include <cctype>
#include <sodium.h>
#include <stdexcept>

namespace keyring::crypto
{

    // Initialize libsodium on first use
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // SecureRandom
    // ============================================================================

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    // ============================================================================
    // Uuid
    // ============================================================================

    std::string Uuid::generate()
    {
        auto raw = SecureRandom::generate_bytes(16);

        // version 4, variant 10xx
        raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40);
        raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80);

        static constexpr char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < raw.size(); ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
                out.push_back('-');
            out.push_back(hex[raw[i] >> 4]);
            out.push_back(hex[raw[i] & 0x0F]);
        }
        return out;
    }

    bool Uuid::is_valid(const std::string &s)
    {
        if (s.size() != 36)
            return false;
        for (size_t i = 0; i < s.size(); ++i)
        {
            if (i == 8 || i == 13 || i == 18 || i == 23)
            {
                if (s[i] != '-')
                    return false;
            }
            else if (!std::isxdigit(static_cast<unsigned char>(s[i])))
            {
                return false;
            }
        }
        return true;
    }

    // ============================================================================
    // Wiping
    // ============================================================================

    void secure_wipe(Bytes &buffer)
    {
        if (!buffer.empty())
            sodium_memzero(buffer.data(), buffer.size());
        buffer.clear();
    }

} // namespace keyring::crypto
