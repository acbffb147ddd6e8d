#pragma once

#include "types.hpp"
#include <cstddef>
#include <string>

namespace keyring::crypto
{

    /**
     * Cryptographically secure random bytes (libsodium)
     */
    class SecureRandom
    {
    public:
        /** Generate n random bytes */
        static Bytes generate_bytes(size_t n);
    };

    /**
     * RFC 4122 version 4 UUIDs, used as permanent record identifiers
     */
    class Uuid
    {
    public:
        /** New random uuid in lowercase 8-4-4-4-12 hex form */
        static std::string generate();

        /** True if s has the 8-4-4-4-12 hex form */
        static bool is_valid(const std::string &s);
    };

    /**
     * Zero a secret buffer in a way the compiler won't elide, then clear it.
     */
    void secure_wipe(Bytes &buffer);

} // namespace keyring::crypto
