#include "keyring/types.hpp"
#include "keyring/credential.hpp"
#include "keyring/entry.hpp"
#include <format>

namespace keyring
{

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::PlatformFailure:
            return "PlatformFailure";
        case ErrorCode::NoStorageAccess:
            return "NoStorageAccess";
        case ErrorCode::NoEntry:
            return "NoEntry";
        case ErrorCode::BadEncoding:
            return "BadEncoding";
        case ErrorCode::BadDataFormat:
            return "BadDataFormat";
        case ErrorCode::TooLong:
            return "TooLong";
        case ErrorCode::Invalid:
            return "Invalid";
        case ErrorCode::Ambiguous:
            return "Ambiguous";
        case ErrorCode::NoDefaultStore:
            return "NoDefaultStore";
        case ErrorCode::NotSupportedByStore:
            return "NotSupportedByStore";
        }
        return "Unknown";
    }

    std::string describe_inner(const std::exception_ptr &inner)
    {
        if (!inner)
            return "unknown error";
        try
        {
            std::rethrow_exception(inner);
        }
        catch (const std::exception &e)
        {
            return e.what();
        }
        catch (...)
        {
            return "non-standard exception";
        }
    }

    KeyringError KeyringError::platform_failure(std::exception_ptr inner)
    {
        KeyringError err(ErrorCode::PlatformFailure,
                         "Platform secure storage failure: " + describe_inner(inner));
        err.inner_ = std::move(inner);
        return err;
    }

    KeyringError KeyringError::platform_failure(const std::string &msg)
    {
        return platform_failure(std::make_exception_ptr(std::runtime_error(msg)));
    }

    KeyringError KeyringError::no_storage_access(std::exception_ptr inner)
    {
        KeyringError err(ErrorCode::NoStorageAccess,
                         "Couldn't access platform secure storage: " + describe_inner(inner));
        err.inner_ = std::move(inner);
        return err;
    }

    KeyringError KeyringError::no_entry()
    {
        return KeyringError(ErrorCode::NoEntry, "No matching entry found in secure storage");
    }

    KeyringError KeyringError::bad_encoding(Bytes data)
    {
        KeyringError err(ErrorCode::BadEncoding, "Data is not UTF-8 encoded");
        err.data_ = std::move(data);
        return err;
    }

    KeyringError KeyringError::bad_data_format(Bytes data, std::exception_ptr inner)
    {
        KeyringError err(ErrorCode::BadDataFormat,
                         "Data is not in the expected format: " + describe_inner(inner));
        err.data_ = std::move(data);
        err.inner_ = std::move(inner);
        return err;
    }

    KeyringError KeyringError::too_long(const std::string &name, uint32_t limit)
    {
        KeyringError err(ErrorCode::TooLong,
                         std::format("Attribute '{}' is longer than the platform limit of {} chars", name, limit));
        err.field_ = name;
        err.limit_ = limit;
        return err;
    }

    KeyringError KeyringError::invalid(const std::string &field, const std::string &reason)
    {
        KeyringError err(ErrorCode::Invalid, std::format("Attribute {} is invalid: {}", field, reason));
        err.field_ = field;
        err.detail_ = reason;
        return err;
    }

    KeyringError KeyringError::ambiguous(std::vector<std::shared_ptr<Credential>> matches)
    {
        std::string listing;
        for (const auto &cred : matches)
        {
            if (!listing.empty())
                listing += ", ";
            listing += cred->debug_string();
        }
        KeyringError err(ErrorCode::Ambiguous,
                         std::format("Entry is matched by {} credentials: [{}]", matches.size(), listing));
        err.matches_ = std::move(matches);
        return err;
    }

    KeyringError KeyringError::no_default_store()
    {
        return KeyringError(ErrorCode::NoDefaultStore,
                            "No default store has been set, so cannot search or create entries");
    }

    KeyringError KeyringError::not_supported_by_store(const std::string &vendor)
    {
        KeyringError err(ErrorCode::NotSupportedByStore,
                         std::format("The store ({}) does not support this operation", vendor));
        err.detail_ = vendor;
        return err;
    }

    std::vector<Entry> KeyringError::ambiguous_entries() const
    {
        std::vector<Entry> out;
        out.reserve(matches_.size());
        for (const auto &cred : matches_)
            out.emplace_back(cred);
        return out;
    }

    namespace
    {
        // Strict UTF-8 validation: rejects overlongs, surrogates and
        // code points above U+10FFFF.
        bool is_valid_utf8(const Bytes &bytes)
        {
            std::size_t i = 0;
            const std::size_t n = bytes.size();
            while (i < n)
            {
                uint8_t c = bytes[i];
                if (c < 0x80)
                {
                    ++i;
                    continue;
                }

                std::size_t len = 0;
                uint32_t cp = 0;
                if ((c & 0xE0) == 0xC0)
                {
                    len = 2;
                    cp = c & 0x1F;
                }
                else if ((c & 0xF0) == 0xE0)
                {
                    len = 3;
                    cp = c & 0x0F;
                }
                else if ((c & 0xF8) == 0xF0)
                {
                    len = 4;
                    cp = c & 0x07;
                }
                else
                {
                    return false;
                }

                if (i + len > n)
                    return false;
                for (std::size_t k = 1; k < len; ++k)
                {
                    uint8_t cc = bytes[i + k];
                    if ((cc & 0xC0) != 0x80)
                        return false;
                    cp = (cp << 6) | (cc & 0x3F);
                }

                if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
                    return false;
                if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                    return false;
                i += len;
            }
            return true;
        }
    } // namespace

    Result<std::string> decode_password(Bytes bytes)
    {
        if (!is_valid_utf8(bytes))
            return std::unexpected(KeyringError::bad_encoding(std::move(bytes)));
        return std::string(bytes.begin(), bytes.end());
    }

} // namespace keyring
