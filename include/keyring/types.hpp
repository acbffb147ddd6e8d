#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace keyring
{

    class Credential;
    class Entry;

    using Bytes = std::vector<uint8_t>;

    /**
     * String key/value pairs used for modifiers, attributes, search specs
     * and store configuration.
     */
    using Attributes = std::map<std::string, std::string>;

    /**
     * Lifetime of the credentials produced by a store.
     */
    enum class Persistence
    {
        EntryOnly,   // kept in the entry itself
        ProcessOnly, // kept in process memory
        UntilLogout, // kept in user-space memory
        UntilReboot, // kept in kernel-space memory
        UntilDelete, // kept on disk
        Unspecified
    };

    inline std::string persistence_to_string(Persistence p)
    {
        switch (p)
        {
        case Persistence::EntryOnly:
            return "EntryOnly";
        case Persistence::ProcessOnly:
            return "ProcessOnly";
        case Persistence::UntilLogout:
            return "UntilLogout";
        case Persistence::UntilReboot:
            return "UntilReboot";
        case Persistence::UntilDelete:
            return "UntilDelete";
        case Persistence::Unspecified:
            return "Unspecified";
        }
        return "Unknown";
    }

    /**
     * Error kinds for keyring operations
     */
    enum class ErrorCode
    {
        PlatformFailure,
        NoStorageAccess,
        NoEntry,
        BadEncoding,
        BadDataFormat,
        TooLong,
        Invalid,
        Ambiguous,
        NoDefaultStore,
        NotSupportedByStore
    };

    std::string error_code_to_string(ErrorCode code);

    /**
     * Keyring error with code, message and a kind-specific payload.
     *
     * Ambiguous errors carry the wrapper credentials that match the entry;
     * use ambiguous_entries() (declared here, usable once entry.hpp is
     * included) to get them as entries. Platform errors carry the
     * underlying exception as an opaque std::exception_ptr.
     */
    class KeyringError : public std::runtime_error
    {
    public:
        ErrorCode code;

        KeyringError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static KeyringError platform_failure(std::exception_ptr inner);
        static KeyringError platform_failure(const std::string &msg);
        static KeyringError no_storage_access(std::exception_ptr inner);
        static KeyringError no_entry();
        static KeyringError bad_encoding(Bytes data);
        static KeyringError bad_data_format(Bytes data, std::exception_ptr inner);
        static KeyringError too_long(const std::string &name, uint32_t limit);
        static KeyringError invalid(const std::string &field, const std::string &reason);
        static KeyringError ambiguous(std::vector<std::shared_ptr<Credential>> matches);
        static KeyringError no_default_store();
        static KeyringError not_supported_by_store(const std::string &vendor);

        /** Attribute or parameter name for Invalid and TooLong errors */
        const std::string &field() const { return field_; }

        /** Reason for Invalid errors, vendor for NotSupportedByStore */
        const std::string &detail() const { return detail_; }

        /** Raw data for BadEncoding and BadDataFormat errors */
        const Bytes &data() const { return data_; }

        /** Length limit for TooLong errors */
        uint32_t limit() const { return limit_; }

        /** Underlying platform error, if any */
        std::exception_ptr inner() const { return inner_; }

        /** Wrapper credentials of an Ambiguous error */
        const std::vector<std::shared_ptr<Credential>> &matches() const { return matches_; }

        /** The matches of an Ambiguous error wrapped as entries */
        std::vector<Entry> ambiguous_entries() const;

    private:
        std::string field_;
        std::string detail_;
        Bytes data_;
        uint32_t limit_{0};
        std::exception_ptr inner_;
        std::vector<std::shared_ptr<Credential>> matches_;
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, KeyringError>;

    /**
     * Interpret a secret as a UTF-8 password.
     * Returns a BadEncoding error holding the bytes if they are not valid UTF-8.
     */
    Result<std::string> decode_password(Bytes bytes);

    /** Describe the inner exception of a platform error, for logs. */
    std::string describe_inner(const std::exception_ptr &inner);

} // namespace keyring
