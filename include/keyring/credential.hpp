#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace keyring
{

    /**
     * Abstract interface for a credential held by a store.
     *
     * A credential is either a specifier (identifies a service/user pair and
     * resolves against the store on every call) or a wrapper (pinned to one
     * physical record). Implementations must be safe to share and call
     * from multiple threads without external locking.
     */
    class Credential
    {
    public:
        virtual ~Credential() = default;

        /**
         * Set the protected data of the underlying credential.
         * - A specifier with no matching credential creates one.
         * - A specifier with more than one match fails with Ambiguous.
         * - A wrapper whose credential was deleted fails with NoEntry.
         */
        virtual Result<void> set_secret(const Bytes &secret) = 0;

        /**
         * Read the protected data of the underlying credential.
         * NoEntry if nothing matches, Ambiguous if more than one does.
         */
        virtual Result<Bytes> get_secret() = 0;

        /** Set the protected data to the UTF-8 bytes of a password. */
        virtual Result<void> set_password(const std::string &password)
        {
            return set_secret(Bytes(password.begin(), password.end()));
        }

        /** Read the protected data as UTF-8; BadEncoding if it isn't. */
        virtual Result<std::string> get_password()
        {
            auto secret = get_secret();
            if (!secret)
                return std::unexpected(secret.error());
            return decode_password(std::move(*secret));
        }

        /**
         * Store-specific decorations on the credential.
         * The default has no attributes but fails exactly where get_secret does.
         */
        virtual Result<Attributes> get_attributes()
        {
            auto secret = get_secret();
            if (!secret)
                return std::unexpected(secret.error());
            return Attributes{};
        }

        /** Update decorations; stores without updatable attributes refuse. */
        virtual Result<void> update_attributes(const Attributes & /*attributes*/)
        {
            return std::unexpected(KeyringError::not_supported_by_store(vendor()));
        }

        /** Delete the underlying credential (NoEntry / Ambiguous as for reads). */
        virtual Result<void> delete_credential() = 0;

        /**
         * Resolve to a wrapper for the underlying credential.
         * Returns nullopt if this credential is already a wrapper.
         */
        virtual Result<std::optional<std::shared_ptr<Credential>>> get_credential() = 0;

        /** The <service, user> pair of this credential, if it has one. */
        virtual std::optional<std::pair<std::string, std::string>> get_specifiers() const = 0;

        /** Names the concrete credential type; see Entry::as(). */
        virtual std::string vendor() const = 0;

        /** Human readable description for logs and error messages. */
        virtual std::string debug_string() const = 0;
    };

    /**
     * Abstract interface for credential stores.
     * Implementations must be thread-safe.
     */
    class CredentialStore
    {
    public:
        virtual ~CredentialStore() = default;

        /** Name of the provider; stable across versions. */
        virtual std::string vendor() const = 0;

        /** Instance id; equal vendor and id means the same instance. */
        virtual std::string id() const = 0;

        /**
         * Build an entry for service and user, with optional store-specific
         * modifiers. Unknown modifiers are rejected with Invalid.
         */
        virtual Result<Entry> build(const std::string &service,
                                    const std::string &user,
                                    const std::optional<Attributes> &modifiers) = 0;

        /**
         * Search for credentials matching a store-specific spec.
         * Stores without search report NotSupportedByStore.
         */
        virtual Result<std::vector<Entry>> search(const Attributes &spec);

        /** Lifetime of credentials in this store (disk-based by default). */
        virtual Persistence persistence() const
        {
            return Persistence::UntilDelete;
        }

        virtual std::string debug_string() const
        {
            return vendor() + ":" + id();
        }
    };

} // namespace keyring
