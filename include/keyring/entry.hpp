#pragma once

#include "credential.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace keyring
{

    /**
     * Set the store used to create entries.
     *
     * Blocks until threads currently creating entries are done, so it is
     * meant to be called at startup, before entries are created.
     */
    void set_default_store(std::shared_ptr<CredentialStore> store);

    /** The current default store, or nullptr if none is set. */
    std::shared_ptr<CredentialStore> get_default_store();

    /** Forget the default store, returning the previous one (if any). */
    std::shared_ptr<CredentialStore> unset_default_store();

    /**
     * Client-facing handle on a credential.
     *
     * An entry holds its credential by shared ownership: copies observe the
     * same underlying record. Every method forwards to the credential and
     * nothing is cached.
     */
    class Entry
    {
    public:
        /**
         * Wrap an existing credential from any store.
         * Throws std::invalid_argument if credential is null.
         */
        explicit Entry(std::shared_ptr<Credential> credential);

        /** Create an entry for service and user in the default store. */
        static Result<Entry> create(const std::string &service, const std::string &user);

        /** Create an entry passing store-specific modifiers. */
        static Result<Entry> create_with_modifiers(const std::string &service,
                                                   const std::string &user,
                                                   const Attributes &modifiers);

        /** Search the default store. */
        static Result<std::vector<Entry>> search(const Attributes &spec);

        Result<void> set_password(const std::string &password) const;
        Result<void> set_secret(const Bytes &secret) const;
        Result<std::string> get_password() const;
        Result<Bytes> get_secret() const;
        Result<Attributes> get_attributes() const;
        Result<void> update_attributes(const Attributes &attributes) const;
        Result<void> delete_credential() const;

        /**
         * An entry wrapping the single credential this entry specifies,
         * or nullopt if this entry is already a wrapper.
         */
        Result<std::optional<Entry>> get_credential() const;

        std::optional<std::pair<std::string, std::string>> get_specifiers() const;

        const std::shared_ptr<Credential> &credential() const { return inner_; }

        /**
         * Typed access to the concrete credential.
         * Returns nullptr unless the credential's vendor matches T::vendor_name.
         */
        template <typename T>
        std::shared_ptr<T> as() const
        {
            if (inner_->vendor() != T::vendor_name)
                return nullptr;
            return std::static_pointer_cast<T>(inner_);
        }

    private:
        std::shared_ptr<Credential> inner_;
    };

} // namespace keyring
