#pragma once

#include "credential.hpp"
#include "entry.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace keyring::mock
{

    /**
     * A credential whose only storage is itself.
     *
     * Every mock is both a specifier and a wrapper with no attributes. Use
     * set_error() to make the next call fail with a chosen error; the error
     * is cleared once returned, so the call after it behaves normally.
     */
    class Credential : public keyring::Credential
    {
    public:
        static constexpr const char *vendor_name = "mock";

        Result<void> set_secret(const Bytes &secret) override;
        Result<Bytes> get_secret() override;

        /** Accepted and ignored once a secret is set; NoEntry before. */
        Result<void> update_attributes(const Attributes &attributes) override;

        Result<void> delete_credential() override;
        Result<std::optional<std::shared_ptr<keyring::Credential>>> get_credential() override;
        std::optional<std::pair<std::string, std::string>> get_specifiers() const override;
        std::string vendor() const override;
        std::string debug_string() const override;

        void set_error(KeyringError err);

    private:
        std::optional<KeyringError> take_error();

        mutable std::mutex mutex_;
        std::optional<Bytes> secret_;
        std::optional<KeyringError> error_;
    };

    /**
     * Builds a fresh mock credential for every entry; modifiers are ignored.
     */
    class Store : public CredentialStore
    {
    public:
        std::string vendor() const override;
        std::string id() const override;

        Result<Entry> build(const std::string &service,
                            const std::string &user,
                            const std::optional<Attributes> &modifiers) override;

        Persistence persistence() const override;
    };

    /** A mock store for use as the default store. */
    std::shared_ptr<CredentialStore> default_store();

} // namespace keyring::mock
