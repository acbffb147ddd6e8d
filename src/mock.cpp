#include "keyring/crypto.hpp"
#include "keyring/mock.hpp"
#include <format>
#include <utility>

namespace keyring::mock
{

    // Caller must hold mutex_.
    std::optional<KeyringError> Credential::take_error()
    {
        return std::exchange(error_, std::nullopt);
    }

    Result<void> Credential::set_secret(const Bytes &secret)
    {
        std::lock_guard lock(mutex_);
        if (auto err = take_error())
            return std::unexpected(std::move(*err));
        if (secret_)
            crypto::secure_wipe(*secret_);
        secret_ = secret;
        return {};
    }

    Result<Bytes> Credential::get_secret()
    {
        std::lock_guard lock(mutex_);
        if (auto err = take_error())
            return std::unexpected(std::move(*err));
        if (!secret_)
            return std::unexpected(KeyringError::no_entry());
        return *secret_;
    }

    Result<void> Credential::update_attributes(const Attributes & /*attributes*/)
    {
        std::lock_guard lock(mutex_);
        if (auto err = take_error())
            return std::unexpected(std::move(*err));
        if (!secret_)
            return std::unexpected(KeyringError::no_entry());
        return {};
    }

    Result<void> Credential::delete_credential()
    {
        std::lock_guard lock(mutex_);
        if (auto err = take_error())
            return std::unexpected(std::move(*err));
        if (!secret_)
            return std::unexpected(KeyringError::no_entry());
        crypto::secure_wipe(*secret_);
        secret_.reset();
        return {};
    }

    Result<std::optional<std::shared_ptr<keyring::Credential>>> Credential::get_credential()
    {
        std::lock_guard lock(mutex_);
        if (auto err = take_error())
            return std::unexpected(std::move(*err));
        return std::optional<std::shared_ptr<keyring::Credential>>{};
    }

    std::optional<std::pair<std::string, std::string>> Credential::get_specifiers() const
    {
        return std::nullopt;
    }

    std::string Credential::vendor() const
    {
        return vendor_name;
    }

    std::string Credential::debug_string() const
    {
        std::lock_guard lock(mutex_);
        return std::format("MockCredential {{ has_secret: {}, pending_error: {} }}",
                           secret_.has_value(),
                           error_ ? error_code_to_string(error_->code) : "none");
    }

    void Credential::set_error(KeyringError err)
    {
        std::lock_guard lock(mutex_);
        error_ = std::move(err);
    }

    std::string Store::vendor() const
    {
        return "mock";
    }

    std::string Store::id() const
    {
        return "mock";
    }

    Result<Entry> Store::build(const std::string & /*service*/,
                               const std::string & /*user*/,
                               const std::optional<Attributes> & /*modifiers*/)
    {
        return Entry(std::make_shared<Credential>());
    }

    Persistence Store::persistence() const
    {
        return Persistence::EntryOnly;
    }

    std::shared_ptr<CredentialStore> default_store()
    {
        return std::make_shared<Store>();
    }

} // namespace keyring::mock
