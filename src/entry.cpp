#include "keyring/entry.hpp"
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace keyring
{

    namespace
    {
        struct DefaultStore
        {
            std::shared_mutex mutex;
            std::shared_ptr<CredentialStore> inner;
        };

        DefaultStore &default_store()
        {
            static DefaultStore slot;
            return slot;
        }

        Result<Entry> build_default(const std::string &service,
                                    const std::string &user,
                                    const std::optional<Attributes> &modifiers)
        {
            auto &slot = default_store();
            std::shared_lock lock(slot.mutex);
            if (!slot.inner)
                return std::unexpected(KeyringError::no_default_store());
            return slot.inner->build(service, user, modifiers);
        }

        std::string describe(const Attributes &attrs)
        {
            std::string out = "{";
            for (const auto &[k, v] : attrs)
            {
                if (out.size() > 1)
                    out += ", ";
                out += k + ": " + v;
            }
            return out + "}";
        }
    } // namespace

    void set_default_store(std::shared_ptr<CredentialStore> store)
    {
        spdlog::debug("setting default credential store to {}", store ? store->debug_string() : "none");
        auto &slot = default_store();
        std::unique_lock lock(slot.mutex);
        slot.inner = std::move(store);
    }

    std::shared_ptr<CredentialStore> get_default_store()
    {
        auto &slot = default_store();
        std::shared_lock lock(slot.mutex);
        return slot.inner;
    }

    std::shared_ptr<CredentialStore> unset_default_store()
    {
        spdlog::debug("unset the default credential store");
        auto &slot = default_store();
        std::unique_lock lock(slot.mutex);
        return std::exchange(slot.inner, nullptr);
    }

    Entry::Entry(std::shared_ptr<Credential> credential)
        : inner_(std::move(credential))
    {
        if (!inner_)
            throw std::invalid_argument("Entry requires a credential");
    }

    Result<Entry> Entry::create(const std::string &service, const std::string &user)
    {
        spdlog::debug("creating entry with service {}, user {}", service, user);
        auto entry = build_default(service, user, std::nullopt);
        if (entry)
            spdlog::debug("created entry {}", entry->inner_->debug_string());
        return entry;
    }

    Result<Entry> Entry::create_with_modifiers(const std::string &service,
                                               const std::string &user,
                                               const Attributes &modifiers)
    {
        spdlog::debug("creating entry with service {}, user {}, and mods {}", service, user, describe(modifiers));
        auto entry = build_default(service, user, modifiers);
        if (entry)
            spdlog::debug("created entry {}", entry->inner_->debug_string());
        return entry;
    }

    Result<std::vector<Entry>> Entry::search(const Attributes &spec)
    {
        spdlog::debug("searching default store with spec {}", describe(spec));
        auto &slot = default_store();
        std::shared_lock lock(slot.mutex);
        if (!slot.inner)
            return std::unexpected(KeyringError::no_default_store());
        return slot.inner->search(spec);
    }

    Result<void> Entry::set_password(const std::string &password) const
    {
        spdlog::debug("set password for entry {}", inner_->debug_string());
        return inner_->set_password(password);
    }

    Result<void> Entry::set_secret(const Bytes &secret) const
    {
        spdlog::debug("set secret for entry {}", inner_->debug_string());
        return inner_->set_secret(secret);
    }

    Result<std::string> Entry::get_password() const
    {
        spdlog::debug("get password from entry {}", inner_->debug_string());
        return inner_->get_password();
    }

    Result<Bytes> Entry::get_secret() const
    {
        spdlog::debug("get secret from entry {}", inner_->debug_string());
        return inner_->get_secret();
    }

    Result<Attributes> Entry::get_attributes() const
    {
        spdlog::debug("get attributes from entry {}", inner_->debug_string());
        return inner_->get_attributes();
    }

    Result<void> Entry::update_attributes(const Attributes &attributes) const
    {
        spdlog::debug("update attributes for entry {} from map {}", inner_->debug_string(), describe(attributes));
        return inner_->update_attributes(attributes);
    }

    Result<void> Entry::delete_credential() const
    {
        spdlog::debug("delete entry {}", inner_->debug_string());
        return inner_->delete_credential();
    }

    Result<std::optional<Entry>> Entry::get_credential() const
    {
        spdlog::debug("get credential from entry {}", inner_->debug_string());
        auto cred = inner_->get_credential();
        if (!cred)
            return std::unexpected(cred.error());
        if (!cred->has_value())
            return std::optional<Entry>{};
        return std::optional<Entry>(Entry(std::move(**cred)));
    }

    std::optional<std::pair<std::string, std::string>> Entry::get_specifiers() const
    {
        return inner_->get_specifiers();
    }

} // namespace keyring
