#include "keyring/crypto.hpp"
#include "keyring/sample_store.hpp"
#include <format>
#include <mutex>
#include <shared_mutex>

namespace keyring::sample
{

    CredKey::CredKey(std::shared_ptr<Store> store, CredId id, std::optional<std::string> uuid)
        : store_(std::move(store)), id_(std::move(id)), uuid_(std::move(uuid))
    {
    }

    std::vector<std::shared_ptr<Credential>> CredKey::wrappers(const Bucket &bucket) const
    {
        std::vector<std::shared_ptr<Credential>> out;
        out.reserve(bucket.records.size());
        for (const auto &[uuid, _] : bucket.records)
            out.push_back(std::make_shared<CredKey>(store_, id_, uuid));
        return out;
    }

    Result<std::string> CredKey::resolve(const Bucket &bucket) const
    {
        if (uuid_)
        {
            if (!bucket.records.contains(*uuid_))
                return std::unexpected(KeyringError::no_entry());
            return *uuid_;
        }

        switch (bucket.records.size())
        {
        case 0:
            return std::unexpected(KeyringError::no_entry());
        case 1:
            return bucket.records.begin()->first;
        default:
            return std::unexpected(KeyringError::ambiguous(wrappers(bucket)));
        }
    }

    Result<CredValue> CredKey::read_value() const
    {
        auto bucket = store_->find_bucket(id_);
        if (!bucket)
            return std::unexpected(KeyringError::no_entry());

        std::shared_lock lock(bucket->mutex);
        auto uuid = resolve(*bucket);
        if (!uuid)
            return std::unexpected(uuid.error());
        return bucket->records.at(*uuid);
    }

    Result<void> CredKey::set_secret(const Bytes &secret)
    {
        if (uuid_)
        {
            auto bucket = store_->find_bucket(id_);
            if (!bucket)
                return std::unexpected(KeyringError::no_entry());

            std::unique_lock lock(bucket->mutex);
            auto it = bucket->records.find(*uuid_);
            if (it == bucket->records.end())
                return std::unexpected(KeyringError::no_entry());
            crypto::secure_wipe(it->second.secret);
            it->second.secret = secret;
            return {};
        }

        // Count and write under the same exclusive lock.
        auto bucket = store_->get_or_create_bucket(id_);
        std::unique_lock lock(bucket->mutex);
        switch (bucket->records.size())
        {
        case 0:
            bucket->records.emplace(crypto::Uuid::generate(), CredValue{secret, std::nullopt, std::nullopt});
            return {};
        case 1:
        {
            auto &value = bucket->records.begin()->second;
            crypto::secure_wipe(value.secret);
            value.secret = secret;
            return {};
        }
        default:
            return std::unexpected(KeyringError::ambiguous(wrappers(*bucket)));
        }
    }

    Result<Bytes> CredKey::get_secret()
    {
        auto value = read_value();
        if (!value)
            return std::unexpected(value.error());
        return std::move(value->secret);
    }

    Result<Attributes> CredKey::get_attributes()
    {
        auto bucket = store_->find_bucket(id_);
        if (!bucket)
            return std::unexpected(KeyringError::no_entry());

        std::shared_lock lock(bucket->mutex);
        auto uuid = resolve(*bucket);
        if (!uuid)
            return std::unexpected(uuid.error());

        const auto &value = bucket->records.at(*uuid);
        Attributes attrs{{"uuid", *uuid}};
        if (value.comment)
            attrs.emplace("comment", *value.comment);
        if (value.creation_date)
            attrs.emplace("creation_date", *value.creation_date);
        return attrs;
    }

    Result<void> CredKey::update_attributes(const Attributes &attributes)
    {
        auto bucket = store_->find_bucket(id_);
        if (!bucket)
            return std::unexpected(KeyringError::no_entry());

        std::unique_lock lock(bucket->mutex);
        auto uuid = resolve(*bucket);
        if (!uuid)
            return std::unexpected(uuid.error());

        for (const auto &key : {"creation_date", "uuid"})
        {
            if (attributes.contains(key))
                return std::unexpected(KeyringError::invalid(key, "cannot be updated"));
        }

        if (auto it = attributes.find("comment"); it != attributes.end())
            bucket->records.at(*uuid).comment = it->second;
        return {};
    }

    Result<void> CredKey::delete_credential()
    {
        auto bucket = store_->find_bucket(id_);
        if (!bucket)
            return std::unexpected(KeyringError::no_entry());

        std::unique_lock lock(bucket->mutex);
        auto uuid = resolve(*bucket);
        if (!uuid)
            return std::unexpected(uuid.error());

        auto it = bucket->records.find(*uuid);
        crypto::secure_wipe(it->second.secret);
        bucket->records.erase(it);
        return {};
    }

    Result<std::optional<std::shared_ptr<Credential>>> CredKey::get_credential()
    {
        auto bucket = store_->find_bucket(id_);
        if (!bucket)
            return std::unexpected(KeyringError::no_entry());

        std::shared_lock lock(bucket->mutex);
        auto uuid = resolve(*bucket);
        if (!uuid)
            return std::unexpected(uuid.error());
        if (uuid_)
            return std::optional<std::shared_ptr<Credential>>{};
        return std::optional<std::shared_ptr<Credential>>(std::make_shared<CredKey>(store_, id_, *uuid));
    }

    std::optional<std::pair<std::string, std::string>> CredKey::get_specifiers() const
    {
        return std::make_pair(id_.service, id_.user);
    }

    std::string CredKey::vendor() const
    {
        return vendor_name;
    }

    std::string CredKey::debug_string() const
    {
        return std::format("CredKey {{ store: {}, service: \"{}\", user: \"{}\", uuid: {} }}",
                           store_->id(),
                           id_.service,
                           id_.user,
                           uuid_.value_or("none"));
    }

    Result<std::string> CredKey::get_uuid() const
    {
        auto bucket = store_->find_bucket(id_);
        if (!bucket)
            return std::unexpected(KeyringError::no_entry());

        std::shared_lock lock(bucket->mutex);
        return resolve(*bucket);
    }

    Result<std::optional<std::string>> CredKey::get_comment() const
    {
        auto value = read_value();
        if (!value)
            return std::unexpected(value.error());
        return value->comment;
    }

    Result<std::optional<std::string>> CredKey::get_creation_date() const
    {
        auto value = read_value();
        if (!value)
            return std::unexpected(value.error());
        return value->creation_date;
    }

} // namespace keyring::sample
