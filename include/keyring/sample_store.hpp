#pragma once

#include "credential.hpp"
#include "entry.hpp"
#include "types.hpp"
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace keyring::sample
{

    /**
     * The <service, user> pair that specifies a bucket of credentials.
     */
    struct CredId
    {
        std::string service;
        std::string user;

        bool operator==(const CredId &) const = default;
    };

    struct CredIdHash
    {
        std::size_t operator()(const CredId &id) const noexcept;
    };

    /**
     * The stored data of one credential.
     * creation_date is fixed once set; comment can be updated.
     */
    struct CredValue
    {
        Bytes secret;
        std::optional<std::string> comment;
        std::optional<std::string> creation_date;

        nlohmann::json to_json() const;
        /** PlatformFailure unless every secret element is a byte (0..255). */
        static Result<CredValue> from_json(const nlohmann::json &j);
    };

    /**
     * All credentials for one CredId, keyed by uuid.
     * The mutex guards both membership and record contents.
     */
    struct Bucket
    {
        mutable std::shared_mutex mutex;
        std::map<std::string, CredValue> records;
    };

    using CredMap = std::unordered_map<CredId, std::shared_ptr<Bucket>, CredIdHash>;

    /**
     * In-memory credential store with an optional backing file.
     *
     * Meant for testing clients and as a template for store authors; it is
     * neither secure nor robust. The backing file is read once when the store
     * is created and written only by save() and when the store is destroyed
     * (the last handle on it is released). Stores sharing a backing file are
     * not coordinated.
     *
     * Stores only exist inside a shared_ptr: credentials minted by build()
     * and search() hold a strong reference to their store, and the store
     * keeps only the weak self reference from enable_shared_from_this.
     *
     * Supports ambiguity through the `force-create` modifier, which creates
     * a new record (empty secret, `comment` set to the modifier value,
     * `creation_date` set to the current local time) and returns a wrapper
     * for it.
     */
    class Store : public CredentialStore, public std::enable_shared_from_this<Store>
    {
    public:
        static constexpr const char *vendor_name = "keyring-sample";

        /** An empty store with no backing file. */
        static std::shared_ptr<Store> create();

        /**
         * A store loaded from path, which need not exist yet.
         * PlatformFailure if the file can't be read or decoded.
         */
        static Result<std::shared_ptr<Store>> create_with_backing(const std::string &path);

        /** A store from configuration keys (`backing-file`). */
        static Result<std::shared_ptr<Store>> create_with_configuration(const Attributes &config);

        ~Store() override;

        Store(const Store &) = delete;
        Store &operator=(const Store &) = delete;

        /** Write the whole store to the backing file (no-op without one). */
        Result<void> save() const;

        /** Decode a backing file; a missing file gives an empty map. */
        static Result<CredMap> load_credentials(const std::string &path);

        std::string vendor() const override;
        std::string id() const override;

        Result<Entry> build(const std::string &service,
                            const std::string &user,
                            const std::optional<Attributes> &modifiers) override;

        /**
         * Search by ECMAScript regular expressions on `service`, `user`,
         * `uuid` and `comment`. Patterns are unanchored (std::regex_search)
         * and all given patterns must match. Records without a comment never
         * match a `comment` pattern.
         */
        Result<std::vector<Entry>> search(const Attributes &spec) override;

        Persistence persistence() const override;

        std::string debug_string() const override;

        const std::optional<std::string> &backing() const { return backing_; }

        /** Number of records across all buckets. */
        std::size_t credential_count() const;

        /** The bucket for id, or nullptr if none was ever created. */
        std::shared_ptr<Bucket> find_bucket(const CredId &id) const;

        /** The bucket for id, creating an empty one if needed. */
        std::shared_ptr<Bucket> get_or_create_bucket(const CredId &id);

    private:
        Store(CredMap creds, std::optional<std::string> backing);

        nlohmann::json to_json() const;

        static std::atomic<std::size_t> next_index_;

        std::size_t index_;
        mutable std::shared_mutex mutex_;
        CredMap creds_;
        std::optional<std::string> backing_;
    };

    /**
     * A credential in the sample store.
     *
     * With no uuid it is a specifier: every call resolves against the bucket
     * for its CredId. With a uuid it is a wrapper pinned to that record and
     * reports NoEntry once the record is gone.
     */
    class CredKey : public Credential
    {
    public:
        static constexpr const char *vendor_name = "keyring-sample";

        CredKey(std::shared_ptr<Store> store, CredId id, std::optional<std::string> uuid);

        Result<void> set_secret(const Bytes &secret) override;
        Result<Bytes> get_secret() override;

        /** `uuid`, plus `comment` and `creation_date` when present. */
        Result<Attributes> get_attributes() override;

        /**
         * `comment` is overwritten; `creation_date` and `uuid` are rejected
         * with Invalid (nothing is changed); other keys are ignored.
         */
        Result<void> update_attributes(const Attributes &attributes) override;

        Result<void> delete_credential() override;
        Result<std::optional<std::shared_ptr<Credential>>> get_credential() override;
        std::optional<std::pair<std::string, std::string>> get_specifiers() const override;
        std::string vendor() const override;
        std::string debug_string() const override;

        bool is_specifier() const { return !uuid_.has_value(); }

        /** The uuid of the (single) matching record. */
        Result<std::string> get_uuid() const;
        Result<std::optional<std::string>> get_comment() const;
        Result<std::optional<std::string>> get_creation_date() const;

        const CredId &cred_id() const { return id_; }
        const std::optional<std::string> &uuid() const { return uuid_; }
        const std::shared_ptr<Store> &store() const { return store_; }

    private:
        // Caller must hold the bucket's mutex (either mode).
        Result<std::string> resolve(const Bucket &bucket) const;
        std::vector<std::shared_ptr<Credential>> wrappers(const Bucket &bucket) const;

        Result<CredValue> read_value() const;

        std::shared_ptr<Store> store_;
        CredId id_;
        std::optional<std::string> uuid_;
    };

} // namespace keyring::sample
