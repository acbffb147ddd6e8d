#include "keyring/attributes.hpp"
#include "keyring/crypto.hpp"
#include "keyring/sample_store.hpp"
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <regex>
#include <shared_mutex>
#include <spdlog/spdlog.h>
#include <sstream>

namespace keyring::sample
{

    namespace
    {
        // RFC 2822 style local time, e.g. "Tue, 01 Jul 2025 09:30:00 +0200"
        std::string now_rfc2822()
        {
            std::time_t t = std::time(nullptr);
            std::tm tm_buf;
            localtime_r(&t, &tm_buf);
            char buf[64];
            std::size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S %z", &tm_buf);
            return std::string(buf, n);
        }

        std::optional<std::string> optional_string(const nlohmann::json &j, const char *key)
        {
            if (!j.contains(key) || j.at(key).is_null())
                return std::nullopt;
            return j.at(key).get<std::string>();
        }
    } // namespace

    std::size_t CredIdHash::operator()(const CredId &id) const noexcept
    {
        std::size_t h = std::hash<std::string>{}(id.service);
        h ^= std::hash<std::string>{}(id.user) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }

    nlohmann::json CredValue::to_json() const
    {
        nlohmann::json j;
        j["secret"] = secret;
        j["comment"] = comment ? nlohmann::json(*comment) : nlohmann::json(nullptr);
        j["creation_date"] = creation_date ? nlohmann::json(*creation_date) : nlohmann::json(nullptr);
        return j;
    }

    Result<CredValue> CredValue::from_json(const nlohmann::json &j)
    {
        CredValue value;
        const auto &secret = j.at("secret");
        if (!secret.is_array())
            return std::unexpected(KeyringError::platform_failure("secret is not a byte array"));
        value.secret.reserve(secret.size());
        for (const auto &byte : secret)
        {
            if (!byte.is_number_unsigned() || byte.get<std::uint64_t>() > 0xff)
                return std::unexpected(KeyringError::platform_failure("secret contains a non-byte value: " + byte.dump()));
            value.secret.push_back(static_cast<std::uint8_t>(byte.get<std::uint64_t>()));
        }
        value.comment = optional_string(j, "comment");
        value.creation_date = optional_string(j, "creation_date");
        return value;
    }

    std::atomic<std::size_t> Store::next_index_{0};

    Store::Store(CredMap creds, std::optional<std::string> backing)
        : index_(next_index_.fetch_add(1)), creds_(std::move(creds)), backing_(std::move(backing))
    {
    }

    std::shared_ptr<Store> Store::create()
    {
        std::shared_ptr<Store> store(new Store(CredMap{}, std::nullopt));
        spdlog::debug("created {}", store->debug_string());
        return store;
    }

    Result<std::shared_ptr<Store>> Store::create_with_backing(const std::string &path)
    {
        auto creds = load_credentials(path);
        if (!creds)
            return std::unexpected(creds.error());
        std::shared_ptr<Store> store(new Store(std::move(*creds), path));
        spdlog::debug("created {} from backing file {}", store->debug_string(), path);
        return store;
    }

    Result<std::shared_ptr<Store>> Store::create_with_configuration(const Attributes &config)
    {
        auto parsed = parse_attributes({"backing-file"}, config);
        if (!parsed)
            return std::unexpected(parsed.error());
        if (auto it = parsed->find("backing-file"); it != parsed->end())
            return create_with_backing(it->second);
        return create();
    }

    Store::~Store()
    {
        if (!backing_)
            return;
        spdlog::debug("Saving store {} on drop...", debug_string());
        auto res = save();
        if (res)
            spdlog::debug("Save of store {} complete.", debug_string());
        else
            spdlog::error("Save of store {} failed: {}", debug_string(), res.error().what());
    }

    Result<CredMap> Store::load_credentials(const std::string &path)
    {
        std::error_code ec;
        bool exists = std::filesystem::exists(path, ec);
        if (ec)
            return std::unexpected(KeyringError::invalid("backing-file", ec.message()));
        if (!exists)
            return CredMap{};

        std::ifstream file(path);
        if (!file.is_open())
            return std::unexpected(KeyringError::platform_failure("Unable to open backing file: " + path));
        std::stringstream buffer;
        buffer << file.rdbuf();

        try
        {
            auto j = nlohmann::json::parse(buffer.str());
            CredMap creds;
            for (const auto &cred : j.at("credentials"))
            {
                CredId id{cred.at("service").get<std::string>(), cred.at("user").get<std::string>()};
                auto bucket = std::make_shared<Bucket>();
                for (const auto &[uuid, value] : cred.at("records").items())
                {
                    if (!crypto::Uuid::is_valid(uuid))
                        return std::unexpected(KeyringError::platform_failure("invalid record uuid: " + uuid));
                    auto decoded = CredValue::from_json(value);
                    if (!decoded)
                        return std::unexpected(decoded.error());
                    bucket->records.emplace(uuid, std::move(*decoded));
                }
                if (!creds.emplace(id, std::move(bucket)).second)
                    return std::unexpected(KeyringError::platform_failure(
                        std::format("duplicate credentials for service \"{}\", user \"{}\"", id.service, id.user)));
            }
            return creds;
        }
        catch (const nlohmann::json::exception &)
        {
            return std::unexpected(KeyringError::platform_failure(std::current_exception()));
        }
    }

    nlohmann::json Store::to_json() const
    {
        nlohmann::json credentials = nlohmann::json::array();
        std::shared_lock lock(mutex_);
        for (const auto &[id, bucket] : creds_)
        {
            nlohmann::json records = nlohmann::json::object();
            {
                std::shared_lock bucket_lock(bucket->mutex);
                for (const auto &[uuid, value] : bucket->records)
                    records[uuid] = value.to_json();
            }
            credentials.push_back({{"service", id.service}, {"user", id.user}, {"records", std::move(records)}});
        }
        return nlohmann::json{{"credentials", std::move(credentials)}};
    }

    Result<void> Store::save() const
    {
        if (!backing_)
            return {};

        std::string content;
        try
        {
            content = to_json().dump(2);
        }
        catch (const nlohmann::json::exception &)
        {
            return std::unexpected(KeyringError::platform_failure(std::current_exception()));
        }

        std::ofstream out(*backing_, std::ios::trunc);
        if (!out.is_open())
            return std::unexpected(KeyringError::platform_failure("Unable to open backing file for writing: " + *backing_));
        out << content;
        out.flush();
        if (!out)
            return std::unexpected(KeyringError::platform_failure("Write to backing file failed: " + *backing_));
        return {};
    }

    std::string Store::vendor() const
    {
        return vendor_name;
    }

    std::string Store::id() const
    {
        return std::format("sample-store-{}", index_);
    }

    Result<Entry> Store::build(const std::string &service,
                               const std::string &user,
                               const std::optional<Attributes> &modifiers)
    {
        auto mods = parse_attributes({"force-create"}, modifiers);
        if (!mods)
            return std::unexpected(mods.error());

        CredId id{service, user};
        auto self = shared_from_this();

        auto force = mods->find("force-create");
        if (force == mods->end())
            return Entry(std::make_shared<CredKey>(std::move(self), std::move(id), std::nullopt));

        auto uuid = crypto::Uuid::generate();
        {
            auto bucket = get_or_create_bucket(id);
            std::unique_lock lock(bucket->mutex);
            bucket->records.emplace(uuid, CredValue{Bytes{}, force->second, now_rfc2822()});
        }
        return Entry(std::make_shared<CredKey>(std::move(self), std::move(id), std::move(uuid)));
    }

    Result<std::vector<Entry>> Store::search(const Attributes &spec)
    {
        auto parsed = parse_attributes({"service", "user", "uuid", "comment"}, spec);
        if (!parsed)
            return std::unexpected(parsed.error());

        std::map<std::string, std::regex> patterns;
        for (const auto &[key, pattern] : *parsed)
        {
            try
            {
                patterns.emplace(key, std::regex(pattern, std::regex::ECMAScript));
            }
            catch (const std::regex_error &e)
            {
                return std::unexpected(KeyringError::invalid(key, e.what()));
            }
        }

        auto matches = [&patterns](const std::string &key, const std::string &value) {
            auto it = patterns.find(key);
            return it == patterns.end() || std::regex_search(value, it->second);
        };

        std::vector<std::pair<CredId, std::shared_ptr<Bucket>>> buckets;
        {
            std::shared_lock lock(mutex_);
            buckets.assign(creds_.begin(), creds_.end());
        }

        auto self = shared_from_this();
        std::vector<Entry> out;
        for (const auto &[id, bucket] : buckets)
        {
            if (!matches("service", id.service) || !matches("user", id.user))
                continue;

            std::shared_lock lock(bucket->mutex);
            for (const auto &[uuid, value] : bucket->records)
            {
                if (!matches("uuid", uuid))
                    continue;
                if (patterns.contains("comment") && (!value.comment || !matches("comment", *value.comment)))
                    continue;
                out.emplace_back(std::make_shared<CredKey>(self, id, uuid));
            }
        }
        return out;
    }

    Persistence Store::persistence() const
    {
        return backing_ ? Persistence::UntilDelete : Persistence::ProcessOnly;
    }

    std::string Store::debug_string() const
    {
        std::size_t buckets = 0;
        {
            std::shared_lock lock(mutex_);
            buckets = creds_.size();
        }
        return std::format("Store {{ id: {}, backing: {}, buckets: {} }}",
                           id(),
                           backing_.value_or("none"),
                           buckets);
    }

    std::size_t Store::credential_count() const
    {
        std::size_t count = 0;
        std::shared_lock lock(mutex_);
        for (const auto &[_, bucket] : creds_)
        {
            std::shared_lock bucket_lock(bucket->mutex);
            count += bucket->records.size();
        }
        return count;
    }

    std::shared_ptr<Bucket> Store::find_bucket(const CredId &id) const
    {
        std::shared_lock lock(mutex_);
        auto it = creds_.find(id);
        if (it == creds_.end())
            return nullptr;
        return it->second;
    }

    std::shared_ptr<Bucket> Store::get_or_create_bucket(const CredId &id)
    {
        if (auto bucket = find_bucket(id))
            return bucket;
        std::unique_lock lock(mutex_);
        auto [it, _] = creds_.try_emplace(id, std::make_shared<Bucket>());
        return it->second;
    }

} // namespace keyring::sample
