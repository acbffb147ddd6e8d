#include "keyring/attributes.hpp"
#include <unordered_map>

namespace keyring
{

    Result<Attributes> parse_attributes(const std::vector<std::string> &keys,
                                        const std::optional<Attributes> &attrs)
    {
        Attributes result;
        if (!attrs)
            return result;

        std::unordered_map<std::string, bool> key_map;
        for (const auto &k : keys)
        {
            if (k.starts_with('*'))
                key_map.emplace(k.substr(1), true);
            else
                key_map.emplace(k, false);
        }

        for (const auto &[key, value] : *attrs)
        {
            auto it = key_map.find(key);
            if (it == key_map.end())
                return std::unexpected(KeyringError::invalid(key, "unknown key"));
            if (it->second && value != "true" && value != "false")
                return std::unexpected(KeyringError::invalid(key, "must be `true` or `false`"));
            result.emplace(key, value);
        }
        return result;
    }

} // namespace keyring
