#include "keyring/credential.hpp"
#include "keyring/entry.hpp"

namespace keyring
{

    Result<std::vector<Entry>> CredentialStore::search(const Attributes & /*spec*/)
    {
        return std::unexpected(KeyringError::not_supported_by_store(vendor()));
    }

} // namespace keyring
