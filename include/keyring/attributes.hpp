#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace keyring
{

    /**
     * Validate a key/value map against a list of allowed keys.
     *
     * A key listed with a leading '*' must have the value "true" or "false";
     * the '*' is not part of the key. Returns an Invalid error naming the
     * first unknown key or malformed boolean. An absent map yields an empty one.
     */
    Result<Attributes> parse_attributes(const std::vector<std::string> &keys,
                                        const std::optional<Attributes> &attrs);

} // namespace keyring
