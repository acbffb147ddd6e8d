#pragma once

#include "types.hpp"
#include <ostream>

namespace keyring::cli
{
    /** Parse arguments and run the selected command; returns the exit code. */
    int run(int argc, char *argv[]);

    /**
     * Make `count` credentials for svc/usr ambiguous and resolve them, once
     * through the attributes of the returned entries and once through the
     * sample credentials behind them. Needs a sample default store; writes
     * progress to out.
     */
    Result<void> ambiguity_demo(int count, std::ostream &out);
}
