#include "keyring/cli.hpp"

int main(int argc, char *argv[])
{
    return keyring::cli::run(argc, argv);
}
