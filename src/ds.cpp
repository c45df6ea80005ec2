/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace delegation_scout;
    consider_bin_dir(argv[0]);
    return cli::run(argc, argv);
}
