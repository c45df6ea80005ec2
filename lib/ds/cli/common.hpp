/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#ifndef DELEGATION_SCOUT_CLI_COMMON_HPP
#define DELEGATION_SCOUT_CLI_COMMON_HPP

#include <ds/cli.hpp>
#include <ds/json.hpp>

namespace delegation_scout::cli::common {
    extern option_validator required_value();
    extern void add_rpc_opt(config &cmd);
    extern std::optional<std::string> rpc_endpoint(const options &opts);
    // results go to stdout, diagnostics go to the log
    extern void print_json(const json::value &j);
}

#endif // !DELEGATION_SCOUT_CLI_COMMON_HPP
