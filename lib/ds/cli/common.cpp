/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/cli/common.hpp>

namespace delegation_scout::cli::common {
    option_validator required_value()
    {
        return [](const std::optional<std::string> &val) -> std::optional<std::string> {
            if (!val || val->empty())
                return "a value is required";
            return {};
        };
    }

    void add_rpc_opt(config &cmd)
    {
        cmd.opts.try_emplace("rpc", "the JSON-RPC endpoint URL, the endpoint from the rpc config by default", std::optional<std::string> {}, required_value());
    }

    std::optional<std::string> rpc_endpoint(const options &opts)
    {
        if (const auto it = opts.find("rpc"); it != opts.end())
            return it->second;
        return {};
    }

    void print_json(const json::value &j)
    {
        std::cout << json::serialize_pretty(j) << '\n';
    }
}
