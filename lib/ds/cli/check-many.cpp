/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/cli/common.hpp>
#include <ds/delegation/resolver.hpp>

namespace delegation_scout::cli::check_many {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "check-many";
            cmd.desc = "check a list of accounts, a failed item is reported as not delegated";
            cmd.args.expect({ "[<account> ...]" });
            common::add_rpc_opt(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto results = delegation::resolve_many(args, common::rpc_endpoint(opts));
            size_t num_delegated = 0;
            json::array res_j {};
            res_j.reserve(results.size());
            for (const auto &r: results) {
                if (r.delegated())
                    ++num_delegated;
                res_j.emplace_back(r.to_json());
            }
            logger::info("{} of {} accounts are delegated", num_delegated, results.size());
            common::print_json(res_j);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
