/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/cli/common.hpp>
#include <ds/delegation/resolver.hpp>

namespace delegation_scout::cli::check {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "check";
            cmd.desc = "report whether an account is delegated and to which validator";
            cmd.args.expect({ "<account>" });
            common::add_rpc_opt(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto res = delegation::resolve(args.at(0), common::rpc_endpoint(opts));
            logger::info("{}: {}", res.account, res.status);
            common::print_json(res.to_json());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
