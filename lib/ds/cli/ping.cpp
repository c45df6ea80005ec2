/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/cli/common.hpp>
#include <ds/delegation/ping.hpp>

namespace delegation_scout::cli::ping {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "ping";
            cmd.desc = "send a zero-lamport transfer to an account and wait for its confirmation";
            cmd.args.expect({ "<to>" });
            cmd.opts.try_emplace("keypair", "a Solana CLI keypair file of the fee payer", std::optional<std::string> {}, common::required_value());
            common::add_rpc_opt(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto kp_it = opts.find("keypair");
            if (kp_it == opts.end() || !kp_it->second)
                throw error("the --keypair option is required");
            const auto to = solana::pubkey::from_base58(args.at(0));
            const auto signer = solana::keypair_signer::from_file(*kp_it->second);
            const auto from = signer.public_key();
            logger::info("ping from {} to {}", from, to);
            const auto rcpt = delegation::send_ping(from, to, signer, common::rpc_endpoint(opts));
            logger::info("transaction {} confirmed", rcpt.signature);
            common::print_json(rcpt.to_json());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
