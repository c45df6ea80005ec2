/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/cli/common.hpp>
#include <ds/delegation/record.hpp>

namespace delegation_scout::cli::derive {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "derive";
            cmd.desc = "print the delegation record address of an account without contacting the network";
            cmd.args.expect({ "<account>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const auto account = solana::pubkey::from_base58(args.at(0));
            const auto pda = delegation::record_address(account);
            logger::debug("derived {} for {}", pda, account);
            common::print_json(json::object {
                { "accountPubkey", account.to_base58() },
                { "delegationPDA", pda.address.to_base58() },
                { "bump", static_cast<uint64_t>(pda.bump) },
                { "programId", delegation::program_id().to_base58() }
            });
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
