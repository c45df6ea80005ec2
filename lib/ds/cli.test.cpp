/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/common/test.hpp>
#include <ds/cli.hpp>

using namespace delegation_scout;
using namespace delegation_scout::cli;

namespace {
    struct echo_cmd: command {
        mutable arguments last_args {};
        mutable options last_opts {};

        void configure(cli::config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "remember the arguments";
            cmd.args.expect({ "<first>", "[<rest> ...]" });
            cmd.opts.try_emplace("rpc", "an endpoint");
            cmd.opts.try_emplace("mode", "a mode with a default", "fast");
        }

        void run(const arguments &args, const options &opts) const override
        {
            if (args.at(0) == "fail")
                throw error("requested failure");
            last_args = args;
            last_opts = opts;
        }
    };
}

suite cli_suite = [] {
    "cli"_test = [] {
        "expect"_test = [] {
            argument_config a {};
            a.expect({ "<a>", "<b>", "[<c>]" });
            test_same(size_t { 2 }, *a.min);
            test_same(size_t { 3 }, *a.max);
            argument_config many {};
            many.expect({ "[<account> ...]" });
            test_same(size_t { 0 }, *many.min);
            test_same(std::numeric_limits<size_t>::max(), *many.max);
        };
        "parse"_test = [] {
            echo_cmd cmd {};
            cli::config cfg {};
            cmd.configure(cfg);
            const auto pr = cmd.parse(cfg, { "a", "--rpc=http://localhost:8899", "b" });
            test_same(size_t { 2 }, pr.args.size());
            test_same(std::string { "b" }, pr.args.at(1));
            expect(pr.opts.at("rpc") == std::optional<std::string> { "http://localhost:8899" });
            expect(pr.opts.at("mode") == std::optional<std::string> { "fast" });
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "--unknown" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "--rpc=x", "--rpc=y" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, {}); }));
        };
        "run"_test = [] {
            const auto cmd = std::make_shared<echo_cmd>();
            const command::command_list cmds { cmd };
            {
                const char *argv[] = { "ds", "echo", "x", "--mode=slow" };
                test_same(0, run(4, argv, cmds));
                test_same(std::string { "x" }, cmd->last_args.at(0));
                expect(cmd->last_opts.at("mode") == std::optional<std::string> { "slow" });
            }
            {
                const char *argv[] = { "ds", "echo", "fail" };
                test_same(1, run(3, argv, cmds));
            }
            {
                const char *argv[] = { "ds", "missing" };
                test_same(1, run(2, argv, cmds));
            }
            {
                const char *argv[] = { "ds", "echo" };
                test_same(1, run(2, argv, cmds));
            }
            {
                const char *argv[] = { "ds" };
                test_same(1, run(1, argv, cmds));
            }
        };
    };
};
