/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <atomic>
#include <thread>
#include <ds/common/test.hpp>
#include <ds/solana/rpc-mock.hpp>

using namespace delegation_scout;
using namespace delegation_scout::solana;

namespace {
    json::value parse(const std::string_view text)
    {
        return json::parse(buffer { text });
    }
}

suite solana_rpc_suite = [] {
    "solana::rpc"_test = [] {
        "response result"_test = [] {
            const auto res = rpc::response_result("getBlockHeight", parse(R"({"jsonrpc":"2.0","result":233,"id":1})"));
            test_same(uint64_t { 233 }, res.to_number<uint64_t>());
            expect(throws<network_error>([] {
                rpc::response_result("getBlockHeight", parse(R"({"jsonrpc":"2.0","error":{"code":-32602,"message":"Invalid params"},"id":1})"));
            }));
            expect(throws<network_error>([] { rpc::response_result("getBlockHeight", parse(R"({"jsonrpc":"2.0","id":1})")); }));
            expect(throws<network_error>([] { rpc::response_result("getBlockHeight", parse(R"([1, 2])")); }));
        };
        "account info"_test = [] {
            const auto res = parse(R"({
                "context": { "slot": 1 },
                "value": {
                    "data": ["AAECAw==", "base64"],
                    "executable": false,
                    "lamports": 1461600,
                    "owner": "DELeGGvXpWV2fqJUhqcF5ZSYMS4JTLjteaAMARRSaeSh",
                    "rentEpoch": 18446744073709551615,
                    "space": 4
                }
            })");
            const auto info = rpc::decode_account_info(res);
            expect(info.has_value() >> fatal);
            test_same(uint64_t { 1461600 }, info->lamports);
            test_same(std::string { "DELeGGvXpWV2fqJUhqcF5ZSYMS4JTLjteaAMARRSaeSh" }, info->owner.to_base58());
            test_same(uint8_vector::from_hex("00010203"), info->data);
            expect(!info->executable);
            test_same(uint64_t { 18446744073709551615ULL }, info->rent_epoch);
            expect(!rpc::decode_account_info(parse(R"({"context":{"slot":1},"value":null})")).has_value());
            expect(throws<network_error>([] { rpc::decode_account_info(parse(R"({"value":{"data":["AA==","base58"],"executable":false,"lamports":1,"owner":"11111111111111111111111111111111","rentEpoch":0}})")); }));
            expect(throws<network_error>([] { rpc::decode_account_info(parse(R"({"value":{"data":["AA==","base64"],"executable":false,"lamports":1,"owner":"not-a-key","rentEpoch":0}})")); }));
            expect(throws<network_error>([] { rpc::decode_account_info(parse(R"({"value":{"lamports":1}})")); }));
        };
        "latest blockhash"_test = [] {
            const auto bh = rpc::decode_latest_blockhash(parse(R"({"context":{"slot":2792},"value":{"blockhash":"EkSnNWid2cvwEVnVx9aBqawnmiCNiDgp3gUdkDPTKN1N","lastValidBlockHeight":3090}})"));
            test_same(std::string { "EkSnNWid2cvwEVnVx9aBqawnmiCNiDgp3gUdkDPTKN1N" }, bh.hash.to_base58());
            test_same(uint64_t { 3090 }, bh.last_valid_block_height);
        };
        "signature status"_test = [] {
            const auto st = rpc::decode_signature_status(parse(R"({"context":{"slot":82},"value":[{"slot":72,"confirmations":10,"err":null,"status":{"Ok":null},"confirmationStatus":"confirmed"}]})"));
            expect(st.has_value() >> fatal);
            test_same(uint64_t { 72 }, st->slot);
            expect(!st->err);
            expect(st->confirmed());
            const auto failed = rpc::decode_signature_status(parse(R"({"context":{"slot":82},"value":[{"slot":48,"confirmations":null,"err":{"InstructionError":[0,"InsufficientFunds"]},"confirmationStatus":"finalized"}]})"));
            expect(failed.has_value() >> fatal);
            expect(failed->err.has_value());
            const auto processed = rpc::decode_signature_status(parse(R"({"context":{"slot":82},"value":[{"slot":81,"confirmations":0,"err":null,"confirmationStatus":"processed"}]})"));
            expect(processed.has_value() >> fatal);
            expect(!processed->confirmed());
            expect(!rpc::decode_signature_status(parse(R"({"context":{"slot":82},"value":[null]})")).has_value());
        };
        "confirm"_test = [] {
            rpc::client_mock c {};
            c.statuses = { std::nullopt, rpc::signature_status { 10, 0, {}, "processed" }, rpc::signature_status { 11, 1, {}, "confirmed" } };
            c.block_heights = { 900 };
            expect(nothrow([&] { c.confirm_transaction("sig", 1000); }));
            test_same(size_t { 3 }, c.calls.signature_status);
            test_same(size_t { 2 }, c.calls.block_height);
        };
        "confirm on-chain failure"_test = [] {
            rpc::client_mock c {};
            c.statuses = { rpc::signature_status { 10, {}, "{\"InstructionError\":[0,\"InsufficientFunds\"]}", "finalized" } };
            expect(throws<network_error>([&] { c.confirm_transaction("sig", 1000); }));
        };
        "confirm timeout"_test = [] {
            rpc::client_mock c {};
            c.statuses = { std::nullopt };
            c.block_heights = { 999, 1000, 1001 };
            expect(throws<confirmation_timeout_error>([&] { c.confirm_transaction("sig", 1000); }));
            test_same(size_t { 3 }, c.calls.block_height);
            // one final status check after the height bound is passed
            test_same(size_t { 4 }, c.calls.signature_status);
        };
        "confirm after the height bound"_test = [] {
            rpc::client_mock c {};
            c.statuses = { std::nullopt, rpc::signature_status { 12, 1, {}, "confirmed" } };
            c.block_heights = { 1001 };
            expect(nothrow([&] { c.confirm_transaction("sig", 1000); }));
            test_same(size_t { 2 }, c.calls.signature_status);
            test_same(size_t { 1 }, c.calls.block_height);
        };
        "failure after the height bound"_test = [] {
            rpc::client_mock c {};
            c.statuses = { std::nullopt, rpc::signature_status { 12, {}, "{\"InstructionError\":[0,\"Custom\"]}", "confirmed" } };
            c.block_heights = { 1001 };
            expect(throws<network_error>([&] { c.confirm_transaction("sig", 1000); }));
        };
        "http client endpoint validation"_test = [] {
            expect(throws<network_error>([] { rpc::client_http c { "ftp://example.com" }; }));
            expect(nothrow([] { rpc::client_http c { "https://api.devnet.solana.com" }; }));
        };
        "http client transport failure"_test = [] {
            const rpc::client_http c { "http://127.0.0.1:1", std::chrono::milliseconds { 2000 } };
            expect(throws<network_error>([&] { c.get_block_height(); }));
        };
        "http client shared between threads"_test = [] {
            const rpc::client_http c { "http://127.0.0.1:1", std::chrono::milliseconds { 2000 } };
            std::atomic_size_t failures { 0 };
            std::vector<std::thread> workers {};
            for (size_t i = 0; i < 4; ++i) {
                workers.emplace_back([&] {
                    try {
                        c.get_block_height();
                    } catch (const network_error &) {
                        ++failures;
                    }
                });
            }
            for (auto &w: workers)
                w.join();
            test_same(size_t { 4 }, failures.load());
        };
        "config"_test = [] {
            configs_mock::map_type cfg_data {};
            cfg_data.emplace("rpc", json::object {
                { "endpoint", "https://api.mainnet-beta.solana.com" },
                { "timeout-ms", 5000 },
                { "confirm-poll-ms", 250 }
            });
            const configs_mock cfg { std::move(cfg_data) };
            const auto c = rpc::client_http::from_config(cfg);
            test_same(std::string { "https://api.mainnet-beta.solana.com" }, c.endpoint());
            test_same(std::chrono::milliseconds { 250 }, c.confirm_poll_interval());
            const auto c2 = rpc::client_http::from_config(cfg, "http://localhost:8899");
            test_same(std::string { "http://localhost:8899" }, c2.endpoint());
        };
    };
};
