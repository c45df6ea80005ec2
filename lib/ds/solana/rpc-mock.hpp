/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_SOLANA_RPC_MOCK_HPP
#define DELEGATION_SCOUT_SOLANA_RPC_MOCK_HPP

#include <map>
#include <set>
#include <vector>
#include <ds/solana/rpc.hpp>

namespace delegation_scout::solana::rpc {
    // An in-memory node: accounts are keyed by their base58 address
    struct client_mock: client {
        struct call_counts {
            size_t account_info = 0;
            size_t latest_blockhash = 0;
            size_t send_transaction = 0;
            size_t signature_status = 0;
            size_t block_height = 0;

            [[nodiscard]] size_t total() const noexcept
            {
                return account_info + latest_blockhash + send_transaction + signature_status + block_height;
            }
        };

        std::map<std::string, account_info> accounts {};
        // addresses whose reads fail with network_error
        std::set<std::string> failing_accounts {};
        rpc::latest_blockhash recent_blockhash { pubkey { byte_array<32>::from_hex("0101010101010101010101010101010101010101010101010101010101010101") }, 1000 };
        std::optional<std::string> send_error {};
        // answers to consecutive polls; the last one repeats
        std::vector<std::optional<signature_status>> statuses { signature_status { 1, {}, {}, "confirmed" } };
        std::vector<uint64_t> block_heights { 900 };
        mutable std::vector<transaction> sent {};
        mutable call_counts calls {};

        client_mock(): client { std::chrono::milliseconds { 0 } }
        {
        }

        void add_account(const pubkey &address, account_info &&info)
        {
            accounts.insert_or_assign(address.to_base58(), std::move(info));
        }
    private:
        template<typename T>
        static const T &_next(const std::vector<T> &answers, size_t idx)
        {
            if (answers.empty())
                throw error("client_mock: no answers configured!");
            return answers.at(std::min(idx, answers.size() - 1));
        }

        std::optional<account_info> _get_account_info_impl(const pubkey &address) const override
        {
            ++calls.account_info;
            const auto addr = address.to_base58();
            if (failing_accounts.contains(addr))
                throw network_error(fmt::format("client_mock: failed to read account {}", addr));
            if (const auto it = accounts.find(addr); it != accounts.end())
                return it->second;
            return {};
        }

        latest_blockhash _get_latest_blockhash_impl() const override
        {
            ++calls.latest_blockhash;
            return recent_blockhash;
        }

        std::string _send_transaction_impl(const transaction &tx) const override
        {
            ++calls.send_transaction;
            if (send_error)
                throw network_error(fmt::format("client_mock: sendTransaction failed: {}", *send_error));
            sent.emplace_back(tx);
            return tx.id();
        }

        std::optional<signature_status> _get_signature_status_impl(const std::string &) const override
        {
            return _next(statuses, calls.signature_status++);
        }

        uint64_t _get_block_height_impl() const override
        {
            return _next(block_heights, calls.block_height++);
        }
    };
}

#endif // !DELEGATION_SCOUT_SOLANA_RPC_MOCK_HPP
