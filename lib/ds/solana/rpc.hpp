/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_SOLANA_RPC_HPP
#define DELEGATION_SCOUT_SOLANA_RPC_HPP

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <ds/config.hpp>
#include <ds/http/client.hpp>
#include <ds/json.hpp>
#include <ds/solana/transaction.hpp>

namespace delegation_scout::solana::rpc {
    struct account_info {
        uint64_t lamports = 0;
        pubkey owner {};
        uint8_vector data {};
        bool executable = false;
        uint64_t rent_epoch = 0;
    };

    struct latest_blockhash {
        blockhash hash {};
        uint64_t last_valid_block_height = 0;
    };

    struct signature_status {
        uint64_t slot = 0;
        std::optional<uint64_t> confirmations {};
        // the serialized on-chain error when the transaction failed
        std::optional<std::string> err {};
        std::string confirmation_status {};

        [[nodiscard]] bool confirmed() const noexcept
        {
            // nodes that predate confirmationStatus report rooted transactions with null confirmations
            if (confirmation_status.empty())
                return !confirmations;
            return confirmation_status == "confirmed" || confirmation_status == "finalized";
        }
    };

    // Decoders of the "result" member of JSON-RPC responses; malformed input throws network_error
    extern json::value response_result(std::string_view method, const json::value &resp);
    extern std::optional<account_info> decode_account_info(const json::value &result);
    extern latest_blockhash decode_latest_blockhash(const json::value &result);
    extern std::optional<signature_status> decode_signature_status(const json::value &result);

    // All reads use the "confirmed" commitment level
    struct client {
        explicit client(const std::chrono::milliseconds confirm_poll_interval=std::chrono::milliseconds { 500 })
            : _confirm_poll_interval { confirm_poll_interval }
        {
        }

        virtual ~client() =default;

        [[nodiscard]] std::optional<account_info> get_account_info(const pubkey &address) const
        {
            return _get_account_info_impl(address);
        }

        [[nodiscard]] latest_blockhash get_latest_blockhash() const
        {
            return _get_latest_blockhash_impl();
        }

        // returns the signature reported by the node
        [[nodiscard]] std::string send_transaction(const transaction &tx) const
        {
            return _send_transaction_impl(tx);
        }

        [[nodiscard]] std::optional<signature_status> get_signature_status(const std::string &sig) const
        {
            return _get_signature_status_impl(sig);
        }

        [[nodiscard]] uint64_t get_block_height() const
        {
            return _get_block_height_impl();
        }

        // Polls until the transaction is confirmed. Throws network_error if it failed on chain
        // and confirmation_timeout_error once the block height passes last_valid_block_height.
        void confirm_transaction(const std::string &sig, uint64_t last_valid_block_height) const;

        [[nodiscard]] std::chrono::milliseconds confirm_poll_interval() const noexcept
        {
            return _confirm_poll_interval;
        }
    private:
        const std::chrono::milliseconds _confirm_poll_interval;

        virtual std::optional<account_info> _get_account_info_impl(const pubkey &address) const =0;
        virtual latest_blockhash _get_latest_blockhash_impl() const =0;
        virtual std::string _send_transaction_impl(const transaction &tx) const =0;
        virtual std::optional<signature_status> _get_signature_status_impl(const std::string &sig) const =0;
        virtual uint64_t _get_block_height_impl() const =0;
    };

    struct client_http: client {
        // the endpoint overrides the "endpoint" element of the rpc config when given
        static client_http from_config(const configs &cfg=configs_dir::get(), const std::optional<std::string> &endpoint={});

        explicit client_http(std::string endpoint, std::chrono::milliseconds timeout=std::chrono::milliseconds { 30000 },
            std::chrono::milliseconds confirm_poll_interval=std::chrono::milliseconds { 500 });

        [[nodiscard]] const std::string &endpoint() const noexcept
        {
            return _endpoint;
        }

        // one JSON-RPC 2.0 call: returns the "result" member of the response
        json::value call(std::string_view method, json::array params) const;
    private:
        std::string _endpoint;
        http::client _http;
        mutable std::atomic<uint64_t> _next_id { 1 };

        std::optional<account_info> _get_account_info_impl(const pubkey &address) const override;
        latest_blockhash _get_latest_blockhash_impl() const override;
        std::string _send_transaction_impl(const transaction &tx) const override;
        std::optional<signature_status> _get_signature_status_impl(const std::string &sig) const override;
        uint64_t _get_block_height_impl() const override;
    };
}

#endif // !DELEGATION_SCOUT_SOLANA_RPC_HPP
