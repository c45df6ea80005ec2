/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_SOLANA_TRANSACTION_HPP
#define DELEGATION_SCOUT_SOLANA_TRANSACTION_HPP

#include <vector>
#include <ds/ed25519.hpp>
#include <ds/solana/pubkey.hpp>

namespace delegation_scout::solana {
    // a recent block hash has the same 32-byte base58 text form as an account key
    using blockhash = pubkey;
    using signature = ed25519::signature;

    extern void write_compact_u16(uint8_vector &out, size_t val);

    struct message_header {
        uint8_t num_required_signatures = 0;
        uint8_t num_readonly_signed = 0;
        uint8_t num_readonly_unsigned = 0;

        bool operator==(const message_header &o) const =default;
    };

    struct compiled_instruction {
        uint8_t program_id_index = 0;
        std::vector<uint8_t> accounts {};
        uint8_vector data {};

        bool operator==(const compiled_instruction &o) const =default;
    };

    // the legacy message layout
    struct message {
        message_header header {};
        std::vector<pubkey> account_keys {};
        blockhash recent_blockhash {};
        std::vector<compiled_instruction> instructions {};

        bool operator==(const message &o) const =default;
        [[nodiscard]] uint8_vector serialize() const;
    };

    struct transaction {
        std::vector<signature> signatures {};
        solana::message message {};

        // a transaction with zeroed signatures for every required signer
        static transaction unsigned_for(solana::message &&msg);

        [[nodiscard]] const pubkey &fee_payer() const;
        [[nodiscard]] uint8_vector message_bytes() const;
        [[nodiscard]] uint8_vector serialize() const;
        // the fee payer's signature in base58: the transaction id
        [[nodiscard]] std::string id() const;
        [[nodiscard]] bool verify() const;
    };

    // a system-program transfer with the fee paid by the sender
    extern transaction system_transfer(const pubkey &from, const pubkey &to, uint64_t lamports, const blockhash &recent_blockhash);
}

#endif // !DELEGATION_SCOUT_SOLANA_TRANSACTION_HPP
