/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/base58.hpp>
#include <ds/solana/transaction.hpp>

namespace delegation_scout::solana {
    static constexpr uint32_t system_transfer_tag = 2;

    template<typename T>
    static void write_le(uint8_vector &out, T val)
    {
        for (size_t i = 0; i < sizeof(T); ++i) {
            out << static_cast<uint8_t>(val & 0xFF);
            val >>= 8;
        }
    }

    void write_compact_u16(uint8_vector &out, size_t val)
    {
        if (val > 0xFFFF)
            throw error(fmt::format("value {} does not fit into a compact-u16", val));
        for (;;) {
            const auto b = static_cast<uint8_t>(val & 0x7F);
            val >>= 7;
            if (!val) {
                out << b;
                break;
            }
            out << static_cast<uint8_t>(b | 0x80);
        }
    }

    uint8_vector message::serialize() const
    {
        uint8_vector out {};
        out << header.num_required_signatures << header.num_readonly_signed << header.num_readonly_unsigned;
        write_compact_u16(out, account_keys.size());
        for (const auto &k: account_keys)
            out << k;
        out << recent_blockhash;
        write_compact_u16(out, instructions.size());
        for (const auto &ix: instructions) {
            if (ix.program_id_index >= account_keys.size())
                throw error(fmt::format("program index {} is outside of the {} account keys", ix.program_id_index, account_keys.size()));
            out << ix.program_id_index;
            write_compact_u16(out, ix.accounts.size());
            for (const auto idx: ix.accounts)
                out << idx;
            write_compact_u16(out, ix.data.size());
            out << ix.data;
        }
        return out;
    }

    transaction transaction::unsigned_for(solana::message &&msg)
    {
        transaction tx {};
        tx.signatures.resize(msg.header.num_required_signatures);
        tx.message = std::move(msg);
        return tx;
    }

    const pubkey &transaction::fee_payer() const
    {
        if (message.account_keys.empty())
            throw error("a transaction message has no account keys!");
        return message.account_keys.front();
    }

    uint8_vector transaction::message_bytes() const
    {
        return message.serialize();
    }

    uint8_vector transaction::serialize() const
    {
        if (signatures.size() != message.header.num_required_signatures)
            throw error(fmt::format("the transaction requires {} signatures but has {}", message.header.num_required_signatures, signatures.size()));
        uint8_vector out {};
        write_compact_u16(out, signatures.size());
        for (const auto &sig: signatures)
            out << sig;
        out << message.serialize();
        return out;
    }

    std::string transaction::id() const
    {
        if (signatures.empty())
            throw error("a transaction without signatures has no id!");
        return base58::encode(signatures.front());
    }

    bool transaction::verify() const
    {
        if (signatures.size() != message.header.num_required_signatures || message.account_keys.size() < signatures.size())
            return false;
        const auto msg = message.serialize();
        for (size_t i = 0; i < signatures.size(); ++i) {
            if (!ed25519::verify(signatures[i], message.account_keys[i], msg))
                return false;
        }
        return true;
    }

    transaction system_transfer(const pubkey &from, const pubkey &to, const uint64_t lamports, const blockhash &recent_blockhash)
    {
        solana::message msg {};
        msg.header = { 1, 0, 1 };
        msg.recent_blockhash = recent_blockhash;
        compiled_instruction ix {};
        msg.account_keys.emplace_back(from);
        if (to != from) {
            msg.account_keys.emplace_back(to);
            ix.accounts = { 0, 1 };
        } else {
            ix.accounts = { 0, 0 };
        }
        msg.account_keys.emplace_back(system_program);
        ix.program_id_index = static_cast<uint8_t>(msg.account_keys.size() - 1);
        write_le<uint32_t>(ix.data, system_transfer_tag);
        write_le<uint64_t>(ix.data, lamports);
        msg.instructions.emplace_back(std::move(ix));
        return transaction::unsigned_for(std::move(msg));
    }
}
