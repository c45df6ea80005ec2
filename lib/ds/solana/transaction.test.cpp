/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/common/test.hpp>
#include <ds/base58.hpp>
#include <ds/sha2.hpp>
#include <ds/solana/transaction.hpp>

using namespace delegation_scout;
using namespace delegation_scout::solana;

suite solana_transaction_suite = [] {
    "solana::transaction"_test = [] {
        const auto from = pubkey::from_base58("9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM");
        const auto to = pubkey::from_base58("DELeGGvXpWV2fqJUhqcF5ZSYMS4JTLjteaAMARRSaeSh");
        const blockhash bh { sha2::digest(std::string_view { "blockhash" }) };
        "compact-u16"_test = [] {
            static std::vector<std::pair<size_t, uint8_vector>> test_vectors {
                { 0x0000, uint8_vector::from_hex("00") },
                { 0x007F, uint8_vector::from_hex("7f") },
                { 0x0080, uint8_vector::from_hex("8001") },
                { 0x00FF, uint8_vector::from_hex("ff01") },
                { 0x3FFF, uint8_vector::from_hex("ff7f") },
                { 0x4000, uint8_vector::from_hex("808001") },
                { 0xFFFF, uint8_vector::from_hex("ffff03") }
            };
            for (const auto &[val, exp]: test_vectors) {
                uint8_vector out {};
                write_compact_u16(out, val);
                expect(out == exp) << val << out;
            }
            uint8_vector out {};
            expect(throws([&] { write_compact_u16(out, 0x10000); }));
        };
        "system transfer layout"_test = [&] {
            const auto tx = system_transfer(from, to, 0, bh);
            test_same(size_t { 1 }, tx.signatures.size());
            test_same(from, tx.fee_payer());
            const auto msg = tx.message_bytes();
            test_same(size_t { 150 }, msg.size());
            const buffer m { msg };
            test_same(buffer { uint8_vector::from_hex("01000103") }, m.subbuf(0, 4));
            test_same(static_cast<buffer>(from), m.subbuf(4, 32));
            test_same(static_cast<buffer>(to), m.subbuf(36, 32));
            test_same(static_cast<buffer>(system_program), m.subbuf(68, 32));
            test_same(static_cast<buffer>(bh), m.subbuf(100, 32));
            test_same(buffer { uint8_vector::from_hex("01020200010c020000000000000000000000") }, m.subbuf(132));
            const auto raw = tx.serialize();
            test_same(size_t { 1 + 64 + 150 }, raw.size());
            test_same(uint8_t { 1 }, raw[0]);
            test_same(m, buffer { raw }.subbuf(65));
        };
        "lamports encoding"_test = [&] {
            const auto tx = system_transfer(from, to, 0x0102030405060708ULL, bh);
            test_same(uint8_vector::from_hex("020000000807060504030201"), tx.message.instructions.at(0).data);
        };
        "self transfer"_test = [&] {
            const auto tx = system_transfer(from, from, 0, bh);
            test_same(size_t { 2 }, tx.message.account_keys.size());
            const auto &ix = tx.message.instructions.at(0);
            test_same(uint8_t { 1 }, ix.program_id_index);
            expect(ix.accounts == std::vector<uint8_t> { 0, 0 });
            test_same(size_t { 3 + 1 + 64 + 32 + 1 + 1 + 1 + 2 + 1 + 12 }, tx.message_bytes().size());
        };
        "id and verify"_test = [&] {
            auto tx = system_transfer(from, to, 0, bh);
            expect(!tx.verify());
            tx.signatures.at(0) = signature::from_hex("01020304050607080910111213141516171819202122232425262728293031323334353637383940414243444546474849505152535455565758596061626364");
            test_same(base58::encode(tx.signatures.at(0)), tx.id());
            expect(!tx.verify());
            tx.signatures.clear();
            expect(throws([&] { tx.serialize(); }));
            expect(throws([&] { tx.id(); }));
        };
    };
};
