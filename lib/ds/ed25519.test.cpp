/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/common/test.hpp>
#include <ds/base58.hpp>
#include <ds/ed25519.hpp>
#include <ds/sha2.hpp>

using namespace delegation_scout;

suite ed25519_suite = [] {
    "ed25519"_test = [] {
        "sha256"_test = [] {
            test_same(sha2::hash_256::from_hex("E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855"), sha2::digest(std::string_view { "" }));
            test_same(sha2::hash_256::from_hex("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"), sha2::digest(std::string_view { "abc" }));
        };
        "create-sign-verify"_test = [] {
            ed25519::skey sk1 {}, sk2 {};
            ed25519::vkey vk1 {}, vk2 {};
            ed25519::create(sk1, vk1);
            ed25519::create(sk2, vk2);
            expect(vk1 != vk2);
            const std::string msg1 { "message1" }, msg2 { "message2" };
            const auto sig11 = ed25519::sign(msg1, sk1);
            const auto sig12 = ed25519::sign(msg2, sk1);
            const auto sig21 = ed25519::sign(msg1, sk2);
            expect(sig11 != sig12);
            expect(sig11 != sig21);
            expect(ed25519::verify(sig11, vk1, msg1));
            expect(!ed25519::verify(sig11, vk2, msg1));
            expect(!ed25519::verify(sig11, vk1, msg2));
            expect(ed25519::verify(sig12, vk1, msg2));
            expect(ed25519::verify(sig21, vk2, msg1));
            expect(!ed25519::verify(sig21, vk1, msg1));
        };
        "extract-vkey"_test = [] {
            ed25519::skey sk {};
            ed25519::vkey vk {};
            ed25519::create(sk, vk);
            test_same(vk, ed25519::extract_vk(sk));
        };
        "create-seed"_test = [] {
            const ed25519::seed seed1 { sha2::digest(std::string_view { "1" }) };
            const ed25519::seed seed2 { sha2::digest(std::string_view { "2" }) };
            const auto [sk1, vk1] = ed25519::create_from_seed(seed1);
            const auto [sk2, vk2] = ed25519::create_from_seed(seed2);
            expect(vk1 != vk2);
            const auto [sk1b, vk1b] = ed25519::create_from_seed(seed1);
            test_same(vk1, vk1b);
            expect(throws([] { ed25519::create_from_seed(uint8_vector(31, 0)); }));
        };
        "on_curve"_test = [] {
            // the base point and the neutral element
            expect(ed25519::on_curve(ed25519::vkey::from_hex("5866666666666666666666666666666666666666666666666666666666666666")));
            expect(ed25519::on_curve(ed25519::vkey::from_hex("0100000000000000000000000000000000000000000000000000000000000000")));
            // the sign bit does not affect membership
            expect(ed25519::on_curve(ed25519::vkey::from_hex("58666666666666666666666666666666666666666666666666666666666666E6")));
            for (size_t i = 0; i < 16; ++i) {
                ed25519::skey sk {};
                ed25519::vkey vk {};
                ed25519::create(sk, vk);
                expect(ed25519::on_curve(vk));
            }
            // a program-derived address is off the curve by construction
            expect(!ed25519::on_curve(base58::decode("88y18jrwLGFqrpqa8VFMSn9usivy5AnPNErfEofnmyTG")));
            // y = 2: (y^2 - 1) / (d*y^2 + 1) is not a square
            expect(!ed25519::on_curve(ed25519::vkey::from_hex("0200000000000000000000000000000000000000000000000000000000000000")));
            expect(throws([] { ed25519::on_curve(uint8_vector(31, 0)); }));
        };
        "on_curve mixed"_test = [] {
            // roughly half of all 32-byte strings encode a curve point
            size_t on = 0, off = 0;
            for (size_t i = 0; i < 64; ++i) {
                const auto h = sha2::digest(fmt::format("candidate-{}", i));
                if (ed25519::on_curve(h))
                    ++on;
                else
                    ++off;
            }
            expect(on > 0);
            expect(off > 0);
        };
    };
};
