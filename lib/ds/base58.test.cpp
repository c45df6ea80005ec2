/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/common/test.hpp>
#include <ds/base58.hpp>

using namespace delegation_scout;

suite base58_suite = [] {
    "base58"_test = [] {
        static std::vector<std::pair<std::string_view, uint8_vector>> test_vectors {
            { "", uint8_vector {} },
            { "1", uint8_vector::from_hex("00") },
            { "11233QC4", uint8_vector::from_hex("0000287fb4cd") },
            { "2NEpo7TZRRrLZSi2U", uint8_vector { buffer { std::string_view { "Hello World!" } } } },
            { "11111111111111111111111111111111", uint8_vector(32, 0) }
        };
        "encode"_test = [] {
            for (const auto &[exp, in]: test_vectors)
                test_same(exp, std::string_view { base58::encode(in) });
        };
        "decode"_test = [] {
            for (const auto &[in, exp]: test_vectors) {
                const auto out = base58::decode(in);
                expect(out == exp) << in << out;
            }
        };
        "solana key"_test = [] {
            const auto bytes = base58::decode("9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM");
            expect(bytes.size() == 32_ull);
            test_same(std::string { "9WzDXwBbmkg8ZTbNMqUxvQRAyrZzDsGYdLVL9zYtAWWM" }, base58::encode(bytes));
        };
        "invalid characters"_test = [] {
            // 0, O, I and l are not part of the alphabet
            expect(throws([] { base58::decode("0abc"); }));
            expect(throws([] { base58::decode("abcO"); }));
            expect(throws([] { base58::decode("Il"); }));
            expect(throws([] { base58::decode("not-a-key"); }));
            expect(throws([] { base58::decode("\xff"); }));
        };
    };
};
