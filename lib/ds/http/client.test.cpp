/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/common/test.hpp>
#include <ds/http/client.hpp>

using namespace delegation_scout;
using namespace delegation_scout::http;

suite http_client_suite = [] {
    "http::client"_test = [] {
        "parse_url"_test = [] {
            {
                const auto u = parse_url("https://api.devnet.solana.com");
                expect(u.tls);
                test_same(std::string { "api.devnet.solana.com" }, u.host);
                test_same(std::string { "443" }, u.port);
                test_same(std::string { "/" }, u.target);
            }
            {
                const auto u = parse_url("http://127.0.0.1:8899/rpc?api-key=abc");
                expect(!u.tls);
                test_same(std::string { "127.0.0.1" }, u.host);
                test_same(std::string { "8899" }, u.port);
                test_same(std::string { "/rpc?api-key=abc" }, u.target);
            }
            {
                const auto u = parse_url("http://localhost/");
                test_same(std::string { "80" }, u.port);
                test_same(std::string { "/" }, u.target);
            }
            expect(throws<network_error>([] { parse_url("ftp://example.com/file"); }));
            expect(throws<network_error>([] { parse_url("not a url"); }));
            expect(throws<network_error>([] { parse_url("http:///path-only"); }));
        };
        "connection refused"_test = [] {
            const client c { std::chrono::milliseconds { 2000 } };
            expect(throws<network_error>([&] { c.post("http://127.0.0.1:1/", "{}"); }));
        };
    };
};
