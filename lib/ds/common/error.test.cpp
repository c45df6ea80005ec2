/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <cerrno>
#include <optional>
#include <ds/common/test.hpp>
#include <ds/common/error.hpp>

using namespace delegation_scout;

template<typename E=error, typename F>
void expect_throws_msg(const F &f, const std::string &matches, const std::source_location &src_loc=std::source_location::current())
{
    expect(boost::ut::throws<E>(f)) << "no exception has been thrown";
    std::optional<std::string> msg {};
    try {
        f();
    } catch (E &ex) {
        msg = ex.what();
    }
    expect((bool)msg) << "exception message is empty";
    if (msg) {
        const auto descr = fmt::format("'{}' does not contain '{}' from {}:{}", *msg, matches, src_loc.file_name(), src_loc.line());
        test_same(descr, true, msg->starts_with(matches));
    }
}

suite error_suite = [] {
    "error"_test = [] {
        "no_args"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, "Hello!");
        };
        "integers"_test = [] {
            expect_throws_msg([] { throw error(fmt::format("Hello {}!", 123)); }, "Hello 123!");
        };
        "buffer"_test = [] {
            byte_array<4> buf { 0xDE, 0xAD, 0xBE, 0xEF };
            expect_throws_msg([&] { throw error(fmt::format("Hello {}!", buf)); }, "Hello DEADBEEF!");
        };
        "error_sys_fail"_test = [] {
            expect_throws_msg([&] { errno = 2; throw error_sys(fmt::format("Hello {}!", "world")); }, "Hello world! errno: 2 strerror: No such file or directory");
        };
        "cause"_test = [] {
            expect_throws_msg([] {
                try {
                    throw std::runtime_error("connection reset");
                } catch (const std::exception &ex) {
                    throw error("rpc call failed", ex);
                }
            }, "rpc call failed caused by");
        };
        "kinds"_test = [] {
            expect_throws_msg<network_error>([] { throw network_error("rpc unreachable"); }, "rpc unreachable");
            expect(throws<error>([] { throw invalid_input_error("bad key"); }));
            expect(throws<error>([] { throw derivation_error("no bump"); }));
            expect(throws<error>([] { throw signing_rejected_error("declined"); }));
            expect(throws<error>([] { throw confirmation_timeout_error("expired"); }));
            expect(throws<invalid_input_error>([] { throw invalid_input_error("bad key"); }));
        };
    };
};
