/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <thread>
#include <ds/base64.hpp>
#include <ds/logger.hpp>
#include <ds/solana/rpc.hpp>

namespace delegation_scout::solana::rpc {
    // structural errors in responses surface as boost exceptions and are reported as network_error
    template<typename F>
    static auto decode(const std::string_view what, const F &f) -> decltype(f())
    {
        try {
            return f();
        } catch (const network_error &) {
            throw;
        } catch (const std::exception &ex) {
            throw network_error(fmt::format("malformed {} response", what), ex);
        }
    }

    json::value response_result(const std::string_view method, const json::value &resp)
    {
        return decode(method, [&] {
            const auto &obj = resp.as_object();
            if (const auto *err = obj.if_contains("error"); err && !err->is_null()) {
                const auto &err_obj = err->as_object();
                const auto *msg = err_obj.if_contains("message");
                throw network_error(fmt::format("{} failed with RPC error {}: {}", method,
                    err_obj.contains("code") ? json::serialize(err_obj.at("code")) : std::string { "unknown" },
                    msg && msg->is_string() ? std::string { static_cast<std::string_view>(msg->as_string()) } : json::serialize(*err)));
            }
            if (!obj.contains("result"))
                throw network_error(fmt::format("{} response has neither a result nor an error", method));
            return obj.at("result");
        });
    }

    std::optional<account_info> decode_account_info(const json::value &result)
    {
        return decode("getAccountInfo", [&]() -> std::optional<account_info> {
            const auto &val = result.at("value");
            if (val.is_null())
                return {};
            account_info info {};
            info.lamports = val.at("lamports").to_number<uint64_t>();
            info.owner = pubkey::from_base58(static_cast<std::string_view>(val.at("owner").as_string()));
            const auto &data = val.at("data").as_array();
            if (data.size() != 2 || static_cast<std::string_view>(data.at(1).as_string()) != "base64")
                throw network_error(fmt::format("unsupported account data encoding: {}", json::serialize(data)));
            info.data = base64::decode(static_cast<std::string_view>(data.at(0).as_string()));
            info.executable = val.at("executable").as_bool();
            info.rent_epoch = val.at("rentEpoch").to_number<uint64_t>();
            return info;
        });
    }

    latest_blockhash decode_latest_blockhash(const json::value &result)
    {
        return decode("getLatestBlockhash", [&] {
            const auto &val = result.at("value");
            return latest_blockhash {
                pubkey::from_base58(static_cast<std::string_view>(val.at("blockhash").as_string())),
                val.at("lastValidBlockHeight").to_number<uint64_t>()
            };
        });
    }

    std::optional<signature_status> decode_signature_status(const json::value &result)
    {
        return decode("getSignatureStatuses", [&]() -> std::optional<signature_status> {
            const auto &vals = result.at("value").as_array();
            if (vals.size() != 1)
                throw network_error(fmt::format("expected one signature status but got {}", vals.size()));
            const auto &val = vals.at(0);
            if (val.is_null())
                return {};
            signature_status st {};
            st.slot = val.at("slot").to_number<uint64_t>();
            if (const auto &conf = val.at("confirmations"); !conf.is_null())
                st.confirmations = conf.to_number<uint64_t>();
            if (const auto *err = val.as_object().if_contains("err"); err && !err->is_null())
                st.err = json::serialize(*err);
            if (const auto *cs = val.as_object().if_contains("confirmationStatus"); cs && cs->is_string())
                st.confirmation_status = static_cast<std::string_view>(cs->as_string());
            return st;
        });
    }

    void client::confirm_transaction(const std::string &sig, const uint64_t last_valid_block_height) const
    {
        const auto check_status = [&] {
            if (const auto st = get_signature_status(sig); st) {
                if (st->err)
                    throw network_error(fmt::format("transaction {} failed on chain: {}", sig, *st->err));
                if (st->confirmed()) {
                    logger::debug("transaction {} confirmed at slot {}", sig, st->slot);
                    return true;
                }
            }
            return false;
        };
        for (;;) {
            if (check_status())
                return;
            if (const auto height = get_block_height(); height > last_valid_block_height) {
                // the transaction may have landed between the two polls
                if (check_status())
                    return;
                throw confirmation_timeout_error(fmt::format("transaction {} was not confirmed before block height {}: the current height is {}",
                    sig, last_valid_block_height, height));
            }
            std::this_thread::sleep_for(_confirm_poll_interval);
        }
    }

    client_http client_http::from_config(const configs &cfg, const std::optional<std::string> &endpoint)
    {
        const auto &rpc_cfg = cfg.at("rpc");
        const auto url = endpoint ? *endpoint : std::string { static_cast<std::string_view>(rpc_cfg.at("endpoint").as_string()) };
        const std::chrono::milliseconds timeout { rpc_cfg.at("timeout-ms").to_number<uint64_t>() };
        const std::chrono::milliseconds poll { rpc_cfg.at("confirm-poll-ms").to_number<uint64_t>() };
        return client_http { url, timeout, poll };
    }

    client_http::client_http(std::string endpoint, const std::chrono::milliseconds timeout, const std::chrono::milliseconds confirm_poll_interval)
        : client { confirm_poll_interval }, _endpoint { std::move(endpoint) }, _http { timeout }
    {
        // validate the endpoint early
        http::parse_url(_endpoint);
    }

    json::value client_http::call(const std::string_view method, json::array params) const
    {
        const auto id = _next_id++;
        const json::object req {
            { "jsonrpc", "2.0" },
            { "id", id },
            { "method", method },
            { "params", std::move(params) }
        };
        const auto req_text = json::serialize(req);
        logger::trace("RPC request to {}: {}", _endpoint, req_text);
        const auto resp = _http.post(_endpoint, req_text);
        logger::trace("RPC response from {} HTTP status {}: {}", _endpoint, resp.status, resp.body);
        if (!resp.ok())
            throw network_error(fmt::format("{} to {} failed with HTTP status {}: {}", method, _endpoint, resp.status, resp.body));
        json::value parsed {};
        try {
            parsed = json::parse(buffer { resp.body });
        } catch (const std::exception &ex) {
            throw network_error(fmt::format("{} to {} returned a response that is not JSON", method, _endpoint), ex);
        }
        return response_result(method, parsed);
    }

    std::optional<account_info> client_http::_get_account_info_impl(const pubkey &address) const
    {
        return decode_account_info(call("getAccountInfo", json::array {
            address.to_base58(),
            json::object { { "encoding", "base64" }, { "commitment", "confirmed" } }
        }));
    }

    latest_blockhash client_http::_get_latest_blockhash_impl() const
    {
        return decode_latest_blockhash(call("getLatestBlockhash", json::array {
            json::object { { "commitment", "confirmed" } }
        }));
    }

    std::string client_http::_send_transaction_impl(const transaction &tx) const
    {
        const auto res = call("sendTransaction", json::array {
            base64::encode(tx.serialize()),
            json::object { { "encoding", "base64" }, { "preflightCommitment", "confirmed" } }
        });
        return decode("sendTransaction", [&] { return std::string { static_cast<std::string_view>(res.as_string()) }; });
    }

    std::optional<signature_status> client_http::_get_signature_status_impl(const std::string &sig) const
    {
        return decode_signature_status(call("getSignatureStatuses", json::array {
            json::array { sig },
            json::object { { "searchTransactionHistory", false } }
        }));
    }

    uint64_t client_http::_get_block_height_impl() const
    {
        const auto res = call("getBlockHeight", json::array {
            json::object { { "commitment", "confirmed" } }
        });
        return decode("getBlockHeight", [&] { return res.to_number<uint64_t>(); });
    }
}
