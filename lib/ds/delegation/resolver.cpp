/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/delegation/resolver.hpp>
#include <ds/logger.hpp>

namespace delegation_scout::delegation {
    resolver::resolver(const solana::rpc::client &client): _client { client }
    {
    }

    result resolver::resolve(const std::string_view account) const
    {
        const auto key = solana::pubkey::from_base58(account);
        const auto addr = record_address(key);
        logger::debug("the delegation record of {} is at {}", account, addr);
        result res { std::string { account }, addr };
        const auto info = _client.get_account_info(addr.address);
        if (!info || info->lamports == 0) {
            logger::info("{} is not delegated: the record account {}", account, info ? "has no lamports" : "does not exist");
            return res;
        }
        res.pda_account = account_meta { info->lamports, info->owner, info->data.size(), info->executable, info->rent_epoch };
        if (const auto rec = decode_record(info->data); rec) {
            res.status = status::delegated;
            res.validator_identity = rec->validator_identity;
            res.raw_data = raw_fields { rec->discriminator, rec->validator_identity };
            logger::info("{} is delegated to validator {}", account, rec->validator_identity);
        } else {
            logger::info("{} is not delegated: the record account holds {} bytes instead of {}", account, info->data.size(), record_size);
        }
        return res;
    }

    std::vector<result> resolver::resolve_many(const std::vector<std::string> &accounts) const
    {
        logger::info("checking the delegation status of {} accounts", accounts.size());
        std::vector<result> res {};
        res.reserve(accounts.size());
        const auto add_placeholder = [&](const std::string &account, const error &ex) {
            logger::warn("failed to check the delegation status of {}: {}", account, ex.what());
            res.emplace_back(result::placeholder(account));
        };
        for (const auto &account: accounts) {
            try {
                res.emplace_back(resolve(account));
            } catch (const invalid_input_error &ex) {
                add_placeholder(account, ex);
            } catch (const network_error &ex) {
                add_placeholder(account, ex);
            } catch (const derivation_error &ex) {
                add_placeholder(account, ex);
            }
        }
        return res;
    }

    result resolve(const std::string_view account, const std::optional<std::string> &endpoint)
    {
        const auto key = solana::pubkey::from_base58(account);
        const auto client = solana::rpc::client_http::from_config(configs_dir::get(), endpoint);
        logger::info("checking the delegation status of {} using {}", key, client.endpoint());
        return resolver { client }.resolve(account);
    }

    std::vector<result> resolve_many(const std::vector<std::string> &accounts, const std::optional<std::string> &endpoint)
    {
        const auto client = solana::rpc::client_http::from_config(configs_dir::get(), endpoint);
        logger::info("using RPC endpoint {}", client.endpoint());
        return resolver { client }.resolve_many(accounts);
    }
}
