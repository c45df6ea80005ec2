/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/delegation/result.hpp>

namespace delegation_scout::delegation {
    static json::array byte_list(const buffer &bytes)
    {
        json::array arr {};
        arr.reserve(bytes.size());
        for (const auto b: bytes)
            arr.emplace_back(static_cast<uint64_t>(b));
        return arr;
    }

    json::object result::to_json() const
    {
        json::object j {
            { "accountPubkey", account },
            { "delegationPDA", pda ? pda->address.to_base58() : std::string {} },
            { "status", fmt::format("{}", status) }
        };
        if (validator_identity)
            j.emplace("validatorIdentity", validator_identity->to_base58());
        if (pda_account) {
            j.emplace("pdaAccount", json::object {
                { "lamports", pda_account->lamports },
                { "owner", pda_account->owner.to_base58() },
                { "dataLength", pda_account->data_length },
                { "executable", pda_account->executable },
                { "rentEpoch", pda_account->rent_epoch }
            });
        }
        if (raw_data) {
            j.emplace("rawData", json::object {
                { "discriminator", byte_list(raw_data->discriminator) },
                { "identityBytes", byte_list(raw_data->identity) }
            });
        }
        return j;
    }
}
