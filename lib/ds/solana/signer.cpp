/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <algorithm>
#include <ds/json.hpp>
#include <ds/logger.hpp>
#include <ds/solana/signer.hpp>

namespace delegation_scout::solana {
    keypair_signer keypair_signer::from_file(const std::string &path)
    {
        secure_byte_array<sizeof(ed25519::skey)> bytes {};
        try {
            const auto j = json::load(path);
            const auto &arr = j.as_array();
            if (arr.size() != bytes.size())
                throw error(fmt::format("expected {} numbers but got {}", bytes.size(), arr.size()));
            for (size_t i = 0; i < arr.size(); ++i) {
                const auto v = arr[i].to_number<uint64_t>();
                if (v > 0xFF)
                    throw error(fmt::format("element #{} is not a byte value: {}", i, v));
                bytes[i] = static_cast<uint8_t>(v);
            }
        } catch (const std::exception &ex) {
            throw invalid_input_error(fmt::format("failed to load the keypair file {}", path), ex);
        }
        keypair_signer s { buffer { bytes.data(), sizeof(ed25519::seed) } };
        if (static_cast<buffer>(s._vk) != static_cast<buffer>(bytes).subbuf(sizeof(ed25519::seed)))
            throw invalid_input_error(fmt::format("the public key in the keypair file {} does not match its secret key", path));
        logger::debug("loaded the keypair of {} from {}", s._vk, path);
        return s;
    }

    keypair_signer::keypair_signer(const buffer &seed)
    {
        std::tie(_sk, _vk) = ed25519::create_from_seed(seed);
    }

    pubkey keypair_signer::_public_key_impl() const
    {
        return _vk;
    }

    transaction keypair_signer::_sign_impl(const transaction &tx) const
    {
        const auto &keys = tx.message.account_keys;
        const auto num_signers = std::min(static_cast<size_t>(tx.message.header.num_required_signatures), keys.size());
        const auto it = std::find(keys.begin(), keys.begin() + num_signers, _vk);
        if (it == keys.begin() + num_signers)
            throw error(fmt::format("{} is not a required signer of the transaction", _vk));
        auto signed_tx = tx;
        signed_tx.signatures.resize(tx.message.header.num_required_signatures);
        signed_tx.signatures[it - keys.begin()] = ed25519::sign(tx.message_bytes(), _sk);
        return signed_tx;
    }
}
