/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_SOLANA_SIGNER_HPP
#define DELEGATION_SCOUT_SOLANA_SIGNER_HPP

#include <ds/solana/transaction.hpp>

namespace delegation_scout::solana {
    // Signs an unsigned transaction or throws. Implementations may hold keys elsewhere
    // such as in a hardware wallet or a remote agent.
    struct signer {
        virtual ~signer() =default;

        [[nodiscard]] pubkey public_key() const
        {
            return _public_key_impl();
        }

        [[nodiscard]] transaction sign(const transaction &tx) const
        {
            return _sign_impl(tx);
        }
    private:
        virtual pubkey _public_key_impl() const =0;
        virtual transaction _sign_impl(const transaction &tx) const =0;
    };

    struct keypair_signer: signer {
        // a Solana CLI keypair file: a JSON array of 64 integers, the seed followed by the public key
        static keypair_signer from_file(const std::string &path);

        explicit keypair_signer(const buffer &seed);
    private:
        ed25519::skey _sk {};
        pubkey _vk {};

        pubkey _public_key_impl() const override;
        transaction _sign_impl(const transaction &tx) const override;
    };
}

#endif // !DELEGATION_SCOUT_SOLANA_SIGNER_HPP
