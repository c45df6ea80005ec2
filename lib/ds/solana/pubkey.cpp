/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/base58.hpp>
#include <ds/solana/pubkey.hpp>

namespace delegation_scout::solana {
    const pubkey system_program {};

    pubkey pubkey::from_base58(const std::string_view text)
    {
        uint8_vector bytes {};
        try {
            bytes = base58::decode(text);
        } catch (const error &ex) {
            throw invalid_input_error(fmt::format("'{}' is not a valid account key", text), ex);
        }
        if (bytes.size() != sizeof(pubkey))
            throw invalid_input_error(fmt::format("'{}' is not a valid account key: it decodes to {} bytes instead of {}", text, bytes.size(), sizeof(pubkey)));
        return pubkey { static_cast<buffer>(bytes) };
    }

    std::string pubkey::to_base58() const
    {
        return base58::encode(*this);
    }
}
