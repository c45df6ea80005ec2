/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <ds/delegation/ping.hpp>
#include <ds/logger.hpp>

namespace delegation_scout::delegation {
    json::object receipt::to_json() const
    {
        return json::object {
            { "signature", signature },
            { "blockhash", blockhash.to_base58() },
            { "lastValidBlockHeight", last_valid_block_height }
        };
    }

    static solana::transaction request_signature(const solana::signer &signer, const solana::transaction &tx)
    {
        solana::transaction signed_tx {};
        try {
            signed_tx = signer.sign(tx);
        } catch (const std::exception &ex) {
            throw signing_rejected_error("the signer did not sign the transaction", ex);
        }
        if (signed_tx.message != tx.message)
            throw signing_rejected_error("the signer returned a transaction with a different message");
        if (signed_tx.signatures.size() != tx.signatures.size())
            throw signing_rejected_error(fmt::format("the signer returned {} signatures instead of {}", signed_tx.signatures.size(), tx.signatures.size()));
        if (!signed_tx.verify())
            throw signing_rejected_error(fmt::format("the signature of the fee payer {} does not verify", tx.fee_payer()));
        return signed_tx;
    }

    receipt send_ping(const solana::rpc::client &client, const solana::pubkey &from, const solana::pubkey &to, const solana::signer &signer)
    {
        const auto ctx = fmt::format("ping from {} to {}", from, to);
        try {
            const auto bh = client.get_latest_blockhash();
            logger::debug("{}: using blockhash {} valid until block height {}", ctx, bh.hash, bh.last_valid_block_height);
            const auto tx = solana::system_transfer(from, to, 0, bh.hash);
            const auto signed_tx = request_signature(signer, tx);
            const auto sig = client.send_transaction(signed_tx);
            if (sig != signed_tx.id())
                logger::warn("{}: the node reported signature {} while the transaction id is {}", ctx, sig, signed_tx.id());
            logger::info("{}: submitted transaction {}", ctx, sig);
            client.confirm_transaction(sig, bh.last_valid_block_height);
            logger::info("{}: transaction {} confirmed", ctx, sig);
            return receipt { sig, bh.hash, bh.last_valid_block_height };
        } catch (const signing_rejected_error &ex) {
            throw signing_rejected_error(fmt::format("{} failed", ctx), ex);
        } catch (const confirmation_timeout_error &ex) {
            throw confirmation_timeout_error(fmt::format("{} failed", ctx), ex);
        } catch (const network_error &ex) {
            throw network_error(fmt::format("{} failed", ctx), ex);
        } catch (const std::exception &ex) {
            throw error(fmt::format("{} failed", ctx), ex);
        }
    }

    receipt send_ping(const solana::pubkey &from, const solana::pubkey &to, const solana::signer &signer, const std::optional<std::string> &endpoint)
    {
        const auto client = solana::rpc::client_http::from_config(configs_dir::get(), endpoint);
        logger::info("sending a ping transaction using {}", client.endpoint());
        return send_ping(client, from, to, signer);
    }
}
