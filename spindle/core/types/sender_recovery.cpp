// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "sender_recovery.hpp"

#include <spindle/core/common/util.hpp>
#include <spindle/core/crypto/ecdsa.hpp>
#include <spindle/core/crypto/secp256k1n.hpp>

namespace spindle {

std::string_view to_string(RecoveryError error) {
    switch (error) {
        case RecoveryError::kInvalidSignature:
            return "invalid signature";
    }
    return "unknown recovery error";
}

static RecoveryResult recover_from_signing_payload(const Transaction& txn, ByteView signing_payload) {
    const ethash::hash256 hash{keccak256(signing_payload)};

    uint8_t signature[kHashLength * 2];
    intx::be::unsafe::store(signature, txn.r);
    intx::be::unsafe::store(signature + kHashLength, txn.s);

    const auto sender{ecdsa::recover_address(ByteView{hash.bytes}, ByteView{signature}, txn.odd_y_parity ? 1 : 0)};
    if (!sender) {
        return tl::unexpected{RecoveryError::kInvalidSignature};
    }
    return *sender;
}

RecoveryResult recover_signer(const Transaction& txn) {
    Bytes buffer;
    return recover_signer(txn, SenderRecoveryMode::kChecked, buffer);
}

RecoveryResult recover_signer_unchecked(const Transaction& txn, Bytes& buffer) {
    buffer.clear();
    txn.encode_for_signing(buffer);
    return recover_from_signing_payload(txn, buffer);
}

RecoveryResult recover_signer_unchecked(const Transaction& txn) {
    Bytes buffer;
    return recover_signer_unchecked(txn, buffer);
}

RecoveryResult recover_signer(const Transaction& txn, SenderRecoveryMode mode, Bytes& buffer) {
    if (mode == SenderRecoveryMode::kChecked && !is_valid_signature(txn.r, txn.s, /*low_s=*/true)) {
        return tl::unexpected{RecoveryError::kInvalidSignature};
    }
    return recover_signer_unchecked(txn, buffer);
}

tl::expected<std::vector<evmc::address>, SendersRecoveryError> recover_senders(
    std::span<const Transaction> transactions, SenderRecoveryMode mode) {
    std::vector<evmc::address> senders;
    senders.reserve(transactions.size());
    Bytes buffer;
    for (size_t i{0}; i < transactions.size(); ++i) {
        const RecoveryResult sender{recover_signer(transactions[i], mode, buffer)};
        if (!sender) {
            return tl::unexpected{SendersRecoveryError{.txn_index = i, .error = sender.error()}};
        }
        senders.push_back(*sender);
    }
    return senders;
}

}  // namespace spindle
