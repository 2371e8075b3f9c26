// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <spindle/core/common/bytes.hpp>
#include <spindle/core/types/transaction.hpp>

namespace spindle {

enum class RecoveryError {
    kInvalidSignature,  // out of range or high-s (when checked) r/s, or no recoverable public key
};

std::string_view to_string(RecoveryError error);

//! Which signer recovery rules apply to historical transactions
enum class SenderRecoveryMode {
    kChecked,    // EIP-2 low-s enforced
    kUnchecked,  // any s accepted, as pre-Homestead chain history requires
};

using RecoveryResult = tl::expected<evmc::address, RecoveryError>;

//! \brief Recovers the sender enforcing EIP-2: s must be in the lower half of the curve order
//! \see Yellow Paper, Appendix F "Signing Transactions" and EIP-155
RecoveryResult recover_signer(const Transaction& txn);

//! \brief Recovers the sender without the low-s rule
//! \param [in] buffer : scratch space for the signing payload, cleared before use
RecoveryResult recover_signer_unchecked(const Transaction& txn, Bytes& buffer);

RecoveryResult recover_signer_unchecked(const Transaction& txn);

RecoveryResult recover_signer(const Transaction& txn, SenderRecoveryMode mode, Bytes& buffer);

struct SendersRecoveryError {
    size_t txn_index{0};
    RecoveryError error{RecoveryError::kInvalidSignature};
};

//! \brief Recovers the senders of all transactions in order, sharing one signing payload buffer
//! \return The senders or the index of the first transaction whose recovery failed
tl::expected<std::vector<evmc::address>, SendersRecoveryError> recover_senders(
    std::span<const Transaction> transactions, SenderRecoveryMode mode);

}  // namespace spindle
