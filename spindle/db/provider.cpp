// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "provider.hpp"

#include <utility>

#include <spindle/core/common/util.hpp>

namespace spindle::db {

std::string to_string(const BlockHashOrNumber& id) {
    if (const auto* block_num = std::get_if<BlockNum>(&id)) {
        return std::to_string(*block_num);
    }
    return to_hex(std::get<evmc::bytes32>(id), /*with_prefix=*/true);
}

tl::expected<RecoveredBlock, BlockReadError> BlockReader::recovered_block(const BlockHashOrNumber& id,
                                                                          TransactionVariant variant,
                                                                          SenderRecoveryMode mode) const {
    std::optional<SealedBlock> sealed{sealed_block(id)};
    if (!sealed) {
        return tl::make_unexpected(BlockReadError{BlockReadError::Kind::kNotFound});
    }

    std::optional<std::vector<evmc::address>> stored{senders(sealed->number())};
    std::optional<RecoveredBlock> recovered;
    if (stored && stored->size() == sealed->block.transactions.size()) {
        recovered.emplace(std::move(*sealed), std::move(*stored));
    } else {
        auto result{RecoveredBlock::try_recover(std::move(*sealed), mode)};
        if (!result) {
            return tl::make_unexpected(BlockReadError{BlockReadError::Kind::kInvalidSignature, result.error().txn_index});
        }
        recovered.emplace(std::move(*result));
    }

    if (variant == TransactionVariant::kWithHash) {
        recovered->with_transaction_hashes();
    }
    return std::move(*recovered);
}

}  // namespace spindle::db
