// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <tl/expected.hpp>

#include <spindle/core/common/base.hpp>
#include <spindle/core/common/bytes.hpp>
#include <spindle/core/types/account.hpp>
#include <spindle/core/types/block.hpp>
#include <spindle/core/types/recovered_block.hpp>
#include <spindle/core/types/sender_recovery.hpp>

// All provider operations report backend failures by throwing db::ProviderError

namespace spindle::db {

using BlockHashOrNumber = std::variant<BlockNum, evmc::bytes32>;

struct BlockId {
    BlockNum block_num{0};
    evmc::bytes32 hash;

    friend bool operator==(const BlockId&, const BlockId&) = default;
};

std::string to_string(const BlockHashOrNumber& id);

enum class TransactionVariant {
    kNoHash,    // senders only
    kWithHash,  // senders and transaction hashes
};

//! Read-only view of the world state as of the end of block_num()
class StateView {
  public:
    virtual ~StateView() = default;

    virtual std::optional<Account> read_account(const evmc::address& address) const = 0;
    virtual intx::uint256 read_storage(const evmc::address& address, const intx::uint256& slot) const = 0;
    virtual Bytes read_code(const evmc::address& address, const evmc::bytes32& code_hash) const = 0;

    virtual BlockNum block_num() const = 0;
};

class HeaderProvider {
  public:
    virtual ~HeaderProvider() = default;

    virtual std::optional<BlockHeader> header(const BlockHashOrNumber& id) const = 0;
    virtual BlockNum best_block_number() const = 0;
};

struct BlockReadError {
    enum class Kind {
        kNotFound,
        kInvalidSignature,
    };
    Kind kind{Kind::kNotFound};
    size_t txn_index{0};  // meaningful for kInvalidSignature only
};

class BlockReader : public HeaderProvider {
  public:
    virtual std::optional<SealedBlock> sealed_block(const BlockHashOrNumber& id) const = 0;

    //! \return senders stored for the block, nullopt when they must be recovered
    virtual std::optional<std::vector<evmc::address>> senders(BlockNum /*block_num*/) const { return std::nullopt; }

    //! \brief Reads the block and attaches its senders, recovering them when none (or a wrong count) are stored
    virtual tl::expected<RecoveredBlock, BlockReadError> recovered_block(const BlockHashOrNumber& id,
                                                                         TransactionVariant variant,
                                                                         SenderRecoveryMode mode) const;
};

class StateProviderFactory {
  public:
    virtual ~StateProviderFactory() = default;

    //! \return state at the end of the given block, null when not available
    virtual std::unique_ptr<StateView> history_by_block_number(BlockNum block_num) const = 0;
};

//! Everything the backfill pipeline reads from storage
class ChainProvider : public BlockReader, public StateProviderFactory {};

}  // namespace spindle::db
