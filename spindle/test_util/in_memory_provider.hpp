// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <absl/container/btree_map.h>
#include <absl/container/btree_set.h>
#include <evmc/evmc.hpp>

#include <spindle/db/provider.hpp>

namespace spindle::test_util {

using AccountChanges = std::vector<std::pair<evmc::address, Account>>;

//! State snapshot held in ordered maps
class InMemoryStateView : public db::StateView {
  public:
    InMemoryStateView(BlockNum block_num, absl::btree_map<evmc::address, Account> accounts)
        : block_num_{block_num}, accounts_{std::move(accounts)} {}

    std::optional<Account> read_account(const evmc::address& address) const override;
    intx::uint256 read_storage(const evmc::address& address, const intx::uint256& slot) const override;
    Bytes read_code(const evmc::address& address, const evmc::bytes32& code_hash) const override;
    BlockNum block_num() const override { return block_num_; }

  private:
    BlockNum block_num_;
    absl::btree_map<evmc::address, Account> accounts_;
};

//! \brief Chain provider over ordered in-memory maps, with fetch recording and failure injection
//! \details Population is not thread safe, reads are
class InMemoryChainProvider : public db::ChainProvider {
  public:
    void add_genesis_account(const evmc::address& address, const Account& account);

    //! \param post_accounts accounts as they are after executing the block
    void insert_block(SealedBlock block, AccountChanges post_accounts = {});

    //! \brief Stores block in place of the one with the same number, keeping the post state
    void replace_block(SealedBlock block);
    void insert_senders(BlockNum block_num, std::vector<evmc::address> senders);
    void remove_block(BlockNum block_num);

    //! \brief Makes sealed_block throw db::ProviderError for the given block number
    void fail_fetch_at(BlockNum block_num) { failing_fetches_.insert(block_num); }

    //! \brief Makes history_by_block_number throw db::ProviderError for the given block number
    void fail_state_at(BlockNum block_num) { failing_states_.insert(block_num); }

    //! \brief Makes history_by_block_number return null for the given block number
    void drop_state_at(BlockNum block_num) { missing_states_.insert(block_num); }

    //! \brief Block numbers requested through sealed_block, in request order
    std::vector<BlockNum> fetched_blocks() const;

    std::optional<BlockHeader> header(const db::BlockHashOrNumber& id) const override;
    BlockNum best_block_number() const override;
    std::optional<SealedBlock> sealed_block(const db::BlockHashOrNumber& id) const override;
    std::optional<std::vector<evmc::address>> senders(BlockNum block_num) const override;
    std::unique_ptr<db::StateView> history_by_block_number(BlockNum block_num) const override;

  private:
    std::optional<BlockNum> resolve(const db::BlockHashOrNumber& id) const;

    absl::btree_map<evmc::address, Account> genesis_accounts_;
    absl::btree_map<BlockNum, SealedBlock> blocks_;
    absl::btree_map<evmc::bytes32, BlockNum> block_numbers_;
    absl::btree_map<BlockNum, AccountChanges> account_changes_;
    absl::btree_map<BlockNum, std::vector<evmc::address>> senders_;

    absl::btree_set<BlockNum> failing_fetches_;
    absl::btree_set<BlockNum> failing_states_;
    absl::btree_set<BlockNum> missing_states_;

    mutable std::mutex fetches_mutex_;
    mutable std::vector<BlockNum> fetched_blocks_;
};

}  // namespace spindle::test_util
