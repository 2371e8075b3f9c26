// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_provider.hpp"

#include <string>

#include <spindle/db/provider_error.hpp>

namespace spindle::test_util {

std::optional<Account> InMemoryStateView::read_account(const evmc::address& address) const {
    const auto it{accounts_.find(address)};
    if (it == accounts_.end()) return std::nullopt;
    return it->second;
}

intx::uint256 InMemoryStateView::read_storage(const evmc::address&, const intx::uint256&) const {
    return 0;
}

Bytes InMemoryStateView::read_code(const evmc::address&, const evmc::bytes32&) const {
    return {};
}

void InMemoryChainProvider::add_genesis_account(const evmc::address& address, const Account& account) {
    genesis_accounts_.insert_or_assign(address, account);
}

void InMemoryChainProvider::insert_block(SealedBlock block, AccountChanges post_accounts) {
    const BlockNum block_num{block.number()};
    block_numbers_.insert_or_assign(block.hash, block_num);
    blocks_.insert_or_assign(block_num, std::move(block));
    account_changes_.insert_or_assign(block_num, std::move(post_accounts));
}

void InMemoryChainProvider::replace_block(SealedBlock block) {
    const BlockNum block_num{block.number()};
    remove_block(block_num);
    block_numbers_.insert_or_assign(block.hash, block_num);
    blocks_.insert_or_assign(block_num, std::move(block));
}

void InMemoryChainProvider::insert_senders(BlockNum block_num, std::vector<evmc::address> senders) {
    senders_.insert_or_assign(block_num, std::move(senders));
}

void InMemoryChainProvider::remove_block(BlockNum block_num) {
    const auto it{blocks_.find(block_num)};
    if (it == blocks_.end()) return;
    block_numbers_.erase(it->second.hash);
    blocks_.erase(it);
}

std::vector<BlockNum> InMemoryChainProvider::fetched_blocks() const {
    std::scoped_lock lock{fetches_mutex_};
    return fetched_blocks_;
}

std::optional<BlockNum> InMemoryChainProvider::resolve(const db::BlockHashOrNumber& id) const {
    if (const auto* block_num = std::get_if<BlockNum>(&id)) {
        return *block_num;
    }
    const auto it{block_numbers_.find(std::get<evmc::bytes32>(id))};
    if (it == block_numbers_.end()) return std::nullopt;
    return it->second;
}

std::optional<BlockHeader> InMemoryChainProvider::header(const db::BlockHashOrNumber& id) const {
    const std::optional<BlockNum> block_num{resolve(id)};
    if (!block_num) return std::nullopt;
    const auto it{blocks_.find(*block_num)};
    if (it == blocks_.end()) return std::nullopt;
    return it->second.header();
}

BlockNum InMemoryChainProvider::best_block_number() const {
    return blocks_.empty() ? 0 : blocks_.rbegin()->first;
}

std::optional<SealedBlock> InMemoryChainProvider::sealed_block(const db::BlockHashOrNumber& id) const {
    const std::optional<BlockNum> block_num{resolve(id)};
    if (!block_num) return std::nullopt;
    {
        std::scoped_lock lock{fetches_mutex_};
        fetched_blocks_.push_back(*block_num);
    }
    if (failing_fetches_.contains(*block_num)) {
        throw db::ProviderError{"injected read failure at block " + std::to_string(*block_num)};
    }
    const auto it{blocks_.find(*block_num)};
    if (it == blocks_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::vector<evmc::address>> InMemoryChainProvider::senders(BlockNum block_num) const {
    const auto it{senders_.find(block_num)};
    if (it == senders_.end()) return std::nullopt;
    return it->second;
}

std::unique_ptr<db::StateView> InMemoryChainProvider::history_by_block_number(BlockNum block_num) const {
    if (failing_states_.contains(block_num)) {
        throw db::ProviderError{"injected state failure at block " + std::to_string(block_num)};
    }
    if (missing_states_.contains(block_num)) {
        return nullptr;
    }

    absl::btree_map<evmc::address, Account> accounts{genesis_accounts_};
    for (BlockNum n{1}; n <= block_num; ++n) {
        const auto it{account_changes_.find(n)};
        if (it == account_changes_.end()) {
            return nullptr;
        }
        for (const auto& [address, account] : it->second) {
            accounts.insert_or_assign(address, account);
        }
    }
    return std::make_unique<InMemoryStateView>(block_num, std::move(accounts));
}

}  // namespace spindle::test_util
