// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <spindle/core/types/recovered_block.hpp>
#include <spindle/infra/common/secp256k1_context.hpp>
#include <spindle/test_util/in_memory_provider.hpp>

namespace spindle::test_util {

using namespace evmc::literals;

inline constexpr evmc::bytes32 kDefaultSignerKey{0xb71c71a67e1177ad4e901695e1b4b9ee17ae16c6668d313eac2f96dbcda3f291_bytes32};
inline constexpr evmc::address kRecipient{0x0000000000000000000000000000000000c0ffee_address};
inline constexpr evmc::address kBeneficiary{0x000000000000000000000000000000000000beef_address};
inline constexpr uint64_t kInitialBaseFee{1'000'000'000};
inline constexpr uint64_t kChainId{1};

//! \brief Builds chains of blocks with signed zero-value transfers from a single signer
//! \details Tracks the signer account as it is expected after each built block
class TestBlockBuilder {
  public:
    explicit TestBlockBuilder(const evmc::bytes32& signer_key = kDefaultSignerKey);

    const evmc::address& signer() const { return signer_; }

    //! \brief Signer account expected after executing all built blocks
    const Account& signer_account() const { return signer_account_; }

    //! 10^18 wei
    static intx::uint256 initial_balance();

    //! \brief Gas cost of one transfer built by this builder
    static intx::uint256 single_tx_cost();

    SealedBlock genesis() const;

    Transaction sign(const UnsignedTransaction& txn);

    //! \brief Builds the child of parent carrying num_txs transfers, all sent by the signer
    SealedBlock build_block(const SealedBlock& parent, size_t num_txs);

    //! \brief Inserts genesis and num_blocks built blocks with their post state into provider
    //! \return The built blocks, genesis excluded
    std::vector<SealedBlock> populate(InMemoryChainProvider& provider, size_t num_blocks, size_t txs_per_block);

  private:
    evmc::bytes32 signer_key_;
    evmc::address signer_;
    Account signer_account_;
    SecP256K1Context context_{/*allow_verify=*/true, /*allow_sign=*/true};
};

}  // namespace spindle::test_util
