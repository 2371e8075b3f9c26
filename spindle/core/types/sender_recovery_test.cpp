// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "sender_recovery.hpp"

#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <spindle/core/crypto/secp256k1n.hpp>

namespace spindle {

using namespace evmc::literals;

static constexpr evmc::address kEip155Sender{0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address};

static Transaction eip155_example() {
    Transaction txn;
    txn.nonce = 9;
    txn.max_priority_fee_per_gas = 20 * kGiga;
    txn.max_fee_per_gas = 20 * kGiga;
    txn.gas_limit = 21000;
    txn.to = 0x3535353535353535353535353535353535353535_address;
    txn.value = kEther;
    txn.chain_id = 1;
    txn.odd_y_parity = false;
    txn.r = intx::from_string<intx::uint256>("0x28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276");
    txn.s = intx::from_string<intx::uint256>("0x67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83");
    return txn;
}

// Same signature with s replaced by n - s: still valid for the curve, rejected by EIP-2
static Transaction high_s_variant() {
    Transaction txn{eip155_example()};
    txn.s = kSecp256k1n - txn.s;
    txn.odd_y_parity = !txn.odd_y_parity;
    return txn;
}

TEST_CASE("recover_signer low-s", "[core][types][sender_recovery]") {
    const Transaction txn{eip155_example()};
    const RecoveryResult checked{recover_signer(txn)};
    REQUIRE(checked);
    CHECK(*checked == kEip155Sender);

    Bytes buffer;
    const RecoveryResult unchecked{recover_signer_unchecked(txn, buffer)};
    REQUIRE(unchecked);
    CHECK(*unchecked == *checked);
    CHECK(!buffer.empty());
}

TEST_CASE("recover_signer high-s", "[core][types][sender_recovery]") {
    const Transaction txn{high_s_variant()};
    REQUIRE(txn.s > kSecp256k1Halfn);

    const RecoveryResult checked{recover_signer(txn)};
    REQUIRE_FALSE(checked);
    CHECK(checked.error() == RecoveryError::kInvalidSignature);

    const RecoveryResult unchecked{recover_signer_unchecked(txn)};
    REQUIRE(unchecked);
    CHECK(*unchecked == kEip155Sender);
}

TEST_CASE("recover_signer_unchecked reuses the buffer", "[core][types][sender_recovery]") {
    Bytes buffer(300, 0xff);
    const RecoveryResult first{recover_signer_unchecked(eip155_example(), buffer)};
    const RecoveryResult second{recover_signer_unchecked(eip155_example(), buffer)};
    REQUIRE(first);
    REQUIRE(second);
    CHECK(*first == *second);
    CHECK(buffer.size() == 45);  // signing payload only, stale content cleared
}

TEST_CASE("recover_signer rejects out of range values", "[core][types][sender_recovery]") {
    Transaction txn{eip155_example()};
    txn.r = 0;
    CHECK_FALSE(recover_signer(txn));
    CHECK_FALSE(recover_signer_unchecked(txn));

    txn = eip155_example();
    txn.s = kSecp256k1n;
    CHECK_FALSE(recover_signer(txn));
    CHECK_FALSE(recover_signer_unchecked(txn));
}

TEST_CASE("recover_senders", "[core][types][sender_recovery]") {
    const std::vector<Transaction> transactions{eip155_example(), high_s_variant(), eip155_example()};

    const auto unchecked{recover_senders(transactions, SenderRecoveryMode::kUnchecked)};
    REQUIRE(unchecked);
    CHECK(*unchecked == std::vector<evmc::address>(3, kEip155Sender));

    const auto checked{recover_senders(transactions, SenderRecoveryMode::kChecked)};
    REQUIRE_FALSE(checked);
    CHECK(checked.error().txn_index == 1);
    CHECK(to_string(checked.error().error) == "invalid signature");

    CHECK(recover_senders({}, SenderRecoveryMode::kChecked)->empty());
}

}  // namespace spindle
