// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

// Reserved addresses of the system contracts; the live network must agree on them
namespace gensim::genesis {

using namespace evmc::literals;

inline constexpr evmc::address kStakingAddress{0x0000000000000000000000000000000000001000_address};
inline constexpr evmc::address kSlashingIndicatorAddress{0x0000000000000000000000000000000000001001_address};
inline constexpr evmc::address kSystemRewardAddress{0x0000000000000000000000000000000000001002_address};
inline constexpr evmc::address kStakingPoolAddress{0x0000000000000000000000000000000000007001_address};
inline constexpr evmc::address kGovernanceAddress{0x0000000000000000000000000000000000007002_address};
inline constexpr evmc::address kChainConfigAddress{0x0000000000000000000000000000000000007003_address};
inline constexpr evmc::address kRuntimeUpgradeAddress{0x0000000000000000000000000000000000007004_address};
inline constexpr evmc::address kDeployerProxyAddress{0x0000000000000000000000000000000000007005_address};
inline constexpr evmc::address kIntermediarySystemAddress{0xfffffffffffffffffffffffffffffffffffffffe_address};

}  // namespace gensim::genesis
