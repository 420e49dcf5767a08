// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>

#include <evmc/evmc.h>
#include <tl/expected.hpp>

#include <gensim/core/chain/config.hpp>
#include <gensim/core/execution/evm.hpp>
#include <gensim/core/execution/precompile.hpp>
#include <gensim/core/state/account_change.hpp>
#include <gensim/core/state/in_memory_state.hpp>

namespace gensim {

//! \brief Why a creation transaction did not go through
struct ExecutionFailure {
    evmc_status_code status{EVMC_FAILURE};
    Bytes output;  // revert data, if any
    std::string message;
};

using ExecutionOutcome = tl::expected<std::vector<AccountChange>, ExecutionFailure>;

std::string to_string(evmc_status_code status);

/**
 * @brief Executes a single creation transaction that deploys init_code at target.
 * @details The transaction runs on a journaled overlay of state. On success the resulting changes are
 * applied to state and returned, ordered by address; on failure state is left exactly as it was.
 * @param state The world state to execute against.
 * @param config The chain configuration (only the chain id is visible to the code).
 * @param precompiles The precompiled contracts reachable from the executed code.
 * @param sender The creator; its nonce is incremented.
 * @param target The address the contract is deployed at.
 * @param value The amount transferred from sender to target.
 * @param init_code The creation bytecode, constructor arguments included.
 * @param gas The gas limit; values above INT64_MAX are clamped.
 */
ExecutionOutcome execute_creation(InMemoryState& state, const ChainConfig& config,
                                  const precompile::Registry& precompiles, const evmc::address& sender,
                                  const evmc::address& target, const intx::uint256& value, ByteView init_code,
                                  uint64_t gas);

}  // namespace gensim
