// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "execution.hpp"

#include <utility>

#include <gensim/core/state/intra_block_state.hpp>

namespace gensim {

std::string to_string(evmc_status_code status) {
    switch (status) {
        case EVMC_SUCCESS:
            return "success";
        case EVMC_FAILURE:
            return "failure";
        case EVMC_REVERT:
            return "revert";
        case EVMC_OUT_OF_GAS:
            return "out of gas";
        case EVMC_INVALID_INSTRUCTION:
            return "invalid instruction";
        case EVMC_UNDEFINED_INSTRUCTION:
            return "undefined instruction";
        case EVMC_STACK_OVERFLOW:
            return "stack overflow";
        case EVMC_STACK_UNDERFLOW:
            return "stack underflow";
        case EVMC_BAD_JUMP_DESTINATION:
            return "bad jump destination";
        case EVMC_INVALID_MEMORY_ACCESS:
            return "invalid memory access";
        case EVMC_CALL_DEPTH_EXCEEDED:
            return "call depth exceeded";
        case EVMC_STATIC_MODE_VIOLATION:
            return "static mode violation";
        case EVMC_PRECOMPILE_FAILURE:
            return "precompile failure";
        case EVMC_ARGUMENT_OUT_OF_RANGE:
            return "argument out of range";
        case EVMC_INSUFFICIENT_BALANCE:
            return "insufficient balance";
        default:
            return "status " + std::to_string(static_cast<int>(status));
    }
}

ExecutionOutcome execute_creation(InMemoryState& state, const ChainConfig& config,
                                  const precompile::Registry& precompiles, const evmc::address& sender,
                                  const evmc::address& target, const intx::uint256& value, ByteView init_code,
                                  uint64_t gas) {
    IntraBlockState overlay{state};
    const BlockContext block{};
    EVM evm{block, overlay, config, precompiles};

    CallResult res{evm.execute_creation({
        .sender = sender,
        .target = target,
        .value = value,
        .init_code = init_code,
        .gas = gas,
    })};
    if (res.status != EVMC_SUCCESS) {
        std::string message{to_string(res.status)};
        return tl::unexpected{ExecutionFailure{res.status, std::move(res.data), std::move(message)}};
    }

    overlay.finalize_transaction();
    std::vector<AccountChange> changes{overlay.account_changes()};

    if (const auto applied{state.apply(changes)}; !applied) {
        return tl::unexpected{ExecutionFailure{EVMC_INTERNAL_ERROR, {}, std::string{to_string(applied.error())}}};
    }
    return changes;
}

}  // namespace gensim
