// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evm.hpp"

#include <algorithm>
#include <utility>

#include <ethash/keccak.hpp>
#include <evmone/evmone.h>

#include <gensim/core/common/empty_hashes.hpp>
#include <gensim/core/types/address.hpp>
#include <gensim/core/types/evmc_bytes32.hpp>

namespace gensim {

GENSIM_THREAD_LOCAL evmc::VM EVM::evm1_{evmc_create_evmone()};

namespace {

    int64_t clamp_to_int64(uint64_t value) noexcept {
        return static_cast<int64_t>(std::min<uint64_t>(value, INT64_MAX));
    }

    intx::uint256 message_value(const evmc_message& message) noexcept {
        return intx::be::load<intx::uint256>(message.value);
    }

    void transfer(IntraBlockState& state, const evmc::address& from, const evmc::address& to,
                  const intx::uint256& amount) noexcept {
        state.subtract_from_balance(from, amount);
        state.add_to_balance(to, amount);
    }

}  // namespace

CallResult EVM::execute_creation(const CreationMessage& creation) noexcept {
    origin_ = creation.sender;

    const evmc_message message{
        .kind = EVMC_CREATE,
        .gas = clamp_to_int64(creation.gas),
        .sender = creation.sender,
        .input_data = creation.init_code.data(),
        .input_size = creation.init_code.size(),
        .value = intx::be::store<evmc::uint256be>(creation.value),
    };

    const evmc::Result res{create(message, creation.target)};
    CallResult result{.status = res.status_code, .gas_left = static_cast<uint64_t>(res.gas_left)};
    if (res.output_size > 0) {
        result.data.assign(res.output_data, res.output_size);
    }
    return result;
}

evmc::Result EVM::create(const evmc_message& message, std::optional<evmc::address> target) noexcept {
    const intx::uint256 value{message_value(message)};
    if (state_.get_balance(message.sender) < value) {
        return evmc::Result{EVMC_INSUFFICIENT_BALANCE, message.gas, 0};
    }

    // EIP-2681: Limit account nonce to 2^64-1
    const uint64_t nonce{state_.get_nonce(message.sender)};
    if (nonce == UINT64_MAX) {
        return evmc::Result{EVMC_ARGUMENT_OUT_OF_RANGE, message.gas, 0};
    }
    state_.set_nonce(message.sender, nonce + 1);

    evmc::address contract{};
    if (target) {
        contract = *target;
    } else if (message.kind == EVMC_CREATE2) {
        const ethash::hash256 init_code_hash{ethash::keccak256(message.input_data, message.input_size)};
        contract = create2_address(message.sender, message.create2_salt, init_code_hash.bytes);
    } else {
        contract = create_address(message.sender, nonce);
    }

    // https://github.com/ethereum/EIPs/issues/684
    if (state_.get_nonce(contract) != 0 || state_.get_code_hash(contract) != kEmptyHash) {
        return evmc::Result{EVMC_INVALID_INSTRUCTION, 0, 0};
    }

    const IntraBlockState::Snapshot snapshot{state_.take_snapshot()};

    state_.create_contract(contract);
    state_.set_nonce(contract, 1);  // EIP-161
    transfer(state_, message.sender, contract, value);

    evmc_message init_message{message};
    init_message.recipient = contract;
    init_message.code_address = contract;
    init_message.input_data = nullptr;
    init_message.input_size = 0;
    // evmone refuses a top-level CREATE frame
    if (message.depth == 0) {
        init_message.kind = EVMC_CALL;
    }

    evmc_result res{execute(init_message, ByteView{message.input_data, message.input_size})};
    if (res.status_code == EVMC_SUCCESS) {
        deposit_code(contract, res);
    }
    settle(snapshot, res);
    if (res.status_code == EVMC_SUCCESS) {
        res.create_address = contract;
    }
    return evmc::Result{res};
}

void EVM::deposit_code(const evmc::address& contract, evmc_result& result) noexcept {
    // EIP-170: Contract code size limit
    if (result.output_size > kMaxCodeSize) {
        result.status_code = EVMC_ARGUMENT_OUT_OF_RANGE;
        return;
    }
    const uint64_t deposit_cost{result.output_size * kGCodeDeposit};
    if (std::cmp_less(result.gas_left, deposit_cost)) {
        result.status_code = EVMC_OUT_OF_GAS;
        return;
    }
    result.gas_left -= static_cast<int64_t>(deposit_cost);
    state_.set_code(contract, ByteView{result.output_data, result.output_size});
}

evmc::Result EVM::call(const evmc_message& message) noexcept {
    const intx::uint256 value{message_value(message)};
    if (message.kind != EVMC_DELEGATECALL && state_.get_balance(message.sender) < value) {
        return evmc::Result{EVMC_INSUFFICIENT_BALANCE, message.gas};
    }

    const IntraBlockState::Snapshot snapshot{state_.take_snapshot()};

    if (message.kind == EVMC_CALL) {
        if ((message.flags & EVMC_STATIC) != 0) {
            // A static call still touches its recipient, as geth does
            state_.touch(message.recipient);
        } else {
            transfer(state_, message.sender, message.recipient, value);
        }
    }

    evmc::Result res{EVMC_SUCCESS, message.gas};
    if (const precompile::Handler* handler{precompiles_.resolve(message.code_address)}) {
        res = call_precompile(*handler, message);
    } else if (const ByteView code{state_.get_code(message.code_address)}; !code.empty()) {
        res = evmc::Result{execute(message, code)};
    }

    settle(snapshot, res);
    return res;
}

evmc::Result EVM::call_precompile(const precompile::Handler& handler, const evmc_message& message) noexcept {
    const precompile::CallContext context{
        .caller = message.sender,
        .address = message.recipient,
        .apparent_value = message_value(message),
    };
    const bool is_static{(message.flags & EVMC_STATIC) != 0};

    const precompile::PrecompileResult output{handler(ByteView{message.input_data, message.input_size},
                                                      static_cast<uint64_t>(message.gas), context, is_static)};
    if (!output) {
        if (output.error() == precompile::PrecompileError::kOutOfGas) {
            return evmc::Result{EVMC_OUT_OF_GAS, 0, 0};
        }
        return evmc::Result{EVMC_PRECOMPILE_FAILURE, 0, 0};
    }
    const int64_t gas_left{message.gas - static_cast<int64_t>(output->gas_cost)};
    return evmc::Result{EVMC_SUCCESS, gas_left, 0, output->output.data(), output->output.size()};
}

evmc_result EVM::execute(const evmc_message& message, ByteView code) noexcept {
    auto& vm{*static_cast<evmone::VM*>(evm1_.get_raw_pointer())};
    // EOF is never enabled at Istanbul
    const auto analysis{evmone::baseline::analyze(code, /*eof_enabled=*/false)};

    EvmHost host{*this};
    return evmone::baseline::execute(vm, EvmHost::get_interface(), host.to_context(), kRevision, message, analysis);
}

evmc_tx_context EVM::tx_context() const noexcept {
    evmc_tx_context context{
        .tx_origin = origin_,
        .block_coinbase = block_.coinbase,
        .block_number = clamp_to_int64(block_.number),
        .block_timestamp = clamp_to_int64(block_.timestamp),
        .block_gas_limit = clamp_to_int64(block_.gas_limit),
    };
    context.block_prev_randao = intx::be::store<evmc::bytes32>(block_.difficulty);
    context.chain_id = intx::be::store<evmc::uint256be>(intx::uint256{config_.chain_id});
    return context;
}

evmc_storage_status storage_status(const evmc::bytes32& original, const evmc::bytes32& current,
                                   const evmc::bytes32& value) noexcept {
    if (current == value) {
        return EVMC_STORAGE_ASSIGNED;
    }
    if (original == current) {
        if (is_zero(original)) {
            return EVMC_STORAGE_ADDED;
        }
        return is_zero(value) ? EVMC_STORAGE_DELETED : EVMC_STORAGE_MODIFIED;
    }
    // Dirty slot
    if (is_zero(original)) {
        return value == original ? EVMC_STORAGE_ADDED_DELETED : EVMC_STORAGE_ASSIGNED;
    }
    if (is_zero(current)) {
        return value == original ? EVMC_STORAGE_DELETED_RESTORED : EVMC_STORAGE_DELETED_ADDED;
    }
    if (is_zero(value)) {
        return EVMC_STORAGE_MODIFIED_DELETED;
    }
    return value == original ? EVMC_STORAGE_MODIFIED_RESTORED : EVMC_STORAGE_ASSIGNED;
}

bool EvmHost::account_exists(const evmc::address& address) const noexcept { return !state_.is_dead(address); }

// Access lists come with Berlin and are never consulted at Istanbul
evmc_access_status EvmHost::access_account(const evmc::address&) noexcept { return EVMC_ACCESS_WARM; }

evmc_access_status EvmHost::access_storage(const evmc::address&, const evmc::bytes32&) noexcept {
    return EVMC_ACCESS_WARM;
}

evmc::bytes32 EvmHost::get_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept {
    return state_.get_current_storage(address, key);
}

evmc_storage_status EvmHost::set_storage(const evmc::address& address, const evmc::bytes32& key,
                                         const evmc::bytes32& value) noexcept {
    const evmc::bytes32 current{state_.get_current_storage(address, key)};
    const evmc::bytes32 original{state_.get_original_storage(address, key)};
    state_.set_storage(address, key, value);
    return storage_status(original, current, value);
}

evmc::uint256be EvmHost::get_balance(const evmc::address& address) const noexcept {
    return intx::be::store<evmc::uint256be>(state_.get_balance(address));
}

size_t EvmHost::get_code_size(const evmc::address& address) const noexcept {
    return state_.get_code(address).size();
}

evmc::bytes32 EvmHost::get_code_hash(const evmc::address& address) const noexcept {
    return state_.is_dead(address) ? evmc::bytes32{} : state_.get_code_hash(address);
}

size_t EvmHost::copy_code(const evmc::address& address, size_t code_offset, uint8_t* buffer_data,
                          size_t buffer_size) const noexcept {
    const ByteView code{state_.get_code(address)};
    if (code_offset >= code.size()) {
        return 0;
    }
    const ByteView chunk{code.substr(code_offset, buffer_size)};
    std::ranges::copy(chunk, buffer_data);
    return chunk.size();
}

bool EvmHost::selfdestruct(const evmc::address& address, const evmc::address& beneficiary) noexcept {
    state_.add_to_balance(beneficiary, state_.get_balance(address));
    state_.set_balance(address, 0);
    return state_.record_suicide(address);
}

evmc::Result EvmHost::call(const evmc_message& message) noexcept {
    if (message.kind != EVMC_CREATE && message.kind != EVMC_CREATE2) {
        return evm_.call(message);
    }

    evmc::Result res{evm_.create(message)};
    // EIP-211: creation output is only returned to the caller on revert
    if (res.status_code == EVMC_REVERT) {
        return res;
    }
    evmc::Result stripped{res.status_code, res.gas_left, res.gas_refund};
    stripped.create_address = res.create_address;
    return stripped;
}

// The genesis block has no ancestors
evmc::bytes32 EvmHost::get_block_hash(int64_t) const noexcept { return {}; }

// Event logs are not part of the genesis state
void EvmHost::emit_log(const evmc::address&, const uint8_t*, size_t, const evmc::bytes32[], size_t) noexcept {}

// Transient storage (EIP-1153) does not exist at Istanbul
evmc::bytes32 EvmHost::get_transient_storage(const evmc::address&, const evmc::bytes32&) const noexcept {
    return {};
}

void EvmHost::set_transient_storage(const evmc::address&, const evmc::bytes32&, const evmc::bytes32&) noexcept {}

}  // namespace gensim
