// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <evmone/baseline.hpp>
#include <evmone/vm.hpp>
#include <intx/intx.hpp>

#include <gensim/core/chain/config.hpp>
#include <gensim/core/common/base.hpp>
#include <gensim/core/common/bytes.hpp>
#include <gensim/core/execution/precompile.hpp>
#include <gensim/core/state/intra_block_state.hpp>

namespace gensim {

//! Every simulation runs at this revision regardless of the fork markers in the chain config
inline constexpr evmc_revision kRevision{EVMC_ISTANBUL};

// EIP-170: Contract code size limit
inline constexpr size_t kMaxCodeSize{0x6000};

inline constexpr uint64_t kGCodeDeposit{200};

//! \brief Environment of the simulated genesis block
struct BlockContext {
    uint64_t number{0};
    uint64_t timestamp{0};
    uint64_t gas_limit{UINT64_MAX};
    intx::uint256 difficulty{0};
    evmc::address coinbase{};
};

struct CallResult {
    evmc_status_code status{EVMC_SUCCESS};
    uint64_t gas_left{0};
    Bytes data;
};

//! \brief A creation transaction whose contract address is chosen by the caller
struct CreationMessage {
    evmc::address sender;
    evmc::address target;
    intx::uint256 value;
    ByteView init_code;
    uint64_t gas{0};
};

//! \brief Runs EVM frames against an IntraBlockState on behalf of a single creation transaction
//! \details Failed frames are rolled back through state snapshots and reported in the result,
//! so a failure never escapes the frame that caused it.
class EVM {
  public:
    // Not copyable nor movable
    EVM(const EVM&) = delete;
    EVM& operator=(const EVM&) = delete;

    EVM(const BlockContext& block, IntraBlockState& state, const ChainConfig& config,
        const precompile::Registry& precompiles) noexcept
        : block_{block}, state_{state}, config_{config}, precompiles_{precompiles} {}

    IntraBlockState& state() noexcept { return state_; }
    const IntraBlockState& state() const noexcept { return state_; }

    //! \brief Runs init_code and deploys its output at message.target
    //! \remarks Gas above INT64_MAX is clamped, which the EVM cannot tell apart from unlimited
    CallResult execute_creation(const CreationMessage& message) noexcept;

  private:
    friend class EvmHost;

    // Nested CREATE/CREATE2 derive the address from the sender; the top-level creation passes it in
    evmc::Result create(const evmc_message& message, std::optional<evmc::address> target = std::nullopt) noexcept;

    evmc::Result call(const evmc_message& message) noexcept;

    evmc::Result call_precompile(const precompile::Handler& handler, const evmc_message& message) noexcept;

    evmc_result execute(const evmc_message& message, ByteView code) noexcept;

    //! \brief Charges the code deposit and installs the code, or fails the frame
    void deposit_code(const evmc::address& contract, evmc_result& result) noexcept;

    //! \brief Rolls back a frame that did not succeed; only a revert keeps its remaining gas
    template <typename R>
    void settle(IntraBlockState::Snapshot snapshot, R& result) noexcept {
        if (result.status_code == EVMC_SUCCESS) {
            return;
        }
        state_.revert_to_snapshot(snapshot);
        result.gas_refund = 0;
        if (result.status_code != EVMC_REVERT) {
            result.gas_left = 0;
        }
    }

    evmc_tx_context tx_context() const noexcept;

    const BlockContext& block_;
    IntraBlockState& state_;
    const ChainConfig& config_;
    const precompile::Registry& precompiles_;
    evmc::address origin_{};

    // evmone is not thread safe, so there is one instance per thread
    GENSIM_THREAD_LOCAL static evmc::VM evm1_;
};

//! \brief evmc::Host view of the EVM state for a running frame
class EvmHost : public evmc::Host {
  public:
    explicit EvmHost(EVM& evm) noexcept : evm_{evm}, state_{evm.state_} {}

    bool account_exists(const evmc::address& address) const noexcept override;

    evmc_access_status access_account(const evmc::address& address) noexcept override;

    evmc_access_status access_storage(const evmc::address& address, const evmc::bytes32& key) noexcept override;

    evmc::bytes32 get_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept override;

    evmc_storage_status set_storage(const evmc::address& address, const evmc::bytes32& key,
                                    const evmc::bytes32& value) noexcept override;

    evmc::uint256be get_balance(const evmc::address& address) const noexcept override;

    size_t get_code_size(const evmc::address& address) const noexcept override;

    evmc::bytes32 get_code_hash(const evmc::address& address) const noexcept override;

    size_t copy_code(const evmc::address& address, size_t code_offset, uint8_t* buffer_data,
                     size_t buffer_size) const noexcept override;

    bool selfdestruct(const evmc::address& address, const evmc::address& beneficiary) noexcept override;

    evmc::Result call(const evmc_message& message) noexcept override;

    evmc_tx_context get_tx_context() const noexcept override { return evm_.tx_context(); }

    evmc::bytes32 get_block_hash(int64_t block_num) const noexcept override;

    void emit_log(const evmc::address& address, const uint8_t* data, size_t data_size, const evmc::bytes32 topics[],
                  size_t num_topics) noexcept override;

    evmc::bytes32 get_transient_storage(const evmc::address& addr, const evmc::bytes32& key) const noexcept override;

    void set_transient_storage(const evmc::address& addr, const evmc::bytes32& key,
                               const evmc::bytes32& value) noexcept override;

  private:
    EVM& evm_;
    IntraBlockState& state_;
};

//! \brief EIP-2200 classification of a storage write, given the slot values before the
//! transaction and before the write
evmc_storage_status storage_status(const evmc::bytes32& original, const evmc::bytes32& current,
                                   const evmc::bytes32& value) noexcept;

}  // namespace gensim
