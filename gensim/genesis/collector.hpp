// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <gensim/core/chain/genesis.hpp>
#include <gensim/core/state/account_change.hpp>

namespace gensim::genesis {

//! \brief Genesis allocation entry of target as left by one deployment
//! \details Changes to any other address are ignored. A Delete of target yields an empty account
//! and is logged. Zero-valued storage slots are left out.
GenesisAccount collect_account(const std::vector<AccountChange>& changes, const evmc::address& target);

}  // namespace gensim::genesis
