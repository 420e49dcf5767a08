// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "collector.hpp"

#include <variant>

#include <gensim/core/common/overloaded.hpp>
#include <gensim/core/types/address.hpp>
#include <gensim/core/types/evmc_bytes32.hpp>
#include <gensim/infra/common/log.hpp>

namespace gensim::genesis {

GenesisAccount collect_account(const std::vector<AccountChange>& changes, const evmc::address& target) {
    GenesisAccount account;
    bool found{false};
    for (const auto& change : changes) {
        if (changed_address(change) != target) {
            GENSIM_LOG_TRACE("Ignoring change", {"address", address_to_hex(changed_address(change))});
            continue;
        }
        found = true;
        std::visit(Overloaded{
                       [&](const AccountModify& modify) {
                           account.balance = modify.balance;
                           account.nonce = modify.nonce;
                           if (modify.code) {
                               account.code = *modify.code;
                           }
                           for (const auto& [location, value] : modify.storage) {
                               if (is_zero(value)) {
                                   account.storage.erase(location);
                               } else {
                                   account.storage.insert_or_assign(location, value);
                               }
                           }
                       },
                       [&](const AccountDelete& deletion) {
                           GENSIM_LOG_WARN("Deployment deleted its own account",
                                           {"address", address_to_hex(deletion.address)});
                           account = GenesisAccount{};
                       },
                   },
                   change);
    }
    if (!found) {
        GENSIM_LOG_WARN("No state change for deployed account", {"address", address_to_hex(target)});
    }
    return account;
}

}  // namespace gensim::genesis
