// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(GENSIM_CORE_USE_ABSEIL)

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#else

#include <unordered_map>
#include <unordered_set>

#endif

namespace gensim {

/*
Alias templates to fast hash maps and sets, such as Abseil "Swiss tables".
Neither alias guarantees pointer stability nor a deterministic iteration order:
anything that ends up in the genesis document must be sorted before it is emitted.
*/

#if defined(GENSIM_CORE_USE_ABSEIL)

template <class K, class V>
using FlatHashMap = absl::flat_hash_map<K, V>;

template <class T>
using FlatHashSet = absl::flat_hash_set<T>;

#else

template <class K, class V>
using FlatHashMap = std::unordered_map<K, V>;

template <class T>
using FlatHashSet = std::unordered_set<T>;

#endif

}  // namespace gensim
