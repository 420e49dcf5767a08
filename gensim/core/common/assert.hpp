// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace gensim {
[[noreturn]] void abort_due_to_assertion_failure(char const* expr, char const* file, int line);
}

// GENSIM_ASSERT always aborts program execution on assertion failure, even when NDEBUG is defined.
#define GENSIM_ASSERT(expr)   \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::gensim::abort_due_to_assertion_failure(#expr, __FILE__, __LINE__)
