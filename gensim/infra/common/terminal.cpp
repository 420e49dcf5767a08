// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <unistd.h>

namespace gensim {

bool is_terminal(std::FILE* stream) { return isatty(fileno(stream)) != 0; }

}  // namespace gensim
