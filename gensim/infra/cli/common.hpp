// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include <gensim/infra/common/log.hpp>

namespace gensim::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& settings);

//! \brief Set up option for the contract asset directory, which must exist
void add_option_assets_dir(CLI::App& cli, std::filesystem::path& assets_dir);

//! \brief Set up option for the name of a built-in network, one of known_names
void add_option_network(CLI::App& cli, std::string& network, const std::vector<std::string>& known_names);

//! \brief Set up option for an optional input file, checking that it exists if specified
void add_option_config_file(CLI::App& cli, std::optional<std::filesystem::path>& config_file);

}  // namespace gensim::cmd::common
