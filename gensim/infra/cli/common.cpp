// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>

namespace gensim::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& settings) {
    const std::map<std::string, log::Level> levels{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    CLI::Option_group& group{*cli.add_option_group("Log", "Logging options")};
    group.add_option("--log.verbosity", settings.verbosity, "Lowest severity printed")
        ->transform(CLI::CheckedTransformer(levels, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    group.add_flag("--log.stdout", settings.to_stdout, "Log to stdout instead of stderr");
    group.add_flag("--log.nocolor", settings.no_color, "Disable colors on log lines");
    group.add_flag("--log.utc", settings.utc, "Print log timestamps in UTC");
    group.add_flag("--log.threads", settings.thread_ids, "Print thread ids");
    group.add_option("--log.file", settings.file, "Also append log lines to this file");
}

void add_option_assets_dir(CLI::App& cli, std::filesystem::path& assets_dir) {
    cli.add_option("--assets", assets_dir, "Directory holding contracts/<Name>.json and abi/<Name>.json")
        ->required()
        ->check(CLI::ExistingDirectory);
}

void add_option_network(CLI::App& cli, std::string& network, const std::vector<std::string>& known_names) {
    cli.add_option("--network", network, "Name of the built-in network configuration")
        ->check(CLI::IsMember(known_names, CLI::ignore_case))
        ->capture_default_str();
}

void add_option_config_file(CLI::App& cli, std::optional<std::filesystem::path>& config_file) {
    cli.add_option("--config", config_file, "Genesis configuration JSON file, overrides --network")
        ->check(CLI::ExistingFile);
}

}  // namespace gensim::cmd::common
