// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

#include <CLI/CLI.hpp>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <nlohmann/json.hpp>

#include <gensim/core/execution/precompile.hpp>
#include <gensim/genesis/assets.hpp>
#include <gensim/genesis/genesis_config.hpp>
#include <gensim/genesis/orchestrator.hpp>
#include <gensim/infra/cli/common.hpp>
#include <gensim/infra/common/ensure.hpp>
#include <gensim/infra/common/log.hpp>

using namespace gensim;

static genesis::GenesisConfig load_genesis_config(const std::optional<std::filesystem::path>& config_file,
                                                  const std::string& network) {
    if (!config_file) {
        auto known{genesis::lookup_known_network(network)};
        ensure(known.has_value(), [&]() { return "unknown network: " + network; });
        log::Info("Using built-in network", {"name", network});
        return std::move(*known);
    }
    std::ifstream in{*config_file};
    ensure(in.is_open(), [&]() { return "cannot open " + config_file->string(); });
    const auto json{nlohmann::json::parse(in, /*cb=*/nullptr, /*allow_exceptions=*/false)};
    auto config{genesis::GenesisConfig::from_json(json)};
    ensure(config.has_value(), [&]() { return "invalid genesis configuration in " + config_file->string(); });
    log::Info("Using genesis configuration", {"file", config_file->string()});
    return std::move(*config);
}

int main(int argc, char* argv[]) {
    CLI::App app{"Generate a genesis file with system contracts deployed by simulation"};

    std::filesystem::path assets_dir;
    cmd::common::add_option_assets_dir(app, assets_dir);

    std::string network{"dev"};
    cmd::common::add_option_network(app, network, genesis::known_network_names());

    std::optional<std::filesystem::path> config_file;
    cmd::common::add_option_config_file(app, config_file);

    std::filesystem::path output{"genesis.json"};
    app.add_option("--output", output, "Path of the genesis file to write")->capture_default_str();

    log::Settings log_settings;
    cmd::common::add_logging_options(app, log_settings);

    CLI11_PARSE(app, argc, argv)

    try {
        log::init(log_settings);
        const absl::Time start{absl::Now()};

        const auto config{load_genesis_config(config_file, network)};
        log::Info("Genesis configuration", {"chain_id", std::to_string(config.chain_id),
                                            "validators", std::to_string(config.validators.size())});

        const genesis::AssetBundle assets{assets_dir};
        const precompile::Registry precompiles;
        const genesis::GenesisBuilder builder{assets, precompiles};
        const auto document{builder.build(config)};

        genesis::write_genesis(document, output);
        log::Info("Genesis generation completed", {"elapsed", absl::FormatDuration(absl::Now() - start)});
        return 0;
    } catch (const genesis::DeploymentError& ex) {
        log::Critical("System contract deployment failed", {"contract", ex.contract(), "error", ex.what()});
    } catch (const std::exception& ex) {
        log::Critical("Genesis generation failed", {"error", ex.what()});
    }
    return 1;
}
