// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <gensim/infra/common/terminal.hpp>

namespace gensim::log {

namespace {

    // Messages are padded so that arguments line up
    constexpr int kMessageWidth{41};

    struct LevelStyle {
        std::string_view tag;
        std::string_view color;
    };

    // Indexed by Level
    constexpr std::array<LevelStyle, 6> kLevelStyles{{
        {" CRIT", kBackgroundRed},
        {"ERROR", kColorRed},
        {" WARN", kColorOrangeHigh},
        {" INFO", kColorGreen},
        {"DEBUG", kBackgroundPurple},
        {"TRACE", kColorCoal},
    }};

    //! Process-wide destination of log lines
    class Sink {
      public:
        void configure(const Settings& settings) {
            settings_ = settings;
            colored_ = !settings.no_color && is_terminal(settings.to_stdout ? stdout : stderr);
            time_zone_ = settings.utc ? absl::UTCTimeZone() : absl::LocalTimeZone();
            file_.reset();
            if (!settings.file.empty()) {
                open_file(settings.file);
            }
        }

        void open_file(const std::filesystem::path& path) {
            std::ofstream file{path, std::ios::out | std::ios::app};
            if (!file.is_open()) {
                throw std::runtime_error("Could not open file " + path.string());
            }
            file_.emplace(std::move(file));
            // Escape sequences would end up in the file
            colored_ = false;
        }

        Settings& settings() { return settings_; }

        std::string_view paint(std::string_view color) const { return colored_ ? color : std::string_view{}; }

        const absl::TimeZone& time_zone() const { return time_zone_; }

        void write(const std::string& line) {
            std::scoped_lock lock{mutex_};
            (settings_.to_stdout ? std::cout : std::cerr) << line << '\n';
            if (file_) {
                *file_ << line << '\n' << std::flush;
            }
        }

      private:
        Settings settings_;
        bool colored_{false};
        absl::TimeZone time_zone_{absl::UTCTimeZone()};
        std::optional<std::ofstream> file_;
        std::mutex mutex_;
    };

    Sink& sink() {
        static Sink instance;
        return instance;
    }

}  // namespace

void init(const Settings& settings) { sink().configure(settings); }

void tee_file(const std::filesystem::path& path) { sink().open_file(path); }

Level get_verbosity() { return sink().settings().verbosity; }

void set_verbosity(Level level) { sink().settings().verbosity = level; }

bool test_verbosity(Level level) { return level <= get_verbosity(); }

Record::Record(Level level) : enabled_{test_verbosity(level)} {
    if (!enabled_) return;

    const Sink& out{sink()};
    const LevelStyle& style{kLevelStyles[static_cast<size_t>(level)]};
    stream_ << ' ' << out.paint(style.color) << style.tag << out.paint(kColorReset) << ' ';
    stream_ << out.paint(kColorWhite) << '[' << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), out.time_zone())
            << "] " << out.paint(kColorReset);
    if (sink().settings().thread_ids) {
        stream_ << '[' << std::this_thread::get_id() << "] ";
    }
}

Record::Record(Level level, std::string_view message, const Args& args) : Record(level) {
    if (!enabled_) return;
    stream_ << std::left << std::setw(kMessageWidth) << message;
    append_args(args);
}

Record::~Record() {
    if (enabled_) {
        sink().write(stream_.str());
    }
}

void Record::append_args(const Args& args) {
    if (!enabled_) return;
    const Sink& out{sink()};
    for (size_t i{0}; i < args.size(); ++i) {
        const bool is_key{i % 2 == 0};
        stream_ << out.paint(is_key ? kColorGreen : kColorWhite) << args[i] << out.paint(kColorReset)
                << (is_key ? "=" : " ");
    }
}

}  // namespace gensim::log
