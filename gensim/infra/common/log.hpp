// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace gensim::log {

//! \brief Severity of a log line, from most to least severe
enum class Level {
    kCritical,  // The run cannot go on
    kError,
    kWarning,  // Something the operator may want to fix
    kInfo,
    kDebug,
    kTrace,
};

struct Settings {
    Level verbosity{Level::kInfo};
    bool to_stdout{false};  // std::cerr otherwise
    bool no_color{false};
    bool utc{true};  // local time zone otherwise
    bool thread_ids{false};
    std::string file;  // tee target, none if empty
};

//! \brief Installs settings for all subsequent log lines
//! \note Not thread safe: call before any other thread logs
void init(const Settings& settings = {});

Level get_verbosity();
void set_verbosity(Level level);

//! \brief Whether lines at level are currently printed
bool test_verbosity(Level level);

//! \brief Copies every subsequent line into the file at path, appending
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! Key/value pairs laid out as k1, v1, k2, v2...
using Args = std::vector<std::string>;

//! \brief One log line, emitted when the record goes out of scope
class Record {
  public:
    explicit Record(Level level);
    Record(Level level, std::string_view message, const Args& args);
    ~Record();

    Record(const Record&) = delete;
    Record& operator=(const Record&) = delete;

    template <class T>
    Record& operator<<(const T& value) {
        if (enabled_) stream_ << value;
        return *this;
    }
    Record& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    void append_args(const Args& args);

    const bool enabled_;
    std::ostringstream stream_;
};

template <Level level>
class LogBuffer : public Record {
  public:
    LogBuffer() : Record(level) {}
    explicit LogBuffer(std::string_view message, const Args& args = {}) : Record(level, message, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;

}  // namespace gensim::log

// Arguments are not evaluated when the level is filtered out
#define GENSIM_LOGBUFFER(level_, ...)           \
    if (!gensim::log::test_verbosity(level_)) { \
    } else                                      \
        gensim::log::LogBuffer<level_>(__VA_ARGS__)

#define GENSIM_LOG_TRACE(...) GENSIM_LOGBUFFER(gensim::log::Level::kTrace, __VA_ARGS__)
#define GENSIM_LOG_DEBUG(...) GENSIM_LOGBUFFER(gensim::log::Level::kDebug, __VA_ARGS__)
#define GENSIM_LOG_INFO(...) GENSIM_LOGBUFFER(gensim::log::Level::kInfo, __VA_ARGS__)
#define GENSIM_LOG_WARN(...) GENSIM_LOGBUFFER(gensim::log::Level::kWarning, __VA_ARGS__)
#define GENSIM_LOG_ERROR(...) GENSIM_LOGBUFFER(gensim::log::Level::kError, __VA_ARGS__)
#define GENSIM_LOG_CRIT(...) GENSIM_LOGBUFFER(gensim::log::Level::kCritical, __VA_ARGS__)
