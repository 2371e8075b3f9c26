// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <spindle/infra/common/terminal.hpp>

namespace spindle::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,  // always printed, no severity tag
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,  // per batch details
    kTrace   // per block details
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
//! \note This function is not thread safe as it's meant to be used in tests
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void set_verbosity(Level level);

//! \brief Names the calling thread in log lines, e.g. the workers of a pool
void set_thread_name(std::string_view name);

//! \brief Name of the calling thread, its id when unnamed
std::string get_thread_name();

//! \brief Whether lines of the given level are printed with the current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void tee_file(const std::filesystem::path& path);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    // Accumulators
    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    void append(const Args& args) {
        append("", args);
    }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    static constexpr int kMessageWidth{36};

    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(kMessageWidth) << std::setfill(' ') << msg;
        bool left{true};
        for (const auto& arg : args) {
            ss_ << (left ? kColorGreen : kColorWhite) << arg << kColorReset << (left ? "=" : " ") << kColorReset;
            left = !left;
        }
    }
    void flush();
    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace spindle::log

#define SPINDLE_LOGBUFFER(level_, ...)           \
    if (!spindle::log::test_verbosity(level_)) { \
    } else                                       \
        spindle::log::LogBuffer<level_>(__VA_ARGS__)

#define SPINDLE_TRACE_M(...) SPINDLE_LOGBUFFER(spindle::log::Level::kTrace, __VA_ARGS__)
#define SPINDLE_DEBUG_M(...) SPINDLE_LOGBUFFER(spindle::log::Level::kDebug, __VA_ARGS__)
#define SPINDLE_INFO_M(...) SPINDLE_LOGBUFFER(spindle::log::Level::kInfo, __VA_ARGS__)
#define SPINDLE_WARN_M(...) SPINDLE_LOGBUFFER(spindle::log::Level::kWarning, __VA_ARGS__)
#define SPINDLE_ERROR_M(...) SPINDLE_LOGBUFFER(spindle::log::Level::kError, __VA_ARGS__)
#define SPINDLE_CRIT_M(...) SPINDLE_LOGBUFFER(spindle::log::Level::kCritical, __VA_ARGS__)
#define SPINDLE_LOG_M(...) SPINDLE_LOGBUFFER(spindle::log::Level::kNone, __VA_ARGS__)

#define SPINDLE_TRACE SPINDLE_TRACE_M()
#define SPINDLE_DEBUG SPINDLE_DEBUG_M()
#define SPINDLE_INFO SPINDLE_INFO_M()
#define SPINDLE_WARN SPINDLE_WARN_M()
#define SPINDLE_ERROR SPINDLE_ERROR_M()
