// Copyright 2025 The Spindle Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace spindle::log {

namespace {

    constexpr size_t kThreadNameWidth{11};

    struct LevelTag {
        std::string_view label;
        std::string_view color;
    };

    LevelTag level_tag(Level level) {
        switch (level) {
            case Level::kTrace:
                return {"TRACE", kColorCoal};
            case Level::kDebug:
                return {"DEBUG", kBackgroundPurple};
            case Level::kInfo:
                return {" INFO", kColorGreen};
            case Level::kWarning:
                return {" WARN", kColorOrangeHigh};
            case Level::kError:
                return {"ERROR", kColorRed};
            case Level::kCritical:
                return {" CRIT", kBackgroundRed};
            case Level::kNone:
                break;
        }
        return {"     ", kColorReset};
    }

    std::string strip_colors(const std::string& line) {
        static const std::regex kEscapeSequence{"\x1b\\[[0-9;]+m"};
        return std::regex_replace(line, kEscapeSequence, "");
    }

    //! Process-wide destination of log lines
    class Sink {
      public:
        void configure(const Settings& settings) {
            settings_ = settings;
            file_.reset();
            if (!settings_.log_file.empty()) {
                open_file(settings_.log_file);
            }
            const bool terminal{settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
            settings_.log_nocolor = settings_.log_nocolor || !terminal || file_ != nullptr;
            time_zone_ = settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone();
        }

        void open_file(const std::filesystem::path& path) {
            auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                throw std::runtime_error("cannot open log file " + path.string());
            }
            file_ = std::move(file);
        }

        void write(const std::string& line) {
            const std::string plain{strip_colors(line)};
            std::scoped_lock lock{mutex_};
            auto& out = settings_.log_std_out ? std::cout : std::cerr;
            out << (settings_.log_nocolor ? plain : line) << '\n';
            if (file_) {
                *file_ << plain << '\n';
            }
        }

        Settings& settings() { return settings_; }
        const absl::TimeZone& time_zone() const { return time_zone_; }

      private:
        Settings settings_;
        absl::TimeZone time_zone_{absl::UTCTimeZone()};
        std::mutex mutex_;
        std::unique_ptr<std::ofstream> file_;
    };

    Sink& sink() {
        static Sink instance;
        return instance;
    }

    thread_local std::string thread_name;

}  // namespace

void init(const Settings& settings) { sink().configure(settings); }

void tee_file(const std::filesystem::path& path) {
    sink().open_file(path);
    sink().settings().log_nocolor = true;
}

Level get_verbosity() { return sink().settings().log_verbosity; }

void set_verbosity(Level level) { sink().settings().log_verbosity = level; }

bool test_verbosity(Level level) { return level <= sink().settings().log_verbosity; }

void set_thread_name(std::string_view name) {
    thread_name.assign(name);
    thread_name.resize(kThreadNameWidth, ' ');
}

std::string get_thread_name() {
    if (thread_name.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        return id.str();
    }
    return thread_name;
}

BufferBase::BufferBase(Level level) : should_print_(test_verbosity(level)) {
    if (!should_print_) return;

    const auto [label, color] = level_tag(level);
    ss_ << kColorReset << " " << color << label << kColorReset << " ";
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), sink().time_zone()) << "] "
        << kColorReset;
    if (sink().settings().log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::flush() {
    if (!should_print_) return;
    sink().write(ss_.str());
}

}  // namespace spindle::log
