// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "terminal.hpp"

namespace chordwire::log {

//! The fixed size for thread name in log lines
static constexpr size_t kThreadNameFixedSize{11};

//! Messages are padded so that key/value arguments line up
static constexpr size_t kMessageWidth{40};

static Settings settings_{};
static bool colored_{false};
static std::mutex out_mtx_;
static std::unique_ptr<std::ofstream> file_;
thread_local std::string thread_name_;

void init(const Settings& settings) {
    settings_ = settings;
    if (!settings_.log_file.empty()) {
        tee_file(settings_.log_file);
    }
    std::ostream& out{settings_.log_std_out ? std::cout : std::cerr};
    // Escape sequences must never end up in a log file
    colored_ = !settings_.log_nocolor && !file_ && terminal::is_tty(out);
}

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    std::scoped_lock lock{out_mtx_};
    file_ = std::move(file);
    colored_ = false;
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = name;
    thread_name_.resize(kThreadNameFixedSize, ' ');
}

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::stringstream ss;
        ss << std::this_thread::get_id();
        thread_name_ = ss.str();
    }
    return thread_name_;
}

namespace {

    struct LevelStyle {
        std::string_view tag;
        std::string_view color;
    };

    LevelStyle level_style(Level level) {
        switch (level) {
            case Level::kTrace:
                return {"TRACE", terminal::color::kGrey};
            case Level::kDebug:
                return {"DEBUG", terminal::color::kOnPurple};
            case Level::kInfo:
                return {" INFO", terminal::color::kGreen};
            case Level::kWarning:
                return {" WARN", terminal::color::kBoldYellow};
            case Level::kError:
                return {"ERROR", terminal::color::kRed};
            case Level::kCritical:
                return {" CRIT", terminal::color::kOnRed};
            case Level::kNone:
                break;
        }
        return {"     ", terminal::color::kReset};
    }

    //! Writes text wrapped in the given color when colors are enabled
    struct Colored {
        std::string_view color;
        std::string_view text;
    };

    std::ostream& operator<<(std::ostream& out, const Colored& c) {
        if (colored_) {
            return out << c.color << c.text << terminal::color::kReset;
        }
        return out << c.text;
    }

}  // namespace

BufferBase::BufferBase(Level level) : should_print_(test_verbosity(level)) {
    if (!should_print_) return;

    const auto [tag, color] = level_style(level);
    ss_ << " " << Colored{color, tag} << " ";

    static const absl::TimeZone kTz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    const std::string timestamp{absl::FormatTime("[%m-%d|%H:%M:%E3S ", absl::Now(), kTz) + kTz.name() + "]"};
    ss_ << Colored{terminal::color::kWhite, timestamp} << " ";

    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::append(std::string_view msg, const Args& args) {
    if (!should_print_) return;
    if (!msg.empty() || !args.empty()) {
        ss_ << msg;
        if (!args.empty() && msg.size() < kMessageWidth) {
            ss_ << std::string(kMessageWidth - msg.size(), ' ');
        }
    }
    for (size_t i{0}; i < args.size(); ++i) {
        const bool is_key{i % 2 == 0};
        ss_ << Colored{is_key ? terminal::color::kCyan : terminal::color::kWhite, args[i]}
            << (is_key ? "=" : " ");
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{absl::StripTrailingAsciiWhitespace(ss_.str())};
    std::scoped_lock lock{out_mtx_};
    std::ostream& out{settings_.log_std_out ? std::cout : std::cerr};
    out << line << '\n';
    if (file_) {
        *file_ << line << '\n';
        file_->flush();
    }
}

}  // namespace chordwire::log
