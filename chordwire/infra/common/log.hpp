// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace chordwire::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or in the local timezone
    bool log_utc{true};
    //! Whether to disable colorized output (always disabled if not on a terminal or when teeing to file)
    bool log_nocolor{false};
    //! Whether to print thread ids in log lines
    bool log_threads{false};
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \note Not thread safe, meant to be used in tests
Level get_verbosity();

//! \note Not thread safe, meant to be used at start of process
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
//! \remarks Use it to skip building expensive log arguments, e.g. hex dumps of large packets
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! Alternating key and value strings
using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& t) {
        if (should_print_) ss_ << t;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append("", args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args);
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

}  // namespace chordwire::log

#define CHORD_LOGBUFFER(level_, ...)               \
    if (!chordwire::log::test_verbosity(level_)) { \
    } else                                         \
        chordwire::log::LogBuffer<level_>(__VA_ARGS__)

#define CHORD_TRACE_M(...) CHORD_LOGBUFFER(chordwire::log::Level::kTrace, __VA_ARGS__)
#define CHORD_DEBUG_M(...) CHORD_LOGBUFFER(chordwire::log::Level::kDebug, __VA_ARGS__)
#define CHORD_INFO_M(...) CHORD_LOGBUFFER(chordwire::log::Level::kInfo, __VA_ARGS__)
#define CHORD_WARN_M(...) CHORD_LOGBUFFER(chordwire::log::Level::kWarning, __VA_ARGS__)
#define CHORD_ERROR_M(...) CHORD_LOGBUFFER(chordwire::log::Level::kError, __VA_ARGS__)
#define CHORD_CRIT_M(...) CHORD_LOGBUFFER(chordwire::log::Level::kCritical, __VA_ARGS__)
#define CHORD_LOG_M(...) CHORD_LOGBUFFER(chordwire::log::Level::kNone, __VA_ARGS__)

#define CHORD_TRACE CHORD_TRACE_M()
#define CHORD_DEBUG CHORD_DEBUG_M()
#define CHORD_INFO CHORD_INFO_M()
#define CHORD_WARN CHORD_WARN_M()
#define CHORD_ERROR CHORD_ERROR_M()
#define CHORD_CRIT CHORD_CRIT_M()
#define CHORD_LOG CHORD_LOG_M()
