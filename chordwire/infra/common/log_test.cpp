// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <absl/strings/match.h>
#include <catch2/catch.hpp>

#include <chordwire/infra/test_util/log.hpp>

namespace chordwire::log {

//! Custom LogBuffer just for testing to access buffered content
template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    explicit LogBufferForTest() : LogBuffer<level>() {}
    explicit LogBufferForTest(std::string_view msg, const Args& args) : LogBuffer<level>(msg, args) {}

    std::string content() const { return LogBuffer<level>::ss_.str(); }
};

TEST_CASE("LogBuffer", "[chordwire][infra][log]") {
    test_util::VerbosityGuard log_guard{get_verbosity()};
    test_util::OutputCapture output;
    Settings settings{.log_nocolor = true, .log_verbosity = Level::kInfo};
    init(settings);

    SECTION("LogBuffer stores nothing for verbosity higher than configured") {
        LogBufferForTest<Level::kDebug> debug_buffer;
        debug_buffer << "hidden";
        CHECK(debug_buffer.content().empty());

        LogBufferForTest<Level::kTrace> trace_buffer;
        trace_buffer << "hidden";
        CHECK(trace_buffer.content().empty());
    }

    SECTION("LogBuffer stores content for verbosity lower than or equal to configured") {
        LogBufferForTest<Level::kInfo> info_buffer;
        info_buffer << "shown";
        CHECK(absl::StrContains(info_buffer.content(), "shown"));
        CHECK(absl::StrContains(info_buffer.content(), "INFO"));
    }

    SECTION("LogBuffer formats key value arguments") {
        LogBufferForTest<Level::kWarning> buffer{"Decoded", {"type", "GetPeers", "size", "5"}};
        CHECK(absl::StrContains(buffer.content(), "Decoded"));
        CHECK(absl::StrContains(buffer.content(), "type"));
        CHECK(absl::StrContains(buffer.content(), "GetPeers"));
    }

    SECTION("flushed lines go to std::cerr by default") {
        { CHORD_ERROR_M("Relay decode failed", {"error", "kInputTooShort"}); }
        CHECK(absl::StrContains(output.err(), "Relay decode failed"));
        CHECK(absl::StrContains(output.err(), "kInputTooShort"));
        CHECK(output.out().empty());
    }

    SECTION("macros skip disabled levels") {
        CHORD_TRACE << "never printed";
        CHECK_FALSE(absl::StrContains(output.err(), "never printed"));
    }
}

TEST_CASE("Log file tee", "[chordwire][infra][log]") {
    test_util::VerbosityGuard log_guard{get_verbosity()};
    test_util::OutputCapture output;

    const auto path{std::filesystem::temp_directory_path() / "chordwire_log_test.log"};
    std::filesystem::remove(path);
    init(Settings{.log_verbosity = Level::kInfo, .log_file = path.string()});

    { CHORD_WARN_M("Unknown message type", {"tag", "101"}); }

    std::ifstream file{path};
    const std::string content{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    CHECK(absl::StrContains(content, "Unknown message type"));
    CHECK(absl::StrContains(content, "tag=101"));
    CHECK_FALSE(absl::StrContains(content, "\x1b["));
    CHECK(absl::StrContains(output.err(), "Unknown message type"));

    CHECK_THROWS_AS(tee_file(std::filesystem::path{"/nonexistent-dir/chordwire.log"}), std::runtime_error);
}

TEST_CASE("test_verbosity", "[chordwire][infra][log]") {
    test_util::VerbosityGuard log_guard{Level::kWarning};
    CHECK(test_verbosity(Level::kCritical));
    CHECK(test_verbosity(Level::kError));
    CHECK(test_verbosity(Level::kWarning));
    CHECK_FALSE(test_verbosity(Level::kInfo));
    CHECK_FALSE(test_verbosity(Level::kTrace));
}

TEST_CASE("thread name", "[chordwire][infra][log]") {
    set_thread_name("codec");
    CHECK(get_thread_name() == "codec      ");
}

}  // namespace chordwire::log
