// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include <chordwire/infra/common/log.hpp>

namespace chordwire::test_util {

//! Sets the log verbosity for the lifetime of the guard and restores the previous one on exit
class VerbosityGuard {
  public:
    explicit VerbosityGuard(log::Level level) : saved_{log::get_verbosity()} { log::set_verbosity(level); }
    ~VerbosityGuard() { log::set_verbosity(saved_); }

    VerbosityGuard(const VerbosityGuard&) = delete;
    VerbosityGuard& operator=(const VerbosityGuard&) = delete;

  private:
    log::Level saved_;
};

//! Redirects std::cout and std::cerr into in-memory buffers until destroyed
class OutputCapture {
  public:
    OutputCapture() : cout_saved_{std::cout.rdbuf(out_.rdbuf())}, cerr_saved_{std::cerr.rdbuf(err_.rdbuf())} {}
    ~OutputCapture() {
        std::cout.rdbuf(cout_saved_);
        std::cerr.rdbuf(cerr_saved_);
    }

    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    std::string out() const { return out_.str(); }
    std::string err() const { return err_.str(); }

  private:
    std::stringstream out_;
    std::stringstream err_;
    std::streambuf* cout_saved_;
    std::streambuf* cerr_saved_;
};

}  // namespace chordwire::test_util
