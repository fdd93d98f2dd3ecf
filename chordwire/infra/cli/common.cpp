// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

#include <absl/strings/ascii.h>
#include <magic_enum.hpp>

namespace chordwire::cmd::common {

//! Maps lowercase level names without prefix, e.g. "warning", to log levels
static std::map<std::string, log::Level> log_level_names() {
    std::map<std::string, log::Level> names;
    for (const auto level : magic_enum::enum_values<log::Level>()) {
        if (level == log::Level::kNone) continue;
        std::string name{magic_enum::enum_name(level).substr(1)};
        names.emplace(absl::AsciiStrToLower(name), level);
    }
    return names;
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(log_level_names(), CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

}  // namespace chordwire::cmd::common
