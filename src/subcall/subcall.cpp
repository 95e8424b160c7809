/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "subcall/subcall.hpp"

#include <filesystem>
#include <stdexcept>

#include "utility.hpp"

namespace subcall {

void subcall::add_common_options(cxxopts::Options& options) {
    options.add_options("Common")
        ("o,output", "Output file (default: stdout)",
            cxxopts::value<std::string>())
        ("progress", "Show progress output")
        ("h,help", "Show help message")
        ;
}

void subcall::apply_common_options(const cxxopts::ParseResult& args) {
    if (args.count("progress")) {
        logging::set_progress_enabled(true);
    }
}

void subcall::require_files(const std::vector<std::string>& files) {
    for (const auto& f : files) {
        if (!std::filesystem::exists(f)) {
            throw std::runtime_error("Input file not found: " + f);
        }
    }
}

void subcall::run(const cxxopts::ParseResult& args) {
    validate(args);
    apply_common_options(args);
    execute(args);
}

} // namespace subcall
