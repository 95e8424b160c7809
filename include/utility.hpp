/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_UTILITY_HPP
#define ISOWEAVE_UTILITY_HPP

// standard
#include <chrono>
#include <cstddef>
#include <string>

/**
 * Diagnostics go to stderr so that records written to stdout stay clean.
 */
namespace logging {
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // progress reporting, silent unless enabled with --progress
    void set_progress_enabled(bool enabled);
    bool progress_enabled();
    void progress_start();
    void progress(size_t count, const std::string& prefix);
    void progress_done(size_t count, const std::string& message);
}

#endif //ISOWEAVE_UTILITY_HPP
