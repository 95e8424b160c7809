/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_SUBCALL_HPP
#define ISOWEAVE_SUBCALL_HPP

#include <string>
#include <vector>

#include <cxxopts.hpp>

namespace subcall {

/**
 * Abstract base class for all isoweave subcommands.
 */
class subcall {
public:
    virtual ~subcall() = default;

    /**
     * Parse command-line arguments and return the options object.
     * The subclass defines its own options here.
     * Should call add_common_options() to include shared options.
     */
    virtual cxxopts::Options parse_args(int argc, char** argv) = 0;

    /**
     * Validate parsed arguments. Throws on invalid input.
     */
    virtual void validate(const cxxopts::ParseResult& args) = 0;

    /**
     * Execute the subcommand (called after validation).
     */
    virtual void execute(const cxxopts::ParseResult& args) = 0;

    /**
     * Template method: validate → apply_common_options → execute.
     */
    void run(const cxxopts::ParseResult& args);

    /**
     * Add common options shared across all subcommands.
     * Call this in parse_args() implementations.
     */
    static void add_common_options(cxxopts::Options& options);

    /**
     * Get the subcommand name (for help text).
     */
    virtual std::string name() const = 0;

    /**
     * Get brief description (for help text).
     */
    virtual std::string description() const = 0;

protected:
    /**
     * Check that every listed input file exists.
     * @throws std::runtime_error naming the first missing file
     */
    static void require_files(const std::vector<std::string>& files);

private:
    /**
     * Apply common options (progress, etc.)
     */
    static void apply_common_options(const cxxopts::ParseResult& args);
};

} // namespace subcall

#endif // ISOWEAVE_SUBCALL_HPP
