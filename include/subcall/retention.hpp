/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_SUBCALL_RETENTION_HPP
#define ISOWEAVE_SUBCALL_RETENTION_HPP

#include "subcall/subcall.hpp"

namespace subcall {

/**
 * Retention subcommand: report intron retention events found in an
 * assembled BED12 transcript set as GFF3.
 *
 * Transcripts are expected grouped by gene (as written by `assemble`).
 */
class retention : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "retention"; }
    std::string description() const override {
        return "Detect intron retention events in assembled transcripts";
    }
};

} // namespace subcall

#endif // ISOWEAVE_SUBCALL_RETENTION_HPP
