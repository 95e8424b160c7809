/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_SUBCALL_ASSEMBLE_HPP
#define ISOWEAVE_SUBCALL_ASSEMBLE_HPP

#include "subcall/subcall.hpp"

#include "assembler.hpp"

namespace subcall {

/**
 * Assemble subcommand: build gene and transcript models from spliced
 * alignments.
 *
 * Pipeline:
 * 1. Reads PSL/BED12/SAM/BAM alignments into the exon and intron registries
 * 2. Merges intron clusters into gene loci
 * 3. Builds and collapses a splice graph per locus
 * 4. Enumerates isoforms (all maximal paths or a minimal covering set)
 * 5. Writes surviving transcripts and merged unspliced genes as BED12
 */
class assemble : public subcall {
public:
    cxxopts::Options parse_args(int argc, char** argv) override;
    void validate(const cxxopts::ParseResult& args) override;
    void execute(const cxxopts::ParseResult& args) override;

    std::string name() const override { return "assemble"; }
    std::string description() const override {
        return "Assemble transcript models from spliced alignments";
    }

    /**
     * Collect assembly parameters from parsed options (not validated)
     */
    static assembler::config make_config(const cxxopts::ParseResult& args);

private:
    void report_parameters(const cxxopts::ParseResult& args, const assembler::config& cfg) const;
};

} // namespace subcall

#endif // ISOWEAVE_SUBCALL_ASSEMBLE_HPP
