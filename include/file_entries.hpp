/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_FILE_ENTRIES_HPP
#define ISOWEAVE_FILE_ENTRIES_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// one aligned block on the reference, 0-based half-open
struct alignment_block {
    size_t start;
    size_t size;

    alignment_block() : start(0), size(0) {}
    alignment_block(size_t start, size_t size) : start{start}, size{size} {}

    size_t end() const { return start + size; }
};

/**
 * A spliced alignment of one transcript read against the reference.
 * Produced by the PSL, BED12 and SAM/BAM readers alike.
 */
struct alignment_record {
    std::string name;
    std::string seqid;
    char strand;
    std::vector<alignment_block> blocks;

    alignment_record() : strand('+') {}
    alignment_record(std::string name, std::string seqid, char strand,
        std::vector<alignment_block> blocks)
        : name{std::move(name)}, seqid{std::move(seqid)}, strand{strand},
          blocks{std::move(blocks)} {}
};

#endif //ISOWEAVE_FILE_ENTRIES_HPP
