/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_INTERVAL_UTILS_HPP
#define ISOWEAVE_INTERVAL_UTILS_HPP

// standard
#include <cstddef>
#include <vector>

// class
#include "file_entries.hpp"

/**
 * Exon interval of a single alignment before registration.
 * start is the block start, end = start + size.
 */
struct exon_span {
    size_t start;
    size_t end;

    exon_span() : start(0), end(0) {}
    exon_span(size_t start, size_t end) : start{start}, end{end} {}

    size_t length() const { return end - start; }

    bool operator==(const exon_span& other) const {
        return start == other.start && end == other.end;
    }
};

namespace interval_utils {

    // Convert aligned blocks into exon spans ordered by start
    std::vector<exon_span> from_blocks(const std::vector<alignment_block>& blocks);

    /**
     * Merge consecutive blocks separated by at most gap_size bases so that
     * small alignment gaps do not show up as spurious introns.
     * Blocks must be ordered along the chromosome.
     */
    std::vector<exon_span> fill_gaps(const std::vector<exon_span>& exons, int gap_size);

    /**
     * Drop exons shorter than min_exon_len ((end - start) + 1 < min_exon_len).
     * Every dropped exon ends the current run, each run is handled as an
     * independent partial transcript.
     */
    std::vector<std::vector<exon_span>> split_at_short_exons(
        const std::vector<exon_span>& exons, int min_exon_len);

    /**
     * Sweep-merge intervals by overlap (next.start <= current.end).
     * Input need not be sorted. Result is ordered by start.
     */
    std::vector<exon_span> merge_overlapping(std::vector<exon_span> exons);

} // namespace interval_utils

#endif //ISOWEAVE_INTERVAL_UTILS_HPP
