/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "interval_utils.hpp"

#include <algorithm>

namespace interval_utils {

std::vector<exon_span> from_blocks(const std::vector<alignment_block>& blocks) {
    std::vector<exon_span> exons;
    exons.reserve(blocks.size());
    for (const auto& block : blocks) {
        exons.emplace_back(block.start, block.end());
    }
    std::stable_sort(exons.begin(), exons.end(), [](const exon_span& a, const exon_span& b) {
        return a.start < b.start;
    });
    return exons;
}

std::vector<exon_span> fill_gaps(const std::vector<exon_span>& exons, int gap_size) {
    std::vector<exon_span> merged;
    if (exons.empty()) return merged;

    exon_span current = exons.front();
    for (size_t i = 1; i < exons.size(); ++i) {
        const exon_span& next = exons[i];
        // signed arithmetic: overlapping blocks give a negative gap
        long long gap = static_cast<long long>(next.start) - static_cast<long long>(current.end);
        if (gap <= gap_size) {
            current.end = std::max(current.end, next.end);
        } else {
            merged.push_back(current);
            current = next;
        }
    }
    merged.push_back(current);

    return merged;
}

std::vector<std::vector<exon_span>> split_at_short_exons(
    const std::vector<exon_span>& exons, int min_exon_len) {

    std::vector<std::vector<exon_span>> runs;
    std::vector<exon_span> kept;

    for (const auto& exon : exons) {
        if (static_cast<long long>(exon.length()) + 1 >= min_exon_len) {
            kept.push_back(exon);
        } else if (!kept.empty()) {
            runs.push_back(std::move(kept));
            kept.clear();
        }
    }
    if (!kept.empty()) {
        runs.push_back(std::move(kept));
    }

    return runs;
}

std::vector<exon_span> merge_overlapping(std::vector<exon_span> exons) {
    std::vector<exon_span> merged;
    if (exons.empty()) return merged;

    std::sort(exons.begin(), exons.end(), [](const exon_span& a, const exon_span& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end < b.end;
    });

    exon_span current = exons.front();
    for (size_t i = 1; i < exons.size(); ++i) {
        if (exons[i].start <= current.end) {
            current.end = std::max(current.end, exons[i].end);
        } else {
            merged.push_back(current);
            current = exons[i];
        }
    }
    merged.push_back(current);

    return merged;
}

} // namespace interval_utils
