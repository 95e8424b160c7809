/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_PATH_ENUMERATOR_HPP
#define ISOWEAVE_PATH_ENUMERATOR_HPP

// standard
#include <cstddef>
#include <vector>

// class
#include "exon_registry.hpp"
#include "splice_graph.hpp"

// Ordered exon handles from a root to a leaf of a splice graph
using transcript_path = std::vector<exon_id>;

/**
 * Enumerate all maximal root-to-leaf paths.
 *
 * Depth-first walk from every node without predecessors. Visited nodes are
 * tracked per path, so a successor already on the current path is never
 * re-entered and a path ends at the first node without unvisited successors.
 * Roots and successors are visited in ascending (start, end) order.
 * The walk uses an explicit stack, deep exon chains do not grow the call stack.
 */
std::vector<transcript_path> enumerate_paths(const splice_graph& graph, const exon_registry& exons);

// Summed exon length (end - start) of a path, introns excluded
size_t transcript_length(const transcript_path& path, const exon_registry& exons);

// A transcript passes when its length is strictly greater than min_length
bool passes_length_filter(const transcript_path& path, const exon_registry& exons, size_t min_length);

#endif //ISOWEAVE_PATH_ENUMERATOR_HPP
