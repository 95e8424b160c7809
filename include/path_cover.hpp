/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_PATH_COVER_HPP
#define ISOWEAVE_PATH_COVER_HPP

// standard
#include <set>
#include <utility>
#include <vector>

// class
#include "path_enumerator.hpp"

using path_edge = std::pair<exon_id, exon_id>;

// Consecutive exon pairs of a path
std::set<path_edge> path_edges(const transcript_path& path);

/**
 * Select a small subset of paths whose edges cover every edge of the input.
 *
 * Greedy set cover: repeatedly take the path adding the most uncovered
 * edges, ties broken by fewer exons and then by input order. Edgeless
 * paths are kept only when their exon is not part of a chosen path.
 * Duplicate paths are reported once. Output keeps the input order.
 */
std::vector<transcript_path> minimum_path_cover(const std::vector<transcript_path>& paths);

#endif //ISOWEAVE_PATH_COVER_HPP
