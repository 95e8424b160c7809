/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "path_cover.hpp"

#include <algorithm>
#include <unordered_set>

std::set<path_edge> path_edges(const transcript_path& path) {
    std::set<path_edge> edges;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        edges.emplace(path[i], path[i + 1]);
    }
    return edges;
}

std::vector<transcript_path> minimum_path_cover(const std::vector<transcript_path>& paths) {
    std::vector<std::set<path_edge>> edge_sets;
    edge_sets.reserve(paths.size());
    std::set<path_edge> uncovered;
    for (const auto& path : paths) {
        edge_sets.push_back(path_edges(path));
        uncovered.insert(edge_sets.back().begin(), edge_sets.back().end());
    }

    std::vector<bool> chosen(paths.size(), false);

    while (!uncovered.empty()) {
        size_t best = paths.size();
        size_t best_gain = 0;

        for (size_t i = 0; i < paths.size(); ++i) {
            if (chosen[i]) continue;
            size_t gain = 0;
            for (const auto& edge : edge_sets[i]) {
                if (uncovered.count(edge)) gain++;
            }
            if (gain == 0) continue;

            bool better = best == paths.size() || gain > best_gain ||
                          (gain == best_gain && paths[i].size() < paths[best].size());
            if (better) {
                best = i;
                best_gain = gain;
            }
        }

        // cannot happen while uncovered edges come from the input paths
        if (best == paths.size()) break;

        chosen[best] = true;
        for (const auto& edge : edge_sets[best]) {
            uncovered.erase(edge);
        }
    }

    // single-exon paths have no edges to cover
    std::unordered_set<exon_id> covered_nodes;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (chosen[i]) covered_nodes.insert(paths[i].begin(), paths[i].end());
    }
    for (size_t i = 0; i < paths.size(); ++i) {
        if (chosen[i] || !edge_sets[i].empty() || paths[i].empty()) continue;
        if (covered_nodes.insert(paths[i].front()).second) {
            chosen[i] = true;
        }
    }

    std::vector<transcript_path> cover;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (!chosen[i]) continue;
        if (std::find(cover.begin(), cover.end(), paths[i]) != cover.end()) continue;
        cover.push_back(paths[i]);
    }

    return cover;
}
