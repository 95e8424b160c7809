/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "path_enumerator.hpp"

#include <algorithm>
#include <unordered_set>

namespace {

struct walk_frame {
    std::vector<exon_id> children;
    size_t next_child;
};

void sort_by_position(std::vector<exon_id>& ids, const exon_registry& exons) {
    std::sort(ids.begin(), ids.end(), [&exons](exon_id a, exon_id b) {
        const exon_node& ea = exons.get(a);
        const exon_node& eb = exons.get(b);
        if (ea.start != eb.start) return ea.start < eb.start;
        return ea.end < eb.end;
    });
}

std::vector<exon_id> unvisited_successors(const splice_graph& graph, exon_id node,
                                          const std::unordered_set<exon_id>& on_path,
                                          const exon_registry& exons) {
    std::vector<exon_id> children;
    for (exon_id succ : graph.successors(node)) {
        if (on_path.find(succ) == on_path.end()) {
            children.push_back(succ);
        }
    }
    sort_by_position(children, exons);
    return children;
}

} // anonymous namespace

std::vector<transcript_path> enumerate_paths(const splice_graph& graph, const exon_registry& exons) {
    std::vector<transcript_path> paths;

    std::vector<exon_id> roots = graph.roots();
    sort_by_position(roots, exons);

    for (exon_id root : roots) {
        transcript_path path;
        std::unordered_set<exon_id> on_path;
        std::vector<walk_frame> stack;

        auto enter = [&](exon_id node) {
            path.push_back(node);
            on_path.insert(node);
            auto children = unvisited_successors(graph, node, on_path, exons);
            if (children.empty()) {
                paths.push_back(path);
            }
            stack.push_back(walk_frame{std::move(children), 0});
        };

        auto leave = [&]() {
            on_path.erase(path.back());
            path.pop_back();
            stack.pop_back();
        };

        enter(root);
        while (!stack.empty()) {
            walk_frame& top = stack.back();
            if (top.next_child < top.children.size()) {
                exon_id child = top.children[top.next_child++];
                enter(child);
            } else {
                leave();
            }
        }
    }

    return paths;
}

size_t transcript_length(const transcript_path& path, const exon_registry& exons) {
    size_t length = 0;
    for (exon_id id : path) {
        length += exons.get(id).length();
    }
    return length;
}

bool passes_length_filter(const transcript_path& path, const exon_registry& exons, size_t min_length) {
    return transcript_length(path, exons) > min_length;
}
