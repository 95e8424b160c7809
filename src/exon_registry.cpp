/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "exon_registry.hpp"

#include <stdexcept>

std::vector<exon_id> exon_registry::add_exons(const std::string& seqid,
                                              const std::vector<exon_span>& run) {
    std::vector<exon_id> handles;
    handles.reserve(run.size());

    if (seqid_ranks_.find(seqid) == seqid_ranks_.end()) {
        size_t rank = seqid_ranks_.size();
        seqid_ranks_[seqid] = rank;
    }

    for (size_t i = 0; i < run.size(); ++i) {
        const exon_span& span = run[i];

        // a single-exon run ends up RIGHT, as the last assignment wins
        terminal_type terminal = terminal_type::NONE;
        if (i == 0) terminal = terminal_type::LEFT;
        if (i + 1 == run.size()) terminal = terminal_type::RIGHT;

        coordinate_key key{seqid, span.start, span.end};
        auto it = index_.find(key);
        if (it == index_.end()) {
            exon_id id = exons_.size();
            exon_node node(seqid, span.start, span.end);
            node.terminal = terminal;
            exons_.push_back(std::move(node));
            index_.emplace(std::move(key), id);
            handles.push_back(id);
            continue;
        }

        // internal here but terminal elsewhere: not really terminal
        exon_node& existing = exons_[it->second];
        if (terminal == terminal_type::NONE && existing.terminal != terminal_type::NONE) {
            existing.terminal = terminal_type::NONE;
        }
        handles.push_back(it->second);
    }

    return handles;
}

std::optional<exon_id> exon_registry::find(const std::string& seqid, size_t start, size_t end) const {
    auto it = index_.find(coordinate_key{seqid, start, end});
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t exon_registry::seqid_rank(const std::string& seqid) const {
    auto it = seqid_ranks_.find(seqid);
    if (it == seqid_ranks_.end()) {
        throw std::out_of_range("Unknown sequence: " + seqid);
    }
    return it->second;
}
