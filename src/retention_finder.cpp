/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "retention_finder.hpp"

#include <algorithm>
#include <memory>

retention_finder::retention_finder(std::ostream& out, int order)
    : out_(out), order_(order), event_count_(0) {}

std::string retention_finder::transcript_id_of(const std::string& name) {
    std::string id = name;
    std::replace(id.begin(), id.end(), ':', '-');
    return id;
}

std::string retention_finder::gene_id_of(const std::string& transcript_id) {
    return transcript_id.substr(0, transcript_id.find('.'));
}

void retention_finder::add_transcript(const alignment_record& record) {
    if (record.strand == '.' || record.blocks.empty()) {
        return;
    }

    std::string gene_id = gene_id_of(transcript_id_of(record.name));
    if (!current_gene_.empty() && gene_id != current_gene_) {
        flush_gene();
    }
    if (current_gene_.empty()) {
        current_gene_ = gene_id;
        events_per_gene_[gene_id];
    }

    size_t previous = 0;
    for (size_t i = 0; i < record.blocks.size(); ++i) {
        const auto& block = record.blocks[i];
        model_exon exon(record.seqid, block.start + 1, block.start + block.size, record.strand);
        size_t idx = intern_exon(exon);

        if (i > 0 && seen_edges_.emplace(previous, idx).second) {
            edges_.emplace_back(previous, idx);
        }
        previous = idx;
    }
}

void retention_finder::finish() {
    if (!current_gene_.empty()) {
        flush_gene();
    }
}

size_t retention_finder::intern_exon(const model_exon& exon) {
    exon_key key{exon.seqid, exon.start, exon.end};
    auto it = exon_index_.find(key);
    if (it != exon_index_.end()) {
        return it->second;
    }
    size_t idx = exons_.size();
    exons_.push_back(exon);
    exon_index_.emplace(std::move(key), idx);
    return idx;
}

void retention_finder::flush_gene() {
    for (const auto& event : find_events()) {
        events_per_gene_[current_gene_]++;
        event_count_++;
        write_gff(event);
    }

    current_gene_.clear();
    exons_.clear();
    exon_index_.clear();
    edges_.clear();
    seen_edges_.clear();
}

std::vector<std::vector<std::vector<size_t>>> retention_finder::find_events() const {
    std::vector<std::vector<std::vector<size_t>>> events;
    if (exons_.empty()) return events;

    auto grove = std::make_unique<grove_type>(order_);
    for (size_t i = 0; i < exons_.size(); ++i) {
        grove->insert_data(exons_[i].seqid, gdt::interval(exons_[i].start, exons_[i].end), i);
    }

    for (const auto& [up_idx, dn_idx] : edges_) {
        const model_exon& up = exons_[up_idx];
        const model_exon& dn = exons_[dn_idx];

        std::vector<std::vector<size_t>> alternatives;
        alternatives.push_back({up_idx, dn_idx});

        auto result = grove->intersect(gdt::interval(up.start, dn.end), up.seqid);
        for (auto* key : result.get_keys()) {
            size_t idx = key->get_data();
            const model_exon& overlap = exons_[idx];
            if (overlap.start == up.start && overlap.end == dn.end) {
                alternatives.push_back({idx});
            }
        }

        if (alternatives.size() > 1) {
            events.push_back(std::move(alternatives));
        }
    }

    return events;
}

void retention_finder::write_gff(const std::vector<std::vector<size_t>>& event) {
    auto by_end = [this](size_t a, size_t b) {
        if (exons_[a].end != exons_[b].end) return exons_[a].end < exons_[b].end;
        return exons_[a].start < exons_[b].start;
    };

    std::vector<size_t> all_exons;
    for (const auto& alternative : event) {
        all_exons.insert(all_exons.end(), alternative.begin(), alternative.end());
    }
    std::sort(all_exons.begin(), all_exons.end(), by_end);
    all_exons.erase(std::unique(all_exons.begin(), all_exons.end()), all_exons.end());

    const model_exon& first = exons_[all_exons.front()];
    const model_exon& last = exons_[all_exons.back()];
    std::string gene_id = current_gene_ + ".ev" + std::to_string(events_per_gene_[current_gene_]);

    out_ << first.seqid << "\tRI\tgene\t" << first.start << '\t' << last.end
         << "\t.\t" << first.strand << "\t.\tID=" << gene_id << ";Name=" << current_gene_ << '\n';

    size_t mrna_id = 1;
    for (const auto& alternative : event) {
        std::vector<size_t> event_exons = alternative;
        std::sort(event_exons.begin(), event_exons.end(), by_end);
        const model_exon& mrna_first = exons_[event_exons.front()];
        const model_exon& mrna_last = exons_[event_exons.back()];

        out_ << mrna_first.seqid << "\tRI\tmRNA\t" << mrna_first.start << '\t' << mrna_last.end
             << "\t.\t" << mrna_first.strand << "\t.\tID=" << gene_id << "." << mrna_id
             << ";Parent=" << gene_id << '\n';

        size_t exon_num = 1;
        for (size_t idx : event_exons) {
            const model_exon& exon = exons_[idx];
            out_ << exon.seqid << "\tRI\texon\t" << exon.start << '\t' << exon.end
                 << "\t.\t" << exon.strand << "\t.\tID=" << gene_id << "." << mrna_id << "." << exon_num
                 << ";Parent=" << gene_id << "." << mrna_id << '\n';
            exon_num++;
        }
        mrna_id++;
    }
}
