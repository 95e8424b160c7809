/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "bed_writer.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
    constexpr int BED_SCORE = 1000;
    constexpr char BED_STRAND = '+';
    const std::string BED_ITEM_RGB = "0,0,0";
}

std::string bed_record::get_name() const {
    return seqid + ":" + std::to_string(gene_id) + "." + std::to_string(transcript_id);
}

std::string bed_record::to_string() const {
    if (exons.empty()) {
        throw std::logic_error("BED record without exons: " + get_name());
    }

    std::ostringstream sizes;
    std::ostringstream starts;
    for (size_t i = 0; i < exons.size(); ++i) {
        if (i > 0) {
            sizes << ",";
            starts << ",";
        }
        sizes << exons[i].length();
        starts << exons[i].start - chrom_start();
    }

    std::ostringstream ss;
    ss << seqid << '\t'
       << chrom_start() << '\t'
       << chrom_end() << '\t'
       << get_name() << '\t'
       << BED_SCORE << '\t'
       << BED_STRAND << '\t'
       << chrom_start() << '\t'
       << chrom_end() << '\t'
       << BED_ITEM_RGB << '\t'
       << exons.size() << '\t'
       << sizes.str() << '\t'
       << starts.str();
    return ss.str();
}

bed_writer::bed_writer()
    : out_(&std::cout), records_written_(0) {}

bed_writer::bed_writer(const std::string& path)
    : file_(std::make_unique<std::ofstream>(path)), out_(nullptr), records_written_(0) {
    if (!file_->is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out_ = file_.get();
}

bed_writer::bed_writer(std::ostream& out)
    : out_(&out), records_written_(0) {}

void bed_writer::write(const bed_record& record) {
    *out_ << record.to_string() << '\n';
    if (!*out_) {
        throw std::runtime_error("Failed to write BED record " + record.get_name());
    }
    records_written_++;
}
