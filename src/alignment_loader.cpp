/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#include "alignment_loader.hpp"

#include <stdexcept>
#include <utility>

#include "bed_reader.hpp"
#include "psl_reader.hpp"
#include "utility.hpp"

alignment_loader::alignment_loader(const config& cfg)
    : cfg_(cfg) {}

alignment_loader::stats alignment_loader::load(const std::filesystem::path& path,
                                               const callback& on_record) {
    filetype_detector detector;
    auto [ftype, is_gzipped] = detector.detect_filetype(path);

    logging::info("Parsing alignments from " + path.string() + " (" + filetype_name(ftype) +
                  (is_gzipped && ftype != filetype::BAM ? ", gzipped" : "") + ")");

    stats result;
    switch (ftype) {
        case filetype::PSL:
            result = load_psl(path, on_record);
            break;
        case filetype::BED:
            result = load_bed(path, on_record);
            break;
        case filetype::SAM:
        case filetype::BAM:
            result = load_sam(path, on_record);
            break;
        default:
            throw std::runtime_error("Unsupported input format: " + path.string());
    }

    if (result.skipped_lines > 0) {
        logging::warning("Skipped " + std::to_string(result.skipped_lines) +
                         " malformed line(s) in " + path.string());
    }

    return result;
}

alignment_loader::stats alignment_loader::load_psl(const std::filesystem::path& path,
                                                   const callback& on_record) {
    stats result;
    psl_reader reader(path);
    alignment_record record;

    logging::progress_start();
    while (reader.read_next(record)) {
        on_record(record);
        result.records++;
        if (result.records % 1000 == 0) {
            logging::progress(result.records, "Parsing " + path.filename().string());
        }
    }
    logging::progress_done(result.records, "Parsed " + path.filename().string());

    result.skipped_lines = reader.get_skipped_lines();
    return result;
}

alignment_loader::stats alignment_loader::load_bed(const std::filesystem::path& path,
                                                   const callback& on_record) {
    stats result;
    bed_reader reader(path);
    alignment_record record;

    logging::progress_start();
    while (reader.read_next(record)) {
        on_record(record);
        result.records++;
        if (result.records % 1000 == 0) {
            logging::progress(result.records, "Parsing " + path.filename().string());
        }
    }
    logging::progress_done(result.records, "Parsed " + path.filename().string());

    result.skipped_lines = reader.get_skipped_lines();
    return result;
}

alignment_loader::stats alignment_loader::load_sam(const std::filesystem::path& path,
                                                   const callback& on_record) {
    stats result;

    // Configure BAM reader
    gio::bam_reader_options opts = gio::bam_reader_options::primary_only();
    opts.min_mapq = cfg_.min_mapq;
    gio::bam_reader reader(path.string(), opts);

    logging::progress_start();
    for (const auto& entry : reader) {
        // Skip unmapped reads (should already be filtered by bam_reader)
        if (!entry.is_mapped()) continue;

        on_record(from_sam_entry(entry));
        result.records++;
        if (result.records % 1000 == 0) {
            logging::progress(result.records, "Parsing " + path.filename().string());
        }
    }
    logging::progress_done(result.records, "Parsed " + path.filename().string());

    return result;
}

alignment_record alignment_loader::from_sam_entry(const gio::sam_entry& entry) {
    alignment_record record;
    record.name = entry.qname;
    record.seqid = entry.chrom;
    record.strand = entry.get_strand();

    cigar_block_builder builder(entry.interval.get_start());
    for (const auto& op : entry.cigar) {
        builder.add(op.length, op.consumes_reference(), op.op == gio::cigar_op::REF_SKIP);
    }
    record.blocks = builder.finish();

    return record;
}

// ============================================================================
// cigar_block_builder
// ============================================================================

cigar_block_builder::cigar_block_builder(size_t ref_start)
    : ref_pos(ref_start), block_start(ref_start) {}

void cigar_block_builder::add(size_t length, bool consumes_reference, bool ref_skip) {
    if (ref_skip) {
        // N operation = intron, closes the current block
        if (ref_pos > block_start) {
            blocks.emplace_back(block_start, ref_pos - block_start);
        }
        ref_pos += length;
        block_start = ref_pos;
        return;
    }

    if (consumes_reference) {
        ref_pos += length;
    }
}

std::vector<alignment_block> cigar_block_builder::finish() {
    if (ref_pos > block_start) {
        blocks.emplace_back(block_start, ref_pos - block_start);
        block_start = ref_pos;
    }
    return std::move(blocks);
}
