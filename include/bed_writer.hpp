/*
 * SPDX-License-Identifier: GPLv3
 *
 * Copyright (c) 2025 Richard A. Schäfer
 *
 * This file is part of isoweave and is licensed under the terms of the GPLv3
 * license. See the LICENSE file in the root of the repository for more
 * information.
 */

#ifndef ISOWEAVE_BED_WRITER_HPP
#define ISOWEAVE_BED_WRITER_HPP

// standard
#include <cstddef>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

// class
#include "interval_utils.hpp"

/**
 * One transcript model as a 12-column BED record.
 * Name is chrom:gene.transcript, score 1000, strand '+', color 0,0,0,
 * thick region spanning the whole record.
 */
struct bed_record {
    std::string seqid;
    size_t gene_id;
    size_t transcript_id;
    std::vector<exon_span> exons;  // sorted by (start, end)

    bed_record() : gene_id(0), transcript_id(0) {}

    size_t chrom_start() const { return exons.front().start; }
    size_t chrom_end() const { return exons.back().end; }
    std::string get_name() const;

    // Tab-separated line without trailing newline
    std::string to_string() const;
};

/**
 * Writes BED records to a file or, when no path is given, to stdout.
 */
class bed_writer {
public:
    // Write to stdout
    bed_writer();

    // Write to a file, throws std::runtime_error if it cannot be created
    explicit bed_writer(const std::string& path);

    // Write to a caller-owned stream (tests)
    explicit bed_writer(std::ostream& out);

    void write(const bed_record& record);

    size_t records_written() const { return records_written_; }

private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_;
    size_t records_written_;
};

#endif //ISOWEAVE_BED_WRITER_HPP
