#include "bed_reader.hpp"

// standard
#include <stdexcept>

bed_reader::bed_reader(const std::filesystem::path& filepath)
    : reader(filepath), eof_reached(false), skipped_lines(0) {}

bool bed_reader::read_next(alignment_record& entry) {
    std::string line;

    while (reader.next_line(line)) {
        // Skip empty lines, comments and UCSC browser directives
        if (line.empty() || line[0] == '#' ||
            line.rfind("track", 0) == 0 || line.rfind("browser", 0) == 0) {
            continue;
        }

        if (parse_line(line, entry)) {
            return true;
        }

        skipped_lines++;
        error_message = "Malformed BED line " + std::to_string(reader.get_line_number());
    }

    eof_reached = true;
    return false;
}

bool bed_reader::parse_line(const std::string& line, alignment_record& entry) {
    auto fields = split_fields(line, '\t');
    if (fields.size() < 3) {
        return false;
    }

    entry = alignment_record();
    entry.seqid = fields[0];
    if (fields.size() > 3) entry.name = fields[3];
    if (fields.size() > 5 && !fields[5].empty()) entry.strand = fields[5][0];

    try {
        size_t chrom_start = std::stoull(fields[1]);
        size_t chrom_end = std::stoull(fields[2]);
        if (chrom_end <= chrom_start) {
            return false;
        }

        if (fields.size() < 12) {
            entry.blocks.emplace_back(chrom_start, chrom_end - chrom_start);
            return true;
        }

        size_t block_count = std::stoull(fields[9]);
        auto sizes = parse_coordinate_list(fields[10]);
        auto starts = parse_coordinate_list(fields[11]);
        if (block_count == 0 || sizes.size() != block_count || starts.size() != block_count) {
            return false;
        }

        for (size_t i = 0; i < block_count; ++i) {
            entry.blocks.emplace_back(chrom_start + starts[i], sizes[i]);
        }
    } catch (const std::exception&) {
        return false;
    }

    return true;
}
