#include "psl_reader.hpp"

// standard
#include <cctype>
#include <stdexcept>

namespace {
    // PSL column indices (0-based)
    constexpr size_t PSL_COLUMNS = 21;
    constexpr size_t COL_QNAME = 9;
    constexpr size_t COL_STRAND = 8;
    constexpr size_t COL_TNAME = 13;
    constexpr size_t COL_BLOCK_COUNT = 17;
    constexpr size_t COL_BLOCK_SIZES = 18;
    constexpr size_t COL_T_STARTS = 20;

    bool is_header_line(const std::string& line) {
        if (line.empty()) return true;
        if (line.rfind("psLayout", 0) == 0) return true;
        if (line.rfind("track", 0) == 0 || line.rfind("browser", 0) == 0) return true;
        if (line[0] == '#' || line[0] == '-') return true;
        // column title lines start with "match" / a blank continuation
        return !std::isdigit(static_cast<unsigned char>(line[0]));
    }
}

psl_reader::psl_reader(const std::filesystem::path& filepath)
    : reader(filepath), eof_reached(false), skipped_lines(0) {}

bool psl_reader::read_next(alignment_record& entry) {
    std::string line;

    while (reader.next_line(line)) {
        if (is_header_line(line)) {
            continue;
        }

        if (parse_line(line, entry)) {
            return true;
        }

        skipped_lines++;
        error_message = "Malformed PSL line " + std::to_string(reader.get_line_number());
    }

    eof_reached = true;
    return false;
}

bool psl_reader::parse_line(const std::string& line, alignment_record& entry) {
    auto fields = split_fields(line, '\t');
    if (fields.size() < PSL_COLUMNS) {
        return false;
    }

    entry = alignment_record();
    entry.name = fields[COL_QNAME];
    entry.seqid = fields[COL_TNAME];
    // strand may be two characters for translated alignments ("+-")
    entry.strand = fields[COL_STRAND].empty() ? '+' : fields[COL_STRAND].back();

    try {
        size_t block_count = std::stoull(fields[COL_BLOCK_COUNT]);
        auto sizes = parse_coordinate_list(fields[COL_BLOCK_SIZES]);
        auto starts = parse_coordinate_list(fields[COL_T_STARTS]);

        if (sizes.size() != block_count || starts.size() != block_count || block_count == 0) {
            return false;
        }

        entry.blocks.reserve(block_count);
        for (size_t i = 0; i < block_count; ++i) {
            entry.blocks.emplace_back(starts[i], sizes[i]);
        }
    } catch (const std::exception&) {
        return false;
    }

    return !entry.seqid.empty();
}
