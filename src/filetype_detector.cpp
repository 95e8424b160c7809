#include "filetype_detector.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>

#include "file_reader.hpp"

namespace {
    constexpr size_t SNIFF_BYTES = 8192;

    bool is_number(const std::string& field) {
        return !field.empty() &&
               std::all_of(field.begin(), field.end(),
                   [](unsigned char c) { return std::isdigit(c); });
    }

    // "*" or one or more <length><op> pairs
    bool is_cigar(const std::string& field) {
        if (field == "*") return true;
        if (field.empty()) return false;

        bool has_length = false;
        for (unsigned char c : field) {
            if (std::isdigit(c)) {
                has_length = true;
            } else if (has_length && std::strchr("MIDNSHP=X", c) != nullptr) {
                has_length = false;
            } else {
                return false;
            }
        }
        return !has_length;
    }
}

std::string filetype_name(filetype ftype) {
    switch (ftype) {
        case filetype::PSL: return "PSL";
        case filetype::BED: return "BED";
        case filetype::SAM: return "SAM";
        case filetype::BAM: return "BAM";
        default: return "UNKNOWN";
    }
}

std::tuple<filetype, bool> filetype_detector::detect_filetype(
    const std::filesystem::path& filepath) {

    std::ifstream file(filepath, std::ios::binary);
    if(!file) {
        throw std::runtime_error("Failed to open file: " + filepath.string());
    }

    // Read first few bytes to check magic numbers
    std::vector<char> buffer(SNIFF_BYTES);
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize bytes_read = file.gcount();
    file.close();

    if (bytes_read < 2) {
        return std::make_tuple(filetype::UNKNOWN, false);
    }

    // Check if the file is gzipped (magic bytes: 0x1f 0x8b), BAM is BGZF
    bool is_gzipped = (static_cast<unsigned char>(buffer[0]) == 0x1f &&
                       static_cast<unsigned char>(buffer[1]) == 0x8b);

    if (is_gzipped) {
        return detect_gzipped_filetype(filepath);
    }
    return detect_plain_filetype(buffer.data(), bytes_read);
}

std::tuple<filetype, bool> filetype_detector::detect_plain_filetype(const char* buffer, std::streamsize size) {
    if (size < 4) {
        return std::make_tuple(filetype::UNKNOWN, false);
    }

    std::string text(buffer, static_cast<size_t>(size));

    // Check for SAM header (@HD, @SQ, @RG, @PG, @CO)
    if (text[0] == '@' && (text.compare(1, 2, "HD") == 0 || text.compare(1, 2, "SQ") == 0 ||
                           text.compare(1, 2, "RG") == 0 || text.compare(1, 2, "PG") == 0 ||
                           text.compare(1, 2, "CO") == 0)) {
        return std::make_tuple(filetype::SAM, false);
    }

    if (text.rfind("psLayout", 0) == 0) {
        return std::make_tuple(filetype::PSL, false);
    }

    // Classify by the column layout of the first data line
    for (const auto& line : split_fields(text, '\n')) {
        if (line.empty() || line[0] == '#' ||
            line.rfind("track", 0) == 0 || line.rfind("browser", 0) == 0) {
            continue;
        }

        auto fields = split_fields(line, '\t');

        // PSL: 21 columns, all leading count columns numeric
        if (fields.size() >= 21 && is_number(fields[0]) && is_number(fields[10])) {
            return std::make_tuple(filetype::PSL, false);
        }

        // SAM: qname, flag, rname, pos, mapq, cigar (rname may be numeric)
        if (fields.size() >= 11 && is_number(fields[1]) && is_number(fields[3]) &&
            is_cigar(fields[5])) {
            return std::make_tuple(filetype::SAM, false);
        }

        // BED: chrom, chromStart, chromEnd
        if (fields.size() >= 3 && is_number(fields[1]) && is_number(fields[2])) {
            return std::make_tuple(filetype::BED, false);
        }

        break;
    }

    return std::make_tuple(filetype::UNKNOWN, false);
}

std::tuple<filetype, bool> filetype_detector::detect_gzipped_filetype(const std::filesystem::path& filepath) {
    gzFile gzfile = gzopen(filepath.string().c_str(), "rb");
    if (!gzfile) {
        throw std::runtime_error("Failed to open gzipped file: " + filepath.string());
    }

    // Read decompressed header
    std::vector<char> buffer(SNIFF_BYTES);
    int bytes_read = gzread(gzfile, buffer.data(), static_cast<unsigned>(buffer.size()));
    gzclose(gzfile);

    if (bytes_read < 4) {
        return std::make_tuple(filetype::UNKNOWN, true);
    }

    // Check for BAM magic bytes: "BAM\1"
    if (buffer[0] == 'B' && buffer[1] == 'A' && buffer[2] == 'M' && buffer[3] == '\1') {
        return std::make_tuple(filetype::BAM, true);
    }

    auto [ftype, _] = detect_plain_filetype(buffer.data(), bytes_read);
    return std::make_tuple(ftype, true);
}
