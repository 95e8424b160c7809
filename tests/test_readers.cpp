#include <gtest/gtest.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <zlib.h>

#include "alignment_loader.hpp"
#include "bed_reader.hpp"
#include "filetype_detector.hpp"
#include "psl_reader.hpp"

namespace {

const std::string PSL_LINE =
    "250\t0\t0\t0\t0\t0\t1\t100\t+\tread1\t250\t0\t250\tchr1\t1000\t100\t450\t2\t100,150,\t0,100,\t100,300,";

const std::string BED_LINE =
    "chr1\t100\t450\tchr1:1.1\t1000\t+\t100\t450\t0,0,0\t2\t100,150\t0,200";

// numeric reference name as written by `samtools view` for Ensembl assemblies
const std::string SAM_NUMERIC_RNAME_LINE =
    "read1\t0\t1\t1000\t60\t50M100N50M\t*\t0\t0\tACGT\tIIII";

const std::string SAM_LINE =
    "read1\t0\tchr1\t101\t60\t100M200N150M\t*\t0\t0\t*\t*";

// feed a CIGAR string through the block builder with SAM operation semantics
std::vector<alignment_block> blocks_from_cigar(size_t ref_start, const std::string& cigar) {
    cigar_block_builder builder(ref_start);
    size_t length = 0;
    for (char c : cigar) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            length = length * 10 + static_cast<size_t>(c - '0');
            continue;
        }
        bool consumes_reference = c == 'M' || c == 'D' || c == 'N' || c == '=' || c == 'X';
        builder.add(length, consumes_reference, c == 'N');
        length = 0;
    }
    return builder.finish();
}

class TempFile {
public:
    explicit TempFile(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {}
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write_plain(const std::string& content) const {
        std::ofstream out(path_);
        out << content;
    }

    void write_gzip(const std::string& content) const {
        gzFile gz = gzopen(path_.string().c_str(), "wb");
        ASSERT_NE(gz, nullptr);
        gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
        gzclose(gz);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // anonymous namespace

// ============================================================================
// PSL
// ============================================================================

TEST(PslReaderTest, ParseLine) {
    alignment_record record;
    ASSERT_TRUE(psl_reader::parse_line(PSL_LINE, record));

    EXPECT_EQ(record.name, "read1");
    EXPECT_EQ(record.seqid, "chr1");
    EXPECT_EQ(record.strand, '+');
    ASSERT_EQ(record.blocks.size(), 2u);
    EXPECT_EQ(record.blocks[0].start, 100u);
    EXPECT_EQ(record.blocks[0].end(), 200u);
    EXPECT_EQ(record.blocks[1].start, 300u);
    EXPECT_EQ(record.blocks[1].end(), 450u);
}

TEST(PslReaderTest, RejectsMalformedLines) {
    alignment_record record;
    EXPECT_FALSE(psl_reader::parse_line("1\t2\t3", record));

    std::string bad_count = PSL_LINE;
    bad_count.replace(bad_count.find("\t2\t100,150,"), 3, "\t3\t");
    EXPECT_FALSE(psl_reader::parse_line(bad_count, record));
}

TEST(PslReaderTest, ReadsGzippedFileAndSkipsHeader) {
    TempFile file("isoweave_test_reader.psl.gz");
    file.write_gzip("psLayout version 3\n\nmatch\tmis-\n-------\n" + PSL_LINE + "\n" +
                    "garbage\tline\n" + PSL_LINE + "\n");

    psl_reader reader(file.path());
    alignment_record record;
    size_t count = 0;
    while (reader.read_next(record)) {
        count++;
    }

    EXPECT_EQ(count, 2u);
    EXPECT_FALSE(reader.has_next());
    // "garbage" does not start with a digit and is treated as a header
    EXPECT_EQ(reader.get_skipped_lines(), 0u);
}

TEST(PslReaderTest, CountsMalformedDataLines) {
    TempFile file("isoweave_test_reader_bad.psl");
    file.write_plain(PSL_LINE + "\n12\t3\n" + PSL_LINE);

    psl_reader reader(file.path());
    alignment_record record;
    size_t count = 0;
    while (reader.read_next(record)) {
        count++;
    }

    EXPECT_EQ(count, 2u);
    EXPECT_EQ(reader.get_skipped_lines(), 1u);
    EXPECT_FALSE(reader.get_error_message().empty());
}

TEST(PslReaderTest, MissingFileThrows) {
    EXPECT_THROW(psl_reader("/nonexistent-isoweave-dir/in.psl"), std::runtime_error);
}

// ============================================================================
// BED
// ============================================================================

TEST(BedReaderTest, ParseBed12) {
    alignment_record record;
    ASSERT_TRUE(bed_reader::parse_line(BED_LINE, record));

    EXPECT_EQ(record.name, "chr1:1.1");
    EXPECT_EQ(record.seqid, "chr1");
    ASSERT_EQ(record.blocks.size(), 2u);
    EXPECT_EQ(record.blocks[0].start, 100u);
    EXPECT_EQ(record.blocks[0].size, 100u);
    EXPECT_EQ(record.blocks[1].start, 300u);
    EXPECT_EQ(record.blocks[1].size, 150u);
}

TEST(BedReaderTest, ShortBedIsOneBlock) {
    alignment_record record;
    ASSERT_TRUE(bed_reader::parse_line("chr2\t50\t200", record));

    EXPECT_EQ(record.seqid, "chr2");
    ASSERT_EQ(record.blocks.size(), 1u);
    EXPECT_EQ(record.blocks[0].start, 50u);
    EXPECT_EQ(record.blocks[0].end(), 200u);
}

TEST(BedReaderTest, RejectsMalformedLines) {
    alignment_record record;
    EXPECT_FALSE(bed_reader::parse_line("chr1\tabc\t200", record));
    EXPECT_FALSE(bed_reader::parse_line("chr1\t200\t100", record));
    EXPECT_FALSE(bed_reader::parse_line(
        "chr1\t100\t450\tx\t0\t+\t100\t450\t0\t3\t100,150\t0,200", record));
}

TEST(BedReaderTest, SkipsTrackLines) {
    TempFile file("isoweave_test_reader.bed");
    file.write_plain("track name=test\n#comment\n" + BED_LINE + "\r\n" + BED_LINE + "\n");

    bed_reader reader(file.path());
    alignment_record record;
    size_t count = 0;
    while (reader.read_next(record)) {
        count++;
        EXPECT_EQ(record.blocks.size(), 2u);
    }

    EXPECT_EQ(count, 2u);
    EXPECT_EQ(reader.get_skipped_lines(), 0u);
}

// ============================================================================
// SAM/BAM CIGAR blocks
// ============================================================================

TEST(CigarBlockTest, SplitsOnlyAtReferenceSkip) {
    auto blocks = blocks_from_cigar(1000, "5S50M2I10M3D20M100N40M");

    // soft clip and insertion do not move the position, the deletion does
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].start, 1000u);
    EXPECT_EQ(blocks[0].size, 83u);
    EXPECT_EQ(blocks[1].start, 1183u);
    EXPECT_EQ(blocks[1].size, 40u);
}

TEST(CigarBlockTest, TrailingSkipAddsNoEmptyBlock) {
    auto blocks = blocks_from_cigar(0, "50M100N");

    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start, 0u);
    EXPECT_EQ(blocks[0].end(), 50u);
}

TEST(CigarBlockTest, LeadingSkipAndClipsIgnored) {
    auto blocks = blocks_from_cigar(200, "3H100N30M2=1X10H");

    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start, 300u);
    EXPECT_EQ(blocks[0].size, 33u);
}

TEST(CigarBlockTest, SeveralIntrons) {
    auto blocks = blocks_from_cigar(100, "100M200N50M300N25M");

    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].end(), 200u);
    EXPECT_EQ(blocks[1].start, 400u);
    EXPECT_EQ(blocks[1].end(), 450u);
    EXPECT_EQ(blocks[2].start, 750u);
    EXPECT_EQ(blocks[2].end(), 775u);
}

// ============================================================================
// shared helpers
// ============================================================================

TEST(FileReaderTest, CoordinateListAcceptsTrailingComma) {
    EXPECT_EQ(parse_coordinate_list("1,2,3,"), (std::vector<size_t>{1, 2, 3}));
    EXPECT_EQ(parse_coordinate_list("7"), (std::vector<size_t>{7}));
    EXPECT_THROW(parse_coordinate_list("1,2x"), std::invalid_argument);
}

TEST(FileReaderTest, SplitKeepsEmptyFields) {
    auto fields = split_fields("a\t\tb", '\t');
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_TRUE(fields[1].empty());
}

// ============================================================================
// file type detection
// ============================================================================

TEST(FiletypeDetectorTest, PlainFormats) {
    filetype_detector detector;
    auto detect = [&detector](const std::string& text) {
        return std::get<0>(detector.detect_plain_filetype(text.data(),
                                                          static_cast<std::streamsize>(text.size())));
    };

    EXPECT_EQ(detect(PSL_LINE + "\n"), filetype::PSL);
    EXPECT_EQ(detect("psLayout version 3\n"), filetype::PSL);
    EXPECT_EQ(detect(BED_LINE + "\n"), filetype::BED);
    EXPECT_EQ(detect("track name=x\n" + BED_LINE + "\n"), filetype::BED);
    EXPECT_EQ(detect("@HD\tVN:1.6\n"), filetype::SAM);
    EXPECT_EQ(detect(SAM_LINE + "\n"), filetype::SAM);
    EXPECT_EQ(detect(SAM_NUMERIC_RNAME_LINE + "\n"), filetype::SAM);
    EXPECT_EQ(detect("hello world\n"), filetype::UNKNOWN);
}

TEST(FiletypeDetectorTest, HeaderlessSamWithNumericReference) {
    TempFile file("isoweave_test_detect_numeric.sam");
    file.write_plain(SAM_NUMERIC_RNAME_LINE + "\n");

    filetype_detector detector;
    auto [ftype, gzipped] = detector.detect_filetype(file.path());
    EXPECT_EQ(ftype, filetype::SAM);
    EXPECT_FALSE(gzipped);
}

TEST(FiletypeDetectorTest, BedWithNumericChromosome) {
    filetype_detector detector;
    std::string bed = "1\t100\t450\tchr1:1.1\t1000\t+\t100\t450\t0,0,0\t2\t100,150\t0,200\n";
    auto [ftype, gzipped] = detector.detect_plain_filetype(bed.data(),
                                                           static_cast<std::streamsize>(bed.size()));
    EXPECT_EQ(ftype, filetype::BED);
}

TEST(FiletypeDetectorTest, GzippedInput) {
    TempFile file("isoweave_test_detect.bed.gz");
    file.write_gzip(BED_LINE + "\n");

    filetype_detector detector;
    auto [ftype, gzipped] = detector.detect_filetype(file.path());
    EXPECT_EQ(ftype, filetype::BED);
    EXPECT_TRUE(gzipped);
}

TEST(FiletypeDetectorTest, PlainFile) {
    TempFile file("isoweave_test_detect.psl");
    file.write_plain(PSL_LINE + "\n");

    filetype_detector detector;
    auto [ftype, gzipped] = detector.detect_filetype(file.path());
    EXPECT_EQ(ftype, filetype::PSL);
    EXPECT_FALSE(gzipped);
    EXPECT_EQ(filetype_name(ftype), "PSL");
}
