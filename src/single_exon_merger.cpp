#include "single_exon_merger.hpp"

single_exon_table merge_single_exons(const single_exon_table& exons) {
    single_exon_table merged;
    for (const auto& [seqid, spans] : exons) {
        if (spans.empty()) continue;
        merged[seqid] = interval_utils::merge_overlapping(spans);
    }
    return merged;
}
