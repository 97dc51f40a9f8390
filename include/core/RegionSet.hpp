#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/VariantRecord.hpp"

namespace Tmber {

/**
 * @brief A BED interval: 0-based, half-open [start, end).
 */
struct GenomicInterval {
    std::string chrom;
    int64_t start = 0;
    int64_t end = 0;

    int64_t length() const { return end - start; }

    bool operator==(const GenomicInterval& o) const {
        return chrom == o.chrom && start == o.start && end == o.end;
    }
};

/**
 * @brief Sorts intervals by (chrom, start, end) and coalesces overlapping and
 * book-ended ones, as `bedtools merge` does.
 *
 * The result is non-overlapping with strictly increasing starts and ends per
 * chromosome. Merging an already merged list returns it unchanged.
 */
std::vector<GenomicInterval> merge_intervals(std::vector<GenomicInterval> intervals);

/**
 * @brief Named, immutable set of merged intervals surveyed for TMB.
 *
 * Intervals are merged at construction and grouped per chromosome so that
 * containment queries are a binary search within one chromosome.
 * Chromosome names must already be normalized by the caller.
 */
class RegionSet {
public:
    /**
     * @brief Builds a region set from raw intervals.
     * @throws ConfigError if there are no intervals or the total size is zero.
     */
    RegionSet(std::string name, std::vector<GenomicInterval> intervals);

    const std::string& name() const { return name_; }

    /**
     * @brief Sum of (end - start) over all merged intervals, in bp.
     */
    int64_t size() const { return size_; }

    size_t num_intervals() const { return num_intervals_; }

    /**
     * @brief Merged intervals sorted by chrom then start.
     */
    std::vector<GenomicInterval> intervals() const;

    /**
     * @brief True if some interval satisfies rstart < pos_start && rend >= pos_end.
     *
     * pos_start/pos_end are a variant's 1-based closed span, so this is the
     * variant lying entirely within the interval.
     */
    bool contains(const std::string& chrom, int64_t pos_start, int64_t pos_end) const;

    /**
     * @brief Containment of a variant record; records without an end never match.
     */
    bool contains(const VariantRecord& record) const;

private:
    std::string name_;
    int64_t size_ = 0;
    size_t num_intervals_ = 0;
    std::map<std::string, std::vector<std::pair<int64_t, int64_t>>> by_chrom_;
};

/**
 * @brief Region set name for a BED path: the file name without compression
 * and ".bed" extensions ("/data/exome.bed.gz" -> "exome").
 */
std::string region_set_name_from_path(const std::string& path);

} // namespace Tmber
