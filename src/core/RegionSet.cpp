#include "core/RegionSet.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <string>
#include <tuple>

#include "core/Types.hpp"
#include "utils/StringUtils.hpp"

namespace Tmber {

std::vector<GenomicInterval> merge_intervals(std::vector<GenomicInterval> intervals) {
    std::sort(intervals.begin(), intervals.end(), [](const GenomicInterval& a, const GenomicInterval& b) {
        return std::tie(a.chrom, a.start, a.end) < std::tie(b.chrom, b.start, b.end);
    });

    std::vector<GenomicInterval> merged;
    merged.reserve(intervals.size());
    for (auto& iv : intervals) {
        if (!merged.empty() && merged.back().chrom == iv.chrom && iv.start <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, iv.end);
        } else {
            merged.push_back(std::move(iv));
        }
    }
    return merged;
}

RegionSet::RegionSet(std::string name, std::vector<GenomicInterval> intervals) : name_(std::move(name)) {
    auto merged = merge_intervals(std::move(intervals));
    if (merged.empty()) {
        throw ConfigError("Region set '" + name_ + "' has no intervals");
    }

    for (const auto& iv : merged) {
        size_ += iv.length();
        by_chrom_[iv.chrom].emplace_back(iv.start, iv.end);
    }
    num_intervals_ = merged.size();

    if (size_ <= 0) {
        throw ConfigError("Region set '" + name_ + "' has zero size");
    }
}

std::vector<GenomicInterval> RegionSet::intervals() const {
    std::vector<GenomicInterval> out;
    out.reserve(num_intervals_);
    for (const auto& [chrom, ivs] : by_chrom_) {
        for (const auto& [start, end] : ivs) {
            out.push_back({chrom, start, end});
        }
    }
    return out;
}

bool RegionSet::contains(const std::string& chrom, int64_t pos_start, int64_t pos_end) const {
    auto it = by_chrom_.find(chrom);
    if (it == by_chrom_.end()) {
        return false;
    }
    const auto& ivs = it->second;

    // First interval with rstart >= pos_start; the candidate is the one before.
    // Intervals are merged, so it also has the largest rend of all intervals
    // with rstart < pos_start.
    auto next = std::lower_bound(ivs.begin(), ivs.end(), pos_start,
                                 [](const std::pair<int64_t, int64_t>& iv, int64_t pos) { return iv.first < pos; });
    if (next == ivs.begin()) {
        return false;
    }
    const auto& candidate = *std::prev(next);
    return candidate.second >= pos_end;
}

bool RegionSet::contains(const VariantRecord& record) const {
    if (!record.has_span()) {
        return false;
    }
    return contains(record.chrom, record.pos_start, *record.pos_end);
}

std::string region_set_name_from_path(const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    for (const char* ext : {".gz", ".bgz", ".bz2"}) {
        if (Utils::ends_with(name, ext)) {
            name.erase(name.size() - std::char_traits<char>::length(ext));
            break;
        }
    }
    if (Utils::ends_with(name, ".bed")) {
        name.erase(name.size() - 4);
    }
    return name;
}

} // namespace Tmber
