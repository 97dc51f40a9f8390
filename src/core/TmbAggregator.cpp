#include "core/TmbAggregator.hpp"

#include <algorithm>
#include <map>
#include <tuple>

namespace Tmber {

double mutations_per_mb(int64_t observed_count, int64_t region_set_size) {
    if (region_set_size <= 0) {
        throw ConfigError("Region set size must be positive to compute mutations per Mb");
    }
    return static_cast<double>(observed_count) * 1e6 / static_cast<double>(region_set_size);
}

std::vector<TmbRow> aggregate_tmb(const std::vector<TallyResult>& tallies,
                                  const std::vector<std::pair<std::string, int64_t>>& region_sets) {
    using RegionKey = std::pair<std::string, int64_t>;
    std::map<RegionKey, std::map<MutationClass, int64_t>> counts;

    for (const auto& key : region_sets) {
        counts[key];
    }
    for (const auto& t : tallies) {
        counts[{t.region_set_name, t.region_set_size}][t.mutation_class] += t.observed_count;
    }

    std::vector<TmbRow> rows;
    rows.reserve(counts.size() * (kAllMutationClasses.size() + 1));
    for (const auto& [key, by_class] : counts) {
        int64_t total = 0;
        for (MutationClass c : kAllMutationClasses) {
            auto it = by_class.find(c);
            int64_t n = it == by_class.end() ? 0 : it->second;
            if (c != MutationClass::NO_SEQUENCE_ALTERATION) {
                total += n;
            }
            rows.push_back({key.first, key.second, mutation_class_to_string(c), n, mutations_per_mb(n, key.second)});
        }
        rows.push_back({key.first, key.second, kTotalLabel, total, mutations_per_mb(total, key.second)});
    }

    std::sort(rows.begin(), rows.end(), [](const TmbRow& a, const TmbRow& b) {
        return std::tie(a.region_set_name, a.region_set_size, a.variant_type) <
               std::tie(b.region_set_name, b.region_set_size, b.variant_type);
    });
    return rows;
}

} // namespace Tmber
