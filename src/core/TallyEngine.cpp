#include "core/TallyEngine.hpp"

#include <algorithm>
#include <map>
#include <tuple>
#include <utility>

#include "core/SequenceOntology.hpp"

namespace Tmber {

std::vector<TallyResult> tally_variants(const std::vector<VariantRecord>& variants, const RegionSet& region_set) {
    std::map<std::pair<std::string, std::string>, int64_t> counts;
    for (const auto& v : variants) {
        if (region_set.contains(v)) {
            ++counts[{v.ref, v.alt}];
        }
    }

    std::vector<TallyResult> results;
    results.reserve(counts.size());
    for (const auto& [alleles, count] : counts) {
        TallyResult r;
        r.region_set_name = region_set.name();
        r.region_set_size = region_set.size();
        r.mutation_class = classify_alleles(alleles.first, alleles.second);
        r.ref = alleles.first;
        r.alt = alleles.second;
        r.observed_count = count;
        results.push_back(std::move(r));
    }
    std::sort(results.begin(), results.end(), tally_result_less);
    return results;
}

bool tally_result_less(const TallyResult& a, const TallyResult& b) {
    const std::string a_label = mutation_class_to_string(a.mutation_class);
    const std::string b_label = mutation_class_to_string(b.mutation_class);
    return std::tie(a.region_set_name, a.region_set_size, a_label, a.ref, a.alt) <
           std::tie(b.region_set_name, b.region_set_size, b_label, b.ref, b.alt);
}

} // namespace Tmber
