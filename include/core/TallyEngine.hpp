#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/RegionSet.hpp"
#include "core/Types.hpp"
#include "core/VariantRecord.hpp"

namespace Tmber {

/**
 * @brief Observed count of one (class, ref, alt) combination in one region set.
 */
struct TallyResult {
    std::string region_set_name;
    int64_t region_set_size = 0;
    MutationClass mutation_class = MutationClass::UNCLASSIFIED;
    std::string ref;
    std::string alt;
    int64_t observed_count = 0;
};

/**
 * @brief Counts variants contained in a region set, per distinct (ref, alt).
 *
 * @param variants Deduplicated variant records (see deduplicate()); shared
 *                 read-only between concurrent calls.
 * @param region_set Region set to join against.
 * @return One row per distinct (ref, alt) with at least one contained variant,
 *         sorted by (class label, ref, alt). Each variant counts at most once.
 */
std::vector<TallyResult> tally_variants(const std::vector<VariantRecord>& variants, const RegionSet& region_set);

/**
 * @brief Ordering used for the raw tally table:
 * (region_set_name, region_set_size, class label, ref, alt).
 */
bool tally_result_less(const TallyResult& a, const TallyResult& b);

} // namespace Tmber
