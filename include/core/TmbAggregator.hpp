#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/TallyEngine.hpp"

namespace Tmber {

/// Label of the per-region-set row summing every class but no_sequence_alteration.
inline const std::string kTotalLabel = "total";

/**
 * @brief One row of the final TMB table.
 */
struct TmbRow {
    std::string region_set_name;
    int64_t region_set_size = 0;
    std::string variant_type;  ///< Mutation class label or "total"
    int64_t observed_count = 0;
    double mutations_per_mb = 0.0;
};

/**
 * @brief Mutations per megabase: count * 1e6 / size.
 */
double mutations_per_mb(int64_t observed_count, int64_t region_set_size);

/**
 * @brief Folds tallies into the final TMB table.
 *
 * For each region set, emits one row per mutation class (zero-filled when
 * unobserved) and one "total" row. Region sets listed in @p region_sets are
 * reported even if no variant fell inside them.
 *
 * @param tallies Raw tallies from tally_variants(), any order.
 * @param region_sets (name, size) of every region set surveyed.
 * @return Rows sorted by (region_set_name, region_set_size, variant_type).
 */
std::vector<TmbRow> aggregate_tmb(const std::vector<TallyResult>& tallies,
                                  const std::vector<std::pair<std::string, int64_t>>& region_sets = {});

} // namespace Tmber
