#pragma once

#include <string>

#include "core/Types.hpp"

namespace Tmber {

/**
 * @brief Classifies a (ref, alt) allele pair into a Sequence Ontology class.
 *
 * Rules are evaluated top to bottom and the first match wins:
 * 1. alt contains '[' or ']' (breakend)            -> STRUCTURAL_VARIANT
 * 2. alt starts with <DEL> or <DEL:                -> DELETION
 * 3. alt starts with <INS> or <INS:                -> INSERTION
 * 4. alt starts with <DUP> or <DUP:                -> DUPLICATION
 * 5. alt starts with <INV> or <INV:                -> INVERSION
 * 6. alt starts with <CNV> or <CNV:                -> COPY_NUMBER_VARIATION
 * 7. alt == "."                                    -> NO_SEQUENCE_ALTERATION
 * 8. alt == "*"                                    -> DELETION
 * 9. on the first comma-delimited alt allele (alt0):
 *    - len(ref) == 1 and len(alt0) == 1            -> SNV
 *    - same first base, len(ref) > 1, len(alt0) == 1 -> DELETION
 *    - same first base, len(ref) == 1, len(alt0) > 1 -> INSERTION
 *    - len(ref) > 1 and len(alt0) > 1              -> DELINS
 * Anything else is UNCLASSIFIED.
 */
MutationClass classify_alleles(const std::string& ref, const std::string& alt);

} // namespace Tmber
