#include "core/SequenceOntology.hpp"

#include "utils/StringUtils.hpp"

namespace Tmber {

namespace {

bool has_symbolic_tag(const std::string& alt, const std::string& tag) {
    return Utils::starts_with(alt, "<" + tag + ">") || Utils::starts_with(alt, "<" + tag + ":");
}

} // namespace

MutationClass classify_alleles(const std::string& ref, const std::string& alt) {
    if (alt.find_first_of("[]") != std::string::npos) {
        return MutationClass::STRUCTURAL_VARIANT;
    }
    if (has_symbolic_tag(alt, "DEL")) return MutationClass::DELETION;
    if (has_symbolic_tag(alt, "INS")) return MutationClass::INSERTION;
    if (has_symbolic_tag(alt, "DUP")) return MutationClass::DUPLICATION;
    if (has_symbolic_tag(alt, "INV")) return MutationClass::INVERSION;
    if (has_symbolic_tag(alt, "CNV")) return MutationClass::COPY_NUMBER_VARIATION;
    if (alt == ".") return MutationClass::NO_SEQUENCE_ALTERATION;
    if (alt == "*") return MutationClass::DELETION;

    const std::string alt0 = alt.substr(0, alt.find(','));
    const size_t ref_len = ref.size();
    const size_t alt_len = alt0.size();

    if (ref_len == 1 && alt_len == 1) {
        return MutationClass::SNV;
    }
    const bool same_anchor = ref_len > 0 && alt_len > 0 && ref[0] == alt0[0];
    if (same_anchor && ref_len > 1 && alt_len == 1) {
        return MutationClass::DELETION;
    }
    if (same_anchor && ref_len == 1 && alt_len > 1) {
        return MutationClass::INSERTION;
    }
    if (ref_len > 1 && alt_len > 1) {
        return MutationClass::DELINS;
    }
    return MutationClass::UNCLASSIFIED;
}

} // namespace Tmber
