#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace Tmber {

/**
 * @brief Sequence Ontology class assigned to a variant from its allele shape.
 *
 * UNCLASSIFIED is the sentinel for allele pairs that match none of the
 * classification rules. It is a regular outcome, not an error.
 */
enum class MutationClass : uint8_t {
    SNV,
    INSERTION,
    DELETION,
    DELINS,
    DUPLICATION,
    INVERSION,
    STRUCTURAL_VARIANT,
    COPY_NUMBER_VARIATION,
    NO_SEQUENCE_ALTERATION,
    UNCLASSIFIED
};

/**
 * @brief Every member of MutationClass, in declaration order.
 *
 * Used to zero-fill classes that were not observed in a region set.
 */
inline constexpr std::array<MutationClass, 10> kAllMutationClasses = {
    MutationClass::SNV,
    MutationClass::INSERTION,
    MutationClass::DELETION,
    MutationClass::DELINS,
    MutationClass::DUPLICATION,
    MutationClass::INVERSION,
    MutationClass::STRUCTURAL_VARIANT,
    MutationClass::COPY_NUMBER_VARIATION,
    MutationClass::NO_SEQUENCE_ALTERATION,
    MutationClass::UNCLASSIFIED};

/**
 * @brief Label written to output tables for a mutation class.
 */
inline std::string mutation_class_to_string(MutationClass c) {
    switch (c) {
        case MutationClass::SNV: return "SNV";
        case MutationClass::INSERTION: return "insertion";
        case MutationClass::DELETION: return "deletion";
        case MutationClass::DELINS: return "delins";
        case MutationClass::DUPLICATION: return "duplication";
        case MutationClass::INVERSION: return "inversion";
        case MutationClass::STRUCTURAL_VARIANT: return "structural_variant";
        case MutationClass::COPY_NUMBER_VARIATION: return "copy_number_variation";
        case MutationClass::NO_SEQUENCE_ALTERATION: return "no_sequence_alteration";
        case MutationClass::UNCLASSIFIED: return "unclassified";
    }
    return "unclassified";
}

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,    ///< Only errors
    LOG_WARN = 1,     ///< Errors and warnings
    LOG_INFO = 2,     ///< Normal operational messages
    LOG_DEBUG = 3     ///< Detailed debug output including per-file statistics
};

/**
 * @brief Fatal misconfiguration: missing executable, absent sample column,
 * empty region set, unreadable input.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Structurally malformed VCF or BED line.
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief External tool exited with non-zero status.
 *
 * The captured stderr of the tool is kept separately so callers can log it.
 */
class SubprocessError : public std::runtime_error {
public:
    SubprocessError(const std::string& msg, int exit_status, std::string stderr_text)
        : std::runtime_error(msg), exit_status_(exit_status), stderr_text_(std::move(stderr_text)) {}

    int exit_status() const { return exit_status_; }
    const std::string& stderr_text() const { return stderr_text_; }

private:
    int exit_status_;
    std::string stderr_text_;
};

} // namespace Tmber
