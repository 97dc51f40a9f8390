#include <gtest/gtest.h>

#include "core/SequenceOntology.hpp"

using namespace Tmber;

TEST(SequenceOntologyTest, SmallVariants) {
    EXPECT_EQ(classify_alleles("A", "T"), MutationClass::SNV);
    EXPECT_EQ(classify_alleles("ACG", "A"), MutationClass::DELETION);
    EXPECT_EQ(classify_alleles("A", "ACG"), MutationClass::INSERTION);
    EXPECT_EQ(classify_alleles("AC", "GT"), MutationClass::DELINS);
    EXPECT_EQ(classify_alleles("ACGT", "TG"), MutationClass::DELINS);
}

TEST(SequenceOntologyTest, SymbolicAlleles) {
    EXPECT_EQ(classify_alleles("N", "<DEL>"), MutationClass::DELETION);
    EXPECT_EQ(classify_alleles("N", "<DEL:ME:ALU>"), MutationClass::DELETION);
    EXPECT_EQ(classify_alleles("N", "<INS>"), MutationClass::INSERTION);
    EXPECT_EQ(classify_alleles("N", "<INS:ME>"), MutationClass::INSERTION);
    EXPECT_EQ(classify_alleles("N", "<DUP>"), MutationClass::DUPLICATION);
    EXPECT_EQ(classify_alleles("N", "<DUP:TANDEM>"), MutationClass::DUPLICATION);
    EXPECT_EQ(classify_alleles("N", "<INV>"), MutationClass::INVERSION);
    EXPECT_EQ(classify_alleles("N", "<CNV>"), MutationClass::COPY_NUMBER_VARIATION);
    EXPECT_EQ(classify_alleles("N", "<CNV:GAIN>"), MutationClass::COPY_NUMBER_VARIATION);
}

TEST(SequenceOntologyTest, TagMustBeFollowedByBracketOrColon) {
    // "<DELX>" is neither <DEL> nor <DEL:...>; falls through to length rules
    EXPECT_EQ(classify_alleles("N", "<DELX>"), MutationClass::UNCLASSIFIED);
    EXPECT_EQ(classify_alleles("NA", "<DUPLICATE>"), MutationClass::DELINS);
}

TEST(SequenceOntologyTest, BreakendsAreStructuralVariants) {
    EXPECT_EQ(classify_alleles("G", "G]17:198982]"), MutationClass::STRUCTURAL_VARIANT);
    EXPECT_EQ(classify_alleles("T", "[13:123457[T"), MutationClass::STRUCTURAL_VARIANT);
}

TEST(SequenceOntologyTest, SpecialAlleles) {
    EXPECT_EQ(classify_alleles("A", "."), MutationClass::NO_SEQUENCE_ALTERATION);
    EXPECT_EQ(classify_alleles("A", "*"), MutationClass::DELETION);
}

TEST(SequenceOntologyTest, RulesAreOrdered) {
    // A breakend wins over any symbolic tag
    EXPECT_EQ(classify_alleles("N", "<DEL>[1:100["), MutationClass::STRUCTURAL_VARIANT);
    // Symbolic tags are checked before the length rules
    EXPECT_EQ(classify_alleles("A", "<DEL>"), MutationClass::DELETION);
}

TEST(SequenceOntologyTest, MultiAllelicUsesFirstAllele) {
    EXPECT_EQ(classify_alleles("A", "T,G"), MutationClass::SNV);
    EXPECT_EQ(classify_alleles("A", "AT,G"), MutationClass::INSERTION);
    EXPECT_EQ(classify_alleles("AT", "A,G"), MutationClass::DELETION);
}

TEST(SequenceOntologyTest, Unclassified) {
    // Different anchor base with a length change
    EXPECT_EQ(classify_alleles("AC", "T"), MutationClass::UNCLASSIFIED);
    EXPECT_EQ(classify_alleles("A", "TG"), MutationClass::UNCLASSIFIED);
    EXPECT_EQ(classify_alleles("", "A"), MutationClass::UNCLASSIFIED);
}

TEST(SequenceOntologyTest, Labels) {
    EXPECT_EQ(mutation_class_to_string(MutationClass::SNV), "SNV");
    EXPECT_EQ(mutation_class_to_string(MutationClass::DELINS), "delins");
    EXPECT_EQ(mutation_class_to_string(MutationClass::STRUCTURAL_VARIANT), "structural_variant");
    EXPECT_EQ(mutation_class_to_string(MutationClass::COPY_NUMBER_VARIATION), "copy_number_variation");
    EXPECT_EQ(mutation_class_to_string(MutationClass::NO_SEQUENCE_ALTERATION), "no_sequence_alteration");
    EXPECT_EQ(mutation_class_to_string(MutationClass::UNCLASSIFIED), "unclassified");
    EXPECT_EQ(kAllMutationClasses.size(), 10u);
}
