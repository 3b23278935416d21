// Tests for core/pitch_resolver.h -- formulaic and lookup-table pitch resolution.

#include "core/pitch_resolver.h"

#include <gtest/gtest.h>

#include <string>

#include "test_helpers.h"

namespace stylec {
namespace {

using test_helpers::makeMelodic;
using test_helpers::makePercussion;

// ---------------------------------------------------------------------------
// Letter and accidental tables
// ---------------------------------------------------------------------------

TEST(PitchResolverTest, LetterOffsets) {
  EXPECT_EQ(letterOffset('c'), 0);
  EXPECT_EQ(letterOffset('e'), 4);
  EXPECT_EQ(letterOffset('g'), 7);
}

TEST(PitchResolverTest, OnlyThreeLettersAreDefined) {
  for (char letter : std::string("abdfhC E")) {
    EXPECT_FALSE(letterOffset(letter).has_value()) << "letter '" << letter << "'";
  }
}

TEST(PitchResolverTest, OnlyEmptyAccidentalIsDefined) {
  EXPECT_EQ(accidentalOffset(""), 0);
  EXPECT_FALSE(accidentalOffset("#").has_value());
  EXPECT_FALSE(accidentalOffset("b").has_value());
  EXPECT_FALSE(accidentalOffset("is").has_value());
}

// ---------------------------------------------------------------------------
// Formulaic resolution
// ---------------------------------------------------------------------------

TEST(FormulaicPitchTest, MiddleOctave) {
  EXPECT_EQ(formulaicPitch("c4"), 60);
  EXPECT_EQ(formulaicPitch("e4"), 64);
  EXPECT_EQ(formulaicPitch("g4"), 67);
}

TEST(FormulaicPitchTest, OctaveArithmetic) {
  EXPECT_EQ(formulaicPitch("c0"), 12);
  EXPECT_EQ(formulaicPitch("c3"), 48);
  EXPECT_EQ(formulaicPitch("g5"), 79);
  EXPECT_EQ(formulaicPitch("g9"), 127);
}

TEST(FormulaicPitchTest, UnsupportedTokens) {
  EXPECT_FALSE(formulaicPitch("d4").has_value());   // Letter outside c/e/g
  EXPECT_FALSE(formulaicPitch("c#4").has_value());  // Accidental
  EXPECT_FALSE(formulaicPitch("eb4").has_value());  // Accidental
  EXPECT_FALSE(formulaicPitch("C4").has_value());   // Upper case
  EXPECT_FALSE(formulaicPitch("c").has_value());    // No octave
  EXPECT_FALSE(formulaicPitch("cx").has_value());   // Octave not a digit
  EXPECT_FALSE(formulaicPitch("4").has_value());    // No letter
  EXPECT_FALSE(formulaicPitch("").has_value());
}

// ---------------------------------------------------------------------------
// resolvePitch
// ---------------------------------------------------------------------------

TEST(ResolvePitchTest, MelodicUsesFormula) {
  auto oud = makeMelodic("oud", 106);
  uint8_t pitch = 0;
  CompileError error;
  ASSERT_TRUE(resolvePitch("e4", oud, pitch, error));
  EXPECT_EQ(pitch, 64);
  EXPECT_TRUE(error.ok());
}

TEST(ResolvePitchTest, MelodicUnknownLetterFails) {
  auto oud = makeMelodic("oud", 106);
  uint8_t pitch = 0;
  CompileError error;
  EXPECT_FALSE(resolvePitch("a4", oud, pitch, error));
  EXPECT_EQ(error.kind, ErrorKind::UnknownPitch);
  EXPECT_NE(error.message.find("a4"), std::string::npos);
  EXPECT_NE(error.message.find("oud"), std::string::npos);
}

TEST(ResolvePitchTest, MelodicAccidentalFails) {
  auto oud = makeMelodic("oud", std::nullopt);
  uint8_t pitch = 0;
  CompileError error;
  EXPECT_FALSE(resolvePitch("c#4", oud, pitch, error));
  EXPECT_EQ(error.kind, ErrorKind::UnknownPitch);
}

TEST(ResolvePitchTest, PercussionUsesMap) {
  auto darbuka = makePercussion("darbuka", {{"dum", 36}, {"tak", 38}});
  uint8_t pitch = 0;
  CompileError error;
  ASSERT_TRUE(resolvePitch("dum", darbuka, pitch, error));
  EXPECT_EQ(pitch, 36);
  ASSERT_TRUE(resolvePitch("tak", darbuka, pitch, error));
  EXPECT_EQ(pitch, 38);
}

TEST(ResolvePitchTest, PercussionMissFails) {
  auto darbuka = makePercussion("darbuka", {{"dum", 36}});
  uint8_t pitch = 0;
  CompileError error;
  EXPECT_FALSE(resolvePitch("ka", darbuka, pitch, error));
  EXPECT_EQ(error.kind, ErrorKind::UnknownPitch);
  EXPECT_NE(error.message.find("ka"), std::string::npos);
}

TEST(ResolvePitchTest, PitchMapTakesPrecedenceOverFormula) {
  // "c4" is a valid formulaic token but percussion never falls back to it.
  auto kit = makePercussion("kit", {{"x", 42}});
  uint8_t pitch = 0;
  CompileError error;
  EXPECT_FALSE(resolvePitch("c4", kit, pitch, error));
  EXPECT_EQ(error.kind, ErrorKind::UnknownPitch);

  auto mapped = makePercussion("mapped", {{"c4", 49}});
  ASSERT_TRUE(resolvePitch("c4", mapped, pitch, error));
  EXPECT_EQ(pitch, 49);
}

}  // namespace
}  // namespace stylec
