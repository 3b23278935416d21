// Tests for track/track_definition.h -- track descriptor parsing and loading.

#include "track/track_definition.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/file_io.h"
#include "test_helpers.h"

namespace stylec {
namespace {

using test_helpers::ScopedTempDir;
using test_helpers::writeFile;

// ---------------------------------------------------------------------------
// Descriptor parsing
// ---------------------------------------------------------------------------

TEST(TrackDescriptorTest, SinglesAndChords) {
  const std::string text = R"({"track": {"instrument": "oud", "notes": [
      {"pitch": "c4", "duration": "4"},
      {"pitches": ["c4", "e4", "g4"], "duration": "8."}
  ]}})";
  TrackDefinition track;
  CompileError error;
  ASSERT_TRUE(parseTrackText(text, "melody.json", track, error)) << error.message;

  EXPECT_EQ(track.instrument, "oud");
  EXPECT_TRUE(track.name.empty());
  ASSERT_EQ(track.notes.size(), 2u);

  EXPECT_EQ(track.notes[0].duration, "4");
  ASSERT_EQ(track.notes[0].pitches.size(), 1u);
  EXPECT_EQ(track.notes[0].pitches[0], "c4");

  EXPECT_EQ(track.notes[1].duration, "8.");
  EXPECT_EQ(track.notes[1].pitches, (std::vector<std::string>{"c4", "e4", "g4"}));
}

TEST(TrackDescriptorTest, IntegerDurationBecomesCode) {
  TrackDefinition track;
  CompileError error;
  ASSERT_TRUE(parseTrackText(
      R"({"track": {"instrument": "oud", "notes": [{"pitch": "c4", "duration": 16}]}})", "t",
      track, error));
  EXPECT_EQ(track.notes[0].duration, "16");
}

TEST(TrackDescriptorTest, OutOfRangeNumericDurationKeepsSourceText) {
  TrackDefinition track;
  CompileError error;
  ASSERT_TRUE(parseTrackText(
      R"({"track": {"instrument": "oud", "notes": [
          {"pitch": "c4", "duration": 1e30},
          {"pitch": "c4", "duration": 3000000000}
      ]}})",
      "t", track, error))
      << error.message;
  ASSERT_EQ(track.notes.size(), 2u);
  EXPECT_EQ(track.notes[0].duration, "1e30");
  EXPECT_EQ(track.notes[1].duration, "3000000000");
}

TEST(TrackDescriptorTest, WrongPitchTypeNamesTheType) {
  TrackDefinition track;
  CompileError error;
  EXPECT_FALSE(parseTrackText(
      R"({"track": {"instrument": "oud", "notes": [{"pitch": {}, "duration": "4"}]}})", "t",
      track, error));
  EXPECT_EQ(error.kind, ErrorKind::MalformedDescriptor);
  EXPECT_NE(error.message.find("got object"), std::string::npos) << error.message;
}

TEST(TrackDescriptorTest, EmptyNotesAndEmptyChord) {
  TrackDefinition track;
  CompileError error;
  ASSERT_TRUE(parseTrackText(R"({"track": {"instrument": "oud", "notes": []}})", "t", track,
                             error));
  EXPECT_TRUE(track.notes.empty());

  ASSERT_TRUE(parseTrackText(
      R"({"track": {"instrument": "oud", "notes": [{"pitches": [], "duration": "4"}]}})", "t",
      track, error));
  ASSERT_EQ(track.notes.size(), 1u);
  EXPECT_TRUE(track.notes[0].pitches.empty());
}

TEST(TrackDescriptorTest, BothPitchAndPitchesIsMalformed) {
  TrackDefinition track;
  CompileError error;
  EXPECT_FALSE(parseTrackText(
      R"({"track": {"instrument": "oud", "notes": [
          {"pitch": "c4", "duration": "4"},
          {"pitch": "c4", "pitches": ["e4"], "duration": "4"}]}})",
      "both.json", track, error));
  EXPECT_EQ(error.kind, ErrorKind::MalformedDescriptor);
  EXPECT_NE(error.message.find("notes[1]"), std::string::npos) << error.message;
  EXPECT_NE(error.message.find("both.json"), std::string::npos);
}

TEST(TrackDescriptorTest, NeitherPitchNorPitchesIsMalformed) {
  TrackDefinition track;
  CompileError error;
  EXPECT_FALSE(parseTrackText(
      R"({"track": {"instrument": "oud", "notes": [{"duration": "4"}]}})", "t", track, error));
  EXPECT_EQ(error.kind, ErrorKind::MalformedDescriptor);
}

TEST(TrackDescriptorTest, MalformedShapes) {
  TrackDefinition track;
  CompileError error;
  EXPECT_FALSE(parseTrackText("{", "t", track, error));
  EXPECT_FALSE(parseTrackText(R"({"instrument": {}})", "t", track, error));
  EXPECT_FALSE(parseTrackText(R"({"track": {"notes": []}})", "t", track, error));
  EXPECT_FALSE(parseTrackText(R"({"track": {"instrument": "oud"}})", "t", track, error));
  EXPECT_FALSE(parseTrackText(R"({"track": {"instrument": "oud", "notes": {}}})", "t", track,
                              error));
  EXPECT_FALSE(parseTrackText(R"({"track": {"instrument": "oud", "notes": ["c4"]}})", "t",
                              track, error));
  EXPECT_FALSE(parseTrackText(
      R"({"track": {"instrument": "oud", "notes": [{"pitch": "c4"}]}})", "t", track, error));
  EXPECT_FALSE(parseTrackText(
      R"({"track": {"instrument": "oud", "notes": [{"pitches": "c4", "duration": "4"}]}})", "t",
      track, error));
  EXPECT_FALSE(parseTrackText(
      R"({"track": {"instrument": "oud", "notes": [{"pitch": ["c4"], "duration": "4"}]}})",
      "t", track, error));
  EXPECT_EQ(error.kind, ErrorKind::MalformedDescriptor);
}

// ---------------------------------------------------------------------------
// Directory loading
// ---------------------------------------------------------------------------

TEST(TrackDirectoryTest, LoadsInNameOrderWithStemNames) {
  ScopedTempDir temp;
  writeFile(temp.path(), "rhythm.json",
            R"({"track": {"instrument": "darbuka", "notes": [{"pitch": "dum", "duration": "8"}]}})");
  writeFile(temp.path(), "melody.json",
            R"({"track": {"instrument": "oud", "notes": [{"pitch": "c4", "duration": "4"}]}})");

  std::vector<TrackDefinition> tracks;
  CompileError error;
  ASSERT_TRUE(loadTrackDirectory(temp.path(), tracks, error)) << error.message;
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(tracks[0].name, "melody");
  EXPECT_EQ(tracks[0].instrument, "oud");
  EXPECT_EQ(tracks[1].name, "rhythm");
  EXPECT_EQ(tracks[1].instrument, "darbuka");
}

TEST(TrackDirectoryTest, MalformedFileFails) {
  ScopedTempDir temp;
  writeFile(temp.path(), "broken.json", R"({"track": )");
  std::vector<TrackDefinition> tracks;
  CompileError error;
  EXPECT_FALSE(loadTrackDirectory(temp.path(), tracks, error));
  EXPECT_EQ(error.kind, ErrorKind::MalformedDescriptor);
}

TEST(TrackDirectoryTest, MissingDirectoryIsIoError) {
  ScopedTempDir temp;
  std::vector<TrackDefinition> tracks;
  CompileError error;
  EXPECT_FALSE(loadTrackDirectory(joinPath(temp.path(), "absent"), tracks, error));
  EXPECT_EQ(error.kind, ErrorKind::IoError);
}

}  // namespace
}  // namespace stylec
