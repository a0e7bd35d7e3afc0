#include <txtpack/error.hxx>
#include <txtpack/stream-extractor.hxx>

#include <gtest/gtest.h>
#include <string>
#include <string_view>

using namespace txtpack;

TEST(FindLineEndTest, StopsAtNewline) {
  const std::string_view content = "line1\nline2\nline3";
  EXPECT_EQ(find_line_end(content, 0), 5u);
  EXPECT_EQ(find_line_end(content, 6), 11u);
  EXPECT_EQ(find_line_end(content, 5), 5u);
}

TEST(FindLineEndTest, UnterminatedLastLine) {
  const std::string_view content = "line1\nline2";
  EXPECT_EQ(find_line_end("no newline", 0), 10u);
  EXPECT_EQ(find_line_end(content, 6), content.size());
}

TEST(FindLineEndTest, EmptyAndExhaustedBuffer) {
  EXPECT_EQ(find_line_end("", 0), 0u);
  EXPECT_EQ(find_line_end("abc", 7), 3u);
}

TEST(ExtractPayloadTest, SlicesExactByteCount) {
  const std::string_view content = "Hello, world!\nremaining";
  const auto payload = extract_payload(content, 0, "test.txt", 13);
  EXPECT_EQ(payload.text, "Hello, world!");
  EXPECT_EQ(payload.next_position, 13u);
}

TEST(ExtractPayloadTest, IgnoresLineStructure) {
  const std::string_view content =
      "xx\n--- END: a.txt ---\n--- FILE: b (1 bytes) ---\ntail";
  const auto payload = extract_payload(content, 3, "a.txt", 45);
  EXPECT_EQ(payload.text, "--- END: a.txt ---\n--- FILE: b (1 bytes) ---\n");
  EXPECT_EQ(payload.next_position, 48u);
}

TEST(ExtractPayloadTest, CountsBytesNotCharacters) {
  const std::string text = "h\xc3\xa9llo \xe2\x82\xac";  // 7 chars, 10 bytes
  const auto payload = extract_payload(text, 0, "u.txt", text.size());
  EXPECT_EQ(payload.text, text);
  EXPECT_EQ(payload.next_position, 10u);
}

TEST(ExtractPayloadTest, ZeroBytesAtEnd) {
  const auto payload = extract_payload("abc", 3, "empty.txt", 0);
  EXPECT_EQ(payload.text, "");
  EXPECT_EQ(payload.next_position, 3u);
}

TEST(ExtractPayloadTest, ThrowsOnTruncation) {
  EXPECT_THROW(extract_payload("Short", 0, "test.txt", 100), TruncatedContent);
  EXPECT_THROW(extract_payload("abc", 4, "test.txt", 0), TruncatedContent);
}

TEST(ExtractPayloadTest, ThrowsOnInvalidUtf8) {
  EXPECT_THROW(extract_payload("ok\xff\xfe", 0, "bin.dat", 4), DecodeError);
  // Cutting a multi-byte character in half is a decode error too
  EXPECT_THROW(extract_payload("\xe2\x82\xac", 0, "cut.txt", 2), DecodeError);
}

TEST(SkipEndMarkerTest, ConsumesSeparatorAndMarker) {
  const std::string_view content = "\n--- END: test.txt ---\nnext";
  EXPECT_EQ(skip_end_marker(content, 0, "test.txt"), content.size() - 4);
}

TEST(SkipEndMarkerTest, MarkerWithoutTrailingNewline) {
  const std::string_view content = "\n--- END: test.txt ---";
  EXPECT_EQ(skip_end_marker(content, 0, "test.txt"), content.size());
}

TEST(SkipEndMarkerTest, WrongFilenameLeavesLineForRescan) {
  const std::string_view content = "\n--- END: other.txt ---\n";
  EXPECT_EQ(skip_end_marker(content, 0, "test.txt"), 1u);
}

TEST(SkipEndMarkerTest, MissingMarker) {
  const std::string_view content = "\nsome other line\n";
  EXPECT_EQ(skip_end_marker(content, 0, "test.txt"), 1u);
  EXPECT_EQ(skip_end_marker("no separator", 0, "test.txt"), 0u);
}

TEST(SkipEndMarkerTest, AtEndOfContent) {
  const std::string_view content = "abc";
  EXPECT_EQ(skip_end_marker(content, 3, "test.txt"), 3u);
  EXPECT_EQ(skip_end_marker("\n", 0, "test.txt"), 1u);
}

TEST(SkipEndMarkerTest, CustomGrammar) {
  const auto config = DelimiterConfig().with_end_prefix("### END: ")
                          .with_end_suffix(" ###");
  const std::string_view content = "\n### END: test.txt ###\n";
  EXPECT_EQ(skip_end_marker(content, 0, "test.txt", config), content.size());
  EXPECT_EQ(skip_end_marker("\n--- END: test.txt ---\n", 0, "test.txt", config),
            1u);
}

TEST(ExtractNextRecordTest, SingleRecord) {
  const std::string_view content =
      "--- FILE: a.txt (5 bytes) ---\nhello\n--- END: a.txt ---\n";
  const auto result = extract_next_record(content, 0);
  ASSERT_TRUE(result.has_record());
  EXPECT_EQ(*result.record, (FileRecord{"a.txt", "hello"}));
  EXPECT_EQ(result.next_position, content.size());
  EXPECT_EQ(result.reason, SkipReason::None);
}

TEST(ExtractNextRecordTest, StopsBeforeFollowingContent) {
  const std::string_view content = "--- FILE: test.txt (13 bytes) ---\n"
                                   "Hello, world!\n"
                                   "--- END: test.txt ---\n"
                                   "remaining content";
  const auto result = extract_next_record(content, 0);
  ASSERT_TRUE(result.has_record());
  EXPECT_EQ(*result.record, (FileRecord{"test.txt", "Hello, world!"}));
  EXPECT_EQ(result.next_position, content.size() - 17);
}

TEST(ExtractNextRecordTest, TwoRecordsInSequence) {
  const std::string_view content = "--- FILE: a.txt (5 bytes) ---\nHello\n"
                                   "--- END: a.txt ---\n"
                                   "--- FILE: b.txt (5 bytes) ---\nWorld\n"
                                   "--- END: b.txt ---\n";
  const auto first = extract_next_record(content, 0);
  ASSERT_TRUE(first.has_record());
  EXPECT_EQ(*first.record, (FileRecord{"a.txt", "Hello"}));

  const auto second = extract_next_record(content, first.next_position);
  ASSERT_TRUE(second.has_record());
  EXPECT_EQ(*second.record, (FileRecord{"b.txt", "World"}));
  EXPECT_EQ(second.next_position, content.size());
}

TEST(ExtractNextRecordTest, GarbageLineAdvancesOneLine) {
  const std::string_view content = "not a delimiter\nmore";
  const auto result = extract_next_record(content, 0);
  EXPECT_FALSE(result.has_record());
  EXPECT_EQ(result.next_position, 16u);
  EXPECT_EQ(result.reason, SkipReason::NotADelimiter);
}

TEST(ExtractNextRecordTest, NonNumericCountSkipsStartLine) {
  const std::string_view content = "--- FILE: x (abc bytes) ---\nbody\n";
  const auto result = extract_next_record(content, 0);
  EXPECT_FALSE(result.has_record());
  EXPECT_EQ(result.next_position, 28u);
  EXPECT_EQ(result.reason, SkipReason::InvalidDelimiter);
}

TEST(ExtractNextRecordTest, TruncatedRecordSkipsOnlyStartLine) {
  const std::string_view start = "--- FILE: test.txt (100 bytes) ---\n";
  const std::string content = std::string(start) + "Short content\n";
  const auto result = extract_next_record(content, 0);
  EXPECT_FALSE(result.has_record());
  EXPECT_EQ(result.next_position, start.size());
  EXPECT_EQ(result.reason, SkipReason::TruncatedContent);
}

TEST(ExtractNextRecordTest, UndecodablePayloadSkipsStartLine) {
  const std::string_view start = "--- FILE: bin (2 bytes) ---\n";
  const std::string content = std::string(start) + "\xff\xfe\n";
  const auto result = extract_next_record(content, 0);
  EXPECT_FALSE(result.has_record());
  EXPECT_EQ(result.next_position, start.size());
  EXPECT_EQ(result.reason, SkipReason::DecodeError);
}

TEST(ExtractNextRecordTest, UndecodableLineIsSkipped) {
  const std::string content = "\xc3\x28 garbage\nnext";
  const auto result = extract_next_record(content, 0);
  EXPECT_FALSE(result.has_record());
  EXPECT_EQ(result.next_position, 11u);
  EXPECT_EQ(result.reason, SkipReason::NotUtf8);
}

TEST(ExtractNextRecordTest, EndOfContentMakesNoProgress) {
  const std::string_view content = "abc\n";
  const auto result = extract_next_record(content, content.size());
  EXPECT_FALSE(result.has_record());
  EXPECT_EQ(result.next_position, content.size());
  EXPECT_EQ(result.reason, SkipReason::EndOfInput);
}

TEST(ExtractNextRecordTest, BlankLineIsSteppedOver) {
  const std::string_view content = "\n\nabc";
  const auto result = extract_next_record(content, 0);
  EXPECT_FALSE(result.has_record());
  EXPECT_EQ(result.next_position, 1u);
  EXPECT_EQ(result.reason, SkipReason::BlankLine);
}

TEST(ExtractNextRecordTest, UnterminatedGarbageClampsToEnd) {
  const std::string_view content = "trailing garbage";
  const auto result = extract_next_record(content, 0);
  EXPECT_FALSE(result.has_record());
  EXPECT_EQ(result.next_position, content.size());
}

TEST(ExtractNextRecordTest, PayloadThatLooksLikeMarkers) {
  const std::string payload = "--- END: a.txt ---\n--- FILE: b.txt (3 bytes) ---";
  const std::string content = "--- FILE: a.txt (" +
                              std::to_string(payload.size()) + " bytes) ---\n" +
                              payload + "\n--- END: a.txt ---\n";
  const auto result = extract_next_record(content, 0);
  ASSERT_TRUE(result.has_record());
  EXPECT_EQ(result.record->content, payload);
  EXPECT_EQ(result.next_position, content.size());
}

TEST(ExtractNextRecordTest, WrongEndMarkerStillYieldsRecord) {
  const std::string_view content =
      "--- FILE: a.txt (5 bytes) ---\nhello\n--- END: b.txt ---\n";
  const auto result = extract_next_record(content, 0);
  ASSERT_TRUE(result.has_record());
  EXPECT_EQ(*result.record, (FileRecord{"a.txt", "hello"}));
  // Positioned at the mismatched end marker line, which is left for rescan
  EXPECT_EQ(content.substr(result.next_position), "--- END: b.txt ---\n");
}

TEST(ExtractNextRecordTest, PayloadEndingAtEndOfBuffer) {
  const std::string_view content = "--- FILE: a.txt (5 bytes) ---\nhello";
  const auto result = extract_next_record(content, 0);
  ASSERT_TRUE(result.has_record());
  EXPECT_EQ(result.record->content, "hello");
  EXPECT_EQ(result.next_position, content.size());
}

TEST(ExtractNextRecordTest, StartLineWithoutNewlineAtEnd) {
  const std::string_view content = "--- FILE: a.txt (0 bytes) ---";
  const auto result = extract_next_record(content, 0);
  EXPECT_FALSE(result.has_record());
  EXPECT_EQ(result.reason, SkipReason::TruncatedContent);
  EXPECT_EQ(result.next_position, content.size());
}

TEST(ExtractNextRecordTest, CustomGrammar) {
  const DelimiterConfig config("### START: ", " [", " bytes] ###",
                               "### END: ", " ###");
  const std::string_view content =
      "### START: test.txt [5 bytes] ###\nhello\n### END: test.txt ###\n";
  const auto result = extract_next_record(content, 0, config);
  ASSERT_TRUE(result.has_record());
  EXPECT_EQ(*result.record, (FileRecord{"test.txt", "hello"}));
  EXPECT_EQ(result.next_position, content.size());

  EXPECT_FALSE(extract_next_record(content, 0).has_record());
}
