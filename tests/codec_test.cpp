#include <gtest/gtest.h>

#include "track/codec.hpp"

using track::Record;

TEST(SplitCsvLine, PlainAndQuotedFields) {
  std::vector<std::string> cols;
  ASSERT_TRUE(track::split_csv_line("a,b", cols));
  EXPECT_EQ(cols, (std::vector<std::string>{"a", "b"}));

  ASSERT_TRUE(track::split_csv_line("\"a,b\",\"say \"\"hi\"\"\"", cols));
  EXPECT_EQ(cols, (std::vector<std::string>{"a,b", "say \"hi\""}));

  ASSERT_TRUE(track::split_csv_line("a,,", cols));
  EXPECT_EQ(cols.size(), 3u);
}

TEST(SplitCsvLine, UnterminatedQuoteFails) {
  std::vector<std::string> cols;
  std::string err;
  EXPECT_FALSE(track::split_csv_line("\"open", cols, &err));
  EXPECT_FALSE(err.empty());
}

TEST(SplitCsvLine, EmptyAndTrailingFields) {
  std::vector<std::string> cols;
  ASSERT_TRUE(track::split_csv_line("", cols));
  EXPECT_EQ(cols, std::vector<std::string>{""});

  ASSERT_TRUE(track::split_csv_line("a,", cols));
  EXPECT_EQ(cols, (std::vector<std::string>{"a", ""}));

  ASSERT_TRUE(track::split_csv_line("say \"hi\",b", cols));
  EXPECT_EQ(cols, (std::vector<std::string>{"say \"hi\"", "b"}));
}

TEST(SplitCsvLine, TextAfterClosingQuoteFails) {
  std::vector<std::string> cols;
  std::string err;
  EXPECT_FALSE(track::split_csv_line("\"a\"b,c", cols, &err));
  EXPECT_FALSE(err.empty());
}

TEST(DecodeRecord, FieldCountDecidesKind) {
  auto open = track::decode_record({"2024-01-01 10:00:00 UTC"});
  ASSERT_TRUE(open.has_value());
  EXPECT_TRUE(open->is_open());

  auto closed = track::decode_record({"2024-01-01 10:00:00 UTC", "2024-01-01 11:00:00 UTC"});
  ASSERT_TRUE(closed.has_value());
  EXPECT_FALSE(closed->is_open());
  EXPECT_EQ(*closed->end, "2024-01-01 11:00:00 UTC");

  EXPECT_FALSE(track::decode_record({}).has_value());
  EXPECT_FALSE(track::decode_record({"a", "b", "c"}).has_value());
}

TEST(EncodeRecord, OneLinePerRecord) {
  EXPECT_EQ(track::encode_record(Record{"2024-01-01 10:00:00 UTC", std::nullopt}),
            "2024-01-01 10:00:00 UTC\n");
  EXPECT_EQ(track::encode_record(Record{"s", std::string("e")}), "s,e\n");
}

TEST(EncodeRecord, QuotesSeparatorsSoDecodeRecoversThem) {
  const Record r{"a,b", std::string("c\"d")};
  const std::string line = track::encode_record(r);
  EXPECT_EQ(line, "\"a,b\",\"c\"\"d\"\n");

  std::vector<std::string> cols;
  ASSERT_TRUE(track::split_csv_line(line.substr(0, line.size() - 1), cols));
  EXPECT_EQ(track::decode_record(cols), r);
}

TEST(EncodeRecord, RoundTripKeepsOpenness) {
  for (const Record& r : {Record{"2024-01-01 10:00:00 UTC", std::nullopt},
                          Record{"2024-01-01 10:00:00 UTC", std::string("2024-01-01 12:00:00 UTC")}}) {
    const std::string line = track::encode_record(r);
    std::vector<std::string> cols;
    ASSERT_TRUE(track::split_csv_line(line.substr(0, line.size() - 1), cols));
    auto back = track::decode_record(cols);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, r);
    EXPECT_EQ(back->is_open(), r.is_open());
  }
}
