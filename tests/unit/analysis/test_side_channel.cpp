// tests/unit/analysis/test_side_channel.cpp - Unit tests for lookup tables and .proto scanning
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "wirebind/analysis/side_channel.hpp"

using namespace wirebind;

namespace
{

TableSideChannel scan(const std::string & proto)
{
  ProtoScanner scanner;
  scanner.scan_text(proto);
  return scanner.build();
}

}  // namespace

// ============================================================================
// TableSideChannel
// ============================================================================

TEST(SideChannelTest, NullChannelNeverAnswers)
{
  NullSideChannel none;
  EXPECT_FALSE(none.get_field_optionality("Book", "title").has_value());
}

TEST(SideChannelTest, TableLookup)
{
  TableSideChannel table;
  table.set("Book", "subtitle", true);
  table.set("Book", "title", false);

  EXPECT_EQ(table.get_field_optionality("Book", "subtitle"), std::optional<bool>(true));
  EXPECT_EQ(table.get_field_optionality("Book", "title"), std::optional<bool>(false));
  EXPECT_FALSE(table.get_field_optionality("Book", "pages").has_value());
  EXPECT_FALSE(table.get_field_optionality("Shelf", "title").has_value());
  EXPECT_EQ(table.size(), 2U);
}

TEST(SideChannelTest, MergeOverwrites)
{
  TableSideChannel base;
  base.set("Book", "title", false);
  base.set("Book", "pages", false);

  TableSideChannel overrides;
  overrides.set("Book", "pages", true);
  base.merge(overrides);

  EXPECT_EQ(base.get_field_optionality("Book", "pages"), std::optional<bool>(true));
  EXPECT_EQ(base.get_field_optionality("Book", "title"), std::optional<bool>(false));
}

TEST(SideChannelTest, JsonRoundTrip)
{
  TableSideChannel table;
  table.set("Book", "subtitle", true);
  table.set("Shelf", "label", false);

  const nlohmann::json j = table.to_json();
  EXPECT_EQ(j["Book"]["subtitle"], true);

  std::string error;
  auto back = TableSideChannel::from_json(j, error);
  ASSERT_TRUE(back.has_value()) << error;
  EXPECT_EQ(back->to_json(), j);
}

TEST(SideChannelTest, FromJsonRejectsBadShapes)
{
  std::string error;
  EXPECT_FALSE(TableSideChannel::from_json(nlohmann::json::array(), error).has_value());
  EXPECT_EQ(error, "lookup table must be a JSON object");

  EXPECT_FALSE(
    TableSideChannel::from_json(nlohmann::json::parse(R"({"Book": 1})"), error).has_value());
  EXPECT_EQ(error, "entry 'Book' must be an object of booleans");

  EXPECT_FALSE(TableSideChannel::from_json(
                 nlohmann::json::parse(R"({"Book": {"title": "yes"}})"), error)
                 .has_value());
  EXPECT_EQ(error, "entry 'Book.title' must be true or false");
}

TEST(SideChannelTest, LoadFile)
{
  const auto path = std::filesystem::temp_directory_path() / "wirebind_lookup_case.json";
  {
    std::ofstream out(path);
    out << R"({"LoanRecord": {"borrower": true}})";
  }
  std::string error;
  auto table = TableSideChannel::load_file(path, error);
  ASSERT_TRUE(table.has_value()) << error;
  EXPECT_EQ(table->get_field_optionality("LoanRecord", "borrower"), std::optional<bool>(true));
  std::filesystem::remove(path);

  EXPECT_FALSE(TableSideChannel::load_file(path, error).has_value());
  EXPECT_NE(error.find("cannot open lookup file"), std::string::npos);
}

TEST(SideChannelTest, LoadFileRejectsInvalidJson)
{
  const auto path = std::filesystem::temp_directory_path() / "wirebind_lookup_broken.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  std::string error;
  EXPECT_FALSE(TableSideChannel::load_file(path, error).has_value());
  EXPECT_NE(error.find("invalid JSON"), std::string::npos);
  std::filesystem::remove(path);
}

// ============================================================================
// ProtoScanner
// ============================================================================

TEST(ProtoScannerTest, LabelsDecideOptionality)
{
  const auto table = scan(R"(
syntax = "proto3";
package library.pb;

enum Genre {
  GENRE_UNSPECIFIED = 0;
  GENRE_FICTION = 1;
}

message Author {
  string name = 1;
}

message Book {
  uint64 id = 1;
  optional string subtitle = 2;
  repeated string tags = 3;
  Author author = 4;
  Genre genre = 5;
  map<string, int32> ratings = 6;
  library.pb.Author editor = 7;  // qualified message type
}
)");

  EXPECT_EQ(table.get_field_optionality("Book", "id"), std::optional<bool>(false));
  EXPECT_EQ(table.get_field_optionality("Book", "subtitle"), std::optional<bool>(true));
  EXPECT_EQ(table.get_field_optionality("Book", "tags"), std::optional<bool>(false));
  EXPECT_EQ(table.get_field_optionality("Book", "author"), std::optional<bool>(true));
  EXPECT_EQ(table.get_field_optionality("Book", "genre"), std::optional<bool>(false));
  EXPECT_EQ(table.get_field_optionality("Book", "ratings"), std::optional<bool>(false));
  EXPECT_EQ(table.get_field_optionality("Book", "editor"), std::optional<bool>(true));
  EXPECT_EQ(table.get_field_optionality("Author", "name"), std::optional<bool>(false));
  EXPECT_FALSE(table.get_field_optionality("Genre", "GENRE_FICTION").has_value());
}

TEST(ProtoScannerTest, OneofMembersHavePresence)
{
  const auto table = scan(R"(
message Payment {
  string id = 1;
  oneof method {
    string card = 2;
    uint64 account = 3;
  }
  int32 amount = 4;
}
)");
  EXPECT_EQ(table.get_field_optionality("Payment", "card"), std::optional<bool>(true));
  EXPECT_EQ(table.get_field_optionality("Payment", "account"), std::optional<bool>(true));
  EXPECT_EQ(table.get_field_optionality("Payment", "amount"), std::optional<bool>(false));
}

TEST(ProtoScannerTest, NestedMessagesUseUnqualifiedNames)
{
  const auto table = scan(R"(
message Outer {
  message Inner {
    optional int32 depth = 1;
  }
  Inner inner = 1;
  string label = 2;
}
)");
  EXPECT_EQ(table.get_field_optionality("Inner", "depth"), std::optional<bool>(true));
  EXPECT_EQ(table.get_field_optionality("Outer", "inner"), std::optional<bool>(true));
  EXPECT_EQ(table.get_field_optionality("Outer", "label"), std::optional<bool>(false));
}

TEST(ProtoScannerTest, CommentsAndOptionsAreSkipped)
{
  const auto table = scan(R"(
// message Ghost { string x = 1; }
/* message Hidden {
  string y = 1;
} */
message Visible {
  option deprecated = true;
  reserved 2, 3;
  string z = 1; // trailing comment
}
)");
  EXPECT_FALSE(table.get_field_optionality("Ghost", "x").has_value());
  EXPECT_FALSE(table.get_field_optionality("Hidden", "y").has_value());
  EXPECT_EQ(table.get_field_optionality("Visible", "z"), std::optional<bool>(false));
  EXPECT_EQ(table.size(), 1U);
}

TEST(ProtoScannerTest, EnumsResolveAcrossFiles)
{
  ProtoScanner scanner;
  scanner.scan_text("message Book {\n  Status status = 1;\n}\n");
  scanner.scan_text("enum Status {\n  STATUS_UNKNOWN = 0;\n}\n");
  const auto table = scanner.build();
  EXPECT_EQ(table.get_field_optionality("Book", "status"), std::optional<bool>(false));
}

TEST(ProtoScannerTest, MissingFileFails)
{
  ProtoScanner scanner;
  EXPECT_FALSE(scanner.scan_file("/nonexistent/library.proto"));
}
