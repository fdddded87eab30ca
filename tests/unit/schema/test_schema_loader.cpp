// tests/unit/schema/test_schema_loader.cpp - Unit tests for the YAML schema front end
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "wirebind/schema/schema_loader.hpp"

using namespace wirebind;

namespace
{

void expect_contains(const std::string & haystack, const std::string & needle)
{
  EXPECT_NE(haystack.find(needle), std::string::npos) << "missing: " << needle << "\n"
                                                      << haystack;
}

const char * k_library_schema = R"yaml(
namespace: library
wire_namespace: library::pb
includes:
  - library.pb.h
  - <cstdint>
transparent:
  - { name: BookId, inner: uint64_t }
  - { name: Isbn, inner: std::string, member: text }
enums:
  - name: Genre
    variants: [Fiction, NonFiction]
    wire_variants: [GENRE_UNSPECIFIED, GENRE_FICTION, GENRE_NON_FICTION]
aggregates:
  - name: Book
    directives: [wire_name = "BookMsg"]
    fields:
      - { name: id, type: BookId, directives: [transparent] }
      - { name: title, type: std::string }
      - name: subtitle
        type: std::optional<std::string>
        directives: "optional, expect(error)"
  - name: Empty
)yaml";

}  // namespace

TEST(SchemaLoaderTest, LoadsDocument)
{
  auto result = load_schema_string(k_library_schema, "library.wb.yaml");
  ASSERT_TRUE(result.success) << result.error;
  const SchemaDocument & doc = result.document;

  EXPECT_EQ(doc.origin, "library.wb.yaml");
  EXPECT_EQ(doc.domain_namespace, "library");
  EXPECT_EQ(doc.wire_namespace, "library::pb");
  ASSERT_EQ(doc.includes.size(), 2U);
  EXPECT_EQ(doc.includes[1], "<cstdint>");

  ASSERT_EQ(doc.transparent_types.size(), 2U);
  EXPECT_EQ(doc.transparent_types[0].member, "value");
  EXPECT_EQ(doc.transparent_types[1].inner, "std::string");
  EXPECT_EQ(doc.transparent_types[1].member, "text");

  ASSERT_EQ(doc.enums.size(), 1U);
  EXPECT_EQ(doc.enums[0].variants.size(), 2U);
  EXPECT_EQ(doc.enums[0].wire_variants.size(), 3U);

  ASSERT_EQ(doc.aggregates.size(), 2U);
  const AggregateDescriptor & book = doc.aggregates[0];
  EXPECT_EQ(book.name, "Book");
  ASSERT_EQ(book.directives.size(), 1U);
  EXPECT_EQ(book.directives[0], "wire_name = \"BookMsg\"");
  ASSERT_EQ(book.fields.size(), 3U);
  EXPECT_EQ(book.fields[0].aggregate, "Book");
  EXPECT_EQ(book.fields[1].directives.size(), 0U);
  ASSERT_EQ(book.fields[2].directives.size(), 1U);
  EXPECT_EQ(book.fields[2].directives[0], "optional, expect(error)");
  EXPECT_TRUE(doc.aggregates[1].fields.empty());
}

TEST(SchemaLoaderTest, RecordsFieldLocations)
{
  auto result = load_schema_string(k_library_schema, "library.wb.yaml");
  ASSERT_TRUE(result.success) << result.error;
  const FieldDescriptor & title = result.document.aggregates[0].fields[1];
  EXPECT_EQ(title.location.file, "library.wb.yaml");
  EXPECT_EQ(title.location.line, 19U);
  EXPECT_GT(title.location.column, 0U);
}

TEST(SchemaLoaderTest, EmptyDocumentIsValid)
{
  auto result = load_schema_string("", "empty.wb.yaml");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.document.aggregates.empty());
}

TEST(SchemaLoaderTest, RejectsNonMapRoot)
{
  auto result = load_schema_string("- a\n- b\n");
  EXPECT_FALSE(result.success);
  expect_contains(result.error, "schema root must be a map");
}

TEST(SchemaLoaderTest, RejectsMissingFieldType)
{
  auto result = load_schema_string(
    "aggregates:\n"
    "  - name: Book\n"
    "    fields:\n"
    "      - { name: title }\n");
  EXPECT_FALSE(result.success);
  expect_contains(result.error, "field is missing 'type'");
  EXPECT_EQ(result.error_location.line, 4U);
}

TEST(SchemaLoaderTest, RejectsDuplicateField)
{
  auto result = load_schema_string(
    "aggregates:\n"
    "  - name: Book\n"
    "    fields:\n"
    "      - { name: title, type: std::string }\n"
    "      - { name: title, type: std::string }\n");
  EXPECT_FALSE(result.success);
  expect_contains(result.error, "duplicate field 'title' in aggregate 'Book'");
  EXPECT_EQ(result.error_location.line, 5U);
}

TEST(SchemaLoaderTest, RejectsDuplicateTypeName)
{
  auto result = load_schema_string(
    "enums:\n"
    "  - { name: Book, variants: [A] }\n"
    "aggregates:\n"
    "  - name: Book\n");
  EXPECT_FALSE(result.success);
  expect_contains(result.error, "duplicate type name 'Book'");
}

TEST(SchemaLoaderTest, RejectsEnumWithoutVariants)
{
  auto result = load_schema_string("enums:\n  - name: Color\n");
  EXPECT_FALSE(result.success);
  expect_contains(result.error, "enum 'Color' needs a non-empty 'variants' list");
}

TEST(SchemaLoaderTest, RejectsDuplicateVariant)
{
  auto result = load_schema_string("enums:\n  - { name: Color, variants: [Red, Red] }\n");
  EXPECT_FALSE(result.success);
  expect_contains(result.error, "duplicate variant 'Red' in enum 'Color'");
}

TEST(SchemaLoaderTest, RejectsMalformedDirectiveList)
{
  auto result = load_schema_string(
    "aggregates:\n"
    "  - name: Book\n"
    "    directives: { a: b }\n");
  EXPECT_FALSE(result.success);
  expect_contains(result.error, "directives must be a string or a list of strings");
}

TEST(SchemaLoaderTest, ReportsYamlSyntaxErrors)
{
  auto result = load_schema_string("aggregates: [\n", "broken.wb.yaml");
  EXPECT_FALSE(result.success);
  expect_contains(result.error, "failed to parse YAML");
  EXPECT_EQ(result.error_location.file, "broken.wb.yaml");
}

TEST(SchemaLoaderTest, LoadsFromFile)
{
  const auto path = std::filesystem::temp_directory_path() / "wirebind_loader_case.wb.yaml";
  {
    std::ofstream out(path);
    out << "namespace: demo\naggregates:\n  - name: Point\n";
  }
  auto result = load_schema_file(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.document.origin, path.string());
  EXPECT_EQ(result.document.domain_namespace, "demo");
  std::filesystem::remove(path);
}

TEST(SchemaLoaderTest, MissingFileFails)
{
  auto result = load_schema_file("/nonexistent/dir/none.wb.yaml");
  EXPECT_FALSE(result.success);
  expect_contains(result.error, "schema file not found");
}
