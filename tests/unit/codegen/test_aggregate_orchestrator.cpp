// tests/unit/codegen/test_aggregate_orchestrator.cpp - Unit tests for schema-wide planning
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "wirebind/analysis/side_channel.hpp"
#include "wirebind/codegen/aggregate_orchestrator.hpp"
#include "wirebind/schema/schema_loader.hpp"

using namespace wirebind;

namespace
{

struct Planned
{
  SchemaPlan plan;
  DiagnosticBag diags;
};

Planned plan(const std::string & yaml, const SideChannel * side_channel = nullptr)
{
  Planned out;
  auto loaded = load_schema_string(yaml, "test.wb.yaml");
  EXPECT_TRUE(loaded.success) << loaded.error;
  AggregateOrchestrator orchestrator(loaded.document, side_channel, &out.diags);
  out.plan = orchestrator.plan_schema();
  return out;
}

const StructConversionPlan * find_aggregate(const SchemaPlan & plan, const std::string & name)
{
  for (const auto & a : plan.aggregates) {
    if (a.aggregate == name) return &a;
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Aggregates
// ============================================================================

TEST(AggregateOrchestratorTest, PlansFieldsInDeclarationOrder)
{
  auto r = plan(R"(
namespace: library
wire_namespace: library::pb
aggregates:
  - name: Book
    fields:
      - { name: title, type: std::string }
      - { name: subtitle, type: std::optional<std::string> }
      - { name: tags, type: std::vector<std::string> }
      - { name: display, type: std::string, directives: [rename = "DisplayName"] }
)");
  EXPECT_FALSE(r.diags.has_errors());
  ASSERT_EQ(r.plan.aggregates.size(), 1U);
  const auto & book = r.plan.aggregates[0];
  EXPECT_EQ(book.domain_namespace, "library");
  EXPECT_EQ(book.wire_name, "Book");
  ASSERT_EQ(book.fields.size(), 4U);
  EXPECT_EQ(book.fields[0].strategy.describe(), "Direct.Assignment");
  EXPECT_EQ(book.fields[1].strategy.describe(), "Option.Map");
  EXPECT_EQ(book.fields[2].strategy.describe(), "Collection.DirectAssignment");
  EXPECT_EQ(book.fields[3].wire_field_name, "DisplayName");
  EXPECT_FALSE(book.needs_fallible_conversion);
  EXPECT_FALSE(book.error_type.has_value());
}

TEST(AggregateOrchestratorTest, AggregateDirectivesOverrideNames)
{
  auto r = plan(R"(
namespace: library
aggregates:
  - name: Loan
    directives: [wire_name = "LoanRecord", namespace = "library::lending"]
    fields:
      - { name: borrower, type: std::string }
)");
  ASSERT_EQ(r.plan.aggregates.size(), 1U);
  EXPECT_EQ(r.plan.aggregates[0].wire_name, "LoanRecord");
  EXPECT_EQ(r.plan.aggregates[0].domain_namespace, "library::lending");
}

TEST(AggregateOrchestratorTest, SideChannelIsKeyedByWireNames)
{
  TableSideChannel table;
  table.set("LoanRecord", "borrower_name", true);

  auto r = plan(
    R"(
aggregates:
  - name: Loan
    directives: [wire_name = "LoanRecord"]
    fields:
      - { name: borrower, type: std::string, directives: [rename = "borrower_name"] }
)",
    &table);
  ASSERT_EQ(r.plan.aggregates.size(), 1U);
  const auto & field = r.plan.aggregates[0].fields[0];
  EXPECT_EQ(field.tier, InferenceTier::SideChannel);
  EXPECT_EQ(field.strategy.describe(), "Option.Unwrap(Panic)");
}

TEST(AggregateOrchestratorTest, ErrorModedFieldMakesConversionFallible)
{
  auto r = plan(R"(
aggregates:
  - name: Book
    fields:
      - { name: isbn, type: std::string, directives: [expect(error)] }
      - { name: title, type: std::string }
)");
  ASSERT_EQ(r.plan.aggregates.size(), 1U);
  const auto & book = r.plan.aggregates[0];
  EXPECT_TRUE(book.needs_fallible_conversion);
  EXPECT_EQ(book.error_type, "BookConversionError");
  EXPECT_EQ(book.generated_error_type_name, "BookConversionError");
}

TEST(AggregateOrchestratorTest, UserErrorTypeFromAggregate)
{
  auto r = plan(R"(
aggregates:
  - name: Loan
    directives: [error_type = LoanError, error_fn = "make_loan_error"]
    fields:
      - { name: borrower, type: std::string, directives: [expect(error)] }
      - { name: due, type: int64_t, directives: [expect] }
)");
  EXPECT_FALSE(r.diags.has_errors());
  ASSERT_EQ(r.plan.aggregates.size(), 1U);
  const auto & loan = r.plan.aggregates[0];
  EXPECT_TRUE(loan.needs_fallible_conversion);
  EXPECT_EQ(loan.error_type, "LoanError");
  EXPECT_FALSE(loan.generated_error_type_name.has_value());
}

TEST(AggregateOrchestratorTest, ConflictingErrorTypes)
{
  auto r = plan(R"(
aggregates:
  - name: Loan
    fields:
      - name: borrower
        type: std::string
        directives: [expect(error), error_type = LoanError, error_fn = "make_loan_error"]
      - { name: due, type: int64_t, directives: [expect(error)] }
)");
  EXPECT_TRUE(r.plan.aggregates.empty());
  ASSERT_TRUE(r.diags.contains(DiagnosticKind::ConflictingErrorType));
  const auto errors = r.diags.errors();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].field, "due");
  EXPECT_EQ(errors[0].code(), "E0107");
  EXPECT_FALSE(errors[0].notes.empty());
}

TEST(AggregateOrchestratorTest, ErrorTypeWithoutFunction)
{
  auto r = plan(R"(
aggregates:
  - name: Loan
    fields:
      - { name: borrower, type: std::string, directives: [expect(error), error_type = LoanError] }
)");
  EXPECT_TRUE(r.plan.aggregates.empty());
  EXPECT_TRUE(r.diags.contains(DiagnosticKind::MissingErrorFunction));
}

TEST(AggregateOrchestratorTest, ErrorSettingsWithoutErrorModeAreInert)
{
  auto r = plan(R"(
aggregates:
  - name: Loan
    directives: [error_type = LoanError]
    fields:
      - { name: borrower, type: std::string }
)");
  EXPECT_FALSE(r.diags.has_errors());
  ASSERT_EQ(r.plan.aggregates.size(), 1U);
  EXPECT_FALSE(r.plan.aggregates[0].needs_fallible_conversion);
}

TEST(AggregateOrchestratorTest, FailingAggregateDoesNotHideOthers)
{
  auto r = plan(R"(
aggregates:
  - name: Broken
    fields:
      - { name: a, type: other::Thing }
      - { name: b, type: std::string, directives: [optional, required] }
  - name: Fine
    fields:
      - { name: c, type: int32_t }
)");
  EXPECT_EQ(r.diags.error_count(), 2U);
  EXPECT_TRUE(r.diags.contains(DiagnosticKind::AmbiguousOptionality));
  EXPECT_TRUE(r.diags.contains(DiagnosticKind::ConflictingAnnotation));
  ASSERT_EQ(r.plan.aggregates.size(), 1U);
  EXPECT_EQ(r.plan.aggregates[0].aggregate, "Fine");
}

TEST(AggregateOrchestratorTest, InferredAggregateWarnsButPlans)
{
  auto r = plan(R"(
aggregates:
  - name: Book
    fields:
      - { name: author, type: Author }
)");
  EXPECT_FALSE(r.diags.has_errors());
  EXPECT_TRUE(r.diags.has_warnings());
  ASSERT_NE(find_aggregate(r.plan, "Book"), nullptr);
}

TEST(AggregateOrchestratorTest, MapFieldsNeedConversionFunctions)
{
  auto r = plan(R"(
aggregates:
  - name: Catalog
    fields:
      - { name: counts, type: "std::map<std::string, int32_t>" }
      - { name: shelves, type: "std::vector<std::unordered_map<std::string, Shelf>>" }
      - { name: cache, type: "std::map<int64_t, int64_t>", directives: [ignore] }
)");
  EXPECT_TRUE(r.plan.aggregates.empty());
  const auto errors = r.diags.errors();
  ASSERT_EQ(errors.size(), 2U);
  EXPECT_EQ(errors[0].kind, DiagnosticKind::StrategyPreconditionViolation);
  EXPECT_EQ(errors[0].field, "counts");
  EXPECT_NE(errors[0].message.find("no built-in conversion"), std::string::npos);
  EXPECT_EQ(errors[1].field, "shelves");

  auto converted = plan(R"(
aggregates:
  - name: Catalog
    fields:
      - name: counts
        type: "std::map<std::string, int32_t>"
        directives: [from_wire_fn = "counts_from_wire", to_wire_fn = "counts_to_wire"]
)");
  EXPECT_FALSE(converted.diags.has_errors());
  ASSERT_EQ(converted.plan.aggregates.size(), 1U);
  EXPECT_EQ(
    converted.plan.aggregates[0].fields[0].strategy.describe(),
    "Custom(from=counts_from_wire, to=counts_to_wire)");
}

TEST(AggregateOrchestratorTest, CustomFieldWithExpectErrorIsFallible)
{
  auto r = plan(R"(
aggregates:
  - name: Meter
    fields:
      - { name: count, type: int64_t, directives: [from_wire_fn = "parse", default = "dflt"] }
      - { name: code, type: int64_t, directives: [from_wire_fn = "parse", expect(error)] }
)");
  EXPECT_FALSE(r.diags.has_errors());
  ASSERT_EQ(r.plan.aggregates.size(), 1U);
  const auto & meter = r.plan.aggregates[0];
  EXPECT_TRUE(meter.needs_fallible_conversion);
  EXPECT_EQ(meter.error_type, "MeterConversionError");
  EXPECT_EQ(meter.fields[0].strategy.describe(), "Custom(from=parse, to=-, Default(dflt))");
  EXPECT_EQ(meter.fields[1].strategy.describe(), "Custom(from=parse, to=-, Error)");
}

TEST(AggregateOrchestratorTest, TransparentFieldNeedsDeclaration)
{
  auto r = plan(R"(
aggregates:
  - name: T
    fields:
      - { name: id, type: TrackId, directives: [transparent] }
)");
  EXPECT_TRUE(r.plan.aggregates.empty());
  ASSERT_TRUE(r.diags.contains(DiagnosticKind::StrategyPreconditionViolation));
  const auto errors = r.diags.errors();
  ASSERT_TRUE(errors[0].help_message.has_value());
  EXPECT_EQ(*errors[0].help_message, "declare `TrackId` under `transparent:`");
}

TEST(AggregateOrchestratorTest, RegistryKnowsSchemaTypes)
{
  auto loaded = load_schema_string(R"(
transparent:
  - { name: BookId, inner: uint64_t }
enums:
  - { name: Genre, variants: [Fiction], directives: [wire_name = "BookGenre"] }
)");
  ASSERT_TRUE(loaded.success);
  DiagnosticBag diags;
  AggregateOrchestrator orchestrator(loaded.document, nullptr, &diags);
  EXPECT_TRUE(orchestrator.registry().is_enum("Genre"));
  EXPECT_EQ(orchestrator.registry().enum_wire_name("Genre"), "BookGenre");
  EXPECT_NE(orchestrator.registry().find_transparent("BookId"), nullptr);
}

// ============================================================================
// Enumerations
// ============================================================================

TEST(AggregateOrchestratorTest, EnumVariantsMatchProtocNames)
{
  auto r = plan(R"(
enums:
  - name: Genre
    variants: [Fiction, NonFiction, Poetry]
    wire_variants: [GENRE_UNSPECIFIED, GENRE_FICTION, NON_FICTION, Poetry]
)");
  EXPECT_FALSE(r.diags.has_errors());
  ASSERT_EQ(r.plan.enums.size(), 1U);
  const auto & variants = r.plan.enums[0].variants;
  ASSERT_EQ(variants.size(), 3U);
  EXPECT_EQ(variants[0].wire_name, "GENRE_FICTION");
  EXPECT_EQ(variants[1].wire_name, "NON_FICTION");
  EXPECT_EQ(variants[2].wire_name, "Poetry");
}

TEST(AggregateOrchestratorTest, EnumWithoutWireVariantsMapsByName)
{
  auto r = plan("enums:\n  - { name: Color, variants: [Red, Green] }\n");
  ASSERT_EQ(r.plan.enums.size(), 1U);
  EXPECT_EQ(r.plan.enums[0].variants[1].wire_name, "Green");
}

TEST(AggregateOrchestratorTest, UnmatchedVariant)
{
  auto r = plan(R"(
enums:
  - name: Genre
    variants: [Fiction, Drama]
    wire_variants: [GENRE_FICTION]
)");
  EXPECT_TRUE(r.plan.enums.empty());
  const auto errors = r.diags.errors();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].kind, DiagnosticKind::UnmatchedVariant);
  EXPECT_EQ(errors[0].field, "Drama");
  ASSERT_TRUE(errors[0].help_message.has_value());
  EXPECT_NE(errors[0].help_message->find("GENRE_DRAMA"), std::string::npos);
}

TEST(AggregateOrchestratorTest, TwoVariantsOnOneWireValue)
{
  auto r = plan(R"(
enums:
  - name: Mode
    variants: [Fast, FAST]
    wire_variants: [FAST]
)");
  EXPECT_TRUE(r.plan.enums.empty());
  EXPECT_TRUE(r.diags.contains(DiagnosticKind::UnmatchedVariant));
}

TEST(AggregateOrchestratorTest, ScreamingSnakeCase)
{
  EXPECT_EQ(screaming_snake_case("DarkRed"), "DARK_RED");
  EXPECT_EQ(screaming_snake_case("HTTPServer"), "HTTP_SERVER");
  EXPECT_EQ(screaming_snake_case("Level2Cache"), "LEVEL2_CACHE");
  EXPECT_EQ(screaming_snake_case("red"), "RED");

  const std::vector<std::string> wire = {"COLOR_DARK_RED", "BLUE"};
  EXPECT_EQ(match_wire_variant("DarkRed", "Color", wire), "COLOR_DARK_RED");
  EXPECT_EQ(match_wire_variant("Blue", "Color", wire), "BLUE");
  EXPECT_FALSE(match_wire_variant("Green", "Color", wire).has_value());
}
