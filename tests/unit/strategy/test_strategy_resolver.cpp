// tests/unit/strategy/test_strategy_resolver.cpp - Unit tests for strategy selection
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "wirebind/analysis/directive.hpp"
#include "wirebind/analysis/field_shape.hpp"
#include "wirebind/analysis/wire_shape.hpp"
#include "wirebind/strategy/conversion_strategy.hpp"
#include "wirebind/strategy/strategy_resolver.hpp"

using namespace wirebind;

namespace
{

TypeRegistry registry()
{
  TypeRegistry r = TypeRegistry::with_defaults();
  r.add_enum("Genre", "Genre");
  r.add_transparent(TransparentDecl{"TrackId", "uint64_t", "value", {}});
  return r;
}

/// Runs directives, classification and inference, then resolves.
std::optional<ConversionStrategy> strategy_for(
  const std::string & type, const std::vector<std::string> & directives, DiagnosticBag & diags)
{
  FieldDescriptor field;
  field.name = "f";
  field.aggregate = "Track";
  field.type_text = type;
  field.directives = directives;

  DirectiveParser parser(&diags);
  auto ann = parser.parse_field(field, {});
  if (!ann) {
    return std::nullopt;
  }
  const auto shape = classify_field_type(type, registry());
  WireShapeInferrer inferrer(nullptr, &diags);
  auto inferred = inferrer.infer(field, *ann, shape, WireFieldKey{"Track", "f"});
  if (!inferred) {
    return std::nullopt;
  }
  return StrategyResolver::resolve(*ann, shape, inferred->shape);
}

std::string describe(const std::string & type, const std::vector<std::string> & directives)
{
  DiagnosticBag diags;
  auto s = strategy_for(type, directives, diags);
  return s ? s->describe() : "<none>";
}

WireFieldShape wire(WireMapping m, Optionality o) { return WireFieldShape::make(m, o); }

}  // namespace

// ============================================================================
// End-to-end scenarios
// ============================================================================

TEST(StrategyResolverTest, NullableTextWithoutDirectivesMaps)
{
  EXPECT_EQ(describe("std::optional<std::string>", {}), "Option.Map");
}

TEST(StrategyResolverTest, DefaultFunctionUnwraps)
{
  EXPECT_EQ(
    describe("uint32_t", {"default = \"default_count\""}), "Option.Unwrap(Default(default_count))");
}

TEST(StrategyResolverTest, TransparentOnRequiredWire)
{
  EXPECT_EQ(describe("TrackId", {"transparent"}), "Transparent(None)");
}

TEST(StrategyResolverTest, ExpectedSequenceCollectsWithError)
{
  EXPECT_EQ(describe("std::vector<std::string>", {"expect"}), "Collection.Collect(Error)");
}

TEST(StrategyResolverTest, ConflictStopsBeforeResolution)
{
  DiagnosticBag diags;
  EXPECT_FALSE(strategy_for("std::string", {"optional", "required"}, diags).has_value());
  EXPECT_TRUE(diags.contains(DiagnosticKind::ConflictingAnnotation));
}

// ============================================================================
// Priority order
// ============================================================================

TEST(StrategyResolverTest, IgnoreWinsOverEverything)
{
  EXPECT_EQ(
    describe("std::vector<int32_t>", {"ignore", "transparent", "from_wire_fn = parse"}), "Ignore");
  EXPECT_EQ(describe("Cache", {"ignore", "default = \"fresh_cache\""}), "Ignore(Default(fresh_cache))");
}

TEST(StrategyResolverTest, CustomWinsOverTransparentAndCollections)
{
  EXPECT_EQ(
    describe("std::vector<Date>", {"from_wire_fn = parse_dates", "transparent"}),
    "Custom(from=parse_dates, to=-)");
  EXPECT_EQ(
    describe("Date", {"required", "to_wire_fn = format_date"}), "Custom(from=-, to=format_date)");
}

TEST(StrategyResolverTest, CustomKeepsAbsenceDirectives)
{
  EXPECT_EQ(
    describe("int64_t", {"from_wire_fn = parse", "default = \"dflt\""}),
    "Custom(from=parse, to=-, Default(dflt))");
  EXPECT_EQ(
    describe("int64_t", {"from_wire_fn = parse", "expect(error)"}), "Custom(from=parse, to=-, Error)");

  DiagnosticBag diags;
  const auto fallible = strategy_for("int64_t", {"from_wire_fn = parse", "expect(error)"}, diags);
  ASSERT_TRUE(fallible.has_value());
  EXPECT_TRUE(fallible->is_error_moded());
}

TEST(StrategyResolverTest, TransparentWinsOverDefault)
{
  EXPECT_EQ(
    describe("TrackId", {"transparent", "default = \"no_track\""}),
    "Transparent(Default(no_track))");
  EXPECT_EQ(describe("TrackId", {"transparent", "expect(panic)"}), "Transparent(Panic)");
  EXPECT_EQ(describe("std::optional<TrackId>", {"transparent"}), "Transparent(None)");
}

TEST(StrategyResolverTest, CollectionVariants)
{
  EXPECT_EQ(describe("std::vector<std::string>", {}), "Collection.DirectAssignment");
  EXPECT_EQ(describe("std::vector<Genre>", {}), "Collection.Collect(None)");
  EXPECT_EQ(describe("std::vector<Book>", {}), "Collection.Collect(None)");
  EXPECT_EQ(describe("std::vector<int32_t>", {"expect(panic)"}), "Collection.Collect(Panic)");
  EXPECT_EQ(describe("std::optional<std::vector<Book>>", {}), "Collection.MapOption");
}

TEST(StrategyResolverTest, DirectAssignmentVersusConversion)
{
  EXPECT_EQ(describe("int64_t", {}), "Direct.Assignment");
  EXPECT_EQ(describe("Genre", {}), "Direct.WithConversion");
  EXPECT_EQ(describe("Author", {"required"}), "Direct.WithConversion");
}

TEST(StrategyResolverTest, OptionalWireIntoPlainDomainPanicsByDefault)
{
  EXPECT_EQ(describe("std::string", {"optional"}), "Option.Unwrap(Panic)");
  EXPECT_EQ(describe("std::string", {"expect(error)"}), "Option.Unwrap(Error)");
  EXPECT_EQ(describe("Author", {}), "Option.Unwrap(Panic)");
}

TEST(StrategyResolverTest, NullableDomainOverRequiredWireWraps)
{
  EXPECT_EQ(describe("std::optional<int32_t>", {"required"}), "Option.Wrap");
}

TEST(StrategyResolverTest, ExpectOnNullableDomainUnwraps)
{
  EXPECT_EQ(describe("std::optional<std::string>", {"expect(panic)"}), "Option.Unwrap(Panic)");
}

// ============================================================================
// Decision table
// ============================================================================

TEST(StrategyResolverTest, TotalOverShapeMatrix)
{
  const auto reg = registry();
  const std::vector<std::string> types = {
    "int32_t",          "std::optional<int32_t>", "std::vector<int32_t>",
    "Genre",            "TrackId",                "Author",
    "std::optional<Author>", "std::optional<std::vector<Author>>"};
  const std::vector<WireFieldShape> wires = {
    wire(WireMapping::Scalar, Optionality::Required),
    wire(WireMapping::Optional, Optionality::Optional),
    wire(WireMapping::Repeated, Optionality::Required),
    wire(WireMapping::Message, Optionality::Optional),
    wire(WireMapping::Message, Optionality::Required)};
  const std::vector<FieldAnnotation> annotations = [] {
    std::vector<FieldAnnotation> out(4);
    out[1].expect_mode = ExpectMode::Error;
    out[2].default_value = DefaultValue{};
    out[3].transparent = true;
    return out;
  }();

  for (const auto & t : types) {
    const auto shape = classify_field_type(t, reg);
    for (const auto & w : wires) {
      for (const auto & ann : annotations) {
        const auto first = StrategyResolver::resolve(ann, shape, w);
        const auto second = StrategyResolver::resolve(ann, shape, w);
        EXPECT_EQ(first, second) << t << " / " << w.describe();
        EXPECT_FALSE(first.describe().empty());
      }
    }
  }
}

TEST(StrategyResolverTest, DefaultOverridesMatrix)
{
  FieldAnnotation ann;
  ann.default_value = DefaultValue{std::string("zero")};
  const auto shape = classify_field_type("std::optional<int32_t>", registry());

  const auto s = StrategyResolver::resolve(ann, shape, wire(WireMapping::Optional, Optionality::Optional));
  EXPECT_EQ(s, ConversionStrategy::option_unwrap(ErrorMode::with_default(std::string("zero"))));
}

TEST(StrategyResolverTest, TransparentErrorMode)
{
  const auto plain = classify_field_type("TrackId", registry());
  const auto nullable = classify_field_type("std::optional<TrackId>", registry());
  const auto optional_wire = wire(WireMapping::Optional, Optionality::Optional);
  const auto required_wire = wire(WireMapping::Scalar, Optionality::Required);

  FieldAnnotation ann;
  ann.transparent = true;
  EXPECT_EQ(StrategyResolver::transparent_error_mode(ann, plain, required_wire), ErrorMode::none());
  EXPECT_EQ(StrategyResolver::transparent_error_mode(ann, plain, optional_wire), ErrorMode::panic());
  EXPECT_EQ(StrategyResolver::transparent_error_mode(ann, nullable, optional_wire), ErrorMode::none());

  ann.expect_mode = ExpectMode::Error;
  EXPECT_EQ(StrategyResolver::transparent_error_mode(ann, nullable, optional_wire), ErrorMode::error());
}

TEST(StrategyResolverTest, CollectionErrorModePrefersExpect)
{
  FieldAnnotation ann;
  EXPECT_EQ(StrategyResolver::collection_error_mode(ann), ErrorMode::none());
  ann.default_value = DefaultValue{std::string("seed_tags")};
  EXPECT_EQ(
    StrategyResolver::collection_error_mode(ann), ErrorMode::with_default(std::string("seed_tags")));
  ann.expect_mode = ExpectMode::Panic;
  EXPECT_EQ(StrategyResolver::collection_error_mode(ann), ErrorMode::panic());
}

TEST(ConversionStrategyTest, DescribeAndEquality)
{
  EXPECT_EQ(ConversionStrategy::ignore().describe(), "Ignore");
  EXPECT_EQ(ConversionStrategy::option_wrap().describe(), "Option.Wrap");
  EXPECT_EQ(ConversionStrategy::collect(ErrorMode::with_default(std::nullopt)).describe(),
            "Collection.Collect(Default)");
  EXPECT_EQ(ConversionStrategy::custom(std::string("a"), std::string("b")).describe(),
            "Custom(from=a, to=b)");
  EXPECT_EQ(ConversionStrategy::custom(std::string("a"), std::nullopt, ErrorMode::panic()).describe(),
            "Custom(from=a, to=-, Panic)");

  EXPECT_EQ(ConversionStrategy::transparent(ErrorMode::panic()),
            ConversionStrategy::transparent(ErrorMode::panic()));
  EXPECT_NE(ConversionStrategy::transparent(ErrorMode::panic()),
            ConversionStrategy::transparent(ErrorMode::error()));
  EXPECT_NE(ConversionStrategy::option_map(), ConversionStrategy::option_wrap());

  EXPECT_TRUE(ConversionStrategy::option_unwrap(ErrorMode::error()).is_error_moded());
  EXPECT_TRUE(ConversionStrategy::option_unwrap(ErrorMode::error()).is(OptionVariant::Unwrap));
  EXPECT_FALSE(ConversionStrategy::option_map().is(CollectionVariant::Collect));
}
