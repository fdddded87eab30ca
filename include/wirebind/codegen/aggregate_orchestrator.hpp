// wirebind/codegen/aggregate_orchestrator.hpp - Schema-wide conversion planning
//
// Runs the per-field pipeline (directives, shape, wire inference, strategy,
// validation) for every aggregate of a schema and matches enum variants.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gsl/span>

#include "wirebind/analysis/directive.hpp"
#include "wirebind/analysis/side_channel.hpp"
#include "wirebind/analysis/type_registry.hpp"
#include "wirebind/basic/diagnostic.hpp"
#include "wirebind/schema/schema_document.hpp"
#include "wirebind/strategy/conversion_plan.hpp"

namespace wirebind
{

// ============================================================================
// Plans
// ============================================================================

struct VariantMapping
{
  std::string domain_name;
  std::string wire_name;
};

/**
 * Bidirectional mapping of one tagged enumeration.
 */
struct EnumConversionPlan
{
  std::string name;
  std::string wire_name;
  std::string domain_namespace;
  std::vector<VariantMapping> variants;
};

/**
 * Every plan of one schema file that analysed without errors.
 */
struct SchemaPlan
{
  std::string origin;
  std::string wire_namespace;
  std::vector<std::string> includes;
  std::vector<TransparentDecl> transparent_types;
  std::vector<EnumConversionPlan> enums;
  std::vector<StructConversionPlan> aggregates;
};

// ============================================================================
// Orchestrator
// ============================================================================

/**
 * Plans the conversions of one schema document.
 *
 * An aggregate or enum with any error diagnostic yields no plan; analysis
 * continues with the next declaration so all problems are reported at once.
 */
class AggregateOrchestrator
{
public:
  /**
   * @param document Schema being planned; must outlive the orchestrator
   * @param side_channel Optional optionality lookup (may be nullptr)
   * @param diags Receives all diagnostics
   */
  AggregateOrchestrator(
    const SchemaDocument & document, const SideChannel * side_channel, DiagnosticBag * diags);

  /// Plan every enum and aggregate in declaration order.
  [[nodiscard]] SchemaPlan plan_schema();

  [[nodiscard]] std::optional<StructConversionPlan> plan_aggregate(
    const AggregateDescriptor & aggregate);

  [[nodiscard]] std::optional<EnumConversionPlan> plan_enum(const EnumDescriptor & descriptor);

  [[nodiscard]] const TypeRegistry & registry() const noexcept { return registry_; }

private:
  [[nodiscard]] std::optional<FieldPlan> plan_field(
    const FieldDescriptor & field, const AggregateAnnotation & inherited,
    const std::string & wire_message);

  /// Map typed fields and map elements need both custom functions (StrategyPreconditionViolation).
  bool check_map_field(
    const FieldDescriptor & field, const FieldAnnotation & annotation,
    const DomainFieldShape & shape);

  /// Fallibility and error type of an aggregate (ConflictingErrorType, MissingErrorFunction).
  bool resolve_error_type(StructConversionPlan & plan);

  const SchemaDocument & document_;
  const SideChannel * side_channel_;
  DiagnosticBag * diags_;
  TypeRegistry registry_;
};

/**
 * Upper-case snake form used by protoc enum values: "DarkRed" -> "DARK_RED".
 */
[[nodiscard]] std::string screaming_snake_case(std::string_view name);

/**
 * Find the wire value a domain variant maps to.
 *
 * Accepted spellings, in order: the variant name itself, its
 * SCREAMING_SNAKE form, and that form prefixed by the SCREAMING_SNAKE wire
 * enum name ("COLOR_DARK_RED").
 */
[[nodiscard]] std::optional<std::string> match_wire_variant(
  const std::string & variant, const std::string & wire_enum,
  gsl::span<const std::string> wire_variants);

}  // namespace wirebind
