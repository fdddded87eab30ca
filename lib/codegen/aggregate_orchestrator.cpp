// wirebind/codegen/aggregate_orchestrator.cpp - Schema-wide conversion planning
#include "wirebind/codegen/aggregate_orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

#include "wirebind/analysis/field_shape.hpp"
#include "wirebind/analysis/wire_shape.hpp"
#include "wirebind/strategy/strategy_resolver.hpp"
#include "wirebind/strategy/strategy_validator.hpp"

namespace wirebind
{

AggregateOrchestrator::AggregateOrchestrator(
  const SchemaDocument & document, const SideChannel * side_channel, DiagnosticBag * diags)
: document_(document), side_channel_(side_channel), diags_(diags), registry_(TypeRegistry::with_defaults())
{
  for (const auto & decl : document_.transparent_types) {
    registry_.add_transparent(decl);
  }

  // Enum directive errors are reported by plan_enum; only the wire name is needed here.
  DiagnosticBag scratch;
  DirectiveParser parser(&scratch);
  for (const auto & e : document_.enums) {
    std::string wire_name = e.name;
    if (auto ann = parser.parse_aggregate(e.directives, e.name, e.location)) {
      wire_name = ann->wire_name.value_or(e.name);
    }
    registry_.add_enum(e.name, std::move(wire_name));
  }
}

SchemaPlan AggregateOrchestrator::plan_schema()
{
  SchemaPlan plan;
  plan.origin = document_.origin;
  plan.wire_namespace = document_.wire_namespace;
  plan.includes = document_.includes;
  plan.transparent_types = document_.transparent_types;

  for (const auto & e : document_.enums) {
    if (auto p = plan_enum(e)) {
      plan.enums.push_back(std::move(*p));
    }
  }
  for (const auto & a : document_.aggregates) {
    if (auto p = plan_aggregate(a)) {
      plan.aggregates.push_back(std::move(*p));
    }
  }
  return plan;
}

// ============================================================================
// Aggregates
// ============================================================================

std::optional<FieldPlan> AggregateOrchestrator::plan_field(
  const FieldDescriptor & field, const AggregateAnnotation & inherited,
  const std::string & wire_message)
{
  DirectiveParser parser(diags_);
  auto annotation = parser.parse_field(field, inherited);
  if (!annotation) {
    return std::nullopt;
  }

  DomainFieldShape shape = classify_field_type(field.type_text, registry_);
  if (!annotation->ignore && !check_map_field(field, *annotation, shape)) {
    return std::nullopt;
  }
  std::string wire_field = annotation->rename.value_or(field.name);

  WireShapeInferrer inferrer(side_channel_, diags_);
  auto inference = inferrer.infer(field, *annotation, shape, WireFieldKey{wire_message, wire_field});
  if (!inference) {
    return std::nullopt;
  }

  ConversionStrategy strategy = StrategyResolver::resolve(*annotation, shape, inference->shape);

  FieldPlan plan{
    field,
    *annotation,
    std::move(shape),
    inference->shape,
    inference->tier,
    std::move(wire_field),
    std::move(strategy)};

  StrategyValidator validator(diags_);
  if (!validator.validate(plan)) {
    return std::nullopt;
  }
  return plan;
}

bool AggregateOrchestrator::check_map_field(
  const FieldDescriptor & field, const FieldAnnotation & annotation,
  const DomainFieldShape & shape)
{
  const std::string & type = shape.element_shape().type_text();
  const std::string template_name = type.substr(0, type.find('<'));
  if (!registry_.is_map_wrapper(template_name)) {
    return true;
  }
  if (annotation.custom_from_wire_fn && annotation.custom_to_wire_fn) {
    return true;
  }
  diags_->report_error(
      DiagnosticKind::StrategyPreconditionViolation,
      "field '" + field.name + "' has map type '" + type + "', which has no built-in conversion")
    .in_aggregate(field.aggregate)
    .on_field(field.name)
    .at(field.location)
    .with_note("protobuf map fields are not mapped to " + template_name)
    .with_help("convert it with from_wire_fn and to_wire_fn, or mark it 'ignore'");
  return false;
}

std::optional<StructConversionPlan> AggregateOrchestrator::plan_aggregate(
  const AggregateDescriptor & aggregate)
{
  const size_t errors_before = diags_->error_count();

  DirectiveParser parser(diags_);
  auto annotation = parser.parse_aggregate(aggregate.directives, aggregate.name, aggregate.location);
  if (!annotation) {
    return std::nullopt;
  }

  StructConversionPlan plan;
  plan.aggregate = aggregate.name;
  plan.wire_name = annotation->wire_name.value_or(aggregate.name);
  plan.domain_namespace = annotation->namespace_override.value_or(document_.domain_namespace);

  // Every field is analysed even after a failure so all problems surface together.
  bool ok = true;
  for (const auto & field : aggregate.fields) {
    if (auto fp = plan_field(field, *annotation, plan.wire_name)) {
      plan.fields.push_back(std::move(*fp));
    } else {
      ok = false;
    }
  }

  if (ok) {
    ok = resolve_error_type(plan);
  }
  if (!ok || diags_->error_count() > errors_before) {
    return std::nullopt;
  }
  return plan;
}

bool AggregateOrchestrator::resolve_error_type(StructConversionPlan & plan)
{
  const std::string generated = plan.aggregate + "ConversionError";

  bool ok = true;
  std::optional<std::string> effective;
  const FieldPlan * first_error_field = nullptr;

  for (const auto & field : plan.fields) {
    if (!field.strategy.is_error_moded()) {
      continue;
    }
    plan.needs_fallible_conversion = true;

    const FieldAnnotation & ann = field.annotation;
    if (ann.error_type.has_value() != ann.error_fn.has_value()) {
      const std::string message =
        ann.error_type
          ? "field '" + field.name() + "' fails with '" + *ann.error_type +
              "' but names no error_fn to construct it"
          : "field '" + field.name() + "' names error_fn '" + *ann.error_fn +
              "' but no error_type it returns";
      diags_->report_error(DiagnosticKind::MissingErrorFunction, message)
        .in_aggregate(plan.aggregate)
        .on_field(field.name())
        .at(field.descriptor.location)
        .with_help(
          ann.error_type ? "add error_fn = \"make_error\" to the field or the aggregate"
                         : "add error_type = MyError to the field or the aggregate");
      ok = false;
      continue;
    }

    std::string type = ann.error_type.value_or(generated);
    if (!effective) {
      effective = std::move(type);
      first_error_field = &field;
    } else if (*effective != type) {
      diags_
        ->report_error(
          DiagnosticKind::ConflictingErrorType,
          "field '" + field.name() + "' fails with '" + type + "' but field '" +
            first_error_field->name() + "' fails with '" + *effective + "'")
        .in_aggregate(plan.aggregate)
        .on_field(field.name())
        .at(field.descriptor.location)
        .with_note("a wire->domain conversion returns a single error type")
        .with_help("set error_type and error_fn once on the aggregate");
      ok = false;
    }
  }

  if (ok && effective) {
    plan.error_type = effective;
    if (*effective == generated) {
      plan.generated_error_type_name = generated;
    }
  }
  return ok;
}

// ============================================================================
// Enumerations
// ============================================================================

std::string screaming_snake_case(std::string_view name)
{
  std::string out;
  out.reserve(name.size() + 4);
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto c = static_cast<unsigned char>(name[i]);
    if (std::isupper(c) != 0 && i > 0) {
      const auto prev = static_cast<unsigned char>(name[i - 1]);
      const bool next_lower =
        i + 1 < name.size() && std::islower(static_cast<unsigned char>(name[i + 1])) != 0;
      if (std::islower(prev) != 0 || std::isdigit(prev) != 0 || (std::isupper(prev) != 0 && next_lower)) {
        out += '_';
      }
    }
    out += static_cast<char>(std::toupper(c));
  }
  return out;
}

std::optional<std::string> match_wire_variant(
  const std::string & variant, const std::string & wire_enum,
  gsl::span<const std::string> wire_variants)
{
  const std::string snake = screaming_snake_case(variant);
  const std::string candidates[] = {variant, snake, screaming_snake_case(wire_enum) + "_" + snake};

  for (const auto & candidate : candidates) {
    const auto it = std::find(wire_variants.begin(), wire_variants.end(), candidate);
    if (it != wire_variants.end()) {
      return *it;
    }
  }
  return std::nullopt;
}

std::optional<EnumConversionPlan> AggregateOrchestrator::plan_enum(const EnumDescriptor & descriptor)
{
  DirectiveParser parser(diags_);
  auto annotation = parser.parse_aggregate(descriptor.directives, descriptor.name, descriptor.location);
  if (!annotation) {
    return std::nullopt;
  }

  EnumConversionPlan plan;
  plan.name = descriptor.name;
  plan.wire_name = annotation->wire_name.value_or(descriptor.name);
  plan.domain_namespace = annotation->namespace_override.value_or(document_.domain_namespace);

  std::vector<std::string> wire_variants = descriptor.wire_variants;
  if (wire_variants.empty()) {
    for (const auto & v : descriptor.variants) {
      wire_variants.push_back(v.name);
    }
  }

  bool ok = true;
  std::map<std::string, std::string> claimed;  // wire value -> domain variant
  for (const auto & variant : descriptor.variants) {
    auto wire = match_wire_variant(variant.name, plan.wire_name, wire_variants);
    if (!wire) {
      std::string available;
      for (const auto & w : wire_variants) {
        available += available.empty() ? w : ", " + w;
      }
      diags_
        ->report_error(
          DiagnosticKind::UnmatchedVariant,
          "variant '" + variant.name + "' of '" + descriptor.name + "' has no counterpart in wire enum '" +
            plan.wire_name + "'")
        .in_aggregate(descriptor.name)
        .on_field(variant.name)
        .at(variant.location)
        .with_note("wire values: " + available)
        .with_help(
          "name the wire value " + screaming_snake_case(plan.wire_name) + "_" +
          screaming_snake_case(variant.name) + " or list it in wire_variants");
      ok = false;
      continue;
    }

    const auto [it, inserted] = claimed.emplace(*wire, variant.name);
    if (!inserted) {
      diags_
        ->report_error(
          DiagnosticKind::UnmatchedVariant,
          "variants '" + it->second + "' and '" + variant.name + "' both map to wire value '" +
            *wire + "'")
        .in_aggregate(descriptor.name)
        .on_field(variant.name)
        .at(variant.location)
        .with_help("rename one of the variants");
      ok = false;
      continue;
    }
    plan.variants.push_back(VariantMapping{variant.name, *wire});
  }

  if (!ok) {
    return std::nullopt;
  }
  return plan;
}

}  // namespace wirebind
