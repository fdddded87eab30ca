// wirebind/strategy/strategy_validator.cpp - Structural preconditions of strategies
#include "wirebind/strategy/strategy_validator.hpp"

namespace wirebind
{

namespace
{

bool is_blank(const std::string & s) { return s.find_first_not_of(" \t") == std::string::npos; }

}  // namespace

StrategyValidator::StrategyValidator(DiagnosticBag * diags) : diags_(diags) {}

bool StrategyValidator::violation(
  const FieldPlan & field, const std::string & reason, const std::string & fix)
{
  if (diags_ != nullptr) {
    diags_
      ->report_error(
        DiagnosticKind::StrategyPreconditionViolation,
        "strategy " + field.strategy.describe() + " cannot apply to field '" + field.name() +
          "': " + reason)
      .in_aggregate(field.descriptor.aggregate)
      .on_field(field.name())
      .at(field.descriptor.location)
      .with_note(
        "domain " + field.domain_shape.describe() + ", wire " + field.wire_shape.describe())
      .with_help(fix);
  }
  return false;
}

bool StrategyValidator::empty_function(const FieldPlan & field, const std::string & which)
{
  if (diags_ != nullptr) {
    diags_
      ->report_error(
        DiagnosticKind::EmptyCustomFunctionReference,
        "empty function name in '" + which + "' of field '" + field.name() + "'")
      .in_aggregate(field.descriptor.aggregate)
      .on_field(field.name())
      .at(field.descriptor.location)
      .with_help("name the function, e.g. " + which + " = \"my_function\"");
  }
  return false;
}

bool StrategyValidator::validate(const FieldPlan & field)
{
  const ConversionStrategy & s = field.strategy;
  const DomainFieldShape & domain = field.domain_shape;
  const WireFieldShape & wire = field.wire_shape;
  const FieldAnnotation & ann = field.annotation;

  bool ok = true;

  if (s.error_mode().kind() == ErrorMode::Kind::Default) {
    const auto & fn = s.error_mode().default_fn();
    if (fn && is_blank(*fn)) {
      ok = empty_function(field, "default") && ok;
    }
  }
  if (s.is_error_moded() && ann.error_fn && is_blank(*ann.error_fn)) {
    ok = empty_function(field, "error_fn") && ok;
  }

  const bool sequence_domain = domain.value_shape().is_sequence();

  switch (s.kind()) {
    case StrategyKind::Ignore:
      if (!ann.ignore) {
        ok = violation(field, "the field is not marked 'ignore'", "add the 'ignore' directive");
      }
      break;

    case StrategyKind::Custom:
      if (!s.custom_from_wire_fn() && !s.custom_to_wire_fn()) {
        ok = violation(
          field, "no conversion function is named", "set from_wire_fn and/or to_wire_fn");
      }
      if (s.custom_from_wire_fn() && is_blank(*s.custom_from_wire_fn())) {
        ok = empty_function(field, "from_wire_fn") && ok;
      }
      if (s.custom_to_wire_fn() && is_blank(*s.custom_to_wire_fn())) {
        ok = empty_function(field, "to_wire_fn") && ok;
      }
      if (
        !wire.is_optional() && (s.error_mode().kind() == ErrorMode::Kind::Panic ||
                                s.error_mode().kind() == ErrorMode::Kind::Error)) {
        ok = violation(
          field, "the wire field is never absent, there is nothing to expect",
          "remove 'expect' or mark the field 'optional'");
      }
      break;

    case StrategyKind::Direct:
      if (wire.is_optional() || wire.is_repeated() || domain.is_nullable()) {
        ok = violation(
          field, "direct conversion needs a required wire value and a non-nullable domain type",
          "mark the field 'required', or wrap the domain type in std::optional");
      }
      break;

    case StrategyKind::Option:
      switch (s.option_variant()) {
        case OptionVariant::Unwrap:
          if (!wire.is_optional() && s.error_mode().kind() != ErrorMode::Kind::Default) {
            ok = violation(
              field, "the wire field is never absent, there is nothing to unwrap",
              "remove 'expect' or mark the field 'optional'");
          }
          break;
        case OptionVariant::Map:
          if (!wire.is_optional() || !domain.is_nullable()) {
            ok = violation(
              field, "mapping needs an optional wire field and a nullable domain type",
              "mark the field 'optional' and declare it as std::optional<...>");
          }
          break;
        case OptionVariant::Wrap:
          if (!domain.is_nullable() || wire.is_optional()) {
            ok = violation(
              field, "wrapping needs a nullable domain type and a required wire field",
              "declare the field as std::optional<...> or mark it 'optional'");
          }
          break;
      }
      break;

    case StrategyKind::Transparent:
      if (!ann.transparent) {
        ok = violation(
          field, "the field is not marked 'transparent'", "add the 'transparent' directive");
      }
      if (domain.value_shape().kind() != DomainShapeKind::TransparentWrapper) {
        const std::string & type = domain.value_shape().type_text();
        ok = violation(
          field, "'" + type + "' is not a declared transparent wrapper",
          "declare `" + type + "` under `transparent:`");
      }
      break;

    case StrategyKind::Collection:
      if (!sequence_domain && !wire.is_repeated()) {
        ok = violation(
          field, "neither the domain type is a sequence nor the wire field repeated",
          "declare the field as std::vector<...>");
        break;
      }
      if (s.collection_variant() == CollectionVariant::MapOption && !domain.is_nullable_sequence()) {
        ok = violation(
          field, "MapOption needs a std::optional<std::vector<...>> domain type",
          "declare the field as std::optional<std::vector<...>>");
      }
      if (
        s.collection_variant() == CollectionVariant::DirectAssignment &&
        domain.element_shape().kind() != DomainShapeKind::Primitive) {
        ok = violation(
          field, "elements need a per-item conversion",
          "use a primitive element type, or let elements be converted one by one");
      }
      break;
  }

  return ok;
}

}  // namespace wirebind
