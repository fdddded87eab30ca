// wirebind/analysis/wire_shape.cpp - Wire shape inference waterfall
#include "wirebind/analysis/wire_shape.hpp"

namespace wirebind
{

std::string_view to_string(WireMapping mapping) noexcept
{
  switch (mapping) {
    case WireMapping::Scalar:
      return "Scalar";
    case WireMapping::Optional:
      return "Optional";
    case WireMapping::Repeated:
      return "Repeated";
    case WireMapping::Message:
      return "Message";
    case WireMapping::CustomDerived:
      return "CustomDerived";
  }
  return "Scalar";
}

std::string_view to_string(InferenceTier tier) noexcept
{
  switch (tier) {
    case InferenceTier::Skipped:
      return "skipped";
    case InferenceTier::Explicit:
      return "explicit";
    case InferenceTier::SideChannel:
      return "side-channel";
    case InferenceTier::Structural:
      return "structural";
    case InferenceTier::UsagePattern:
      return "usage-pattern";
  }
  return "skipped";
}

WireFieldShape WireFieldShape::make(WireMapping mapping, Optionality optionality) noexcept
{
  if (mapping == WireMapping::Repeated) {
    optionality = Optionality::Required;
  }
  return WireFieldShape(mapping, optionality);
}

std::string WireFieldShape::describe() const
{
  return std::string(to_string(mapping_)) + "/" + std::string(to_string(optionality_));
}

WireMapping structural_mapping(
  const DomainFieldShape & shape, const FieldAnnotation & annotation, Optionality optionality)
{
  const DomainFieldShape & value = shape.value_shape();
  if (value.is_sequence()) {
    return WireMapping::Repeated;
  }

  // A transparent wrapper travels as whatever it wraps.
  const DomainFieldShape * carried = &value;
  while (carried->kind() == DomainShapeKind::TransparentWrapper && carried->inner() != nullptr) {
    carried = carried->inner();
  }

  const bool scalar_like = annotation.wire_scalar || annotation.transparent ||
                           carried->kind() != DomainShapeKind::CustomAggregate;
  if (!scalar_like) {
    return annotation.has_custom_fn() ? WireMapping::CustomDerived : WireMapping::Message;
  }
  return optionality == Optionality::Optional ? WireMapping::Optional : WireMapping::Scalar;
}

// ============================================================================
// WireShapeInferrer
// ============================================================================

WireShapeInferrer::WireShapeInferrer(const SideChannel * side_channel, DiagnosticBag * diags)
: side_channel_(side_channel), diags_(diags)
{
}

std::optional<WireShapeInference> WireShapeInferrer::infer(
  const FieldDescriptor & field, const FieldAnnotation & annotation,
  const DomainFieldShape & shape, const WireFieldKey & key)
{
  auto with = [&](Optionality optionality, InferenceTier tier) {
    return WireShapeInference{
      WireFieldShape::make(structural_mapping(shape, annotation, optionality), optionality), tier};
  };

  if (annotation.ignore) {
    return WireShapeInference{
      WireFieldShape::make(WireMapping::Scalar, Optionality::Required), InferenceTier::Skipped};
  }

  // Tier 1: explicit override
  if (annotation.explicit_optionality) {
    return with(*annotation.explicit_optionality, InferenceTier::Explicit);
  }

  // Tier 2: side channel
  if (side_channel_ != nullptr) {
    if (auto answer = side_channel_->get_field_optionality(key.message, key.field)) {
      return with(*answer ? Optionality::Optional : Optionality::Required, InferenceTier::SideChannel);
    }
  }

  // Tier 3: structural pattern
  if (shape.is_nullable()) {
    return with(Optionality::Optional, InferenceTier::Structural);
  }
  if (shape.is_sequence()) {
    return with(Optionality::Required, InferenceTier::Structural);
  }

  const DomainShapeKind kind = shape.kind();
  const bool custom_aggregate =
    kind == DomainShapeKind::CustomAggregate && !annotation.transparent && !annotation.wire_scalar;

  if (custom_aggregate && annotation.has_custom_fn()) {
    return with(Optionality::Required, InferenceTier::Structural);
  }
  if (!custom_aggregate && !annotation.has_usage_indicators()) {
    return with(Optionality::Required, InferenceTier::Structural);
  }

  // Tier 4: usage-pattern heuristic
  if (annotation.has_usage_indicators()) {
    return with(Optionality::Optional, InferenceTier::UsagePattern);
  }
  if (custom_aggregate && shape.is_unqualified_name()) {
    if (diags_ != nullptr) {
      diags_
        ->report_warning(
          DiagnosticKind::InferredOptionality,
          "wire field '" + key.field + "' assumed optional (inferred, not verified)")
        .in_aggregate(field.aggregate)
        .on_field(field.name)
        .at(field.location)
        .with_help("add 'optional' or 'required' to confirm the wire optionality");
    }
    return with(Optionality::Optional, InferenceTier::UsagePattern);
  }

  // Tier 5: nothing answered
  if (diags_ != nullptr) {
    diags_
      ->report_error(
        DiagnosticKind::AmbiguousOptionality,
        "cannot determine wire optionality of field '" + field.name + "' of type '" +
          shape.type_text() + "'")
      .in_aggregate(field.aggregate)
      .on_field(field.name)
      .at(field.location)
      .with_help(
        "add 'optional' or 'required' to the field directives, or provide a side channel entry "
        "for " + key.message + "." + key.field);
  }
  return std::nullopt;
}

}  // namespace wirebind
