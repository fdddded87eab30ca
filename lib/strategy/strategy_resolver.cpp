// wirebind/strategy/strategy_resolver.cpp - Strategy decision table
#include "wirebind/strategy/strategy_resolver.hpp"

namespace wirebind
{

namespace
{

ErrorMode expect_error_mode(ExpectMode expect, ErrorMode fallback)
{
  switch (expect) {
    case ExpectMode::Panic:
      return ErrorMode::panic();
    case ExpectMode::Error:
      return ErrorMode::error();
    case ExpectMode::None:
      break;
  }
  return fallback;
}

}  // namespace

ErrorMode StrategyResolver::transparent_error_mode(
  const FieldAnnotation & annotation, const DomainFieldShape & domain, const WireFieldShape & wire)
{
  if (annotation.default_value) {
    return ErrorMode::with_default(annotation.default_value->function);
  }
  if (!wire.is_optional()) {
    return ErrorMode::none();
  }
  return expect_error_mode(
    annotation.expect_mode, domain.is_nullable() ? ErrorMode::none() : ErrorMode::panic());
}

ErrorMode StrategyResolver::collection_error_mode(const FieldAnnotation & annotation)
{
  if (annotation.expect_mode != ExpectMode::None) {
    return expect_error_mode(annotation.expect_mode, ErrorMode::none());
  }
  if (annotation.default_value) {
    return ErrorMode::with_default(annotation.default_value->function);
  }
  return ErrorMode::none();
}

ConversionStrategy StrategyResolver::resolve(
  const FieldAnnotation & annotation, const DomainFieldShape & domain, const WireFieldShape & wire)
{
  // 1. ignore
  if (annotation.ignore) {
    if (annotation.default_value) {
      return ConversionStrategy::ignore(ErrorMode::with_default(annotation.default_value->function));
    }
    return ConversionStrategy::ignore();
  }

  // 2. custom functions
  if (annotation.has_custom_fn()) {
    return ConversionStrategy::custom(
      annotation.custom_from_wire_fn, annotation.custom_to_wire_fn,
      transparent_error_mode(annotation, domain, wire));
  }

  // 3. transparent
  if (annotation.transparent) {
    return ConversionStrategy::transparent(transparent_error_mode(annotation, domain, wire));
  }

  // 4. collections
  if (domain.is_sequence() || wire.is_repeated() || domain.is_nullable_sequence()) {
    if (domain.is_nullable_sequence()) {
      return ConversionStrategy::collection_map_option();
    }
    const ErrorMode mode = collection_error_mode(annotation);
    if (
      domain.element_shape().kind() == DomainShapeKind::Primitive &&
      mode.kind() == ErrorMode::Kind::None) {
      return ConversionStrategy::collection_direct_assignment();
    }
    return ConversionStrategy::collect(mode);
  }

  // 5. default overrides the matrix
  if (annotation.default_value) {
    return ConversionStrategy::option_unwrap(
      ErrorMode::with_default(annotation.default_value->function));
  }

  // 6. (domain nullable, wire optional)
  const bool domain_nullable = domain.is_nullable();
  const bool wire_optional = wire.is_optional();

  if (!domain_nullable && !wire_optional) {
    return ConversionStrategy::direct(
      domain.kind() == DomainShapeKind::Primitive ? DirectVariant::Assignment
                                                  : DirectVariant::WithConversion);
  }
  if (!domain_nullable && wire_optional) {
    return ConversionStrategy::option_unwrap(
      expect_error_mode(annotation.expect_mode, ErrorMode::panic()));
  }
  if (domain_nullable && !wire_optional) {
    return ConversionStrategy::option_wrap();
  }
  if (annotation.expect_mode != ExpectMode::None) {
    return ConversionStrategy::option_unwrap(
      expect_error_mode(annotation.expect_mode, ErrorMode::panic()));
  }
  return ConversionStrategy::option_map();
}

}  // namespace wirebind
