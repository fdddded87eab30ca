// wirebind/strategy/strategy_resolver.hpp - Strategy decision table
#pragma once

#include "wirebind/analysis/directive.hpp"
#include "wirebind/analysis/field_shape.hpp"
#include "wirebind/analysis/wire_shape.hpp"
#include "wirebind/strategy/conversion_strategy.hpp"

namespace wirebind
{

/**
 * Selects exactly one strategy per field. First match wins:
 *
 *  1. ignore                                 -> Ignore
 *  2. from_wire_fn / to_wire_fn              -> Custom(mode)
 *  3. transparent                            -> Transparent(mode)
 *  4. sequence domain or repeated wire       -> Collection.*
 *  5. default                                -> Option.Unwrap(Default)
 *  6. (domain nullable, wire optional):
 *       (no,  no)  -> Direct.*
 *       (no,  yes) -> Option.Unwrap(Panic unless expect says otherwise)
 *       (yes, no)  -> Option.Wrap
 *       (yes, yes) -> Option.Map, or Option.Unwrap(mode) under expect
 *
 * Pure and total.
 */
class StrategyResolver
{
public:
  [[nodiscard]] static ConversionStrategy resolve(
    const FieldAnnotation & annotation, const DomainFieldShape & domain, const WireFieldShape & wire);

  /**
   * Error mode applied to the wrapped value of a transparent field, and to
   * the value a custom from_wire_fn reads.
   *
   * Default wins; a wire value that cannot be absent needs no handling;
   * otherwise expect decides, falling back to Panic for a non-nullable
   * domain.
   */
  [[nodiscard]] static ErrorMode transparent_error_mode(
    const FieldAnnotation & annotation, const DomainFieldShape & domain, const WireFieldShape & wire);

  /// Error mode of Collection.Collect: empty wire sequences are the "missing" case.
  [[nodiscard]] static ErrorMode collection_error_mode(const FieldAnnotation & annotation);
};

}  // namespace wirebind
