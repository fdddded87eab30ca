// wirebind/strategy/strategy_validator.hpp - Structural preconditions of strategies
#pragma once

#include "wirebind/basic/diagnostic.hpp"
#include "wirebind/strategy/conversion_plan.hpp"

namespace wirebind
{

/**
 * Checks that a resolved strategy fits the shapes and directives it was
 * chosen for. Violations are reported as StrategyPreconditionViolation
 * (with the strategy, the reason and a suggested fix) or as
 * EmptyCustomFunctionReference.
 *
 * Preconditions:
 *   - Option.Unwrap: wire optional (a Default fallback is accepted on a
 *     required wire field and simply never triggers)
 *   - Option.Map: wire optional, domain nullable
 *   - Option.Wrap: domain nullable, wire not optional
 *   - Collection.Collect / DirectAssignment: sequence domain or repeated wire
 *   - Collection.MapOption: nullable sequence domain
 *   - Collection.DirectAssignment: primitive elements
 *   - Direct: neither side optional or repeated
 *   - Transparent: `transparent` directive present
 *   - Ignore: `ignore` directive present
 *   - Custom: every named function is non-empty
 */
class StrategyValidator
{
public:
  explicit StrategyValidator(DiagnosticBag * diags);

  /**
   * @return true if all preconditions hold
   */
  [[nodiscard]] bool validate(const FieldPlan & field);

private:
  bool violation(const FieldPlan & field, const std::string & reason, const std::string & fix);
  bool empty_function(const FieldPlan & field, const std::string & which);

  DiagnosticBag * diags_;
};

}  // namespace wirebind
