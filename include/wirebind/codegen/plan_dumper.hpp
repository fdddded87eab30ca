// wirebind/codegen/plan_dumper.hpp - JSON view of conversion plans
#pragma once

#include <nlohmann/json.hpp>

#include "wirebind/codegen/aggregate_orchestrator.hpp"
#include "wirebind/strategy/conversion_plan.hpp"

namespace wirebind
{

/**
 * One aggregate:
 *   {"aggregate", "wire_name", "namespace", "needs_fallible_conversion",
 *    "generated_error_type_name", "error_type",
 *    "fields": [{"name", "wire_name", "domain_shape", "wire_shape", "tier", "strategy"}]}
 */
[[nodiscard]] nlohmann::json dump_plan(const StructConversionPlan & plan);

/// {"name", "wire_name", "namespace", "variants": [{"domain", "wire"}]}
[[nodiscard]] nlohmann::json dump_enum_plan(const EnumConversionPlan & plan);

/// {"origin", "enums": [..], "aggregates": [..]}
[[nodiscard]] nlohmann::json dump_plans(const SchemaPlan & plan);

}  // namespace wirebind
