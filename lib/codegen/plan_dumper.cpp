// wirebind/codegen/plan_dumper.cpp - JSON view of conversion plans
#include "wirebind/codegen/plan_dumper.hpp"

namespace wirebind
{

namespace
{

nlohmann::json optional_string(const std::optional<std::string> & s)
{
  return s ? nlohmann::json(*s) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json dump_plan(const StructConversionPlan & plan)
{
  nlohmann::json fields = nlohmann::json::array();
  for (const auto & f : plan.fields) {
    fields.push_back({
      {"name", f.name()},
      {"type", f.domain_shape.type_text()},
      {"wire_name", f.wire_field_name},
      {"domain_shape", f.domain_shape.describe()},
      {"wire_shape", f.wire_shape.describe()},
      {"tier", std::string(to_string(f.tier))},
      {"strategy", f.strategy.describe()},
    });
  }

  return {
    {"aggregate", plan.aggregate},
    {"wire_name", plan.wire_name},
    {"namespace", plan.domain_namespace},
    {"needs_fallible_conversion", plan.needs_fallible_conversion},
    {"generated_error_type_name", optional_string(plan.generated_error_type_name)},
    {"error_type", optional_string(plan.error_type)},
    {"fields", std::move(fields)},
  };
}

nlohmann::json dump_enum_plan(const EnumConversionPlan & plan)
{
  nlohmann::json variants = nlohmann::json::array();
  for (const auto & v : plan.variants) {
    variants.push_back({{"domain", v.domain_name}, {"wire", v.wire_name}});
  }
  return {
    {"name", plan.name},
    {"wire_name", plan.wire_name},
    {"namespace", plan.domain_namespace},
    {"variants", std::move(variants)},
  };
}

nlohmann::json dump_plans(const SchemaPlan & plan)
{
  nlohmann::json enums = nlohmann::json::array();
  for (const auto & e : plan.enums) {
    enums.push_back(dump_enum_plan(e));
  }
  nlohmann::json aggregates = nlohmann::json::array();
  for (const auto & a : plan.aggregates) {
    aggregates.push_back(dump_plan(a));
  }
  return {
    {"origin", plan.origin},
    {"enums", std::move(enums)},
    {"aggregates", std::move(aggregates)},
  };
}

}  // namespace wirebind
