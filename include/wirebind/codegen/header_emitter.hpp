// wirebind/codegen/header_emitter.hpp - Generated header assembly
#pragma once

#include <string>

#include "wirebind/codegen/aggregate_orchestrator.hpp"
#include "wirebind/codegen/code_synthesizer.hpp"

namespace wirebind
{

struct EmitOptions
{
  /// Prefix each field's statements with its chosen strategy
  bool emit_plan_comments = false;

  /// Runtime header included by the generated code
  std::string runtime_include = "wirebind/runtime/wire_support.hpp";
};

/**
 * Renders a schema plan as a self-contained C++ header.
 *
 * Output is deterministic: the same plan and options give byte-identical text.
 */
class HeaderEmitter
{
public:
  HeaderEmitter(const SchemaPlan & plan, EmitOptions options);

  [[nodiscard]] std::string emit() const;

  /// Conversion functions of one aggregate (no forward declarations).
  [[nodiscard]] std::string emit_aggregate(const StructConversionPlan & plan) const;

  [[nodiscard]] std::string emit_enum(const EnumConversionPlan & plan) const;

private:
  [[nodiscard]] std::string wire_type(const std::string & wire_name) const;
  [[nodiscard]] std::string result_type_name(const StructConversionPlan & plan) const;
  [[nodiscard]] FieldIdentifiers identifiers_for(
    const StructConversionPlan & aggregate, const FieldPlan & field) const;
  [[nodiscard]] ValueConversion value_conversion(
    const DomainFieldShape & shape, const std::string & current_namespace) const;
  [[nodiscard]] std::string declarations(const std::string & ns) const;
  [[nodiscard]] std::string error_struct(const StructConversionPlan & plan) const;

  const SchemaPlan & plan_;
  EmitOptions options_;
};

}  // namespace wirebind
