// wirebind/codegen/header_emitter.cpp - Generated header assembly
#include "wirebind/codegen/header_emitter.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <utility>
#include <vector>

namespace wirebind
{

namespace
{

std::string qualifier_for(const std::string & target_ns, const std::string & current_ns)
{
  if (target_ns == current_ns) {
    return {};
  }
  return target_ns.empty() ? "::" : "::" + target_ns + "::";
}

std::string open_namespace(const std::string & ns)
{
  return ns.empty() ? std::string{} : fmt::format("namespace {}\n{{\n\n", ns);
}

std::string close_namespace(const std::string & ns)
{
  return ns.empty() ? std::string{} : fmt::format("}}  // namespace {}\n", ns);
}

std::string include_line(const std::string & header)
{
  if (!header.empty() && header.front() == '<') {
    return fmt::format("#include {}\n", header);
  }
  return fmt::format("#include \"{}\"\n", header);
}

}  // namespace

HeaderEmitter::HeaderEmitter(const SchemaPlan & plan, EmitOptions options)
: plan_(plan), options_(std::move(options))
{
}

std::string HeaderEmitter::wire_type(const std::string & wire_name) const
{
  return plan_.wire_namespace.empty() ? wire_name : plan_.wire_namespace + "::" + wire_name;
}

std::string HeaderEmitter::result_type_name(const StructConversionPlan & plan) const
{
  return plan.aggregate + "FromWireResult";
}

// ============================================================================
// Whole header
// ============================================================================

std::string HeaderEmitter::emit() const
{
  std::string out;
  out += fmt::format(
    "// Generated by wbc from {}. Do not edit.\n",
    std::filesystem::path(plan_.origin).filename().string());
  out += "#pragma once\n\n";
  out += "#include <string>\n#include <utility>\n\n";
  out += include_line(options_.runtime_include);
  for (const auto & inc : plan_.includes) {
    out += include_line(inc);
  }

  // Namespaces in order of first appearance.
  std::vector<std::string> namespaces;
  auto note_ns = [&](const std::string & ns) {
    if (std::find(namespaces.begin(), namespaces.end(), ns) == namespaces.end()) {
      namespaces.push_back(ns);
    }
  };
  for (const auto & e : plan_.enums) note_ns(e.domain_namespace);
  for (const auto & a : plan_.aggregates) note_ns(a.domain_namespace);

  for (const auto & ns : namespaces) {
    out += "\n";
    out += open_namespace(ns);
    out += declarations(ns);
    out += close_namespace(ns);
  }

  for (const auto & ns : namespaces) {
    out += "\n";
    out += open_namespace(ns);
    for (const auto & e : plan_.enums) {
      if (e.domain_namespace == ns) {
        out += emit_enum(e);
        out += "\n";
      }
    }
    for (const auto & a : plan_.aggregates) {
      if (a.domain_namespace == ns) {
        out += emit_aggregate(a);
        out += "\n";
      }
    }
    out += close_namespace(ns);
  }
  return out;
}

std::string HeaderEmitter::declarations(const std::string & ns) const
{
  std::string out;
  for (const auto & e : plan_.enums) {
    if (e.domain_namespace != ns) continue;
    const std::string wire = wire_type(e.wire_name);
    out += fmt::format("inline {} from_wire({} wire);\n", e.name, wire);
    out += fmt::format("inline {} to_wire({} domain);\n\n", wire, e.name);
  }
  for (const auto & a : plan_.aggregates) {
    if (a.domain_namespace != ns) continue;
    const std::string wire = wire_type(a.wire_name);
    if (a.needs_fallible_conversion) {
      if (a.generated_error_type_name) {
        out += error_struct(a);
        out += "\n";
      }
      out += fmt::format(
        "using {} = wirebind::runtime::ConversionResult<{}, {}>;\n", result_type_name(a), a.aggregate,
        a.error_type.value_or(a.aggregate + "ConversionError"));
      out += fmt::format("inline {} try_from_wire(const {} & wire);\n", result_type_name(a), wire);
    }
    out += fmt::format("inline {} from_wire(const {} & wire);\n", a.aggregate, wire);
    out += fmt::format("inline {} to_wire(const {} & domain);\n\n", wire, a.aggregate);
  }
  return out;
}

std::string HeaderEmitter::error_struct(const StructConversionPlan & plan) const
{
  const std::string & name = *plan.generated_error_type_name;
  std::string out;
  out += fmt::format("/// Failure of the wire->domain conversion of {}.\n", plan.aggregate);
  out += fmt::format("struct {}\n{{\n", name);
  out += "  enum class Kind {\n    MissingField,\n  };\n\n";
  out += "  Kind kind = Kind::MissingField;\n";
  out += "  std::string field;\n\n";
  out += fmt::format("  static {} missing_field(std::string field_name)\n  {{\n", name);
  out += fmt::format("    return {}{{Kind::MissingField, std::move(field_name)}};\n  }}\n\n", name);
  out += "  std::string message() const { return \"missing wire field '\" + field + \"'\"; }\n";
  out += "};\n";
  return out;
}

// ============================================================================
// Enumerations
// ============================================================================

std::string HeaderEmitter::emit_enum(const EnumConversionPlan & plan) const
{
  const std::string wire = wire_type(plan.wire_name);
  std::string out;

  out += fmt::format("inline {} from_wire({} wire)\n{{\n", plan.name, wire);
  out += "  switch (wire) {\n";
  for (const auto & v : plan.variants) {
    out += fmt::format("    case {}::{}:\n      return {}::{};\n", wire, v.wire_name, plan.name, v.domain_name);
  }
  out += "    default:\n      break;\n  }\n";
  out += fmt::format(
    "  wirebind::runtime::unknown_enum_value_panic(\"{}\", static_cast<int>(wire));\n}}\n\n", plan.name);

  out += fmt::format("inline {} to_wire({} domain)\n{{\n", wire, plan.name);
  out += "  switch (domain) {\n";
  for (const auto & v : plan.variants) {
    out += fmt::format("    case {}::{}:\n      return {}::{};\n", plan.name, v.domain_name, wire, v.wire_name);
  }
  out += "  }\n";
  out += fmt::format(
    "  wirebind::runtime::unknown_enum_value_panic(\"{}\", static_cast<int>(domain));\n}}\n", plan.name);
  return out;
}

// ============================================================================
// Aggregates
// ============================================================================

ValueConversion HeaderEmitter::value_conversion(
  const DomainFieldShape & shape, const std::string & current_namespace) const
{
  switch (shape.kind()) {
    case DomainShapeKind::Primitive:
      return ValueConversion::identity();

    case DomainShapeKind::TaggedEnum:
      for (const auto & e : plan_.enums) {
        if (e.name == shape.type_text()) {
          return ValueConversion::overloaded_call(qualifier_for(e.domain_namespace, current_namespace));
        }
      }
      return ValueConversion::overloaded_call();

    case DomainShapeKind::CustomAggregate:
      for (const auto & a : plan_.aggregates) {
        if (a.aggregate == shape.type_text()) {
          return ValueConversion::overloaded_call(qualifier_for(a.domain_namespace, current_namespace));
        }
      }
      // Declared elsewhere; found by ordinary lookup.
      return ValueConversion::overloaded_call();

    case DomainShapeKind::TransparentWrapper: {
      std::string member = "value";
      for (const auto & decl : plan_.transparent_types) {
        if (decl.name == shape.type_text()) {
          member = decl.member;
        }
      }
      const ValueConversion inner = shape.inner() != nullptr
                                      ? value_conversion(*shape.inner(), current_namespace)
                                      : ValueConversion::identity();
      return ValueConversion::transparent(shape.type_text(), member, inner);
    }

    case DomainShapeKind::NullableWrapper:
    case DomainShapeKind::SequenceWrapper:
      break;
  }
  return ValueConversion::identity();
}

FieldIdentifiers HeaderEmitter::identifiers_for(
  const StructConversionPlan & aggregate, const FieldPlan & field) const
{
  FieldIdentifiers ids;
  ids.aggregate = aggregate.aggregate;
  ids.field = field.name();
  ids.wire_accessor = wire_accessor_name(field.wire_field_name);
  ids.domain_type = field.domain_shape.type_text();
  ids.domain_nullable = field.domain_shape.is_nullable();
  ids.wire_optional = field.wire_shape.is_optional();
  ids.wire_repeated = field.wire_shape.is_repeated();
  ids.wire_message_like = field.wire_shape.is_message_like();

  const DomainFieldShape & element = field.domain_shape.element_shape();
  ids.value = value_conversion(element, aggregate.domain_namespace);
  if (ids.wire_repeated && element.kind() == DomainShapeKind::TaggedEnum) {
    // Repeated enum fields hold plain ints.
    for (const auto & e : plan_.enums) {
      if (e.name == element.type_text()) {
        ids.value = ids.value.with_wire_cast(wire_type(e.wire_name));
      }
    }
  }

  if (field.strategy.is_error_moded()) {
    ids.result_type = result_type_name(aggregate);
    if (field.annotation.error_fn) {
      ids.error_expression = fmt::format("{}(\"{}\")", *field.annotation.error_fn, field.name());
    } else {
      ids.error_expression = fmt::format(
        "{}::missing_field(\"{}\")",
        aggregate.generated_error_type_name.value_or(aggregate.aggregate + "ConversionError"),
        field.name());
    }
  }
  return ids;
}

std::string HeaderEmitter::emit_aggregate(const StructConversionPlan & plan) const
{
  const std::string wire = wire_type(plan.wire_name);

  std::string reads;
  std::string writes;
  for (const auto & field : plan.fields) {
    const FieldIdentifiers ids = identifiers_for(plan, field);
    const std::string from = CodeSynthesizer::synthesize(field.strategy, Direction::WireToDomain, ids);
    const std::string to = CodeSynthesizer::synthesize(field.strategy, Direction::DomainToWire, ids);
    if (options_.emit_plan_comments) {
      const std::string comment = fmt::format("  // {}: {}\n", field.name(), field.strategy.describe());
      reads += comment;
      writes += comment;
    }
    reads += from;
    writes += to;
  }

  const bool reads_wire = reads.find("wire.") != std::string::npos;
  const bool reads_domain = writes.find("domain.") != std::string::npos;

  std::string out;
  if (plan.needs_fallible_conversion) {
    const std::string result = result_type_name(plan);
    out += fmt::format("inline {} try_from_wire(const {} & wire)\n{{\n", result, wire);
    if (!reads_wire) out += "  static_cast<void>(wire);\n";
    out += fmt::format("  {} out{{}};\n", plan.aggregate);
    out += reads;
    out += fmt::format("  return {}::ok(std::move(out));\n}}\n\n", result);

    out += fmt::format("inline {} from_wire(const {} & wire)\n{{\n", plan.aggregate, wire);
    out += fmt::format(
      "  return wirebind::runtime::value_or_throw(try_from_wire(wire), \"{}\");\n}}\n\n", plan.aggregate);
  } else {
    out += fmt::format("inline {} from_wire(const {} & wire)\n{{\n", plan.aggregate, wire);
    if (!reads_wire) out += "  static_cast<void>(wire);\n";
    out += fmt::format("  {} out{{}};\n", plan.aggregate);
    out += reads;
    out += "  return out;\n}\n\n";
  }

  out += fmt::format("inline {} to_wire(const {} & domain)\n{{\n", wire, plan.aggregate);
  if (!reads_domain) out += "  static_cast<void>(domain);\n";
  out += fmt::format("  {} wire;\n", wire);
  out += writes;
  out += "  return wire;\n}\n";
  return out;
}

}  // namespace wirebind
