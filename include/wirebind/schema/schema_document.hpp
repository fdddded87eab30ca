// wirebind/schema/schema_document.hpp - Descriptors produced by the schema front end
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wirebind/basic/source_location.hpp"

namespace wirebind
{

// ============================================================================
// Descriptors
// ============================================================================

/**
 * One domain field as written in the schema.
 *
 * The type text is kept verbatim; shape classification happens later.
 */
struct FieldDescriptor
{
  std::string name;
  std::string type_text;
  std::vector<std::string> directives;  // raw directive tokens
  std::string aggregate;                // enclosing aggregate name
  SourceLocation location;
};

struct AggregateDescriptor
{
  std::string name;
  std::vector<std::string> directives;
  std::vector<FieldDescriptor> fields;
  SourceLocation location;
};

struct VariantDescriptor
{
  std::string name;
  SourceLocation location;
};

struct EnumDescriptor
{
  std::string name;
  std::vector<std::string> directives;
  std::vector<VariantDescriptor> variants;

  /// Value names of the protoc enum. Empty means "same as the domain variants".
  std::vector<std::string> wire_variants;
  SourceLocation location;
};

/**
 * Declaration of a single-member wrapper type, e.g. `struct TrackId { uint64_t value; }`.
 */
struct TransparentDecl
{
  std::string name;
  std::string inner;
  std::string member = "value";
  SourceLocation location;
};

/**
 * A whole schema file.
 */
struct SchemaDocument
{
  /// File path or "<string>" for in-memory schemas
  std::string origin;

  /// C++ namespace of the domain types (generated functions land here too)
  std::string domain_namespace;

  /// C++ namespace of the protoc generated classes, e.g. "demo::pb"
  std::string wire_namespace;

  /// Headers emitted as #include lines at the top of the output
  std::vector<std::string> includes;

  std::vector<TransparentDecl> transparent_types;
  std::vector<EnumDescriptor> enums;
  std::vector<AggregateDescriptor> aggregates;
};

}  // namespace wirebind
