// wirebind/analysis/type_registry.hpp - Known type names for shape classification
#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "wirebind/schema/schema_document.hpp"

namespace wirebind
{

/**
 * Per-pass table of the type names the classifier recognises.
 *
 * Built once before analysis and passed by const reference; nothing in the
 * pipeline mutates it afterwards.
 */
class TypeRegistry
{
public:
  TypeRegistry() = default;

  /**
   * Registry with the C++ primitives and standard wrapper templates:
   * bool, (std::)int32_t/int64_t/uint32_t/uint64_t, float, double,
   * std::string; std::optional as nullable; std::vector as sequence;
   * std::map and std::unordered_map as maps.
   */
  [[nodiscard]] static TypeRegistry with_defaults();

  void add_primitive(std::string name);
  void add_nullable_wrapper(std::string template_name);
  void add_sequence_wrapper(std::string template_name);

  /// Key/value containers; they have no built-in conversion to protobuf maps.
  void add_map_wrapper(std::string template_name);

  /// Register a tagged enum with the unqualified name of its wire enum.
  void add_enum(std::string name, std::string wire_name);
  void add_transparent(TransparentDecl decl);

  [[nodiscard]] bool is_primitive(std::string_view name) const;
  [[nodiscard]] bool is_nullable_wrapper(std::string_view template_name) const;
  [[nodiscard]] bool is_sequence_wrapper(std::string_view template_name) const;
  [[nodiscard]] bool is_map_wrapper(std::string_view template_name) const;
  [[nodiscard]] bool is_enum(std::string_view name) const;

  [[nodiscard]] std::optional<std::string> enum_wire_name(std::string_view name) const;
  [[nodiscard]] const TransparentDecl * find_transparent(std::string_view name) const;

private:
  std::set<std::string, std::less<>> primitives_;
  std::set<std::string, std::less<>> nullable_wrappers_;
  std::set<std::string, std::less<>> sequence_wrappers_;
  std::set<std::string, std::less<>> map_wrappers_;
  std::map<std::string, std::string, std::less<>> enums_;
  std::map<std::string, TransparentDecl, std::less<>> transparent_;
};

}  // namespace wirebind
