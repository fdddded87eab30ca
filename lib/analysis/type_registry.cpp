// wirebind/analysis/type_registry.cpp - Known type names
#include "wirebind/analysis/type_registry.hpp"

#include <utility>

namespace wirebind
{

TypeRegistry TypeRegistry::with_defaults()
{
  TypeRegistry r;
  for (const char * name :
       {"bool", "int32_t", "int64_t", "uint32_t", "uint64_t", "std::int32_t", "std::int64_t",
        "std::uint32_t", "std::uint64_t", "float", "double", "std::string"}) {
    r.add_primitive(name);
  }
  r.add_nullable_wrapper("std::optional");
  r.add_sequence_wrapper("std::vector");
  r.add_map_wrapper("std::map");
  r.add_map_wrapper("std::unordered_map");
  return r;
}

void TypeRegistry::add_primitive(std::string name) { primitives_.insert(std::move(name)); }

void TypeRegistry::add_nullable_wrapper(std::string template_name)
{
  nullable_wrappers_.insert(std::move(template_name));
}

void TypeRegistry::add_sequence_wrapper(std::string template_name)
{
  sequence_wrappers_.insert(std::move(template_name));
}

void TypeRegistry::add_map_wrapper(std::string template_name)
{
  map_wrappers_.insert(std::move(template_name));
}

void TypeRegistry::add_enum(std::string name, std::string wire_name)
{
  enums_[std::move(name)] = std::move(wire_name);
}

void TypeRegistry::add_transparent(TransparentDecl decl)
{
  std::string key = decl.name;
  transparent_[std::move(key)] = std::move(decl);
}

bool TypeRegistry::is_primitive(std::string_view name) const
{
  return primitives_.find(name) != primitives_.end();
}

bool TypeRegistry::is_nullable_wrapper(std::string_view template_name) const
{
  return nullable_wrappers_.find(template_name) != nullable_wrappers_.end();
}

bool TypeRegistry::is_sequence_wrapper(std::string_view template_name) const
{
  return sequence_wrappers_.find(template_name) != sequence_wrappers_.end();
}

bool TypeRegistry::is_map_wrapper(std::string_view template_name) const
{
  return map_wrappers_.find(template_name) != map_wrappers_.end();
}

bool TypeRegistry::is_enum(std::string_view name) const { return enums_.find(name) != enums_.end(); }

std::optional<std::string> TypeRegistry::enum_wire_name(std::string_view name) const
{
  auto it = enums_.find(name);
  if (it == enums_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const TransparentDecl * TypeRegistry::find_transparent(std::string_view name) const
{
  auto it = transparent_.find(name);
  return it == transparent_.end() ? nullptr : &it->second;
}

}  // namespace wirebind
