// wirebind/schema/schema_loader.cpp - YAML schema front end implementation
//
#include "wirebind/schema/schema_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <set>
#include <sstream>

namespace wirebind
{

namespace
{

SourceLocation location_of(const YAML::Node & node, const std::string & origin)
{
  SourceLocation loc;
  loc.file = origin;
  const YAML::Mark mark = node.Mark();
  if (!mark.is_null()) {
    loc.line = static_cast<uint32_t>(mark.line + 1);
    loc.column = static_cast<uint32_t>(mark.column + 1);
  }
  return loc;
}

/// Read a required scalar string key; reports through `error` on failure.
std::optional<std::string> required_string(
  const YAML::Node & node, const char * key, const char * what, std::string & error)
{
  const YAML::Node value = node[key];
  if (!value) {
    error = std::string(what) + " is missing '" + key + "'";
    return std::nullopt;
  }
  if (!value.IsScalar()) {
    error = std::string(what) + " '" + key + "' must be a string";
    return std::nullopt;
  }
  return value.as<std::string>();
}

/// Directives may be written as a list or as a single string.
std::optional<std::vector<std::string>> parse_directive_list(
  const YAML::Node & node, std::string & error)
{
  std::vector<std::string> out;
  if (!node) {
    return out;
  }
  if (node.IsScalar()) {
    out.push_back(node.as<std::string>());
    return out;
  }
  if (!node.IsSequence()) {
    error = "directives must be a string or a list of strings";
    return std::nullopt;
  }
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = "each directive must be a string";
      return std::nullopt;
    }
    out.push_back(item.as<std::string>());
  }
  return out;
}

std::optional<std::vector<std::string>> parse_string_list(
  const YAML::Node & node, const char * what, std::string & error)
{
  std::vector<std::string> out;
  if (!node) {
    return out;
  }
  if (!node.IsSequence()) {
    error = std::string(what) + " must be a list";
    return std::nullopt;
  }
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = std::string(what) + " entries must be strings";
      return std::nullopt;
    }
    out.push_back(item.as<std::string>());
  }
  return out;
}

class DocumentParser
{
public:
  explicit DocumentParser(std::string origin) : origin_(std::move(origin)) {}

  SchemaLoadResult parse(const YAML::Node & root)
  {
    SchemaDocument doc;
    doc.origin = origin_;

    if (!root || root.IsNull()) {
      return SchemaLoadResult::ok(std::move(doc));
    }
    if (!root.IsMap()) {
      return SchemaLoadResult::fail("schema root must be a map", location_of(root, origin_));
    }

    if (root["namespace"]) {
      doc.domain_namespace = root["namespace"].as<std::string>();
    }
    if (root["wire_namespace"]) {
      doc.wire_namespace = root["wire_namespace"].as<std::string>();
    }

    auto includes = parse_string_list(root["includes"], "includes", error_);
    if (!includes) {
      return fail_at(root["includes"]);
    }
    doc.includes = std::move(*includes);

    if (const YAML::Node list = root["transparent"]) {
      if (!list.IsSequence()) {
        error_ = "transparent must be a list";
        return fail_at(list);
      }
      for (const auto & entry : list) {
        auto decl = parse_transparent(entry);
        if (!decl) {
          return fail_at(entry);
        }
        doc.transparent_types.push_back(std::move(*decl));
      }
    }

    if (const YAML::Node list = root["enums"]) {
      if (!list.IsSequence()) {
        error_ = "enums must be a list";
        return fail_at(list);
      }
      for (const auto & entry : list) {
        auto e = parse_enum(entry);
        if (!e) {
          return fail_at(entry);
        }
        doc.enums.push_back(std::move(*e));
      }
    }

    if (const YAML::Node list = root["aggregates"]) {
      if (!list.IsSequence()) {
        error_ = "aggregates must be a list";
        return fail_at(list);
      }
      for (const auto & entry : list) {
        auto agg = parse_aggregate(entry);
        if (!agg) {
          return fail_at(entry);
        }
        doc.aggregates.push_back(std::move(*agg));
      }
    }

    return SchemaLoadResult::ok(std::move(doc));
  }

private:
  SchemaLoadResult fail_at(const YAML::Node & node)
  {
    SourceLocation where = failed_location_ ? *failed_location_ : location_of(node, origin_);
    return SchemaLoadResult::fail(error_, std::move(where));
  }

  bool claim_type_name(const std::string & name)
  {
    if (!type_names_.insert(name).second) {
      error_ = "duplicate type name '" + name + "'";
      return false;
    }
    return true;
  }

  std::optional<TransparentDecl> parse_transparent(const YAML::Node & node)
  {
    if (!node.IsMap()) {
      error_ = "transparent entry must be a map";
      return std::nullopt;
    }
    TransparentDecl decl;
    auto name = required_string(node, "name", "transparent type", error_);
    if (!name) return std::nullopt;
    auto inner = required_string(node, "inner", "transparent type", error_);
    if (!inner) return std::nullopt;

    decl.name = std::move(*name);
    decl.inner = std::move(*inner);
    if (node["member"]) {
      decl.member = node["member"].as<std::string>();
    }
    decl.location = location_of(node, origin_);
    if (!claim_type_name(decl.name)) {
      return std::nullopt;
    }
    return decl;
  }

  std::optional<EnumDescriptor> parse_enum(const YAML::Node & node)
  {
    if (!node.IsMap()) {
      error_ = "enum entry must be a map";
      return std::nullopt;
    }
    EnumDescriptor e;
    auto name = required_string(node, "name", "enum", error_);
    if (!name) return std::nullopt;
    e.name = std::move(*name);
    e.location = location_of(node, origin_);

    auto directives = parse_directive_list(node["directives"], error_);
    if (!directives) return std::nullopt;
    e.directives = std::move(*directives);

    const YAML::Node variants = node["variants"];
    if (!variants || !variants.IsSequence() || variants.size() == 0) {
      error_ = "enum '" + e.name + "' needs a non-empty 'variants' list";
      return std::nullopt;
    }
    std::set<std::string> seen;
    for (const auto & v : variants) {
      if (!v.IsScalar()) {
        error_ = "enum '" + e.name + "' variants must be names";
        failed_location_ = location_of(v, origin_);
        return std::nullopt;
      }
      VariantDescriptor vd{v.as<std::string>(), location_of(v, origin_)};
      if (!seen.insert(vd.name).second) {
        error_ = "duplicate variant '" + vd.name + "' in enum '" + e.name + "'";
        failed_location_ = location_of(v, origin_);
        return std::nullopt;
      }
      e.variants.push_back(std::move(vd));
    }

    auto wire_variants = parse_string_list(node["wire_variants"], "wire_variants", error_);
    if (!wire_variants) return std::nullopt;
    e.wire_variants = std::move(*wire_variants);

    if (!claim_type_name(e.name)) {
      return std::nullopt;
    }
    return e;
  }

  std::optional<FieldDescriptor> parse_field(const YAML::Node & node, const std::string & agg)
  {
    if (!node.IsMap()) {
      error_ = "field entry in '" + agg + "' must be a map";
      return std::nullopt;
    }
    FieldDescriptor f;
    auto name = required_string(node, "name", "field", error_);
    if (!name) return std::nullopt;
    auto type = required_string(node, "type", "field", error_);
    if (!type) return std::nullopt;

    f.name = std::move(*name);
    f.type_text = std::move(*type);
    f.aggregate = agg;
    f.location = location_of(node, origin_);

    auto directives = parse_directive_list(node["directives"], error_);
    if (!directives) return std::nullopt;
    f.directives = std::move(*directives);
    return f;
  }

  std::optional<AggregateDescriptor> parse_aggregate(const YAML::Node & node)
  {
    if (!node.IsMap()) {
      error_ = "aggregate entry must be a map";
      return std::nullopt;
    }
    AggregateDescriptor agg;
    auto name = required_string(node, "name", "aggregate", error_);
    if (!name) return std::nullopt;
    agg.name = std::move(*name);
    agg.location = location_of(node, origin_);

    auto directives = parse_directive_list(node["directives"], error_);
    if (!directives) return std::nullopt;
    agg.directives = std::move(*directives);

    const YAML::Node fields = node["fields"];
    if (fields && !fields.IsSequence()) {
      error_ = "fields of '" + agg.name + "' must be a list";
      return std::nullopt;
    }

    std::set<std::string> seen;
    if (fields) {
      for (const auto & fnode : fields) {
        auto f = parse_field(fnode, agg.name);
        if (!f) {
          failed_location_ = location_of(fnode, origin_);
          return std::nullopt;
        }
        if (!seen.insert(f->name).second) {
          error_ = "duplicate field '" + f->name + "' in aggregate '" + agg.name + "'";
          failed_location_ = location_of(fnode, origin_);
          return std::nullopt;
        }
        agg.fields.push_back(std::move(*f));
      }
    }

    if (!claim_type_name(agg.name)) {
      return std::nullopt;
    }
    return agg;
  }

  std::string origin_;
  std::string error_;
  std::optional<SourceLocation> failed_location_;
  std::set<std::string> type_names_;
};

SchemaLoadResult parse_root(const YAML::Node & root, const std::string & origin)
{
  try {
    DocumentParser parser(origin);
    return parser.parse(root);
  } catch (const YAML::Exception & e) {
    SourceLocation loc;
    loc.file = origin;
    if (!e.mark.is_null()) {
      loc.line = static_cast<uint32_t>(e.mark.line + 1);
      loc.column = static_cast<uint32_t>(e.mark.column + 1);
    }
    return SchemaLoadResult::fail("invalid schema value: " + e.msg, loc);
  }
}

}  // namespace

SchemaLoadResult load_schema_file(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return SchemaLoadResult::fail("schema file not found: " + path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception & e) {
    SourceLocation loc;
    loc.file = path.string();
    if (!e.mark.is_null()) {
      loc.line = static_cast<uint32_t>(e.mark.line + 1);
      loc.column = static_cast<uint32_t>(e.mark.column + 1);
    }
    return SchemaLoadResult::fail("failed to parse YAML: " + e.msg, loc);
  }

  return parse_root(root, path.string());
}

SchemaLoadResult load_schema_string(std::string_view text, std::string origin)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::Exception & e) {
    SourceLocation loc;
    loc.file = origin;
    if (!e.mark.is_null()) {
      loc.line = static_cast<uint32_t>(e.mark.line + 1);
      loc.column = static_cast<uint32_t>(e.mark.column + 1);
    }
    return SchemaLoadResult::fail("failed to parse YAML: " + e.msg, loc);
  }

  return parse_root(root, origin);
}

}  // namespace wirebind
