// wirebind/analysis/side_channel.cpp - Side channel implementations
#include "wirebind/analysis/side_channel.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>

namespace wirebind
{

// ============================================================================
// NullSideChannel
// ============================================================================

std::optional<bool> NullSideChannel::get_field_optionality(
  std::string_view /*aggregate_name*/, std::string_view /*field_name*/) const
{
  return std::nullopt;
}

// ============================================================================
// TableSideChannel
// ============================================================================

std::optional<bool> TableSideChannel::get_field_optionality(
  std::string_view aggregate_name, std::string_view field_name) const
{
  auto msg = entries_.find(aggregate_name);
  if (msg == entries_.end()) {
    return std::nullopt;
  }
  auto field = msg->second.find(field_name);
  if (field == msg->second.end()) {
    return std::nullopt;
  }
  return field->second;
}

void TableSideChannel::set(const std::string & message, const std::string & field, bool optional)
{
  entries_[message][field] = optional;
}

void TableSideChannel::merge(const TableSideChannel & other)
{
  for (const auto & [message, fields] : other.entries_) {
    for (const auto & [field, optional] : fields) {
      entries_[message][field] = optional;
    }
  }
}

std::size_t TableSideChannel::size() const noexcept
{
  std::size_t n = 0;
  for (const auto & [message, fields] : entries_) {
    n += fields.size();
  }
  return n;
}

nlohmann::json TableSideChannel::to_json() const
{
  nlohmann::json out = nlohmann::json::object();
  for (const auto & [message, fields] : entries_) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto & [field, optional] : fields) {
      obj[field] = optional;
    }
    out[message] = std::move(obj);
  }
  return out;
}

std::optional<TableSideChannel> TableSideChannel::from_json(
  const nlohmann::json & j, std::string & error)
{
  if (!j.is_object()) {
    error = "lookup table must be a JSON object";
    return std::nullopt;
  }
  TableSideChannel table;
  for (const auto & [message, fields] : j.items()) {
    if (!fields.is_object()) {
      error = "entry '" + message + "' must be an object of booleans";
      return std::nullopt;
    }
    for (const auto & [field, value] : fields.items()) {
      if (!value.is_boolean()) {
        error = "entry '" + message + "." + field + "' must be true or false";
        return std::nullopt;
      }
      table.set(message, field, value.get<bool>());
    }
  }
  return table;
}

std::optional<TableSideChannel> TableSideChannel::load_file(
  const std::filesystem::path & path, std::string & error)
{
  std::ifstream in(path);
  if (!in.is_open()) {
    error = "cannot open lookup file: " + path.string();
    return std::nullopt;
  }
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error & e) {
    error = "invalid JSON in " + path.string() + ": " + e.what();
    return std::nullopt;
  }
  return from_json(j, error);
}

// ============================================================================
// ProtoScanner
// ============================================================================

namespace
{

enum class BlockKind {
  Message,
  Enum,
  Oneof,
  Other,
};

struct Block
{
  BlockKind kind;
  std::string name;
  int depth;  // brace depth inside the block
};

std::string strip_line_comment(const std::string & line)
{
  const auto pos = line.find("//");
  std::string out = pos == std::string::npos ? line : line.substr(0, pos);
  const auto b = out.find_first_not_of(" \t\r");
  if (b == std::string::npos) {
    return {};
  }
  const auto e = out.find_last_not_of(" \t\r");
  return out.substr(b, e - b + 1);
}

bool is_scalar_type(const std::string & type)
{
  static const std::set<std::string> k_scalars = {
    "int32",   "int64",    "uint32",   "uint64", "sint32", "sint64", "fixed32", "fixed64",
    "sfixed32", "sfixed64", "float",    "double", "bool",   "string", "bytes",
  };
  return k_scalars.count(type) != 0;
}

std::string last_segment(const std::string & type)
{
  const auto dot = type.rfind('.');
  return dot == std::string::npos ? type : type.substr(dot + 1);
}

}  // namespace

void ProtoScanner::scan_text(std::string_view text)
{
  static const std::regex k_message_re(R"(^message\s+(\w+)\s*\{)");
  static const std::regex k_enum_re(R"(^enum\s+(\w+)\s*\{)");
  static const std::regex k_oneof_re(R"(^oneof\s+(\w+)\s*\{)");
  static const std::regex k_map_re(R"(^map\s*<[^>]*>\s+(\w+)\s*=\s*\d+)");
  static const std::regex k_field_re(
    R"(^(optional|required|repeated)?\s*([\w.]+)\s+(\w+)\s*=\s*\d+)");

  std::vector<Block> stack;
  int depth = 0;
  bool in_block_comment = false;

  std::istringstream in{std::string(text)};
  std::string raw;
  while (std::getline(in, raw)) {
    if (in_block_comment) {
      const auto end = raw.find("*/");
      if (end == std::string::npos) {
        continue;
      }
      raw = raw.substr(end + 2);
      in_block_comment = false;
    }
    const auto block_start = raw.find("/*");
    if (block_start != std::string::npos && raw.find("*/", block_start) == std::string::npos) {
      raw = raw.substr(0, block_start);
      in_block_comment = true;
    }

    const std::string line = strip_line_comment(raw);
    if (line.empty()) {
      continue;
    }

    std::smatch m;
    const Block * owner = nullptr;
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
      if (it->kind == BlockKind::Message) {
        owner = &*it;
        break;
      }
    }
    const bool in_oneof = !stack.empty() && stack.back().kind == BlockKind::Oneof;
    const bool in_enum = !stack.empty() && stack.back().kind == BlockKind::Enum;

    std::optional<Block> opened;
    if (std::regex_search(line, m, k_message_re)) {
      opened = Block{BlockKind::Message, m[1].str(), depth + 1};
    } else if (std::regex_search(line, m, k_enum_re)) {
      enum_names_.push_back(m[1].str());
      opened = Block{BlockKind::Enum, m[1].str(), depth + 1};
    } else if (std::regex_search(line, m, k_oneof_re)) {
      opened = Block{BlockKind::Oneof, m[1].str(), depth + 1};
    } else if (owner != nullptr && !in_enum && std::regex_search(line, m, k_map_re)) {
      fields_.push_back(ScannedField{owner->name, m[1].str(), "map", "map"});
    } else if (owner != nullptr && !in_enum && std::regex_search(line, m, k_field_re)) {
      // Members of a oneof always carry presence.
      const std::string label = in_oneof ? std::string("optional") : m[1].str();
      if (m[2].str() != "option" && m[2].str() != "reserved") {
        fields_.push_back(ScannedField{owner->name, m[3].str(), m[2].str(), label});
      }
    } else if (line.find('{') != std::string::npos) {
      opened = Block{BlockKind::Other, "", depth + 1};
    }

    if (opened) {
      stack.push_back(std::move(*opened));
    }

    depth += static_cast<int>(std::count(line.begin(), line.end(), '{'));
    depth -= static_cast<int>(std::count(line.begin(), line.end(), '}'));
    while (!stack.empty() && stack.back().depth > depth) {
      stack.pop_back();
    }
  }
}

bool ProtoScanner::scan_file(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in.is_open()) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  scan_text(buffer.str());
  return true;
}

TableSideChannel ProtoScanner::build() const
{
  const std::set<std::string> enums(enum_names_.begin(), enum_names_.end());

  TableSideChannel table;
  for (const auto & f : fields_) {
    bool optional = false;
    if (f.label == "optional") {
      optional = true;
    } else if (f.label.empty()) {
      const std::string type = last_segment(f.type);
      optional = !is_scalar_type(type) && enums.count(type) == 0;
    }
    table.set(f.message, f.field, optional);
  }
  return table;
}

}  // namespace wirebind
