// wirebind/analysis/field_shape.cpp - Domain field shape classification
#include "wirebind/analysis/field_shape.hpp"

#include <cctype>
#include <optional>
#include <utility>

namespace wirebind
{

std::string_view to_string(DomainShapeKind kind) noexcept
{
  switch (kind) {
    case DomainShapeKind::Primitive:
      return "Primitive";
    case DomainShapeKind::NullableWrapper:
      return "NullableWrapper";
    case DomainShapeKind::SequenceWrapper:
      return "SequenceWrapper";
    case DomainShapeKind::TransparentWrapper:
      return "TransparentWrapper";
    case DomainShapeKind::TaggedEnum:
      return "TaggedEnum";
    case DomainShapeKind::CustomAggregate:
      return "CustomAggregate";
  }
  return "CustomAggregate";
}

// ============================================================================
// DomainFieldShape
// ============================================================================

DomainFieldShape DomainFieldShape::leaf(DomainShapeKind kind, std::string type_text, bool unqualified)
{
  DomainFieldShape s;
  s.kind_ = kind;
  s.type_text_ = std::move(type_text);
  s.unqualified_ = unqualified;
  return s;
}

DomainFieldShape DomainFieldShape::wrapper(
  DomainShapeKind kind, std::string type_text, DomainFieldShape inner)
{
  DomainFieldShape s;
  s.kind_ = kind;
  s.type_text_ = std::move(type_text);
  s.inner_ = std::make_shared<const DomainFieldShape>(std::move(inner));
  return s;
}

bool DomainFieldShape::is_nullable_sequence() const noexcept
{
  return is_nullable() && inner_ && inner_->is_sequence();
}

const DomainFieldShape & DomainFieldShape::value_shape() const noexcept
{
  if (is_nullable() && inner_) {
    return *inner_;
  }
  return *this;
}

const DomainFieldShape & DomainFieldShape::element_shape() const noexcept
{
  const DomainFieldShape & v = value_shape();
  if (v.is_sequence() && v.inner_) {
    return *v.inner_;
  }
  return v;
}

std::string DomainFieldShape::describe() const
{
  std::string out(to_string(kind_));
  if (inner_) {
    out += "(" + inner_->describe() + ")";
  }
  return out;
}

bool operator==(const DomainFieldShape & a, const DomainFieldShape & b)
{
  if (a.kind_ != b.kind_ || a.type_text_ != b.type_text_ || a.unqualified_ != b.unqualified_) {
    return false;
  }
  if (static_cast<bool>(a.inner_) != static_cast<bool>(b.inner_)) {
    return false;
  }
  return !a.inner_ || *a.inner_ == *b.inner_;
}

// ============================================================================
// Classification
// ============================================================================

namespace
{

bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

bool is_identifier(std::string_view text)
{
  if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())) != 0) {
    return false;
  }
  for (const char c : text) {
    if (!is_ident_char(c)) {
      return false;
    }
  }
  return true;
}

struct TemplateSplit
{
  std::string name;
  std::string first_argument;
};

/// Split "name<arg, ...>" when the first '<' closes at the final '>'.
std::optional<TemplateSplit> split_template(const std::string & text)
{
  const auto open = text.find('<');
  if (open == std::string::npos || open == 0 || text.back() != '>') {
    return std::nullopt;
  }

  int depth = 0;
  std::size_t first_arg_end = std::string::npos;
  for (std::size_t i = open; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '<') {
      ++depth;
    } else if (c == '>') {
      --depth;
      if (depth == 0 && i != text.size() - 1) {
        return std::nullopt;  // e.g. "A<B>::C<D>"
      }
    } else if (c == ',' && depth == 1 && first_arg_end == std::string::npos) {
      first_arg_end = i;
    }
  }
  if (depth != 0) {
    return std::nullopt;
  }

  const std::size_t arg_end =
    first_arg_end == std::string::npos ? text.size() - 1 : first_arg_end;
  return TemplateSplit{text.substr(0, open), text.substr(open + 1, arg_end - open - 1)};
}

}  // namespace

std::string normalize_type_text(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      out += c;
      continue;
    }
    // Keep a single space only between two identifier characters ("unsigned int").
    std::size_t j = i;
    while (j < text.size() && std::isspace(static_cast<unsigned char>(text[j])) != 0) {
      ++j;
    }
    if (!out.empty() && j < text.size() && is_ident_char(out.back()) && is_ident_char(text[j])) {
      out += ' ';
    }
    i = j - 1;
  }
  return out;
}

namespace
{

/// Transparent declarations may refer to each other; bound the nesting.
constexpr int k_max_transparent_depth = 16;

DomainFieldShape classify_impl(std::string_view type_text, const TypeRegistry & registry, int depth)
{
  std::string text = normalize_type_text(type_text);

  if (auto split = split_template(text)) {
    if (registry.is_nullable_wrapper(split->name)) {
      return DomainFieldShape::wrapper(
        DomainShapeKind::NullableWrapper, text,
        classify_impl(split->first_argument, registry, depth));
    }
    if (registry.is_sequence_wrapper(split->name)) {
      return DomainFieldShape::wrapper(
        DomainShapeKind::SequenceWrapper, text,
        classify_impl(split->first_argument, registry, depth));
    }
  }

  if (registry.is_primitive(text)) {
    return DomainFieldShape::leaf(DomainShapeKind::Primitive, text);
  }

  const bool unqualified = is_identifier(text);

  if (registry.is_enum(text)) {
    return DomainFieldShape::leaf(DomainShapeKind::TaggedEnum, text, unqualified);
  }

  if (const TransparentDecl * decl = registry.find_transparent(text)) {
    if (depth < k_max_transparent_depth) {
      DomainFieldShape inner = classify_impl(decl->inner, registry, depth + 1);
      return DomainFieldShape::wrapper(
        DomainShapeKind::TransparentWrapper, text, std::move(inner));
    }
  }

  return DomainFieldShape::leaf(DomainShapeKind::CustomAggregate, text, unqualified);
}

}  // namespace

DomainFieldShape classify_field_type(std::string_view type_text, const TypeRegistry & registry)
{
  return classify_impl(type_text, registry, 0);
}

}  // namespace wirebind
