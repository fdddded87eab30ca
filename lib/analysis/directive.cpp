// wirebind/analysis/directive.cpp - Directive parser implementation
#include "wirebind/analysis/directive.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace wirebind
{

std::string_view to_string(ExpectMode mode) noexcept
{
  switch (mode) {
    case ExpectMode::None:
      return "None";
    case ExpectMode::Panic:
      return "Panic";
    case ExpectMode::Error:
      return "Error";
  }
  return "None";
}

std::string_view to_string(Optionality optionality) noexcept
{
  return optionality == Optionality::Optional ? "Optional" : "Required";
}

namespace
{

// ============================================================================
// Tokenizer
// ============================================================================

enum class DirectiveForm : uint8_t {
  Bare,    // name
  Call,    // name(arg)
  Assign,  // name = value
};

struct RawDirective
{
  std::string name;
  DirectiveForm form = DirectiveForm::Bare;

  /// Parsed argument; nullopt when missing or not a literal/identifier
  std::optional<std::string> argument;
  bool quoted = false;

  std::string text;
};

std::string trim(std::string_view s)
{
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
  return std::string(s.substr(b, e - b));
}

bool is_qualified_identifier(std::string_view s)
{
  if (s.empty()) {
    return false;
  }
  bool expect_start = true;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (expect_start) {
      if (std::isalpha(static_cast<unsigned char>(c)) == 0 && c != '_') {
        return false;
      }
      expect_start = false;
    } else if (c == ':') {
      if (i + 1 >= s.size() || s[i + 1] != ':') {
        return false;
      }
      ++i;
      expect_start = true;
    } else if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
      return false;
    }
  }
  return !expect_start;
}

/// Split on commas that are outside quotes and parentheses.
std::vector<std::string> split_top_level(std::string_view token)
{
  std::vector<std::string> parts;
  std::string current;
  bool in_quote = false;
  int depth = 0;
  for (const char c : token) {
    if (c == '"') {
      in_quote = !in_quote;
    } else if (!in_quote && c == '(') {
      ++depth;
    } else if (!in_quote && c == ')') {
      --depth;
    } else if (!in_quote && depth == 0 && c == ',') {
      parts.push_back(trim(current));
      current.clear();
      continue;
    }
    current += c;
  }
  parts.push_back(trim(current));
  return parts;
}

void parse_value(std::string_view raw, RawDirective & out)
{
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    out.argument = value.substr(1, value.size() - 2);
    out.quoted = true;
  } else if (is_qualified_identifier(value)) {
    out.argument = value;
  }
}

RawDirective tokenize_one(const std::string & text)
{
  RawDirective d;
  d.text = text;

  // '=' outside quotes
  bool in_quote = false;
  std::size_t eq = std::string::npos;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '"') {
      in_quote = !in_quote;
    } else if (!in_quote && text[i] == '=') {
      eq = i;
      break;
    }
  }

  if (eq != std::string::npos) {
    d.name = trim(std::string_view(text).substr(0, eq));
    d.form = DirectiveForm::Assign;
    parse_value(std::string_view(text).substr(eq + 1), d);
    return d;
  }

  const auto open = text.find('(');
  if (open != std::string::npos && text.back() == ')') {
    d.name = trim(std::string_view(text).substr(0, open));
    d.form = DirectiveForm::Call;
    parse_value(std::string_view(text).substr(open + 1, text.size() - open - 2), d);
    return d;
  }

  d.name = text;
  return d;
}

std::vector<RawDirective> tokenize(gsl::span<const std::string> tokens)
{
  std::vector<RawDirective> out;
  for (const auto & token : tokens) {
    for (auto & part : split_top_level(token)) {
      if (!part.empty()) {
        out.push_back(tokenize_one(part));
      }
    }
  }
  return out;
}

// ============================================================================
// Reporting context
// ============================================================================

class DirectiveContext
{
public:
  DirectiveContext(DiagnosticBag * diags, std::string aggregate, std::string field, SourceLocation loc)
  : diags_(diags), aggregate_(std::move(aggregate)), field_(std::move(field)), loc_(std::move(loc))
  {
  }

  void error(DiagnosticKind kind, std::string message, std::string help)
  {
    failed_ = true;
    if (diags_ == nullptr) {
      return;
    }
    diags_->report_error(kind, std::move(message))
      .in_aggregate(aggregate_)
      .on_field(field_)
      .at(loc_)
      .with_help(std::move(help));
  }

  void unknown(const RawDirective & d, const char * known)
  {
    if (diags_ == nullptr) {
      return;
    }
    diags_->report_warning(DiagnosticKind::UnknownDirective, "unknown directive '" + d.name + "'")
      .in_aggregate(aggregate_)
      .on_field(field_)
      .at(loc_)
      .with_help(std::string("known directives: ") + known);
  }

  void malformed(const RawDirective & d, const std::string & expectation)
  {
    error(
      DiagnosticKind::MalformedDirectiveValue,
      "malformed value in directive '" + d.text + "'",
      "'" + d.name + "' " + expectation);
  }

  /// Store a string-valued directive, reporting a conflict on a differing repeat.
  void assign(std::optional<std::string> & slot, const RawDirective & d)
  {
    if (slot && *slot != *d.argument) {
      error(
        DiagnosticKind::ConflictingAnnotation,
        "directive '" + d.name + "' given twice with different values",
        "keep one of '" + *slot + "' or '" + *d.argument + "'");
      return;
    }
    slot = *d.argument;
  }

  [[nodiscard]] bool failed() const { return failed_; }

private:
  DiagnosticBag * diags_;
  std::string aggregate_;
  std::string field_;
  SourceLocation loc_;
  bool failed_ = false;
};

/// `flag`, `flag = true` or `flag = false`. Returns nullopt on a malformed form.
std::optional<bool> flag_value(const RawDirective & d)
{
  if (d.form == DirectiveForm::Bare) {
    return true;
  }
  if (d.form == DirectiveForm::Assign && d.argument && !d.quoted) {
    if (*d.argument == "true") return true;
    if (*d.argument == "false") return false;
  }
  return std::nullopt;
}

/// `name = value` with a literal or identifier. Empty literals are kept when allowed.
bool has_assigned_value(const RawDirective & d, bool allow_empty)
{
  return d.form == DirectiveForm::Assign && d.argument && (allow_empty || !d.argument->empty());
}

constexpr const char * k_field_directives =
  "ignore, transparent, wire_scalar, expect, expect(panic), expect(error), default, "
  "default = \"fn\", rename = \"name\", optional, required, from_wire_fn = \"fn\", "
  "to_wire_fn = \"fn\", error_fn = \"fn\", error_type = Type";

constexpr const char * k_aggregate_directives =
  "namespace = \"ns\", wire_name = \"Name\", error_type = Type, error_fn = \"fn\"";

}  // namespace

// ============================================================================
// DirectiveParser
// ============================================================================

DirectiveParser::DirectiveParser(DiagnosticBag * diags) : diags_(diags) {}

std::optional<AggregateAnnotation> DirectiveParser::parse_aggregate(
  gsl::span<const std::string> tokens, const std::string & owner, const SourceLocation & location)
{
  DirectiveContext ctx(diags_, owner, "", location);
  AggregateAnnotation out;

  for (const auto & d : tokenize(tokens)) {
    if (d.name == "namespace") {
      if (!has_assigned_value(d, false)) {
        ctx.malformed(d, "expects a namespace, e.g. namespace = \"demo::model\"");
        continue;
      }
      ctx.assign(out.namespace_override, d);
    } else if (d.name == "wire_name" || d.name == "rename") {
      if (!has_assigned_value(d, false)) {
        ctx.malformed(d, "expects the wire type name, e.g. wire_name = \"BookMsg\"");
        continue;
      }
      ctx.assign(out.wire_name, d);
    } else if (d.name == "error_type") {
      if (!has_assigned_value(d, false)) {
        ctx.malformed(d, "expects a type name, e.g. error_type = LibraryError");
        continue;
      }
      ctx.assign(out.error_type, d);
    } else if (d.name == "error_fn") {
      if (!has_assigned_value(d, true)) {
        ctx.malformed(d, "expects a function name, e.g. error_fn = \"make_error\"");
        continue;
      }
      ctx.assign(out.error_fn, d);
    } else {
      ctx.unknown(d, k_aggregate_directives);
    }
  }

  if (ctx.failed()) {
    return std::nullopt;
  }
  return out;
}

std::optional<FieldAnnotation> DirectiveParser::parse_field(
  const FieldDescriptor & field, const AggregateAnnotation & inherited)
{
  DirectiveContext ctx(diags_, field.aggregate, field.name, field.location);
  FieldAnnotation out;
  bool saw_optional = false;
  bool saw_required = false;
  std::optional<ExpectMode> expect;

  for (const auto & d : tokenize(field.directives)) {
    if (d.name == "ignore" || d.name == "transparent" || d.name == "wire_scalar") {
      const auto v = flag_value(d);
      if (!v) {
        ctx.malformed(d, "is a flag and takes no value other than true/false");
        continue;
      }
      bool & slot = d.name == "ignore"        ? out.ignore
                    : d.name == "transparent" ? out.transparent
                                              : out.wire_scalar;
      slot = *v;
    } else if (d.name == "optional" || d.name == "required") {
      const auto v = flag_value(d);
      if (!v) {
        ctx.malformed(d, "is a flag and takes no value other than true/false");
        continue;
      }
      // `optional = false` reads as "required" and vice versa.
      const bool is_optional = (d.name == "optional") == *v;
      (is_optional ? saw_optional : saw_required) = true;
    } else if (d.name == "expect") {
      ExpectMode mode = ExpectMode::Error;
      if (d.form == DirectiveForm::Call && d.argument && *d.argument == "panic") {
        mode = ExpectMode::Panic;
      } else if (d.form == DirectiveForm::Call && d.argument && *d.argument == "error") {
        mode = ExpectMode::Error;
      } else if (d.form != DirectiveForm::Bare) {
        ctx.malformed(d, "accepts only 'panic' or 'error', e.g. expect(panic)");
        continue;
      }
      if (expect && *expect != mode) {
        ctx.error(
          DiagnosticKind::ConflictingAnnotation, "field has both expect(panic) and expect(error)",
          "keep a single expect directive");
        continue;
      }
      expect = mode;
    } else if (d.name == "default") {
      DefaultValue value;
      if (d.form == DirectiveForm::Assign) {
        if (!d.argument) {
          ctx.malformed(d, "expects a function name, e.g. default = \"default_count\"");
          continue;
        }
        value.function = *d.argument;
      } else if (d.form == DirectiveForm::Call) {
        ctx.malformed(d, "is written `default` or `default = \"fn\"`");
        continue;
      }
      if (out.default_value && !(*out.default_value == value)) {
        ctx.error(
          DiagnosticKind::ConflictingAnnotation, "directive 'default' given twice with different values",
          "keep a single default directive");
        continue;
      }
      out.default_value = std::move(value);
    } else if (d.name == "rename") {
      if (!has_assigned_value(d, false)) {
        ctx.malformed(d, "expects the wire field name, e.g. rename = \"display_name\"");
        continue;
      }
      ctx.assign(out.rename, d);
    } else if (d.name == "from_wire_fn" || d.name == "to_wire_fn" || d.name == "error_fn") {
      if (!has_assigned_value(d, true)) {
        ctx.malformed(d, "expects a function name, e.g. " + d.name + " = \"convert\"");
        continue;
      }
      auto & slot = d.name == "from_wire_fn" ? out.custom_from_wire_fn
                    : d.name == "to_wire_fn" ? out.custom_to_wire_fn
                                             : out.error_fn;
      ctx.assign(slot, d);
    } else if (d.name == "error_type") {
      if (!has_assigned_value(d, false)) {
        ctx.malformed(d, "expects a type name, e.g. error_type = LibraryError");
        continue;
      }
      ctx.assign(out.error_type, d);
    } else {
      ctx.unknown(d, k_field_directives);
    }
  }

  if (saw_optional && saw_required) {
    ctx.error(
      DiagnosticKind::ConflictingAnnotation, "field is marked both optional and required",
      "remove either 'optional' or 'required'");
  } else if (saw_optional) {
    out.explicit_optionality = Optionality::Optional;
  } else if (saw_required) {
    out.explicit_optionality = Optionality::Required;
  }

  if (expect) {
    out.expect_mode = *expect;
  }
  if (!out.error_type) {
    out.error_type = inherited.error_type;
  }
  if (!out.error_fn) {
    out.error_fn = inherited.error_fn;
  }

  if (ctx.failed()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace wirebind
