// wirebind/codegen/code_synthesizer.cpp - Per-field conversion statement templates
#include "wirebind/codegen/code_synthesizer.hpp"

#include <fmt/core.h>

#include <cctype>
#include <set>

namespace wirebind
{

// ============================================================================
// ValueConversion
// ============================================================================

ValueConversion ValueConversion::identity() { return ValueConversion{}; }

ValueConversion ValueConversion::overloaded_call(const std::string & qualifier)
{
  ValueConversion v;
  v.from_prefix_ = qualifier + "from_wire(";
  v.from_suffix_ = ")";
  v.to_prefix_ = qualifier + "to_wire(";
  v.to_suffix_ = ")";
  return v;
}

ValueConversion ValueConversion::transparent(
  const std::string & domain_type, const std::string & member, const ValueConversion & inner)
{
  ValueConversion v;
  v.from_prefix_ = domain_type + "{" + inner.from_prefix_;
  v.from_suffix_ = inner.from_suffix_ + "}";
  v.to_prefix_ = inner.to_prefix_ + "(";
  v.to_suffix_ = ")." + member + inner.to_suffix_;
  return v;
}

ValueConversion ValueConversion::with_wire_cast(const std::string & wire_type) const
{
  ValueConversion v = *this;
  v.from_prefix_ = from_prefix_ + "static_cast<" + wire_type + ">(";
  v.from_suffix_ = ")" + from_suffix_;
  return v;
}

std::string ValueConversion::from_wire(std::string_view expr) const
{
  return from_prefix_ + std::string(expr) + from_suffix_;
}

std::string ValueConversion::to_wire(std::string_view expr) const
{
  return to_prefix_ + std::string(expr) + to_suffix_;
}

bool ValueConversion::is_identity() const noexcept
{
  return from_prefix_.empty() && from_suffix_.empty() && to_prefix_.empty() && to_suffix_.empty();
}

// ============================================================================
// Emission helpers
// ============================================================================

namespace
{

/// Accumulates indented statement lines.
class Lines
{
public:
  explicit Lines(std::string indent) : indent_(std::move(indent)) {}

  void line(const std::string & text)
  {
    out_ += indent_;
    out_ += std::string(depth_ * 2, ' ');
    out_ += text;
    out_ += '\n';
  }

  void open(const std::string & text)
  {
    line(text + " {");
    ++depth_;
  }

  void close()
  {
    --depth_;
    line("}");
  }

  /// "} else {"
  void otherwise()
  {
    --depth_;
    line("} else {");
    ++depth_;
  }

  [[nodiscard]] std::string str() const { return out_; }

private:
  std::string indent_;
  std::string out_;
  int depth_ = 0;
};

struct Access
{
  const FieldIdentifiers & ids;

  [[nodiscard]] std::string out() const { return "out." + ids.field; }
  [[nodiscard]] std::string domain() const { return "domain." + ids.field; }
  [[nodiscard]] std::string get() const { return fmt::format("wire.{}()", ids.wire_accessor); }
  [[nodiscard]] std::string has() const { return fmt::format("wire.has_{}()", ids.wire_accessor); }
  [[nodiscard]] std::string mut() const { return fmt::format("wire.mutable_{}()", ids.wire_accessor); }

  /// Statement storing a single value into the wire field.
  [[nodiscard]] std::string store(const std::string & value) const
  {
    if (ids.wire_message_like || ids.wire_repeated) {
      return fmt::format("*{} = {};", mut(), value);
    }
    return fmt::format("wire.set_{}({});", ids.wire_accessor, value);
  }

  [[nodiscard]] std::string append(const std::string & value) const
  {
    return fmt::format("wirebind::runtime::append(*{}, {});", mut(), value);
  }

  [[nodiscard]] std::string panic() const
  {
    return fmt::format(
      "wirebind::runtime::missing_field_panic(\"{}\", \"{}\");", ids.aggregate, ids.field);
  }
};

/// Statement run when the wire value is absent; nothing for ErrorMode::None.
void emit_missing(Lines & l, const ErrorMode & mode, const Access & a)
{
  switch (mode.kind()) {
    case ErrorMode::Kind::None:
      break;
    case ErrorMode::Kind::Panic:
      l.line(a.panic());
      break;
    case ErrorMode::Kind::Error:
      l.line(fmt::format("return {}::fail({});", a.ids.result_type, a.ids.error_expression));
      break;
    case ErrorMode::Kind::Default:
      if (mode.default_fn()) {
        l.line(fmt::format("{} = {}();", a.out(), *mode.default_fn()));
      } else {
        l.line(fmt::format("{} = {}{{}};", a.out(), a.ids.domain_type));
      }
      break;
  }
}

/// Assigns a possibly absent wire value, falling back per error mode.
void emit_presence_checked(
  Lines & l, const ErrorMode & mode, const Access & a, const std::string & value)
{
  const std::string assign = fmt::format("{} = {};", a.out(), value);
  if (!a.ids.wire_optional) {
    l.line(assign);
    return;
  }
  l.open(fmt::format("if ({})", a.has()));
  l.line(assign);
  if (mode.kind() != ErrorMode::Kind::None) {
    l.otherwise();
    emit_missing(l, mode, a);
  }
  l.close();
}

/// Writes a domain value that may be nullable.
void emit_store_value(Lines & l, const Access & a)
{
  if (a.ids.domain_nullable) {
    l.open(fmt::format("if ({})", a.domain()));
    l.line(a.store(a.ids.value.to_wire("*" + a.domain())));
    l.close();
  } else {
    l.line(a.store(a.ids.value.to_wire(a.domain())));
  }
}

void emit_collect_loop(Lines & l, const Access & a, const std::string & target)
{
  l.line(fmt::format("{}reserve({}.size());", target, a.get()));
  l.open(fmt::format("for (const auto & item : {})", a.get()));
  l.line(fmt::format("{}push_back({});", target, a.ids.value.from_wire("item")));
  l.close();
}

void emit_append_loop(Lines & l, const Access & a, const std::string & source)
{
  l.open(fmt::format("for (const auto & item : {})", source));
  l.line(a.append(a.ids.value.to_wire("item")));
  l.close();
}

}  // namespace

// ============================================================================
// CodeSynthesizer
// ============================================================================

std::string CodeSynthesizer::synthesize(
  const ConversionStrategy & strategy, Direction direction, const FieldIdentifiers & ids)
{
  return direction == Direction::WireToDomain ? wire_to_domain(strategy, ids)
                                              : domain_to_wire(strategy, ids);
}

std::string CodeSynthesizer::wire_to_domain(
  const ConversionStrategy & strategy, const FieldIdentifiers & ids)
{
  Lines l(ids.indent);
  const Access a{ids};

  switch (strategy.kind()) {
    case StrategyKind::Ignore: {
      // Value-initialised by the enclosing conversion unless a default function is named.
      const ErrorMode & mode = strategy.error_mode();
      if (mode.kind() == ErrorMode::Kind::Default && mode.default_fn()) {
        l.line(fmt::format("{} = {}();", a.out(), *mode.default_fn()));
      }
      break;
    }

    case StrategyKind::Custom: {
      const auto & fn = strategy.custom_from_wire_fn();
      const std::string value =
        fn ? fmt::format("{}({})", *fn, a.get()) : ids.value.from_wire(a.get());
      emit_presence_checked(l, strategy.error_mode(), a, value);
      break;
    }

    case StrategyKind::Direct:
      if (strategy.direct_variant() == DirectVariant::Assignment) {
        l.line(fmt::format("{} = {};", a.out(), a.get()));
      } else {
        l.line(fmt::format("{} = {};", a.out(), ids.value.from_wire(a.get())));
      }
      break;

    case StrategyKind::Option:
      switch (strategy.option_variant()) {
        case OptionVariant::Wrap:
          l.line(fmt::format("{} = {};", a.out(), ids.value.from_wire(a.get())));
          break;
        case OptionVariant::Unwrap:
          emit_presence_checked(l, strategy.error_mode(), a, ids.value.from_wire(a.get()));
          break;
        case OptionVariant::Map:
          l.open(fmt::format("if ({})", a.has()));
          l.line(fmt::format("{} = {};", a.out(), ids.value.from_wire(a.get())));
          l.close();
          break;
      }
      break;

    case StrategyKind::Transparent:
      emit_presence_checked(l, strategy.error_mode(), a, ids.value.from_wire(a.get()));
      break;

    case StrategyKind::Collection:
      switch (strategy.collection_variant()) {
        case CollectionVariant::Collect: {
          const ErrorMode & mode = strategy.error_mode();
          const bool checks_empty =
            mode.kind() == ErrorMode::Kind::Panic || mode.kind() == ErrorMode::Kind::Error ||
            (mode.kind() == ErrorMode::Kind::Default && mode.default_fn());
          if (checks_empty) {
            l.open(fmt::format("if ({}.empty())", a.get()));
            emit_missing(l, mode, a);
            l.otherwise();
            emit_collect_loop(l, a, a.out() + ".");
            l.close();
          } else {
            emit_collect_loop(l, a, a.out() + ".");
          }
          break;
        }
        case CollectionVariant::MapOption:
          l.open(fmt::format("if (!{}.empty())", a.get()));
          l.line(fmt::format("{}.emplace();", a.out()));
          emit_collect_loop(l, a, a.out() + "->");
          l.close();
          break;
        case CollectionVariant::DirectAssignment:
          l.line(fmt::format("{}.assign({}.begin(), {}.end());", a.out(), a.get(), a.get()));
          break;
      }
      break;
  }

  return l.str();
}

std::string CodeSynthesizer::domain_to_wire(
  const ConversionStrategy & strategy, const FieldIdentifiers & ids)
{
  Lines l(ids.indent);
  const Access a{ids};

  switch (strategy.kind()) {
    case StrategyKind::Ignore:
      break;

    case StrategyKind::Custom:
      if (const auto & fn = strategy.custom_to_wire_fn()) {
        if (ids.domain_nullable) {
          l.open(fmt::format("if ({})", a.domain()));
          l.line(a.store(fmt::format("{}(*{})", *fn, a.domain())));
          l.close();
        } else {
          l.line(a.store(fmt::format("{}({})", *fn, a.domain())));
        }
      } else {
        emit_store_value(l, a);
      }
      break;

    case StrategyKind::Direct:
      if (strategy.direct_variant() == DirectVariant::Assignment) {
        l.line(a.store(a.domain()));
      } else {
        emit_store_value(l, a);
      }
      break;

    case StrategyKind::Option:
    case StrategyKind::Transparent:
      emit_store_value(l, a);
      break;

    case StrategyKind::Collection:
      switch (strategy.collection_variant()) {
        case CollectionVariant::Collect:
          emit_append_loop(l, a, a.domain());
          break;
        case CollectionVariant::MapOption:
          l.open(fmt::format("if ({})", a.domain()));
          emit_append_loop(l, a, "*" + a.domain());
          l.close();
          break;
        case CollectionVariant::DirectAssignment:
          l.line(fmt::format("{}->Add({}.begin(), {}.end());", a.mut(), a.domain(), a.domain()));
          break;
      }
      break;
  }

  return l.str();
}

// ============================================================================
// Accessor names
// ============================================================================

std::string wire_accessor_name(std::string_view wire_field_name)
{
  // protoc appends '_' to field names that are C++ keywords.
  static const std::set<std::string, std::less<>> k_keywords = {
    "alignas",  "alignof",   "and",       "and_eq",       "asm",          "auto",
    "bitand",   "bitor",     "bool",      "break",        "case",         "catch",
    "char",     "class",     "compl",     "const",        "constexpr",    "const_cast",
    "continue", "decltype",  "default",   "delete",       "do",           "double",
    "dynamic_cast", "else",  "enum",      "explicit",     "export",       "extern",
    "false",    "float",     "for",       "friend",       "goto",         "if",
    "inline",   "int",       "long",      "mutable",      "namespace",    "new",
    "noexcept", "not",       "not_eq",    "nullptr",      "operator",     "or",
    "or_eq",    "private",   "protected", "public",       "register",     "reinterpret_cast",
    "return",   "short",     "signed",    "sizeof",       "static",       "static_assert",
    "static_cast", "struct", "switch",    "template",     "this",         "thread_local",
    "throw",    "true",      "try",       "typedef",      "typeid",       "typename",
    "union",    "unsigned",  "using",     "virtual",      "void",         "volatile",
    "wchar_t",  "while",     "xor",       "xor_eq",
  };

  std::string out;
  out.reserve(wire_field_name.size() + 1);
  for (const char c : wire_field_name) {
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (k_keywords.count(out) != 0) {
    out += '_';
  }
  return out;
}

}  // namespace wirebind
