// wirebind/analysis/wire_shape.hpp - Wire shape inference
//
// Determines how a domain field is represented on the wire, using a
// priority waterfall: explicit override, side channel, structural pattern,
// usage-pattern heuristic. If nothing answers, the field is ambiguous.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "wirebind/analysis/directive.hpp"
#include "wirebind/analysis/field_shape.hpp"
#include "wirebind/analysis/side_channel.hpp"
#include "wirebind/basic/diagnostic.hpp"
#include "wirebind/schema/schema_document.hpp"

namespace wirebind
{

enum class WireMapping : uint8_t {
  Scalar,         ///< always-present scalar or enum
  Optional,       ///< scalar or enum with explicit presence
  Repeated,       ///< repeated field, absence is emptiness
  Message,        ///< nested message
  CustomDerived,  ///< message produced by user conversion functions
};

[[nodiscard]] std::string_view to_string(WireMapping mapping) noexcept;

/**
 * Mapping and optionality of the wire counterpart of a field.
 *
 * A repeated mapping is never optional; the factory enforces it.
 */
class WireFieldShape
{
public:
  [[nodiscard]] static WireFieldShape make(WireMapping mapping, Optionality optionality) noexcept;

  [[nodiscard]] WireMapping mapping() const noexcept { return mapping_; }
  [[nodiscard]] Optionality optionality() const noexcept { return optionality_; }

  /// optionality = Optional and mapping != Repeated
  [[nodiscard]] bool is_optional() const noexcept
  {
    return optionality_ == Optionality::Optional && mapping_ != WireMapping::Repeated;
  }

  [[nodiscard]] bool is_repeated() const noexcept { return mapping_ == WireMapping::Repeated; }

  /// True when the wire field is written through mutable_x() rather than set_x().
  [[nodiscard]] bool is_message_like() const noexcept
  {
    return mapping_ == WireMapping::Message || mapping_ == WireMapping::CustomDerived;
  }

  /// e.g. "Optional/Optional", "Repeated/Required"
  [[nodiscard]] std::string describe() const;

  friend bool operator==(const WireFieldShape & a, const WireFieldShape & b)
  {
    return a.mapping_ == b.mapping_ && a.optionality_ == b.optionality_;
  }
  friend bool operator!=(const WireFieldShape & a, const WireFieldShape & b) { return !(a == b); }

private:
  WireFieldShape(WireMapping mapping, Optionality optionality) noexcept
  : mapping_(mapping), optionality_(optionality)
  {
  }

  WireMapping mapping_;
  Optionality optionality_;
};

/**
 * Which waterfall tier produced the answer.
 */
enum class InferenceTier : uint8_t {
  Skipped,        ///< ignored field, no wire counterpart
  Explicit,       ///< optional / required directive
  SideChannel,    ///< external lookup
  Structural,     ///< shape of the domain type
  UsagePattern,   ///< expect / default directives, aggregate heuristic
};

[[nodiscard]] std::string_view to_string(InferenceTier tier) noexcept;

struct WireShapeInference
{
  WireFieldShape shape;
  InferenceTier tier;
};

/**
 * Lookup key of the wire field: message and field names after renames.
 */
struct WireFieldKey
{
  std::string message;
  std::string field;
};

/**
 * Mapping used for a domain shape once optionality is known.
 */
[[nodiscard]] WireMapping structural_mapping(
  const DomainFieldShape & shape, const FieldAnnotation & annotation, Optionality optionality);

/**
 * Runs the inference waterfall for one field.
 */
class WireShapeInferrer
{
public:
  /**
   * @param side_channel Consulted at tier 2; may be nullptr
   * @param diags Receives AmbiguousOptionality errors and heuristic warnings
   */
  WireShapeInferrer(const SideChannel * side_channel, DiagnosticBag * diags);

  /**
   * Infer the wire shape.
   *
   * @return std::nullopt after reporting AmbiguousOptionality
   */
  [[nodiscard]] std::optional<WireShapeInference> infer(
    const FieldDescriptor & field, const FieldAnnotation & annotation,
    const DomainFieldShape & shape, const WireFieldKey & key);

private:
  const SideChannel * side_channel_;
  DiagnosticBag * diags_;
};

}  // namespace wirebind
