// wirebind/strategy/conversion_strategy.cpp - Conversion strategy taxonomy
#include "wirebind/strategy/conversion_strategy.hpp"

#include <utility>

namespace wirebind
{

std::string ErrorMode::describe() const
{
  switch (kind_) {
    case Kind::None:
      return "None";
    case Kind::Panic:
      return "Panic";
    case Kind::Error:
      return "Error";
    case Kind::Default:
      return default_fn_ ? "Default(" + *default_fn_ + ")" : "Default";
  }
  return "None";
}

std::string_view to_string(StrategyKind kind) noexcept
{
  switch (kind) {
    case StrategyKind::Ignore:
      return "Ignore";
    case StrategyKind::Custom:
      return "Custom";
    case StrategyKind::Direct:
      return "Direct";
    case StrategyKind::Option:
      return "Option";
    case StrategyKind::Transparent:
      return "Transparent";
    case StrategyKind::Collection:
      return "Collection";
  }
  return "Ignore";
}

// ============================================================================
// Factories
// ============================================================================

ConversionStrategy ConversionStrategy::ignore(ErrorMode mode)
{
  ConversionStrategy s(StrategyKind::Ignore);
  s.error_mode_ = std::move(mode);
  return s;
}

ConversionStrategy ConversionStrategy::custom(
  std::optional<std::string> from_wire_fn, std::optional<std::string> to_wire_fn, ErrorMode mode)
{
  ConversionStrategy s(StrategyKind::Custom);
  s.from_wire_fn_ = std::move(from_wire_fn);
  s.to_wire_fn_ = std::move(to_wire_fn);
  s.error_mode_ = std::move(mode);
  return s;
}

ConversionStrategy ConversionStrategy::direct(DirectVariant variant)
{
  ConversionStrategy s(StrategyKind::Direct);
  s.direct_ = variant;
  return s;
}

ConversionStrategy ConversionStrategy::option_wrap()
{
  ConversionStrategy s(StrategyKind::Option);
  s.option_ = OptionVariant::Wrap;
  return s;
}

ConversionStrategy ConversionStrategy::option_unwrap(ErrorMode mode)
{
  ConversionStrategy s(StrategyKind::Option);
  s.option_ = OptionVariant::Unwrap;
  s.error_mode_ = std::move(mode);
  return s;
}

ConversionStrategy ConversionStrategy::option_map()
{
  ConversionStrategy s(StrategyKind::Option);
  s.option_ = OptionVariant::Map;
  return s;
}

ConversionStrategy ConversionStrategy::transparent(ErrorMode mode)
{
  ConversionStrategy s(StrategyKind::Transparent);
  s.error_mode_ = std::move(mode);
  return s;
}

ConversionStrategy ConversionStrategy::collect(ErrorMode mode)
{
  ConversionStrategy s(StrategyKind::Collection);
  s.collection_ = CollectionVariant::Collect;
  s.error_mode_ = std::move(mode);
  return s;
}

ConversionStrategy ConversionStrategy::collection_map_option()
{
  ConversionStrategy s(StrategyKind::Collection);
  s.collection_ = CollectionVariant::MapOption;
  return s;
}

ConversionStrategy ConversionStrategy::collection_direct_assignment()
{
  ConversionStrategy s(StrategyKind::Collection);
  s.collection_ = CollectionVariant::DirectAssignment;
  return s;
}

// ============================================================================
// Description
// ============================================================================

std::string ConversionStrategy::describe() const
{
  switch (kind_) {
    case StrategyKind::Ignore:
      return error_mode_.kind() == ErrorMode::Kind::None ? "Ignore"
                                                         : "Ignore(" + error_mode_.describe() + ")";
    case StrategyKind::Custom: {
      std::string out =
        "Custom(from=" + from_wire_fn_.value_or("-") + ", to=" + to_wire_fn_.value_or("-");
      if (error_mode_.kind() != ErrorMode::Kind::None) {
        out += ", " + error_mode_.describe();
      }
      return out + ")";
    }
    case StrategyKind::Direct:
      return direct_ == DirectVariant::Assignment ? "Direct.Assignment" : "Direct.WithConversion";
    case StrategyKind::Option:
      switch (option_) {
        case OptionVariant::Wrap:
          return "Option.Wrap";
        case OptionVariant::Unwrap:
          return "Option.Unwrap(" + error_mode_.describe() + ")";
        case OptionVariant::Map:
          return "Option.Map";
      }
      break;
    case StrategyKind::Transparent:
      return "Transparent(" + error_mode_.describe() + ")";
    case StrategyKind::Collection:
      switch (collection_) {
        case CollectionVariant::Collect:
          return "Collection.Collect(" + error_mode_.describe() + ")";
        case CollectionVariant::MapOption:
          return "Collection.MapOption";
        case CollectionVariant::DirectAssignment:
          return "Collection.DirectAssignment";
      }
      break;
  }
  return "Ignore";
}

bool operator==(const ConversionStrategy & a, const ConversionStrategy & b)
{
  if (a.kind_ != b.kind_ || a.error_mode_ != b.error_mode_) {
    return false;
  }
  switch (a.kind_) {
    case StrategyKind::Ignore:
    case StrategyKind::Transparent:
      return true;
    case StrategyKind::Custom:
      return a.from_wire_fn_ == b.from_wire_fn_ && a.to_wire_fn_ == b.to_wire_fn_;
    case StrategyKind::Direct:
      return a.direct_ == b.direct_;
    case StrategyKind::Option:
      return a.option_ == b.option_;
    case StrategyKind::Collection:
      return a.collection_ == b.collection_;
  }
  return false;
}

}  // namespace wirebind
