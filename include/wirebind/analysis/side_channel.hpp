// wirebind/analysis/side_channel.hpp - External wire optionality metadata
//
// The side channel answers "is this wire field optional?" before any
// heuristic runs. Answers come from a lookup table, usually produced by
// scanning the .proto sources.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace wirebind
{

/**
 * Best-effort optionality lookup keyed by wire message and wire field name.
 *
 * Implementations are read-only once constructed.
 */
class SideChannel
{
public:
  virtual ~SideChannel() = default;

  /**
   * @return true if the wire field can be absent, false if always present,
   *         std::nullopt if the channel has no answer
   */
  [[nodiscard]] virtual std::optional<bool> get_field_optionality(
    std::string_view aggregate_name, std::string_view field_name) const = 0;
};

/**
 * Never answers.
 */
class NullSideChannel : public SideChannel
{
public:
  [[nodiscard]] std::optional<bool> get_field_optionality(
    std::string_view aggregate_name, std::string_view field_name) const override;
};

/**
 * In-memory table, serialisable as {"Message": {"field": true}}.
 */
class TableSideChannel : public SideChannel
{
public:
  [[nodiscard]] std::optional<bool> get_field_optionality(
    std::string_view aggregate_name, std::string_view field_name) const override;

  void set(const std::string & message, const std::string & field, bool optional);

  /// Copy all entries of another table, overwriting duplicates.
  void merge(const TableSideChannel & other);

  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept;

  [[nodiscard]] nlohmann::json to_json() const;

  /**
   * Build a table from JSON.
   *
   * @param j Object of objects of booleans
   * @param error Receives a message on failure
   */
  [[nodiscard]] static std::optional<TableSideChannel> from_json(
    const nlohmann::json & j, std::string & error);

  /// Load a JSON lookup file written by `wbc scan-proto`.
  [[nodiscard]] static std::optional<TableSideChannel> load_file(
    const std::filesystem::path & path, std::string & error);

private:
  std::map<std::string, std::map<std::string, bool, std::less<>>, std::less<>> entries_;
};

// ============================================================================
// .proto scanning
// ============================================================================

/**
 * Line-based scanner over .proto sources.
 *
 * Not a protobuf parser: it tracks message nesting by braces and reads the
 * field label. Rules:
 *   - `optional` label: optional
 *   - `repeated`, `required`, `map<...>`: not optional
 *   - no label, message-typed: optional (proto3 messages have presence)
 *   - no label, scalar or enum typed: not optional
 * Nested messages are recorded under their unqualified name.
 */
class ProtoScanner
{
public:
  /// Scan one file's text.
  void scan_text(std::string_view text);

  /**
   * Scan a file.
   *
   * @return false if the file cannot be read
   */
  [[nodiscard]] bool scan_file(const std::filesystem::path & path);

  /**
   * Produce the lookup table. Enum names collected across all scanned files
   * are resolved here, so scan every file before calling.
   */
  [[nodiscard]] TableSideChannel build() const;

private:
  struct ScannedField
  {
    std::string message;
    std::string field;
    std::string type;
    std::string label;  // "", "optional", "repeated", "required", "map"
  };

  std::vector<ScannedField> fields_;
  std::vector<std::string> enum_names_;
};

}  // namespace wirebind
