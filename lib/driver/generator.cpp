// wirebind/driver/generator.cpp - Generator driver implementation
//
#include "wirebind/driver/generator.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

#include "wirebind/codegen/aggregate_orchestrator.hpp"
#include "wirebind/codegen/header_emitter.hpp"
#include "wirebind/codegen/plan_dumper.hpp"
#include "wirebind/schema/schema_loader.hpp"

namespace wirebind
{

namespace
{

bool ends_with(const std::string & s, const std::string & suffix)
{
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

SourceLocation file_location(const std::filesystem::path & path)
{
  SourceLocation loc;
  loc.file = path.string();
  return loc;
}

}  // namespace

std::string Generator::output_file_name(const std::filesystem::path & schema)
{
  std::string name = schema.filename().string();
  if (ends_with(name, k_schema_file_extension)) {
    name.resize(name.size() - std::string(k_schema_file_extension).size());
  } else {
    name = schema.stem().string();
  }
  return name + ".wb.hpp";
}

std::optional<std::string> Generator::generate_header(
  const SchemaDocument & document, const SideChannel * side_channel,
  const GeneratorConfig & config, DiagnosticBag & diags)
{
  const size_t errors_before = diags.error_count();

  AggregateOrchestrator orchestrator(document, side_channel, &diags);
  const SchemaPlan plan = orchestrator.plan_schema();

  if (diags.error_count() > errors_before) {
    return std::nullopt;
  }

  EmitOptions emit;
  emit.emit_plan_comments = config.emit_plan_comments;
  emit.runtime_include = config.runtime_include;
  return HeaderEmitter(plan, emit).emit();
}

std::optional<TableSideChannel> Generator::build_side_channel(
  const std::vector<std::filesystem::path> & proto_files,
  const std::vector<std::filesystem::path> & lookup_files, DiagnosticBag & diags)
{
  bool ok = true;

  ProtoScanner scanner;
  for (const auto & proto : proto_files) {
    if (!scanner.scan_file(proto)) {
      diags.report_error(DiagnosticKind::IoError, "cannot read proto file: " + proto.string())
        .at(file_location(proto));
      ok = false;
    }
  }
  TableSideChannel table = scanner.build();

  // Lookup files are applied last so hand-written answers win over the scan.
  for (const auto & lookup : lookup_files) {
    std::string error;
    auto loaded = TableSideChannel::load_file(lookup, error);
    if (!loaded) {
      diags.report_error(DiagnosticKind::IoError, error).at(file_location(lookup));
      ok = false;
      continue;
    }
    table.merge(*loaded);
  }

  if (!ok) {
    return std::nullopt;
  }
  return table;
}

bool Generator::write_output(
  const std::filesystem::path & path, const std::string & text, DiagnosticBag & diags)
{
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  if (ec) {
    diags.report_error(
      DiagnosticKind::IoError,
      "cannot create output directory " + path.parent_path().string() + ": " + ec.message());
    return false;
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    diags.report_error(DiagnosticKind::IoError, "cannot open output file: " + path.string());
    return false;
  }
  out << text;
  if (!out.good()) {
    diags.report_error(DiagnosticKind::IoError, "failed to write output file: " + path.string());
    return false;
  }
  return true;
}

void Generator::process_schema(
  const std::filesystem::path & schema, const SideChannel * side_channel,
  const GenerateOptions & options, const std::filesystem::path & output_dir,
  GenerateResult & result)
{
  namespace fs = std::filesystem;

  if (!fs::exists(schema)) {
    result.diagnostics
      .report_error(DiagnosticKind::IoError, "schema file not found: " + schema.string())
      .at(file_location(schema));
    return;
  }

  if (options.config.verbose) {
    std::cerr << "Loading schema: " << schema.string() << "\n";
  }

  SchemaLoadResult loaded = load_schema_file(schema);
  if (!loaded.success) {
    result.diagnostics.report_error(DiagnosticKind::SchemaError, loaded.error)
      .at(loaded.error_location.is_valid() ? loaded.error_location : file_location(schema));
    return;
  }

  const size_t errors_before = result.diagnostics.error_count();
  AggregateOrchestrator orchestrator(loaded.document, side_channel, &result.diagnostics);
  const SchemaPlan plan = orchestrator.plan_schema();

  if (options.config.verbose) {
    std::cerr << "Planned " << plan.aggregates.size() << " aggregate(s), " << plan.enums.size()
              << " enum(s) from " << schema.filename().string() << "\n";
  }

  // All-or-nothing per schema.
  if (result.diagnostics.error_count() > errors_before) {
    return;
  }

  switch (options.mode) {
    case GenerateMode::Check:
      break;

    case GenerateMode::Plan:
      result.plan_json.push_back(dump_plans(plan));
      break;

    case GenerateMode::Generate: {
      EmitOptions emit;
      emit.emit_plan_comments = options.config.emit_plan_comments;
      emit.runtime_include = options.config.runtime_include;
      const std::string text = HeaderEmitter(plan, emit).emit();

      const fs::path output_path = output_dir / output_file_name(schema);
      if (write_output(output_path, text, result.diagnostics)) {
        if (options.config.verbose) {
          std::cerr << "Wrote " << output_path.string() << "\n";
        }
        result.generated_files.push_back(output_path);
      }
      break;
    }
  }
}

GenerateResult Generator::generate_file(
  const std::filesystem::path & schema, const GenerateOptions & options)
{
  GenerateResult result;

  auto side_channel =
    build_side_channel(options.proto_files, options.lookup_files, result.diagnostics);
  if (!side_channel) {
    return result;
  }

  const std::filesystem::path output_dir = options.output_dir.value_or(schema.parent_path());
  process_schema(schema, side_channel->empty() ? nullptr : &*side_channel, options, output_dir, result);

  result.success = !result.diagnostics.has_errors();
  return result;
}

GenerateResult Generator::generate_project(
  const ProjectConfig & config, const GenerateOptions & options)
{
  GenerateResult result;

  // Handle empty schema list
  if (config.generator.schemas.empty()) {
    result.diagnostics.report_error(
      DiagnosticKind::SchemaError, "no schemas defined in project configuration");
    return result;
  }

  std::vector<std::filesystem::path> protos;
  for (const auto & p : config.side_channel.proto_files) {
    protos.push_back(config.resolve(p));
  }
  protos.insert(protos.end(), options.proto_files.begin(), options.proto_files.end());

  std::vector<std::filesystem::path> lookups;
  if (config.side_channel.lookup_file) {
    lookups.push_back(config.resolve(*config.side_channel.lookup_file));
  }
  lookups.insert(lookups.end(), options.lookup_files.begin(), options.lookup_files.end());

  auto side_channel = build_side_channel(protos, lookups, result.diagnostics);
  if (!side_channel) {
    return result;
  }

  GenerateOptions effective = options;
  effective.config.emit_plan_comments =
    options.config.emit_plan_comments || config.generator.emit_plan_comments;

  const std::filesystem::path output_dir =
    options.output_dir.value_or(config.resolve(config.generator.output_dir));

  if (options.config.verbose && !config.package.name.empty()) {
    std::cerr << "Project: " << config.package.name << "\n";
  }

  for (const auto & schema : config.generator.schemas) {
    process_schema(
      config.resolve(schema), side_channel->empty() ? nullptr : &*side_channel, effective,
      output_dir, result);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace wirebind
