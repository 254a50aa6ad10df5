#include "diagram_stream.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>

using namespace diagram_stream;

static CancellationToken g_cancel;

static void on_interrupt(int) { g_cancel.cancel(); }

static std::string read_all_stdin() {
  std::ostringstream oss;
  oss << std::cin.rdbuf();
  return oss.str();
}

static void usage() {
  std::cerr
      << "diagram_stream_cli <generate|detect|prepare|types> [options]\n"
      << "  generate [--request <file>] [--catalog <file>] [--config <file>] [--store <dir>] [--validator-cmd <cmd>]\n"
      << "      Streams one generation as server-sent events to stdout. Request JSON from --request or stdin.\n"
      << "  detect --prompt <text> [--catalog <file>] [--config <file>]\n"
      << "  prepare --type <id> [--input <file>] [--catalog <file>] [--validator-cmd <cmd>]\n"
      << "      Extracts, normalizes and validates a complete completion text.\n"
      << "  types [--catalog <file>]\n";
}

struct CliOptions {
  std::string request_path;
  std::string catalog_path;
  std::string config_path;
  std::string store_dir{".diagram_stream"};
  std::string validator_cmd;
  std::string prompt;
  std::string type;
  std::string input_path;
  bool verbose{false};
};

static ProviderConfig provider_config_for(const CliOptions& opt) {
  ProviderConfig cfg = opt.config_path.empty() ? ProviderConfig{} : load_provider_config(opt.config_path);
  apply_provider_env(cfg);
  return cfg;
}

static std::unique_ptr<IDiagramValidator> make_validator(const CliOptions& opt, const DiagramCatalog& catalog) {
  if (!opt.validator_cmd.empty()) return std::make_unique<CommandValidator>(opt.validator_cmd);
  return std::make_unique<BasicSyntaxValidator>(catalog);
}

static int run_generate(const CliOptions& opt, const DiagramCatalog& catalog) {
  std::string body = opt.request_path.empty() ? read_all_stdin() : read_text_file(opt.request_path);
  GenerationRequest req = parse_generation_request(body);
  PipelineConfig cfg = opt.config_path.empty() ? PipelineConfig{} : load_pipeline_config(opt.config_path);
  ProviderConfig pcfg = provider_config_for(opt);
  if (cfg.model.empty()) cfg.model = pcfg.model;

  OpenAiStreamProvider provider(pcfg);
  auto validator = make_validator(opt, catalog);
  FileArtifactStore store(opt.store_dir, cfg.default_quota);
  DiagramGenerator generator(catalog, provider, *validator, store, cfg);
  OstreamEventSink sink(std::cout);

  auto result = generator.generate(req, sink, &g_cancel);
  if (!result.success) {
    std::cerr << "error: " << (result.error ? result.error->message : std::string("generation failed")) << "\n";
    return 1;
  }
  return 0;
}

static int run_detect(const CliOptions& opt, const DiagramCatalog& catalog) {
  if (opt.prompt.empty()) {
    usage();
    return 2;
  }
  ProviderConfig pcfg = provider_config_for(opt);
  OpenAiStreamProvider provider(pcfg);
  auto type = detect_diagram_type(provider, catalog, opt.prompt, pcfg.model);
  if (!type) {
    std::cerr << "error: Could not determine diagram type\n";
    return 1;
  }
  JsonObject o;
  o["diagramType"] = *type;
  std::cout << dumps_json(Json(o)) << "\n";
  return 0;
}

static int run_prepare(const CliOptions& opt, const DiagramCatalog& catalog) {
  if (opt.type.empty()) {
    usage();
    return 2;
  }
  const auto& def = catalog.at(opt.type);
  std::string input = opt.input_path.empty() ? read_all_stdin() : read_text_file(opt.input_path);
  auto fenced = extract_fenced_candidate(input);
  std::string raw = fenced ? *fenced : input;

  auto validator = make_validator(opt, catalog);
  auto artifact = prepare_artifact(raw, def, *validator);
  JsonObject o;
  o["diagramType"] = artifact.diagram_type;
  o["fenced"] = fenced.has_value();
  o["rawText"] = artifact.raw_text;
  o["normalizedText"] = artifact.normalized_text;
  o["isValid"] = artifact.is_valid;
  if (!artifact.is_valid) o["validationMessage"] = artifact.validation_message;
  std::cout << dumps_json(Json(o)) << "\n";
  return artifact.is_valid ? 0 : 1;
}

static int run_types(const DiagramCatalog& catalog) {
  JsonArray types;
  for (const auto& def : catalog.definitions()) {
    JsonArray aliases;
    for (const auto& a : def.aliases) aliases.push_back(a);
    JsonObject o;
    o["id"] = def.id;
    o["declaration"] = def.canonical_declaration;
    o["aliases"] = aliases;
    types.push_back(o);
  }
  std::cout << dumps_json(Json(types)) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      usage();
      return 2;
    }

    std::string mode = argv[1];
    CliOptions opt;
    for (int i = 2; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--request" && i + 1 < argc) {
        opt.request_path = argv[++i];
      } else if (a == "--catalog" && i + 1 < argc) {
        opt.catalog_path = argv[++i];
      } else if (a == "--config" && i + 1 < argc) {
        opt.config_path = argv[++i];
      } else if (a == "--store" && i + 1 < argc) {
        opt.store_dir = argv[++i];
      } else if (a == "--validator-cmd" && i + 1 < argc) {
        opt.validator_cmd = argv[++i];
      } else if (a == "--prompt" && i + 1 < argc) {
        opt.prompt = argv[++i];
      } else if (a == "--type" && i + 1 < argc) {
        opt.type = argv[++i];
      } else if (a == "--input" && i + 1 < argc) {
        opt.input_path = argv[++i];
      } else if (a == "--verbose") {
        opt.verbose = true;
      } else {
        usage();
        return 2;
      }
    }
    if (opt.verbose) logger()->set_level(spdlog::level::debug);

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, on_interrupt);

    std::unique_ptr<DiagramCatalog> loaded;
    if (!opt.catalog_path.empty()) loaded = std::make_unique<DiagramCatalog>(load_catalog_file(opt.catalog_path));
    const DiagramCatalog& catalog = loaded ? *loaded : default_catalog();

    if (mode == "generate") return run_generate(opt, catalog);
    if (mode == "detect") return run_detect(opt, catalog);
    if (mode == "prepare") return run_prepare(opt, catalog);
    if (mode == "types") return run_types(catalog);

    usage();
    return 2;
  } catch (const DiagramStreamError& e) {
    std::cerr << "error: " << e.message << " (" << error_kind_name(e.kind) << ")\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
