#include "diagram_stream.hpp"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>

using namespace diagram_stream;

// ---------------- fakes ----------------

struct ScriptedProvider : public ICompletionProvider {
  struct Script {
    std::vector<std::string> deltas;
    bool fail_after{false};
    std::string error;
  };
  std::vector<Script> scripts;
  std::vector<CompletionRequest> requests;

  ProviderStatus stream(const CompletionRequest& request, const DeltaCallback& on_delta) override {
    requests.push_back(request);
    ProviderStatus st;
    if (requests.size() > scripts.size()) {
      st.ok = false;
      st.error = "no script";
      return st;
    }
    const auto& s = scripts[requests.size() - 1];
    for (const auto& d : s.deltas) {
      if (!on_delta(d)) {
        st.stopped = true;
        return st;
      }
    }
    if (s.fail_after) {
      st.ok = false;
      st.error = s.error;
    }
    return st;
  }
};

struct RecordingSink : public IEventSink {
  std::vector<StreamEvent> events;
  size_t accept_limit{std::numeric_limits<size_t>::max()};

  bool write(const StreamEvent& event) override {
    if (events.size() >= accept_limit) return false;
    events.push_back(event);
    return true;
  }
};

struct RecordingSleeper : public Sleeper {
  std::vector<std::chrono::milliseconds> delays;
  void sleep_for(std::chrono::milliseconds delay) override { delays.push_back(delay); }
};

struct ManualClock : public Clock {
  std::chrono::steady_clock::time_point t{};
  std::chrono::milliseconds step{0};
  std::chrono::steady_clock::time_point now() override {
    auto r = t;
    t += step;
    return r;
  }
};

struct ScriptedValidator : public IDiagramValidator {
  std::vector<ValidationResult> results;
  std::vector<std::string> seen;

  ValidationResult validate(const std::string& text, const std::string&) override {
    seen.push_back(text);
    size_t i = seen.size() - 1;
    return i < results.size() ? results[i] : ValidationResult{true, ""};
  }
};

struct FlakyStore : public MemoryArtifactStore {
  int commit_failures{0};
  int preview_failures{0};
  explicit FlakyStore(int64_t balance) : MemoryArtifactStore(balance) {}

  CommitReceipt commit(const CommitRequest& request) override {
    if (commit_failures > 0) {
      commit_failures--;
      throw DiagramStreamError("disk full", ErrorKind::Persistence);
    }
    return MemoryArtifactStore::commit(request);
  }

  void store_preview(const std::string& project_id, const std::string& artifact_id, const std::string& image) override {
    if (preview_failures > 0) {
      preview_failures--;
      throw DiagramStreamError("blob store unavailable", ErrorKind::Persistence);
    }
    MemoryArtifactStore::store_preview(project_id, artifact_id, image);
  }
};

static GenerationRequest login_flow_request() {
  GenerationRequest req;
  req.prompt = "login flow";
  req.diagram_type = "flowchart";
  req.project_id = "p1";
  req.user_id = "u1";
  req.request_id = "r1";
  return req;
}

static ScriptedProvider::Script fenced_script(const std::string& body_lines) {
  ScriptedProvider::Script s;
  s.deltas = {"Sure! Here is your diagram:\n```mermaid\n"};
  size_t start = 0;
  while (start < body_lines.size()) {
    size_t nl = body_lines.find('\n', start);
    if (nl == std::string::npos) nl = body_lines.size() - 1;
    s.deltas.push_back(body_lines.substr(start, nl - start + 1));
    start = nl + 1;
  }
  s.deltas.push_back("```\nLet me know if you want changes.");
  return s;
}

static size_t count_kind(const std::vector<StreamEvent>& events, StreamEvent::Kind kind) {
  size_t n = 0;
  for (const auto& e : events) n += e.kind == kind ? 1 : 0;
  return n;
}

// ---------------- json ----------------

static void test_json_loads_dumps() {
  Json v = loads_json(R"({"b":[1,2.5,true,null],"a":"x\ny","e":"café 😀"})");
  assert(v.is_object());
  const auto& o = v.as_object();
  assert(o.at("a").as_string() == "x\ny");
  assert(o.at("b").as_array().size() == 4);
  assert(o.at("b").as_array()[1].as_number() == 2.5);
  assert(o.at("e").as_string() == "caf\xC3\xA9 \xF0\x9F\x98\x80");
  assert(dumps_json(Json(JsonObject{{"k", Json("a\"b")}, {"n", Json(3)}})) == R"({"k":"a\"b","n":3})");
}

static void test_json_rejects_malformed() {
  const char* bad[] = {"{\"a\":1,}", "[1 2]", "{\"a\":1} x", "'single'", ""};
  for (const char* text : bad) {
    try {
      (void)loads_json(text);
      assert(false && "expected parse error");
    } catch (const std::runtime_error& e) {
      assert(std::string(e.what()).find("JSON parse error") == 0);
    }
  }

  std::string nested = std::string(200, '[') + std::string(200, ']');
  assert(loads_json(nested).is_array());
  try {
    (void)loads_json(std::string(200000, '['));
    assert(false && "expected parse error");
  } catch (const std::runtime_error& e) {
    assert(std::string(e.what()).find("nesting too deep") != std::string::npos);
  }
}

// ---------------- logging ----------------

static std::shared_ptr<spdlog::logger> silent_logger() {
  return std::make_shared<spdlog::logger>("diagram_stream", std::make_shared<spdlog::sinks::null_sink_mt>());
}

static void test_logger_capture_and_level() {
  std::ostringstream out;
  auto captured = std::make_shared<spdlog::logger>("diagram_stream", std::make_shared<spdlog::sinks::ostream_sink_mt>(out));
  captured->set_pattern("%l %v");
  captured->set_level(spdlog::level::info);
  set_logger(captured);

  RetryPolicy policy;
  policy.max_attempts = 2;
  RecordingSleeper sleeper;
  int calls = 0;
  int v = with_retry(policy, sleeper, "commit", [&] {
    if (++calls == 1) throw DiagramStreamError("disk full", ErrorKind::Persistence);
    return 7;
  });
  assert(v == 7);
  logger()->debug("fence: hidden");
  assert(out.str() == "warning persistence: commit failed (attempt 1): disk full\n");

  captured->set_level(spdlog::level::err);
  logger()->warn("filtered");
  assert(out.str() == "warning persistence: commit failed (attempt 1): disk full\n");

  set_logger(nullptr);
  assert(logger() != captured);
  assert(logger()->name() == "diagram_stream");
  assert(logger()->level() == spdlog::level::info);
  set_logger(silent_logger());
}

// ---------------- catalog / prompts ----------------

static void test_catalog_lookup() {
  const auto& catalog = default_catalog();
  assert(catalog.definitions().size() == 12);
  assert(catalog.find(" Flowchart ")->id == "flowchart");
  assert(catalog.find("ER")->id == "erd");
  assert(catalog.find("graph")->id == "flowchart");
  assert(catalog.find("architecture")->canonical_declaration == "architecture-beta");
  assert(catalog.find("venn") == nullptr);
  try {
    (void)catalog.at("venn");
    assert(false && "expected DiagramStreamError");
  } catch (const DiagramStreamError& e) {
    assert(e.kind == ErrorKind::Rejected);
  }
}

static void test_catalog_load_json() {
  auto catalog = load_catalog(R"({
    "prompts": {"system_template": "Make a {diagram_type}.", "user_template": "{prompt}"},
    "definitions": {
      "Journey": {"keywords": ["journey"], "aliases": ["user-journey"], "example": "journey\n  title T"}
    }
  })");
  assert(catalog.definitions().size() == 1);
  const auto* def = catalog.find("user-journey");
  assert(def && def->id == "journey");
  assert(def->canonical_declaration == "journey");
  PromptCompiler compiler(catalog);
  assert(compiler.system_prompt(*def) == "Make a journey.");

  try {
    (void)load_catalog(R"({"definitions": {}})");
    assert(false && "expected DiagramStreamError");
  } catch (const DiagramStreamError& e) {
    assert(e.message.find("no definitions") != std::string::npos);
  }
}

static void test_prompt_compiler() {
  PromptCompiler compiler(default_catalog());
  auto req = login_flow_request();
  req.prior_messages = {{"user", "make a login flow"}, {"assistant", "```mermaid\nflowchart TD\n```"}};

  auto compiled = compiler.compile(req);
  assert(compiled.system.find("flowchart diagram") != std::string::npos);
  assert(compiled.system.find("LoadBalancer") != std::string::npos);
  assert(compiled.messages.size() == 3);
  assert(compiled.messages.back().role == "user");
  assert(compiled.messages.back().content.find("login flow") != std::string::npos);
  assert(std::abs(compiled.sampling.temperature - 0.7) < 1e-9);
  assert(compiled.sampling.max_tokens == 4000);

  req.clear_cache = true;
  assert(compiler.compile(req).messages.size() == 1);

  req.is_retry = true;
  req.failure_reason = "Parse error on line 3: unexpected '}'";
  auto retry = compiler.compile(req);
  assert(retry.messages.back().content.find("Parse error on line 3: unexpected '}'") != std::string::npos);
  assert(retry.messages.back().content.find("Keep the syntax simple") != std::string::npos);

  req.diagram_type = "venn";
  try {
    (void)compiler.compile(req);
    assert(false && "expected DiagramStreamError");
  } catch (const DiagramStreamError& e) {
    assert(e.kind == ErrorKind::Rejected);
  }
}

static void test_render_template_single_pass() {
  std::string out = render_template("{prompt} / {example} / {missing}", {{"prompt", "use {example}"}, {"example", "E"}});
  assert(out == "use {example} / E / {missing}");
}

static void test_parse_detected_type() {
  const auto& catalog = default_catalog();
  assert(parse_detected_type(catalog, "Flowchart.") == std::optional<std::string>("flowchart"));
  assert(parse_detected_type(catalog, "`ER`") == std::optional<std::string>("erd"));
  assert(parse_detected_type(catalog, "I would use a sequence diagram") == std::optional<std::string>("sequence"));
  assert(!parse_detected_type(catalog, "no idea"));
}

static void test_detect_diagram_type() {
  ScriptedProvider provider;
  provider.scripts.push_back({{"Seq", "uence"}, false, ""});
  auto type = detect_diagram_type(provider, default_catalog(), "show how the browser talks to the API");
  assert(type && *type == "sequence");
  assert(provider.requests.size() == 1);
  assert(std::abs(provider.requests[0].sampling.temperature - 0.3) < 1e-9);
  assert(provider.requests[0].system.find("- architecture") != std::string::npos);
}

// ---------------- requests ----------------

static void test_parse_generation_request() {
  auto req = parse_generation_request(R"({
    "textPrompt": "checkout flow", "diagramType": "Flowchart", "projectId": "p9",
    "clientSvg": "<svg/>", "isRetry": true, "failureReason": "bad arrow",
    "chatHistory": [{"role": "user", "content": "hi"}, {"role": "system", "content": "x"}],
    "temperature": 0.2
  })");
  assert(req.prompt == "checkout flow");
  assert(req.diagram_type == "Flowchart");
  assert(req.client_rendered_image == "<svg/>");
  assert(req.is_retry && req.failure_reason == "bad arrow");
  assert(req.prior_messages.size() == 1);
  assert(std::abs(req.sampling.temperature - 0.2) < 1e-9);
  assert(!req.request_id.empty());

  const char* bad[] = {R"({"diagramType": "pie", "projectId": "p"})", "[1]", "{", R"({"textPrompt": "x",
    "diagramType": "pie", "projectId": "p", "temperature": 5})"};
  for (const char* body : bad) {
    try {
      (void)parse_generation_request(body);
      assert(false && "expected DiagramStreamError");
    } catch (const DiagramStreamError& e) {
      assert(e.kind == ErrorKind::Rejected);
    }
  }

  try {
    (void)parse_generation_request(std::string(200000, '['));
    assert(false && "expected DiagramStreamError");
  } catch (const DiagramStreamError& e) {
    assert(e.kind == ErrorKind::Rejected);
    assert(e.message.find("nesting too deep") != std::string::npos);
  }

  auto plain = parse_generation_request(R"({"textPrompt": "x", "diagramType": "pie", "projectId": "p"})");
  assert(!plain.explicit_temperature);
  assert(req.explicit_temperature);
}

// ---------------- fence extractor ----------------

static void test_fence_single_delta() {
  FenceExtractor fx;
  auto em = fx.feed("Sure!\n```mermaid\nflowchart TD\nA-->B\nB-->C\n```\nThanks");
  assert(em.size() == 3);
  assert(em[0].kind == FenceEmission::Kind::Settle);
  assert(em[1].kind == FenceEmission::Kind::Partial);
  assert(em[1].text == "flowchart TD\nA-->B\nB-->C");
  assert(em[2].kind == FenceEmission::Kind::Complete);
  assert(fx.state() == FenceState::Done);
  assert(fx.candidate() == std::optional<std::string>("flowchart TD\nA-->B\nB-->C"));
}

static void test_fence_incremental_batches() {
  FenceExtractor fx;
  std::vector<std::string> deltas = {"Here you go:\n``", "`mer", "maid\nflow", "chart TD\n", "A-->B\n",
                                     "B-->C\n", "C-->D\n``", "`\n"};
  std::vector<FenceEmission> all;
  for (const auto& d : deltas) {
    for (auto& e : fx.feed(d)) all.push_back(e);
  }
  assert(all.size() == 4);
  assert(all[0].kind == FenceEmission::Kind::Settle);
  assert(all[1].kind == FenceEmission::Kind::Partial && all[1].text == "flowchart TD\nA-->B");
  assert(all[1].flushed_lines == 2);
  assert(all[2].kind == FenceEmission::Kind::Partial && all[2].text == "flowchart TD\nA-->B\nB-->C\nC-->D");
  assert(all[2].flushed_lines == 2);
  assert(all[3].kind == FenceEmission::Kind::Complete && all[3].text == all[2].text);

  // Deltas after the closing fence are ignored.
  assert(fx.feed("```mermaid\nmore\n").empty());
  assert(fx.state() == FenceState::Done);
}

static void test_fence_final_flush_may_be_short() {
  FenceExtractor fx;
  auto first = fx.feed("```mermaid\ngraph LR\nA-->B\n");
  assert(first.size() == 2 && first[1].flushed_lines == 2);
  auto last = fx.feed("B-->C```");
  assert(last.size() == 2);
  assert(last[0].kind == FenceEmission::Kind::Partial && last[0].flushed_lines == 1);
  assert(last[0].text == "graph LR\nA-->B\nB-->C");
  assert(last[1].kind == FenceEmission::Kind::Complete);
}

static void test_fence_without_opening_marker_aborts() {
  FenceExtractor fx;
  assert(fx.feed("flowchart TD\nA-->B\n").empty());
  assert(fx.feed("B-->C\n").empty());
  assert(fx.finish().empty());
  assert(fx.state() == FenceState::Aborted);
  assert(!fx.candidate());
  assert(fx.session().abort_reason.find("opening fence") != std::string::npos);
}

static void test_fence_without_closing_marker_aborts() {
  FenceExtractor fx;
  auto em = fx.feed("```mermaid\nsequenceDiagram\nA->>B: hi\nB->>A: yo\n");
  assert(em.size() == 2);
  fx.finish();
  assert(fx.state() == FenceState::Aborted);
  assert(!fx.candidate());
  assert(fx.session().visible == "sequenceDiagram\nA->>B: hi\nB->>A: yo");
  assert(fx.session().abort_reason.find("closing fence") != std::string::npos);
}

static void test_fence_marker_case_and_trailing_text() {
  auto c = extract_fenced_candidate("```Mermaid   \npie\n  \"A\" : 1\n```");
  assert(c == std::optional<std::string>("pie\n  \"A\" : 1"));
  auto inline_decl = extract_fenced_candidate("```mermaid gantt\n  title T\n```");
  assert(inline_decl == std::optional<std::string>("gantt\n  title T"));
}

static void test_fence_max_buffer_bytes() {
  FenceOptions opt;
  opt.max_buffer_bytes = 16;
  FenceExtractor fx(opt);
  fx.feed("this is a long preamble without any fence");
  assert(fx.state() == FenceState::Aborted);
}

static void test_fence_long_preamble_keeps_only_marker_tail() {
  FenceOptions opt;
  FenceExtractor fx(opt);
  std::string preamble(50000, 'x');
  for (char c : preamble) {
    (void)fx.feed(std::string(1, c));
    assert(fx.session().accumulated.size() < opt.open_marker.size());
  }
  assert(fx.state() == FenceState::SeekingFence);
  assert(fx.session().skipped_bytes + fx.session().accumulated.size() == preamble.size());

  // A marker split across one-byte deltas is still found after the trim.
  std::vector<FenceEmission> all;
  for (char c : std::string("\n```MerMaid\npie\n\"A\" : 1\n```\n")) {
    for (auto& e : fx.feed(std::string(1, c))) all.push_back(std::move(e));
  }
  assert(fx.state() == FenceState::Done);
  assert(fx.candidate() == std::optional<std::string>("pie\n\"A\" : 1"));
  assert(all.front().kind == FenceEmission::Kind::Settle);

  FenceOptions capped;
  capped.max_buffer_bytes = 1000;
  FenceExtractor bounded(capped);
  for (int i = 0; i < 1000; ++i) (void)bounded.feed("y");
  assert(bounded.state() == FenceState::SeekingFence);
  (void)bounded.feed("y");
  assert(bounded.state() == FenceState::Aborted);
  assert(bounded.session().abort_reason == "no opening fence within maxBufferBytes");
}

static void test_fence_advance_is_pure() {
  FenceOptions opt;
  StreamSession start;
  auto t = advance(start, "```mermaid\nA\nB\n", opt);
  assert(start.state == FenceState::SeekingFence);
  assert(start.accumulated.empty());
  assert(t.session.state == FenceState::Collecting);
  assert(t.session.in_fence());
  assert(t.session.visible == "A\nB");
  auto t2 = advance(t.session, "```", opt);
  assert(t.session.state == FenceState::Collecting);
  assert(t2.session.state == FenceState::Done && !t2.session.in_fence());
  assert(finish(t.session).session.state == FenceState::Aborted);
}

// ---------------- normalizer ----------------

static void test_normalize_inserts_canonical_declaration() {
  const auto& flow = default_catalog().at("flowchart");
  assert(normalize_declaration("A-->B", flow) == "flowchart TD\nA-->B");
  assert(normalize_declaration("%% login\nA-->B", flow) == "%% login\nflowchart TD\nA-->B");
  assert(normalize_declaration("graph\nA-->B", flow) == "graph TD\nA-->B");
  assert(normalize_declaration("flowchart;\nA-->B", flow) == "flowchart TD\nA-->B");
  assert(normalize_declaration("flowchart LR\nA-->B", flow) == "flowchart LR\nA-->B");
  assert(normalize_declaration("flowchartish\nA-->B", flow) == "flowchart TD\nflowchartish\nA-->B");
}

static void test_normalize_drops_junk_and_stray_language_line() {
  const auto& seq = default_catalog().at("sequence");
  assert(normalize_declaration("Here it is:\nsequenceDiagram\nA->>B: hi", seq) == "sequenceDiagram\nA->>B: hi");
  assert(normalize_declaration("%% keep\nnoise\nsequenceDiagram\nA->>B: hi", seq) ==
         "%% keep\nsequenceDiagram\nA->>B: hi");

  const auto& sankey = default_catalog().at("sankey");
  assert(normalize_declaration("mermaid\nsankey-beta\na,b,1", sankey) == "sankey-beta\na,b,1");
  assert(normalize_declaration("---\nconfig:\n  sankey:\n    showValues: false\n---\na,b,1", sankey) ==
         "---\nconfig:\n  sankey:\n    showValues: false\n---\nsankey-beta\na,b,1");
}

static void test_normalize_is_idempotent() {
  const auto& catalog = default_catalog();
  std::vector<std::pair<std::string, std::string>> cases = {
      {"flowchart", "A-->B"},
      {"flowchart", "\n\ngraph\n  A-->B\n\n"},
      {"erd", "Diagram:\nerDiagram\n  USER ||--o{ ORDER : places"},
      {"pie", "mermaid\n\"A\" : 1"},
      {"gantt", "%% plan\n---\ntitle: x\n---\ntitle Plan"},
  };
  for (const auto& c : cases) {
    const auto& def = catalog.at(c.first);
    std::string once = normalize_declaration(c.second, def);
    assert(normalize_declaration(once, def) == once);
    BasicSyntaxValidator v(catalog);
    assert(v.validate(once, def.id).message.find("must start with") == std::string::npos);
  }
}

// ---------------- sanitizer ----------------

static void test_sanitize_gantt() {
  std::string in = "gantt\n    title T\n    Task A :a1, 2024-01-01, 3d";
  std::string out = sanitize_gantt(in);
  assert(out == "gantt\n    dateFormat YYYY-MM-DD\n    title T\n    section Tasks\n    Task A :a1, 2024-01-01, 3d");
  assert(sanitize_gantt(out) == out);

  std::string ok = "gantt\n  dateFormat YYYY-MM-DD\n  section Build\n  A :a1, 2024-01-01, 1d";
  assert(sanitize_gantt(ok) == ok);
}

static void test_sanitize_architecture() {
  std::string in =
      "architecture-beta\n"
      "  service a(server)[A & B]\n"
      "  service b(disk)[In/Out]\n"
      "  a -- b\n"
      "  a:t -- t:b\n"
      "  a:L --> L:b\n"
      "  a:r <.. l:b";
  std::string out = sanitize_architecture(in);
  assert(out ==
         "architecture-beta\n"
         "  service a(server)[A and B]\n"
         "  service b(disk)[In-Out]\n"
         "  a:R -- L:b\n"
         "  a:R -- L:b\n"
         "  a:B --> T:b\n"
         "  a:R <-- L:b");
  assert(sanitize_architecture(out) == out);
}

static void test_sanitize_flowchart_end_class() {
  std::string in = "flowchart TD\nA-->B\nclassDef end fill:#f00\nclassDef endpoint fill:#0f0\nclass B end\nC:::end";
  std::string out = sanitize_flowchart(in);
  assert(out ==
         "flowchart TD\nA-->B\nclassDef endClass fill:#f00\nclassDef endpoint fill:#0f0\nclass B endClass\n"
         "C:::endClass");
  assert(sanitize_flowchart(out) == out);
  // Other types pass through.
  const auto& pie = default_catalog().at("pie");
  assert(sanitize_diagram("pie\nclassDef end x", pie) == "pie\nclassDef end x");
}

// ---------------- validators ----------------

static void test_basic_validator() {
  BasicSyntaxValidator v(default_catalog());
  assert(!v.validate("", "flowchart").valid);
  assert(!v.validate("   \n", "flowchart").valid);
  auto r = v.validate("A-->B", "flowchart");
  assert(!r.valid && r.message.find("'flowchart'") != std::string::npos);
  assert(!v.validate("flowchart TD\nA[Start-->B", "flowchart").valid);
  assert(!v.validate("flowchart TD\nA-->B}", "flowchart").valid);
  assert(v.validate("flowchart TD\nA[\"a (b\"] --> B{ok}", "flowchart").valid);
  assert(v.validate("flowchart TD\nA>flag] --> B((c))", "flowchart").valid);
  assert(v.validate("%% c\nsequenceDiagram\nNote over A: (x", "sequence").valid);
  assert(!v.validate("pie\n\"A\" : 1", "venn").valid);
}

static void test_command_validator() {
  CommandValidator accept("true");
  assert(accept.validate("flowchart TD\nA-->B", "flowchart").valid);

  CommandValidator reject("false");
  auto r = reject.validate("flowchart TD\nA-->B", "flowchart");
  assert(!r.valid);
  assert(r.message == "validator exited with status 1");

  CommandValidator grep("grep -q sequenceDiagram");
  assert(grep.validate("sequenceDiagram\nA->>B: hi", "sequence").valid);
  assert(!grep.validate("flowchart TD\nA-->B", "flowchart").valid);
}

static void test_prepare_artifact_validates_once() {
  ScriptedValidator v;
  const auto& flow = default_catalog().at("flowchart");
  auto a = prepare_artifact("A-->B\nclassDef end fill:#f00", flow, v);
  assert(v.seen.size() == 1);
  assert(v.seen[0] == "flowchart TD\nA-->B\nclassDef endClass fill:#f00");
  assert(a.is_valid);
  assert(a.raw_text == "A-->B\nclassDef end fill:#f00");
  assert(a.normalized_text == v.seen[0]);
}

// ---------------- token stream ----------------

static void test_sse_parser_and_chat_delta() {
  SseLineParser parser;
  std::vector<std::string> contents;
  bool done = false;
  auto on_data = [&](const std::string& data) {
    if (data == "[DONE]") {
      done = true;
      return false;
    }
    if (auto c = parse_chat_delta(data)) contents.push_back(*c);
    return true;
  };
  assert(parser.feed(": keep-alive\n\ndata: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n\n", on_data));
  assert(parser.feed("data: {\"choices\":[{\"delta\":{\"content\":\"```mer\"}}]}\r\n\r\nda", on_data));
  assert(!parser.feed("ta: {\"choices\":[{\"delta\":{\"content\":\"maid\\n\"}}]}\n\ndata: [DONE]\n\n", on_data));
  assert(done);
  assert(contents.size() == 2);
  assert(contents[0] == "```mer" && contents[1] == "maid\n");
}

static void test_chat_completion_body() {
  CompletionRequest req;
  req.model = "gpt-4o";
  req.system = "sys";
  req.messages = {{"user", "hi"}};
  Json body = loads_json(build_chat_completion_body(req));
  const auto& o = body.as_object();
  assert(o.at("stream").as_bool());
  assert(o.at("model").as_string() == "gpt-4o");
  assert(o.at("max_tokens").as_number() == 4000);
  const auto& msgs = o.at("messages").as_array();
  assert(msgs.size() == 2);
  assert(msgs[0].as_object().at("role").as_string() == "system");
  assert(msgs[1].as_object().at("content").as_string() == "hi");
}

// ---------------- events ----------------

static void test_event_encoding() {
  assert(format_sse(StreamEvent::partial("pie")) == "data: {\"isComplete\":false,\"mermaidSyntax\":\"pie\"}\n\n");

  Json ok = event_to_json(StreamEvent::success("pie", "art-1"));
  assert(ok.as_object().at("isComplete").as_bool());
  assert(ok.as_object().at("artifactId").as_string() == "art-1");

  Json fail = event_to_json(StreamEvent::failure(PipelineError{ErrorKind::Validation, "bad", "A-->"}, true));
  const auto& o = fail.as_object();
  assert(o.at("error").as_bool());
  assert(o.at("needsRetry").as_bool());
  assert(o.at("isComplete").as_bool());
  assert(o.at("mermaidSyntax").as_string() == "A-->");
  assert(o.at("errorMessage").as_string() == "bad");

  Json bare = event_to_json(StreamEvent::failure(PipelineError{ErrorKind::Rejected, "Insufficient token balance", ""}, false));
  assert(bare.as_object().count("mermaidSyntax") == 0);
}

// ---------------- stores / persistence ----------------

static void test_history_cap() {
  std::vector<HistoryEntry> h;
  for (int i = 0; i < 31; ++i) {
    HistoryEntry e;
    e.prompt = "p" + std::to_string(i);
    push_history(h, e);
    assert(h.size() <= kMaxHistoryEntries);
  }
  assert(h.size() == 30);
  assert(h.front().prompt == "p30");
  assert(h.back().prompt == "p1");
}

static void test_memory_store_commit_rules() {
  MemoryArtifactStore store(2500);
  std::vector<HistoryEntry> seeded;
  for (int i = 0; i < 30; ++i) {
    HistoryEntry e;
    e.prompt = "old" + std::to_string(i);
    seeded.push_back(e);
  }
  store.seed_history("p1", seeded);

  CommitRequest req;
  req.request_id = "r1";
  req.user_id = "u1";
  req.project_id = "p1";
  req.prompt = "new";
  req.diagram_text = "pie\n\"A\" : 1";
  auto first = store.commit(req);
  auto again = store.commit(req);
  assert(!first.duplicate && again.duplicate);
  assert(first.artifact_id == again.artifact_id);
  assert(store.quota_balance("u1") == 1500);
  assert(store.commit_count() == 1);

  auto history = store.history("p1");
  assert(history.size() == 30);
  assert(history.front().prompt == "new");
  assert(history.back().prompt == "old28");
  assert(store.current_diagram("p1") == req.diagram_text);

  req.request_id = "r2";
  (void)store.commit(req);
  req.request_id = "r3";
  try {
    (void)store.commit(req);
    assert(false && "expected DiagramStreamError");
  } catch (const DiagramStreamError& e) {
    assert(e.kind == ErrorKind::Rejected);
    assert(e.message == "Insufficient token balance");
  }
  assert(store.quota_balance("u1") == 500);
}

static void test_commit_idempotency_is_bounded_by_history() {
  MemoryArtifactStore store(100000);
  CommitRequest req;
  req.user_id = "u1";
  req.project_id = "p1";
  req.prompt = "step";
  req.diagram_text = "pie\n\"A\" : 1";
  req.cost = 1;
  for (size_t i = 0; i <= kMaxHistoryEntries; ++i) {
    req.request_id = "r" + std::to_string(i);
    assert(!store.commit(req).duplicate);
  }
  auto history = store.history("p1");
  assert(history.size() == kMaxHistoryEntries);
  assert(history.front().request_id == "r" + std::to_string(kMaxHistoryEntries));
  assert(history.back().request_id == "r1");

  req.request_id = "r1";
  assert(store.commit(req).duplicate);
  // Another project never sees this project's request ids.
  req.project_id = "p2";
  assert(!store.commit(req).duplicate);

  std::string dir = (std::filesystem::temp_directory_path() / ("diagram_stream_test_" + make_request_id())).string();
  {
    FileArtifactStore file_store(dir, 100000);
    req.project_id = "p1";
    for (size_t i = 0; i <= kMaxHistoryEntries; ++i) {
      req.request_id = "r" + std::to_string(i);
      (void)file_store.commit(req);
    }
    req.request_id = "r" + std::to_string(kMaxHistoryEntries);
    assert(file_store.commit(req).duplicate);
    assert(file_store.history("p1").size() == kMaxHistoryEntries);
  }
  Json doc = loads_json(read_text_file(dir + "/store.json"));
  assert(doc.as_object().count("requests") == 0);
  const auto& project = doc.as_object().at("projects").as_object().at("p1").as_object();
  assert(project.at("history").as_array().size() == kMaxHistoryEntries);
  assert(json_string_or(project.at("history").as_array().front().as_object(), "requestId") ==
         "r" + std::to_string(kMaxHistoryEntries));
  std::filesystem::remove_all(dir);
}

static void test_file_store_roundtrip() {
  std::string dir = (std::filesystem::temp_directory_path() / ("diagram_stream_test_" + make_request_id())).string();
  {
    FileArtifactStore store(dir, 3000);
    CommitRequest req;
    req.request_id = "r1";
    req.user_id = "u1";
    req.project_id = "p1";
    req.prompt = "login flow";
    req.diagram_type = "flowchart";
    req.diagram_text = "flowchart TD\nA-->B";
    auto receipt = store.commit(req);
    assert(receipt.remaining_balance == 2000);
    store.store_preview("p1", receipt.artifact_id, "<svg/>");
    assert(store.commit(req).duplicate);
  }
  {
    FileArtifactStore reopened(dir, 3000);
    assert(reopened.quota_balance("u1") == 2000);
    assert(reopened.quota_balance("someone-else") == 3000);
    auto history = reopened.history("p1");
    assert(history.size() == 1);
    assert(history[0].diagram_text == "flowchart TD\nA-->B");
    assert(history[0].rendered_image == "<svg/>");
  }
  std::filesystem::remove_all(dir);
}

static void test_retry_policy_backoff() {
  RetryPolicy policy;
  assert(policy.delay_after(1).count() == 250);
  assert(policy.delay_after(2).count() == 500);
  assert(policy.delay_after(3).count() == 1000);
  policy.max_delay = std::chrono::milliseconds(600);
  assert(policy.delay_after(3).count() == 600);

  RecordingSleeper sleeper;
  int calls = 0;
  int v = with_retry(RetryPolicy{}, sleeper, "flaky", [&] {
    if (++calls < 3) throw DiagramStreamError("busy", ErrorKind::Persistence);
    return 7;
  });
  assert(v == 7 && calls == 3);
  assert(sleeper.delays.size() == 2);
  assert(sleeper.delays[0].count() == 250 && sleeper.delays[1].count() == 500);

  calls = 0;
  try {
    with_retry(RetryPolicy{}, sleeper, "rejected", [&]() -> int {
      ++calls;
      throw DiagramStreamError("Insufficient token balance", ErrorKind::Rejected);
    });
    assert(false && "expected DiagramStreamError");
  } catch (const DiagramStreamError& e) {
    assert(e.kind == ErrorKind::Rejected);
  }
  assert(calls == 1);
}

static void test_pipeline_config_from_json() {
  auto cfg = pipeline_config_from_json(loads_json(R"({"pipeline": {
    "settle_delay_ms": 0, "partial_delay_ms": 10, "max_auto_retries": 2, "generation_timeout_ms": 5000,
    "persistence_retry": {"max_attempts": 5, "initial_delay_ms": 100}, "close_marker": "~~~", "model": "m"
  }})"));
  assert(cfg.pacing.settle_delay.count() == 0);
  assert(cfg.pacing.partial_delay.count() == 10);
  assert(cfg.pacing.completion_delay.count() == 800);
  assert(cfg.max_auto_retries == 2);
  assert(cfg.generation_timeout.count() == 5000);
  assert(cfg.persistence_retry.max_attempts == 5);
  assert(cfg.persistence_retry.initial_delay.count() == 100);
  assert(cfg.fence.close_marker == "~~~");
  assert(cfg.fence.open_marker == "```mermaid");
  assert(cfg.model == "m");

  try {
    (void)pipeline_config_from_json(loads_json(R"({"settle_delay_ms": -1})"));
    assert(false && "expected DiagramStreamError");
  } catch (const DiagramStreamError&) {
  }
}

static void test_retry_request_raises_temperature() {
  PipelineConfig cfg;
  auto req = login_flow_request();
  auto next = make_retry_request(req, "Parse error", cfg);
  assert(next.is_retry && next.failure_reason == "Parse error");
  assert(std::abs(next.sampling.temperature - 0.9) < 1e-9);
  assert(next.request_id == req.request_id);
  req.sampling.temperature = 0.95;
  assert(std::abs(make_retry_request(req, "x", cfg).sampling.temperature - 1.0) < 1e-9);

  RetryState st;
  assert(st.consume("first"));
  assert(!st.consume("second"));
  assert(st.attempt == 1 && st.last_failure_reason == "second");
}

// ---------------- pipeline ----------------

static void test_generate_success_paces_and_commits() {
  ScriptedProvider provider;
  provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
  BasicSyntaxValidator validator(default_catalog());
  MemoryArtifactStore store(5000);
  RecordingSleeper sleeper;
  ManualClock clock;
  DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
  RecordingSink sink;

  auto req = login_flow_request();
  req.client_rendered_image = "<svg id='prev'/>";
  auto result = gen.generate(req, sink);
  assert(result.success);
  assert(result.physical_attempts == 1);
  assert(result.diagram_text == "flowchart TD\nA-->B\nB-->C");

  assert(sink.events.size() == 2);
  assert(sink.events[0].kind == StreamEvent::Kind::Partial);
  assert(sink.events[0].mermaid_syntax == "flowchart TD\nA-->B\nB-->C");
  assert(sink.events[1].kind == StreamEvent::Kind::Success);
  assert(sink.events[1].artifact_id == result.artifact_id);

  assert(store.commit_count() == 1);
  assert(store.quota_balance("u1") == 4000);
  assert(store.current_diagram("p1") == result.diagram_text);
  assert(store.preview("p1") == "<svg id='prev'/>");
  assert(store.history("p1").size() == 1);

  assert(sleeper.delays.size() == 3);
  assert(sleeper.delays[0].count() == 1000);
  assert(sleeper.delays[1].count() == 400);
  assert(sleeper.delays[2].count() == 800);

  const auto& sent = provider.requests[0];
  assert(sent.messages.back().content.find("login flow") != std::string::npos);
  assert(std::abs(sent.sampling.temperature - 0.7) < 1e-9);
}

static void test_generate_retry_after_validation_failure() {
  ScriptedProvider provider;
  provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
  provider.scripts.push_back(fenced_script("A-->B\nB-->D\n"));
  ScriptedValidator validator;
  validator.results = {{false, "Parse error on line 2"}, {true, ""}};
  MemoryArtifactStore store(5000);
  RecordingSleeper sleeper;
  ManualClock clock;
  DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
  RecordingSink sink;

  auto result = gen.generate(login_flow_request(), sink);
  assert(result.success);
  assert(result.physical_attempts == 2);
  assert(result.retry.attempt == 1);
  assert(validator.seen.size() == 2);

  assert(count_kind(sink.events, StreamEvent::Kind::Failure) == 1);
  const StreamEvent* failure = nullptr;
  for (const auto& e : sink.events) {
    if (e.kind == StreamEvent::Kind::Failure) failure = &e;
  }
  assert(failure->needs_retry);
  assert(failure->mermaid_syntax == "A-->B\nB-->C");
  assert(failure->error_message == "Parse error on line 2");
  assert(sink.events.back().kind == StreamEvent::Kind::Success);

  assert(provider.requests.size() == 2);
  assert(std::abs(provider.requests[1].sampling.temperature - 0.9) < 1e-9);
  assert(provider.requests[1].messages.back().content.find("Parse error on line 2") != std::string::npos);
  assert(provider.requests[0].messages.back().content.find("Parse error") == std::string::npos);

  assert(store.commit_count() == 1);
  assert(store.current_diagram("p1") == "flowchart TD\nA-->B\nB-->D");
}

static void test_generate_manual_retry_samples_hotter() {
  ScriptedProvider provider;
  provider.scripts.push_back(fenced_script("A-->B\n"));
  provider.scripts.push_back(fenced_script("A-->B\n"));
  ScriptedValidator validator;
  validator.results = {{true, ""}, {true, ""}};
  MemoryArtifactStore store(5000);
  RecordingSleeper sleeper;
  ManualClock clock;
  DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);

  RecordingSink sink;
  auto req = parse_generation_request(R"({"textPrompt": "login flow", "diagramType": "flowchart",
    "projectId": "p1", "userId": "u1", "isRetry": true, "failureReason": "Parse error line 2"})");
  auto result = gen.generate(req, sink);
  assert(result.success);
  assert(result.physical_attempts == 1);
  assert(std::abs(provider.requests[0].sampling.temperature - 0.9) < 1e-9);
  const auto& content = provider.requests[0].messages.back().content;
  assert(content.find("Parse error line 2") != std::string::npos);
  assert(content.find("Keep the syntax simple") != std::string::npos);

  RecordingSink pinned_sink;
  auto pinned = parse_generation_request(R"({"textPrompt": "login flow", "diagramType": "flowchart",
    "projectId": "p1", "userId": "u1", "isRetry": true, "failureReason": "bad", "temperature": 0.4})");
  assert(gen.generate(pinned, pinned_sink).success);
  assert(std::abs(provider.requests[1].sampling.temperature - 0.4) < 1e-9);
}

static void test_generate_retry_budget_exhausted() {
  ScriptedProvider provider;
  provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
  provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
  provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
  ScriptedValidator validator;
  validator.results = {{false, "bad 1"}, {false, "bad 2"}, {false, "bad 3"}};
  MemoryArtifactStore store(5000);
  RecordingSleeper sleeper;
  ManualClock clock;
  DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
  RecordingSink sink;

  auto result = gen.generate(login_flow_request(), sink);
  assert(!result.success);
  assert(result.physical_attempts == 2);
  assert(result.retry.attempt == 1);
  assert(result.retry.attempt <= result.retry.max_attempts);
  assert(result.error->kind == ErrorKind::Validation);
  assert(provider.requests.size() == 2);

  assert(count_kind(sink.events, StreamEvent::Kind::Success) == 0);
  assert(count_kind(sink.events, StreamEvent::Kind::Failure) == 2);
  assert(sink.events.back().kind == StreamEvent::Kind::Failure);
  assert(!sink.events.back().needs_retry);
  assert(sink.events.back().error_message == "bad 2");
  assert(store.commit_count() == 0);
  assert(store.quota_balance("u1") == 5000);
}

static void test_generate_missing_closing_fence() {
  ScriptedProvider provider;
  ScriptedProvider::Script open_only;
  open_only.deltas = {"```mermaid\n", "flowchart TD\n", "A-->B\n", "B-->C\n"};
  provider.scripts = {open_only, open_only};
  BasicSyntaxValidator validator(default_catalog());
  MemoryArtifactStore store(5000);
  RecordingSleeper sleeper;
  ManualClock clock;
  DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
  RecordingSink sink;

  auto result = gen.generate(login_flow_request(), sink);
  assert(!result.success);
  assert(result.error->kind == ErrorKind::EmptyArtifact);
  assert(count_kind(sink.events, StreamEvent::Kind::Success) == 0);
  assert(count_kind(sink.events, StreamEvent::Kind::Partial) == 2);
  assert(sink.events.back().kind == StreamEvent::Kind::Failure);
  assert(!sink.events.back().needs_retry);
  assert(store.commit_count() == 0);
}

static void test_generate_transport_failure_keeps_budget() {
  ScriptedProvider provider;
  ScriptedProvider::Script broken;
  broken.deltas = {"```mermaid\n", "flowchart TD\n"};
  broken.fail_after = true;
  broken.error = "curl error: Connection reset by peer";
  provider.scripts = {broken};
  BasicSyntaxValidator validator(default_catalog());
  MemoryArtifactStore store(5000);
  RecordingSleeper sleeper;
  ManualClock clock;
  DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
  RecordingSink sink;

  auto result = gen.generate(login_flow_request(), sink);
  assert(!result.success);
  assert(result.error->kind == ErrorKind::StreamTransport);
  assert(result.retry.attempt == 0);
  assert(provider.requests.size() == 1);
  assert(sink.events.size() == 1);
  assert(sink.events[0].error_kind == ErrorKind::StreamTransport);
  assert(!sink.events[0].needs_retry);
  assert(store.commit_count() == 0);
}

static void test_generate_timeout_is_transport_failure() {
  ScriptedProvider provider;
  provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
  BasicSyntaxValidator validator(default_catalog());
  MemoryArtifactStore store(5000);
  RecordingSleeper sleeper;
  ManualClock clock;
  clock.step = std::chrono::seconds(200);
  DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
  RecordingSink sink;

  auto result = gen.generate(login_flow_request(), sink);
  assert(!result.success);
  assert(result.error->kind == ErrorKind::StreamTransport);
  assert(result.error->message.find("timed out") != std::string::npos);
  assert(result.retry.attempt == 0);
  assert(store.commit_count() == 0);
}

static void test_generate_cancellation_commits_nothing() {
  {
    ScriptedProvider provider;
    provider.scripts.push_back(fenced_script("A-->B\nB-->C\nC-->D\nD-->E\n"));
    BasicSyntaxValidator validator(default_catalog());
    MemoryArtifactStore store(5000);
    RecordingSleeper sleeper;
    ManualClock clock;
    DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
    RecordingSink sink;
    sink.accept_limit = 1;

    auto result = gen.generate(login_flow_request(), sink);
    assert(!result.success);
    assert(result.error->kind == ErrorKind::Cancelled);
    assert(sink.events.size() == 1);
    assert(store.commit_count() == 0);
    assert(store.quota_balance("u1") == 5000);
  }
  {
    ScriptedProvider provider;
    provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
    BasicSyntaxValidator validator(default_catalog());
    MemoryArtifactStore store(5000);
    RecordingSleeper sleeper;
    ManualClock clock;
    DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
    RecordingSink sink;
    CancellationToken token;
    token.cancel();

    auto result = gen.generate(login_flow_request(), sink, &token);
    assert(result.error->kind == ErrorKind::Cancelled);
    assert(sink.events.empty());
    assert(store.commit_count() == 0);
  }
}

static void test_generate_rejections() {
  ScriptedProvider provider;
  BasicSyntaxValidator validator(default_catalog());
  MemoryArtifactStore store(500);
  RecordingSleeper sleeper;
  ManualClock clock;
  DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);

  RecordingSink poor;
  auto result = gen.generate(login_flow_request(), poor);
  assert(result.error->kind == ErrorKind::Rejected);
  assert(poor.events.size() == 1);
  assert(poor.events[0].error_message == "Insufficient token balance");
  assert(provider.requests.empty());

  store.set_balance("u1", 5000);
  RecordingSink unknown;
  auto req = login_flow_request();
  req.diagram_type = "venn";
  result = gen.generate(req, unknown);
  assert(result.error->kind == ErrorKind::Rejected);
  assert(unknown.events[0].error_message.find("venn") != std::string::npos);
  assert(provider.requests.empty());

  // Owns a real sleeper and clock when none are injected.
  MemoryArtifactStore empty_store(0);
  DiagramGenerator defaults(default_catalog(), provider, validator, empty_store);
  RecordingSink broke;
  result = defaults.generate(login_flow_request(), broke);
  assert(result.error->kind == ErrorKind::Rejected);
  assert(broke.events.size() == 1);
  assert(provider.requests.empty());
}

static void test_generate_persistence_retry() {
  {
    ScriptedProvider provider;
    provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
    BasicSyntaxValidator validator(default_catalog());
    FlakyStore store(5000);
    store.commit_failures = 2;
    store.preview_failures = 10;
    RecordingSleeper sleeper;
    ManualClock clock;
    DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
    RecordingSink sink;
    auto req = login_flow_request();
    req.client_rendered_image = "<svg/>";

    auto result = gen.generate(req, sink);
    assert(result.success);
    assert(store.commit_count() == 1);
    assert(store.quota_balance("u1") == 4000);
    assert(store.preview("p1").empty());
    assert(sink.events.back().kind == StreamEvent::Kind::Success);
  }
  {
    ScriptedProvider provider;
    provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
    BasicSyntaxValidator validator(default_catalog());
    FlakyStore store(5000);
    store.commit_failures = 5;
    RecordingSleeper sleeper;
    ManualClock clock;
    DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);
    RecordingSink sink;

    auto result = gen.generate(login_flow_request(), sink);
    assert(!result.success);
    assert(result.error->kind == ErrorKind::Persistence);
    assert(sink.events.back().kind == StreamEvent::Kind::Failure);
    assert(!sink.events.back().needs_retry);
    assert(sink.events.back().mermaid_syntax == "flowchart TD\nA-->B\nB-->C");
    assert(store.commit_count() == 0);
    assert(store.quota_balance("u1") == 5000);
    assert(provider.requests.size() == 1);
  }
}

static void test_generate_commit_is_idempotent_per_request() {
  ScriptedProvider provider;
  provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
  provider.scripts.push_back(fenced_script("A-->B\nB-->C\n"));
  BasicSyntaxValidator validator(default_catalog());
  MemoryArtifactStore store(5000);
  RecordingSleeper sleeper;
  ManualClock clock;
  DiagramGenerator gen(default_catalog(), provider, validator, store, PipelineConfig{}, &sleeper, &clock);

  RecordingSink a;
  RecordingSink b;
  auto first = gen.generate(login_flow_request(), a);
  auto second = gen.generate(login_flow_request(), b);
  assert(first.success && second.success);
  assert(first.artifact_id == second.artifact_id);
  assert(store.commit_count() == 1);
  assert(store.quota_balance("u1") == 4000);
}

int main() {
  set_logger(silent_logger());

  auto run = [](const char* name, void (*fn)()) {
    try {
      fn();
      std::cout << "PASS: " << name << "\n";
    } catch (const std::exception& e) {
      std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
      throw;
    }
  };

  try {
    run("json_loads_dumps", test_json_loads_dumps);
    run("json_rejects_malformed", test_json_rejects_malformed);
    run("logger_capture_and_level", test_logger_capture_and_level);
    run("catalog_lookup", test_catalog_lookup);
    run("catalog_load_json", test_catalog_load_json);
    run("prompt_compiler", test_prompt_compiler);
    run("render_template_single_pass", test_render_template_single_pass);
    run("parse_detected_type", test_parse_detected_type);
    run("detect_diagram_type", test_detect_diagram_type);
    run("parse_generation_request", test_parse_generation_request);
    run("fence_single_delta", test_fence_single_delta);
    run("fence_incremental_batches", test_fence_incremental_batches);
    run("fence_final_flush_may_be_short", test_fence_final_flush_may_be_short);
    run("fence_without_opening_marker_aborts", test_fence_without_opening_marker_aborts);
    run("fence_without_closing_marker_aborts", test_fence_without_closing_marker_aborts);
    run("fence_marker_case_and_trailing_text", test_fence_marker_case_and_trailing_text);
    run("fence_max_buffer_bytes", test_fence_max_buffer_bytes);
    run("fence_long_preamble_keeps_only_marker_tail", test_fence_long_preamble_keeps_only_marker_tail);
    run("fence_advance_is_pure", test_fence_advance_is_pure);
    run("normalize_inserts_canonical_declaration", test_normalize_inserts_canonical_declaration);
    run("normalize_drops_junk_and_stray_language_line", test_normalize_drops_junk_and_stray_language_line);
    run("normalize_is_idempotent", test_normalize_is_idempotent);
    run("sanitize_gantt", test_sanitize_gantt);
    run("sanitize_architecture", test_sanitize_architecture);
    run("sanitize_flowchart_end_class", test_sanitize_flowchart_end_class);
    run("basic_validator", test_basic_validator);
    run("command_validator", test_command_validator);
    run("prepare_artifact_validates_once", test_prepare_artifact_validates_once);
    run("sse_parser_and_chat_delta", test_sse_parser_and_chat_delta);
    run("chat_completion_body", test_chat_completion_body);
    run("event_encoding", test_event_encoding);
    run("history_cap", test_history_cap);
    run("memory_store_commit_rules", test_memory_store_commit_rules);
    run("commit_idempotency_is_bounded_by_history", test_commit_idempotency_is_bounded_by_history);
    run("file_store_roundtrip", test_file_store_roundtrip);
    run("retry_policy_backoff", test_retry_policy_backoff);
    run("pipeline_config_from_json", test_pipeline_config_from_json);
    run("retry_request_raises_temperature", test_retry_request_raises_temperature);
    run("generate_success", test_generate_success_paces_and_commits);
    run("generate_retry_after_validation_failure", test_generate_retry_after_validation_failure);
    run("generate_manual_retry_samples_hotter", test_generate_manual_retry_samples_hotter);
    run("generate_retry_budget_exhausted", test_generate_retry_budget_exhausted);
    run("generate_missing_closing_fence", test_generate_missing_closing_fence);
    run("generate_transport_failure_keeps_budget", test_generate_transport_failure_keeps_budget);
    run("generate_timeout_is_transport_failure", test_generate_timeout_is_transport_failure);
    run("generate_cancellation_commits_nothing", test_generate_cancellation_commits_nothing);
    run("generate_rejections", test_generate_rejections);
    run("generate_persistence_retry", test_generate_persistence_retry);
    run("generate_commit_is_idempotent_per_request", test_generate_commit_is_idempotent_per_request);
  } catch (...) {
    return 1;
  }

  std::cout << "All tests passed.\n";
  return 0;
}
