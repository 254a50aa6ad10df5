#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

namespace diagram_stream {

// ---------------- Errors ----------------

enum class ErrorKind {
  StreamTransport,  // provider/network failure, HTTP error, timeout
  Validation,       // candidate failed the syntax check
  EmptyArtifact,    // stream ended without an extractable fenced payload
  Persistence,      // post-validation write failure
  Cancelled,        // client went away
  Rejected,         // unknown type, insufficient quota, malformed request
};

const char* error_kind_name(ErrorKind kind);

struct DiagramStreamError : public std::runtime_error {
  ErrorKind kind;
  std::string message;
  explicit DiagramStreamError(std::string message_, ErrorKind kind_ = ErrorKind::Rejected)
      : std::runtime_error(message_), kind(kind_), message(std::move(message_)) {}

  const char* what() const noexcept override { return message.c_str(); }
};

struct PipelineError {
  ErrorKind kind{ErrorKind::Validation};
  std::string message;
  // Best available diagram text, shown to the user for inspection.
  std::string candidate;
};

// Result of one pipeline stage. Exactly one of value/error is set.
template <typename T>
struct Outcome {
  bool ok{false};
  std::optional<T> value;
  std::optional<PipelineError> error;

  static Outcome success(T v) {
    Outcome out;
    out.ok = true;
    out.value = std::move(v);
    return out;
  }

  static Outcome failure(PipelineError e) {
    Outcome out;
    out.ok = false;
    out.error = std::move(e);
    return out;
  }

  static Outcome failure(ErrorKind kind, std::string message, std::string candidate = "") {
    return failure(PipelineError{kind, std::move(message), std::move(candidate)});
  }
};

// ---------------- Json ----------------

struct Json;
using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

struct Json {
  using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;
  Value value;

  Json() : value(nullptr) {}
  Json(std::nullptr_t) : value(nullptr) {}
  Json(bool b) : value(b) {}
  Json(double n) : value(n) {}
  Json(int n) : value(static_cast<double>(n)) {}
  Json(int64_t n) : value(static_cast<double>(n)) {}
  Json(std::string s) : value(std::move(s)) {}
  Json(const char* s) : value(std::string(s)) {}
  Json(JsonArray a) : value(std::move(a)) {}
  Json(JsonObject o) : value(std::move(o)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool& as_bool() const;
  const double& as_number() const;
  const std::string& as_string() const;
  const JsonArray& as_array() const;
  const JsonObject& as_object() const;

  JsonArray& as_array();
  JsonObject& as_object();
};

// Strict JSON parse. Throws std::runtime_error("JSON parse error: ...").
Json loads_json(const std::string& text);

std::string dumps_json(const Json& value);

// Field accessors for decoded objects; missing or mistyped fields yield the default.
std::string json_string_or(const JsonObject& o, const std::string& key, const std::string& def = "");
bool json_bool_or(const JsonObject& o, const std::string& key, bool def);
std::optional<double> json_number_opt(const JsonObject& o, const std::string& key);
std::vector<std::string> json_string_list(const JsonObject& o, const std::string& key);

std::string read_text_file(const std::string& path);

// ---------------- Logging ----------------

// Library logger named "diagram_stream"; logs to stderr at info level until replaced.
std::shared_ptr<spdlog::logger> logger();

// Swaps the library logger; nullptr restores the stderr default.
void set_logger(std::shared_ptr<spdlog::logger> replacement);

// ---------------- Diagram Type Registry ----------------

struct DiagramTypeDefinition {
  std::string id;
  // Keywords that may open a diagram of this type, e.g. "flowchart", "graph".
  std::vector<std::string> declaration_keywords;
  // Full line prepended when the declaration is missing, e.g. "flowchart TD".
  std::string canonical_declaration;
  // Non-empty for directional graphs; appended to a bare keyword.
  std::string default_direction;
  std::string description;
  std::string prompt_template;
  // Per-type system prompt; empty uses the catalog template.
  std::string system_template;
  std::string example;
  std::vector<std::string> aliases;
};

class DiagramCatalog {
 public:
  DiagramCatalog(std::vector<DiagramTypeDefinition> definitions, std::string system_template, std::string user_template);

  // Case-insensitive, trims whitespace, resolves aliases. nullptr when unknown.
  const DiagramTypeDefinition* find(const std::string& type) const;
  // Like find(), but throws DiagramStreamError(Rejected) when unknown.
  const DiagramTypeDefinition& at(const std::string& type) const;

  const std::vector<DiagramTypeDefinition>& definitions() const { return definitions_; }
  const std::string& system_template() const { return system_template_; }
  const std::string& user_template() const { return user_template_; }

 private:
  std::vector<DiagramTypeDefinition> definitions_;
  std::map<std::string, size_t> index_;
  std::string system_template_;
  std::string user_template_;
};

std::string normalize_type_id(const std::string& raw);

// Built-in catalog, constructed once on first use.
const DiagramCatalog& default_catalog();

// Catalog JSON: {"prompts": {"system_template", "user_template"}, "definitions": {"<id>": {...}}}.
// Definitions omitted from the file fall back to nothing; the file fully replaces the default.
DiagramCatalog load_catalog(const std::string& json_text);
DiagramCatalog load_catalog_file(const std::string& path);

// ---------------- Requests ----------------

struct ChatMessage {
  std::string role;
  std::string content;
};

struct SamplingParams {
  double temperature{0.7};
  double top_p{0.95};
  int max_tokens{4000};
};

struct GenerationRequest {
  std::string prompt;
  std::string diagram_type;
  std::string project_id;
  std::string user_id;
  // Idempotency key for the commit; generated when empty.
  std::string request_id;
  std::string client_rendered_image;
  std::vector<ChatMessage> prior_messages;
  bool is_retry{false};
  // Drop prior conversation context for this generation.
  bool clear_cache{false};
  std::string failure_reason;
  SamplingParams sampling;
  // Set when the body named a temperature; a manual retry then keeps it.
  bool explicit_temperature{false};
};

// Decodes the inbound JSON body. Throws DiagramStreamError(Rejected) on malformed input.
GenerationRequest parse_generation_request(const std::string& json_body);

std::string make_request_id();

// ---------------- Prompt Compiler ----------------

struct CompiledPrompt {
  std::string system;
  std::vector<ChatMessage> messages;
  SamplingParams sampling;
};

class PromptCompiler {
 public:
  explicit PromptCompiler(const DiagramCatalog& catalog) : catalog_(catalog) {}

  std::string system_prompt(const DiagramTypeDefinition& def) const;
  std::string user_prompt(const DiagramTypeDefinition& def, const GenerationRequest& request) const;

  // Throws DiagramStreamError(Rejected) for unknown diagram types.
  CompiledPrompt compile(const GenerationRequest& request) const;

  // Prompt asking the model to pick one catalog type for a free-form request.
  CompiledPrompt compile_detection(const std::string& prompt) const;

 private:
  const DiagramCatalog& catalog_;
};

std::string render_template(std::string tmpl, const std::map<std::string, std::string>& vars);

// Maps a detection completion ("Flowchart.", "`erd`") to a catalog id.
std::optional<std::string> parse_detected_type(const DiagramCatalog& catalog, const std::string& completion);

// ---------------- Fence Extractor ----------------

enum class FenceState { SeekingFence, Collecting, Done, Aborted };

const char* fence_state_name(FenceState state);

struct FenceOptions {
  std::string open_marker{"```mermaid"};
  std::string close_marker{"```"};
  // Lines buffered before a partial flush.
  size_t min_flush_lines{2};
  // 0 = unlimited. Exceeding it aborts the session.
  size_t max_buffer_bytes{0};
};

struct StreamSession {
  FenceState state{FenceState::SeekingFence};
  // While seeking, only the tail that may still begin the opening marker.
  std::string accumulated;
  // Preamble bytes discarded before the opening marker.
  size_t skipped_bytes{0};
  std::vector<std::string> line_buffer;
  // Text already flushed to the client.
  std::string visible;
  size_t emitted_length{0};
  // Rest of the opening marker line not yet consumed.
  bool marker_line_open{false};
  bool settled{false};
  std::string candidate;
  std::string abort_reason;

  bool in_fence() const { return state == FenceState::Collecting; }
};

struct FenceEmission {
  enum class Kind {
    Settle,    // first entry into the fence; wait before the first partial
    Partial,   // text = whole visible text so far
    Complete,  // text = raw candidate
  };
  Kind kind{Kind::Partial};
  std::string text;
  size_t flushed_lines{0};
};

struct FenceTransition {
  StreamSession session;
  std::vector<FenceEmission> emissions;
};

// Pure transition: (session, delta) -> (session', emissions).
FenceTransition advance(StreamSession session, const std::string& delta, const FenceOptions& options);

// Stream end. Any non-terminal session becomes Aborted.
FenceTransition finish(StreamSession session);

class FenceExtractor {
 public:
  FenceExtractor() = default;
  explicit FenceExtractor(FenceOptions options) : options_(std::move(options)) {}

  std::vector<FenceEmission> feed(const std::string& delta);
  std::vector<FenceEmission> finish();
  void reset();

  FenceState state() const { return session_.state; }
  const StreamSession& session() const { return session_; }
  std::optional<std::string> candidate() const;

 private:
  FenceOptions options_;
  StreamSession session_;
};

// Runs a complete completion text through a fresh extractor.
std::optional<std::string> extract_fenced_candidate(const std::string& text, const FenceOptions& options = FenceOptions{});

// ---------------- Normalizer / Sanitizer ----------------

bool is_declaration_line(const DiagramTypeDefinition& def, const std::string& line);

// Ensures the first non-comment line is a declaration for def. Idempotent.
std::string normalize_declaration(const std::string& raw, const DiagramTypeDefinition& def);

// Per-type structural fixups. Idempotent.
std::string sanitize_diagram(const std::string& text, const DiagramTypeDefinition& def);
std::string sanitize_gantt(const std::string& text);
std::string sanitize_architecture(const std::string& text);
std::string sanitize_flowchart(const std::string& text);

// ---------------- Validator ----------------

struct ValidationResult {
  bool valid{false};
  std::string message;
};

class IDiagramValidator {
 public:
  virtual ~IDiagramValidator() = default;
  virtual ValidationResult validate(const std::string& text, const std::string& diagram_type) = 0;
};

// Declaration check plus bracket balance for bracket-structured types.
class BasicSyntaxValidator : public IDiagramValidator {
 public:
  explicit BasicSyntaxValidator(const DiagramCatalog& catalog) : catalog_(catalog) {}
  ValidationResult validate(const std::string& text, const std::string& diagram_type) override;

 private:
  const DiagramCatalog& catalog_;
};

// Runs "<command> <file>" on a temp file holding the text; exit status 0 means valid.
class CommandValidator : public IDiagramValidator {
 public:
  explicit CommandValidator(std::string command) : command_(std::move(command)) {}
  ValidationResult validate(const std::string& text, const std::string& diagram_type) override;

 private:
  std::string command_;
};

struct DiagramArtifact {
  std::string diagram_type;
  std::string raw_text;
  std::string normalized_text;
  bool is_valid{false};
  std::string validation_message;
};

// normalize -> sanitize -> validate (exactly one validator call).
DiagramArtifact prepare_artifact(const std::string& raw, const DiagramTypeDefinition& def, IDiagramValidator& validator);

// ---------------- Timing / cancellation ----------------

class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::chrono::steady_clock::time_point now() = 0;
};

class SystemClock : public Clock {
 public:
  std::chrono::steady_clock::time_point now() override { return std::chrono::steady_clock::now(); }
};

class Sleeper {
 public:
  virtual ~Sleeper() = default;
  virtual void sleep_for(std::chrono::milliseconds delay) = 0;
};

class ThreadSleeper : public Sleeper {
 public:
  void sleep_for(std::chrono::milliseconds delay) override;
};

class CancellationToken {
 public:
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

 private:
  std::atomic<bool> cancelled_{false};
};

// ---------------- Token stream ----------------

struct CompletionRequest {
  std::string model;
  std::string system;
  std::vector<ChatMessage> messages;
  SamplingParams sampling;
};

// Return false to stop the stream.
using DeltaCallback = std::function<bool(const std::string& delta)>;

struct ProviderStatus {
  bool ok{true};
  // The consumer returned false from the delta callback.
  bool stopped{false};
  int http_status{0};
  std::string error;
};

class ICompletionProvider {
 public:
  virtual ~ICompletionProvider() = default;
  virtual ProviderStatus stream(const CompletionRequest& request, const DeltaCallback& on_delta) = 0;
};

struct StreamReadResult {
  enum class Status { Completed, Stopped, Cancelled, TimedOut, TransportError };
  Status status{Status::Completed};
  std::string error;
  size_t delta_count{0};
};

// Wraps a provider stream with a wait deadline and cooperative cancellation.
class TokenStreamReader {
 public:
  TokenStreamReader(ICompletionProvider& provider, Clock& clock, std::chrono::milliseconds timeout,
                    const CancellationToken* cancel = nullptr)
      : provider_(provider), clock_(clock), timeout_(timeout), cancel_(cancel) {}

  StreamReadResult read(const CompletionRequest& request, const DeltaCallback& on_delta);

 private:
  ICompletionProvider& provider_;
  Clock& clock_;
  std::chrono::milliseconds timeout_;
  const CancellationToken* cancel_;
};

// Splits server-sent-event bytes into "data:" payloads.
class SseLineParser {
 public:
  // on_data returns false to stop parsing.
  bool feed(const std::string& chunk, const std::function<bool(const std::string& data)>& on_data);
  void reset() { buffer_.clear(); }

 private:
  std::string buffer_;
};

// Extracts choices[0].delta.content from an OpenAI-style chunk. nullopt when absent.
std::optional<std::string> parse_chat_delta(const std::string& data);

struct ProviderConfig {
  std::string base_url{"https://api.openai.com"};
  std::string api_key;
  std::string model{"gpt-4o"};
  long timeout_seconds{120};
  long connect_timeout_seconds{15};
};

// Reads {"provider": {...}} (or a bare object) from a JSON config file.
ProviderConfig load_provider_config(const std::string& path);
// OPENAI_API_KEY, DIAGRAM_STREAM_BASE_URL, DIAGRAM_STREAM_MODEL.
void apply_provider_env(ProviderConfig& config);

std::string build_chat_completion_body(const CompletionRequest& request);

// chat.completions streaming over libcurl.
class OpenAiStreamProvider : public ICompletionProvider {
 public:
  explicit OpenAiStreamProvider(ProviderConfig config);
  ~OpenAiStreamProvider() override;
  ProviderStatus stream(const CompletionRequest& request, const DeltaCallback& on_delta) override;

 private:
  ProviderConfig config_;
};

// Collects a whole completion and maps it to a catalog type.
std::optional<std::string> detect_diagram_type(ICompletionProvider& provider, const DiagramCatalog& catalog,
                                               const std::string& prompt, const std::string& model = "");

// ---------------- Events ----------------

struct StreamEvent {
  enum class Kind { Partial, Success, Failure };
  Kind kind{Kind::Partial};
  std::string mermaid_syntax;
  bool has_syntax{true};
  std::string artifact_id;
  std::string error_message;
  bool needs_retry{false};
  ErrorKind error_kind{ErrorKind::Validation};

  bool is_complete() const { return kind != Kind::Partial; }

  static StreamEvent partial(std::string text);
  static StreamEvent success(std::string text, std::string artifact_id);
  static StreamEvent failure(const PipelineError& error, bool needs_retry);
};

Json event_to_json(const StreamEvent& event);
// "data: <json>\n\n"
std::string format_sse(const StreamEvent& event);

class IEventSink {
 public:
  virtual ~IEventSink() = default;
  // false means the client is gone.
  virtual bool write(const StreamEvent& event) = 0;
};

class OstreamEventSink : public IEventSink {
 public:
  explicit OstreamEventSink(std::ostream& out) : out_(out) {}
  bool write(const StreamEvent& event) override;

 private:
  std::ostream& out_;
};

// ---------------- Artifact store ----------------

constexpr size_t kMaxHistoryEntries = 30;
constexpr int64_t kGenerationCost = 1000;

struct HistoryEntry {
  std::string artifact_id;
  // Commit idempotency key; replays are recognized while the entry is in history.
  std::string request_id;
  std::string prompt;
  std::string diagram_text;
  std::string rendered_image;
  std::string kind{"chat"};
  int64_t timestamp{0};  // ms since epoch
};

// Newest first; drops the oldest entries beyond cap.
void push_history(std::vector<HistoryEntry>& history, HistoryEntry entry, size_t cap = kMaxHistoryEntries);

int64_t unix_millis_now();

struct CommitRequest {
  std::string request_id;
  std::string user_id;
  std::string project_id;
  std::string prompt;
  std::string diagram_type;
  std::string diagram_text;
  int64_t cost{kGenerationCost};
  int64_t timestamp{0};
};

struct CommitReceipt {
  std::string artifact_id;
  // The request id was already committed; nothing was charged again.
  bool duplicate{false};
  int64_t remaining_balance{0};
};

class IArtifactStore {
 public:
  virtual ~IArtifactStore() = default;
  virtual int64_t quota_balance(const std::string& user_id) = 0;
  // Atomic and conditional: balance >= cost, decrement, push history, upsert current diagram.
  // Idempotent per (project_id, request_id) within the capped history. Throws DiagramStreamError (Rejected: insufficient balance,
  // Persistence: write failure).
  virtual CommitReceipt commit(const CommitRequest& request) = 0;
  virtual void store_preview(const std::string& project_id, const std::string& artifact_id, const std::string& image) = 0;
  virtual std::vector<HistoryEntry> history(const std::string& project_id) = 0;
};

class MemoryArtifactStore : public IArtifactStore {
 public:
  explicit MemoryArtifactStore(int64_t default_balance = 0) : default_balance_(default_balance) {}

  void set_balance(const std::string& user_id, int64_t balance);
  std::string current_diagram(const std::string& project_id);
  std::string preview(const std::string& project_id);
  size_t commit_count();
  void seed_history(const std::string& project_id, std::vector<HistoryEntry> entries);

  int64_t quota_balance(const std::string& user_id) override;
  CommitReceipt commit(const CommitRequest& request) override;
  void store_preview(const std::string& project_id, const std::string& artifact_id, const std::string& image) override;
  std::vector<HistoryEntry> history(const std::string& project_id) override;

 private:
  struct Project {
    std::string current_diagram;
    std::string preview;
    std::vector<HistoryEntry> history;
  };

  std::mutex mu_;
  int64_t default_balance_;
  std::map<std::string, int64_t> balances_;
  std::map<std::string, Project> projects_;
  size_t next_id_{1};
  size_t commit_count_{0};
};

// Whole-store JSON document at <directory>/store.json, rewritten on every mutation.
class FileArtifactStore : public IArtifactStore {
 public:
  FileArtifactStore(std::string directory, int64_t default_balance);

  int64_t quota_balance(const std::string& user_id) override;
  CommitReceipt commit(const CommitRequest& request) override;
  void store_preview(const std::string& project_id, const std::string& artifact_id, const std::string& image) override;
  std::vector<HistoryEntry> history(const std::string& project_id) override;

 private:
  Json load_locked();
  void save_locked(const Json& doc);

  std::mutex mu_;
  std::string directory_;
  int64_t default_balance_;
};

// ---------------- Retry policy / persistence ----------------

struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds initial_delay{250};
  double multiplier{2.0};
  std::chrono::milliseconds max_delay{4000};

  // Delay before attempt n+1, n being 1-based.
  std::chrono::milliseconds delay_after(int attempt) const;
};

// Retries fn on DiagramStreamError(Persistence) / std::runtime_error other than Rejected.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, Sleeper& sleeper, const std::string& what, Fn&& fn) -> decltype(fn()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const DiagramStreamError& e) {
      if (e.kind == ErrorKind::Rejected || attempt >= policy.max_attempts) throw;
      logger()->warn("persistence: {} failed (attempt {}): {}", what, attempt, e.message);
    } catch (const std::runtime_error& e) {
      if (attempt >= policy.max_attempts) throw;
      logger()->warn("persistence: {} failed (attempt {}): {}", what, attempt, e.what());
    }
    sleeper.sleep_for(policy.delay_after(attempt));
  }
}

class PersistenceSink {
 public:
  PersistenceSink(IArtifactStore& store, Sleeper& sleeper, RetryPolicy policy, int64_t cost = kGenerationCost)
      : store_(store), sleeper_(sleeper), policy_(policy), cost_(cost) {}

  // Rejected when the user cannot afford one generation.
  Outcome<int64_t> check_quota(const std::string& user_id);
  Outcome<CommitReceipt> commit(const GenerationRequest& request, const DiagramArtifact& artifact);
  // Secondary write; failures are logged only.
  bool store_preview(const std::string& project_id, const std::string& artifact_id, const std::string& image);

 private:
  IArtifactStore& store_;
  Sleeper& sleeper_;
  RetryPolicy policy_;
  int64_t cost_;
};

// ---------------- Retry controller ----------------

struct RetryState {
  int attempt{0};
  int max_attempts{1};
  std::string last_failure_reason;

  bool can_retry() const { return attempt < max_attempts; }
  // Records a failure; returns true when a retry was granted.
  bool consume(std::string reason);
};

struct PacingOptions {
  std::chrono::milliseconds settle_delay{1000};
  std::chrono::milliseconds partial_delay{400};
  std::chrono::milliseconds completion_delay{800};
};

struct PipelineConfig {
  FenceOptions fence;
  PacingOptions pacing;
  RetryPolicy persistence_retry;
  int max_auto_retries{1};
  double retry_temperature_step{0.2};
  double max_temperature{1.0};
  std::chrono::milliseconds generation_timeout{120000};
  int64_t generation_cost{kGenerationCost};
  // Run partial text through the declaration normalizer before sending.
  bool normalize_partials{true};
  std::string model;
  int64_t default_quota{0};
};

// Reads {"pipeline": {...}} (or a bare object) from a JSON config file.
PipelineConfig load_pipeline_config(const std::string& path);
PipelineConfig pipeline_config_from_json(const Json& value);

// Request for the automatic re-generation after a validation failure.
GenerationRequest make_retry_request(const GenerationRequest& failed, const std::string& failure_reason,
                                     const PipelineConfig& config);

struct GenerationResult {
  bool success{false};
  std::string artifact_id;
  std::string diagram_text;
  std::optional<PipelineError> error;
  int physical_attempts{0};
  RetryState retry;
};

class DiagramGenerator {
 public:
  // sleeper/clock default to real time when null.
  DiagramGenerator(const DiagramCatalog& catalog, ICompletionProvider& provider, IDiagramValidator& validator,
                   IArtifactStore& store, PipelineConfig config = PipelineConfig{}, Sleeper* sleeper = nullptr,
                   Clock* clock = nullptr);

  GenerationResult generate(const GenerationRequest& request, IEventSink& sink,
                            const CancellationToken* cancel = nullptr);

  // One physical attempt with a fresh session. Emits partial events only.
  Outcome<DiagramArtifact> run_attempt(const GenerationRequest& request, const DiagramTypeDefinition& def,
                                       IEventSink& sink, const CancellationToken* cancel = nullptr);

  bool save_preview(const std::string& project_id, const std::string& artifact_id, const std::string& image);

  const PipelineConfig& config() const { return config_; }

 private:
  const DiagramCatalog& catalog_;
  ICompletionProvider& provider_;
  IDiagramValidator& validator_;
  PipelineConfig config_;
  PromptCompiler compiler_;
  std::unique_ptr<Sleeper> owned_sleeper_;
  std::unique_ptr<Clock> owned_clock_;
  Sleeper* sleeper_;
  Clock* clock_;
  PersistenceSink persistence_;
};

}  // namespace diagram_stream
