#include "diagram_stream.hpp"

#include <cstdlib>
#include <sstream>

#include <curl/curl.h>

namespace diagram_stream {

// ---------------- Provider config ----------------

ProviderConfig load_provider_config(const std::string& path) {
  ProviderConfig cfg;
  Json doc;
  try {
    doc = loads_json(read_text_file(path));
  } catch (const std::runtime_error& e) {
    throw DiagramStreamError("invalid config " + path + ": " + e.what(), ErrorKind::Rejected);
  }
  if (!doc.is_object()) throw DiagramStreamError("invalid config " + path + ": root must be an object");
  const JsonObject* o = &doc.as_object();
  auto it = o->find("provider");
  if (it != o->end()) {
    if (!it->second.is_object()) throw DiagramStreamError("invalid config " + path + ": 'provider' must be an object");
    o = &it->second.as_object();
  }
  cfg.base_url = json_string_or(*o, "base_url", cfg.base_url);
  cfg.api_key = json_string_or(*o, "api_key", cfg.api_key);
  cfg.model = json_string_or(*o, "model", cfg.model);
  if (auto v = json_number_opt(*o, "timeout_seconds")) cfg.timeout_seconds = static_cast<long>(*v);
  if (auto v = json_number_opt(*o, "connect_timeout_seconds")) cfg.connect_timeout_seconds = static_cast<long>(*v);
  return cfg;
}

void apply_provider_env(ProviderConfig& config) {
  if (const char* key = std::getenv("OPENAI_API_KEY"); key && *key) config.api_key = key;
  if (const char* url = std::getenv("DIAGRAM_STREAM_BASE_URL"); url && *url) config.base_url = url;
  if (const char* model = std::getenv("DIAGRAM_STREAM_MODEL"); model && *model) config.model = model;
}

// ---------------- Request body ----------------

std::string build_chat_completion_body(const CompletionRequest& request) {
  JsonArray messages;
  if (!request.system.empty()) {
    messages.push_back(Json(JsonObject{{"role", Json("system")}, {"content", Json(request.system)}}));
  }
  for (const auto& m : request.messages) {
    messages.push_back(Json(JsonObject{{"role", Json(m.role)}, {"content", Json(m.content)}}));
  }
  JsonObject body;
  body["model"] = Json(request.model);
  body["stream"] = Json(true);
  body["temperature"] = Json(request.sampling.temperature);
  body["top_p"] = Json(request.sampling.top_p);
  body["max_tokens"] = Json(request.sampling.max_tokens);
  body["messages"] = Json(std::move(messages));
  return dumps_json(Json(std::move(body)));
}

// ---------------- OpenAI streaming provider ----------------

namespace {

struct StreamContext {
  CURL* curl{nullptr};
  const DeltaCallback* on_delta{nullptr};
  SseLineParser parser;
  long http_status{0};
  std::string error_body;
  std::string stream_error;
  bool stopped{false};
  bool done{false};
};

std::optional<std::string> chunk_error(const std::string& data) {
  if (data.find("\"error\"") == std::string::npos) return std::nullopt;
  try {
    Json v = loads_json(data);
    if (!v.is_object()) return std::nullopt;
    auto it = v.as_object().find("error");
    if (it == v.as_object().end()) return std::nullopt;
    if (it->second.is_object()) return json_string_or(it->second.as_object(), "message", "provider error");
    if (it->second.is_string()) return it->second.as_string();
    return std::string("provider error");
  } catch (const std::runtime_error&) {
    return std::nullopt;
  }
}

size_t on_stream_bytes(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<StreamContext*>(userdata);
  const size_t n = size * nmemb;
  if (ctx->http_status == 0) curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->http_status);
  if (ctx->http_status >= 400) {
    if (ctx->error_body.size() < 4096) ctx->error_body.append(ptr, n);
    return n;
  }
  if (ctx->done) return n;

  bool keep_going = ctx->parser.feed(std::string(ptr, n), [ctx](const std::string& data) {
    if (data == "[DONE]") {
      ctx->done = true;
      return false;
    }
    if (auto err = chunk_error(data)) {
      ctx->stream_error = *err;
      return false;
    }
    auto content = parse_chat_delta(data);
    if (!content || content->empty()) return true;
    if (!(*ctx->on_delta)(*content)) {
      ctx->stopped = true;
      return false;
    }
    return true;
  });
  if (!keep_going && (ctx->stopped || !ctx->stream_error.empty())) return 0;
  return n;
}

std::string describe_http_error(long status, const std::string& body) {
  std::ostringstream oss;
  if (status == 401 || status == 403) {
    oss << "authentication failed (HTTP " << status << ")";
  } else if (status == 429) {
    oss << "rate limit or quota exceeded (HTTP 429)";
  } else if (status == 400) {
    oss << "invalid request (HTTP 400)";
  } else {
    oss << "http error (" << status << ")";
  }
  if (auto msg = chunk_error(body)) {
    oss << ": " << *msg;
  } else if (!body.empty()) {
    oss << ": " << body.substr(0, 200);
  }
  return oss.str();
}

}  // namespace

OpenAiStreamProvider::OpenAiStreamProvider(ProviderConfig config) : config_(std::move(config)) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

OpenAiStreamProvider::~OpenAiStreamProvider() { curl_global_cleanup(); }

ProviderStatus OpenAiStreamProvider::stream(const CompletionRequest& request, const DeltaCallback& on_delta) {
  ProviderStatus status;
  if (config_.api_key.empty()) {
    status.ok = false;
    status.error = "OPENAI_API_KEY missing";
    return status;
  }

  std::string base = config_.base_url;
  while (!base.empty() && base.back() == '/') base.pop_back();
  const std::string url = base + "/v1/chat/completions";
  CompletionRequest effective = request;
  if (effective.model.empty()) effective.model = config_.model;
  const std::string body = build_chat_completion_body(effective);

  CURL* curl = curl_easy_init();
  if (!curl) {
    status.ok = false;
    status.error = "curl init failed";
    return status;
  }

  struct curl_slist* headers = nullptr;
  const std::string auth = "Authorization: Bearer " + config_.api_key;
  headers = curl_slist_append(headers, auth.c_str());
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, "Accept: text/event-stream");

  StreamContext ctx;
  ctx.curl = curl;
  ctx.on_delta = &on_delta;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config_.connect_timeout_seconds);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_stream_bytes);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

  logger()->debug("provider: POST {} model={}", url, effective.model);
  CURLcode res = curl_easy_perform(curl);
  long http_status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  status.http_status = static_cast<int>(http_status);
  if (ctx.stopped) {
    status.stopped = true;
    return status;
  }
  if (!ctx.stream_error.empty()) {
    status.ok = false;
    status.error = "provider stream error: " + ctx.stream_error;
  } else if (http_status >= 400) {
    status.ok = false;
    status.error = describe_http_error(http_status, ctx.error_body);
  } else if (res != CURLE_OK) {
    status.ok = false;
    status.error = std::string("curl error: ") + curl_easy_strerror(res);
  }
  if (!status.ok) logger()->warn("provider: {}", status.error);
  return status;
}

}  // namespace diagram_stream
