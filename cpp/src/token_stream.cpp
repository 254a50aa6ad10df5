#include "diagram_stream.hpp"

#include "text_util.hpp"

namespace diagram_stream {

// ---------------- SSE framing ----------------

bool SseLineParser::feed(const std::string& chunk, const std::function<bool(const std::string& data)>& on_data) {
  buffer_ += chunk;
  size_t nl;
  while ((nl = buffer_.find('\n')) != std::string::npos) {
    std::string line = buffer_.substr(0, nl);
    buffer_.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    // Blank lines end an event; "event:", "id:" and ":" comments carry nothing we use.
    if (!detail::starts_with(line, "data:")) continue;
    std::string data = line.substr(5);
    if (!data.empty() && data.front() == ' ') data.erase(0, 1);
    if (!on_data(data)) return false;
  }
  return true;
}

std::optional<std::string> parse_chat_delta(const std::string& data) {
  Json chunk;
  try {
    chunk = loads_json(data);
  } catch (const std::runtime_error& e) {
    logger()->debug("provider: ignoring malformed stream chunk: {}", e.what());
    return std::nullopt;
  }
  if (!chunk.is_object()) return std::nullopt;
  const auto& root = chunk.as_object();
  auto it_choices = root.find("choices");
  if (it_choices == root.end() || !it_choices->second.is_array() || it_choices->second.as_array().empty()) {
    return std::nullopt;
  }
  const auto& choice = it_choices->second.as_array().front();
  if (!choice.is_object()) return std::nullopt;
  auto it_delta = choice.as_object().find("delta");
  if (it_delta == choice.as_object().end() || !it_delta->second.is_object()) return std::nullopt;
  auto it_content = it_delta->second.as_object().find("content");
  if (it_content == it_delta->second.as_object().end() || !it_content->second.is_string()) return std::nullopt;
  return it_content->second.as_string();
}

// ---------------- Token Stream Reader ----------------

StreamReadResult TokenStreamReader::read(const CompletionRequest& request, const DeltaCallback& on_delta) {
  StreamReadResult result;
  const auto deadline = clock_.now() + timeout_;
  bool cancelled = false;
  bool timed_out = false;
  bool consumer_stopped = false;

  auto guarded = [&](const std::string& delta) -> bool {
    if (cancel_ && cancel_->cancelled()) {
      cancelled = true;
      return false;
    }
    if (clock_.now() > deadline) {
      timed_out = true;
      return false;
    }
    result.delta_count++;
    if (!on_delta(delta)) {
      consumer_stopped = true;
      return false;
    }
    return true;
  };

  ProviderStatus status;
  try {
    status = provider_.stream(request, guarded);
  } catch (const std::exception& e) {
    status.ok = false;
    status.error = e.what();
  }

  if (cancelled || (cancel_ && cancel_->cancelled())) {
    result.status = StreamReadResult::Status::Cancelled;
  } else if (timed_out) {
    result.status = StreamReadResult::Status::TimedOut;
    result.error = "generation timed out after " + std::to_string(timeout_.count() / 1000) + "s";
  } else if (consumer_stopped) {
    result.status = StreamReadResult::Status::Stopped;
  } else if (!status.ok) {
    result.status = StreamReadResult::Status::TransportError;
    result.error = status.error.empty() ? "completion stream failed" : status.error;
  } else {
    result.status = StreamReadResult::Status::Completed;
  }
  return result;
}

// ---------------- Type detection ----------------

std::optional<std::string> detect_diagram_type(ICompletionProvider& provider, const DiagramCatalog& catalog,
                                               const std::string& prompt, const std::string& model) {
  if (detail::trim_copy(prompt).empty()) throw DiagramStreamError("Prompt is required", ErrorKind::Rejected);
  PromptCompiler compiler(catalog);
  auto compiled = compiler.compile_detection(prompt);
  CompletionRequest req;
  req.model = model;
  req.system = compiled.system;
  req.messages = compiled.messages;
  req.sampling = compiled.sampling;

  std::string text;
  auto status = provider.stream(req, [&](const std::string& delta) {
    text += delta;
    return true;
  });
  if (!status.ok) throw DiagramStreamError("type detection failed: " + status.error, ErrorKind::StreamTransport);

  auto type = parse_detected_type(catalog, text);
  if (type) {
    logger()->info("detect: detected diagram type '{}'", *type);
  } else {
    logger()->warn("detect: could not map completion '{}' to a type", detail::trim_copy(text));
  }
  return type;
}

}  // namespace diagram_stream
