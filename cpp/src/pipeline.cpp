#include "diagram_stream.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "text_util.hpp"

namespace diagram_stream {

void ThreadSleeper::sleep_for(std::chrono::milliseconds delay) {
  if (delay.count() > 0) std::this_thread::sleep_for(delay);
}

// ---------------- Events ----------------

StreamEvent StreamEvent::partial(std::string text) {
  StreamEvent e;
  e.kind = Kind::Partial;
  e.mermaid_syntax = std::move(text);
  return e;
}

StreamEvent StreamEvent::success(std::string text, std::string artifact_id) {
  StreamEvent e;
  e.kind = Kind::Success;
  e.mermaid_syntax = std::move(text);
  e.artifact_id = std::move(artifact_id);
  return e;
}

StreamEvent StreamEvent::failure(const PipelineError& error, bool needs_retry) {
  StreamEvent e;
  e.kind = Kind::Failure;
  e.mermaid_syntax = error.candidate;
  e.has_syntax = !error.candidate.empty();
  e.error_message = error.message;
  e.needs_retry = needs_retry;
  e.error_kind = error.kind;
  return e;
}

Json event_to_json(const StreamEvent& event) {
  JsonObject o;
  switch (event.kind) {
    case StreamEvent::Kind::Partial:
      o["mermaidSyntax"] = Json(event.mermaid_syntax);
      o["isComplete"] = Json(false);
      break;
    case StreamEvent::Kind::Success:
      o["mermaidSyntax"] = Json(event.mermaid_syntax);
      o["isComplete"] = Json(true);
      o["artifactId"] = Json(event.artifact_id);
      break;
    case StreamEvent::Kind::Failure:
      o["error"] = Json(true);
      o["errorMessage"] = Json(event.error_message);
      o["errorKind"] = Json(error_kind_name(event.error_kind));
      if (event.has_syntax) o["mermaidSyntax"] = Json(event.mermaid_syntax);
      o["needsRetry"] = Json(event.needs_retry);
      o["isComplete"] = Json(true);
      break;
  }
  return Json(std::move(o));
}

std::string format_sse(const StreamEvent& event) { return "data: " + dumps_json(event_to_json(event)) + "\n\n"; }

bool OstreamEventSink::write(const StreamEvent& event) {
  if (!out_) return false;
  out_ << format_sse(event);
  out_.flush();
  return static_cast<bool>(out_);
}

// ---------------- Retry policy / persistence ----------------

std::chrono::milliseconds RetryPolicy::delay_after(int attempt) const {
  double ms = static_cast<double>(initial_delay.count()) * std::pow(multiplier, std::max(0, attempt - 1));
  ms = std::min(ms, static_cast<double>(max_delay.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

Outcome<int64_t> PersistenceSink::check_quota(const std::string& user_id) {
  try {
    int64_t balance = with_retry(policy_, sleeper_, "quota lookup", [&] { return store_.quota_balance(user_id); });
    if (balance < cost_) {
      return Outcome<int64_t>::failure(ErrorKind::Rejected, "Insufficient token balance");
    }
    return Outcome<int64_t>::success(balance);
  } catch (const DiagramStreamError& e) {
    return Outcome<int64_t>::failure(e.kind, e.message);
  } catch (const std::runtime_error& e) {
    return Outcome<int64_t>::failure(ErrorKind::Persistence, e.what());
  }
}

Outcome<CommitReceipt> PersistenceSink::commit(const GenerationRequest& request, const DiagramArtifact& artifact) {
  CommitRequest req;
  req.request_id = request.request_id;
  req.user_id = request.user_id;
  req.project_id = request.project_id;
  req.prompt = request.prompt;
  req.diagram_type = artifact.diagram_type;
  req.diagram_text = artifact.normalized_text;
  req.cost = cost_;
  req.timestamp = unix_millis_now();
  try {
    auto receipt = with_retry(policy_, sleeper_, "commit", [&] { return store_.commit(req); });
    if (receipt.duplicate) {
      logger()->info("persistence: commit replayed for request {}", request.request_id);
    } else {
      logger()->info("persistence: committed artifact {} for request {}", receipt.artifact_id, request.request_id);
    }
    return Outcome<CommitReceipt>::success(receipt);
  } catch (const DiagramStreamError& e) {
    logger()->error("persistence: commit failed: {}", e.message);
    return Outcome<CommitReceipt>::failure(e.kind, e.message, artifact.normalized_text);
  } catch (const std::runtime_error& e) {
    logger()->error("persistence: commit failed: {}", e.what());
    return Outcome<CommitReceipt>::failure(ErrorKind::Persistence, e.what(), artifact.normalized_text);
  }
}

bool PersistenceSink::store_preview(const std::string& project_id, const std::string& artifact_id,
                                    const std::string& image) {
  try {
    with_retry(policy_, sleeper_, "preview write", [&] {
      store_.store_preview(project_id, artifact_id, image);
      return true;
    });
    return true;
  } catch (const std::runtime_error& e) {
    logger()->warn("persistence: preview write for {} failed: {}", artifact_id, e.what());
    return false;
  }
}

// ---------------- Retry controller ----------------

bool RetryState::consume(std::string reason) {
  last_failure_reason = std::move(reason);
  if (!can_retry()) return false;
  attempt++;
  return true;
}

static std::chrono::milliseconds ms_field(const JsonObject& o, const std::string& key,
                                          std::chrono::milliseconds def) {
  if (auto v = json_number_opt(o, key)) {
    if (*v < 0) throw DiagramStreamError("config field '" + key + "' must not be negative");
    return std::chrono::milliseconds(static_cast<int64_t>(*v));
  }
  return def;
}

PipelineConfig pipeline_config_from_json(const Json& value) {
  PipelineConfig cfg;
  if (!value.is_object()) throw DiagramStreamError("pipeline config must be an object");
  const JsonObject* o = &value.as_object();
  auto it = o->find("pipeline");
  if (it != o->end()) {
    if (!it->second.is_object()) throw DiagramStreamError("'pipeline' must be an object");
    o = &it->second.as_object();
  }

  cfg.fence.open_marker = json_string_or(*o, "open_marker", cfg.fence.open_marker);
  cfg.fence.close_marker = json_string_or(*o, "close_marker", cfg.fence.close_marker);
  if (auto v = json_number_opt(*o, "min_flush_lines")) cfg.fence.min_flush_lines = static_cast<size_t>(std::max(1.0, *v));
  if (auto v = json_number_opt(*o, "max_buffer_bytes")) cfg.fence.max_buffer_bytes = static_cast<size_t>(std::max(0.0, *v));

  cfg.pacing.settle_delay = ms_field(*o, "settle_delay_ms", cfg.pacing.settle_delay);
  cfg.pacing.partial_delay = ms_field(*o, "partial_delay_ms", cfg.pacing.partial_delay);
  cfg.pacing.completion_delay = ms_field(*o, "completion_delay_ms", cfg.pacing.completion_delay);

  auto it_retry = o->find("persistence_retry");
  if (it_retry != o->end() && it_retry->second.is_object()) {
    const auto& r = it_retry->second.as_object();
    if (auto v = json_number_opt(r, "max_attempts")) cfg.persistence_retry.max_attempts = std::max(1, static_cast<int>(*v));
    cfg.persistence_retry.initial_delay = ms_field(r, "initial_delay_ms", cfg.persistence_retry.initial_delay);
    cfg.persistence_retry.max_delay = ms_field(r, "max_delay_ms", cfg.persistence_retry.max_delay);
    if (auto v = json_number_opt(r, "multiplier")) cfg.persistence_retry.multiplier = std::max(1.0, *v);
  }

  if (auto v = json_number_opt(*o, "max_auto_retries")) cfg.max_auto_retries = std::max(0, static_cast<int>(*v));
  if (auto v = json_number_opt(*o, "retry_temperature_step")) cfg.retry_temperature_step = *v;
  if (auto v = json_number_opt(*o, "max_temperature")) cfg.max_temperature = *v;
  cfg.generation_timeout = ms_field(*o, "generation_timeout_ms", cfg.generation_timeout);
  if (auto v = json_number_opt(*o, "generation_cost")) cfg.generation_cost = static_cast<int64_t>(*v);
  if (auto v = json_number_opt(*o, "default_quota")) cfg.default_quota = static_cast<int64_t>(*v);
  cfg.normalize_partials = json_bool_or(*o, "normalize_partials", cfg.normalize_partials);
  cfg.model = json_string_or(*o, "model", cfg.model);
  return cfg;
}

PipelineConfig load_pipeline_config(const std::string& path) {
  try {
    return pipeline_config_from_json(loads_json(read_text_file(path)));
  } catch (const DiagramStreamError& e) {
    throw DiagramStreamError("invalid config " + path + ": " + e.message, ErrorKind::Rejected);
  } catch (const std::runtime_error& e) {
    throw DiagramStreamError("invalid config " + path + ": " + e.what(), ErrorKind::Rejected);
  }
}

static double stepped_temperature(double temperature, const PipelineConfig& config) {
  return std::min(config.max_temperature, temperature + config.retry_temperature_step);
}

GenerationRequest make_retry_request(const GenerationRequest& failed, const std::string& failure_reason,
                                     const PipelineConfig& config) {
  GenerationRequest next = failed;
  next.is_retry = true;
  next.failure_reason = failure_reason;
  next.sampling.temperature = stepped_temperature(failed.sampling.temperature, config);
  return next;
}

DiagramGenerator::DiagramGenerator(const DiagramCatalog& catalog, ICompletionProvider& provider,
                                   IDiagramValidator& validator, IArtifactStore& store, PipelineConfig config,
                                   Sleeper* sleeper, Clock* clock)
    : catalog_(catalog),
      provider_(provider),
      validator_(validator),
      config_(std::move(config)),
      compiler_(catalog),
      owned_sleeper_(sleeper ? nullptr : std::make_unique<ThreadSleeper>()),
      owned_clock_(clock ? nullptr : std::make_unique<SystemClock>()),
      sleeper_(sleeper ? sleeper : owned_sleeper_.get()),
      clock_(clock ? clock : owned_clock_.get()),
      persistence_(store, *sleeper_, config_.persistence_retry, config_.generation_cost) {}

bool DiagramGenerator::save_preview(const std::string& project_id, const std::string& artifact_id,
                                    const std::string& image) {
  return persistence_.store_preview(project_id, artifact_id, image);
}

Outcome<DiagramArtifact> DiagramGenerator::run_attempt(const GenerationRequest& request,
                                                       const DiagramTypeDefinition& def, IEventSink& sink,
                                                       const CancellationToken* cancel) {
  FenceExtractor fence(config_.fence);
  bool client_gone = false;
  auto cancelled = [&] { return client_gone || (cancel && cancel->cancelled()); };

  auto compiled = compiler_.compile(request);
  CompletionRequest creq;
  creq.model = config_.model;
  creq.system = compiled.system;
  creq.messages = compiled.messages;
  creq.sampling = compiled.sampling;

  auto on_delta = [&](const std::string& delta) -> bool {
    for (const auto& em : fence.feed(delta)) {
      switch (em.kind) {
        case FenceEmission::Kind::Settle:
          logger()->debug("fence: opening fence found for request {}", request.request_id);
          sleeper_->sleep_for(config_.pacing.settle_delay);
          break;
        case FenceEmission::Kind::Partial: {
          std::string text = config_.normalize_partials ? normalize_declaration(em.text, def) : em.text;
          if (!sink.write(StreamEvent::partial(std::move(text)))) {
            client_gone = true;
            return false;
          }
          sleeper_->sleep_for(config_.pacing.partial_delay);
          break;
        }
        case FenceEmission::Kind::Complete:
          break;
      }
      if (cancelled()) return false;
    }
    if (fence.state() == FenceState::Aborted) return false;
    // Nothing after the closing fence is needed.
    return fence.state() != FenceState::Done;
  };

  TokenStreamReader reader(provider_, *clock_, config_.generation_timeout, cancel);
  auto read = reader.read(creq, on_delta);
  const std::string visible = fence.session().visible;

  if (client_gone || read.status == StreamReadResult::Status::Cancelled || (cancel && cancel->cancelled())) {
    return Outcome<DiagramArtifact>::failure(ErrorKind::Cancelled, "client disconnected", visible);
  }
  if (read.status == StreamReadResult::Status::TimedOut || read.status == StreamReadResult::Status::TransportError) {
    return Outcome<DiagramArtifact>::failure(ErrorKind::StreamTransport, read.error, visible);
  }

  if (fence.state() != FenceState::Done) {
    fence.finish();
    std::string reason = fence.session().abort_reason.empty() ? "stream ended before the diagram was complete"
                                                              : fence.session().abort_reason;
    logger()->warn("fence: request {}: {}", request.request_id, reason);
    return Outcome<DiagramArtifact>::failure(ErrorKind::EmptyArtifact, "No diagram was generated: " + reason,
                                             visible);
  }

  auto candidate = fence.candidate();
  if (!candidate || detail::trim_copy(*candidate).empty()) {
    return Outcome<DiagramArtifact>::failure(ErrorKind::EmptyArtifact, "No diagram was generated: empty code block");
  }

  DiagramArtifact artifact;
  try {
    artifact = prepare_artifact(*candidate, def, validator_);
  } catch (const DiagramStreamError& e) {
    return Outcome<DiagramArtifact>::failure(ErrorKind::Validation, e.message, *candidate);
  }
  if (!artifact.is_valid) {
    logger()->info("validator: request {} rejected: {}", request.request_id, artifact.validation_message);
    return Outcome<DiagramArtifact>::failure(ErrorKind::Validation, artifact.validation_message, *candidate);
  }
  return Outcome<DiagramArtifact>::success(std::move(artifact));
}

GenerationResult DiagramGenerator::generate(const GenerationRequest& request, IEventSink& sink,
                                            const CancellationToken* cancel) {
  GenerationResult result;
  result.retry.max_attempts = config_.max_auto_retries;

  auto fail = [&](const PipelineError& err, bool needs_retry) {
    result.error = err;
    if (err.kind != ErrorKind::Cancelled && !sink.write(StreamEvent::failure(err, needs_retry))) {
      logger()->debug("pipeline: client left before the failure event");
    }
    return result;
  };

  GenerationRequest current = request;
  if (current.request_id.empty()) current.request_id = make_request_id();
  // A client-triggered retry samples hotter than the attempt it replaces.
  if (current.is_retry && !current.explicit_temperature) {
    current.sampling.temperature = stepped_temperature(current.sampling.temperature, config_);
  }

  const auto* def = catalog_.find(current.diagram_type);
  if (!def) return fail(PipelineError{ErrorKind::Rejected, "Invalid diagram type: " + current.diagram_type, ""}, false);
  current.diagram_type = def->id;

  auto quota = persistence_.check_quota(current.user_id);
  if (!quota.ok) return fail(*quota.error, false);

  logger()->info("pipeline: request {}: generating {}{}", current.request_id, def->id,
                 current.is_retry ? " (manual retry)" : "");

  for (;;) {
    result.physical_attempts++;
    auto attempt = run_attempt(current, *def, sink, cancel);

    if (attempt.ok) {
      const auto& artifact = *attempt.value;
      sleeper_->sleep_for(config_.pacing.completion_delay);
      if (cancel && cancel->cancelled()) {
        return fail(PipelineError{ErrorKind::Cancelled, "client disconnected", artifact.normalized_text}, false);
      }
      auto commit = persistence_.commit(current, artifact);
      if (!commit.ok) return fail(*commit.error, false);

      result.success = true;
      result.artifact_id = commit.value->artifact_id;
      result.diagram_text = artifact.normalized_text;
      if (!sink.write(StreamEvent::success(artifact.normalized_text, result.artifact_id))) {
        logger()->warn("pipeline: client left before the success event of {}", result.artifact_id);
      }
      if (!current.client_rendered_image.empty()) {
        persistence_.store_preview(current.project_id, result.artifact_id, current.client_rendered_image);
      }
      return result;
    }

    const PipelineError& err = *attempt.error;
    switch (err.kind) {
      case ErrorKind::Validation:
      case ErrorKind::EmptyArtifact: {
        bool will_retry = result.retry.consume(err.message);
        if (!will_retry) {
          logger()->warn("pipeline: request {} failed: {}", current.request_id, err.message);
          return fail(err, false);
        }
        result.error = err;
        if (!sink.write(StreamEvent::failure(err, true)) || (cancel && cancel->cancelled())) {
          return fail(PipelineError{ErrorKind::Cancelled, "client disconnected", err.candidate}, false);
        }
        current = make_retry_request(current, err.message, config_);
        logger()->info("pipeline: request {}: automatic retry {} at temperature {:.2f}", current.request_id,
                       result.retry.attempt, current.sampling.temperature);
        break;
      }
      case ErrorKind::Cancelled:
        logger()->info("pipeline: request {} cancelled", current.request_id);
        return fail(err, false);
      default:
        logger()->warn("pipeline: request {} failed: {}", current.request_id, err.message);
        return fail(err, false);
    }
  }
}

}  // namespace diagram_stream
