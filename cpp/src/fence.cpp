#include "diagram_stream.hpp"

#include <algorithm>

#include "text_util.hpp"

namespace diagram_stream {

// ---------------- Fence Extractor ----------------

const char* fence_state_name(FenceState state) {
  switch (state) {
    case FenceState::SeekingFence: return "seeking_fence";
    case FenceState::Collecting: return "collecting";
    case FenceState::Done: return "done";
    case FenceState::Aborted: return "aborted";
  }
  return "unknown";
}

namespace {

void strip_cr(std::string& line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
}

void flush_lines(StreamSession& s, std::vector<FenceEmission>& out) {
  if (s.line_buffer.empty()) return;
  for (const auto& line : s.line_buffer) {
    if (s.visible.empty()) {
      // Leading blank lines never become visible.
      if (!detail::is_blank(line)) s.visible = line;
    } else {
      s.visible += "\n" + line;
    }
  }
  size_t flushed = s.line_buffer.size();
  s.line_buffer.clear();
  if (s.visible.size() == s.emitted_length) return;
  s.emitted_length = s.visible.size();
  FenceEmission e;
  e.kind = FenceEmission::Kind::Partial;
  e.text = s.visible;
  e.flushed_lines = flushed;
  out.push_back(std::move(e));
}

void abort_session(StreamSession& s, std::string reason) {
  s.state = FenceState::Aborted;
  s.abort_reason = std::move(reason);
  s.line_buffer.clear();
  s.accumulated.clear();
}

bool over_limit(const StreamSession& s, const FenceOptions& opt) {
  return opt.max_buffer_bytes > 0 && s.accumulated.size() + s.visible.size() > opt.max_buffer_bytes;
}

// Drops the rest of the opening marker line once its newline has arrived.
// Returns false while the line is still incomplete.
bool consume_marker_line(StreamSession& s) {
  auto nl = s.accumulated.find('\n');
  if (nl == std::string::npos) return false;
  std::string rest = s.accumulated.substr(0, nl);
  strip_cr(rest);
  s.accumulated.erase(0, nl + 1);
  s.marker_line_open = false;
  if (!detail::is_blank(rest)) s.line_buffer.push_back(detail::trim_copy(rest));
  return true;
}

void collect(StreamSession& s, const FenceOptions& opt, std::vector<FenceEmission>& out) {
  if (s.marker_line_open && !consume_marker_line(s)) return;

  auto close = s.accumulated.find(opt.close_marker);
  if (close != std::string::npos) {
    auto lines = detail::split_lines(s.accumulated.substr(0, close));
    if (!lines.empty() && detail::is_blank(lines.back())) lines.pop_back();
    for (auto& line : lines) s.line_buffer.push_back(std::move(line));
    flush_lines(s, out);
    s.accumulated.clear();
    s.state = FenceState::Done;
    s.candidate = detail::trim_copy(s.visible);
    FenceEmission e;
    e.kind = FenceEmission::Kind::Complete;
    e.text = s.candidate;
    out.push_back(std::move(e));
    return;
  }

  size_t nl;
  while ((nl = s.accumulated.find('\n')) != std::string::npos) {
    std::string line = s.accumulated.substr(0, nl);
    strip_cr(line);
    s.line_buffer.push_back(std::move(line));
    s.accumulated.erase(0, nl + 1);
  }
  if (s.line_buffer.size() >= opt.min_flush_lines) flush_lines(s, out);
}

}  // namespace

FenceTransition advance(StreamSession session, const std::string& delta, const FenceOptions& options) {
  FenceTransition t;
  auto& s = session;
  if (s.state == FenceState::Done || s.state == FenceState::Aborted) {
    t.session = std::move(session);
    return t;
  }

  s.accumulated += delta;

  if (s.state == FenceState::SeekingFence) {
    auto pos = detail::find_ci(s.accumulated, options.open_marker);
    if (pos == std::string::npos) {
      size_t keep = std::min(s.accumulated.size(), options.open_marker.size() - 1);
      s.skipped_bytes += s.accumulated.size() - keep;
      s.accumulated.erase(0, s.accumulated.size() - keep);
      if (options.max_buffer_bytes > 0 && s.skipped_bytes + s.accumulated.size() > options.max_buffer_bytes) {
        abort_session(s, "no opening fence within maxBufferBytes");
      }
      t.session = std::move(session);
      return t;
    }
    s.accumulated.erase(0, pos + options.open_marker.size());
    s.state = FenceState::Collecting;
    s.marker_line_open = true;
    if (!s.settled) {
      s.settled = true;
      FenceEmission e;
      e.kind = FenceEmission::Kind::Settle;
      t.emissions.push_back(std::move(e));
    }
  }

  collect(s, options, t.emissions);
  if (s.state == FenceState::Collecting && over_limit(s, options)) {
    abort_session(s, "stream buffer exceeded maxBufferBytes (max=" + std::to_string(options.max_buffer_bytes) + ")");
  }
  t.session = std::move(session);
  return t;
}

FenceTransition finish(StreamSession session) {
  FenceTransition t;
  if (session.state == FenceState::SeekingFence) {
    abort_session(session, "stream ended without an opening fence");
  } else if (session.state == FenceState::Collecting) {
    abort_session(session, "stream ended before the closing fence");
  }
  t.session = std::move(session);
  return t;
}

std::vector<FenceEmission> FenceExtractor::feed(const std::string& delta) {
  auto t = advance(std::move(session_), delta, options_);
  session_ = std::move(t.session);
  return std::move(t.emissions);
}

std::vector<FenceEmission> FenceExtractor::finish() {
  auto t = diagram_stream::finish(std::move(session_));
  session_ = std::move(t.session);
  return std::move(t.emissions);
}

void FenceExtractor::reset() { session_ = StreamSession{}; }

std::optional<std::string> FenceExtractor::candidate() const {
  if (session_.state != FenceState::Done) return std::nullopt;
  return session_.candidate;
}

std::optional<std::string> extract_fenced_candidate(const std::string& text, const FenceOptions& options) {
  FenceExtractor fx(options);
  fx.feed(text);
  fx.finish();
  return fx.candidate();
}

}  // namespace diagram_stream
