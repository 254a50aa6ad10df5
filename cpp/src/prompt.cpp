#include "diagram_stream.hpp"

#include <random>
#include <sstream>

#include "text_util.hpp"

namespace diagram_stream {

using detail::to_lower;
using detail::trim_copy;

// ---------------- Requests ----------------

std::string make_request_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream oss;
  oss.setf(std::ios::hex, std::ios::basefield);
  for (int i = 0; i < 2; ++i) {
    oss.width(16);
    oss.fill('0');
    oss << rng();
  }
  return oss.str();
}

static std::vector<ChatMessage> parse_chat_history(const JsonObject& body) {
  std::vector<ChatMessage> out;
  auto it = body.find("chatHistory");
  if (it == body.end() || it->second.is_null()) return out;
  if (!it->second.is_array()) throw DiagramStreamError("chatHistory must be an array", ErrorKind::Rejected);
  for (const auto& item : it->second.as_array()) {
    if (!item.is_object()) throw DiagramStreamError("chatHistory entries must be objects", ErrorKind::Rejected);
    const auto& o = item.as_object();
    ChatMessage msg{to_lower(json_string_or(o, "role")), json_string_or(o, "content")};
    if (msg.role != "user" && msg.role != "assistant") {
      logger()->debug("request: skipping chat history entry with role '{}'", msg.role);
      continue;
    }
    if (msg.content.empty()) continue;
    out.push_back(std::move(msg));
  }
  return out;
}

GenerationRequest parse_generation_request(const std::string& json_body) {
  Json doc;
  try {
    doc = loads_json(json_body);
  } catch (const std::runtime_error& e) {
    throw DiagramStreamError(std::string("Malformed request body: ") + e.what(), ErrorKind::Rejected);
  }
  if (!doc.is_object()) throw DiagramStreamError("Malformed request body: expected an object", ErrorKind::Rejected);
  const auto& body = doc.as_object();

  GenerationRequest req;
  req.prompt = json_string_or(body, "textPrompt", json_string_or(body, "prompt"));
  req.diagram_type = json_string_or(body, "diagramType");
  req.project_id = json_string_or(body, "projectId");
  req.user_id = json_string_or(body, "userId");
  req.request_id = json_string_or(body, "requestId");
  req.client_rendered_image = json_string_or(body, "clientRenderedImage", json_string_or(body, "clientSvg"));
  req.is_retry = json_bool_or(body, "isRetry", false);
  req.clear_cache = json_bool_or(body, "clearCache", false);
  req.failure_reason = json_string_or(body, "failureReason");
  req.prior_messages = parse_chat_history(body);

  if (trim_copy(req.prompt).empty() || trim_copy(req.diagram_type).empty() || req.project_id.empty()) {
    throw DiagramStreamError("Missing required fields", ErrorKind::Rejected);
  }

  if (auto t = json_number_opt(body, "temperature")) {
    if (*t < 0.0 || *t > 2.0) throw DiagramStreamError("temperature out of range", ErrorKind::Rejected);
    req.sampling.temperature = *t;
    req.explicit_temperature = true;
  }
  if (auto p = json_number_opt(body, "topP")) {
    if (*p <= 0.0 || *p > 1.0) throw DiagramStreamError("topP out of range", ErrorKind::Rejected);
    req.sampling.top_p = *p;
  }
  if (auto m = json_number_opt(body, "maxTokens")) {
    if (*m < 1.0) throw DiagramStreamError("maxTokens must be positive", ErrorKind::Rejected);
    req.sampling.max_tokens = static_cast<int>(*m);
  }
  if (req.request_id.empty()) req.request_id = make_request_id();
  return req;
}

// ---------------- Prompt Compiler ----------------

std::string render_template(std::string tmpl, const std::map<std::string, std::string>& vars) {
  // Single pass: substituted text is never rescanned.
  std::string out;
  out.reserve(tmpl.size());
  size_t i = 0;
  while (i < tmpl.size()) {
    if (tmpl[i] == '{') {
      size_t close = tmpl.find('}', i + 1);
      if (close != std::string::npos) {
        auto it = vars.find(tmpl.substr(i + 1, close - i - 1));
        if (it != vars.end()) {
          out += it->second;
          i = close + 1;
          continue;
        }
      }
    }
    out.push_back(tmpl[i]);
    ++i;
  }
  return out;
}

std::string PromptCompiler::system_prompt(const DiagramTypeDefinition& def) const {
  const std::string& tmpl = def.system_template.empty() ? catalog_.system_template() : def.system_template;
  return render_template(tmpl, {{"diagram_type", def.id}, {"description", def.description}, {"example", def.example}});
}

std::string PromptCompiler::user_prompt(const DiagramTypeDefinition& def, const GenerationRequest& request) const {
  const std::string& tmpl = def.prompt_template.empty() ? catalog_.user_template() : def.prompt_template;
  std::string out = render_template(
      tmpl, {{"prompt", request.prompt}, {"diagram_type", def.id}, {"example", def.example},
             {"description", def.description}});
  if (request.is_retry && !request.failure_reason.empty()) {
    out += "\n\nThe previous diagram failed validation with this error:\n";
    out += request.failure_reason;
    out += "\nFix the error and return the complete corrected diagram. Keep the syntax simple: avoid special "
           "characters and quotes in labels, and prefer basic node and edge forms.";
  }
  return out;
}

CompiledPrompt PromptCompiler::compile(const GenerationRequest& request) const {
  const auto& def = catalog_.at(request.diagram_type);
  CompiledPrompt out;
  out.system = system_prompt(def);
  if (!request.clear_cache) out.messages = request.prior_messages;
  out.messages.push_back(ChatMessage{"user", user_prompt(def, request)});
  out.sampling = request.sampling;
  return out;
}

CompiledPrompt PromptCompiler::compile_detection(const std::string& prompt) const {
  std::string types;
  for (const auto& def : catalog_.definitions()) {
    types += "- " + def.id;
    if (!def.description.empty()) {
      auto first_line = detail::split_lines(trim_copy(def.description)).front();
      types += ": " + first_line;
    }
    types += "\n";
  }
  CompiledPrompt out;
  out.system =
      "You are a diagram type detection expert. Analyze the user's request and choose the single most "
      "appropriate diagram type from the available options.\n\nAvailable diagram types:\n" +
      types + "\nRespond with ONLY the diagram type name, nothing else.";
  out.messages.push_back(ChatMessage{"user", prompt});
  out.sampling.temperature = 0.3;
  out.sampling.max_tokens = 50;
  return out;
}

std::optional<std::string> parse_detected_type(const DiagramCatalog& catalog, const std::string& completion) {
  std::string s = to_lower(trim_copy(completion));
  auto is_noise = [](char c) { return c == '"' || c == '\'' || c == '`' || c == '.' || c == ':' || c == '*'; };
  while (!s.empty() && is_noise(s.front())) s.erase(s.begin());
  while (!s.empty() && is_noise(s.back())) s.pop_back();
  if (const auto* def = catalog.find(s)) return def->id;

  // Fall back to the first word that names a catalog type.
  std::string word;
  for (size_t i = 0; i <= s.size(); ++i) {
    char c = i < s.size() ? s[i] : ' ';
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') {
      word.push_back(c);
      continue;
    }
    if (!word.empty()) {
      if (const auto* def = catalog.find(word)) return def->id;
      word.clear();
    }
  }
  return std::nullopt;
}

}  // namespace diagram_stream
