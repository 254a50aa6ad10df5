#include "diagram_stream.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include <sys/wait.h>

#include "text_util.hpp"

namespace diagram_stream {

using detail::split_lines;
using detail::trim_copy;

// ---------------- Validator ----------------

static bool needs_bracket_balance(const std::string& id) {
  return id == "flowchart" || id == "class" || id == "state" || id == "architecture";
}

static char closer_for(char open) {
  switch (open) {
    case '(': return ')';
    case '[': return ']';
    case '{': return '}';
  }
  return '\0';
}

static std::optional<std::string> check_brackets(const std::vector<std::string>& lines, bool flowchart) {
  struct Open {
    char c;
    size_t line;
  };
  std::vector<Open> stack;
  for (size_t ln = 0; ln < lines.size(); ++ln) {
    const std::string& line = lines[ln];
    if (detail::is_comment_line(line)) continue;
    bool in_quotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
      char c = line[i];
      if (c == '"') {
        in_quotes = !in_quotes;
        continue;
      }
      if (in_quotes) continue;
      // Flowchart asymmetric node: id>label]
      if (flowchart && c == '>' && i > 0 && std::isalnum(static_cast<unsigned char>(line[i - 1]))) {
        stack.push_back({'[', ln});
        continue;
      }
      if (c == '(' || c == '[' || c == '{') {
        stack.push_back({c, ln});
      } else if (c == ')' || c == ']' || c == '}') {
        if (stack.empty() || closer_for(stack.back().c) != c) {
          return std::string("Unbalanced brackets: unexpected '") + c + "' on line " + std::to_string(ln + 1);
        }
        stack.pop_back();
      }
    }
  }
  if (!stack.empty()) {
    return std::string("Unbalanced brackets: '") + stack.back().c + "' opened on line " +
           std::to_string(stack.back().line + 1) + " is never closed";
  }
  return std::nullopt;
}

ValidationResult BasicSyntaxValidator::validate(const std::string& text, const std::string& diagram_type) {
  if (trim_copy(text).empty()) return ValidationResult{false, "Diagram code cannot be empty"};
  const auto* def = catalog_.find(diagram_type);
  if (!def) return ValidationResult{false, "Unknown diagram type: " + diagram_type};

  auto lines = split_lines(text);
  size_t first = detail::first_content_index(lines);
  if (first >= lines.size()) return ValidationResult{false, "Diagram has no content"};
  if (!is_declaration_line(*def, lines[first])) {
    return ValidationResult{false, "Diagram must start with a valid '" + def->declaration_keywords.front() +
                                       "' declaration. Found: '" + trim_copy(lines[first]) + "'"};
  }
  if (needs_bracket_balance(def->id)) {
    if (auto err = check_brackets(lines, def->id == "flowchart")) return ValidationResult{false, *err};
  }
  return ValidationResult{true, ""};
}

static std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out += '\'';
  return out;
}

namespace {

// Removes the temporary file on scope exit.
struct TempFile {
  std::string path;
  ~TempFile() {
    if (!path.empty()) std::remove(path.c_str());
  }
};

}  // namespace

ValidationResult CommandValidator::validate(const std::string& text, const std::string& diagram_type) {
  if (trim_copy(text).empty()) return ValidationResult{false, "Diagram code cannot be empty"};

  const char* tmpdir = std::getenv("TMPDIR");
  std::string pattern = std::string(tmpdir && *tmpdir ? tmpdir : "/tmp") + "/diagram_stream_XXXXXX.mmd";
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  int fd = mkstemps(buf.data(), 4);
  if (fd < 0) throw DiagramStreamError("cannot create validator temp file", ErrorKind::Validation);
  TempFile tmp{std::string(buf.data())};

  size_t written = 0;
  while (written < text.size()) {
    ssize_t n = ::write(fd, text.data() + written, text.size() - written);
    if (n <= 0) {
      ::close(fd);
      throw DiagramStreamError("cannot write validator temp file " + tmp.path, ErrorKind::Validation);
    }
    written += static_cast<size_t>(n);
  }
  ::close(fd);

  std::string cmd = command_ + " " + shell_quote(tmp.path) + " 2>&1";
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw DiagramStreamError("popen() failed for validator command", ErrorKind::Validation);
  std::string output;
  std::array<char, 4096> buffer{};
  while (true) {
    size_t n = fread(buffer.data(), 1, buffer.size(), pipe);
    if (n > 0) output.append(buffer.data(), n);
    if (n < buffer.size()) break;
  }
  int rc = pclose(pipe);

  bool ok = rc != -1 && WIFEXITED(rc) && WEXITSTATUS(rc) == 0;
  std::string message = trim_copy(output);
  if (!ok && message.empty()) {
    message = "validator exited with status " + std::to_string(rc == -1 ? -1 : WEXITSTATUS(rc));
  }
  logger()->debug("validator: {} candidate {} by '{}'", diagram_type, ok ? "accepted" : "rejected", command_);
  return ValidationResult{ok, ok ? "" : message};
}

// ---------------- Artifact preparation ----------------

DiagramArtifact prepare_artifact(const std::string& raw, const DiagramTypeDefinition& def,
                                 IDiagramValidator& validator) {
  DiagramArtifact a;
  a.diagram_type = def.id;
  a.raw_text = raw;
  a.normalized_text = sanitize_diagram(normalize_declaration(raw, def), def);
  if (trim_copy(raw).empty()) {
    a.is_valid = false;
    a.validation_message = "Diagram code cannot be empty";
    return a;
  }
  auto result = validator.validate(a.normalized_text, def.id);
  a.is_valid = result.valid;
  a.validation_message = result.message;
  return a;
}

}  // namespace diagram_stream
