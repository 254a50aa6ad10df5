#include "diagram_stream.hpp"

#include <regex>

#include "text_util.hpp"

namespace diagram_stream {

using detail::first_content_index;
using detail::is_blank;
using detail::is_comment_line;
using detail::join_lines;
using detail::split_lines;
using detail::trim_blank_edges;
using detail::trim_copy;

// ---------------- Declaration Normalizer ----------------

bool is_declaration_line(const DiagramTypeDefinition& def, const std::string& line) {
  std::string t = detail::ltrim_copy(line);
  for (const auto& kw : def.declaration_keywords) {
    if (!detail::starts_with_ci(t, kw)) continue;
    if (t.size() == kw.size()) return true;
    char next = t[kw.size()];
    if (std::isspace(static_cast<unsigned char>(next)) || next == ';') return true;
  }
  return false;
}

static std::string with_default_direction(const DiagramTypeDefinition& def, const std::string& line) {
  if (def.default_direction.empty()) return line;
  std::string body = trim_copy(line);
  if (!body.empty() && body.back() == ';') body = trim_copy(body.substr(0, body.size() - 1));
  for (const auto& kw : def.declaration_keywords) {
    if (detail::to_lower(body) == detail::to_lower(kw)) {
      return detail::leading_ws(line) + body + " " + def.default_direction;
    }
  }
  return line;
}

std::string normalize_declaration(const std::string& raw, const DiagramTypeDefinition& def) {
  std::vector<std::string> lines;
  for (auto& line : split_lines(raw)) {
    // Fence lines never belong to the payload.
    if (detail::starts_with(trim_copy(line), "```")) continue;
    lines.push_back(std::move(line));
  }
  trim_blank_edges(lines);
  if (!lines.empty() && detail::to_lower(trim_copy(lines.front())) == "mermaid") {
    lines.erase(lines.begin());
    trim_blank_edges(lines);
  }

  size_t start = first_content_index(lines);
  size_t decl = lines.size();
  for (size_t i = start; i < lines.size(); ++i) {
    if (is_declaration_line(def, lines[i])) {
      decl = i;
      break;
    }
  }

  if (decl == lines.size()) {
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(start), def.canonical_declaration);
    return join_lines(lines);
  }

  if (decl > start) {
    std::vector<std::string> kept(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(start));
    for (size_t i = start; i < decl; ++i) {
      if (is_comment_line(lines[i])) kept.push_back(lines[i]);
    }
    size_t removed = (decl - start) - (kept.size() - start);
    if (removed > 0) {
      logger()->debug("normalize: dropped {} line(s) before the {} declaration", removed, def.id);
    }
    kept.insert(kept.end(), lines.begin() + static_cast<std::ptrdiff_t>(decl), lines.end());
    lines = std::move(kept);
    decl = start;
    while (decl < lines.size() && !is_declaration_line(def, lines[decl])) ++decl;
  }

  lines[decl] = with_default_direction(def, lines[decl]);
  return join_lines(lines);
}

// ---------------- Type-Specific Sanitizer ----------------

static size_t find_declaration(const std::vector<std::string>& lines, const std::string& keyword) {
  DiagramTypeDefinition probe;
  probe.declaration_keywords = {keyword};
  for (size_t i = 0; i < lines.size(); ++i) {
    if (is_declaration_line(probe, lines[i])) return i;
  }
  return lines.size();
}

static bool is_gantt_directive(const std::string& trimmed) {
  static const char* kDirectives[] = {"title",    "dateFormat",        "axisFormat", "tickInterval",
                                      "excludes", "includes",          "todayMarker", "weekday",
                                      "weekend",  "inclusiveEndDates", "topAxis",    "displayMode",
                                      "accTitle", "accDescr",          "section"};
  for (const char* d : kDirectives) {
    if (detail::starts_with_ci(trimmed, d)) return true;
  }
  return false;
}

std::string sanitize_gantt(const std::string& text) {
  auto lines = split_lines(text);
  size_t decl = find_declaration(lines, "gantt");
  if (decl == lines.size()) return text;

  bool has_date_format = false;
  bool has_section = false;
  for (const auto& line : lines) {
    std::string t = trim_copy(line);
    if (detail::starts_with_ci(t, "dateFormat")) has_date_format = true;
    if (detail::starts_with_ci(t, "section ") || detail::to_lower(t) == "section") has_section = true;
  }

  if (!has_date_format) {
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(decl + 1), "    dateFormat YYYY-MM-DD");
  }
  if (!has_section) {
    size_t task = lines.size();
    for (size_t i = decl + 1; i < lines.size(); ++i) {
      std::string t = trim_copy(lines[i]);
      if (t.empty() || detail::starts_with(t, "%%") || is_gantt_directive(t)) continue;
      if (t.find(':') != std::string::npos) {
        task = i;
        break;
      }
    }
    std::string indent = task < lines.size() ? detail::leading_ws(lines[task]) : std::string("    ");
    if (indent.empty()) indent = "    ";
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(task), indent + "section Tasks");
  }
  return join_lines(lines);
}

static std::string fix_architecture_labels(const std::string& line) {
  std::string out;
  out.reserve(line.size());
  int depth = 0;
  for (char c : line) {
    if (c == '[') depth++;
    if (c == ']' && depth > 0) depth--;
    if (depth > 0 && c == '&') {
      out += "and";
    } else if (depth > 0 && c == '/') {
      out.push_back('-');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

static char normalize_port(const std::string& port, char def) {
  if (port.empty()) return def;
  char p = static_cast<char>(std::toupper(static_cast<unsigned char>(port[0])));
  if (p == 'L' || p == 'R' || p == 'T' || p == 'B') return p;
  return def;
}

std::string sanitize_architecture(const std::string& text) {
  static const std::regex edge_re(
      R"(^(\s*)([A-Za-z0-9_]+)(\{group\})?(?::([A-Za-z]))?\s*(<?[-.=]+>?)\s*(?:([A-Za-z]):)?([A-Za-z0-9_]+)(\{group\})?\s*;?\s*$)");
  auto lines = split_lines(text);
  size_t decl = find_declaration(lines, "architecture-beta");
  for (size_t i = decl == lines.size() ? 0 : decl + 1; i < lines.size(); ++i) {
    std::string line = fix_architecture_labels(lines[i]);
    std::smatch m;
    if (std::regex_match(line, m, edge_re)) {
      std::string op = m[5].str();
      bool left_arrow = !op.empty() && op.front() == '<';
      bool right_arrow = !op.empty() && op.back() == '>';
      char lp = normalize_port(m[4].str(), 'R');
      char rp = normalize_port(m[6].str(), 'L');
      if (lp == rp) {
        if (lp == 'T' || lp == 'B') {
          lp = 'R';
          rp = 'L';
        } else {
          lp = 'B';
          rp = 'T';
        }
      }
      line = m[1].str() + m[2].str() + m[3].str() + ":" + lp + " " + (left_arrow ? "<" : "") + "--" +
             (right_arrow ? ">" : "") + " " + rp + ":" + m[7].str() + m[8].str();
    }
    lines[i] = line;
  }
  return join_lines(lines);
}

std::string sanitize_flowchart(const std::string& text) {
  static const std::regex class_def_re(R"((\bclassDef\s+)end\b)");
  static const std::regex class_assign_re(R"(^(\s*class\s+\S+\s+)end(\s*;?\s*)$)");
  static const std::regex inline_class_re(R"(:::end\b)");
  auto lines = split_lines(text);
  for (auto& line : lines) {
    line = std::regex_replace(line, class_def_re, "$1endClass");
    line = std::regex_replace(line, class_assign_re, "$1endClass$2");
    line = std::regex_replace(line, inline_class_re, ":::endClass");
  }
  return join_lines(lines);
}

std::string sanitize_diagram(const std::string& text, const DiagramTypeDefinition& def) {
  if (def.id == "gantt") return sanitize_gantt(text);
  if (def.id == "architecture") return sanitize_architecture(text);
  if (def.id == "flowchart") return sanitize_flowchart(text);
  return text;
}

}  // namespace diagram_stream
