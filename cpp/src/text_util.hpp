#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace diagram_stream {
namespace detail {

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

inline std::string ltrim_copy(std::string s) {
  size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
  return s.substr(i);
}

inline std::string rtrim_copy(std::string s) {
  size_t n = s.size();
  while (n > 0 && std::isspace(static_cast<unsigned char>(s[n - 1]))) n--;
  s.resize(n);
  return s;
}

inline std::string trim_copy(const std::string& s) { return rtrim_copy(ltrim_copy(s)); }

inline bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// Splits on '\n' and drops '\r'. A trailing newline yields a trailing empty line.
inline std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::string cur;
  for (char c : text) {
    if (c == '\r') continue;
    if (c == '\n') {
      lines.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  lines.push_back(cur);
  return lines;
}

inline std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += "\n";
    out += lines[i];
  }
  return out;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool equals_ci_at(const std::string& s, size_t pos, const std::string& needle) {
  if (pos > s.size() || s.size() - pos < needle.size()) return false;
  for (size_t i = 0; i < needle.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(s[pos + i])) != std::tolower(static_cast<unsigned char>(needle[i]))) {
      return false;
    }
  }
  return true;
}

inline bool starts_with_ci(const std::string& s, const std::string& prefix) { return equals_ci_at(s, 0, prefix); }

inline std::string::size_type find_ci(const std::string& haystack, const std::string& needle, size_t from = 0) {
  if (needle.empty()) return from <= haystack.size() ? from : std::string::npos;
  if (haystack.size() < needle.size()) return std::string::npos;
  for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
    if (equals_ci_at(haystack, i, needle)) return i;
  }
  return std::string::npos;
}

inline std::string replace_all(std::string s, const std::string& from, const std::string& to) {
  if (from.empty()) return s;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

inline std::string leading_ws(const std::string& s) {
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) i++;
  return s.substr(0, i);
}

inline bool is_comment_line(const std::string& line) { return starts_with(trim_copy(line), "%%"); }

inline void trim_blank_edges(std::vector<std::string>& lines) {
  while (!lines.empty() && is_blank(lines.front())) lines.erase(lines.begin());
  while (!lines.empty() && is_blank(lines.back())) lines.pop_back();
}

// Index of the first line after leading comments, blanks and a front-matter block.
inline size_t first_content_index(const std::vector<std::string>& lines) {
  size_t i = 0;
  while (i < lines.size() && (is_blank(lines[i]) || is_comment_line(lines[i]))) ++i;
  if (i < lines.size() && trim_copy(lines[i]) == "---") {
    size_t j = i + 1;
    while (j < lines.size() && trim_copy(lines[j]) != "---") ++j;
    if (j < lines.size()) {
      i = j + 1;
      while (i < lines.size() && (is_blank(lines[i]) || is_comment_line(lines[i]))) ++i;
    }
  }
  return i;
}

}  // namespace detail
}  // namespace diagram_stream
