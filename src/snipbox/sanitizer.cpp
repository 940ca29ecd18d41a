#include <snipbox/sanitizer.h>

#include <vector>
#include <filesystem>

namespace {

constexpr char kFileToken[] = "File \"";

std::vector<std::string> SplitLines(const std::string& str) {
  std::vector<std::string> ret;
  size_t begin = 0;
  while (true) {
    size_t end = str.find('\n', begin);
    if (end == std::string::npos) {
      ret.push_back(str.substr(begin));
      break;
    }
    ret.push_back(str.substr(begin, end - begin));
    begin = end + 1;
  }
  return ret;
}

inline bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t\r\f\v") == std::string::npos;
}

// `  File "/a/b/code_x.py", line 3, in <module>` -> `  File "code_x.py", line 3, in <module>`
// Lines without a quoted path containing a directory part are returned unchanged.
std::string StripFramePath(const std::string& line) {
  size_t token = line.find(kFileToken);
  if (token == std::string::npos) return line;
  size_t begin = token + sizeof(kFileToken) - 1;
  size_t end = line.find('"', begin);
  if (end == std::string::npos) return line;
  std::string path = line.substr(begin, end - begin);
  if (path.find('/') == std::string::npos) return line;
  std::string name = std::filesystem::path(path).filename().string();
  return "  File \"" + name + "\"" + line.substr(end + 1);
}

inline std::string Basename(std::string path) {
  while (path.size() > 1 && path.back() == '/') path.pop_back();
  std::string name = path.substr(path.rfind('/') + 1);
  return name.empty() ? path : name;
}

// `... from 'json' (/usr/lib/python3/json/__init__.py)` -> `... from 'json' (__init__.py)`
// Rewrites every absolute path enclosed in parentheses or quotes.
std::string StripEnclosedPaths(const std::string& line) {
  std::string ret;
  size_t pos = 0;
  while (pos < line.size()) {
    char open = line[pos];
    char close = open == '(' ? ')' : open;
    bool opening = (open == '(' || open == '\'' || open == '"') &&
        pos + 1 < line.size() && line[pos + 1] == '/';
    size_t end = opening ? line.find(close, pos + 1) : std::string::npos;
    if (end == std::string::npos) {
      ret += line[pos++];
      continue;
    }
    ret += open;
    ret += Basename(line.substr(pos + 1, end - pos - 1));
    ret += close;
    pos = end + 1;
  }
  return ret;
}

} // namespace

std::string Sanitize(const std::string& raw, DiagnosticKind kind) {
  std::string text = raw;
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();

  std::string ret;
  bool first = true;
  for (auto& line : SplitLines(text)) {
    if (kind == DiagnosticKind::TRACEBACK && IsBlank(line)) continue;
    if (!first) ret += '\n';
    ret += StripEnclosedPaths(StripFramePath(line));
    first = false;
  }
  return ret;
}
