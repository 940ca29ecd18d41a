#include <snipbox/safety_filter.h>

#include <spdlog/spdlog.h>

namespace {

// process spawning, dynamic import, file I/O, scope reflection, re-compilation, evaluation
const std::vector<std::string> kBlockedPatterns = {
  "os.system(",
  "subprocess",
  "eval(",
  "exec(",
  "__import__(",
  "importlib",
  "open(",
  "file(",
  "globals(",
  "locals(",
  "compile(",
};

} // namespace

const std::vector<std::string>& BlockedPatterns() {
  return kBlockedPatterns;
}

std::string ScreenResult::Reason() const {
  if (accepted) return "";
  return "Potentially unsafe code detected: " + pattern;
}

ScreenResult Screen(const std::string& source) {
  for (auto& pattern : kBlockedPatterns) {
    if (source.find(pattern) != std::string::npos) {
      spdlog::info("Source rejected by safety filter: pattern={}", pattern);
      return {false, pattern};
    }
  }
  return {true, ""};
}
