#ifndef INCLUDE_SNIPBOX_SAFETY_FILTER_H_
#define INCLUDE_SNIPBOX_SAFETY_FILTER_H_

#include <string>
#include <vector>

// Textual pre-screen of submitted source.
//
// Screen() is a case-sensitive substring scan of the raw text against a fixed, ordered
//   list of patterns. It does not parse anything, so it cannot see through string building,
//   aliasing (e.g. `import os as o`), getattr on builtins or any other equivalent spelling
//   of a blocked construct. It is NOT a containment boundary; isolation of executed code
//   comes from the sandbox (see engine.h).

struct ScreenResult {
  bool accepted;
  std::string pattern; // first matched pattern; empty if accepted

  // "Potentially unsafe code detected: <pattern>"; empty if accepted
  std::string Reason() const;
};

// in the order they are checked
const std::vector<std::string>& BlockedPatterns();

// No side effects
ScreenResult Screen(const std::string& source);

#endif  // INCLUDE_SNIPBOX_SAFETY_FILTER_H_
