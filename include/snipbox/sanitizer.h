#ifndef INCLUDE_SNIPBOX_SANITIZER_H_
#define INCLUDE_SNIPBOX_SANITIZER_H_

#include <string>

enum class DiagnosticKind {
  SYNTAX_ERROR, // output of py_compile; empty lines are kept (caret blocks)
  TRACEBACK,    // formatted exception; empty lines are dropped
};

// Rewrites interpreter diagnostics so that they can be shown to the caller verbatim.
// For every line holding a frame token `File "<path>"` whose path has a directory part,
//   only the base name is kept and the rest of the line (line/column/frame) is preserved:
//     `  File "/srv/units/code_x.py", line 3, in <module>`
//   becomes
//     `  File "code_x.py", line 3, in <module>`
// Any other absolute path directly enclosed in parentheses or quotes, as in
//   `ImportError: cannot import name 'x' from 'json' (/usr/lib/python3/json/__init__.py)`,
//   is reduced to its base name as well.
// The result never ends with a newline.
std::string Sanitize(const std::string& raw, DiagnosticKind kind);

#endif  // INCLUDE_SNIPBOX_SANITIZER_H_
