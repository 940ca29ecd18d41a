#ifndef INCLUDE_SNIPBOX_VALIDATOR_H_
#define INCLUDE_SNIPBOX_VALIDATOR_H_

#include "results.h"

// Compile-only pass (py_compile) inside a sandbox; no top-level statement of the unit is run.
// outcome is OK, SYNTAX_ERROR or INTERNAL_ERROR; diagnostic is sanitized.
// Does not screen the unit and does not take a lease; see CheckSyntax in pipeline.h.
CompileResult Validate(const SourceUnit&);

#endif  // INCLUDE_SNIPBOX_VALIDATOR_H_
