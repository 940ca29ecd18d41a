#ifndef INCLUDE_SNIPBOX_ENGINE_H_
#define INCLUDE_SNIPBOX_ENGINE_H_

#include <string>

#include "results.h"

// Limits applied to every sandboxed interpreter (validation and execution)
extern long kTimeLimitMs; // wall clock
extern long kMaxRSS; // KiB
extern long kMaxOutput; // KiB, per captured stream
extern std::string kPython; // resolved with /usr/bin/env inside the box

// Runs the unit in a fresh interpreter inside a fresh box:
//   - the box is a chroot holding a copy of the unit only, with /usr, /lib, ... bind-mounted
//   - the code runs in a new globals dict, with sys.path[0] set to the unit's directory
//   - stdout, stderr and the formatted uncaught exception are captured into files in the box
//   - the box is removed on every exit path
// Outcome: OK, RUNTIME_ERROR, TIMEOUT, MEMORY_LIMIT or INTERNAL_ERROR.
// Does not screen the unit and does not take a lease; see Run in pipeline.h.
ExecutionResult Execute(const SourceUnit&);

#endif  // INCLUDE_SNIPBOX_ENGINE_H_
