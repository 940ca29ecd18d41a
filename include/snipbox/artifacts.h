#ifndef INCLUDE_SNIPBOX_ARTIFACTS_H_
#define INCLUDE_SNIPBOX_ARTIFACTS_H_

#include <chrono>
#include <string>
#include <optional>

#include "results.h"

// Units older than this (by modification time) are removed by Sweep
extern std::chrono::seconds kRetentionWindow;

bool IsValidUnitId(const std::string& id);

// Writes the source to a fresh, uniquely named file under kUnitRoot.
// Names are allocated with O_EXCL, so concurrent callers (threads or processes) never collide.
std::optional<SourceUnit> Materialize(const std::string& source);

// nullopt if the id is malformed or the unit does not exist (anymore)
std::optional<SourceUnit> LookupUnit(const std::string& id);

bool Discard(const SourceUnit&);

// Removes every unit whose age (now - mtime) strictly exceeds kRetentionWindow and which is
//   not leased. Returns the number of units removed. Safe to call repeatedly and concurrently.
size_t Sweep(std::chrono::system_clock::time_point now);

// Marks a unit as in flight for the lifetime of the object; Sweep skips leased units.
// Backed by flock(2), so it also holds between worker processes sharing kUnitRoot.
class UnitLease {
  int fd_;
 public:
  explicit UnitLease(const SourceUnit&);
  ~UnitLease();
  UnitLease(const UnitLease&) = delete;
  UnitLease& operator=(const UnitLease&) = delete;

  // false if the unit is gone (e.g. reclaimed before the lease was acquired)
  bool Valid() const { return fd_ >= 0; }
};

#endif  // INCLUDE_SNIPBOX_ARTIFACTS_H_
