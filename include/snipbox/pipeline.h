#ifndef INCLUDE_SNIPBOX_PIPELINE_H_
#define INCLUDE_SNIPBOX_PIPELINE_H_

#include <mutex>
#include <chrono>
#include <string>
#include <thread>
#include <condition_variable>

#include "results.h"

// KiB; 0 = no limit
extern long kMaxSource;
extern std::chrono::seconds kReclaimInterval;

// None of these throw; every failure is converted into the result's outcome.

// Materializes and screens the source. A rejected unit is discarded right away.
SubmitResult Submit(const std::string& source);
// Screens and validates the unit while holding a lease on it.
CompileResult CheckSyntax(const SourceUnit&);
// Screens and executes the unit while holding a lease on it. A fresh result every call.
ExecutionResult Run(const SourceUnit&);
// Idempotent maintenance sweep; returns the number of units removed
size_t Reclaim(std::chrono::system_clock::time_point now);

// Calls Reclaim periodically from a background thread until stopped or destroyed.
class Reaper {
  std::chrono::seconds interval_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_;
  std::thread thread_;

  void Loop();
 public:
  explicit Reaper(std::chrono::seconds interval);
  ~Reaper();
  Reaper(const Reaper&) = delete;
  Reaper& operator=(const Reaper&) = delete;

  void Stop();
};

#endif  // INCLUDE_SNIPBOX_PIPELINE_H_
