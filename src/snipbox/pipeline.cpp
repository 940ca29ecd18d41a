#include <snipbox/pipeline.h>

#include <exception>

#include <spdlog/spdlog.h>
#include <snipbox/engine.h>
#include <snipbox/artifacts.h>
#include <snipbox/validator.h>
#include <snipbox/safety_filter.h>
#include "utils.h"

long kMaxSource = 1024; // 1M
std::chrono::seconds kReclaimInterval = std::chrono::seconds(60);

namespace {

constexpr char kInternalError[] = "Internal error";

inline SubmitResult SubmitFailure(Outcome outcome, const std::string& message) {
  SubmitResult res;
  res.outcome = outcome;
  res.message = message;
  return res;
}

// Checks the lease and screens the current text of the unit; returns false (with outcome set) on failure
template <class Result>
bool PrepareUnit(const SourceUnit& unit, const UnitLease& lease, Result& res, ScreenResult& screen) {
  if (!lease.Valid()) {
    res.outcome = Outcome::NOT_FOUND;
    return false;
  }
  std::string source;
  if (!ReadFile(unit.Path(), source)) {
    spdlog::warn("Failed reading unit {}", unit.Id());
    res.outcome = Outcome::INTERNAL_ERROR;
    return false;
  }
  screen = Screen(source);
  if (!screen.accepted) {
    res.outcome = Outcome::REJECTED;
    return false;
  }
  return true;
}

} // namespace

SubmitResult Submit(const std::string& source) {
  try {
    if (source.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
      return SubmitFailure(Outcome::INVALID_INPUT, "No code provided");
    }
    if (kMaxSource && source.size() > (size_t)kMaxSource * 1024) {
      return SubmitFailure(Outcome::INVALID_INPUT,
          "Source exceeds the maximum size of " + std::to_string(kMaxSource) + " KiB");
    }
    std::optional<SourceUnit> unit = Materialize(source);
    if (!unit) return SubmitFailure(Outcome::INTERNAL_ERROR, kInternalError);
    ScreenResult screen = Screen(source);
    if (!screen.accepted) {
      Discard(*unit);
      return SubmitFailure(Outcome::REJECTED, screen.Reason());
    }
    SubmitResult res;
    res.outcome = Outcome::OK;
    res.unit = std::move(unit);
    return res;
  } catch (const std::exception& e) {
    spdlog::error("Submit failed: {}", e.what());
    return SubmitFailure(Outcome::INTERNAL_ERROR, kInternalError);
  }
}

CompileResult CheckSyntax(const SourceUnit& unit) {
  try {
    UnitLease lease(unit);
    CompileResult res;
    ScreenResult screen;
    if (!PrepareUnit(unit, lease, res, screen)) {
      if (res.outcome == Outcome::REJECTED) {
        res.diagnostic = screen.Reason();
      } else if (res.outcome == Outcome::INTERNAL_ERROR) {
        res.diagnostic = kInternalError;
      }
      return res;
    }
    return Validate(unit);
  } catch (const std::exception& e) {
    spdlog::error("CheckSyntax failed: unit={} {}", unit.Id(), e.what());
    CompileResult res;
    res.outcome = Outcome::INTERNAL_ERROR;
    res.diagnostic = kInternalError;
    return res;
  }
}

ExecutionResult Run(const SourceUnit& unit) {
  try {
    UnitLease lease(unit);
    ExecutionResult res;
    ScreenResult screen;
    if (!PrepareUnit(unit, lease, res, screen)) {
      if (res.outcome == Outcome::REJECTED) {
        res.exception = screen.Reason();
      } else if (res.outcome == Outcome::INTERNAL_ERROR) {
        res.exception = kInternalError;
      }
      return res;
    }
    return Execute(unit);
  } catch (const std::exception& e) {
    spdlog::error("Run failed: unit={} {}", unit.Id(), e.what());
    ExecutionResult res;
    res.outcome = Outcome::INTERNAL_ERROR;
    res.exception = kInternalError;
    return res;
  }
}

size_t Reclaim(std::chrono::system_clock::time_point now) {
  try {
    return Sweep(now);
  } catch (const std::exception& e) {
    spdlog::error("Reclaim failed: {}", e.what());
    return 0;
  }
}

Reaper::Reaper(std::chrono::seconds interval) :
    interval_(interval), stop_(false), thread_(&Reaper::Loop, this) {}

Reaper::~Reaper() {
  Stop();
}

void Reaper::Stop() {
  {
    std::lock_guard lck(mtx_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void Reaper::Loop() {
  spdlog::info("Reaper started: interval={}s retention={}s", interval_.count(), kRetentionWindow.count());
  std::unique_lock lck(mtx_);
  while (!stop_) {
    lck.unlock();
    Reclaim(std::chrono::system_clock::now());
    lck.lock();
    cv_.wait_for(lck, interval_, [this] { return stop_; });
  }
  spdlog::info("Reaper stopped");
}
