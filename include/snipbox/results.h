#ifndef INCLUDE_SNIPBOX_RESULTS_H_
#define INCLUDE_SNIPBOX_RESULTS_H_

#include <string>
#include <cstdint>
#include <utility>
#include <optional>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#define ENUM_OUTCOME_ \
  X(NUL, "", "nil") \
  X(OK, "OK", "Succeeded") \
  /* refused before anything is run */ \
  X(INVALID_INPUT, "II", "Invalid Input") \
  X(NOT_FOUND, "NF", "Unit Not Found") \
  X(REJECTED, "REJ", "Rejected by Safety Filter") \
  X(SYNTAX_ERROR, "SE", "Syntax Error") \
  /* outcomes of execution */ \
  X(RUNTIME_ERROR, "RE", "Runtime Exception") \
  X(TIMEOUT, "TLE", "Time Limit Exceeded") \
  X(MEMORY_LIMIT, "MLE", "Memory Limit Exceeded") \
  X(INTERNAL_ERROR, "IE", "Internal Error")
enum class Outcome {
#define X(name, abr, desc) name,
  ENUM_OUTCOME_
#undef X
};

// One submitted snippet. Read-only once returned by Materialize/LookupUnit.
class SourceUnit {
  std::string id_;
  std::filesystem::path path_;
  int64_t created_; // UNIX timestamp, seconds
 public:
  SourceUnit(std::string id, std::filesystem::path path, int64_t created) :
      id_(std::move(id)), path_(std::move(path)), created_(created) {}

  // file name of the unit, e.g. code_a1B2c3.py; this is the handle given to callers
  const std::string& Id() const { return id_; }
  const std::filesystem::path& Path() const { return path_; }
  int64_t Created() const { return created_; }
};

struct SubmitResult {
  Outcome outcome;
  std::optional<SourceUnit> unit; // set iff outcome == OK
  std::string message;

  SubmitResult() : outcome(Outcome::NUL) {}
};

struct CompileResult {
  bool accepted;
  Outcome outcome;
  std::optional<std::string> diagnostic; // always sanitized

  CompileResult() : accepted(false), outcome(Outcome::NUL) {}
};

struct ExecutionResult {
  // captured stdout / stderr of the snippet
  std::string output, error;
  std::optional<std::string> exception; // always sanitized
  bool succeeded;
  Outcome outcome;

  ExecutionResult() : succeeded(false), outcome(Outcome::NUL) {}
};

// Absolute paths are never serialized.
nlohmann::json ToJson(const SourceUnit&);
nlohmann::json ToJson(const SubmitResult&);
nlohmann::json ToJson(const CompileResult&);
nlohmann::json ToJson(const ExecutionResult&);

#endif  // INCLUDE_SNIPBOX_RESULTS_H_
