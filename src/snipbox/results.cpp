#include <snipbox/results.h>

#include <nlohmann/json.hpp>
#include <snipbox/utils.h>

namespace {

inline nlohmann::json OptionalText(const std::optional<std::string>& text) {
  if (!text) return nullptr;
  return *text;
}

} // namespace

nlohmann::json ToJson(const SourceUnit& unit) {
  return {
    {"id", unit.Id()},
    {"created", unit.Created()},
  };
}

nlohmann::json ToJson(const SubmitResult& res) {
  return {
    {"success", res.outcome == Outcome::OK},
    {"outcome", OutcomeToAbr(res.outcome)},
    {"message", res.message.empty() ? OutcomeToDesc(res.outcome) : res.message},
    {"unit", res.unit ? ToJson(*res.unit) : nlohmann::json(nullptr)},
  };
}

nlohmann::json ToJson(const CompileResult& res) {
  return {
    {"success", res.accepted},
    {"outcome", OutcomeToAbr(res.outcome)},
    {"message", OutcomeToDesc(res.outcome)},
    {"diagnostic", OptionalText(res.diagnostic)},
  };
}

nlohmann::json ToJson(const ExecutionResult& res) {
  return {
    {"success", res.succeeded},
    {"outcome", OutcomeToAbr(res.outcome)},
    {"message", OutcomeToDesc(res.outcome)},
    {"stdout", res.output},
    {"stderr", res.error},
    {"exception", OptionalText(res.exception)},
  };
}
