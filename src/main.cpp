#include <signal.h>
#include <unistd.h>
#include <pthread.h>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <snipbox/paths.h>
#include <snipbox/utils.h>
#include <snipbox/engine.h>
#include <snipbox/logger.h>
#include <snipbox/pipeline.h>
#include <snipbox/artifacts.h>

namespace {

bool ParseConfig(const fs::path& conf_path) {
  std::error_code ec;
  if (!fs::exists(conf_path, ec)) {
    spdlog::debug("Configuration file {} not found, using defaults", conf_path.c_str());
    return true;
  }
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string unit_root = ini[""]["unit_root"] | "";
  std::string box_root = ini[""]["box_root"] | "";
  std::string python = ini[""]["python"] | "";
  if (unit_root.size()) kUnitRoot = unit_root;
  if (box_root.size()) kBoxRoot = box_root;
  if (python.size()) kPython = python;
  kRetentionWindow = std::chrono::minutes(
      ini[""]["retention_minutes"] | (long)std::chrono::duration_cast<std::chrono::minutes>(kRetentionWindow).count());
  kTimeLimitMs = ini[""]["time_limit_ms"] | kTimeLimitMs;
  kMaxRSS = (ini[""]["memory_limit_mb"] | (kMaxRSS / 1024)) * 1024;
  kMaxOutput = ini[""]["output_limit_kib"] | kMaxOutput;
  kMaxSource = ini[""]["max_source_kib"] | kMaxSource;
  kReclaimInterval = std::chrono::seconds(
      ini[""]["reclaim_interval_seconds"] | (long)kReclaimInterval.count());
  return true;
}

std::optional<std::string> ReadSource(const std::string& file) {
  if (file == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream fin(file, std::ios::binary);
  if (!fin) return std::nullopt;
  return std::string(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
}

int Print(const nlohmann::json& result) {
  std::cout << result.dump(2) << std::endl;
  return result.value("success", false) ? 0 : 1;
}

// submit / compile share the reading & submission step
std::optional<SubmitResult> SubmitFile(const std::string& file) {
  auto source = ReadSource(file);
  if (!source) {
    spdlog::error("Failed to read {}", file);
    return std::nullopt;
  }
  return Submit(*source);
}

int RunReaper() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  // block before the reaper thread starts so it inherits the mask
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  Reaper reaper(kReclaimInterval);
  int sig = 0;
  sigwait(&set, &sig);
  spdlog::info("Received signal {}, stopping", sig);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();

  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "snipbox");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/snipbox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  argparse::ArgumentParser submit_cmd("submit");
  submit_cmd.add_description("Store and screen a snippet; prints its unit id");
  submit_cmd.add_argument("file").help("Python source file, or - for stdin");
  argparse::ArgumentParser compile_cmd("compile");
  compile_cmd.add_description("Submit a snippet and check its syntax");
  compile_cmd.add_argument("file").help("Python source file, or - for stdin");
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Check the syntax of a submitted unit");
  check_cmd.add_argument("unit").help("Unit id returned by submit");
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Execute a submitted unit");
  run_cmd.add_argument("unit").help("Unit id returned by submit");
  argparse::ArgumentParser reclaim_cmd("reclaim");
  reclaim_cmd.add_description("Remove units older than the retention window");
  argparse::ArgumentParser reaper_cmd("reaper");
  reaper_cmd.add_description("Reclaim units periodically until interrupted");
  parser.add_subparser(submit_cmd);
  parser.add_subparser(compile_cmd);
  parser.add_subparser(check_cmd);
  parser.add_subparser(run_cmd);
  parser.add_subparser(reclaim_cmd);
  parser.add_subparser(reaper_cmd);

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 2;
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    return 2;
  }

  bool sandboxed = parser.is_subcommand_used("compile") ||
                   parser.is_subcommand_used("check") ||
                   parser.is_subcommand_used("run");
  if (sandboxed && geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 2;
  }

  if (parser.is_subcommand_used("submit")) {
    auto res = SubmitFile(submit_cmd.get<std::string>("file"));
    if (!res) return 2;
    return Print(ToJson(*res));
  }
  if (parser.is_subcommand_used("compile")) {
    auto res = SubmitFile(compile_cmd.get<std::string>("file"));
    if (!res) return 2;
    if (!res->unit) return Print(ToJson(*res));
    nlohmann::json ret = ToJson(CheckSyntax(*res->unit));
    ret["unit"] = ToJson(*res->unit);
    return Print(ret);
  }
  if (parser.is_subcommand_used("check") || parser.is_subcommand_used("run")) {
    bool is_run = parser.is_subcommand_used("run");
    std::string id = (is_run ? run_cmd : check_cmd).get<std::string>("unit");
    auto unit = LookupUnit(id);
    if (!unit) {
      return Print({{"success", false},
                    {"outcome", OutcomeToAbr(Outcome::NOT_FOUND)},
                    {"message", OutcomeToDesc(Outcome::NOT_FOUND)}});
    }
    if (is_run) return Print(ToJson(Run(*unit)));
    return Print(ToJson(CheckSyntax(*unit)));
  }
  if (parser.is_subcommand_used("reclaim")) {
    size_t removed = Reclaim(std::chrono::system_clock::now());
    return Print({{"success", true}, {"removed", removed}});
  }
  if (parser.is_subcommand_used("reaper")) return RunReaper();
  std::cerr << parser;
  return 2;
}
