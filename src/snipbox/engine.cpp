#include <snipbox/engine.h>

#include <signal.h>
#include <string>

#include <spdlog/spdlog.h>
#include <snipbox/sanitizer.h>
#include "paths.h"
#include "utils.h"
#include "sandbox.h"

long kTimeLimitMs = 10'000;
long kMaxRSS = 256 * 1024; // 256M
long kMaxOutput = 1024; // 1M
std::string kPython = "python3";

namespace {

// argv: unit, descriptor of the exception report.
// The unit gets its own globals and sys.path[0] = its directory; the driver's own frame is
//   cut from the reported traceback.
constexpr char kExecuteDriver[] = R"(import os, sys, builtins, traceback
unit, report_fd = sys.argv[1], int(sys.argv[2])
sys.path[0] = unit.rpartition('/')[0] or '/'
def report(text):
    os.ftruncate(report_fd, 0)
    os.pwrite(report_fd, text.encode('utf-8', 'replace'), 0)
try:
    with open(unit) as f:
        code = compile(f.read(), unit, 'exec')
    exec(code, {'__name__': '__main__', '__builtins__': builtins})
except SystemExit as e:
    if e.code is not None and e.code != 0:
        report('SystemExit: %s\n' % (e.code,))
        sys.exit(1)
except Exception as e:
    report(''.join(traceback.format_exception(type(e), e, e.__traceback__.tb_next)))
    sys.exit(1)
)";

inline ExecutionResult InternalFailure() {
  ExecutionResult res;
  res.outcome = Outcome::INTERNAL_ERROR;
  res.exception = "Internal error";
  return res;
}

// Returns true if the stream reached the output limit
bool ReadStream(const CaptureFile& file, std::string& content) {
  size_t limit = kMaxOutput * 1024;
  if (!file.Read(content, limit)) {
    spdlog::warn("Failed reading captured stream");
    return false;
  }
  // the file size limit stops writes exactly at the limit
  if (file.Size() < (long)limit) return false;
  content += "\n[Output truncated after " + std::to_string(kMaxOutput) + " KiB]";
  return true;
}

} // namespace

ExecutionResult Execute(const SourceUnit& unit) {
  long id = GetUniqueBoxId();
  spdlog::debug("Generating execute settings: unit={} box={}", unit.Id(), id);
  BoxGuard box(ExecuteBoxPath(id));
  if (!box.Ready() || !Copy(unit.Path(), ExecuteBoxProgram(id, unit.Id()), kPerm666)) {
    return InternalFailure();
  }
  CaptureFile output, error, exception_report;
  if (!output.Valid() || !error.Valid() || !exception_report.Valid()) return InternalFailure();

  SandboxOptions opt;
  opt.boxdir = ExecuteBoxPath(id);
  opt.SetPython({"-c", kExecuteDriver,
                 ExecuteBoxProgram(-1, unit.Id(), true), std::to_string(exception_report.Fd())});
  opt.workdir = Workdir("/");
  opt.fd_output = output.Fd();
  opt.fd_error = error.Fd();
  opt.preserve_fds = {exception_report.Fd()};
  opt.uid = opt.gid = BoxUid(id);
  opt.wall_time = kTimeLimitMs * 1000;
  opt.fsize = kMaxOutput;
  opt.proc_num = 1;
  // captured streams are accounted in cgroups when kBoxRoot is on tmpfs, so we need to extend
  //   the RSS limit by all three of them
  opt.rss = kMaxRSS + opt.fsize * 3;
  struct cjail_result cjail_res = SandboxExec(opt);
  if (cjail_res.timekill == -1) return InternalFailure();

  ExecutionResult res;
  bool output_limit = ReadStream(output, res.output);
  output_limit = ReadStream(error, res.error) || output_limit;
  std::string exception;
  output_limit = ReadStream(exception_report, exception) || output_limit;

  bool exited = cjail_res.info.si_code == CLD_EXITED;
  int status = cjail_res.info.si_status;
  if (cjail_res.timekill) {
    res.outcome = Outcome::TIMEOUT;
    res.exception = "Time limit exceeded (" + std::to_string(kTimeLimitMs) + " ms)";
  } else if (cjail_res.oomkill > 0 || cjail_res.rus.ru_maxrss > kMaxRSS) {
    res.outcome = Outcome::MEMORY_LIMIT;
    res.exception = "Memory limit exceeded (" + std::to_string(kMaxRSS / 1024) + " MiB)";
  } else if (output_limit) {
    // python ignores SIGXFSZ, so the limit shows up as an OSError the snippet may even catch
    res.outcome = Outcome::RUNTIME_ERROR;
    res.exception = "Output limit exceeded (" + std::to_string(kMaxOutput) + " KiB)";
  } else if (exited && status == 0) {
    res.outcome = Outcome::OK;
    res.succeeded = true;
  } else if (exited) {
    res.outcome = Outcome::RUNTIME_ERROR;
    if (exception.empty()) {
      res.exception = "Process exited with status " + std::to_string(status);
    } else {
      res.exception = Sanitize(exception, DiagnosticKind::TRACEBACK);
    }
  } else {
    res.outcome = Outcome::RUNTIME_ERROR;
    res.exception = "Killed by signal " + std::to_string(status);
  }
  spdlog::info("Execution finished: unit={} outcome={}", unit.Id(), OutcomeToAbr(res.outcome));
  return res;
}
