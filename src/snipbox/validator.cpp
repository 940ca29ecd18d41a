#include <snipbox/validator.h>

#include <signal.h>

#include <spdlog/spdlog.h>
#include <snipbox/engine.h>
#include <snipbox/sanitizer.h>
#include "paths.h"
#include "utils.h"
#include "sandbox.h"

namespace {

constexpr size_t kMaxMsgLen = 4000;

// argv: unit, cfile. exit 0 = valid, 1 = syntax error, 2 = compiler failure; message on stdout
constexpr char kCompileDriver[] = R"(import sys, traceback, py_compile
try:
    py_compile.compile(sys.argv[1], cfile=sys.argv[2], doraise=True)
except py_compile.PyCompileError as e:
    sys.stdout.write(str(e))
    sys.exit(1)
except Exception:
    sys.stdout.write(traceback.format_exc())
    sys.exit(2)
)";

inline CompileResult InternalFailure(const std::string& diagnostic) {
  CompileResult res;
  res.outcome = Outcome::INTERNAL_ERROR;
  res.diagnostic = diagnostic;
  return res;
}

std::string ReadMessage(const CaptureFile& file) {
  std::string message;
  bool truncated = false;
  if (!file.Read(message, kMaxMsgLen, &truncated)) return "";
  if (truncated) {
    message += "\n[Error message truncated after " + std::to_string(kMaxMsgLen) + " bytes]";
  }
  return message;
}

} // namespace

CompileResult Validate(const SourceUnit& unit) {
  long id = GetUniqueBoxId();
  spdlog::debug("Generating compile settings: unit={} box={}", unit.Id(), id);
  BoxGuard box(CompileBoxPath(id));
  if (!box.Ready() || !Copy(unit.Path(), CompileBoxInput(id, unit.Id()), kPerm666)) {
    return InternalFailure("Internal error");
  }
  CaptureFile message, error;
  if (!message.Valid() || !error.Valid()) return InternalFailure("Internal error");

  SandboxOptions opt;
  opt.boxdir = CompileBoxPath(id);
  opt.SetPython({"-c", kCompileDriver,
                 CompileBoxInput(-1, unit.Id(), true), CompileBoxOutput(-1, true)});
  opt.workdir = Workdir("/");
  opt.fd_output = message.Fd();
  opt.fd_error = error.Fd();
  opt.uid = opt.gid = BoxUid(id);
  opt.wall_time = kTimeLimitMs * 1000;
  opt.proc_num = 1;
  opt.fsize = kMaxOutput;
  // the compiled file and captured streams may be accounted in cgroups
  opt.rss = kMaxRSS + opt.fsize * 3;
  struct cjail_result cjail_res = SandboxExec(opt);

  if (cjail_res.timekill == -1) return InternalFailure("Internal error");
  if (cjail_res.timekill || cjail_res.oomkill > 0) {
    spdlog::info("Compilation exceeded limits: unit={} timekill={} oomkill={}",
                 unit.Id(), cjail_res.timekill, cjail_res.oomkill);
    return InternalFailure("Syntax check exceeded its resource limits");
  }
  bool exited = cjail_res.info.si_code == CLD_EXITED;
  int status = cjail_res.info.si_status;
  CompileResult res;
  if (exited && status == 0) {
    spdlog::info("Compilation successful: unit={}", unit.Id());
    res.accepted = true;
    res.outcome = Outcome::OK;
  } else if (exited && status == 1) {
    res.outcome = Outcome::SYNTAX_ERROR;
    res.diagnostic = Sanitize(ReadMessage(message), DiagnosticKind::SYNTAX_ERROR);
    spdlog::info("Compilation failed: unit={}", unit.Id());
    spdlog::debug("Message: {}", *res.diagnostic);
  } else {
    spdlog::warn("Compiler failure: unit={} code={} status={}",
                 unit.Id(), cjail_res.info.si_code, status);
    spdlog::debug("Message: {}", ReadMessage(message));
    res = InternalFailure("Internal compiler failure");
  }
  return res;
}
