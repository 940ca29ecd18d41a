#include "sandbox.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>
#include <filesystem>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <snipbox/engine.h>
#include "utils.h"

namespace {

constexpr int kUidBase = 50000, kUidPoolSize = 1000;

// Only descriptors handed over explicitly survive into the sandboxed command; the parent may
//   hold descriptors of other boxes and units opened by other threads.
void MarkCloseOnExec() {
  if (close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return;
  long max_fd = sysconf(_SC_OPEN_MAX);
  for (long fd = 3; fd < max_fd; fd++) fcntl(fd, F_SETFD, FD_CLOEXEC);
}

} // namespace

int BoxUid(long box_id) {
  return kUidBase + (int)((getpid() * 7919L + box_id) % kUidPoolSize);
}

void SandboxOptions::FilterDirs() {
  std::vector<std::string> existing;
  for (auto& i : dirs) {
    std::error_code ec;
    if (std::filesystem::is_directory(i, ec)) existing.push_back(i);
  }
  dirs.swap(existing);
}

void SandboxOptions::SetPython(const std::vector<std::string>& args) {
  // -E: ignore PYTHON* variables, -s: no user site-packages, -u: keep partial output on kill
  command = {"/usr/bin/env", kPython, "-E", "-s", "-u"};
  command.insert(command.end(), args.begin(), args.end());
  envs.clear();
  if (char* path = getenv("PATH")) envs.push_back(std::string("PATH=") + path);
  envs.push_back("LANG=C.UTF-8");
  envs.push_back("PYTHONIOENCODING=utf-8");
  envs.push_back("PYTHONDONTWRITEBYTECODE=1");
  dirs = {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"};
  FilterDirs();
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  if (!input.empty()) ctx.redir_input = input.data();
  if (!output.empty()) ctx.redir_output = output.data();
  if (!error.empty()) ctx.redir_error = error.data();
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = boxdir.data();
  ctx.working_dir = workdir.data();
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  // reallocation of str_buf_ invalidate str.data(), thus we need to reserve it first
  ret.str_buf_.reserve(dirs.size());
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  struct cjail_result ret = {};
  CJailCtxClass ctx;
  opt.ToCJailCtx(ctx);
  int pipefd[2];
  pid_t pid;
  if (pipe2(pipefd, O_CLOEXEC) < 0) goto err;
  pid = fork();
  if (pid < 0) {
    close(pipefd[0]);
    close(pipefd[1]);
    goto err;
  }
  if (pid == 0) {
    close(pipefd[0]);
    struct cjail_result res = {};
    MarkCloseOnExec();
    for (int fd : opt.preserve_fds) {
      if (fcntl(fd, F_SETFD, 0) < 0) {
        res.oomkill = errno;
        res.timekill = -1;
        IGNORE_RETURN(write(pipefd[1], &res, sizeof(res)));
        _exit(0);
      }
    }
    if (cjail_exec(&ctx.GetCtx(), &res) < 0) {
      res.oomkill = errno;
      res.timekill = -1;
    }
    IGNORE_RETURN(write(pipefd[1], &res, sizeof(res)));
    _exit(0); // since forked, some atexit() may hang by deadlocks
  }
  close(pipefd[1]);
  spdlog::debug("cjail_exec pid={} childpid={} boxdir={} uid={} command={}",
      getpid(), pid, opt.boxdir, opt.uid, fmt::format("{}", opt.command));
  {
    ssize_t len = read(pipefd[0], &ret, sizeof(ret));
    int read_errno = errno;
    close(pipefd[0]);
    waitpid(pid, nullptr, 0);
    if (len != (ssize_t)sizeof(ret)) {
      // child died before reporting
      errno = len < 0 ? read_errno : EPIPE;
      ret = {};
      goto err;
    }
  }
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
err:
  spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
  ret.oomkill = errno;
  ret.timekill = -1;
  return ret;
}
