#ifndef SNIPBOX_SANDBOX_H_
#define SNIPBOX_SANDBOX_H_

#include <string>
#include <vector>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;

  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
 public:
  std::string boxdir; // chroot
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside box (relative to boxdir but start with /)
  std::string workdir, input, output, error;
  int fd_output, fd_error; // -1 for not dup; overrides output/error
  // extra descriptors the sandboxed process keeps open
  std::vector<int> preserve_fds;
  int uid, gid;
  long wall_time; // us
  long rss; // KiB
  int proc_num;
  int file_num;
  long fsize; // KiB
  // bind-mounted read-only at the same path inside the box
  std::vector<std::string> dirs;

  SandboxOptions() :
      fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0),
      rss(0),
      proc_num(1),
      file_num(0),
      fsize(0) {}

  // drop dirs that do not exist on this host (e.g. /lib64)
  void FilterDirs();
  // fills the interpreter command and environment shared by every python box
  void SetPython(const std::vector<std::string>& args);
  // the result is invalidated after reassignment/reallocation of any string/vector member
  void ToCJailCtx(CJailCtxClass&) const;
};

// uid/gid for the sandboxed process of a box
int BoxUid(long box_id);

// Runs the sandbox in a forked child and blocks until it is done.
// Callers may be on any thread. The cjail context is built before fork(), so the child only
//   adjusts descriptor flags and calls cjail_exec. Every descriptor other than stdio,
//   fd_output/fd_error and preserve_fds is closed when the command starts.
// On failure to set up or run the sandbox, timekill is -1 and oomkill holds errno.
struct cjail_result SandboxExec(const SandboxOptions&);

#endif  // SNIPBOX_SANDBOX_H_
