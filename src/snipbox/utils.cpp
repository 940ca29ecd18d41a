#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "paths.h"

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToDesc, Outcome, ENUM_OUTCOME_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG3

static const char* kOutcomeAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_OUTCOME_
#undef X
};

const char* OutcomeToAbr(Outcome outcome) {
  return kOutcomeAbrTable[(int)outcome];
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (!ec && perms != fs::perms::unknown) fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (!ec && perms != fs::perms::unknown) fs::permissions(to, perms, ec);
  if (ec) {
    spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& content, size_t max_len, bool* truncated) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  content.clear();
  if (truncated) *truncated = false;
  char buf[4096];
  while (fin) {
    size_t want = sizeof(buf);
    if (max_len) {
      if (content.size() >= max_len) {
        if (truncated) *truncated = fin.peek() != std::ifstream::traits_type::eof();
        break;
      }
      want = std::min(want, max_len - content.size());
    }
    fin.read(buf, want);
    content.append(buf, fin.gcount());
  }
  return true;
}

CaptureFile::CaptureFile() : fd_(-1) {
  std::string path = kBoxRoot / "capture_XXXXXX";
  int fd = mkostemp(path.data(), O_CLOEXEC);
  if (fd < 0) {
    spdlog::warn("Failed creating capture file under {}: {}", kBoxRoot.c_str(), strerror(errno));
    return;
  }
  unlink(path.c_str());
  fd_ = fd;
}

CaptureFile::~CaptureFile() {
  if (fd_ >= 0) close(fd_);
}

long CaptureFile::Size() const {
  struct stat st;
  if (fd_ < 0 || fstat(fd_, &st) < 0) return -1;
  return st.st_size;
}

bool CaptureFile::Read(std::string& content, size_t max_len, bool* truncated) const {
  long size = Size();
  if (size < 0) return false;
  size_t want = max_len && (size_t)size > max_len ? max_len : size;
  if (truncated) *truncated = want < (size_t)size;
  content.assign(want, '\0');
  size_t done = 0;
  while (done < want) {
    ssize_t ret = pread(fd_, content.data() + done, want - done, done);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) break;
    done += ret;
  }
  content.resize(done);
  return true;
}

BoxGuard::BoxGuard(fs::path box) : box_(std::move(box)), ready_(false) {
  // the box itself stays root-owned; only the workdir is writable by the sandbox user
  ready_ = CreateDirs(box_) && CreateDirs(Workdir(fs::path(box_)), fs::perms::all);
}

BoxGuard::~BoxGuard() {
  RemoveAll(box_);
}
