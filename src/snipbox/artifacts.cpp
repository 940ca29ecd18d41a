#include <snipbox/artifacts.h>

#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <ctime>
#include <regex>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

std::chrono::seconds kRetentionWindow = std::chrono::minutes(30);

namespace {

constexpr char kUnitTemplate[] = "code_XXXXXX.py";
constexpr int kUnitSuffixLen = 3; // ".py"

bool WriteAll(int fd, const std::string& data) {
  size_t done = 0;
  while (done < data.size()) {
    ssize_t ret = write(fd, data.data() + done, data.size() - done);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    done += ret;
  }
  return true;
}

inline std::chrono::system_clock::time_point ModifiedTime(const struct stat& st) {
  using namespace std::chrono;
  return system_clock::from_time_t(st.st_mtim.tv_sec) +
      duration_cast<system_clock::duration>(nanoseconds(st.st_mtim.tv_nsec));
}

inline bool SameFile(const struct stat& a, const struct stat& b) {
  return a.st_dev == b.st_dev && a.st_ino == b.st_ino;
}

} // namespace

bool IsValidUnitId(const std::string& id) {
  // what mkstemps generates for kUnitTemplate
  static const std::regex kUnitIdRegex("code_[A-Za-z0-9]{6}\\.py");
  return std::regex_match(id, kUnitIdRegex);
}

std::optional<SourceUnit> Materialize(const std::string& source) {
  if (!CreateDirs(kUnitRoot)) return std::nullopt;
  std::string path = UnitPath(kUnitTemplate);
  int fd = mkostemps(path.data(), kUnitSuffixLen, O_CLOEXEC);
  if (fd < 0) {
    spdlog::warn("Failed allocating unit under {}: {}", kUnitRoot.c_str(), strerror(errno));
    return std::nullopt;
  }
  bool ok = WriteAll(fd, source);
  int write_errno = errno;
  if (close(fd) < 0) ok = false;
  if (!ok) {
    spdlog::warn("Failed writing unit {}: {}", path, strerror(write_errno));
    unlink(path.c_str());
    return std::nullopt;
  }
  SourceUnit unit(fs::path(path).filename().string(), path, (int64_t)time(nullptr));
  spdlog::info("Materialized unit {} ({} bytes)", unit.Id(), source.size());
  return unit;
}

std::optional<SourceUnit> LookupUnit(const std::string& id) {
  if (!IsValidUnitId(id)) {
    spdlog::info("Malformed unit id rejected");
    return std::nullopt;
  }
  fs::path path = UnitPath(id);
  struct stat st;
  if (stat(path.c_str(), &st) < 0 || !S_ISREG(st.st_mode)) {
    spdlog::debug("Unit {} not found", id);
    return std::nullopt;
  }
  return SourceUnit(id, path, (int64_t)st.st_mtim.tv_sec);
}

bool Discard(const SourceUnit& unit) {
  spdlog::debug("Discard unit {}", unit.Id());
  if (unlink(unit.Path().c_str()) < 0 && errno != ENOENT) {
    spdlog::warn("Failed discarding unit {}: {}", unit.Id(), strerror(errno));
    return false;
  }
  return true;
}

size_t Sweep(std::chrono::system_clock::time_point now) {
  std::vector<fs::path> candidates;
  {
    std::error_code ec;
    fs::directory_iterator it(kUnitRoot, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
      if (IsValidUnitId(it->path().filename().string())) candidates.push_back(it->path());
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
      spdlog::warn("Failed listing {}: {}", kUnitRoot.c_str(), ec.message());
    }
  }

  size_t removed = 0;
  for (auto& path : candidates) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      // ENOENT: removed by someone else meanwhile
      if (errno != ENOENT) spdlog::warn("Failed opening {}: {}", path.c_str(), strerror(errno));
      continue;
    }
    struct stat st;
    if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
      spdlog::debug("Unit {} is in use, skipped", path.filename().c_str());
    } else if (fstat(fd, &st) < 0 || !S_ISREG(st.st_mode)) {
      spdlog::warn("Failed inspecting {}: {}", path.c_str(), strerror(errno));
    } else if (now - ModifiedTime(st) > kRetentionWindow) {
      if (unlink(path.c_str()) == 0) {
        removed++;
        spdlog::debug("Reclaimed unit {}", path.filename().c_str());
      } else if (errno != ENOENT) {
        spdlog::warn("Failed reclaiming {}: {}", path.c_str(), strerror(errno));
      }
    }
    close(fd); // also releases the lock
  }
  if (removed) spdlog::info("Sweep reclaimed {} unit(s)", removed);
  return removed;
}

UnitLease::UnitLease(const SourceUnit& unit) : fd_(-1) {
  int fd = open(unit.Path().c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    spdlog::debug("Lease on {} failed: {}", unit.Id(), strerror(errno));
    return;
  }
  while (flock(fd, LOCK_SH) < 0) {
    if (errno == EINTR) continue;
    spdlog::warn("Failed locking unit {}: {}", unit.Id(), strerror(errno));
    close(fd);
    return;
  }
  // a sweep may have unlinked the file while we waited for the lock
  struct stat held, current;
  if (fstat(fd, &held) < 0 || stat(unit.Path().c_str(), &current) < 0 || !SameFile(held, current)) {
    spdlog::debug("Unit {} was reclaimed before the lease was acquired", unit.Id());
    close(fd);
    return;
  }
  fd_ = fd;
}

UnitLease::~UnitLease() {
  if (fd_ >= 0) close(fd_);
}
