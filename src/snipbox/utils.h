#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <filesystem>

#include <snipbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);

// Reads at most max_len bytes (0 = whole file); sets truncated if there was more.
// Returns false if the file cannot be opened.
bool ReadFile(const fs::path&, std::string& content, size_t max_len = 0, bool* truncated = nullptr);

// An unlinked temporary file under kBoxRoot that the sandbox writes through an inherited
//   descriptor. It is read back through the same descriptor, so nothing done inside the box
//   (e.g. replacing a file with a symlink) can redirect what the parent reads.
// The descriptor is close-on-exec; see SandboxOptions::preserve_fds.
class CaptureFile {
  int fd_;
 public:
  CaptureFile();
  ~CaptureFile();
  CaptureFile(const CaptureFile&) = delete;
  CaptureFile& operator=(const CaptureFile&) = delete;

  bool Valid() const { return fd_ >= 0; }
  int Fd() const { return fd_; }
  // -1 on error
  long Size() const;
  // Reads at most max_len bytes (0 = whole file) from the beginning; sets truncated if there was more.
  bool Read(std::string& content, size_t max_len = 0, bool* truncated = nullptr) const;
};

// Creates a box directory with its workdir and removes the whole box on destruction.
class BoxGuard {
  fs::path box_;
  bool ready_;
 public:
  explicit BoxGuard(fs::path box);
  ~BoxGuard();
  BoxGuard(const BoxGuard&) = delete;
  BoxGuard& operator=(const BoxGuard&) = delete;

  bool Ready() const { return ready_; }
  const fs::path& Path() const { return box_; }
};

#endif  // UTILS_H_
