#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <stdexcept>
#include <filesystem>
#include <snipbox/paths.h>
#include <snipbox/artifacts.h>

SourceUnit MaterializeOrDie(const std::string& source) {
  auto unit = Materialize(source);
  if (!unit) throw std::runtime_error("Failed to materialize");
  return *unit;
}

void SetUnitAge(const SourceUnit& unit, std::chrono::system_clock::time_point now,
                std::chrono::system_clock::duration age) {
  using namespace std::chrono;
  auto since_epoch = duration_cast<nanoseconds>((now - age).time_since_epoch());
  struct timespec times[2];
  times[0].tv_sec = times[1].tv_sec = since_epoch.count() / 1'000'000'000;
  times[0].tv_nsec = times[1].tv_nsec = since_epoch.count() % 1'000'000'000;
  if (utimensat(AT_FDCWD, unit.Path().c_str(), times, 0) < 0) {
    throw std::runtime_error("Failed to set mtime");
  }
}

size_t CountUnits() {
  size_t ret = 0;
  for (auto& entry : fs::directory_iterator(kUnitRoot)) {
    if (IsValidUnitId(entry.path().filename().string())) ret++;
  }
  return ret;
}

void SandboxTest::SetUp() {
  if (geteuid() != 0) GTEST_SKIP() << "sandbox tests must be run as root";
}
