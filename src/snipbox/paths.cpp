#include "paths.h"

#include <unistd.h>
#include <atomic>

fs::path kUnitRoot = "/tmp/snipbox_units";
fs::path kBoxRoot = "/tmp/snipbox_box";

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

std::atomic_long box_id_seq = 0;

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline std::string BoxName(const char* prefix, long id) {
  return std::string(prefix) + std::to_string(getpid()) + "_" + PadInt(id, 6);
}

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

long GetUniqueBoxId() {
  return ++box_id_seq;
}

fs::path UnitPath(const std::string& id) {
  return kUnitRoot / id;
}

fs::path CompileBoxPath(long id) {
  return kBoxRoot / BoxName("compile_", id);
}
fs::path CompileBoxInput(long id, const std::string& unit_id, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id), inside_box)) / unit_id;
}
fs::path CompileBoxOutput(long id, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id), inside_box)) / "prog.pyc";
}

fs::path ExecuteBoxPath(long id) {
  return kBoxRoot / BoxName("run_", id);
}
fs::path ExecuteBoxProgram(long id, const std::string& unit_id, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id), inside_box)) / unit_id;
}
