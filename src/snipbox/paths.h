#ifndef SNIPBOX_PATHS_H_
#define SNIPBOX_PATHS_H_

#include <snipbox/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// unique within this process; box directories also carry the pid
long GetUniqueBoxId();

// for sandbox; captured streams do not live in the box (see CaptureFile in utils.h)
// if inside_box = true, id is not used; those calls will have id marked as -1
fs::path CompileBoxPath(long id);
fs::path CompileBoxInput(long id, const std::string& unit_id, bool inside_box = false);
fs::path CompileBoxOutput(long id, bool inside_box = false);
fs::path ExecuteBoxPath(long id);
fs::path ExecuteBoxProgram(long id, const std::string& unit_id, bool inside_box = false);

#endif  // SNIPBOX_PATHS_H_
