#ifndef INCLUDE_SNIPBOX_PATHS_H_
#define INCLUDE_SNIPBOX_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Materialized units live directly under kUnitRoot; sandbox boxes are created under kBoxRoot.
// The caller chooses both; they should not be the same directory.
extern fs::path kUnitRoot;
extern fs::path kBoxRoot;

// Does not check the id; see IsValidUnitId in artifacts.h
fs::path UnitPath(const std::string& id);

#endif  // INCLUDE_SNIPBOX_PATHS_H_
