// =================================================================
// src/Infiniloom/DirectoryScanner.cpp
// =================================================================
// Implementation for the single-threaded directory scanner.

#include "Infiniloom/DirectoryScanner.hpp"

namespace Infiniloom {

void DirectoryScanner::traverse() {
    scanDirectory("");
}

void DirectoryScanner::enqueueDirectory(const std::string& relative_path) {
    scanDirectory(relative_path);
}

} // namespace Infiniloom
