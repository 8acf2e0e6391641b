// =================================================================
// include/Infiniloom/DirectoryScanner.hpp
// =================================================================
// Header for the single-threaded directory scanner.

#pragma once

#include "Infiniloom/ScannerBase.hpp"
#include <utility>

namespace Infiniloom {

/**
 * @brief Scans a directory tree by recursive descent on the calling thread
 */
class DirectoryScanner : public ScannerBase {
public:
    explicit DirectoryScanner(WalkConfiguration config = WalkConfiguration())
        : ScannerBase(std::move(config)) {}

protected:
    void traverse() override;
    void enqueueDirectory(const std::string& relative_path) override;
};

} // namespace Infiniloom
