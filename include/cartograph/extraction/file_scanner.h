#pragma once

#include <cartograph/core/types.h>
#include <cartograph/model/entities.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cartograph::extraction {

/// Language tag for a file name, `unknown` when the extension is not recognized.
std::string detectLanguage(const std::filesystem::path& path);

/// True for programming languages (as opposed to markup, data or config formats).
bool isSourceLanguage(std::string_view language);

struct ScanOptions {
    bool skipHidden = true;
};

/**
 * @brief Walk a project tree and describe every regular file.
 *
 * Paths are relative to `root`, '/' separated and sorted. Hidden files and
 * directories are skipped when requested; unreadable entries are logged and skipped.
 */
Result<std::vector<model::FileRecord>> scanProject(const std::filesystem::path& root,
                                                   const ScanOptions& options = {});

} // namespace cartograph::extraction
