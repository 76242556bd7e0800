#include <cartograph/extraction/file_scanner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>
#include <utility>

namespace cartograph::extraction {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 44> kExtensions{{
    {".py", "python"},       {".js", "javascript"},   {".ts", "typescript"},
    {".jsx", "react"},       {".tsx", "react"},       {".java", "java"},
    {".kt", "kotlin"},       {".c", "c"},             {".cpp", "cpp"},
    {".cc", "cpp"},          {".cxx", "cpp"},         {".h", "c_header"},
    {".hpp", "cpp_header"},  {".cs", "csharp"},       {".go", "go"},
    {".rs", "rust"},         {".rb", "ruby"},         {".php", "php"},
    {".swift", "swift"},     {".m", "objective_c"},   {".sql", "sql"},
    {".json", "json"},       {".xml", "xml"},         {".yaml", "yaml"},
    {".yml", "yaml"},        {".md", "markdown"},     {".html", "html"},
    {".css", "css"},         {".scss", "scss"},       {".sass", "sass"},
    {".cob", "cobol"},       {".cbl", "cobol"},       {".pas", "pascal"},
    {".f", "fortran"},       {".f90", "fortran"},     {".sh", "shell"},
    {".toml", "toml"},       {".ini", "ini"},         {".csv", "csv"},
    {".txt", "text"},        {".htm", "html"},        {".mm", "objective_c"},
    {".pyw", "python"},      {".hh", "cpp_header"},
}};

constexpr std::array<std::string_view, 23> kSourceLanguages{
    "python", "javascript", "typescript", "react",       "java",   "kotlin",
    "c",      "cpp",        "c_header",   "cpp_header",  "csharp", "go",
    "rust",   "ruby",       "php",        "swift",       "objective_c",
    "cobol",  "pascal",     "fortran",    "shell",       "dart",   "perl",
};

bool isHidden(const fs::path& relative) {
    for (const auto& part : relative) {
        auto s = part.string();
        if (s.size() > 1 && s[0] == '.' && s != "..")
            return true;
    }
    return false;
}

} // namespace

std::string detectLanguage(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [e, lang] : kExtensions) {
        if (ext == e)
            return std::string(lang);
    }
    return "unknown";
}

bool isSourceLanguage(std::string_view language) {
    return std::find(kSourceLanguages.begin(), kSourceLanguages.end(), language) !=
           kSourceLanguages.end();
}

Result<std::vector<model::FileRecord>> scanProject(const fs::path& root,
                                                   const ScanOptions& options) {
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        return Error{ErrorCode::FileNotFound, "Project root is not a directory: " + root.string()};

    const fs::path base = fs::weakly_canonical(root, ec);
    std::vector<model::FileRecord> files;

    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return Error{ErrorCode::PermissionDenied, "Cannot read " + root.string() + ": " + ec.message()};

    const fs::recursive_directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Skipping unreadable entry under {}: {}", base.string(), ec.message());
            ec.clear();
            continue;
        }
        const fs::path relative = it->path().lexically_relative(base);
        if (options.skipHidden && isHidden(relative)) {
            if (it->is_directory(ec))
                it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec))
            continue;

        model::FileRecord file;
        file.path = relative.generic_string();
        file.absolutePath = it->path().string();
        file.language = detectLanguage(it->path());
        file.extension = it->path().extension().string();
        file.size = it->file_size(ec);
        if (ec) {
            spdlog::warn("Cannot stat {}: {}", file.absolutePath, ec.message());
            ec.clear();
            file.size = 0;
        }
        files.push_back(std::move(file));
    }

    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.path < b.path; });
    spdlog::debug("Scanned {} files under {}", files.size(), base.string());
    return files;
}

} // namespace cartograph::extraction
