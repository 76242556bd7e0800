#include <cartograph/treesitter/grammar_loader.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>

#include <dlfcn.h>

extern "C" {
#include <tree_sitter/api.h>
}

namespace cartograph::treesitter {

GrammarLoader::~GrammarLoader() {
    for (auto& [symbol, entry] : loaded_) {
        if (entry.first)
            dlclose(entry.first);
    }
}

void GrammarLoader::addGrammarPath(std::filesystem::path dir) {
    std::lock_guard lock{pathsMutex_};
    extraPaths_.push_back(std::move(dir));
}

const GrammarLoader::GrammarSpec* GrammarLoader::findSpec(std::string_view language) const {
    for (const auto& spec : kSpecs) {
        if (spec.key == language)
            return &spec;
    }
    return nullptr;
}

bool GrammarLoader::knows(std::string_view language) const {
    return findSpec(language) != nullptr;
}

std::vector<std::filesystem::path> GrammarLoader::searchPaths() const {
    std::vector<std::filesystem::path> paths;
    {
        std::lock_guard lock{pathsMutex_};
        paths = extraPaths_;
    }
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        paths.emplace_back(std::filesystem::path(xdg) / "cartograph" / "grammars");
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        paths.emplace_back(std::filesystem::path(home) / ".local" / "share" / "cartograph" /
                           "grammars");
    }
    paths.emplace_back("/usr/local/lib");
    paths.emplace_back("/usr/lib");
    paths.emplace_back("/usr/lib/x86_64-linux-gnu");
    return paths;
}

std::vector<std::string> GrammarLoader::libraryCandidates(const GrammarSpec& spec) const {
    std::vector<std::string> candidates;
    if (const char* env = std::getenv(std::string(spec.env_var).c_str()); env && *env) {
        candidates.emplace_back(env);
    }

    std::string core(spec.lib_name);
    std::string underscore = core;
    std::replace(underscore.begin(), underscore.end(), '-', '_');
    const std::vector<std::string> names = {"lib" + core + ".so", core + ".so",
                                            "lib" + underscore + ".so", underscore + ".so"};

    std::error_code ec;
    for (const auto& dir : searchPaths()) {
        if (!std::filesystem::is_directory(dir, ec))
            continue;
        for (const auto& name : names) {
            auto candidate = dir / name;
            if (std::filesystem::exists(candidate, ec))
                candidates.push_back(candidate.string());
        }
    }
    return candidates;
}

Result<const TSLanguage*> GrammarLoader::load(std::string_view language) {
    const auto* spec = findSpec(language);
    if (!spec) {
        return Error{ErrorCode::NotSupported,
                     fmt::format("No tree-sitter grammar known for '{}'", language)};
    }

    std::lock_guard lock{mutex_};
    const std::string symbol(spec->symbol);
    if (auto it = loaded_.find(symbol); it != loaded_.end()) {
        if (!it->second.second)
            return Error{ErrorCode::NotFound, fmt::format("Grammar for '{}' unavailable", language)};
        return it->second.second;
    }

    auto candidates = libraryCandidates(*spec);

    for (const auto& candidate : candidates) {
        void* handle = dlopen(candidate.c_str(), RTLD_LAZY | RTLD_LOCAL);
        if (!handle) {
            spdlog::debug("dlopen {} failed: {}", candidate, dlerror());
            continue;
        }
        using Factory = const TSLanguage* (*)();
        auto factory = reinterpret_cast<Factory>(dlsym(handle, symbol.c_str()));
        const TSLanguage* lang = factory ? factory() : nullptr;
        if (!lang) {
            dlclose(handle);
            continue;
        }
        spdlog::info("Loaded tree-sitter grammar for {} from {}", language, candidate);
        loaded_[symbol] = {handle, lang};
        return lang;
    }

    // Remember the miss so later files of this language skip the search
    loaded_[symbol] = {nullptr, nullptr};
    spdlog::warn("No tree-sitter grammar library found for {} (set {})", language, spec->env_var);
    return Error{ErrorCode::NotFound,
                 fmt::format("Grammar for '{}' not found in {} candidates", language,
                             candidates.size())};
}

} // namespace cartograph::treesitter
