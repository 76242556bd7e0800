#include <fstream>
#include <cartograph/config/config_helpers.h>

namespace cartograph::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        bool inQuote = false;
        for (size_t i = 0; i < v.size(); ++i) {
            if (v[i] == '"' || v[i] == '\'') {
                inQuote = !inQuote;
            } else if (v[i] == '#' && !inQuote) {
                v = v.substr(0, i);
                trim(v);
                break;
            }
        }

        // Support both "store.path" at top level and "[store] path"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item = s.substr(start, comma == std::string::npos ? std::string::npos
                                                                       : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(item);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("CARTOGRAPH_CONFIG")) {
        return expand_tilde(*env);
    }

    std::filesystem::path configHome;
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        configHome = std::filesystem::path(*xdg);
    } else if (auto home = env_value("HOME")) {
        configHome = std::filesystem::path(*home) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "cartograph" / "config.toml";
    }

    return configHome / "cartograph" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (auto xdg = env_value("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "cartograph";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".local" / "share" / "cartograph";
    }
    return std::filesystem::current_path() / "cartograph_data";
}

} // namespace cartograph::config
