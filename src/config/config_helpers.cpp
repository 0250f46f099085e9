#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <utility>
#include <depfetch/config/config_helpers.h>

namespace depfetch::config {

namespace {

// Walk a TOML-ish file and invoke fn(section, key, value) for each assignment
template <typename Fn> void for_each_entry(const std::filesystem::path& config_path, Fn&& fn) {
    std::ifstream file(config_path);
    if (!file) {
        return;
    }

    std::string line;
    std::string currentSection;

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

        // Remove inline comments (outside quotes)
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        if (!fn(currentSection, k, unquote(v))) {
            return;
        }
    }
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::string found;
    for_each_entry(config_path, [&](const std::string& currentSection, const std::string& k,
                                    const std::string& v) {
        // Support both "download.workers" and "[download] workers"
        if ((section.empty() || currentSection == section) && k == key) {
            found = v;
            return false;
        }
        if (!section.empty() && k == section + "." + key) {
            found = v;
            return false;
        }
        return true;
    });
    return found;
}

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> out;
    for_each_entry(config_path, [&](const std::string& currentSection, const std::string& k,
                                    const std::string& v) {
        if (currentSection.empty() || k.find('.') != std::string::npos) {
            out[k] = v;
        } else {
            out[currentSection + "." + k] = v;
        }
        return true;
    });
    return out;
}

std::optional<std::uint64_t> parse_size(std::string_view text) {
    std::string size(text);
    trim(size);
    for (auto& c : size) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (size.empty()) {
        return std::nullopt;
    }

    if (std::all_of(size.begin(), size.end(), [](unsigned char c) { return std::isdigit(c); })) {
        try {
            return static_cast<std::uint64_t>(std::stoull(size));
        } catch (...) {
            return std::nullopt;
        }
    }

    // Longest suffix first so "GB" is not read as "B"
    static constexpr std::array<std::pair<std::string_view, std::uint64_t>, 5> kUnits{{
        {"TB", 1024ull * 1024 * 1024 * 1024},
        {"GB", 1024ull * 1024 * 1024},
        {"MB", 1024ull * 1024},
        {"KB", 1024ull},
        {"B", 1ull},
    }};

    for (const auto& [unit, multiplier] : kUnits) {
        if (size.size() > unit.size() && std::string_view(size).ends_with(unit)) {
            std::string number = size.substr(0, size.size() - unit.size());
            trim(number);
            if (number.empty()) {
                return std::nullopt;
            }
            try {
                std::size_t consumed = 0;
                double value = std::stod(number, &consumed);
                if (consumed != number.size() || value < 0 || !std::isfinite(value)) {
                    return std::nullopt;
                }
                return static_cast<std::uint64_t>(value * static_cast<double>(multiplier));
            } catch (...) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

std::optional<bool> parse_bool(std::string_view text) {
    std::string v(text);
    trim(v);
    for (auto& c : v) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("DEPFETCH_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "depfetch" / "config.toml";
    }

    return configHome / "depfetch" / "config.toml";
}

} // namespace depfetch::config
