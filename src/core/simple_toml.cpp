// ============= src/core/simple_toml.cpp =============
#include "core/simple_toml.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace burstface {

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void SimpleToml::parse_line(const std::string& raw, std::string& section) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return;

    if (line[0] == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.length() - 2));
        return;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) {
        spdlog::debug("toml: ignoring line without '=': {}", line);
        return;
    }

    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));

    // trailing comment on unquoted values
    if (!val.empty() && val.front() != '"') {
        auto hash = val.find('#');
        if (hash != std::string::npos) val = trim(val.substr(0, hash));
    }

    if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        val = val.substr(1, val.length() - 2);
    }

    std::string full_key = section.empty() ? key : section + "." + key;
    values[full_key] = val;
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::string line, section;
    while (std::getline(file, line)) {
        parse_line(line, section);
    }
    return true;
}

bool SimpleToml::load_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line, section;
    while (std::getline(stream, line)) {
        parse_line(line, section);
    }
    return true;
}

bool SimpleToml::has(const std::string& key) const {
    return values.find(key) != values.end();
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        spdlog::warn("toml: '{}' = '{}' is not an integer, using {}", key, it->second, def);
        return def;
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    try {
        return std::stof(it->second);
    } catch (const std::exception&) {
        spdlog::warn("toml: '{}' = '{}' is not a number, using {}", key, it->second, def);
        return def;
    }
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    return it->second == "true" || it->second == "1";
}

} // namespace burstface
