// ============= include/core/simple_toml.hpp =============
#pragma once
#include <map>
#include <string>

namespace burstface {

// Minimal TOML reader: [section] headers, key = value lines, # comments.
// Keys are flattened to "section.key".
class SimpleToml {
public:
    bool load(const std::string& filename);
    bool load_string(const std::string& content);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;

    size_t size() const { return values.size(); }

private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);
    void parse_line(const std::string& raw, std::string& section);
};

} // namespace burstface
