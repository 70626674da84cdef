#include "quickroll/simple_toml.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace quickroll {

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

bool SimpleToml::parse(const std::string& content) {
    std::istringstream in(content);
    std::string line, section;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"') {
            auto close = val.find('"', 1);
            if (close != std::string::npos) {
                val = val.substr(1, close - 1);
            }
        } else {
            // comentario al final de la linea
            auto hash = val.find('#');
            if (hash != std::string::npos) {
                val = trim(val.substr(0, hash));
            }
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
    return true;
}

bool SimpleToml::has(const std::string& key) const {
    return values.count(key) > 0;
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try { return std::stoi(get(key)); }
    catch (const std::exception&) { return def; }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try { return std::stof(get(key)); }
    catch (const std::exception&) { return def; }
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    std::string v = get(key);
    if (v == "true" || v == "1") return true;
    if (v == "false" || v == "0") return false;
    return def;
}

}  // namespace quickroll
