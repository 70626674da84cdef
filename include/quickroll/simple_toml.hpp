#pragma once
#include <map>
#include <string>

namespace quickroll {

// Lector TOML minimo: secciones [x] y pares key = value.
// Las claves quedan como "seccion.clave".
class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);

public:
    bool load(const std::string& filename);
    bool parse(const std::string& content);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;
};

}  // namespace quickroll
