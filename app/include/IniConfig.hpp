#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <map>
#include <string>

class IniConfig {
public:
    // A missing file is reported as false without logging an error.
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section,
                         const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
