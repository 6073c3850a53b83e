#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <map>
#include <string>
#include <vector>

class IniConfig {
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key,
                         const std::string& default_value = "") const;
    bool getBool(const std::string& section, const std::string& key, bool default_value) const;
    int getInt(const std::string& section, const std::string& key, int default_value) const;
    std::vector<std::string> getList(const std::string& section, const std::string& key,
                                     const std::vector<std::string>& default_value) const;

    void setValue(const std::string& section, const std::string& key, const std::string& value);
    void setList(const std::string& section, const std::string& key,
                 const std::vector<std::string>& values);
    bool hasValue(const std::string& section, const std::string& key) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
