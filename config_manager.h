#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <string>
#include <map>
#include <vector>

class ConfigManager {
public:
    // Nome sem diretório é procurado ao lado do executável
    ConfigManager(const std::string& filename = "lsid3.conf");

    void load();
    bool save();
    void print();

    bool getBool(const std::string& key, bool defaultValue);
    std::string getString(const std::string& key, const std::string& defaultValue);
    std::vector<std::string> getList(const std::string& key, const std::vector<std::string>& defaultValue);

    void setValue(const std::string& key, const std::string& value);

    const std::string& path() const { return filename; }

private:
    std::string filename;
    std::map<std::string, std::string> configData;

    void createDefaultConfig();
};

#endif // CONFIG_MANAGER_H
