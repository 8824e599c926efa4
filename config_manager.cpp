#include "config_manager.h"
#include "logging.h"
#include "string_utils.h"
#include <fstream>
#include <iostream>
#include <filesystem>
#include <system_error>
#include <unistd.h>
#include <limits.h>

namespace fs = std::filesystem;

namespace {
    // Diretório do executável (/proc/self/exe); "." se não der para descobrir
    fs::path executableDir() {
        char buf[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", buf, sizeof(buf));
        if (count <= 0) {
            return ".";
        }
        return fs::path(std::string(buf, static_cast<size_t>(count))).parent_path();
    }
}

ConfigManager::ConfigManager(const std::string& filename) {
    // Só o nome do arquivo: fica ao lado do executável
    fs::path file(filename);
    if (!file.has_parent_path()) {
        file = executableDir() / file;
    }
    this->filename = file.string();

    load();
}

void ConfigManager::load() {
    createDefaultConfig();

    std::error_code ec;
    if (!fs::is_regular_file(filename, ec)) {
        log("DEBUG", "Sem arquivo de configuração, usando padrões:", filename);
        return;
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        log("WARNING", "Erro ao abrir arquivo de configuração:", filename);
        return;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) {
            log("WARNING", "Linha " + std::to_string(lineNumber) + " ignorada (esperado chave=valor):", filename);
            continue;
        }
        configData[trim(line.substr(0, delimiterPos))] = trim(line.substr(delimiterPos + 1));
    }
    log("DEBUG", "Configuração carregada:", filename);
}

bool ConfigManager::save() {
    std::ofstream file(filename);
    if (!file.is_open()) {
        log("ERROR", "Erro ao salvar arquivo de configuração:", filename);
        return false;
    }

    for (const auto& pair : configData) {
        file << pair.first << "=" << pair.second << "\n";
    }
    return file.good();
}

void ConfigManager::print() {
    std::cout << "Configurações atuais (" << filename << "):\n";
    for (const auto& pair : configData) {
        std::cout << "  " << pair.first << " = " << pair.second << "\n";
    }
}

void ConfigManager::createDefaultConfig() {
    // Mesmos valores padrão das opções de linha de comando
    configData["sort"] = "file-name";
    configData["format"] = "table";
    configData["reverse"] = "false";
    configData["recursive"] = "false";
    configData["verbose"] = "false";
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) {
    auto it = configData.find(key);
    if (it == configData.end()) {
        return defaultValue;
    }

    std::string value = toLower(it->second);
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;

    log("WARNING", "Valor inválido para " + key + ":", it->second);
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) {
    auto it = configData.find(key);
    return it != configData.end() ? it->second : defaultValue;
}

std::vector<std::string> ConfigManager::getList(const std::string& key, const std::vector<std::string>& defaultValue) {
    auto it = configData.find(key);
    if (it == configData.end()) {
        return defaultValue;
    }
    return split(it->second, ',');
}

void ConfigManager::setValue(const std::string& key, const std::string& value) {
    configData[key] = value;
}
