#ifndef PROGRAM_ARGS_H
#define PROGRAM_ARGS_H

#include <optional>
#include <string>
#include <vector>

#include "config_manager.h"
#include "lister.h"
#include "output.h"

/**
 * @struct ProgramArgs
 * @brief Estrutura que armazena todos os argumentos da linha de comando
 *
 * Opções não informadas ficam vazias (std::nullopt) para que o valor do
 * arquivo de configuração seja usado.
 */
struct ProgramArgs
{
    // Arquivos e diretórios para listar (vazio = diretório atual)
    std::vector<std::string> paths;

    // Opções de listagem
    std::optional<bool> recursive; // -R: listar subdiretórios recursivamente
    std::optional<bool> reverse;   // -r: ordem reversa
    std::vector<std::string> sortBy; // -s: critérios de ordenação (pode repetir)

    // Opções de saída
    std::optional<std::string> format; // -f: table ou json
    std::optional<bool> verbose;       // -v: log detalhado
    bool quiet = false;                // -q: somente erros

    // Configuração
    std::string configFile = "lsid3.conf"; // --config-file
    bool configMode = false;               // -config: listar ou alterar configuração
    std::string configPair;                // -config key=value

    bool showHelp = false;
    bool showVersion = false;
};

/**
 * @struct RunSettings
 * @brief Configuração final de uma execução (linha de comando + arquivo de configuração)
 */
struct RunSettings
{
    ListOptions options;
    OutputFormat format = OutputFormat::Table;
    bool verbose = false;
};

/**
 * @brief Lê os argumentos da linha de comando
 * @param args Saída com os argumentos reconhecidos
 * @param error Mensagem de erro de uso, quando retorna false
 * @return false para opção desconhecida ou opção sem valor
 */
bool parseProgramArgs(const std::vector<std::string> &argv, ProgramArgs &args, std::string &error);

/**
 * @brief Combina argumentos e configuração; a linha de comando tem prioridade
 * @return false para critério de ordenação ou formato desconhecido
 */
bool resolveSettings(const ProgramArgs &args, ConfigManager &config, RunSettings &settings, std::string &error);

#endif // PROGRAM_ARGS_H
