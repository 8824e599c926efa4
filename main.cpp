// ==============================
// 📦 BIBLIOTECAS PADRÃO C++
// ==============================
#include <cctype>     // toupper
#include <exception>  // std::exception
#include <iostream>   // Entrada/saída (cout, cerr)
#include <string>     // Strings
#include <vector>     // Arrays dinâmicos

// ==============================
// 📦 BIBLIOTECAS DO PROJETO
// ==============================
#include "config_manager.h"
#include "lister.h"
#include "logging.h"
#include "ls_error.h"
#include "output.h"
#include "program_args.h"
#include "string_utils.h"
#include "taglib_tag_reader.h"

#ifndef LSID3_VERSION
#define LSID3_VERSION "0.0.0"
#endif

// ==============================
// 🛠️ FUNÇÕES AUXILIARES
// ==============================

std::string capitalizeFirstLetter(const std::string &s)
{
    if (s.empty())
        return s;
    std::string result = s;
    result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    return result;
}

// ==============================
// ❓ HELP
// ==============================

/**
 * @brief Exibe a mensagem de ajuda com todas as opções disponíveis
 * @param progName Nome do programa (argv[0])
 */
void printHelp(const char *progName)
{
    std::cout << "lsid3 - lista arquivos MP3 com título, artista, álbum, ano, faixa e gênero\n\n"
              << "Uso: " << progName << " [opções] [ARQUIVO...]\n"
              << "(sem ARQUIVO, lista o diretório atual)\n\n"
              << "Opções:\n"
              << "  -f, --format WORD    Formato de saída: table (padrão) ou json\n"
              << "  -r, --reverse        Ordem reversa\n"
              << "  -R, --recursive      Listar subdiretórios recursivamente\n"
              << "  -s, --sort WORD      Ordenar por WORD (pode repetir ou usar lista: album,track)\n"
              << "                       file-name, file-size, title, artist, album, year, track, genre\n"
              << "  -v, --verbose        Log detalhado (stderr)\n"
              << "  -q, --quiet          Somente erros no log\n"
              << "  --config-file PATH   Arquivo de configuração alternativo\n"
              << "  -config              Listar configurações atuais\n"
              << "  -config <k=v>        Atualizar configuração (ex: sort=album,track)\n"
              << "  -h, --help           Esta ajuda\n"
              << "  --version            Versão\n\n"
              << "Ex: " << progName << " -R -s artist -s album ./musicas\n";
}

// ==============================
// 🚀 FUNÇÃO PRINCIPAL
// ==============================

/**
 * @brief Função principal do programa
 *
 * Fluxo de execução:
 * 1. Parse dos argumentos da linha de comando
 * 2. Leitura da configuração (argumentos têm prioridade)
 * 3. Listagem dos caminhos (leitura das tags ID3v2)
 * 4. Saída (tabela ou JSON) no stdout
 *
 * Códigos de saída: 0 sucesso, 1 erro na listagem, 2 erro de uso.
 */
int main(int argc, char *argv[])
{
    ProgramArgs args;
    std::string error;

    // ==============================
    // PARSE DOS ARGUMENTOS
    // ==============================
    if (!parseProgramArgs(std::vector<std::string>(argv + 1, argv + argc), args, error))
    {
        log("ERROR", capitalizeFirstLetter(error));
        std::cerr << "Use " << argv[0] << " --help para ver as opções.\n";
        return 2;
    }
    if (args.showHelp)
    {
        printHelp(argv[0]);
        return 0;
    }
    if (args.showVersion)
    {
        std::cout << "lsid3 " << LSID3_VERSION << "\n";
        return 0;
    }

    IS_SILENT = args.quiet;

    ConfigManager config(args.configFile);

    // ==============================
    // CONFIGURAÇÃO
    // ==============================
    if (args.configMode)
    {
        if (args.configPair.empty())
        {
            config.print();
            return 0;
        }

        size_t delimiterPos = args.configPair.find('=');
        std::string key = args.configPair.substr(0, delimiterPos);
        std::string value = args.configPair.substr(delimiterPos + 1);
        config.setValue(key, value);
        if (!config.save())
            return 1;
        IS_VERBOSE = true;
        log("SUCCESS", "Config atualizada: " + key + "=" + value, config.path());
        return 0;
    }

    RunSettings settings;
    if (!resolveSettings(args, config, settings, error))
    {
        log("ERROR", capitalizeFirstLetter(error));
        return 2;
    }
    IS_VERBOSE = settings.verbose && !args.quiet;

    std::vector<std::string> sortNames;
    for (SortKey key : settings.options.sortBy)
        sortNames.push_back(sortKeyName(key));
    log("DEBUG", "Ordenação:", join(sortNames, ",") + (settings.options.reverse ? " (reversa)" : ""));

    // ==============================
    // LISTAGEM
    // ==============================
    try
    {
        TagLibTagReader reader;
        Lister lister(reader, settings.options);
        std::vector<Info> results = lister.list(args.paths, ".");

        std::string output = renderResults(results, settings.format, settings.options);
        if (settings.format == OutputFormat::Json)
            output += "\n";
        std::cout << output << std::flush;
    }
    catch (const LsError &e)
    {
        log("ERROR", capitalizeFirstLetter(e.what()));
        return 1;
    }
    catch (const std::exception &e)
    {
        log("ERROR", "Erro: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
