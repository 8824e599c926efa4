#include "program_args.h"

#include "entry.h"
#include "string_utils.h"

bool parseProgramArgs(const std::vector<std::string> &argv, ProgramArgs &args, std::string &error)
{
    bool onlyPaths = false;
    for (size_t i = 0; i < argv.size(); ++i)
    {
        const std::string &arg = argv[i];
        bool hasValue = i + 1 < argv.size();

        if (onlyPaths || arg.empty() || arg[0] != '-' || arg == "-")
            args.paths.push_back(arg); // Argumentos sem '-' são caminhos
        else if (arg == "--")
            onlyPaths = true;
        else if (arg == "-h" || arg == "--help")
            args.showHelp = true;
        else if (arg == "--version")
            args.showVersion = true;
        else if (arg == "-R" || arg == "--recursive")
            args.recursive = true;
        else if (arg == "-r" || arg == "--reverse")
            args.reverse = true;
        else if (arg == "-v" || arg == "--verbose")
            args.verbose = true;
        else if (arg == "-q" || arg == "--quiet")
            args.quiet = true;
        else if (arg == "-s" || arg == "--sort" || arg == "-sort")
        {
            if (!hasValue)
            {
                error = "a opção " + arg + " exige um valor";
                return false;
            }
            // Aceita "-s album -s title" e também "-s album,title"
            std::vector<std::string> keys = split(argv[++i], ',');
            args.sortBy.insert(args.sortBy.end(), keys.begin(), keys.end());
        }
        else if (arg == "-f" || arg == "--format")
        {
            if (!hasValue)
            {
                error = "a opção " + arg + " exige um valor";
                return false;
            }
            args.format = argv[++i];
        }
        else if (arg == "--config-file")
        {
            if (!hasValue)
            {
                error = "a opção " + arg + " exige um valor";
                return false;
            }
            args.configFile = argv[++i];
        }
        else if (arg == "-config")
        {
            args.configMode = true;
            if (hasValue && argv[i + 1].find('=') != std::string::npos)
                args.configPair = argv[++i];
        }
        else
        {
            error = "opção desconhecida: " + arg;
            return false;
        }
    }
    return true;
}

bool resolveSettings(const ProgramArgs &args, ConfigManager &config, RunSettings &settings, std::string &error)
{
    std::vector<std::string> sortWords = args.sortBy;
    if (sortWords.empty())
        sortWords = config.getList("sort", {"file-name"});

    settings.options.sortBy.clear();
    for (const auto &word : sortWords)
    {
        std::optional<SortKey> key = parseSortKey(word);
        if (!key)
        {
            error = "critério de ordenação desconhecido: " + word +
                    " (use file-name, file-size, title, artist, album, year, track, genre)";
            return false;
        }
        settings.options.sortBy.push_back(*key);
    }
    if (settings.options.sortBy.empty())
        settings.options.sortBy.push_back(SortKey::FileName);

    std::string formatWord = args.format ? *args.format : config.getString("format", "table");
    std::optional<OutputFormat> format = parseOutputFormat(formatWord);
    if (!format)
    {
        error = "formato desconhecido: " + formatWord + " (use table ou json)";
        return false;
    }
    settings.format = *format;

    settings.options.reverse = args.reverse ? *args.reverse : config.getBool("reverse", false);
    settings.options.recursive = args.recursive ? *args.recursive : config.getBool("recursive", false);
    settings.verbose = args.verbose ? *args.verbose : config.getBool("verbose", false);
    return true;
}
