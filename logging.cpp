#include "logging.h"

#include <cstdio>
#include <iostream>
#include <unistd.h>

const std::string RESET = "\033[0m";   // Reset todas as formatações
const std::string RED = "\033[91m";    // Vermelho (erros)
const std::string GREEN = "\033[92m";  // Verde (sucesso)
const std::string YELLOW = "\033[93m"; // Amarelo (avisos)
const std::string BLUE = "\033[94m";   // Azul (informações)
const std::string CYAN = "\033[96m";   // Ciano (debug)
const std::string DIM = "\033[2m";     // Texto esmaecido

bool IS_SILENT = false;
bool IS_VERBOSE = false;

namespace
{
    // Cores só quando o stderr é um terminal
    bool useColor()
    {
        static const bool tty = isatty(fileno(stderr)) != 0;
        return tty;
    }

    std::string paint(const std::string &color, const std::string &text)
    {
        return useColor() ? color + text + RESET : text;
    }
}

bool shouldLog(const std::string &level)
{
    if (level == "ERROR")
        return true;
    if (IS_SILENT)
        return false;
    if (level == "WARNING")
        return true;
    return IS_VERBOSE;
}

void log(const std::string &level, const std::string &message, const std::string &detail)
{
    if (!shouldLog(level))
        return;

    // Ícones coloridos por nível
    if (level == "INFO")
        std::cerr << paint(BLUE, "[i] ");
    else if (level == "WARNING")
        std::cerr << paint(YELLOW, "[!] ");
    else if (level == "ERROR")
        std::cerr << paint(RED, "[x] ");
    else if (level == "SUCCESS")
        std::cerr << paint(GREEN, "[✓] ");
    else if (level == "DEBUG")
        std::cerr << paint(CYAN, "[d] ");

    std::cerr << message;

    if (!detail.empty())
    {
        std::cerr << " " << paint(DIM, detail);
    }

    std::cerr << std::endl;
}
