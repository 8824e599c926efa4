#ifndef LOGGING_H
#define LOGGING_H

#include <string>

// ==============================
// 🎨 CONSTANTES DE CORES ANSI
// ==============================
extern const std::string RESET;
extern const std::string RED;
extern const std::string GREEN;
extern const std::string YELLOW;
extern const std::string BLUE;
extern const std::string CYAN;
extern const std::string DIM;

// Flags globais de verbosidade
extern bool IS_SILENT;  // -q: somente erros
extern bool IS_VERBOSE; // -v: inclui INFO, SUCCESS e DEBUG

/**
 * @brief Registra uma mensagem no stderr com nível de severidade
 * @param level Nível: "DEBUG", "INFO", "WARNING", "ERROR", "SUCCESS"
 * @param message Mensagem principal
 * @param detail Detalhes opcionais (nome de arquivo, etc)
 *
 * Tudo vai para stderr: o stdout fica reservado para a listagem (tabela ou JSON).
 * - ERROR: sempre exibido, [x] vermelho
 * - WARNING: exceto em modo silencioso, [!] amarelo
 * - INFO / SUCCESS / DEBUG: apenas em modo verboso
 */
void log(const std::string &level, const std::string &message, const std::string &detail = "");

// true se a mensagem de um nível seria exibida com as flags atuais
bool shouldLog(const std::string &level);

#endif // LOGGING_H
