#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Converte uma string para minúsculas (apenas ASCII, byte a byte)
 */
std::string toLower(const std::string &str);

/**
 * @brief Case folding Unicode de uma string UTF-8 (Boost.Locale)
 *
 * Usado nas comparações de tags, onde "Élan" e "élan" são equivalentes.
 * Se a entrada não for UTF-8 válido, cai para toLower.
 */
std::string foldCase(const std::string &str);

/**
 * @brief Remove espaços, tabs e quebras de linha das pontas
 */
std::string trim(const std::string &str);

// Divide "a,b,c" em {"a","b","c"}; partes vazias são descartadas
std::vector<std::string> split(const std::string &str, char delimiter);

std::string join(const std::vector<std::string> &parts, const std::string &separator);

/**
 * @brief Lê um inteiro sem sinal que ocupa a string inteira (após trim)
 * @return std::nullopt se houver qualquer caractere que não seja dígito ou estouro
 */
std::optional<unsigned> parseUnsigned(const std::string &str);

/**
 * @brief Lê o inteiro (com sinal opcional) no início da string
 *
 * Usado para extrair o ano de datas como "2002-05-01" ou "2002".
 */
std::optional<int> parseLeadingInt(const std::string &str);

#endif // STRING_UTILS_H
