#ifndef OUTPUT_H
#define OUTPUT_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "entry.h"
#include "lister.h"

enum class OutputFormat
{
    Table,
    Json
};

std::optional<OutputFormat> parseOutputFormat(const std::string &name);

// ==============================
// 📊 FORMATAÇÃO DE CAMPOS
// ==============================

/**
 * @brief Converte um tamanho em bytes para formato legível (base 1024)
 *
 * Abaixo de 10 bytes: "4 B". Acima disso uma casa decimal quando o valor
 * fica abaixo de 10 ("7.9 kiB") e nenhuma caso contrário ("12 MiB").
 */
std::string humanReadableSize(uint64_t size);

/**
 * @brief Nome exibível: bytes que não formam UTF-8 válido viram U+FFFD
 */
std::string displayName(const std::string &raw);

std::string displayValues(const std::vector<std::string> &values); // "a/b/c"
std::string displayYear(const std::optional<int> &year);
std::string displayTrack(const Track &track); // "3" ou "3/12"; vazio sem número

// ==============================
// 📋 TABELA
// ==============================

/**
 * @brief Monta a tabela alinhada (NAME SIZE TITLE ARTIST ALBUM YEAR TRACK GENRE)
 * @return Texto com uma linha de cabeçalho e uma por entrada; vazio se não houver entradas
 */
std::string renderTable(const std::vector<Entry> &entries);

// ==============================
// 💾 JSON
// ==============================

/**
 * @brief Escapa caracteres especiais em uma string para formato JSON
 */
std::string escapeJsonString(const std::string &s);

/**
 * @brief Serializa as entradas como um array JSON
 *
 * Campos vazios ou ausentes são omitidos (exceto size). Campos com um único
 * valor viram string; com vários, array. Nomes de ordenação nunca aparecem.
 */
std::string entriesToJson(const std::vector<Entry> &entries);

/**
 * @brief Formata o resultado completo de uma listagem
 *
 * Com um único Info, apenas suas entradas. Com vários, os arquivos nomeados
 * são juntados numa única listagem (reordenada pelos critérios) que vem
 * primeiro, seguida de um bloco por diretório ("caminho:" + tabela, ou
 * {"path", "values"} em JSON).
 */
std::string renderResults(const std::vector<Info> &results, OutputFormat format, const ListOptions &options);

#endif // OUTPUT_H
