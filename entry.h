#ifndef ENTRY_H
#define ENTRY_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tag_reader.h"

// ==============================
// 🎵 ESTRUTURAS DE DADOS
// ==============================

/**
 * @struct Track
 * @brief Número da faixa e total de faixas, ambos opcionais
 *
 * A faixa é considerada vazia quando não há número, mesmo que exista total.
 */
struct Track
{
    std::optional<unsigned> number;
    std::optional<unsigned> total;

    bool empty() const { return !number.has_value(); }

    bool operator==(const Track &other) const
    {
        return number == other.number && total == other.total;
    }
    bool operator!=(const Track &other) const { return !(*this == other); }
};

/**
 * @struct Entry
 * @brief Metadados normalizados de um arquivo de áudio com tag
 *
 * - name: nome do arquivo em bytes crus (pode não ser UTF-8 válido)
 * - title/artist/album/genre: zero ou mais valores, nunca com strings vazias
 * - *SortOrder: usados apenas na ordenação, nunca exibidos
 */
struct Entry
{
    std::string name;
    uint64_t size = 0;

    std::vector<std::string> title;
    std::optional<std::vector<std::string>> titleSortOrder;

    std::vector<std::string> artist;
    std::optional<std::vector<std::string>> artistSortOrder;

    std::vector<std::string> album;
    std::optional<std::vector<std::string>> albumSortOrder;

    std::optional<int> year;
    Track track;

    std::vector<std::string> genre;

    bool operator==(const Entry &other) const;
    bool operator!=(const Entry &other) const { return !(*this == other); }
};

enum class PathType
{
    File,
    Directory
};

/**
 * @struct Info
 * @brief Resultado da listagem de um caminho (argumento ou subdiretório visitado)
 */
struct Info
{
    std::string path; // caminho literal, como foi passado ou percorrido
    PathType pathType = PathType::File;
    std::vector<Entry> entries;
};

// Critérios de ordenação (-sort)
enum class SortKey
{
    FileName,
    FileSize,
    Title,
    Artist,
    Album,
    Year,
    Track,
    Genre
};

/**
 * @brief Converte o nome de um critério ("file-name", "artist"...) em SortKey
 * @return std::nullopt para nomes desconhecidos
 */
std::optional<SortKey> parseSortKey(const std::string &name);

const char *sortKeyName(SortKey key);

/**
 * @brief Monta uma Entry a partir dos dados brutos da tag
 * @param name Nome do arquivo (bytes crus)
 * @param size Tamanho do arquivo em bytes
 * @param data Dados retornados pelo TagReader
 *
 * Strings vazias são descartadas de todos os campos de texto. Os campos de
 * ordenação só ficam presentes se sobrar algum valor. O ano usa o campo
 * numérico explícito e, na falta dele, o ano da data de gravação.
 */
Entry makeEntry(const std::string &name, uint64_t size, const TagData &data);

#endif // ENTRY_H
