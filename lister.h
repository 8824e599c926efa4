#ifndef LISTER_H
#define LISTER_H

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "entry.h"
#include "tag_reader.h"

/**
 * @struct ListOptions
 * @brief Opções de uma listagem: critérios de ordenação, ordem reversa e recursão
 */
struct ListOptions
{
    std::vector<SortKey> sortBy = {SortKey::FileName};
    bool reverse = false;   // -r: inverte a ordem
    bool recursive = false; // -R: entra em subdiretórios
};

/**
 * @class Lister
 * @brief Percorre arquivos e diretórios e monta os resultados (Info) de cada caminho
 *
 * Uso:
 *   TagLibTagReader reader;
 *   Lister lister(reader, options);
 *   std::vector<Info> results = lister.list(paths, ".");
 *
 * A listagem é atômica: ou retorna todos os resultados, ou lança o primeiro
 * LsError encontrado (nenhum resultado parcial é devolvido).
 */
class Lister
{
public:
    Lister(const TagReader &reader, ListOptions options);

    /**
     * @brief Lista os caminhos na ordem em que foram passados
     * @param paths Arquivos e/ou diretórios; vazio significa defaultPath
     * @param defaultPath Caminho usado quando paths está vazio (ex: ".")
     * @return Um Info por caminho, mais um por subdiretório visitado no modo recursivo
     * @throws InvalidPathError, ReadError, TagReadError
     */
    std::vector<Info> list(const std::vector<std::string> &paths, const std::string &defaultPath) const;

private:
    void listPath(const std::string &path, std::vector<Info> &results) const;
    Info listFile(const std::string &path) const;
    void listDirectory(const std::string &path, std::vector<Info> &results,
                       std::set<std::filesystem::path> &visited) const;

    const TagReader &reader;
    ListOptions listOptions;
};

#endif // LISTER_H
