#include "lister.h"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include "compare.h"
#include "logging.h"
#include "ls_error.h"

namespace fs = std::filesystem;

namespace
{
    uint64_t fileSize(const std::string &path)
    {
        std::error_code ec;
        uintmax_t size = fs::file_size(path, ec);
        if (ec)
        {
            throw ReadError(path, ec.message());
        }
        return static_cast<uint64_t>(size);
    }
}

Lister::Lister(const TagReader &reader, ListOptions options)
    : reader(reader), listOptions(std::move(options))
{
}

std::vector<Info> Lister::list(const std::vector<std::string> &paths, const std::string &defaultPath) const
{
    std::vector<Info> results;
    if (paths.empty())
    {
        listPath(defaultPath, results);
        return results;
    }

    for (const auto &path : paths)
    {
        listPath(path, results);
    }
    return results;
}

/**
 * @brief Resolve um caminho do usuário e lista como arquivo ou diretório
 *
 * Links simbólicos são seguidos: um link para arquivo conta como arquivo e
 * um link para diretório conta como diretório.
 */
void Lister::listPath(const std::string &path, std::vector<Info> &results) const
{
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);

    if (fs::is_regular_file(status))
    {
        results.push_back(listFile(path));
    }
    else if (fs::is_directory(status))
    {
        std::set<fs::path> visited;
        listDirectory(path, results, visited);
    }
    else
    {
        throw InvalidPathError(path);
    }
}

// Arquivo nomeado explicitamente: qualquer falha na leitura da tag é erro
Info Lister::listFile(const std::string &path) const
{
    Info info;
    info.path = path;
    info.pathType = PathType::File;

    uint64_t size = fileSize(path);
    TagReadResult tag = reader.read(path);
    switch (tag.status)
    {
    case TagReadStatus::Ok:
        info.entries.push_back(makeEntry(fs::path(path).filename().native(), size, tag.data));
        break;
    case TagReadStatus::NotAudioFormat:
        throw TagReadError(path, tag.errorMessage);
    case TagReadStatus::ReadFault:
        throw ReadError(path, tag.errorMessage);
    }
    return info;
}

/**
 * @brief Lista um diretório (apenas o primeiro nível) e, se recursivo, seus subdiretórios
 *
 * Os filhos são separados em arquivos e subdiretórios numa única passada.
 * Ambos são ordenados pelo nome em bytes antes de qualquer leitura, para que
 * a ordem de visita não dependa do sistema de arquivos nem do -sort.
 * O Info do diretório é emitido antes dos Info dos subdiretórios (profundidade primeiro).
 *
 * visited guarda os caminhos canônicos já listados neste percurso: um diretório
 * alcançado de novo (ex: link para um ancestral) é ignorado.
 */
void Lister::listDirectory(const std::string &path, std::vector<Info> &results,
                           std::set<fs::path> &visited) const
{
    std::error_code canonicalEc;
    fs::path canonical = fs::canonical(path, canonicalEc);
    if (canonicalEc)
    {
        throw ReadError(path, canonicalEc.message());
    }
    if (!visited.insert(canonical).second)
    {
        log("WARNING", "Diretório já visitado (ciclo de links), ignorado:", path);
        return;
    }

    log("INFO", "Listando diretório", path);

    std::vector<std::string> files;
    std::vector<std::string> subdirs;

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec)
    {
        throw ReadError(path, ec.message());
    }

    const fs::directory_iterator end;
    while (it != end)
    {
        const fs::directory_entry &child = *it;
        std::string name = child.path().filename().native();

        if (name != "." && name != "..")
        {
            std::error_code statEc;
            fs::file_status status = child.status(statEc);
            // Link quebrado: não é arquivo nem diretório, apenas ignora
            if (statEc && status.type() != fs::file_type::not_found)
            {
                throw ReadError(child.path().string(), statEc.message());
            }

            if (fs::is_regular_file(status))
                files.push_back(std::move(name));
            else if (fs::is_directory(status) && listOptions.recursive)
                subdirs.push_back(std::move(name));
        }

        it.increment(ec);
        if (ec)
        {
            throw ReadError(path, ec.message());
        }
    }

    std::sort(files.begin(), files.end());
    std::sort(subdirs.begin(), subdirs.end());

    Info info;
    info.path = path;
    info.pathType = PathType::Directory;

    for (const auto &name : files)
    {
        const std::string filePath = (fs::path(path) / name).string();
        uint64_t size = fileSize(filePath);

        TagReadResult tag = reader.read(filePath);
        if (tag.status == TagReadStatus::NotAudioFormat)
        {
            log("DEBUG", "Ignorado (sem tag):", filePath);
            continue;
        }
        if (tag.status == TagReadStatus::ReadFault)
        {
            throw ReadError(filePath, tag.errorMessage);
        }

        info.entries.push_back(makeEntry(name, size, tag.data));
    }

    sortEntries(info.entries, listOptions.sortBy, listOptions.reverse);
    results.push_back(std::move(info));

    for (const auto &name : subdirs)
    {
        listDirectory((fs::path(path) / name).string(), results, visited);
    }
}
