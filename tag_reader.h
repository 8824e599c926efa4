#ifndef TAG_READER_H
#define TAG_READER_H

#include <map>
#include <optional>
#include <string>
#include <vector>

// Campos de texto que o leitor sabe extrair de uma tag
enum class TagField
{
    Title,
    TitleSortOrder,
    Artist,
    ArtistSortOrder,
    Album,
    AlbumSortOrder,
    Genre
};

/**
 * @struct TagData
 * @brief Dados brutos de uma tag, antes da normalização em Entry
 *
 * Os valores de texto ficam como vieram da tag (inclusive strings vazias).
 * Campos numéricos ausentes ficam como std::nullopt, nunca como zero.
 */
struct TagData
{
    std::map<TagField, std::vector<std::string>> values;

    std::optional<int> year;                  // ano numérico explícito, quando o leitor o tem
    std::optional<std::string> recordingDate; // data completa de gravação (ex: TDRC "2002-05-01")

    std::optional<unsigned> trackNumber;
    std::optional<unsigned> trackTotal;
};

enum class TagReadStatus
{
    Ok,
    NotAudioFormat, // não é um arquivo com tag deste formato
    ReadFault       // falha de E/S ao abrir/ler o arquivo
};

struct TagReadResult
{
    TagReadStatus status = TagReadStatus::ReadFault;
    TagData data;
    std::string errorMessage;
};

/**
 * @class TagReader
 * @brief Interface do extrator de tags usada pelo Lister
 *
 * Implementações não lançam exceções para arquivos ruins: o resultado
 * informa se o arquivo foi lido, se não tem tag ou se houve falha de E/S.
 */
class TagReader
{
public:
    virtual ~TagReader() = default;

    virtual TagReadResult read(const std::string &path) const = 0;
};

#endif // TAG_READER_H
