#include "taglib_tag_reader.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <taglib/id3v1genres.h>             // Tabela de gêneros ID3v1
#include <taglib/id3v2frame.h>              // Frame genérico ID3v2
#include <taglib/id3v2tag.h>                // Tags ID3v2 (MP3)
#include <taglib/mpegfile.h>                // Arquivos MPEG (MP3)
#include <taglib/textidentificationframe.h> // Frames de texto ID3v2
#include <taglib/tstring.h>
#include <taglib/tstringlist.h>

#include "logging.h"
#include "string_utils.h"

namespace
{
    const char *RECORDING_DATE_FRAME = "TDRC";
    const char *TRACK_FRAME = "TRCK";

    /**
     * @brief Todos os valores de texto de um frame (um frame pode ter vários)
     *
     * Frames que não são de texto contribuem com toString().
     */
    std::vector<std::string> frameValues(const TagLib::ID3v2::Tag *tag, const std::string &id)
    {
        std::vector<std::string> values;
        const TagLib::ID3v2::FrameList &frames = tag->frameList(TagLib::ByteVector(id.c_str(), static_cast<unsigned int>(id.size())));
        for (TagLib::ID3v2::Frame *frame : frames)
        {
            if (auto *text = dynamic_cast<TagLib::ID3v2::TextIdentificationFrame *>(frame))
            {
                const TagLib::StringList fields = text->fieldList();
                for (const TagLib::String &field : fields)
                {
                    values.push_back(field.to8Bit(true));
                }
            }
            else
            {
                values.push_back(frame->toString().to8Bit(true));
            }
        }
        return values;
    }

    std::optional<std::string> firstValue(const TagLib::ID3v2::Tag *tag, const std::string &id)
    {
        std::vector<std::string> values = frameValues(tag, id);
        for (const auto &value : values)
        {
            if (!trim(value).empty())
                return value;
        }
        return std::nullopt;
    }

    // "13" ou "(13)" -> "Pop"; outros valores ficam como estão
    std::string resolveGenre(const std::string &value)
    {
        std::string text = trim(value);
        if (text.size() > 2 && text.front() == '(' && text.back() == ')')
            text = text.substr(1, text.size() - 2);

        std::optional<unsigned> index = parseUnsigned(text);
        if (!index || *index > 255)
            return value;

        TagLib::String name = TagLib::ID3v1::genre(static_cast<int>(*index));
        if (name.isEmpty())
            return value;
        return name.to8Bit(true);
    }
}

TagLibTagReader::TagLibTagReader()
    : frameIds{
          {TagField::Title, "TIT2"},
          {TagField::TitleSortOrder, "TSOT"},
          {TagField::Artist, "TPE1"},
          {TagField::ArtistSortOrder, "TSOP"},
          {TagField::Album, "TALB"},
          {TagField::AlbumSortOrder, "TSOA"},
          {TagField::Genre, "TCON"},
      }
{
    // Todo campo precisa de um frame de texto ID3v2 válido ("T" + 3 caracteres A-Z/0-9)
    for (const auto &pair : frameIds)
    {
        const std::string &id = pair.second;
        bool valid = id.size() == 4 && id[0] == 'T' &&
                     std::all_of(id.begin(), id.end(), [](unsigned char c)
                                 { return std::isupper(c) || std::isdigit(c); });
        if (!valid)
        {
            throw std::logic_error("frame ID3v2 inválido na tabela de campos: " + id);
        }
    }
    if (frameIds.size() != static_cast<size_t>(TagField::Genre) + 1)
    {
        throw std::logic_error("tabela de campos ID3v2 incompleta");
    }
}

const std::string &TagLibTagReader::frameId(TagField field) const
{
    return frameIds.at(field);
}

TagReadResult TagLibTagReader::read(const std::string &path) const
{
    TagReadResult result;

    // Propriedades de áudio não são necessárias para listar as tags
    TagLib::MPEG::File file(path.c_str(), false);
    if (!file.isOpen())
    {
        result.status = TagReadStatus::ReadFault;
        result.errorMessage = "não foi possível abrir o arquivo";
        return result;
    }
    if (!file.isValid() || !file.hasID3v2Tag())
    {
        result.status = TagReadStatus::NotAudioFormat;
        result.errorMessage = "nenhuma tag ID3v2 encontrada";
        return result;
    }

    const TagLib::ID3v2::Tag *tag = file.ID3v2Tag();
    if (!tag)
    {
        result.status = TagReadStatus::NotAudioFormat;
        result.errorMessage = "nenhuma tag ID3v2 encontrada";
        return result;
    }

    TagData &data = result.data;
    for (const auto &pair : frameIds)
    {
        std::vector<std::string> values = frameValues(tag, pair.second);
        if (pair.first == TagField::Genre)
        {
            std::transform(values.begin(), values.end(), values.begin(), resolveGenre);
        }
        data.values[pair.first] = std::move(values);
    }

    // O TagLib converte o TYER de tags v2.3 em TDRC na leitura; o ano sai da data
    data.recordingDate = firstValue(tag, RECORDING_DATE_FRAME);

    // TRCK: "3" ou "3/12"
    if (auto track = firstValue(tag, TRACK_FRAME))
    {
        size_t slash = track->find('/');
        data.trackNumber = parseUnsigned(track->substr(0, slash));
        if (slash != std::string::npos)
            data.trackTotal = parseUnsigned(track->substr(slash + 1));
    }

    log("DEBUG", "Tag ID3v2 lida", path);

    result.status = TagReadStatus::Ok;
    return result;
}
