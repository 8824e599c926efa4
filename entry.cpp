#include "entry.h"

#include <algorithm>
#include <iterator>
#include <map>

#include "string_utils.h"

namespace
{
    const std::map<std::string, SortKey> SORT_KEYS = {
        {"file-name", SortKey::FileName},
        {"file-size", SortKey::FileSize},
        {"title", SortKey::Title},
        {"artist", SortKey::Artist},
        {"album", SortKey::Album},
        {"year", SortKey::Year},
        {"track", SortKey::Track},
        {"genre", SortKey::Genre},
    };

    std::vector<std::string> nonEmptyValues(const TagData &data, TagField field)
    {
        std::vector<std::string> values;
        auto it = data.values.find(field);
        if (it == data.values.end())
            return values;

        std::copy_if(it->second.begin(), it->second.end(), std::back_inserter(values),
                     [](const std::string &v)
                     { return !v.empty(); });
        return values;
    }

    std::optional<std::vector<std::string>> sortOrderValues(const TagData &data, TagField field)
    {
        std::vector<std::string> values = nonEmptyValues(data, field);
        if (values.empty())
            return std::nullopt;
        return values;
    }
}

bool Entry::operator==(const Entry &other) const
{
    return name == other.name && size == other.size &&
           title == other.title && titleSortOrder == other.titleSortOrder &&
           artist == other.artist && artistSortOrder == other.artistSortOrder &&
           album == other.album && albumSortOrder == other.albumSortOrder &&
           year == other.year && track == other.track && genre == other.genre;
}

std::optional<SortKey> parseSortKey(const std::string &name)
{
    auto it = SORT_KEYS.find(toLower(trim(name)));
    if (it == SORT_KEYS.end())
        return std::nullopt;
    return it->second;
}

const char *sortKeyName(SortKey key)
{
    switch (key)
    {
    case SortKey::FileName:
        return "file-name";
    case SortKey::FileSize:
        return "file-size";
    case SortKey::Title:
        return "title";
    case SortKey::Artist:
        return "artist";
    case SortKey::Album:
        return "album";
    case SortKey::Year:
        return "year";
    case SortKey::Track:
        return "track";
    case SortKey::Genre:
        return "genre";
    }
    return "file-name";
}

Entry makeEntry(const std::string &name, uint64_t size, const TagData &data)
{
    Entry entry;
    entry.name = name;
    entry.size = size;

    entry.title = nonEmptyValues(data, TagField::Title);
    entry.titleSortOrder = sortOrderValues(data, TagField::TitleSortOrder);
    entry.artist = nonEmptyValues(data, TagField::Artist);
    entry.artistSortOrder = sortOrderValues(data, TagField::ArtistSortOrder);
    entry.album = nonEmptyValues(data, TagField::Album);
    entry.albumSortOrder = sortOrderValues(data, TagField::AlbumSortOrder);
    entry.genre = nonEmptyValues(data, TagField::Genre);

    // Ano explícito tem prioridade sobre a data de gravação
    if (data.year)
        entry.year = data.year;
    else if (data.recordingDate)
        entry.year = parseLeadingInt(*data.recordingDate);

    entry.track.number = data.trackNumber;
    entry.track.total = data.trackTotal;

    return entry;
}
