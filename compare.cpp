#include "compare.h"

#include <algorithm>

#include "string_utils.h"

namespace
{
    template <typename T>
    int compareScalar(const T &a, const T &b)
    {
        if (a < b)
            return -1;
        if (b < a)
            return 1;
        return 0;
    }

    // Lexicográfico por elemento e depois pelo tamanho da sequência
    int compareFolded(const std::vector<std::string> &a, const std::vector<std::string> &b)
    {
        size_t count = std::min(a.size(), b.size());
        for (size_t i = 0; i < count; ++i)
        {
            int result = foldCase(a[i]).compare(foldCase(b[i]));
            if (result != 0)
                return result < 0 ? -1 : 1;
        }
        return compareScalar(a.size(), b.size());
    }

    int compareWithSortOrder(const std::vector<std::string> &a,
                             const std::optional<std::vector<std::string>> &aSortOrder,
                             const std::vector<std::string> &b,
                             const std::optional<std::vector<std::string>> &bSortOrder)
    {
        int result = compareFolded(aSortOrder ? *aSortOrder : a, bSortOrder ? *bSortOrder : b);
        if (result != 0)
            return result;

        // Mesmo valor efetivo: quem tem nome de ordenação explícito vem antes
        if (aSortOrder.has_value() != bSortOrder.has_value())
            return aSortOrder ? -1 : 1;
        return 0;
    }

    int compareKey(const Entry &a, const Entry &b, SortKey key)
    {
        switch (key)
        {
        case SortKey::FileName:
            return compareScalar(a.name, b.name);
        case SortKey::FileSize:
            return compareScalar(a.size, b.size);
        case SortKey::Title:
            return compareWithSortOrder(a.title, a.titleSortOrder, b.title, b.titleSortOrder);
        case SortKey::Artist:
            return compareWithSortOrder(a.artist, a.artistSortOrder, b.artist, b.artistSortOrder);
        case SortKey::Album:
            return compareWithSortOrder(a.album, a.albumSortOrder, b.album, b.albumSortOrder);
        case SortKey::Year:
            return compareScalar(a.year, b.year);
        case SortKey::Track:
        {
            int result = compareScalar(a.track.number, b.track.number);
            return result != 0 ? result : compareScalar(a.track.total, b.track.total);
        }
        case SortKey::Genre:
            return compareFolded(a.genre, b.genre);
        }
        return 0;
    }
}

int compareEntries(const Entry &a, const Entry &b, const std::vector<SortKey> &keys)
{
    for (SortKey key : keys)
    {
        int result = compareKey(a, b, key);
        if (result != 0)
            return result;
    }
    return 0;
}

void sortEntries(std::vector<Entry> &entries, const std::vector<SortKey> &keys, bool reverse)
{
    std::stable_sort(entries.begin(), entries.end(), [&](const Entry &a, const Entry &b)
                     {
        int result = compareEntries(a, b, keys);
        return reverse ? result > 0 : result < 0; });
}
