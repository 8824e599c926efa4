// Testes da normalização das tags (makeEntry), dos nomes de critérios de
// ordenação e das funções de string usadas por eles.
#include <iostream>
#include <string>
#include <vector>

#include "entry.h"
#include "string_utils.h"

namespace
{

    bool check(bool cond, const std::string &msg)
    {
        if (!cond)
        {
            std::cerr << "[entry_unit] FAIL: " << msg << "\n";
        }
        return cond;
    }

    bool test_empty_strings_dropped()
    {
        TagData data;
        data.values[TagField::Title] = {"", "Two", "", "titles"};
        data.values[TagField::Artist] = {""};
        data.values[TagField::Genre] = {"Trip-Hop", ""};

        Entry e = makeEntry("x.mp3", 123, data);
        bool ok = check(e.name == "x.mp3" && e.size == 123, "name and size copied");
        ok &= check(e.title == std::vector<std::string>{"Two", "titles"}, "empty title values dropped");
        ok &= check(e.artist.empty(), "artist with only empty values is empty");
        ok &= check(e.album.empty(), "missing album is empty");
        ok &= check(e.genre == std::vector<std::string>{"Trip-Hop"}, "empty genre value dropped");
        return ok;
    }

    bool test_sort_order_presence()
    {
        TagData data;
        data.values[TagField::TitleSortOrder] = {"", ""};
        data.values[TagField::ArtistSortOrder] = {"Beatles, The"};

        Entry e = makeEntry("x.mp3", 0, data);
        bool ok = check(!e.titleSortOrder.has_value(), "sort order with only empty values is absent");
        ok &= check(e.artistSortOrder && *e.artistSortOrder == std::vector<std::string>{"Beatles, The"},
                    "artist sort order kept");
        ok &= check(!e.albumSortOrder.has_value(), "missing album sort order is absent");
        return ok;
    }

    bool test_year_sources()
    {
        TagData data;
        data.recordingDate = "2002-05-01";
        bool ok = check(makeEntry("x", 0, data).year == 2002, "year from recording date");

        data.year = 1999;
        ok &= check(makeEntry("x", 0, data).year == 1999, "explicit year wins over recording date");

        TagData garbage;
        garbage.recordingDate = "unknown";
        ok &= check(!makeEntry("x", 0, garbage).year.has_value(), "unparsable date gives no year");

        TagData none;
        ok &= check(!makeEntry("x", 0, none).year.has_value(), "no year without a source");
        return ok;
    }

    bool test_track()
    {
        TagData data;
        data.trackNumber = 3;
        data.trackTotal = 12;
        Entry e = makeEntry("x", 0, data);
        bool ok = check(e.track.number == 3u && e.track.total == 12u, "track number and total");
        ok &= check(!e.track.empty(), "track with number is not empty");

        TagData totalOnly;
        totalOnly.trackTotal = 12;
        Entry t = makeEntry("x", 0, totalOnly);
        ok &= check(t.track.empty(), "total without number counts as empty");
        ok &= check(t.track.total == 12u, "total kept even without number");
        return ok;
    }

    bool test_sort_key_names()
    {
        bool ok = check(parseSortKey("file-name") == SortKey::FileName, "file-name");
        ok &= check(parseSortKey("file-size") == SortKey::FileSize, "file-size");
        ok &= check(parseSortKey(" Artist ") == SortKey::Artist, "trimmed and case-folded");
        ok &= check(parseSortKey("TRACK") == SortKey::Track, "upper case accepted");
        ok &= check(!parseSortKey("bitrate").has_value(), "unknown key rejected");
        ok &= check(!parseSortKey("").has_value(), "empty key rejected");

        for (SortKey key : {SortKey::FileName, SortKey::FileSize, SortKey::Title, SortKey::Artist,
                            SortKey::Album, SortKey::Year, SortKey::Track, SortKey::Genre})
        {
            ok &= check(parseSortKey(sortKeyName(key)) == key, std::string("name round trip: ") + sortKeyName(key));
        }
        return ok;
    }

    bool test_string_helpers()
    {
        bool ok = check(split(" album , track,,", ',') == std::vector<std::string>{"album", "track"},
                        "split trims and drops empty parts");
        ok &= check(trim(" \t x \n") == "x", "trim");
        ok &= check(trim("   ").empty(), "trim of blanks");
        ok &= check(toLower("ÀBc") == "Àbc", "toLower only folds ASCII");
        ok &= check(parseUnsigned("12") == 12u, "parseUnsigned");
        ok &= check(!parseUnsigned("1a").has_value(), "parseUnsigned rejects trailing text");
        ok &= check(!parseUnsigned("-1").has_value(), "parseUnsigned rejects sign");
        ok &= check(!parseUnsigned("99999999999999999999").has_value(), "parseUnsigned rejects overflow");
        ok &= check(parseLeadingInt("2002-05-01") == 2002, "parseLeadingInt stops at '-'");
        ok &= check(!parseLeadingInt("abc").has_value(), "parseLeadingInt needs digits");
        ok &= check(join({"a", "b"}, "/") == "a/b", "join");
        return ok;
    }

} // namespace

int main()
{
    bool ok = true;
    ok &= test_empty_strings_dropped();
    ok &= test_sort_order_presence();
    ok &= test_year_sources();
    ok &= test_track();
    ok &= test_sort_key_names();
    ok &= test_string_helpers();
    return ok ? 0 : 1;
}
