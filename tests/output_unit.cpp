// Testes da saída: tamanhos, nomes exibidos, tabela alinhada, JSON e
// disposição dos resultados com vários caminhos.
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "output.h"

namespace
{

    bool check(bool cond, const std::string &msg)
    {
        if (!cond)
        {
            std::cerr << "[output_unit] FAIL: " << msg << "\n";
        }
        return cond;
    }

    Entry sampleTagged()
    {
        Entry e;
        e.name = "Some.mp3";
        e.size = 8080;
        e.title = {"Two", "titles"};
        e.titleSortOrder = std::vector<std::string>{"hidden"};
        e.artist = {"Three", "cool", "artists"};
        e.album = {"Dual", "Album"};
        e.year = 2020;
        e.track.number = 2;
        e.track.total = 3;
        e.genre = {"Trip-Hop", "Hip-Hop"};
        return e;
    }

    Entry sampleBare(const std::string &name, uint64_t size)
    {
        Entry e;
        e.name = name;
        e.size = size;
        return e;
    }

    Info info(const std::string &path, PathType type, std::vector<Entry> entries)
    {
        Info i;
        i.path = path;
        i.pathType = type;
        i.entries = std::move(entries);
        return i;
    }

    bool test_human_readable_size()
    {
        bool ok = check(humanReadableSize(4) == "4 B", "4 bytes");
        ok &= check(humanReadableSize(0) == "0 B", "0 bytes");
        ok &= check(humanReadableSize(10) == "10 B", "10 bytes has no decimals");
        ok &= check(humanReadableSize(1023) == "1023 B", "1023 bytes");
        ok &= check(humanReadableSize(1024) == "1.0 kiB", "1024 bytes");
        ok &= check(humanReadableSize(8080) == "7.9 kiB", "8080 bytes");
        ok &= check(humanReadableSize(10239) == "10 kiB", "rounding to 10 drops the decimal");
        ok &= check(humanReadableSize(15 * 1024) == "15 kiB", "15 kiB");
        ok &= check(humanReadableSize(1048576) == "1.0 MiB", "1 MiB");
        ok &= check(humanReadableSize(3ull << 30) == "3.0 GiB", "3 GiB");
        ok &= check(humanReadableSize(std::numeric_limits<uint64_t>::max()) == "16 EiB", "max size");
        return ok;
    }

    bool test_display_helpers()
    {
        bool ok = check(displayName("Caf\xC3\xA9.mp3") == "Caf\xC3\xA9.mp3", "valid UTF-8 kept");
        ok &= check(displayName("a\xFF"
                                "b") == "a\xEF\xBF\xBD"
                                        "b",
                    "invalid byte replaced");
        ok &= check(displayName("\xC3") == "\xEF\xBF\xBD", "truncated sequence replaced");
        ok &= check(displayName("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD", "overlong encoding replaced");

        ok &= check(displayValues({"a", "b", "c"}) == "a/b/c", "values joined by /");
        ok &= check(displayValues({}).empty(), "no values");
        ok &= check(displayYear(1999) == "1999", "year");
        ok &= check(displayYear(std::nullopt).empty(), "missing year");

        Track t;
        ok &= check(displayTrack(t).empty(), "empty track");
        t.total = 12;
        ok &= check(displayTrack(t).empty(), "total alone is not displayed");
        t.number = 3;
        ok &= check(displayTrack(t) == "3/12", "number and total");
        t.total.reset();
        ok &= check(displayTrack(t) == "3", "number only");
        return ok;
    }

    bool test_table()
    {
        const std::string expected =
            " NAME       SIZE      TITLE        ARTIST               ALBUM        YEAR   TRACK   GENRE            \n"
            " Some.mp3   7.9 kiB   Two/titles   Three/cool/artists   Dual/Album   2020   2/3     Trip-Hop/Hip-Hop \n"
            " None.mp3   4 B                                                                                      \n";

        std::string table = renderTable({sampleTagged(), sampleBare("None.mp3", 4)});
        bool ok = check(table == expected, "aligned table");
        ok &= check(table.find("hidden") == std::string::npos, "sort order never shown");
        ok &= check(renderTable({}).empty(), "no entries, no table");

        // Largura contada em code points, não em bytes
        std::string utf8 = renderTable({sampleBare("Caf\xC3\xA9.mp3", 4)});
        ok &= check(utf8.compare(0, 16, " NAME       SIZE") == 0, "UTF-8 name width");
        return ok;
    }

    bool test_json()
    {
        const std::string expected =
            "[{\"name\":\"Some.mp3\",\"size\":8080,\"title\":[\"Two\",\"titles\"],"
            "\"artist\":[\"Three\",\"cool\",\"artists\"],\"album\":[\"Dual\",\"Album\"],"
            "\"year\":2020,\"track\":{\"number\":2,\"total\":3},\"genre\":[\"Trip-Hop\",\"Hip-Hop\"]},"
            "{\"name\":\"None.mp3\",\"size\":4}]";
        bool ok = check(entriesToJson({sampleTagged(), sampleBare("None.mp3", 4)}) == expected,
                        "JSON omits empty fields");

        Entry single = sampleBare("one.mp3", 1);
        single.artist = {"Someone"};
        single.track.number = 7;
        ok &= check(entriesToJson({single}) ==
                        "[{\"name\":\"one.mp3\",\"size\":1,\"artist\":\"Someone\",\"track\":{\"number\":7}}]",
                    "single value is a string and track total is optional");

        Entry totalOnly = sampleBare("t.mp3", 1);
        totalOnly.track.total = 5;
        ok &= check(entriesToJson({totalOnly}) == "[{\"name\":\"t.mp3\",\"size\":1}]",
                    "track without number omitted");

        ok &= check(entriesToJson({}) == "[]", "empty array");
        ok &= check(escapeJsonString("a\"b\\c\n\x01") == "a\\\"b\\\\c\\n\\u0001", "escaping");
        return ok;
    }

    bool test_output_format_names()
    {
        bool ok = check(parseOutputFormat("table") == OutputFormat::Table, "table");
        ok &= check(parseOutputFormat(" JSON ") == OutputFormat::Json, "json, case-folded");
        ok &= check(!parseOutputFormat("xml").has_value(), "unknown format");
        return ok;
    }

    bool test_render_results()
    {
        ListOptions options;
        std::vector<Info> results = {
            info("x/z.mp3", PathType::File, {sampleBare("z.mp3", 1)}),
            info("d", PathType::Directory, {sampleBare("m.mp3", 3)}),
            info("a.mp3", PathType::File, {sampleBare("a.mp3", 2)}),
        };

        bool ok = check(renderResults(results, OutputFormat::Json, options) ==
                            "[[{\"name\":\"a.mp3\",\"size\":2},{\"name\":\"z.mp3\",\"size\":1}],"
                            "{\"path\":\"d\",\"values\":[{\"name\":\"m.mp3\",\"size\":3}]}]",
                        "named files merged first, then directories");

        std::string table = renderResults(results, OutputFormat::Table, options);
        size_t a = table.find(" a.mp3");
        size_t z = table.find(" z.mp3");
        size_t d = table.find("\nd:\n NAME");
        ok &= check(table.compare(0, 5, " NAME") == 0, "merged file table comes first");
        ok &= check(a < z && z < d && d != std::string::npos, "files re-sorted before the directory block");

        options.reverse = true;
        std::string reversed = renderResults(results, OutputFormat::Table, options);
        ok &= check(reversed.find(" z.mp3") < reversed.find(" a.mp3"), "merged files honor reverse");

        std::vector<Info> single = {info("d", PathType::Directory, {sampleBare("m.mp3", 3)})};
        ok &= check(renderResults(single, OutputFormat::Json, options) == "[{\"name\":\"m.mp3\",\"size\":3}]",
                    "single path prints only its entries");
        ok &= check(renderResults(single, OutputFormat::Table, options).compare(0, 5, " NAME") == 0,
                    "single directory has no header line");

        std::vector<Info> dirs = {info("d", PathType::Directory, {}),
                                  info("d/s", PathType::Directory, {sampleBare("m.mp3", 3)})};
        std::string nested = renderResults(dirs, OutputFormat::Table, ListOptions());
        ok &= check(nested.compare(0, 8, "d:\n\nd/s:") == 0, "empty directory block is just its header");
        ok &= check(renderResults(dirs, OutputFormat::Json, ListOptions()) ==
                        "[{\"path\":\"d\",\"values\":[]},{\"path\":\"d/s\",\"values\":[{\"name\":\"m.mp3\",\"size\":3}]}]",
                    "one JSON object per directory");

        std::vector<Info> empty = {info("d", PathType::Directory, {})};
        ok &= check(renderResults(empty, OutputFormat::Table, ListOptions()).empty(), "empty directory prints nothing");
        ok &= check(renderResults(empty, OutputFormat::Json, ListOptions()) == "[]", "empty directory JSON");
        return ok;
    }

} // namespace

int main()
{
    bool ok = true;
    ok &= test_human_readable_size();
    ok &= test_display_helpers();
    ok &= test_table();
    ok &= test_json();
    ok &= test_output_format_names();
    ok &= test_render_results();
    return ok ? 0 : 1;
}
