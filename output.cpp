#include "output.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "compare.h"
#include "string_utils.h"

namespace
{
    const char *SIZE_SUFFIXES[] = {"B", "kiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    const int MAX_SIZE_EXPONENT = 6;

    const char *REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

    // Quantidade de bytes da sequência UTF-8 iniciada por c (0 se c não inicia sequência)
    size_t sequenceLength(unsigned char c)
    {
        if (c < 0x80)
            return 1;
        if ((c >> 5) == 0x6)
            return 2;
        if ((c >> 4) == 0xE)
            return 3;
        if ((c >> 3) == 0x1E)
            return 4;
        return 0;
    }

    bool validSequence(const std::string &s, size_t pos, size_t len)
    {
        if (len == 0 || pos + len > s.size())
            return false;

        uint32_t cp = static_cast<unsigned char>(s[pos]);
        if (len == 1)
            return true;

        cp &= (0xFF >> (len + 1));
        for (size_t k = 1; k < len; ++k)
        {
            unsigned char c = static_cast<unsigned char>(s[pos + k]);
            if ((c & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (c & 0x3F);
        }

        // Rejeita formas longas demais, surrogates e valores fora do Unicode
        if (len == 2)
            return cp >= 0x80;
        if (len == 3)
            return cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF);
        return cp >= 0x10000 && cp <= 0x10FFFF;
    }

    // Largura em colunas: um por code point
    size_t displayWidth(const std::string &s)
    {
        return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](unsigned char c)
                                                 { return (c & 0xC0) != 0x80; }));
    }

    std::string jsonValues(const std::vector<std::string> &values)
    {
        if (values.size() == 1)
            return "\"" + escapeJsonString(values[0]) + "\"";

        std::string out = "[";
        for (size_t i = 0; i < values.size(); ++i)
        {
            if (i > 0)
                out += ",";
            out += "\"" + escapeJsonString(values[i]) + "\"";
        }
        return out + "]";
    }

    std::string entryToJson(const Entry &e)
    {
        std::ostringstream f;
        f << "{";
        f << "\"name\":\"" << escapeJsonString(displayName(e.name)) << "\",";
        f << "\"size\":" << e.size;
        if (!e.title.empty())
            f << ",\"title\":" << jsonValues(e.title);
        if (!e.artist.empty())
            f << ",\"artist\":" << jsonValues(e.artist);
        if (!e.album.empty())
            f << ",\"album\":" << jsonValues(e.album);
        if (e.year)
            f << ",\"year\":" << *e.year;
        if (!e.track.empty())
        {
            f << ",\"track\":{\"number\":" << *e.track.number;
            if (e.track.total)
                f << ",\"total\":" << *e.track.total;
            f << "}";
        }
        if (!e.genre.empty())
            f << ",\"genre\":" << jsonValues(e.genre);
        f << "}";
        return f.str();
    }
}

std::optional<OutputFormat> parseOutputFormat(const std::string &name)
{
    std::string format = toLower(trim(name));
    if (format == "table")
        return OutputFormat::Table;
    if (format == "json")
        return OutputFormat::Json;
    return std::nullopt;
}

std::string humanReadableSize(uint64_t size)
{
    if (size < 10)
    {
        return std::to_string(size) + " " + SIZE_SUFFIXES[0];
    }

    int exponent = 0;
    uint64_t unit = 1;
    while (exponent < MAX_SIZE_EXPONENT && size / unit >= 1024)
    {
        unit *= 1024;
        ++exponent;
    }

    double value = std::floor(static_cast<double>(size) / static_cast<double>(unit) * 10.0 + 0.5) / 10.0;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(value < 10.0 ? 1 : 0) << value << " " << SIZE_SUFFIXES[exponent];
    return ss.str();
}

std::string displayName(const std::string &raw)
{
    std::string out;
    out.reserve(raw.size());
    size_t pos = 0;
    while (pos < raw.size())
    {
        size_t len = sequenceLength(static_cast<unsigned char>(raw[pos]));
        if (validSequence(raw, pos, len))
        {
            out.append(raw, pos, len);
            pos += len;
        }
        else
        {
            out += REPLACEMENT_CHARACTER;
            ++pos;
        }
    }
    return out;
}

std::string displayValues(const std::vector<std::string> &values)
{
    return join(values, "/");
}

std::string displayYear(const std::optional<int> &year)
{
    return year ? std::to_string(*year) : std::string();
}

std::string displayTrack(const Track &track)
{
    if (!track.number)
        return "";

    std::string s = std::to_string(*track.number);
    if (track.total)
        s += "/" + std::to_string(*track.total);
    return s;
}

std::string renderTable(const std::vector<Entry> &entries)
{
    if (entries.empty())
        return "";

    std::vector<std::vector<std::string>> rows;
    rows.push_back({"NAME", "SIZE", "TITLE", "ARTIST", "ALBUM", "YEAR", "TRACK", "GENRE"});
    for (const auto &e : entries)
    {
        rows.push_back({displayName(e.name),
                        humanReadableSize(e.size),
                        displayValues(e.title),
                        displayValues(e.artist),
                        displayValues(e.album),
                        displayYear(e.year),
                        displayTrack(e.track),
                        displayValues(e.genre)});
    }

    std::vector<size_t> widths(rows[0].size(), 0);
    for (const auto &row : rows)
    {
        for (size_t i = 0; i < row.size(); ++i)
            widths[i] = std::max(widths[i], displayWidth(row[i]));
    }

    // Cada célula: um espaço de cada lado, alinhada à esquerda; células separadas por um espaço
    std::string table;
    for (const auto &row : rows)
    {
        for (size_t i = 0; i < row.size(); ++i)
        {
            if (i > 0)
                table += " ";
            table += " " + row[i] + std::string(widths[i] - displayWidth(row[i]), ' ') + " ";
        }
        table += "\n";
    }
    return table;
}

/**
 * @brief Escapa caracteres especiais em uma string para formato JSON
 * @param s String a ser escapada
 * @return String com caracteres especiais escapados
 *
 * Converte caracteres como aspas, barras invertidas e caracteres de controle
 * para suas representações escapadas em JSON (ex: " vira \")
 */
std::string escapeJsonString(const std::string &s)
{
    std::ostringstream o;
    for (char c : s)
    {
        switch (c)
        {
        case '"':
            o << "\\\"";
            break;
        case '\\':
            o << "\\\\";
            break;
        case '\b':
            o << "\\b";
            break;
        case '\f':
            o << "\\f";
            break;
        case '\n':
            o << "\\n";
            break;
        case '\r':
            o << "\\r";
            break;
        case '\t':
            o << "\\t";
            break;
        default:
            if ('\x00' <= c && c <= '\x1f')
            {
                o << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (int)c << std::dec;
            }
            else
            {
                o << c;
            }
        }
    }
    return o.str();
}

std::string entriesToJson(const std::vector<Entry> &entries)
{
    std::string out = "[";
    for (size_t i = 0; i < entries.size(); ++i)
    {
        if (i > 0)
            out += ",";
        out += entryToJson(entries[i]);
    }
    return out + "]";
}

std::string renderResults(const std::vector<Info> &results, OutputFormat format, const ListOptions &options)
{
    if (results.size() == 1)
    {
        return format == OutputFormat::Table ? renderTable(results[0].entries)
                                             : entriesToJson(results[0].entries);
    }

    std::vector<Entry> files;
    bool hasFiles = false;
    for (const auto &info : results)
    {
        if (info.pathType == PathType::File)
        {
            hasFiles = true;
            files.insert(files.end(), info.entries.begin(), info.entries.end());
        }
    }

    std::vector<std::string> blocks;
    if (hasFiles)
    {
        // Arquivos nomeados viram uma única listagem, ordenada de novo
        sortEntries(files, options.sortBy, options.reverse);
        blocks.push_back(format == OutputFormat::Table ? renderTable(files) : entriesToJson(files));
    }

    for (const auto &info : results)
    {
        if (info.pathType != PathType::Directory)
            continue;

        if (format == OutputFormat::Table)
            blocks.push_back(displayName(info.path) + ":\n" + renderTable(info.entries));
        else
            blocks.push_back("{\"path\":\"" + escapeJsonString(displayName(info.path)) +
                             "\",\"values\":" + entriesToJson(info.entries) + "}");
    }

    if (format == OutputFormat::Table)
        return join(blocks, "\n");

    if (blocks.size() == 1)
        return blocks[0];
    return "[" + join(blocks, ",") + "]";
}
