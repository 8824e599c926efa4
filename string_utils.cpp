#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <sstream>
#include <stdexcept>

#include <boost/locale.hpp>

namespace
{
    const std::locale &utf8Locale()
    {
        static const std::locale locale = boost::locale::generator()("en_US.UTF-8");
        return locale;
    }
}

std::string toLower(const std::string &str)
{
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string foldCase(const std::string &str)
{
    try
    {
        return boost::locale::fold_case(str, utf8Locale());
    }
    catch (const boost::locale::conv::conversion_error &)
    {
        return toLower(str);
    }
}

std::string trim(const std::string &str)
{
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first)
    {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter))
    {
        item = trim(item);
        if (!item.empty())
            parts.push_back(item);
    }
    return parts;
}

std::string join(const std::vector<std::string> &parts, const std::string &separator)
{
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        result += parts[i];
        if (i < parts.size() - 1)
            result += separator;
    }
    return result;
}

std::optional<unsigned> parseUnsigned(const std::string &str)
{
    std::string digits = trim(str);
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c)
                                       { return std::isdigit(c); }))
    {
        return std::nullopt;
    }

    try
    {
        unsigned long value = std::stoul(digits);
        if (value > UINT_MAX)
            return std::nullopt;
        return static_cast<unsigned>(value);
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

std::optional<int> parseLeadingInt(const std::string &str)
{
    std::string text = trim(str);
    size_t end = 0;
    if (end < text.size() && (text[end] == '-' || text[end] == '+'))
        ++end;
    size_t digitsStart = end;
    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end])))
        ++end;
    if (end == digitsStart)
        return std::nullopt;

    try
    {
        return std::stoi(text.substr(0, end));
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}
