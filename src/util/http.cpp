#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <string>

#include "util/http.hpp"

namespace http
{
    namespace
    {
        std::string toLower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }
    }

    CurlGlobal::CurlGlobal()
    {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    CurlGlobal::~CurlGlobal()
    {
        curl_global_cleanup();
    }

    // Builds "Key: Value" lines; any caller-supplied Range is dropped since the transport computes its own
    HeaderList::HeaderList(const HeaderMap &headers)
    {
        for (const auto &entry : headers)
        {
            if (toLower(entry.first) == "range")
                continue;

            append(entry.first + ": " + entry.second);
        }
    }

    HeaderList::~HeaderList()
    {
        if (_list)
        {
            curl_slist_free_all(_list);
        }
    }

    void HeaderList::append(const std::string &line)
    {
        curl_slist *extended = curl_slist_append(_list, line.c_str());
        if (extended)
        {
            _list = extended;
        }
    }

    std::string rangeHeader(uint64_t offset)
    {
        return "Range: bytes=" + std::to_string(offset) + "-";
    }

    bool parseContentRange(const std::string &headerLine, ContentRange &range)
    {
        std::string lower = toLower(headerLine);
        const std::string prefix = "content-range:";
        if (lower.rfind(prefix, 0) != 0)
        {
            return false;
        }

        size_t pos = prefix.size();
        auto skipSpaces = [&]()
        {
            while (pos < lower.size() && (lower[pos] == ' ' || lower[pos] == '\t'))
                ++pos;
        };

        // Reads up to 19 digits; false if there are none
        auto readNumber = [&](uint64_t &value) -> bool
        {
            size_t begin = pos;
            while (pos < lower.size() && std::isdigit(static_cast<unsigned char>(lower[pos])))
                ++pos;

            size_t count = pos - begin;
            if (count == 0 || count > 19)
                return false;

            value = std::stoull(lower.substr(begin, count));
            return true;
        };

        skipSpaces();
        if (lower.compare(pos, 5, "bytes") != 0)
        {
            return false;
        }
        pos += 5;
        skipSpaces();

        ContentRange parsed;
        if (!readNumber(parsed.first) || pos >= lower.size() || lower[pos++] != '-' ||
            !readNumber(parsed.last) || pos >= lower.size() || lower[pos++] != '/' ||
            parsed.last < parsed.first)
        {
            return false;
        }

        // "*" means the server does not know the complete length
        if (pos < lower.size() && lower[pos] == '*')
        {
            parsed.total = 0;
        }
        else if (!readNumber(parsed.total) || parsed.last >= parsed.total)
        {
            return false;
        }

        parsed.present = true;
        range = parsed;
        return true;
    }

    size_t contentRangeHeaderCallback(char *buffer, size_t size, size_t nmemb, void *userData)
    {
        size_t length = size * nmemb;
        std::string header(buffer, length);
        auto *range = static_cast<ContentRange *>(userData);

        // A new status line starts a new response (e.g. after a redirect); forget earlier values
        if (header.rfind("HTTP/", 0) == 0)
        {
            *range = ContentRange();
            return length;
        }

        ContentRange parsed;
        if (parseContentRange(header, parsed))
        {
            *range = parsed;
        }

        return length;
    }
}
