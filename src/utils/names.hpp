#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace names
{
    // File-system safe item name: anything that is not alphanumeric, space,
    // hyphen or underscore becomes '_', then surrounding whitespace is trimmed.
    // Template files on disk are named with this.
    inline std::string sanitize(const std::string &name)
    {
        std::string safe;
        safe.reserve(name.size());
        for (unsigned char c : name)
        {
            if (std::isalnum(c) || c == ' ' || c == '-' || c == '_')
                safe.push_back(static_cast<char>(c));
            else
                safe.push_back('_');
        }

        size_t first = safe.find_first_not_of(" \t");
        if (first == std::string::npos)
            return "";
        size_t last = safe.find_last_not_of(" \t");
        return safe.substr(first, last - first + 1);
    }

    // Catalog style name: lower case, spaces as hyphens
    inline std::string normalize(const std::string &name)
    {
        std::string normalized = name;
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        std::replace(normalized.begin(), normalized.end(), ' ', '-');
        return normalized;
    }

} // namespace names
