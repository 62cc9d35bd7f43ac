#pragma once
#include <string>
#include <vector>

// Check if a flag exists in command line args
inline bool hasFlag(int argc, char **argv, const std::string &flag)
{
    for (int i = 1; i < argc; i++)
    {
        if (std::string(argv[i]) == flag)
        {
            return true;
        }
    }
    return false;
}

// Get a string argument from command line
inline std::string getArg(int argc, char **argv, const std::string &flag, const std::string &defaultValue)
{
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == flag && i + 1 < argc)
        {
            return argv[i + 1];
        }
    }
    return defaultValue;
}

// Integer argument, falls back to the default when missing or malformed
inline int getArg(int argc, char **argv, const std::string &flag, int defaultValue)
{
    std::string value = getArg(argc, argv, flag, "");
    if (value.empty())
    {
        return defaultValue;
    }
    try
    {
        return std::stoi(value);
    }
    catch (const std::exception &)
    {
        return defaultValue;
    }
}

// Floating point argument, falls back to the default when missing or malformed
inline double getArg(int argc, char **argv, const std::string &flag, double defaultValue)
{
    std::string value = getArg(argc, argv, flag, "");
    if (value.empty())
    {
        return defaultValue;
    }
    try
    {
        return std::stod(value);
    }
    catch (const std::exception &)
    {
        return defaultValue;
    }
}

// Split a delimited string into a vector of strings
inline std::vector<std::string> splitString(const std::string &str, char delimiter = ',')
{
    std::vector<std::string> result;
    size_t start = 0;
    size_t end = str.find(delimiter);

    while (end != std::string::npos)
    {
        result.push_back(str.substr(start, end - start));
        start = end + 1;
        end = str.find(delimiter, start);
    }

    result.push_back(str.substr(start));
    return result;
}
