#pragma once
#include <string>

// Check if a flag exists in command line args
inline bool hasFlag(int argc, char **argv, const std::string &flag, int first = 1)
{
    for (int i = first; i < argc; i++)
    {
        if (std::string(argv[i]) == flag)
        {
            return true;
        }
    }
    return false;
}

// Get a string argument from command line
inline std::string getArg(int argc, char **argv, const std::string &flag, const std::string &defaultValue, int first = 1)
{
    for (int i = first; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == flag && i + 1 < argc)
        {
            return argv[i + 1];
        }
    }
    return defaultValue;
}

inline std::string getArg(int argc, char **argv, const std::string &flag, const char *defaultValue, int first = 1)
{
    return getArg(argc, argv, flag, std::string(defaultValue), first);
}

// Get an integer argument from command line, throws std::invalid_argument on garbage
inline int getArg(int argc, char **argv, const std::string &flag, int defaultValue, int first = 1)
{
    std::string value = getArg(argc, argv, flag, std::string(), first);
    if (value.empty())
    {
        return defaultValue;
    }
    return std::stoi(value);
}

// Get a floating point argument from command line
inline double getArg(int argc, char **argv, const std::string &flag, double defaultValue, int first = 1)
{
    std::string value = getArg(argc, argv, flag, std::string(), first);
    if (value.empty())
    {
        return defaultValue;
    }
    return std::stod(value);
}
