#include "Arguments.hpp"
#include <robin_hood.h>
#include <string.h>

namespace circa
{
    robin_hood::unordered_map<std::string, std::string> args;

    bool isSwitch(const char* arg)
    {
        return arg[0] == '-' && arg[1] == '-';
    }

    void Arguments::parseArguments(int argc, char** argv)
    {
        for (int i = 1; i < argc; i++)
        {
            size_t len = strlen(argv[i]);

            if (len <= 2)
                continue;
            if (!isSwitch(argv[i]))
                continue;

            const char* arg = argv[i] + 2;
            const char* val = "";

            if (i < argc - 1 && !isSwitch(argv[i + 1]))
            {
                val = argv[i + 1];
                i++;
            }

            addArgument(arg, val);
        }
    }

    void Arguments::addArgument(const char* arg, const char* value)
    {
        args[arg] = value ? value : "";
    }

    bool Arguments::hasArgument(const char* arg)
    {
        return args.contains(arg);
    }

    std::string_view Arguments::argumentValue(const char* arg)
    {
        return args.at(arg);
    }

    void Arguments::forEachArgument(const std::function<void(const std::string&, const std::string&)>& func)
    {
        for (const auto& pair : args)
        {
            func(pair.first, pair.second);
        }
    }

    void Arguments::clear()
    {
        args.clear();
    }
}
