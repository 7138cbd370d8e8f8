#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace circa
{
    // Command line switches of the form "--name [value]".
    class Arguments
    {
      public:
        static void parseArguments(int argc, char** argv);
        static void addArgument(const char* arg, const char* value = nullptr);
        static bool hasArgument(const char* arg);
        static std::string_view argumentValue(const char* arg);
        static void forEachArgument(const std::function<void(const std::string&, const std::string&)>& func);
        static void clear();
    };
}
