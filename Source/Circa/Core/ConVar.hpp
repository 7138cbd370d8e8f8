#pragma once
#include <string>

namespace circa
{
    class ConVar
    {
      public:
        ConVar(const char* name, const char* defaultValue, const char* help = nullptr);
        ~ConVar();
        ConVar(const ConVar&) = delete;
        ConVar& operator=(const ConVar&) = delete;

        float getFloat() const
        {
            return parsedFloat;
        }
        int getInt() const
        {
            return parsedInt;
        }
        const char* getString() const
        {
            return value.c_str();
        }
        const char* getName() const
        {
            return name;
        }
        const char* getHelp() const
        {
            return help;
        }
        void setValue(std::string newValue);
        operator float() const
        {
            return getFloat();
        }
        operator bool() const
        {
            return (bool)getInt();
        }

        // Case-insensitive lookup over every live ConVar.
        static ConVar* find(const char* name);

        // Assigns each parsed command line argument to the ConVar of the same name.
        static void applyArguments();

      private:
        const char* help;
        const char* name;
        std::string value;
        int parsedInt;
        float parsedFloat;
    };
}
