#include "ConVar.hpp"
#include "Arguments.hpp"
#include "Log.hpp"
#include <cctype>
#include <stdexcept>

namespace circa
{
    // ConVars are usually statics, so they can be constructed before anything
    // else in the program runs. A plain linked list needs no initialisation.
    struct ConvarLink
    {
        ConVar* var;
        ConvarLink* next;
    };

    ConvarLink* firstLink = nullptr;

    bool parseConVarValue(const std::string& value, int& parsedInt, float& parsedFloat)
    {
        try
        {
            int i = std::stoi(value);
            float f = std::stof(value);
            parsedInt = i;
            parsedFloat = f;
            return true;
        }
        catch (const std::invalid_argument&)
        {
            return false;
        }
        catch (const std::out_of_range&)
        {
            return false;
        }
    }

    bool namesEqual(const char* a, const char* b)
    {
        while (*a && *b)
        {
            if (std::tolower((unsigned char)*a) != std::tolower((unsigned char)*b))
                return false;
            a++;
            b++;
        }
        return *a == *b;
    }

    ConVar::ConVar(const char* name, const char* defaultValue, const char* help)
        : help(help), name(name), value(defaultValue), parsedInt(0), parsedFloat(0.0f)
    {
        // String-only ConVars are allowed, they just read as zero.
        parseConVarValue(value, parsedInt, parsedFloat);

        ConvarLink* thisLink = new ConvarLink{this, nullptr};
        if (firstLink)
        {
            ConvarLink* next = firstLink;
            while (next->next != nullptr)
            {
                next = next->next;
            }

            next->next = thisLink;
        }
        else
        {
            firstLink = thisLink;
        }
    }

    ConVar::~ConVar()
    {
        ConvarLink** link = &firstLink;
        while (*link != nullptr)
        {
            if ((*link)->var == this)
            {
                ConvarLink* dead = *link;
                *link = dead->next;
                delete dead;
                return;
            }
            link = &(*link)->next;
        }
    }

    void ConVar::setValue(std::string newValue)
    {
        if (!parseConVarValue(newValue, parsedInt, parsedFloat))
        {
            logErr(CircaLogCategoryConfig, "Invalid convar value %s for %s", newValue.c_str(), name);
            return;
        }

        value = newValue;
        logVrb(CircaLogCategoryConfig, "%s = %s", name, value.c_str());
    }

    ConVar* ConVar::find(const char* name)
    {
        for (ConvarLink* link = firstLink; link != nullptr; link = link->next)
        {
            if (namesEqual(link->var->name, name))
                return link->var;
        }

        return nullptr;
    }

    void ConVar::applyArguments()
    {
        Arguments::forEachArgument([](const std::string& arg, const std::string& val) {
            ConVar* var = find(arg.c_str());
            if (var == nullptr)
                return;

            if (val.empty())
            {
                logWarn(CircaLogCategoryConfig, "No value given for convar %s", var->getName());
                return;
            }

            var->setValue(val);
        });
    }
}
