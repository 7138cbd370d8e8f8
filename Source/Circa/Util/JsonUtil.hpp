#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include "CircularArray.hpp"

namespace circa
{
    // Snapshots are stored as a plain JSON array, oldest first.
    template <typename T, size_t sz> void to_json(nlohmann::json& j, const CircularArray<T, sz>& arr)
    {
        j = arr.toArray();
    }

    // Rebuilds the buffer by pushing the snapshot in order, so the restored
    // array has its cursor at 0 and pushCount() == sz.
    template <typename T, size_t sz> void from_json(const nlohmann::json& j, CircularArray<T, sz>& arr)
    {
        if (!j.is_array())
            throw std::runtime_error("CircularArray snapshot must be a JSON array");

        if (j.size() != sz)
            throw std::runtime_error("CircularArray snapshot has " + std::to_string(j.size()) +
                                     " elements, expected " + std::to_string(sz));

        CircularArray<T, sz> restored;
        for (const auto& element : j)
        {
            restored.push(element.template get<T>());
        }
        arr = restored;
    }
}
