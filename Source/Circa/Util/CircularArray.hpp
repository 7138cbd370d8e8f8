#pragma once
#include <array>
#include <stddef.h>
#include <stdint.h>
#include <stdexcept>
#include <string>
#include "Result.hpp"

namespace circa
{
    enum class CircularArrayError
    {
        None,
        OutOfBounds
    };

    inline const char* getCircularArrayErrorStr(CircularArrayError err)
    {
        switch (err)
        {
        case CircularArrayError::None:
            return "none";
        case CircularArrayError::OutOfBounds:
            return "index out of bounds";
        }
        return "";
    }

    class CircularArrayIndexException : public std::out_of_range
    {
      public:
        CircularArrayIndexException(size_t index, size_t capacity)
            : std::out_of_range("CircularArray index " + std::to_string(index) + " out of bounds (capacity " +
                                std::to_string(capacity) + ")"),
              idx(index), cap(capacity)
        {
        }

        size_t index() const
        {
            return idx;
        }

        size_t capacity() const
        {
            return cap;
        }

      private:
        size_t idx;
        size_t cap;
    };

    // Fixed-size buffer that accepts any number of pushes, overwriting the
    // oldest slot once all sz slots have been written.
    //
    // Indexing (operator[], get, set, tryGet) addresses physical slots and
    // ignores the write cursor. toArray() is the only chronological view.
    template <typename T, size_t sz> class CircularArray
    {
        static_assert(sz > 0, "CircularArray needs at least one slot");

      public:
        CircularArray() : values(), idx(0), pushes(0)
        {
        }

        void push(T value)
        {
            values[idx] = value;
            idx++;
            if (idx >= sz)
                idx = 0;
            pushes++;
        }

        T& operator[](size_t index)
        {
            checkIndex(index);
            return values[index];
        }

        const T& operator[](size_t index) const
        {
            checkIndex(index);
            return values[index];
        }

        const T& get(size_t index) const
        {
            checkIndex(index);
            return values[index];
        }

        void set(size_t index, T value)
        {
            checkIndex(index);
            values[index] = value;
        }

        Result<T, CircularArrayError> tryGet(size_t index) const
        {
            if (index >= sz)
                return CircularArrayError::OutOfBounds;

            return values[index];
        }

        // Oldest first. Slots that were never pushed to come out as T{}.
        std::array<T, sz> toArray() const
        {
            std::array<T, sz> ordered;
            for (size_t i = 0; i < sz; i++)
            {
                ordered[i] = values[(idx + i) % sz];
            }
            return ordered;
        }

        // Most recently pushed slot, or nullptr before the first push.
        const T* last() const
        {
            if (pushes == 0)
                return nullptr;

            return &values[idx == 0 ? sz - 1 : idx - 1];
        }

        uint64_t pushCount() const
        {
            return pushes;
        }

        size_t cursor() const
        {
            return idx;
        }

        const T* data() const
        {
            return values;
        }

        constexpr size_t size() const
        {
            return sz;
        }

        constexpr size_t capacity() const
        {
            return sz;
        }

      private:
        T values[sz];
        size_t idx;
        uint64_t pushes;

        void checkIndex(size_t index) const
        {
            if (index >= sz)
                throw CircularArrayIndexException(index, sz);
        }
    };
}
