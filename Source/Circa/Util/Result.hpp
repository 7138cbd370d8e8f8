#pragma once

namespace circa
{
    // Value-or-error pair. Error types are enums whose zero value means "no error".
    template <typename T, typename err> struct Result
    {
        T value;
        err error;

        Result(T val) : value(val), error((err)0)
        {
        }
        Result(err error) : value(), error(error)
        {
        }

        bool ok() const
        {
            return error == (err)0;
        }
    };
}
