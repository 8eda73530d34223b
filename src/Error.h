/*
Exceptions raised by the document codecs.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#ifndef arbor_error_h
#define arbor_error_h

#include "mystring.h"
#include <stdexcept>
#include "shared.h"


namespace arbor
{
    /**
        Base of all failures reported by this library.
        Tree mutations never throw. A rejected addChild() is silent by contract.
    **/
    class SHARED Error : public std::runtime_error
    {
    public:
        explicit Error (const String & message) : std::runtime_error (message) {}
    };

    /// Content could not be encoded, for example a string that is not valid UTF-8.
    class SHARED ValidationError : public Error
    {
    public:
        explicit ValidationError (const String & message) : Error (message) {}
    };

    /// Input buffer or text is truncated, corrupt or malformed.
    class SHARED DecodeError : public Error
    {
    public:
        explicit DecodeError (const String & message) : Error (message) {}
    };

    class SHARED UnknownTypeError : public Error
    {
    public:
        String typeName;  ///< The name that failed to resolve.

        UnknownTypeError (const String & typeName, const String & message)
        :   Error (message),
            typeName (typeName)
        {
        }
    };
}


#endif
