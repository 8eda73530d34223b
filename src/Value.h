/*
Content values stored in a Node.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#ifndef arbor_value_h
#define arbor_value_h

#include "mystring.h"
#include <cstddef>
#include <ostream>
#include "shared.h"


namespace arbor
{
    /**
        A closed tagged variant holding one of: null, boolean, integer, float or string.
        Integers are 64-bit signed. Floats are IEEE-754 double precision. Strings hold UTF-8.
        Only string content lives outside the tag+union, so copies are cheap for everything else.
    **/
    class SHARED Value
    {
    public:
        /// The numeric tag values are written into the binary format. Never renumber them.
        enum Type
        {
            NIL     = 0,
            BOOLEAN = 1,
            INTEGER = 2,
            FLOAT   = 3,
            STRING  = 4
        };

        static const Value null;  ///< Returned by lookups that find nothing.

        Value ();
        Value (std::nullptr_t);
        Value (bool value);
        Value (int value);
        Value (long value);
        Value (long long value);
        Value (double value);
        Value (const char * value);  ///< nullptr produces a NIL value
        Value (const String & value);

        Type type () const {return tag;}
        bool isNull () const {return tag == NIL;}

        /**
            Interprets value as boolean:
            true = nonzero number, or a string equal to "1" or "true" (case insensitive);
            false = everything else, including null.
        **/
        bool    getBool   () const;
        int64_t getInt    () const;  ///< Best-effort conversion. Floats are truncated. Strings are parsed.
        double  getDouble () const;
        String  getString () const;  ///< Text form of the value. Null yields "".

        /**
            Strict comparison. Tags must match, then values.
            Two NaN floats are considered equal, so that a copy of a NaN value compares equal to its source.
        **/
        bool operator== (const Value & that) const;
        bool operator!= (const Value & that) const {return ! (*this == that);}

        static const char * typeName (Type type);

    protected:
        Type tag;
        union
        {
            bool    b;
            int64_t i;
            double  f;
        };
        String s;
    };

    SHARED std::ostream & operator<< (std::ostream & out, const Value & value);
}


#endif
