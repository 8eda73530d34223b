/*
String utilities shared by the document classes.
The library works with std::string throughout. String is simply a shorter
name for it, matching the way the rest of the code spells things.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef arbor_string_h
#define arbor_string_h

#include <string>
#include <vector>
#include <stdint.h>


namespace arbor
{
    typedef std::string String;

    inline std::vector<String> split (const String & source, const String & delimiter)
    {
        std::vector<String> result;
        String::size_type lengthDelimiter = delimiter.size ();
        String::size_type index = 0;
        while (true)
        {
            String::size_type next = source.find (delimiter, index);
            if (next == String::npos)
            {
                result.push_back (source.substr (index));  // Trailing empty element is kept, so "a_" yields two elements.
                break;
            }
            result.push_back (source.substr (index, next - index));
            index = next + lengthDelimiter;
        }
        return result;
    }

    inline String join (const String & delimiter, const std::vector<String> & elements)
    {
        int count = elements.size ();
        if (count == 0) return "";
        String::size_type total = (count - 1) * delimiter.size ();
        for (auto & e : elements) total += e.size ();
        String result;
        result.reserve (total);
        result = elements[0];
        for (int i = 1; i < count; i++)
        {
            result += delimiter;
            result += elements[i];
        }
        return result;
    }

    /**
        Parses a non-negative decimal integer that must span the whole string.
        @return The value, or -1 if the text is empty, contains anything other than digits,
        or would overflow an int.
    **/
    inline int parseIndex (const String & text)
    {
        if (text.empty ()) return -1;
        long result = 0;
        for (char c : text)
        {
            if (c < '0'  ||  c > '9') return -1;
            result = result * 10 + (c - '0');
            if (result > 0x7FFFFFFF) return -1;
        }
        return (int) result;
    }

    /**
        Checks that the bytes form well-formed UTF-8.
        Rejects overlong forms, surrogate code points and anything above U+10FFFF.
    **/
    inline bool validUTF8 (const char * p, size_t size)
    {
        const uint8_t * c   = (const uint8_t *) p;
        const uint8_t * end = c + size;
        while (c < end)
        {
            uint8_t b = *c++;
            if (b < 0x80) continue;

            int      follow;
            uint32_t code;
            uint32_t minimum;
            if      ((b & 0xE0) == 0xC0) {follow = 1; code = b & 0x1F; minimum = 0x80;}
            else if ((b & 0xF0) == 0xE0) {follow = 2; code = b & 0x0F; minimum = 0x800;}
            else if ((b & 0xF8) == 0xF0) {follow = 3; code = b & 0x07; minimum = 0x10000;}
            else return false;  // stray continuation byte, or 5/6 byte form

            if (end - c < follow) return false;
            for (int i = 0; i < follow; i++)
            {
                uint8_t n = *c++;
                if ((n & 0xC0) != 0x80) return false;
                code = (code << 6) | (n & 0x3F);
            }
            if (code < minimum) return false;
            if (code > 0x10FFFF) return false;
            if (code >= 0xD800  &&  code <= 0xDFFF) return false;
        }
        return true;
    }

    inline bool validUTF8 (const String & value)
    {
        return validUTF8 (value.data (), value.size ());
    }
}


#endif
