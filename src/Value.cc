/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#include "Value.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <strings.h>


const arbor::Value arbor::Value::null;

arbor::Value::Value ()
:   tag (NIL)
{
    i = 0;
}

arbor::Value::Value (std::nullptr_t)
:   tag (NIL)
{
    i = 0;
}

arbor::Value::Value (bool value)
:   tag (BOOLEAN)
{
    i = 0;  // clear the unused bytes of the union
    b = value;
}

arbor::Value::Value (int value)
:   tag (INTEGER)
{
    i = value;
}

arbor::Value::Value (long value)
:   tag (INTEGER)
{
    i = value;
}

arbor::Value::Value (long long value)
:   tag (INTEGER)
{
    i = value;
}

arbor::Value::Value (double value)
:   tag (FLOAT)
{
    f = value;
}

arbor::Value::Value (const char * value)
{
    i = 0;
    if (value)
    {
        tag = STRING;
        s   = value;
    }
    else
    {
        tag = NIL;
    }
}

arbor::Value::Value (const String & value)
:   tag (STRING),
    s   (value)
{
    i = 0;
}

bool
arbor::Value::getBool () const
{
    switch (tag)
    {
        case BOOLEAN: return b;
        case INTEGER: return i != 0;
        case FLOAT:   return f != 0;
        case STRING:
        {
            if (s == "1") return true;
            return strcasecmp (s.c_str (), "true") == 0;
        }
        default: return false;
    }
}

int64_t
arbor::Value::getInt () const
{
    switch (tag)
    {
        case BOOLEAN: return b ? 1 : 0;
        case INTEGER: return i;
        case FLOAT:
        {
            if (std::isnan (f)) return 0;
            if (f >=  9.2233720368547758e18) return INT64_MAX;
            if (f <= -9.2233720368547758e18) return INT64_MIN;
            return (int64_t) f;
        }
        case STRING: return strtoll (s.c_str (), nullptr, 10);  // Best-effort conversion. If there is a decimal point, we effectively truncate the float value.
        default: return 0;
    }
}

double
arbor::Value::getDouble () const
{
    switch (tag)
    {
        case BOOLEAN: return b ? 1 : 0;
        case INTEGER: return (double) i;
        case FLOAT:   return f;
        case STRING:  return strtod (s.c_str (), nullptr);
        default: return 0;
    }
}

arbor::String
arbor::Value::getString () const
{
    char buffer[32];
    switch (tag)
    {
        case BOOLEAN: return b ? "true" : "false";
        case INTEGER:
            snprintf (buffer, sizeof (buffer), "%lld", (long long) i);
            return buffer;
        case FLOAT:
            snprintf (buffer, sizeof (buffer), "%.17g", f);
            return buffer;
        case STRING: return s;
        default: return "";
    }
}

bool
arbor::Value::operator== (const Value & that) const
{
    if (tag != that.tag) return false;
    switch (tag)
    {
        case BOOLEAN: return b == that.b;
        case INTEGER: return i == that.i;
        case FLOAT:
            if (std::isnan (f)) return std::isnan (that.f);
            return f == that.f;
        case STRING: return s == that.s;
        default: return true;  // both null
    }
}

const char *
arbor::Value::typeName (Type type)
{
    switch (type)
    {
        case NIL:     return "null";
        case BOOLEAN: return "boolean";
        case INTEGER: return "integer";
        case FLOAT:   return "float";
        case STRING:  return "string";
    }
    return "unknown";
}

std::ostream &
arbor::operator<< (std::ostream & out, const Value & value)
{
    if (value.type () == Value::STRING) out << '"' << value.getString () << '"';
    else if (value.isNull ())           out << "null";
    else                                out << value.getString ();
    return out;
}
