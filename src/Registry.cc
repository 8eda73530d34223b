/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#include "Registry.h"
#include "Error.h"


arbor::Registry &
arbor::Registry::global ()
{
    static Registry instance;
    return instance;
}

void
arbor::Registry::registerType (const String & typeName, Factory * factory)
{
    factories[typeName] = factory;
}

arbor::Factory *
arbor::Registry::resolve (const String & typeName, const String & fallbackTypeName) const
{
    auto end = factories.end ();
    auto it  = factories.find (typeName);
    if (it != end) return it->second;

    if (! fallbackTypeName.empty ())
    {
        it = factories.find (fallbackTypeName);
        if (it != end) return it->second;
        throw UnknownTypeError (typeName, "Unregistered type \"" + typeName + "\" and unregistered fallback \"" + fallbackTypeName + "\"");
    }
    throw UnknownTypeError (typeName, "Unregistered type \"" + typeName + "\". Node classes require explicit registration.");
}

bool
arbor::Registry::contains (const String & typeName) const
{
    return factories.find (typeName) != factories.end ();
}

void
arbor::Registry::remove (const String & typeName)
{
    factories.erase (typeName);
}

void
arbor::Registry::clear ()
{
    factories.clear ();
}

int
arbor::Registry::size () const
{
    return factories.size ();
}

std::vector<arbor::String>
arbor::Registry::names () const
{
    std::vector<String> result;
    result.reserve (factories.size ());
    for (auto & f : factories) result.push_back (f.first);
    return result;
}
