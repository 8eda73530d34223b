/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#include "Schema.h"
#include "myendian.h"

#include <iostream>
#include <cmath>
#include <cstring>


std::ostream &
arbor::operator<< (std::ostream & out, Format format)
{
    switch (format)
    {
        case BINARY: out << "binary"; break;
        case JSON:   out << "JSON";   break;
    }
    return out;
}


// class Schema --------------------------------------------------------------

int arbor::Schema::diagnostics = 0;
int arbor::Schema::maxDepth    = 4096;

void
arbor::Schema::setDiagnostics (int method)
{
    diagnostics = method;
}

arbor::Schema::Schema (int version, Format format, Registry & registry)
:   version  (version),
    format   (format),
    registry (registry)
{
}

arbor::Schema::~Schema ()
{
}

std::unique_ptr<arbor::Schema>
arbor::Schema::create (Format format, Registry & registry)
{
    if (format == JSON) return std::unique_ptr<Schema> (new SchemaJSON   (1, registry));
    return                     std::unique_ptr<Schema> (new SchemaBinary (1, registry));
}

void
arbor::Schema::read (Node & target, const char * data, size_t size, const String & fallbackTypeName)
{
    Node staged ((String ()));
    try
    {
        decode (staged, data, size, fallbackTypeName);
    }
    catch (const Error & error)
    {
        if (diagnostics >= 1) std::cerr << "Failed to read " << format << " document: " << error.what () << std::endl;
        throw;
    }
    target.takeFrom (staged);
}

arbor::String
arbor::Schema::write (const Node & node)
{
    try
    {
        return encode (node);
    }
    catch (const Error & error)
    {
        if (diagnostics >= 1) std::cerr << "Failed to write " << format << " document: " << error.what () << std::endl;
        throw;
    }
}

arbor::Node *
arbor::Schema::instantiate (const String & typeName, const String & fallbackTypeName)
{
    Factory * factory = registry.resolve (typeName, fallbackTypeName);
    if (diagnostics >= 1  &&  ! registry.contains (typeName))
    {
        std::cerr << "Substituting " << fallbackTypeName << " for unregistered type " << typeName << std::endl;
    }
    Node * result = factory ();
    if (! result) throw UnknownTypeError (typeName, "Factory for \"" + typeName + "\" produced no node");
    return result;
}

void
arbor::Schema::adopt (Node & parent, std::unique_ptr<Node> & child)
{
    if (parent.addChild (child.get ())) child.release ();
    else                                child.reset ();
}


// class SchemaBinary --------------------------------------------------------

const char arbor::SchemaBinary::magic[4] = {'A', 'R', 'B', 'R'};

arbor::SchemaBinary::SchemaBinary (int version, Registry & registry)
:   Schema (version, BINARY, registry)
{
}

static void
putU8 (arbor::String & out, uint8_t value)
{
    out += (char) value;
}

static void
putU32 (arbor::String & out, uint32_t value)
{
    value = arbor::toLittle (value);
    out.append ((const char *) &value, sizeof (value));
}

static void
putU64 (arbor::String & out, uint64_t value)
{
    value = arbor::toLittle (value);
    out.append ((const char *) &value, sizeof (value));
}

static void
putString (arbor::String & out, const arbor::String & value, const char * what)
{
    if (! arbor::validUTF8 (value)) throw arbor::ValidationError (arbor::String (what) + " is not valid UTF-8");
    if (value.size () > 0xFFFFFFFFull) throw arbor::ValidationError (arbor::String (what) + " is too long");
    putU32 (out, value.size ());
    out += value;
}

arbor::String
arbor::SchemaBinary::encode (const Node & node)
{
    String result (magic, sizeof (magic));
    putU32 (result, version);
    writeNode (node, result);
    return result;
}

void
arbor::SchemaBinary::writeNode (const Node & node, String & out)
{
    putString (out, node.identifier, "Node id");
    putString (out, node.typeName (), "Type name");
    bool isFlat = node.count == 0;
    putU8 (out, isFlat ? 1 : 0);

    putU32 (out, node.entries.size ());
    for (auto & e : node.entries)
    {
        putString (out, e.key, "Content key");
        const Value & v = e.value;
        Value::Type tag = v.type ();
        putU8 (out, tag);
        switch (tag)
        {
            case Value::NIL:     break;
            case Value::BOOLEAN: putU8  (out, v.getBool () ? 1 : 0);      break;
            case Value::INTEGER: putU64 (out, (uint64_t) v.getInt ());    break;
            case Value::FLOAT:   putU64 (out, bitsOf (v.getDouble ()));   break;
            case Value::STRING:  putString (out, v.getString (), ("Value of \"" + e.key + "\"").c_str ()); break;
            default: throw ValidationError ("Unsupported value type under key \"" + e.key + "\"");
        }
    }

    if (isFlat) return;
    putU32 (out, node.count);
    for (const Node * c = node.head; c; c = c->after) writeNode (*c, out);
}

void
arbor::SchemaBinary::decode (Node & staged, const char * data, size_t size, const String & fallbackTypeName)
{
    Reader reader;
    reader.p   = (const uint8_t *) data;
    reader.end = reader.p + size;

    reader.need (sizeof (magic), "header");
    if (memcmp (reader.p, magic, sizeof (magic))) throw DecodeError ("Not a binary document (bad magic)");
    reader.p += sizeof (magic);
    uint32_t v = reader.getU32 ("schema version");
    if (v != (uint32_t) version) throw DecodeError ("Unsupported schema version " + std::to_string (v));

    staged.identifier = reader.getString ("id");
    if (staged.identifier.empty ()) throw DecodeError ("Empty node id");
    reader.getString ("type name");  // The target keeps its own class, so the root's recorded type is not needed.
    readBody (reader, staged, 0, fallbackTypeName);

    if (reader.p != reader.end) throw DecodeError ("Unexpected data after end of document");
}

void
arbor::SchemaBinary::readBody (Reader & reader, Node & node, int depth, const String & fallbackTypeName)
{
    if (depth > maxDepth) throw DecodeError ("Document nesting is too deep");

    uint8_t isFlat = reader.getU8 ("isFlat flag");
    if (isFlat > 1) throw DecodeError ("Invalid isFlat flag");

    uint32_t entryCount = reader.getU32 ("entry count");
    for (uint32_t i = 0; i < entryCount; i++)
    {
        String key = reader.getString ("content key");
        if (node.has (key)) throw DecodeError ("Duplicate content key \"" + key + "\"");
        uint8_t tag = reader.getU8 ("value tag");
        Value value;
        switch (tag)
        {
            case Value::NIL:
                break;
            case Value::BOOLEAN:
            {
                uint8_t b = reader.getU8 ("boolean");
                if (b > 1) throw DecodeError ("Invalid boolean under key \"" + key + "\"");
                value = Value (b == 1);
                break;
            }
            case Value::INTEGER:
                value = Value ((long long) (int64_t) reader.getU64 ("integer"));
                break;
            case Value::FLOAT:
                value = Value (doubleOf (reader.getU64 ("float")));
                break;
            case Value::STRING:
                value = Value (reader.getString ("string"));
                break;
            default:
                throw DecodeError ("Unknown value tag " + std::to_string (tag) + " under key \"" + key + "\"");
        }
        node.put (key, value);
    }

    if (isFlat) return;
    uint32_t childCount = reader.getU32 ("child count");
    for (uint32_t i = 0; i < childCount; i++)
    {
        String id       = reader.getString ("id");
        String typeName = reader.getString ("type name");
        if (id.empty ()) throw DecodeError ("Empty node id");
        std::unique_ptr<Node> child (instantiate (typeName, fallbackTypeName));
        child->identifier = id;
        readBody (reader, *child, depth + 1, fallbackTypeName);
        adopt (node, child);
    }
}

void
arbor::SchemaBinary::Reader::need (size_t n, const char * what)
{
    if ((size_t) (end - p) < n) throw DecodeError (String ("Truncated input while reading ") + what);
}

uint8_t
arbor::SchemaBinary::Reader::getU8 (const char * what)
{
    need (1, what);
    return *p++;
}

uint32_t
arbor::SchemaBinary::Reader::getU32 (const char * what)
{
    need (4, what);
    uint32_t result;
    memcpy (&result, p, 4);
    p += 4;
    return fromLittle (result);
}

uint64_t
arbor::SchemaBinary::Reader::getU64 (const char * what)
{
    need (8, what);
    uint64_t result;
    memcpy (&result, p, 8);
    p += 8;
    return fromLittle (result);
}

arbor::String
arbor::SchemaBinary::Reader::getString (const char * what)
{
    uint32_t length = getU32 (what);
    need (length, what);
    if (! validUTF8 ((const char *) p, length)) throw DecodeError (String (what) + " is not valid UTF-8");
    String result ((const char *) p, length);
    p += length;
    return result;
}


// class SchemaJSON ----------------------------------------------------------

arbor::SchemaJSON::SchemaJSON (int version, Registry & registry)
:   Schema (version, JSON, registry)
{
}

arbor::String
arbor::SchemaJSON::encode (const Node & node)
{
    return toJSON (node).dump ();
}

nlohmann::ordered_json
arbor::SchemaJSON::toJSON (const Node & node)
{
    using nlohmann::ordered_json;

    if (! validUTF8 (node.identifier)) throw ValidationError ("Node id is not valid UTF-8");
    String typeName = node.typeName ();
    if (! validUTF8 (typeName)) throw ValidationError ("Type name is not valid UTF-8");

    ordered_json result = ordered_json::object ();
    result["id"]  = node.identifier;
    result["fqn"] = typeName;

    ordered_json intrinsic = ordered_json::object ();
    intrinsic["isFlat"] = node.count == 0;
    result["intrinsic"] = intrinsic;

    ordered_json content = ordered_json::object ();
    for (auto & e : node.entries)
    {
        if (! validUTF8 (e.key)) throw ValidationError ("Content key is not valid UTF-8");
        const Value & v = e.value;
        switch (v.type ())
        {
            case Value::NIL:     content[e.key] = nullptr;                  break;
            case Value::BOOLEAN: content[e.key] = v.getBool ();             break;
            case Value::INTEGER: content[e.key] = (int64_t) v.getInt ();    break;
            case Value::FLOAT:
            {
                double f = v.getDouble ();
                if (! std::isfinite (f)) throw ValidationError ("Value of \"" + e.key + "\" is not a finite number, which JSON can't represent");
                content[e.key] = f;
                break;
            }
            case Value::STRING:
            {
                String s = v.getString ();
                if (! validUTF8 (s)) throw ValidationError ("Value of \"" + e.key + "\" is not valid UTF-8");
                content[e.key] = s;
                break;
            }
            default: throw ValidationError ("Unsupported value type under key \"" + e.key + "\"");
        }
    }
    result["content"] = content;

    ordered_json children = ordered_json::array ();
    for (const Node * c = node.head; c; c = c->after) children.push_back (toJSON (*c));
    result["children"] = children;
    return result;
}

void
arbor::SchemaJSON::decode (Node & staged, const char * data, size_t size, const String & fallbackTypeName)
{
    nlohmann::ordered_json document;
    try
    {
        document = nlohmann::ordered_json::parse (data, data + size);
    }
    catch (const nlohmann::ordered_json::exception & error)
    {
        throw DecodeError (String ("Malformed JSON: ") + error.what ());
    }
    fromJSON (document, staged, true, fallbackTypeName, 0);
}

void
arbor::SchemaJSON::fromJSON (const nlohmann::ordered_json & object, Node & node, bool isRoot, const String & fallbackTypeName, int depth)
{
    using nlohmann::ordered_json;

    if (depth > maxDepth) throw DecodeError ("Document nesting is too deep");
    if (! object.is_object ()) throw DecodeError ("Node must be a JSON object");

    auto end = object.end ();
    auto it  = object.find ("id");
    if (it == end)
    {
        node.identifier = Node::generateID ();
    }
    else
    {
        if (! it->is_string ()) throw DecodeError ("Node id must be a string");
        node.identifier = it->get<String> ();
        if (node.identifier.empty ()) throw DecodeError ("Empty node id");
    }

    if (isRoot)
    {
        it = object.find ("fqn");
        if (it != end  &&  ! it->is_string ()) throw DecodeError ("fqn must be a string");
    }

    static const ordered_json empty = ordered_json::array ();
    const ordered_json * children = &empty;
    it = object.find ("children");
    if (it != end)
    {
        if (! it->is_array ()) throw DecodeError ("children must be an array");
        children = & *it;
    }

    bool isFlat = children->empty ();
    it = object.find ("intrinsic");
    if (it != end)
    {
        if (! it->is_object ()) throw DecodeError ("intrinsic must be an object");
        auto f = it->find ("isFlat");
        if (f != it->end ())
        {
            if (! f->is_boolean ()) throw DecodeError ("isFlat must be a boolean");
            isFlat = f->get<bool> ();
            if (isFlat  &&  ! children->empty ()) throw DecodeError ("Node is marked flat but has children");
        }
    }

    it = object.find ("content");
    if (it != end)
    {
        if (! it->is_object ()) throw DecodeError ("content must be an object");
        for (auto e = it->begin (); e != it->end (); ++e)
        {
            const String & key = e.key ();
            if (node.has (key)) throw DecodeError ("Duplicate content key \"" + key + "\"");
            const ordered_json & v = e.value ();
            Value value;
            if      (v.is_null ())    value = Value ();
            else if (v.is_boolean ()) value = Value (v.get<bool> ());
            else if (v.is_number_unsigned ())
            {
                uint64_t u = v.get<uint64_t> ();
                if (u > (uint64_t) INT64_MAX) throw DecodeError ("Integer under key \"" + key + "\" is out of range");
                value = Value ((long long) u);
            }
            else if (v.is_number_integer ()) value = Value ((long long) v.get<int64_t> ());
            else if (v.is_number_float ())   value = Value (v.get<double> ());
            else if (v.is_string ())         value = Value (v.get<String> ());
            else throw DecodeError ("Unsupported value type under key \"" + key + "\"");
            node.put (key, value);
        }
    }

    if (isFlat) return;
    for (auto & c : *children)
    {
        if (! c.is_object ()) throw DecodeError ("Node must be a JSON object");
        auto f = c.find ("fqn");
        if (f == c.end ()  ||  ! f->is_string ()) throw DecodeError ("Child node is missing its fqn");
        std::unique_ptr<Node> child (instantiate (f->get<String> (), fallbackTypeName));
        fromJSON (c, *child, false, fallbackTypeName, depth + 1);
        adopt (node, child);
    }
}
