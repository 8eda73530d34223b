/*
Readers and writers for serialized documents.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#ifndef arbor_schema_h
#define arbor_schema_h

#include "Node.h"
#include "Error.h"
#include <memory>
#include <nlohmann/json.hpp>
#include "shared.h"


namespace arbor
{
    /**
        Converts a subtree to and from one serialized format.

        <p>Reading never modifies the target until the whole input has been interpreted.
        The subclass builds the decoded tree under a scratch root, and only then does
        read() swap it into the target. Any exception leaves the target as it was.
    **/
    class SHARED Schema
    {
    public:
        int        version;   ///< Format revision this object reads and writes. Always positive.
        Format     format;
        Registry & registry;  ///< Where child type names are resolved during read.

        /**
            Sets how failures are reported in addition to the exception.
            The modes are:
                0=do nothing (default),
                1=print a line to stderr for each failed read or write, and for each
                  fallback substitution of an unregistered type.
        **/
        static void setDiagnostics (int method);
        static int diagnostics;

        /**
            Deepest nesting accepted while reading. Anything deeper is treated as corrupt input,
            rather than risking stack exhaustion.
        **/
        static int maxDepth;

        Schema (int version, Format format, Registry & registry);
        virtual ~Schema ();

        /**
            Returns an object suitable for reading and writing the given format.
        **/
        static std::unique_ptr<Schema> create (Format format, Registry & registry = Registry::global ());

        /**
            Replaces id, content and children of target with the decoded document.
            @throws DecodeError or UnknownTypeError. Target is unchanged in that case.
        **/
        void read (Node & target, const char * data, size_t size, const String & fallbackTypeName = "");

        /**
            @throws ValidationError if some content can't be represented.
        **/
        String write (const Node & node);

    protected:
        /**
            Low-level routine to interpret the input. Fills in staged, which starts as
            an empty root of class Node.
        **/
        virtual void decode (Node & staged, const char * data, size_t size, const String & fallbackTypeName) = 0;

        /**
            Low-level routine to produce the output for the given subtree.
        **/
        virtual String encode (const Node & node) = 0;

        /**
            Creates a blank node for the recorded type name, reporting a fallback substitution if one happens.
        **/
        Node * instantiate (const String & typeName, const String & fallbackTypeName);

        /**
            Attaches a decoded child. Takes ownership of child either way. If the parent refuses
            it (a read-only class never holds children), the child is discarded.
        **/
        static void adopt (Node & parent, std::unique_ptr<Node> & child);
    };

    /**
        Compact binary form. All integers are little-endian. Strings are a uint32 byte count
        followed by UTF-8 bytes.
        <pre>
        buffer  = "ARBR" uint32(version) node
        node    = string(id) string(typeName) uint8(isFlat) uint32(entryCount) entry*
                  [uint32(childCount) node*]   -- only present when isFlat == 0
        entry   = string(key) uint8(tag) payload
        payload = nothing for null | uint8 for boolean | int64 for integer
                  | binary64 for float | string for string
        </pre>
    **/
    class SHARED SchemaBinary : public Schema
    {
    public:
        static const char magic[4];

        SchemaBinary (int version, Registry & registry);

    protected:
        struct Reader
        {
            const uint8_t * p;
            const uint8_t * end;

            void     need      (size_t n, const char * what);
            uint8_t  getU8     (const char * what);
            uint32_t getU32    (const char * what);
            uint64_t getU64    (const char * what);
            String   getString (const char * what);
        };

        virtual void   decode    (Node & staged, const char * data, size_t size, const String & fallbackTypeName);
        virtual String encode    (const Node & node);
        void           readBody  (Reader & reader, Node & node, int depth, const String & fallbackTypeName);
        void           writeNode (const Node & node, String & out);
    };

    /**
        Textual form, with one JSON object per node:
        <pre>
        {"id": string, "fqn": string, "intrinsic": {"isFlat": boolean},
         "content": {key: null|boolean|number|string, ...}, "children": [node, ...]}
        </pre>
        Content keys keep their insertion order. A missing "id" gets a fresh one.
        A missing "intrinsic" counts as flat only when "children" is empty.
    **/
    class SHARED SchemaJSON : public Schema
    {
    public:
        SchemaJSON (int version, Registry & registry);

        nlohmann::ordered_json toJSON   (const Node & node);
        void                   fromJSON (const nlohmann::ordered_json & object, Node & node, bool isRoot, const String & fallbackTypeName, int depth);

    protected:
        virtual void   decode (Node & staged, const char * data, size_t size, const String & fallbackTypeName);
        virtual String encode (const Node & node);
    };
}


#endif
