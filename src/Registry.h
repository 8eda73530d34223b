/*
Maps stable type names to factories, so that decoding can rebuild each node
as the concrete class that wrote it.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#ifndef arbor_registry_h
#define arbor_registry_h

#include "mystring.h"
#include <map>
#include <vector>
#include "shared.h"


namespace arbor
{
    class Node;

    /// Produces a blank instance of one concrete node class. The caller owns the result.
    typedef Node * Factory ();

    /**
        Directory of node classes that may appear in a serialized document.
        Any number of names can point at the same factory. This lets a renamed
        class keep reading data written under its old name.

        <p>The codecs consult a registry only while decoding. Encoding takes the name
        directly from Node::typeName(). Every decode call accepts the registry to use,
        so an application (or a test) can keep private registries. global() is the
        process-wide instance used by default. It starts empty. The application must
        populate it before decoding any buffer, including registering Node itself.
    **/
    class SHARED Registry
    {
    public:
        static Registry & global ();

        /**
            Associates a name with a factory. Re-registering a name replaces the previous factory.
        **/
        void registerType (const String & typeName, Factory * factory);

        /**
            Registers class T, which must be default-constructible.
            @param name Specifies the string stored in the stream that identifies this class.
            If empty, the name comes from T::typeName() on a temporary instance.
        **/
        template<class T>
        void registerClass (const String & name = "")
        {
            // Inner-class used to lay down a function that can construct an object of type T.
            struct Product
            {
                static Node * create ()
                {
                    return new T;
                }
            };

            if (name.empty ())
            {
                T prototype;
                registerType (prototype.typeName (), Product::create);
            }
            else
            {
                registerType (name, Product::create);
            }
        }

        /**
            Looks up the factory for typeName. If that name is unknown, tries fallbackTypeName.
            @throws UnknownTypeError if neither name is registered.
        **/
        Factory * resolve (const String & typeName, const String & fallbackTypeName = "") const;

        bool                contains (const String & typeName) const;
        void                remove   (const String & typeName);
        void                clear    ();
        int                 size     () const;
        std::vector<String> names    () const;  ///< Registered names in sorted order.

    protected:
        std::map<String, Factory *> factories;
    };
}


#endif
