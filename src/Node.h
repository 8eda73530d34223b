/*
This collection of classes holds hierarchical documents in memory: an ordered
tree of nodes, each with an identity and a small ordered map of content values.
Whole subtrees can be cloned, compared, and written to or read from a binary
buffer or JSON text.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#ifndef arbor_node_h
#define arbor_node_h

#include "mystring.h"
#include "Value.h"
#include "Registry.h"
#include <vector>
#include <functional>
#include <initializer_list>
#include <stdint.h>
#include "shared.h"


namespace arbor
{
    class SHARED Node;
    class SHARED ReadOnlyNode;
    class SHARED Schema;
    class SHARED SchemaBinary;
    class SHARED SchemaJSON;

    enum Format
    {
        BINARY,
        JSON
    };

    /**
        Handed to every walk callback. Calling it stops the walk once the callback returns.
    **/
    struct Cancel
    {
        bool cancelled;

        Cancel () : cancelled (false) {}
        void operator() () {cancelled = true;}
    };

    /**
        One element of an ordered tree.

        <p>A parent exclusively owns its children, which form a doubly-linked list.
        Each child keeps non-owning pointers to its parent and both neighbors, so
        first/last/next/prev are all O(1). Children must be allocated with new,
        because the parent deletes them when it is destroyed.

        <p>Content is a map from key to Value. Keys are unique. Insertion order is
        kept, and is part of the document: clone() copies it and the codecs write
        entries in that order, so structurally identical trees encode identically.

        <p>Subclasses extend the node with their own behavior. A subclass that
        wants to survive cloning and serialization must override typeName() and
        create(), and must be registered with a Registry under that name before
        data containing it is decoded.
    **/
    class SHARED Node
    {
    public:
        struct Entry
        {
            String key;
            Value  value;
        };
        typedef std::vector<Entry> Content;

        /**
            Walk callback. It may delete or detach the node it is handed, in which case the
            walk skips that node's subtree and continues with the next node. It must not
            delete any other node the walk has yet to reach, nor the node the walk started from.
        **/
        typedef std::function<void (Node & node, Cancel & cancel)>                      Callback;
        typedef std::function<bool (Node & node, const Value & what, Cancel & cancel)> Predicate;

        Node ();  ///< Creates an empty root with a fresh id.
        explicit Node (const String & id);
        virtual ~Node ();  ///< Unlinks from parent, if any, and deletes all children.

        // A node owns its children, so it can't be copied member-wise. Use clone() instead.
        Node (const Node &) = delete;
        Node & operator= (const Node &) = delete;

        /**
            Stable name of this concrete class, written into serialized data as "fqn".
        **/
        virtual String typeName () const;

        /**
            Returns a blank instance of the same concrete class. The caller owns the result.
        **/
        virtual Node * create () const;

        const String & id () const {return identifier;}

        /**
            Generates a random (version 4) UUID in canonical lowercase form.
        **/
        static String generateID ();

        // Structure -----------------------------------------------------------

        Node * parent     () const {return container;}
        Node * firstChild () const {return head;}
        Node * lastChild  () const {return tail;}
        Node * prev       () const {return before;}
        Node * next       () const {return after;}
        Node * childAt    (int index) const;  ///< nullptr if index is out of range

        /**
            Attaches the given node as a child of this one.
            If the node currently belongs to another parent, it is unlinked from there first.
            Silently refuses a null node, this node itself, or any ancestor of this node,
            since attaching those would create a cycle.
            @param index Position the child will occupy. Existing children from that position
            onward shift one place later. Negative or past-the-end means append.
            @return true if the child was attached. This node then owns it. On false, ownership
            is unchanged.
        **/
        virtual bool addChild (Node * child, int index = -1);

        /**
            Unlinks and deletes the given node, if it is a direct child. Otherwise does nothing.
            Any reference to the child is no longer valid afterward.
        **/
        virtual void deleteChild (Node * child);

        /**
            Unlinks this node from its parent and returns it. The caller becomes the owner.
            A root returns itself unchanged.
        **/
        Node * detach ();

        int    findIndex       () const;  ///< Position among siblings, or -1 for a root.
        int    findLevel       () const;  ///< Number of ancestors. A root is at level 0.
        int    findNumChildren () const {return count;}
        Node & findRoot        ();

        /**
            @return true if this node is a proper ancestor of that node.
        **/
        bool isAncestorOf (const Node & that) const;

        /**
            Find the deepest node that is an ancestor (or self) of both this node and the given node.
            If the nodes are in different trees, the result is nullptr.
        **/
        Node * findCommonAncestor (Node & that);

        // Content -------------------------------------------------------------

        bool           has          (const String & key) const;
        const Value &  get          (const String & key) const;  ///< Returns Value::null if key is absent.
        Value          getOrDefault (const String & key, const Value & defaultValue) const;  ///< Returns defaultValue if key is absent or null.
        const Content & content     () const {return entries;}

        /**
            Stores a value. An existing key keeps its position in the ordering.
            A new key is appended.
        **/
        virtual void set (const String & key, const Value & value);

        /**
            Removes the key and its value, if present.
        **/
        virtual void clear (const String & key);

        // Addressing and traversal --------------------------------------------

        /**
            Returns the path of sibling indices from the root to this node, joined by "_".
            The root itself is always written as "-1". For example, the first child of
            the second child of the root is "-1_1_0".
        **/
        String findRoute () const;

        /**
            Descends from this node following the given route.
            The first token must be "-1". Each following token selects a child by index.
            @return The node, or nullptr if the route is malformed or any index is out of range.
        **/
        Node * getByRoute (const String & route);

        /// This node, then all descendants in pre-order.
        void all             (const Callback & f);
        /// All descendants in pre-order, excluding this node.
        void descendants     (const Callback & f);
        void children        (const Callback & f);
        void childrenReverse (const Callback & f);
        /// Ancestors, nearest first.
        void parents         (const Callback & f);
        /// Siblings after this node, in forward order.
        void siblings        (const Callback & f);
        /// Siblings before this node, nearest first.
        void siblingsReverse (const Callback & f);

        /// All nodes in the subtree whose id equals the given one.
        std::vector<Node *> find (const String & id);
        /// All nodes in the subtree whose content under key equals what.
        std::vector<Node *> find (const Value & what, const String & key);
        /// All nodes in the subtree, in all() order, for which the predicate returns true.
        std::vector<Node *> find (const Value & what, const Predicate & predicate);

        // Equality and cloning ------------------------------------------------

        /**
            Makes a copy of the same concrete class, with the same id and content.
            @param deep Also clone all descendants. Otherwise the copy has no children.
            @return A new root. The caller owns it.
        **/
        Node * clone (bool deep = true) const;

        /**
            Deep comparison including identity. Ids must match, content must hold the
            same key/value pairs, and children must match pairwise in order.
        **/
        bool isSame (const Node & that) const;

        /**
            Deep comparison of content and child structure. Ids are ignored.
        **/
        bool isLike (const Node & that) const;

        // Serialization -------------------------------------------------------

        /**
            Encodes this node and its whole subtree in the binary format.
            @throws ValidationError if some content cannot be encoded.
        **/
        std::vector<uint8_t> toSerialized () const;

        /**
            Encodes this node and its whole subtree in the given format.
            For BINARY, the string holds the same bytes as toSerialized().
        **/
        String exportTo (Format format = JSON) const;

        /**
            Replaces the id, content and children of this node with the decoded document.
            Existing references to this node stay valid. Its concrete class does not change.
            On failure this node is left exactly as it was.
            @param fallbackTypeName Class used for any child whose recorded type name is
            not in the registry. Empty means no fallback.
            @throws DecodeError for malformed input.
            @throws UnknownTypeError if a child's type can't be resolved.
        **/
        virtual void importFrom (const char * data, size_t size, Format format = BINARY, const String & fallbackTypeName = "", Registry & registry = Registry::global ());

        void importFrom (const String & data, Format format = BINARY, const String & fallbackTypeName = "", Registry & registry = Registry::global ())
        {
            importFrom (data.data (), data.size (), format, fallbackTypeName, registry);
        }

        void importFrom (const std::vector<uint8_t> & data, Format format = BINARY, const String & fallbackTypeName = "", Registry & registry = Registry::global ())
        {
            importFrom ((const char *) data.data (), data.size (), format, fallbackTypeName, registry);
        }

        friend Schema;
        friend SchemaBinary;
        friend SchemaJSON;

    protected:
        String  identifier;
        Content entries;
        Node *  container;  ///< parent
        Node *  head;       ///< first child
        Node *  tail;       ///< last child
        Node *  before;     ///< previous sibling
        Node *  after;      ///< next sibling
        int     count;      ///< number of children

        /**
            Stores a value without going through the virtual set().
            Used to build content that a read-only subclass must still receive.
        **/
        void put (const String & key, const Value & value);

        /**
            Links an orphan node into the child list. Does no checking.
        **/
        void link (Node * child, int index);

        /**
            Removes a direct child from the child list without deleting it.
        **/
        void unlink (Node * child);

        /**
            Deletes all children.
        **/
        void clearChildren ();

        /**
            Takes the id, content and children of source. The previous content and
            children of this node are discarded. Source is left as an empty root.
        **/
        void takeFrom (Node & source);

        bool contentEquals (const Node & that) const;
    };

    /**
        A node whose content is fixed at construction.
        All mutators are no-ops: set() and clear() leave content unchanged, addChild()
        never accepts a child, and importFrom() ignores its input, valid or not.
        It can still be attached as the child of an ordinary node.
    **/
    class SHARED ReadOnlyNode : public Node
    {
    public:
        ReadOnlyNode ();
        explicit ReadOnlyNode (const Content & snapshot);
        ReadOnlyNode (std::initializer_list<Entry> snapshot);

        virtual String typeName    () const;
        virtual Node * create      () const;
        virtual bool   addChild    (Node * child, int index = -1);
        virtual void   deleteChild (Node * child);
        virtual void   set         (const String & key, const Value & value);
        virtual void   clear       (const String & key);
        virtual void   importFrom  (const char * data, size_t size, Format format = BINARY, const String & fallbackTypeName = "", Registry & registry = Registry::global ());

        // C++ name resolution
        using Node::importFrom;
    };

    SHARED std::ostream & operator<< (std::ostream & out, Format format);
}


#endif
