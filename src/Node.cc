/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#include "Node.h"
#include "Schema.h"

#include <random>
#include <memory>
#include <unordered_set>
#include <cstdio>


// class Node ----------------------------------------------------------------

arbor::Node::Node ()
:   identifier (generateID ()),
    container  (nullptr),
    head       (nullptr),
    tail       (nullptr),
    before     (nullptr),
    after      (nullptr),
    count      (0)
{
}

arbor::Node::Node (const String & id)
:   identifier (id),
    container  (nullptr),
    head       (nullptr),
    tail       (nullptr),
    before     (nullptr),
    after      (nullptr),
    count      (0)
{
}

arbor::Node::~Node ()
{
    if (container) container->unlink (this);
    clearChildren ();
}

arbor::String
arbor::Node::typeName () const
{
    return "arbor.Node";
}

arbor::Node *
arbor::Node::create () const
{
    return new Node;
}

arbor::String
arbor::Node::generateID ()
{
    static std::mt19937_64 generator (std::random_device {} ());
    uint64_t high = generator ();
    uint64_t low  = generator ();
    high = (high & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;  // version 4
    low  = (low  & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;  // variant 1

    char buffer[37];
    snprintf (buffer, sizeof (buffer), "%08x-%04x-%04x-%04x-%012llx",
              (unsigned int) (high >> 32),
              (unsigned int) (high >> 16) & 0xFFFF,
              (unsigned int)  high        & 0xFFFF,
              (unsigned int) (low  >> 48),
              (unsigned long long) (low & 0xFFFFFFFFFFFFull));
    return buffer;
}

arbor::Node *
arbor::Node::childAt (int index) const
{
    if (index < 0  ||  index >= count) return nullptr;
    Node * c;
    if (index < count / 2)
    {
        c = head;
        for (int i = 0; i < index; i++) c = c->after;
    }
    else  // closer to the tail, so walk backward
    {
        c = tail;
        for (int i = count - 1; i > index; i--) c = c->before;
    }
    return c;
}

bool
arbor::Node::addChild (Node * child, int index)
{
    if (! child) return false;
    if (child == this) return false;
    if (child->isAncestorOf (*this)) return false;

    if (child->container)
    {
        // When moving within the same parent, the target index refers to positions
        // after the child has been taken out.
        child->container->unlink (child);
    }
    link (child, index);
    return true;
}

void
arbor::Node::deleteChild (Node * child)
{
    if (! child  ||  child->container != this) return;
    unlink (child);
    delete child;
}

arbor::Node *
arbor::Node::detach ()
{
    if (container) container->unlink (this);
    return this;
}

int
arbor::Node::findIndex () const
{
    if (! container) return -1;
    int result = 0;
    for (const Node * c = before; c; c = c->before) result++;
    return result;
}

int
arbor::Node::findLevel () const
{
    int result = 0;
    for (const Node * p = container; p; p = p->container) result++;
    return result;
}

arbor::Node &
arbor::Node::findRoot ()
{
    Node * result = this;
    while (result->container) result = result->container;
    return *result;
}

bool
arbor::Node::isAncestorOf (const Node & that) const
{
    for (const Node * p = that.container; p; p = p->container)
    {
        if (p == this) return true;
    }
    return false;
}

arbor::Node *
arbor::Node::findCommonAncestor (Node & that)
{
    // Strategy: Place the ancestry of one node in a set. Then walk up the ancestry
    // of the other node. The first ancestor found in the set is the answer.

    std::unordered_set<Node *> thisAncestors;
    for (Node * A = this; A; A = A->container) thisAncestors.insert (A);

    auto end = thisAncestors.end ();
    for (Node * B = &that; B; B = B->container)
    {
        if (thisAncestors.find (B) != end) return B;
    }
    return nullptr;
}

bool
arbor::Node::has (const String & key) const
{
    for (auto & e : entries) if (e.key == key) return true;
    return false;
}

const arbor::Value &
arbor::Node::get (const String & key) const
{
    for (auto & e : entries) if (e.key == key) return e.value;
    return Value::null;
}

arbor::Value
arbor::Node::getOrDefault (const String & key, const Value & defaultValue) const
{
    const Value & result = get (key);
    if (result.isNull ()) return defaultValue;
    return result;
}

void
arbor::Node::set (const String & key, const Value & value)
{
    put (key, value);
}

void
arbor::Node::clear (const String & key)
{
    for (auto it = entries.begin (); it != entries.end (); ++it)
    {
        if (it->key != key) continue;
        entries.erase (it);
        return;
    }
}

arbor::String
arbor::Node::findRoute () const
{
    std::vector<String> path;
    for (const Node * n = this; n->container; n = n->container) path.push_back (std::to_string (n->findIndex ()));
    path.push_back ("-1");
    return join ("_", std::vector<String> (path.rbegin (), path.rend ()));
}

arbor::Node *
arbor::Node::getByRoute (const String & route)
{
    std::vector<String> tokens = split (route, "_");
    if (tokens.empty ()  ||  tokens[0] != "-1") return nullptr;

    Node * result = this;
    int last = tokens.size ();
    for (int i = 1; i < last; i++)
    {
        int index = parseIndex (tokens[i]);
        if (index < 0) return nullptr;
        result = result->childAt (index);
        if (! result) return nullptr;
    }
    return result;
}

void
arbor::Node::all (const Callback & f)
{
    Cancel cancel;
    f (*this, cancel);
    if (cancel.cancelled) return;
    descendants (f);
}

void
arbor::Node::descendants (const Callback & f)
{
    // Iterative pre-order walk, using the sibling links instead of a stack.
    Cancel cancel;
    Node * n = head;
    while (n)
    {
        Node * parent    = n->container;
        Node * following = n->after;
        f (*n, cancel);
        if (cancel.cancelled) return;

        // If the callback deleted or moved n, the neighbors no longer point back at it.
        // Only pointers are compared here, so n itself is never touched once it is gone.
        bool linked = following ? following->before == n : parent->tail == n;
        Node * next;
        if (linked)
        {
            if (n->head)
            {
                n = n->head;
                continue;
            }
            next = n->after;
        }
        else
        {
            next = following;
        }

        while (! next)
        {
            if (parent == this) return;
            next   = parent->after;
            parent = parent->container;
        }
        n = next;
    }
}

void
arbor::Node::children (const Callback & f)
{
    Cancel cancel;
    Node * next;
    for (Node * c = head; c; c = next)
    {
        next = c->after;
        f (*c, cancel);
        if (cancel.cancelled) return;
    }
}

void
arbor::Node::childrenReverse (const Callback & f)
{
    Cancel cancel;
    Node * next;
    for (Node * c = tail; c; c = next)
    {
        next = c->before;
        f (*c, cancel);
        if (cancel.cancelled) return;
    }
}

void
arbor::Node::parents (const Callback & f)
{
    Cancel cancel;
    for (Node * p = container; p; p = p->container)
    {
        f (*p, cancel);
        if (cancel.cancelled) return;
    }
}

void
arbor::Node::siblings (const Callback & f)
{
    Cancel cancel;
    Node * next;
    for (Node * s = after; s; s = next)
    {
        next = s->after;
        f (*s, cancel);
        if (cancel.cancelled) return;
    }
}

void
arbor::Node::siblingsReverse (const Callback & f)
{
    Cancel cancel;
    Node * next;
    for (Node * s = before; s; s = next)
    {
        next = s->before;
        f (*s, cancel);
        if (cancel.cancelled) return;
    }
}

std::vector<arbor::Node *>
arbor::Node::find (const String & id)
{
    std::vector<Node *> result;
    all ([&] (Node & n, Cancel &)
    {
        if (n.identifier == id) result.push_back (&n);
    });
    return result;
}

std::vector<arbor::Node *>
arbor::Node::find (const Value & what, const String & key)
{
    std::vector<Node *> result;
    all ([&] (Node & n, Cancel &)
    {
        for (auto & e : n.entries)
        {
            if (e.key != key) continue;
            if (e.value == what) result.push_back (&n);
            break;
        }
    });
    return result;
}

std::vector<arbor::Node *>
arbor::Node::find (const Value & what, const Predicate & predicate)
{
    std::vector<Node *> result;
    all ([&] (Node & n, Cancel & cancel)
    {
        if (predicate (n, what, cancel)) result.push_back (&n);
    });
    return result;
}

arbor::Node *
arbor::Node::clone (bool deep) const
{
    Node * result = create ();
    result->identifier = identifier;
    result->entries    = entries;
    if (deep)
    {
        for (const Node * c = head; c; c = c->after)
        {
            std::unique_ptr<Node> copy (c->clone (true));
            if (result->addChild (copy.get ())) copy.release ();
        }
    }
    return result;
}

bool
arbor::Node::isSame (const Node & that) const
{
    if (this == &that) return true;  // Short-circuit if exactly the same object
    if (identifier != that.identifier) return false;
    if (! contentEquals (that)) return false;
    if (count != that.count) return false;
    const Node * b = that.head;
    for (const Node * a = head; a; a = a->after, b = b->after)
    {
        if (! a->isSame (*b)) return false;
    }
    return true;
}

bool
arbor::Node::isLike (const Node & that) const
{
    if (this == &that) return true;
    if (! contentEquals (that)) return false;
    if (count != that.count) return false;
    const Node * b = that.head;
    for (const Node * a = head; a; a = a->after, b = b->after)
    {
        if (! a->isLike (*b)) return false;
    }
    return true;
}

std::vector<uint8_t>
arbor::Node::toSerialized () const
{
    String bytes = exportTo (BINARY);
    return std::vector<uint8_t> (bytes.begin (), bytes.end ());
}

arbor::String
arbor::Node::exportTo (Format format) const
{
    std::unique_ptr<Schema> schema = Schema::create (format);
    return schema->write (*this);
}

void
arbor::Node::importFrom (const char * data, size_t size, Format format, const String & fallbackTypeName, Registry & registry)
{
    std::unique_ptr<Schema> schema = Schema::create (format, registry);
    schema->read (*this, data, size, fallbackTypeName);
}

void
arbor::Node::put (const String & key, const Value & value)
{
    for (auto & e : entries)
    {
        if (e.key != key) continue;
        e.value = value;  // Existing key keeps its position.
        return;
    }
    entries.push_back ({key, value});
}

void
arbor::Node::link (Node * child, int index)
{
    child->container = this;
    Node * successor = childAt (index);  // nullptr means append
    if (successor)
    {
        child->after  = successor;
        child->before = successor->before;
        if (successor->before) successor->before->after = child;
        else                   head                     = child;
        successor->before = child;
    }
    else
    {
        child->before = tail;
        child->after  = nullptr;
        if (tail) tail->after = child;
        else      head        = child;
        tail = child;
    }
    count++;
}

void
arbor::Node::unlink (Node * child)
{
    if (child->before) child->before->after = child->after;
    else               head                 = child->after;
    if (child->after) child->after->before = child->before;
    else              tail                 = child->before;
    child->container = nullptr;
    child->before    = nullptr;
    child->after     = nullptr;
    count--;
}

void
arbor::Node::clearChildren ()
{
    Node * c = head;
    while (c)
    {
        Node * next = c->after;
        c->container = nullptr;  // The child must not try to unlink itself from us.
        delete c;
        c = next;
    }
    head  = nullptr;
    tail  = nullptr;
    count = 0;
}

void
arbor::Node::takeFrom (Node & source)
{
    clearChildren ();
    identifier = source.identifier;
    entries.swap (source.entries);
    source.entries.clear ();

    head  = source.head;
    tail  = source.tail;
    count = source.count;
    for (Node * c = head; c; c = c->after) c->container = this;

    source.head  = nullptr;
    source.tail  = nullptr;
    source.count = 0;
}

bool
arbor::Node::contentEquals (const Node & that) const
{
    // Same key/value pairs, regardless of insertion order.
    if (entries.size () != that.entries.size ()) return false;
    for (auto & e : entries)
    {
        bool found = false;
        for (auto & f : that.entries)
        {
            if (f.key != e.key) continue;
            if (f.value != e.value) return false;
            found = true;
            break;
        }
        if (! found) return false;
    }
    return true;
}


// class ReadOnlyNode --------------------------------------------------------

arbor::ReadOnlyNode::ReadOnlyNode ()
{
}

arbor::ReadOnlyNode::ReadOnlyNode (const Content & snapshot)
{
    for (auto & e : snapshot) put (e.key, e.value);
}

arbor::ReadOnlyNode::ReadOnlyNode (std::initializer_list<Entry> snapshot)
{
    for (auto & e : snapshot) put (e.key, e.value);
}

arbor::String
arbor::ReadOnlyNode::typeName () const
{
    return "arbor.ReadOnlyNode";
}

arbor::Node *
arbor::ReadOnlyNode::create () const
{
    return new ReadOnlyNode;
}

bool
arbor::ReadOnlyNode::addChild (Node * child, int index)
{
    return false;
}

void
arbor::ReadOnlyNode::deleteChild (Node * child)
{
}

void
arbor::ReadOnlyNode::set (const String & key, const Value & value)
{
}

void
arbor::ReadOnlyNode::clear (const String & key)
{
}

void
arbor::ReadOnlyNode::importFrom (const char * data, size_t size, Format format, const String & fallbackTypeName, Registry & registry)
{
}
