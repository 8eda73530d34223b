/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#include "Node.h"
#include "Schema.h"

#include <gtest/gtest.h>

#include <memory>

using namespace arbor;


TEST (ReadOnly, snapshot_is_readable)
{
    ReadOnlyNode n {{"name", "fixed"}, {"count", 2}};
    EXPECT_EQ (n.typeName (), "arbor.ReadOnlyNode");
    EXPECT_TRUE (n.has ("name"));
    EXPECT_EQ (n.get ("name"), Value ("fixed"));
    EXPECT_EQ (n.get ("count"), Value (2));
    ASSERT_EQ (n.content ().size (), 2u);
    EXPECT_EQ (n.content ()[0].key, "name");
    EXPECT_EQ (n.id ().size (), 36u);
}

TEST (ReadOnly, snapshot_from_content)
{
    Node source;
    source.set ("a", 1);
    source.set ("b", "x");
    ReadOnlyNode n (source.content ());
    EXPECT_EQ (n.content ().size (), 2u);
    EXPECT_EQ (n.get ("b"), Value ("x"));
}

TEST (ReadOnly, content_mutators_do_nothing)
{
    ReadOnlyNode n {{"k", 1}};
    n.set ("k", 5);
    n.set ("new", true);
    n.clear ("k");
    EXPECT_EQ (n.get ("k"), Value (1));
    EXPECT_FALSE (n.has ("new"));

    Node & base = n;  // dispatch through the base class too
    base.set ("k", 9);
    base.clear ("k");
    EXPECT_EQ (n.get ("k"), Value (1));
}

TEST (ReadOnly, never_accepts_children)
{
    ReadOnlyNode n;
    std::unique_ptr<Node> child (new Node);
    EXPECT_FALSE (n.addChild (child.get ()));
    EXPECT_FALSE (n.addChild (child.get (), 0));
    EXPECT_EQ (n.findNumChildren (), 0);
    EXPECT_EQ (child->parent (), nullptr);
}

TEST (ReadOnly, rejected_child_stays_with_old_parent)
{
    Node holder;
    Node * child = new Node;
    holder.addChild (child);
    ReadOnlyNode n;
    EXPECT_FALSE (n.addChild (child));
    EXPECT_EQ (child->parent (), &holder);
    EXPECT_EQ (holder.findNumChildren (), 1);
}

TEST (ReadOnly, delete_child_does_nothing)
{
    ReadOnlyNode n;
    Node other;
    n.deleteChild (&other);
    n.deleteChild (nullptr);
    EXPECT_EQ (n.findNumChildren (), 0);
}

TEST (ReadOnly, import_does_nothing)
{
    Registry registry;
    registry.registerClass<Node> ();

    Node source;
    source.set ("k", "replacement");
    source.addChild (new Node);

    ReadOnlyNode n {{"k", "original"}};
    String id = n.id ();
    n.importFrom (source.toSerialized (), BINARY, "", registry);
    n.importFrom (source.exportTo (JSON), JSON, "", registry);
    EXPECT_EQ (n.id (), id);
    EXPECT_EQ (n.get ("k"), Value ("original"));
    EXPECT_EQ (n.findNumChildren (), 0);

    // Garbage is ignored rather than reported.
    EXPECT_NO_THROW (n.importFrom (String ("garbage"), BINARY, "", registry));
    EXPECT_NO_THROW (n.importFrom (String ("{"), JSON, "", registry));

    Node & base = n;
    EXPECT_NO_THROW (base.importFrom (String ("garbage"), BINARY, "", registry));
    EXPECT_EQ (n.get ("k"), Value ("original"));
}

TEST (ReadOnly, can_live_in_a_mutable_tree)
{
    Node root;
    ReadOnlyNode * leaf = new ReadOnlyNode {{"tag", "leaf"}};
    root.addChild (new Node);
    EXPECT_TRUE (root.addChild (leaf));
    EXPECT_EQ (leaf->parent (), &root);
    EXPECT_EQ (leaf->findRoute (), "-1_1");
    EXPECT_EQ (root.getByRoute ("-1_1"), leaf);

    std::vector<Node *> found = root.find ("leaf", "tag");
    ASSERT_EQ (found.size (), 1u);
    EXPECT_EQ (found[0], leaf);

    int visited = 0;
    leaf->siblingsReverse ([&] (Node &, Cancel &) {visited++;});
    EXPECT_EQ (visited, 1);

    root.deleteChild (leaf);
    EXPECT_EQ (root.findNumChildren (), 1);
}

TEST (ReadOnly, clone_keeps_content_and_class)
{
    ReadOnlyNode n {{"k", 1}};
    std::unique_ptr<Node> copy (n.clone ());
    EXPECT_EQ (copy->typeName (), "arbor.ReadOnlyNode");
    EXPECT_TRUE (copy->isSame (n));
    copy->set ("k", 2);
    EXPECT_EQ (copy->get ("k"), Value (1));
}

TEST (ReadOnly, serializes_like_any_node)
{
    Registry registry;
    registry.registerClass<Node> ();
    registry.registerClass<ReadOnlyNode> ();

    Node root;
    root.addChild (new ReadOnlyNode {{"k", 1.5}});
    Node target;
    target.importFrom (root.toSerialized (), BINARY, "", registry);
    EXPECT_TRUE (target.isSame (root));
    EXPECT_EQ (target.firstChild ()->typeName (), "arbor.ReadOnlyNode");
    EXPECT_EQ (target.firstChild ()->get ("k"), Value (1.5));
}
