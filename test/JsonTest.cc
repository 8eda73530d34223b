/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/

#include "Node.h"
#include "Schema.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>
#include <memory>

using namespace arbor;
using nlohmann::ordered_json;


namespace
{
    class Widget : public Node
    {
    public:
        virtual String typeName () const {return "test.Widget";}
        virtual Node * create   () const {return new Widget;}
    };

    struct Json : public ::testing::Test
    {
        Registry registry;

        void SetUp () override
        {
            registry.registerClass<Node> ();
            registry.registerClass<Widget> ();
        }

        std::unique_ptr<Node> sample ()
        {
            std::unique_ptr<Node> root (new Node);
            root->set ("z",     "last letter");
            root->set ("a",     1);
            root->set ("ratio", 2.5);
            root->set ("whole", 3.0);
            root->set ("off",   false);
            root->set ("none",  nullptr);
            Widget * w = new Widget;
            w->set ("k", "v");
            root->addChild (w);
            w->addChild (new Node);
            return root;
        }

        void load (Node & target, const String & text, const String & fallback = "")
        {
            target.importFrom (text, JSON, fallback, registry);
        }

        template<class E>
        void expectRejected (const String & text)
        {
            Node target;
            target.set ("keep", 1);
            target.addChild (new Node);
            std::unique_ptr<Node> before (target.clone ());
            EXPECT_THROW (load (target, text), E) << text;
            EXPECT_TRUE (target.isSame (*before));
        }
    };
}


// -- Export ------------------------------------------------------------------

TEST_F (Json, document_shape)
{
    std::unique_ptr<Node> root = sample ();
    ordered_json doc = ordered_json::parse (root->exportTo (JSON));

    ASSERT_TRUE (doc.is_object ());
    std::vector<String> keys;
    for (auto it = doc.begin (); it != doc.end (); ++it) keys.push_back (it.key ());
    std::vector<String> expected {"id", "fqn", "intrinsic", "content", "children"};
    EXPECT_EQ (keys, expected);

    EXPECT_EQ (doc["id"], root->id ());
    EXPECT_EQ (doc["fqn"], "arbor.Node");
    EXPECT_EQ (doc["intrinsic"]["isFlat"], false);
    ASSERT_EQ (doc["children"].size (), 1u);

    const ordered_json & w = doc["children"][0];
    EXPECT_EQ (w["fqn"], "test.Widget");
    EXPECT_EQ (w["content"]["k"], "v");
    EXPECT_EQ (w["children"][0]["intrinsic"]["isFlat"], true);
    EXPECT_TRUE (w["children"][0]["children"].is_array ());
    EXPECT_TRUE (w["children"][0]["children"].empty ());
}

TEST_F (Json, content_keeps_insertion_order)
{
    std::unique_ptr<Node> root = sample ();
    ordered_json doc = ordered_json::parse (root->exportTo (JSON));
    std::vector<String> keys;
    for (auto it = doc["content"].begin (); it != doc["content"].end (); ++it) keys.push_back (it.key ());
    std::vector<String> expected {"z", "a", "ratio", "whole", "off", "none"};
    EXPECT_EQ (keys, expected);
}

TEST_F (Json, value_types)
{
    std::unique_ptr<Node> root = sample ();
    ordered_json content = ordered_json::parse (root->exportTo (JSON))["content"];
    EXPECT_TRUE (content["a"].is_number_integer ());
    EXPECT_TRUE (content["ratio"].is_number_float ());
    EXPECT_TRUE (content["whole"].is_number_float ());
    EXPECT_TRUE (content["off"].is_boolean ());
    EXPECT_TRUE (content["none"].is_null ());
    EXPECT_TRUE (content["z"].is_string ());
}

TEST_F (Json, export_is_deterministic)
{
    std::unique_ptr<Node> root = sample ();
    EXPECT_EQ (root->exportTo (JSON), root->exportTo ());
    EXPECT_EQ (root->exportTo (JSON), root->exportTo (JSON));
}

TEST_F (Json, non_finite_float_is_rejected)
{
    Node n;
    n.set ("bad", std::nan (""));
    EXPECT_THROW (n.exportTo (JSON), ValidationError);
    n.set ("bad", std::numeric_limits<double>::infinity ());
    EXPECT_THROW (n.exportTo (JSON), ValidationError);
}

TEST_F (Json, invalid_utf8_is_rejected)
{
    Node n;
    n.set ("k", "\xF8\x88\x80\x80\x80");
    EXPECT_THROW (n.exportTo (JSON), ValidationError);
}

// -- Import ------------------------------------------------------------------

TEST_F (Json, round_trip_is_same)
{
    std::unique_ptr<Node> root = sample ();
    Node target;
    load (target, root->exportTo (JSON));
    EXPECT_TRUE (target.isSame (*root));
    EXPECT_EQ (target.firstChild ()->typeName (), "test.Widget");
    EXPECT_EQ (target.exportTo (JSON), root->exportTo (JSON));
}

TEST_F (Json, floats_and_integers_stay_distinct)
{
    std::unique_ptr<Node> root = sample ();
    Node target;
    load (target, root->exportTo (JSON));
    EXPECT_EQ (target.get ("a").type (),     Value::INTEGER);
    EXPECT_EQ (target.get ("whole").type (), Value::FLOAT);
    EXPECT_EQ (target.get ("whole"), Value (3.0));
}

TEST_F (Json, agrees_with_binary)
{
    std::unique_ptr<Node> root = sample ();
    Node fromJson;
    Node fromBinary;
    load (fromJson, root->exportTo (JSON));
    fromBinary.importFrom (root->toSerialized (), BINARY, "", registry);
    EXPECT_TRUE (fromJson.isSame (fromBinary));
    EXPECT_EQ (fromJson.toSerialized (), fromBinary.toSerialized ());
}

TEST_F (Json, hand_written_document)
{
    Node target;
    load (target, R"({
        "id": "root",
        "content": {"name": "top", "big": 9223372036854775807, "neg": -1},
        "children": [
            {"fqn": "arbor.Node", "id": "x", "content": {"v": 0.5}},
            {"fqn": "test.Widget"}
        ]
    })");
    EXPECT_EQ (target.id (), "root");
    EXPECT_EQ (target.get ("name"), Value ("top"));
    EXPECT_EQ (target.get ("big"),  Value (std::numeric_limits<long long>::max ()));
    EXPECT_EQ (target.get ("neg"),  Value (-1));
    ASSERT_EQ (target.findNumChildren (), 2);
    EXPECT_EQ (target.firstChild ()->id (), "x");
    EXPECT_EQ (target.firstChild ()->get ("v"), Value (0.5));

    Node * w = target.lastChild ();
    EXPECT_EQ (w->typeName (), "test.Widget");
    EXPECT_EQ (w->id ().size (), 36u);  // fresh id
    EXPECT_TRUE (w->content ().empty ());
}

TEST_F (Json, missing_intrinsic_follows_children)
{
    Node target;
    load (target, R"({"id": "r", "children": [{"fqn": "arbor.Node", "id": "c"}]})");
    EXPECT_EQ (target.findNumChildren (), 1);
}

TEST_F (Json, fallback_for_unknown_child_type)
{
    String text = R"({"id": "r", "children": [{"fqn": "gone.Type", "id": "c", "content": {"k": 1}}]})";
    Node target;
    load (target, text, "arbor.Node");
    ASSERT_EQ (target.findNumChildren (), 1);
    EXPECT_EQ (target.firstChild ()->typeName (), "arbor.Node");
    EXPECT_EQ (target.firstChild ()->get ("k"), Value (1));

    expectRejected<UnknownTypeError> (text);
}

TEST_F (Json, root_fqn_is_informational)
{
    Node target;
    load (target, R"({"id": "r", "fqn": "not.Registered"})");
    EXPECT_EQ (target.id (), "r");
    EXPECT_EQ (target.typeName (), "arbor.Node");
}

// -- Malformed input ---------------------------------------------------------

TEST_F (Json, syntax_errors)
{
    expectRejected<DecodeError> ("");
    expectRejected<DecodeError> ("{");
    expectRejected<DecodeError> ("{\"id\": \"r\"} trailing");
    expectRejected<DecodeError> ("[1, 2]");
}

TEST_F (Json, structural_errors)
{
    expectRejected<DecodeError> (R"({"id": 5})");
    expectRejected<DecodeError> (R"({"id": ""})");
    expectRejected<DecodeError> (R"({"id": "r", "content": []})");
    expectRejected<DecodeError> (R"({"id": "r", "content": {"k": [1]}})");
    expectRejected<DecodeError> (R"({"id": "r", "content": {"k": {"a": 1}}})");
    expectRejected<DecodeError> (R"({"id": "r", "children": {}})");
    expectRejected<DecodeError> (R"({"id": "r", "children": [{"id": "c"}]})");
    expectRejected<DecodeError> (R"({"id": "r", "children": [5]})");
    expectRejected<DecodeError> (R"({"id": "r", "intrinsic": {"isFlat": "no"}})");
}

TEST_F (Json, flat_node_with_children)
{
    expectRejected<DecodeError> (R"({"id": "r", "intrinsic": {"isFlat": true},
                                     "children": [{"fqn": "arbor.Node"}]})");
}

TEST_F (Json, integer_out_of_range)
{
    expectRejected<DecodeError> (R"({"id": "r", "content": {"k": 9223372036854775808}})");
}

TEST_F (Json, error_deep_in_tree_leaves_target_untouched)
{
    expectRejected<DecodeError> (R"({"id": "r", "children": [
        {"fqn": "arbor.Node", "id": "a"},
        {"fqn": "arbor.Node", "id": "b", "children": [{"fqn": "arbor.Node", "id": 7}]}
    ]})");
}
