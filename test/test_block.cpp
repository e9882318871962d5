#include <catch2/catch_test_macros.hpp>
#include "blockcrypt/block/block.hpp"
#include "blockcrypt/block/block_list.hpp"

using namespace blockcrypt;

TEST_CASE("Block - Kind derived from name", "[block]") {
    SECTION("Standard names") {
        REQUIRE(Block(BLOCK_PUB).Kind() == BlockKind::PublicKey);
        REQUIRE(Block(BLOCK_PRIV).Kind() == BlockKind::PrivateKey);
        REQUIRE(Block(BLOCK_CIPHER).Kind() == BlockKind::Cipher);
        REQUIRE(Block(BLOCK_SIGN).Kind() == BlockKind::Signature);
        REQUIRE(Block(BLOCK_HASH).Kind() == BlockKind::Hash);
        REQUIRE(Block(BLOCK_CONTENT).Kind() == BlockKind::Content);
    }

    SECTION("Key names with an algorithm prefix") {
        REQUIRE(Block("RSA PUBLIC KEY").Kind() == BlockKind::PublicKey);
        REQUIRE(Block("DSA PRIVATE KEY").Kind() == BlockKind::PrivateKey);
    }

    SECTION("Unknown names") {
        REQUIRE(Block("CERTIFICATE").Kind() == BlockKind::Unknown);
        REQUIRE(Block("cipher").Kind() == BlockKind::Unknown);
        REQUIRE(Block("XPUBLIC KEY").Kind() == BlockKind::Unknown);
    }

    SECTION("Properties do not change the kind") {
        Block block(BLOCK_CONTENT);
        block.Set(PROP_KEY_ID, "abc").Set(PROP_METHOD, RSA_CIPHER);
        REQUIRE(block.Kind() == BlockKind::Content);
    }
}

TEST_CASE("Block - Properties", "[block]") {
    Block block(BLOCK_CIPHER);

    SECTION("Strings") {
        block.Set(PROP_METHOD, "RSA-JCE");
        REQUIRE(block.IsProperty(PROP_METHOD));
        REQUIRE(block.GetString(PROP_METHOD) == "RSA-JCE");
        REQUIRE(block.Method() == "RSA-JCE");
        REQUIRE(block.GetString("missing", "def") == "def");
    }

    SECTION("Integers") {
        block.Set(PROP_LENGTH, 2048);
        REQUIRE(block.GetString(PROP_LENGTH) == "2048");
        REQUIRE(block.GetInt(PROP_LENGTH, 0) == 2048);

        block.Set(PROP_LENGTH, "12ab");
        REQUIRE(block.GetInt(PROP_LENGTH, 1024) == 1024);

        block.Set(PROP_LENGTH, "");
        REQUIRE(block.GetInt(PROP_LENGTH, 7) == 7);

        REQUIRE(block.GetInt("missing", -1) == -1);
    }

    SECTION("Booleans") {
        block.Set(PROP_EMBEDDED, true);
        REQUIRE(block.GetString(PROP_EMBEDDED) == "true");
        REQUIRE(block.IsEmbedded());

        block.Set(PROP_EMBEDDED, "YES");
        REQUIRE(block.GetBool(PROP_EMBEDDED, false));

        block.Set(PROP_EMBEDDED, "0");
        REQUIRE_FALSE(block.GetBool(PROP_EMBEDDED, true));

        block.Set(PROP_EMBEDDED, "maybe");
        REQUIRE(block.GetBool(PROP_EMBEDDED, true));
        REQUIRE_FALSE(block.GetBool(PROP_EMBEDDED, false));
    }

    SECTION("Embedded next is not a boolean true") {
        block.Set(PROP_EMBEDDED, EMBEDDED_NEXT);
        REQUIRE(block.IsEmbeddedNext());
        REQUIRE_FALSE(block.IsEmbedded());
    }

    SECTION("Removing a property") {
        block.Set(PROP_KEY_ID, "k1");
        block.Remove(PROP_KEY_ID);
        REQUIRE_FALSE(block.IsProperty(PROP_KEY_ID));
    }
}

TEST_CASE("Block - Describe and equality", "[block]") {
    Block a = NewContentBlock("hello");
    REQUIRE(a.Describe() == "CONTENT");
    REQUIRE(a.PayloadText() == "hello");

    a.Set(PROP_IDENT, "id-1");
    REQUIRE(a.Describe() == "CONTENT [id-1]");

    Block b = NewContentBlock("hello");
    REQUIRE(a != b);
    b.Set(PROP_IDENT, "id-1");
    REQUIRE(a == b);

    b.SetPayload({'h', 'i'});
    REQUIRE(a != b);
}

TEST_CASE("BlockList - Insert and render", "[block]") {
    BlockList list;
    list.Add(NewContentBlock("a"));
    list.Add(NewContentBlock("d"));

    BlockList middle;
    middle.Add(NewContentBlock("b"));
    middle.Add(NewContentBlock("c"));

    SECTION("Insert shifts later elements") {
        list.Insert(1, middle);
        REQUIRE(list.Size() == 4);
        REQUIRE(list.Get(0).PayloadText() == "a");
        REQUIRE(list.Get(1).PayloadText() == "b");
        REQUIRE(list.Get(2).PayloadText() == "c");
        REQUIRE(list.Get(3).PayloadText() == "d");
    }

    SECTION("Position past the end appends") {
        list.Insert(10, middle);
        REQUIRE(list.Size() == 4);
        REQUIRE(list.Get(3).PayloadText() == "c");
    }

    SECTION("Render a range") {
        list.Insert(1, middle);
        REQUIRE(list.ToString(1, 3) == list.Get(1).ToString() + list.Get(2).ToString());
        REQUIRE(list.ToString(3, 100) == list.Get(3).ToString());
        REQUIRE(list.ToString(2, 2).empty());
        REQUIRE(list.ToString() == list.ToString(0, list.Size()));
    }

    SECTION("Out of range access throws") {
        REQUIRE_THROWS_AS(list.Get(5), std::out_of_range);
    }
}
