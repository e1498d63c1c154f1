#include "docnet/Exceptions.hpp"
#include "docnet/Vertex.hpp"
#include <gtest/gtest.h>

using docnet::Fields;
using docnet::Vertex;

namespace {

// Only accepts integers as values
class IntOnlyVertex : public Vertex {
public:
    using Vertex::Vertex;

    void set(const std::string& name, Fields value) override {
        if (!value.is_number_integer()) {
            throw docnet::TypeMismatch(value.dump() + " is not an integer");
        }
        Vertex::set(name, std::move(value));
    }
};

}

TEST(VertexFields, StartsDetachedAndEmpty) {
    Vertex v;
    EXPECT_EQ(v.place(), 0u);
    EXPECT_FALSE(v.is_inserted());
    EXPECT_EQ(v.size(), 0u);
    EXPECT_TRUE(v.pack().is_object());
}

TEST(VertexFields, SeedIsCopied) {
    Fields seed = {{"name", "Ruby"}, {"weapon", "Crescent Rose"}};
    Vertex v(seed);
    seed["name"] = "Weiss";
    seed["extra"] = 1;

    EXPECT_EQ(v.get("name"), "Ruby");
    EXPECT_FALSE(v.has("extra"));
    EXPECT_EQ(v.size(), 2u);
}

TEST(VertexFields, SeedMustBeAnObject) {
    EXPECT_THROW({ Vertex v(Fields::array({1, 2})); }, docnet::TypeMismatch);
    EXPECT_THROW({ Vertex v(Fields("text")); }, docnet::TypeMismatch);
}

TEST(VertexFields, GetSetRemove) {
    Vertex v;
    v.set("name", "Blake");
    v.set("age", 17);
    v.set("tags", Fields::array({"faunus", "huntress"}));
    v.set("nested", {{"a", {{"b", true}}}});

    EXPECT_EQ(v["name"], "Blake");
    EXPECT_EQ(v.get("age").get<int>(), 17);
    EXPECT_EQ(v.get("tags").size(), 2u);
    EXPECT_TRUE(v.get("nested")["a"]["b"].get<bool>());

    v.set("age", 18);
    EXPECT_EQ(v.get("age").get<int>(), 18);

    v.remove("age");
    EXPECT_FALSE(v.has("age"));
    EXPECT_THROW(v.get("age"), docnet::MissingField);
    EXPECT_THROW(v.remove("age"), docnet::MissingField);
}

TEST(VertexFields, MissingFieldIsANotFound) {
    Vertex v;
    try {
        v.get("ghost");
        FAIL() << "expected MissingField";
    } catch (const docnet::NotFound& e) {
        EXPECT_NE(std::string(e.what()).find("ghost"), std::string::npos);
    }
}

TEST(VertexFields, KeysKeepInsertionOrder) {
    Vertex v;
    v.set("zeta", 1);
    v.set("alpha", 2);
    v.set("mid", 3);
    EXPECT_EQ(v.keys(), (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(VertexFields, PackIsIndependent) {
    Vertex v(Fields{{"list", Fields::array({1, 2})}});
    Fields pack = v.pack();
    pack["list"].push_back(3);
    pack["new"] = "x";

    EXPECT_EQ(v.get("list").size(), 2u);
    EXPECT_FALSE(v.has("new"));
}

TEST(VertexFields, FromPackRebuildsFields) {
    Fields pack = {{"name", "Yang"}, {"power", 9000}};
    auto v = Vertex::from_pack(pack);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->pack(), pack);
    EXPECT_FALSE(v->is_inserted());
}

TEST(VertexFields, ToString) {
    Vertex v(Fields{{"a", 1}});
    EXPECT_EQ(v.to_string(), "<Vertex {\"a\":1}>");
}

TEST(VertexFields, SubclassCanValidate) {
    IntOnlyVertex v;
    v.set("count", 3);
    EXPECT_THROW(v.set("count", "three"), docnet::TypeMismatch);
    EXPECT_EQ(v.get("count").get<int>(), 3);
}
