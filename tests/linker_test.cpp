#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include "test_util.hpp"
#include "idlspec/errors.hpp"

using namespace idlspec;
using idlspec_test::compile_all;

namespace {

class LinkerTest : public ::testing::Test {
protected:
    SpecContext ctx;
    Scope scope{"main"};
    std::vector<SpecId> ids;

    void load(const std::string& src){ ids = compile_all(ctx, scope, src); }

    SpecId id_of(const std::string& name) const {
        auto id = scope.lookup(name);
        if(!id) throw std::runtime_error("no spec " + name);
        return *id;
    }

    const StructSpec& struct_of(const std::string& name) const { return std::get<StructSpec>(ctx.at(id_of(name)).data); }

    // Link `name` and return the link_error it raised.
    template<typename E = link_error>
    E link_failure(const std::string& name){
        try {
            link(ctx, id_of(name), scope);
        } catch(const E& e){
            return e;
        }
        ADD_FAILURE() << "expected " << name << " to fail linking";
        throw std::runtime_error("no error");
    }

    // Link each name in turn the way a session does, keeping going past failures.
    void link_each(std::initializer_list<const char*> names){
        for(const char* name : names){
            try { link(ctx, id_of(name), scope); } catch(const link_error&){}
        }
    }
};

} // namespace

TEST_F(LinkerTest, UnresolvedReference){
    load("struct S {\n  1: Missing m\n}");
    auto e = link_failure<unresolved_reference_error>("S");
    EXPECT_STREQ(e.what(), "Missing is not defined");
    EXPECT_EQ(e.code(), "E2101");
    EXPECT_EQ(e.name(), "Missing");
    EXPECT_EQ(e.line(), 2);
    EXPECT_EQ(ctx.at(id_of("S")).state, LinkState::Failed);
}

TEST_F(LinkerTest, FailedSpecRethrowsOriginalError){
    load("struct S { 1: Missing m }");
    auto first = link_failure<unresolved_reference_error>("S");
    auto second = link_failure<unresolved_reference_error>("S");
    EXPECT_STREQ(first.what(), second.what());
    EXPECT_EQ(first.line(), second.line());
}

TEST_F(LinkerTest, FailureSpreadsToReferrers){
    load("struct Bad { 1: Missing m }\nstruct User { 1: Bad bad }");
    auto e = link_failure<unresolved_reference_error>("User");
    EXPECT_EQ(e.name(), "Missing");
    EXPECT_EQ(ctx.at(id_of("User")).state, LinkState::Failed);
    EXPECT_EQ(ctx.at(id_of("Bad")).state, LinkState::Failed);
}

TEST_F(LinkerTest, ForwardAndMutualReferences){
    load("struct A { 1: B b }\nstruct B { 1: A a, 2: optional C c }\nstruct C { 1: i32 x }");
    link(ctx, id_of("A"), scope);
    EXPECT_TRUE(ctx.at(id_of("A")).linked());
    EXPECT_TRUE(ctx.at(id_of("B")).linked());
    EXPECT_TRUE(ctx.at(id_of("C")).linked());
    EXPECT_EQ(resolved(struct_of("A").fields.at("b").type), id_of("B"));
    EXPECT_EQ(resolved(struct_of("B").fields.at("a").type), id_of("A"));
    EXPECT_EQ(resolved(struct_of("B").fields.at("c").type), id_of("C"));
}

TEST_F(LinkerTest, SelfReferentialStructSharesOneSpec){
    load("struct Node { 1: string value, 2: list<Node> children, 3: optional Node parent }");
    link(ctx, id_of("Node"), scope);
    const auto& node = struct_of("Node");
    EXPECT_EQ(resolved(node.fields.at("parent").type), id_of("Node"));
    const auto& children = ctx.at(resolved(node.fields.at("children").type));
    EXPECT_TRUE(children.linked());
    EXPECT_EQ(resolved(std::get<ListSpec>(children.data).value), id_of("Node"));
}

TEST_F(LinkerTest, ContainerReferences){
    load("struct Key { 1: string k }\nstruct Value { 1: string v }\nstruct Table { 1: map<Key, list<Value>> rows, 2: set<Key> keys }");
    link(ctx, id_of("Table"), scope);
    EXPECT_EQ(ctx.to_string(struct_of("Table").fields.at("rows").type), "map<Key, list<Value>>");
    const auto& map = std::get<MapSpec>(ctx.at(resolved(struct_of("Table").fields.at("rows").type)).data);
    EXPECT_EQ(resolved(map.key), id_of("Key"));
    const auto& set = std::get<SetSpec>(ctx.at(resolved(struct_of("Table").fields.at("keys").type)).data);
    EXPECT_EQ(resolved(set.value), id_of("Key"));
}

TEST_F(LinkerTest, TypedefChainResolvesToRoot){
    load("typedef i32 Id\ntypedef Id UserId\nstruct User { 1: UserId id }");
    link(ctx, id_of("User"), scope);
    EXPECT_EQ(resolved(struct_of("User").fields.at("id").type), id_of("UserId"));
    EXPECT_EQ(root_type(ctx, id_of("UserId")), ctx.get_base(BaseType::I32));
    EXPECT_EQ(root_type(ctx, id_of("User")), id_of("User"));
}

TEST_F(LinkerTest, TypedefCycle){
    load("typedef B A\ntypedef A B");
    auto e = link_failure<typedef_cycle_error>("A");
    EXPECT_EQ(e.code(), "E2103");
    EXPECT_NE(std::string(e.what()).find("A -> B"), std::string::npos) << e.what();
    EXPECT_EQ(ctx.at(id_of("B")).state, LinkState::Failed);
}

TEST_F(LinkerTest, SelfTypedef){
    load("typedef Loop Loop");
    auto e = link_failure<typedef_cycle_error>("Loop");
    EXPECT_STREQ(e.what(), "typedef cycle: Loop -> Loop");
}

TEST_F(LinkerTest, RecursionThroughAStructIsNotATypedefCycle){
    load("typedef Tree Forest\nstruct Tree { 1: list<Forest> children }");
    link(ctx, id_of("Forest"), scope);
    EXPECT_TRUE(ctx.at(id_of("Tree")).linked());
}

TEST_F(LinkerTest, InheritanceCycle){
    load("service A extends B {}\nservice B extends C {}\nservice C extends A {}");
    auto e = link_failure<inheritance_cycle_error>("A");
    EXPECT_EQ(e.code(), "E2104");
    std::string msg = e.what();
    EXPECT_NE(msg.find("service inheritance cycle: "), std::string::npos) << msg;
}

TEST_F(LinkerTest, ServiceExtendingItself){
    load("service Narcissus extends Narcissus {}");
    auto e = link_failure<inheritance_cycle_error>("Narcissus");
    EXPECT_STREQ(e.what(), "service inheritance cycle: Narcissus -> Narcissus");
}

TEST_F(LinkerTest, ServiceUsedAsType){
    load("service Svc {}\nstruct S {\n  1: Svc handle\n}");
    auto e = link_failure<reference_kind_error>("S");
    EXPECT_STREQ(e.what(), "\"Svc\" is a service, not a type");
    EXPECT_EQ(e.line(), 3);
}

TEST_F(LinkerTest, ExtendingANonService){
    load("struct Base { 1: i32 x }\nservice Svc extends Base {}");
    auto e = link_failure<reference_kind_error>("Svc");
    EXPECT_STREQ(e.what(), "\"Base\" is not a service");
    EXPECT_EQ(e.code(), "E2102");
}

TEST_F(LinkerTest, UnresolvedReturnTypeInService){
    load("service Svc { Result get() }");
    auto e = link_failure<unresolved_reference_error>("Svc");
    EXPECT_EQ(e.name(), "Result");
}

TEST_F(LinkerTest, EnumsLinkTrivially){
    load("enum Color { RED, GREEN }\nstruct Pixel { 1: Color color }");
    link(ctx, id_of("Pixel"), scope);
    EXPECT_TRUE(ctx.at(id_of("Color")).linked());
}

TEST_F(LinkerTest, CycleMemberFailsWithItsRootWhenRootLinksFirst){
    load("struct A { 1: B b, 2: Missing m }\nstruct B { 1: A a }");
    auto e = link_failure<unresolved_reference_error>("A");
    EXPECT_EQ(e.name(), "Missing");
    EXPECT_NE(ctx.at(id_of("B")).state, LinkState::Linked);
    link_each({"B"});
    EXPECT_EQ(ctx.at(id_of("A")).state, LinkState::Failed);
    EXPECT_EQ(ctx.at(id_of("B")).state, LinkState::Failed);
    auto again = link_failure<unresolved_reference_error>("B");
    EXPECT_STREQ(again.what(), "Missing is not defined");
    EXPECT_EQ(again.line(), 1);
}

TEST_F(LinkerTest, CycleMemberFailsWithItsRootWhenMemberLinksFirst){
    load("struct A { 1: B b, 2: Missing m }\nstruct B { 1: A a }");
    link_each({"B", "A"});
    EXPECT_EQ(ctx.at(id_of("A")).state, LinkState::Failed);
    EXPECT_EQ(ctx.at(id_of("B")).state, LinkState::Failed);
    EXPECT_STREQ(link_failure<unresolved_reference_error>("A").what(), "Missing is not defined");
}

TEST_F(LinkerTest, SiblingOfAFailedRootStaysLinkable){
    load("struct C { 1: i32 x }\nstruct A { 1: C c, 2: Missing m }");
    link_each({"A"});
    EXPECT_EQ(ctx.at(id_of("A")).state, LinkState::Failed);
    EXPECT_EQ(ctx.at(id_of("C")).state, LinkState::Unlinked);
    link(ctx, id_of("C"), scope);
    EXPECT_TRUE(ctx.at(id_of("C")).linked());
}

TEST(LinkerSetup, RequiresASealedScope){
    SpecContext ctx;
    Scope open("open");
    EXPECT_THROW({ Linker linker(ctx, open); }, std::logic_error);
}
