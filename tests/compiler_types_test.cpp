#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "test_util.hpp"
#include "idlspec/errors.hpp"

using namespace idlspec;
using idlspec_test::parse_one;

namespace {

struct Compiled {
    SpecContext ctx;
    SpecId id{};
};

std::unique_ptr<Compiled> compile(const std::string& src, Options opts = {}){
    auto out = std::make_unique<Compiled>();
    Compiler c(out->ctx, opts);
    out->id = c.compile(parse_one(src));
    return out;
}

const StructSpec& struct_of(const Compiled& c){ return std::get<StructSpec>(c.ctx.at(c.id).data); }

std::string compile_failure(const std::string& src, Options opts = {}){
    SpecContext ctx;
    Compiler c(ctx, opts);
    try {
        c.compile(parse_one(src));
    } catch(const compile_error& e){
        return e.code() + ": " + e.what();
    }
    return "";
}

} // namespace

TEST(CompileStruct, FieldsKeepDeclarationOrder){
    auto c = compile("struct Point { 1: required i32 x, 2: optional i32 y = 0; 3: string label }");
    const auto& st = struct_of(*c);
    EXPECT_EQ(st.kind, StructKind::Struct);
    ASSERT_EQ(st.fields.size(), 3u);
    std::vector<std::string> names;
    for(const auto& f : st.fields) names.push_back(f.name);
    EXPECT_EQ(names, (std::vector<std::string>{"x", "y", "label"}));
    EXPECT_EQ(st.fields.at("x").requiredness, Requiredness::Required);
    EXPECT_EQ(st.fields.at("y").requiredness, Requiredness::Optional);
    EXPECT_EQ(st.fields.at("label").requiredness, Requiredness::Default);
    EXPECT_EQ(st.fields.find("z"), nullptr);
    EXPECT_THROW(st.fields.at("z"), std::out_of_range);
}

TEST(CompileStruct, ImplicitIdsCountDownFromMinusOne){
    auto c = compile("struct S { string a; 5: string b; string c }");
    const auto& st = struct_of(*c);
    EXPECT_EQ(st.fields.at("a").id, -1);
    EXPECT_EQ(st.fields.at("b").id, 5);
    EXPECT_EQ(st.fields.at("c").id, -2);
}

TEST(CompileStruct, StrictFieldIdsRejectsMissingId){
    Options opts;
    opts.strict_field_ids = true;
    auto msg = compile_failure("struct S { 1: string a; string b }", opts);
    EXPECT_EQ(msg, "E2006: cannot compile \"S\": field \"b\" does not have an explicit ID");
}

TEST(CompileStruct, FieldIdOutOfRange){
    EXPECT_EQ(compile_failure("struct S { 0: string a }").substr(0, 5), "E2006");
    EXPECT_EQ(compile_failure("struct S { 32768: string a }").substr(0, 5), "E2006");
    EXPECT_EQ(compile_failure("struct S { -3: string a }").substr(0, 5), "E2006");
    EXPECT_EQ(compile_failure("struct S { 32767: string a }"), "");
}

TEST(CompileStruct, DuplicateFieldNameAndId){
    EXPECT_EQ(compile_failure("struct S {\n1: string a,\n2: i32 a\n}"),
              "E2001: cannot compile \"S\": the name \"a\" has already been used on line 2");
    EXPECT_EQ(compile_failure("struct S {\n1: string a,\n1: i32 b\n}"),
              "E2002: cannot compile \"S\": field \"b\": the field ID 1 has already been used by \"a\" on line 2");
}

TEST(CompileStruct, ContainersAreCompiledIntoTheArena){
    auto c = compile("struct S { 1: list<map<string, set<i64>>> nested, 2: list<Other> others }");
    const auto& st = struct_of(*c);
    EXPECT_EQ(c->ctx.to_string(st.fields.at("nested").type), "list<map<string, set<i64>>>");
    // Named element types wait for the linker.
    const auto& others = c->ctx.at(resolved(st.fields.at("others").type));
    const auto& list = std::get<ListSpec>(others.data);
    EXPECT_FALSE(is_resolved(list.value));
    EXPECT_EQ(c->ctx.to_string(list.value), "Other");
}

TEST(CompileStruct, FailedCompileDiscardsItsContainers){
    SpecContext ctx;
    Compiler c(ctx);
    size_t before = ctx.size();
    try {
        c.compile(parse_one("struct S { 1: list<i32> a, 1: list<i32> b }"));
        FAIL() << "expected a duplicate field id";
    } catch(const wrapping_error& e){
        EXPECT_EQ(e.code(), "E2002");
    }
    EXPECT_EQ(ctx.size(), before);
}

TEST(CompileStruct, UnionFieldsCannotBeRequired){
    auto msg = compile_failure("union U { 1: required string a }");
    EXPECT_EQ(msg, "E2004: cannot compile \"U\": field \"a\" of union \"U\" cannot be required");
    auto c = compile("union U { 1: string a = \"x\", 2: i32 b }");
    EXPECT_EQ(struct_of(*c).kind, StructKind::Union);
}

TEST(CompileStruct, ExceptionBodyAllowsDefaults){
    auto c = compile("exception Oops { 1: string message = \"boom\", 2: i32 code = 0x1F }");
    const auto& st = struct_of(*c);
    EXPECT_EQ(st.kind, StructKind::Exception);
    EXPECT_EQ(st.fields.at("message").default_value->text, "boom");
    EXPECT_EQ(st.fields.at("code").default_value->int_value, 31);
}

TEST(CompileEnum, ValuesAutoIncrement){
    auto c = compile("enum Color { RED, GREEN = 10, BLUE, ALPHA = -1, OMEGA }");
    const auto& en = std::get<EnumSpec>(c->ctx.at(c->id).data);
    ASSERT_EQ(en.items.size(), 5u);
    EXPECT_EQ(en.items[0].value, 0);
    EXPECT_EQ(en.items[1].value, 10);
    EXPECT_EQ(en.items[2].value, 11);
    EXPECT_EQ(en.items[3].value, -1);
    EXPECT_EQ(en.items[4].value, 0);
    EXPECT_TRUE(c->ctx.at(c->id).state == LinkState::Unlinked);
}

TEST(CompileEnum, DuplicateItem){
    EXPECT_EQ(compile_failure("enum E {\nA,\nB,\nA = 4\n}"),
              "E2001: cannot compile \"E\": the name \"A\" has already been used on line 2");
}

TEST(CompileTypedef, TargetIsKeptAsAReference){
    auto base = compile("typedef i64 Timestamp");
    EXPECT_EQ(resolved(std::get<TypedefSpec>(base->ctx.at(base->id).data).target), base->ctx.get_base(BaseType::I64));

    auto named = compile("typedef Other Alias");
    const auto& td = std::get<TypedefSpec>(named->ctx.at(named->id).data);
    ASSERT_FALSE(is_resolved(td.target));
    EXPECT_EQ(std::get<Unresolved>(td.target).name, "Other");
}

TEST(CompileTypedef, ByteIsAnAliasOfI8){
    auto c = compile("typedef byte Octet");
    EXPECT_EQ(resolved(std::get<TypedefSpec>(c->ctx.at(c->id).data).target), c->ctx.get_base(BaseType::I8));
}

TEST(Arena, PrimitivesAreSeededLinked){
    SpecContext ctx;
    SpecId s = ctx.get_base(BaseType::String);
    EXPECT_EQ(ctx.at(s).name, "string");
    EXPECT_TRUE(ctx.at(s).linked());
    EXPECT_THROW(ctx.truncate(0), std::logic_error);
}

TEST(Arena, CompilerRejectsMissingTypes){
    SpecContext ctx;
    Compiler c(ctx);
    ast::Definition def;
    def.kind = ast::Definition::Kind::Typedef;
    def.name = "Broken";
    EXPECT_THROW(c.compile(def), std::invalid_argument);
}
