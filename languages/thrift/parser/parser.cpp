#include "parser.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>
#include <stdexcept>
#include <string>

namespace thriftlang {

namespace pegtl = tao::pegtl;
namespace pt = tao::pegtl::parse_tree;
namespace g = pegtl_front::grammar;
namespace ast = idlspec::ast;

namespace {

// Only these rules become tree nodes; everything else is matched and dropped.
template<typename Rule>
using selector = pt::selector< Rule,
    pt::store_content::on<
        g::include_path, g::namespace_scope, g::namespace_name,
        g::typedef_decl, g::enum_decl, g::struct_decl, g::union_decl, g::exception_decl, g::service_decl,
        g::def_name, g::extends_name, g::item_name, g::enum_value, g::enum_item,
        g::function, g::function_name, g::throws_clause, g::kw_oneway,
        g::field, g::field_id, g::field_name, g::kw_required, g::kw_optional,
        g::base_type, g::map_type, g::list_type, g::set_type, g::named_type,
        g::const_int, g::const_double, g::const_string, g::const_ident,
        g::const_list, g::const_map, g::const_map_entry > >;

// Literal that parsed but cannot be represented (e.g. integer overflow).
struct literal_error : std::runtime_error {
    int line;
    literal_error(const std::string& msg, int l): std::runtime_error(msg), line(l) {}
};

int line_of(const pt::node& n){ return static_cast<int>(n.begin().line); }

std::string unquote(const std::string& s){ return s.size() >= 2 ? s.substr(1, s.size() - 2) : s; }

int64_t parse_int(const pt::node& n){
    const std::string s = n.string();
    size_t i = 0; bool neg = false;
    if(i < s.size() && (s[i]=='+' || s[i]=='-')){ neg = s[i]=='-'; ++i; }
    int base = 10;
    if(s.size() > i+1 && s[i]=='0' && (s[i+1]=='x' || s[i+1]=='X')){ base = 16; i += 2; }
    // keep the sign on the digits so INT64_MIN is representable
    const std::string digits = (neg ? "-" : "") + s.substr(i);
    try {
        return std::stoll(digits, nullptr, base);
    } catch(const std::out_of_range&){
        throw literal_error("integer literal " + s + " is out of range", line_of(n));
    }
}

bool is_type_node(const pt::node& n){
    return n.is_type<g::base_type>() || n.is_type<g::named_type>() || n.is_type<g::map_type>()
        || n.is_type<g::list_type>() || n.is_type<g::set_type>();
}

bool is_const_node(const pt::node& n){
    return n.is_type<g::const_int>() || n.is_type<g::const_double>() || n.is_type<g::const_string>()
        || n.is_type<g::const_ident>() || n.is_type<g::const_list>() || n.is_type<g::const_map>();
}

ast::BaseType base_of(const std::string& s){
    if(s=="bool") return ast::BaseType::Bool;
    if(s=="byte" || s=="i8") return ast::BaseType::I8;
    if(s=="i16") return ast::BaseType::I16;
    if(s=="i32") return ast::BaseType::I32;
    if(s=="i64") return ast::BaseType::I64;
    if(s=="double") return ast::BaseType::Double;
    if(s=="string") return ast::BaseType::String;
    if(s=="binary") return ast::BaseType::Binary;
    throw std::logic_error("unknown base type " + s);
}

ast::type_ptr build_type(const pt::node& n){
    int line = line_of(n);
    if(n.is_type<g::base_type>()) return ast::make_base(base_of(n.string()), line);
    if(n.is_type<g::named_type>()) return ast::make_named(n.string(), line);
    if(n.is_type<g::list_type>()) return ast::make_list(build_type(*n.children.at(0)), line);
    if(n.is_type<g::set_type>()) return ast::make_set(build_type(*n.children.at(0)), line);
    if(n.is_type<g::map_type>()) return ast::make_map(build_type(*n.children.at(0)), build_type(*n.children.at(1)), line);
    throw std::logic_error("unexpected type node " + std::string(n.type));
}

ast::const_ptr build_const(const pt::node& n){
    auto c = std::make_shared<ast::ConstValue>();
    c->line = line_of(n);
    if(n.is_type<g::const_int>()){ c->kind = ast::ConstValue::Kind::Int; c->int_value = parse_int(n); }
    else if(n.is_type<g::const_double>()){
        c->kind = ast::ConstValue::Kind::Double;
        try {
            c->double_value = std::stod(n.string());
        } catch(const std::out_of_range&){
            throw literal_error("double literal " + n.string() + " is out of range", c->line);
        }
    }
    else if(n.is_type<g::const_string>()){ c->kind = ast::ConstValue::Kind::String; c->text = unquote(n.string()); }
    else if(n.is_type<g::const_ident>()){ c->kind = ast::ConstValue::Kind::Identifier; c->text = n.string(); }
    else if(n.is_type<g::const_list>()){
        c->kind = ast::ConstValue::Kind::List;
        for(const auto& e : n.children) c->elems.push_back(build_const(*e));
    } else if(n.is_type<g::const_map>()){
        c->kind = ast::ConstValue::Kind::Map;
        for(const auto& e : n.children) c->entries.emplace_back(build_const(*e->children.at(0)), build_const(*e->children.at(1)));
    }
    return c;
}

ast::Field build_field(const pt::node& n){
    ast::Field f;
    for(const auto& c : n.children){
        if(c->is_type<g::field_id>()) f.id = parse_int(*c);
        else if(c->is_type<g::kw_required>()) f.requiredness = ast::Requiredness::Required;
        else if(c->is_type<g::kw_optional>()) f.requiredness = ast::Requiredness::Optional;
        else if(c->is_type<g::field_name>()){ f.name = c->string(); f.line = line_of(*c); }
        else if(is_type_node(*c)) f.type = build_type(*c);
        else if(is_const_node(*c)) f.default_value = build_const(*c);
    }
    return f;
}

ast::Function build_function(const pt::node& n){
    ast::Function fn;
    for(const auto& c : n.children){
        if(c->is_type<g::kw_oneway>()) fn.oneway = true;
        else if(c->is_type<g::function_name>()){ fn.name = c->string(); fn.line = line_of(*c); }
        else if(is_type_node(*c)) fn.return_type = build_type(*c);
        else if(c->is_type<g::field>()) fn.params.push_back(build_field(*c));
        else if(c->is_type<g::throws_clause>())
            for(const auto& e : c->children) fn.exceptions.push_back(build_field(*e));
    }
    return fn;
}

ast::Definition build_definition(const pt::node& n){
    using K = ast::Definition::Kind;
    ast::Definition d;
    if(n.is_type<g::typedef_decl>()) d.kind = K::Typedef;
    else if(n.is_type<g::enum_decl>()) d.kind = K::Enum;
    else if(n.is_type<g::struct_decl>()) d.kind = K::Struct;
    else if(n.is_type<g::union_decl>()) d.kind = K::Union;
    else if(n.is_type<g::exception_decl>()) d.kind = K::Exception;
    else d.kind = K::Service;
    for(const auto& c : n.children){
        if(c->is_type<g::def_name>()){ d.name = c->string(); d.line = line_of(*c); }
        else if(c->is_type<g::extends_name>()){ d.extends = c->string(); d.extends_line = line_of(*c); }
        else if(c->is_type<g::field>()) d.fields.push_back(build_field(*c));
        else if(c->is_type<g::function>()) d.functions.push_back(build_function(*c));
        else if(is_type_node(*c)) d.target = build_type(*c);
        else if(c->is_type<g::enum_item>()){
            ast::EnumItem item;
            for(const auto& ic : c->children){
                if(ic->is_type<g::item_name>()){ item.name = ic->string(); item.line = line_of(*ic); }
                else if(ic->is_type<g::enum_value>()) item.value = parse_int(*ic);
            }
            d.items.push_back(std::move(item));
        }
    }
    return d;
}

ast::Program build_program(const pt::node& root){
    ast::Program p;
    for(size_t i = 0; i < root.children.size(); ++i){
        const auto& c = root.children[i];
        if(c->is_type<g::include_path>()) p.includes.push_back(ast::Include{unquote(c->string()), line_of(*c)});
        else if(c->is_type<g::namespace_scope>()){
            // always followed by its namespace_name
            const auto& name = root.children.at(++i);
            p.namespaces.push_back(ast::Namespace{c->string(), name->string(), line_of(*c)});
        }
        else p.definitions.push_back(build_definition(*c));
    }
    return p;
}

} // namespace

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    ParseResult r;
    try {
        auto root = pt::parse< g::document, selector >(in);
        if(!root){ r.error_message = "not a Thrift document"; return r; }
        r.program = build_program(*root);
        r.success = true;
    } catch(const pegtl::parse_error& e){
        auto p = e.positions().front();
        r.error_message = std::string(e.message());
        r.line = static_cast<int>(p.line);
        r.column = static_cast<int>(p.column);
    } catch(const literal_error& e){
        r.error_message = e.what();
        r.line = e.line;
    }
    return r;
}

} // namespace thriftlang
