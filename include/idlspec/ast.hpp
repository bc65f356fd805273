// Syntax-tree input consumed by the compiler (produced by a frontend parser).
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace idlspec::ast {

enum class BaseType {
    Bool,
    I8,
    I16,
    I32,
    I64,
    Double,
    String,
    Binary
};

struct TypeReference;
struct ConstValue;
using type_ptr = std::shared_ptr<TypeReference>;
using const_ptr = std::shared_ptr<ConstValue>;

struct TypeReference {
    enum class Kind { Base, Map, List, Set, Named } kind = Kind::Base;
    BaseType base{};  // Base
    std::string name; // Named (may be dotted: include.Name)
    type_ptr key;     // Map
    type_ptr value;   // Map, List, Set
    int line = 0;
};

// Literal tree for default values. Never evaluated by the core.
struct ConstValue {
    enum class Kind { Int, Double, String, Identifier, List, Map } kind = Kind::Int;
    int64_t int_value = 0;
    double double_value = 0;
    std::string text; // String, Identifier
    std::vector<const_ptr> elems;
    std::vector<std::pair<const_ptr, const_ptr>> entries;
    int line = 0;
};

enum class Requiredness { Default, Required, Optional };

struct Field {
    std::optional<int64_t> id;
    Requiredness requiredness = Requiredness::Default;
    type_ptr type;
    std::string name;
    const_ptr default_value;
    int line = 0;
};

struct Function {
    std::string name;
    bool oneway = false;
    type_ptr return_type; // null for void
    std::vector<Field> params;
    std::vector<Field> exceptions;
    int line = 0;
};

struct EnumItem {
    std::string name;
    std::optional<int64_t> value;
    int line = 0;
};

struct Definition {
    enum class Kind { Struct, Union, Exception, Enum, Typedef, Service } kind = Kind::Struct;
    std::string name;
    int line = 0;
    std::vector<Field> fields;        // Struct, Union, Exception
    std::vector<EnumItem> items;      // Enum
    type_ptr target;                  // Typedef
    std::optional<std::string> extends; // Service
    int extends_line = 0;
    std::vector<Function> functions;  // Service
};

struct Include {
    std::string path;
    int line = 0;
};

struct Namespace {
    std::string scope;
    std::string name;
    int line = 0;
};

struct Program {
    std::vector<Include> includes;
    std::vector<Namespace> namespaces;
    std::vector<Definition> definitions;
};

// Helpers used by frontends and tests to build type references.
inline type_ptr make_base(BaseType b, int line = 0) {
    auto t = std::make_shared<TypeReference>();
    t->kind = TypeReference::Kind::Base;
    t->base = b;
    t->line = line;
    return t;
}
inline type_ptr make_named(std::string name, int line = 0) {
    auto t = std::make_shared<TypeReference>();
    t->kind = TypeReference::Kind::Named;
    t->name = std::move(name);
    t->line = line;
    return t;
}
inline type_ptr make_list(type_ptr value, int line = 0) {
    auto t = std::make_shared<TypeReference>();
    t->kind = TypeReference::Kind::List;
    t->value = std::move(value);
    t->line = line;
    return t;
}
inline type_ptr make_set(type_ptr value, int line = 0) {
    auto t = std::make_shared<TypeReference>();
    t->kind = TypeReference::Kind::Set;
    t->value = std::move(value);
    t->line = line;
    return t;
}
inline type_ptr make_map(type_ptr key, type_ptr value, int line = 0) {
    auto t = std::make_shared<TypeReference>();
    t->kind = TypeReference::Kind::Map;
    t->key = std::move(key);
    t->value = std::move(value);
    t->line = line;
    return t;
}

inline const char* kind_name(Definition::Kind k) {
    switch (k) {
    case Definition::Kind::Struct: return "struct";
    case Definition::Kind::Union: return "union";
    case Definition::Kind::Exception: return "exception";
    case Definition::Kind::Enum: return "enum";
    case Definition::Kind::Typedef: return "typedef";
    case Definition::Kind::Service: return "service";
    }
    return "?";
}

} // namespace idlspec::ast
