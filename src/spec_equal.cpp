// Structural equality of spec graphs. Source lines and link state are ignored.
#include "idlspec/spec.hpp"
#include <set>
#include <utility>

namespace idlspec {

namespace {

bool const_equal(const ast::const_ptr& a, const ast::const_ptr& b){
    if(a.get() == b.get()) return true;
    if(!a || !b) return false;
    if(a->kind != b->kind) return false;
    switch(a->kind){
        case ast::ConstValue::Kind::Int: return a->int_value == b->int_value;
        case ast::ConstValue::Kind::Double: return a->double_value == b->double_value;
        case ast::ConstValue::Kind::String:
        case ast::ConstValue::Kind::Identifier: return a->text == b->text;
        case ast::ConstValue::Kind::List:
            if(a->elems.size() != b->elems.size()) return false;
            for(size_t i = 0; i < a->elems.size(); ++i) if(!const_equal(a->elems[i], b->elems[i])) return false;
            return true;
        case ast::ConstValue::Kind::Map:
            if(a->entries.size() != b->entries.size()) return false;
            for(size_t i = 0; i < a->entries.size(); ++i)
                if(!const_equal(a->entries[i].first, b->entries[i].first) || !const_equal(a->entries[i].second, b->entries[i].second)) return false;
            return true;
    }
    return false;
}

struct Comparer {
    const SpecContext& ca;
    const SpecContext& cb;
    std::set<std::pair<SpecId, SpecId>> active;

    bool ref(const SpecRef& a, const SpecRef& b){
        if(a.index() != b.index()) return false;
        if(auto ua = std::get_if<Unresolved>(&a)) return ua->name == std::get<Unresolved>(b).name;
        return spec(std::get<SpecId>(a), std::get<SpecId>(b));
    }
    bool opt_ref(const std::optional<SpecRef>& a, const std::optional<SpecRef>& b){
        if(a.has_value() != b.has_value()) return false;
        return !a || ref(*a, *b);
    }
    bool group(const FieldGroup& a, const FieldGroup& b){
        if(a.size() != b.size()) return false;
        auto ib = b.begin();
        for(const auto& fa : a){
            const auto& fb = *ib++;
            if(fa.id != fb.id || fa.name != fb.name || fa.requiredness != fb.requiredness) return false;
            if(!const_equal(fa.default_value, fb.default_value)) return false;
            if(!ref(fa.type, fb.type)) return false;
        }
        return true;
    }
    bool function(const FunctionSpec& a, const FunctionSpec& b){
        if(a.name != b.name || a.oneway != b.oneway) return false;
        if(!group(a.args, b.args)) return false;
        if(a.result.has_value() != b.result.has_value()) return false;
        if(!a.result) return true;
        return opt_ref(a.result->return_type, b.result->return_type) && group(a.result->exceptions, b.result->exceptions);
    }

    bool spec(SpecId ia, SpecId ib){
        if(&ca == &cb && ia == ib) return true;
        auto key = std::make_pair(ia, ib);
        if(active.count(key)) return true; // already under comparison (cycle)
        const Spec& a = ca.at(ia);
        const Spec& b = cb.at(ib);
        if(a.name != b.name || a.data.index() != b.data.index()) return false;
        active.insert(key);
        bool r = std::visit([&](const auto& da) { return data(da, b.data); }, a.data);
        active.erase(key);
        return r;
    }

    bool data(const PrimitiveSpec& a, const spec_data& d){ return a.base == std::get<PrimitiveSpec>(d).base; }
    bool data(const ListSpec& a, const spec_data& d){ return ref(a.value, std::get<ListSpec>(d).value); }
    bool data(const SetSpec& a, const spec_data& d){ return ref(a.value, std::get<SetSpec>(d).value); }
    bool data(const MapSpec& a, const spec_data& d){
        const auto& b = std::get<MapSpec>(d);
        return ref(a.key, b.key) && ref(a.value, b.value);
    }
    bool data(const EnumSpec& a, const spec_data& d){
        const auto& b = std::get<EnumSpec>(d);
        if(a.items.size() != b.items.size()) return false;
        for(size_t i = 0; i < a.items.size(); ++i)
            if(a.items[i].name != b.items[i].name || a.items[i].value != b.items[i].value) return false;
        return true;
    }
    bool data(const StructSpec& a, const spec_data& d){
        const auto& b = std::get<StructSpec>(d);
        return a.kind == b.kind && group(a.fields, b.fields);
    }
    bool data(const TypedefSpec& a, const spec_data& d){ return ref(a.target, std::get<TypedefSpec>(d).target); }
    bool data(const ServiceSpec& a, const spec_data& d){
        const auto& b = std::get<ServiceSpec>(d);
        if(!opt_ref(a.parent, b.parent)) return false;
        if(a.functions.size() != b.functions.size()) return false;
        for(const auto& fa : a.functions){
            const FunctionSpec* fb = b.find_function(fa.name);
            if(!fb || !function(fa, *fb)) return false;
        }
        return true;
    }
};

} // namespace

bool equal(const SpecContext& ca, SpecId a, const SpecContext& cb, SpecId b){
    Comparer c{ca, cb, {}};
    return c.spec(a, b);
}

} // namespace idlspec
