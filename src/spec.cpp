#include "idlspec/spec.hpp"
#include "idlspec/errors.hpp"
#include <stdexcept>
#include <unordered_set>

namespace idlspec {

SpecId resolved(const SpecRef& r){
    if(auto id = std::get_if<SpecId>(&r)) return *id;
    throw std::logic_error("reference to \"" + std::get<Unresolved>(r).name + "\" has not been linked");
}

const char* base_name(BaseType b){
    switch(b){
        case BaseType::Bool: return "bool";
        case BaseType::I8: return "i8";
        case BaseType::I16: return "i16";
        case BaseType::I32: return "i32";
        case BaseType::I64: return "i64";
        case BaseType::Double: return "double";
        case BaseType::String: return "string";
        case BaseType::Binary: return "binary";
    }
    return "?";
}

// ---- FieldGroup ----

void FieldGroup::add(FieldSpec field, const Options& opts){
    if(auto it = by_name_.find(field.name); it != by_name_.end())
        throw duplicate_name_error(field.name, fields_[it->second].line, field.line);
    if(auto it = by_id_.find(field.id); it != by_id_.end()){
        const FieldSpec& prev = fields_[it->second];
        throw duplicate_field_id_error(field.id, field.name, prev.name, prev.line, field.line);
    }
    if(opts.forbid_defaults && field.default_value)
        throw illegal_default_value_error(field.name, opts.context, field.line);
    if(opts.forbid_required && field.requiredness == Requiredness::Required)
        throw illegal_requiredness_error(field.name, opts.context, field.line);
    size_t idx = fields_.size();
    by_name_.emplace(field.name, idx);
    by_id_.emplace(field.id, idx);
    fields_.push_back(std::move(field));
}

const FieldSpec* FieldGroup::find(const std::string& name) const {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : &fields_[it->second];
}

const FieldSpec& FieldGroup::at(const std::string& name) const {
    if(auto f = find(name)) return *f;
    throw std::out_of_range("no field named \"" + name + "\"");
}

// ---- SpecContext ----

SpecContext::SpecContext(){
    // seed primitives in BaseType order; they are born linked
    for(int b = 0; b <= static_cast<int>(BaseType::Binary); ++b){
        Spec s;
        s.name = base_name(static_cast<BaseType>(b));
        s.data = PrimitiveSpec{static_cast<BaseType>(b)};
        s.state = LinkState::Linked;
        base_ids_.push_back(add(std::move(s)));
    }
}

SpecId SpecContext::add(Spec s){
    SpecId id = static_cast<SpecId>(specs_.size());
    specs_.push_back(std::move(s));
    return id;
}

void SpecContext::truncate(size_t mark){
    if(mark < base_ids_.size()) throw std::logic_error("cannot truncate primitive specs");
    if(mark < specs_.size()) specs_.erase(specs_.begin() + static_cast<std::ptrdiff_t>(mark), specs_.end());
}

std::string SpecContext::to_string(const SpecRef& r) const {
    if(auto u = std::get_if<Unresolved>(&r)) return u->name;
    return to_string(std::get<SpecId>(r));
}

std::string SpecContext::to_string(SpecId id) const {
    const Spec& s = at(id);
    if(auto l = std::get_if<ListSpec>(&s.data)) return "list<" + to_string(l->value) + ">";
    if(auto st = std::get_if<SetSpec>(&s.data)) return "set<" + to_string(st->value) + ">";
    if(auto m = std::get_if<MapSpec>(&s.data)) return "map<" + to_string(m->key) + ", " + to_string(m->value) + ">";
    return s.name;
}

// ---- consumer helpers ----

SpecId root_type(const SpecContext& ctx, SpecId id){
    std::unordered_set<SpecId> seen;
    while(auto td = std::get_if<TypedefSpec>(&ctx.at(id).data)){
        if(!seen.insert(id).second) throw std::logic_error("typedef cycle through \"" + ctx.at(id).name + "\"");
        id = resolved(td->target);
    }
    return id;
}

const FunctionSpec* find_function(const SpecContext& ctx, SpecId service, const std::string& name){
    std::unordered_set<SpecId> seen;
    std::optional<SpecId> cur = service;
    while(cur && seen.insert(*cur).second){
        const auto* svc = std::get_if<ServiceSpec>(&ctx.at(*cur).data);
        if(!svc) return nullptr;
        if(auto fn = svc->find_function(name)) return fn;
        cur.reset();
        if(svc->parent) cur = resolved(*svc->parent);
    }
    return nullptr;
}

} // namespace idlspec
