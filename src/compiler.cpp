#include "idlspec/compiler.hpp"
#include "idlspec/errors.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace idlspec {

namespace {
constexpr int64_t kMaxFieldId = 32767;
}

SpecId Compiler::compile(const ast::Definition& def){
    if(opts_.trace) std::cerr << "[compile] " << ast::kind_name(def.kind) << " " << def.name << " (line " << def.line << ")\n";
    size_t mark = ctx_.size();
    try {
        Spec s;
        switch(def.kind){
            case ast::Definition::Kind::Struct:
            case ast::Definition::Kind::Union:
            case ast::Definition::Kind::Exception: s = compile_struct(def); break;
            case ast::Definition::Kind::Enum: s = compile_enum(def); break;
            case ast::Definition::Kind::Typedef: s = compile_typedef(def); break;
            case ast::Definition::Kind::Service: s = compile_service(def); break;
        }
        s.name = def.name;
        s.line = def.line;
        return ctx_.add(std::move(s));
    } catch(...){
        ctx_.truncate(mark); // drop containers created for this definition
        throw;
    }
}

SpecRef Compiler::compile_type(const ast::type_ptr& t){
    if(!t) throw std::invalid_argument("type reference is missing");
    using K = ast::TypeReference::Kind;
    switch(t->kind){
        case K::Base: return ctx_.get_base(t->base);
        case K::Named: return Unresolved{t->name, t->line};
        case K::List: {
            Spec s; s.line = t->line; s.data = ListSpec{compile_type(t->value)};
            return ctx_.add(std::move(s));
        }
        case K::Set: {
            Spec s; s.line = t->line; s.data = SetSpec{compile_type(t->value)};
            return ctx_.add(std::move(s));
        }
        case K::Map: {
            Spec s; s.line = t->line;
            SpecRef key = compile_type(t->key);
            s.data = MapSpec{std::move(key), compile_type(t->value)};
            return ctx_.add(std::move(s));
        }
    }
    throw std::invalid_argument("unknown type reference kind");
}

FieldGroup Compiler::compile_fields(const std::vector<ast::Field>& fields, const FieldGroup::Options& opts){
    FieldGroup group;
    int64_t implicit = 0;
    for(const auto& f : fields){
        FieldSpec spec;
        spec.name = f.name;
        spec.line = f.line;
        spec.requiredness = f.requiredness;
        spec.default_value = f.default_value;
        if(f.id){
            if(*f.id < 1 || *f.id > kMaxFieldId)
                throw invalid_field_id_error(f.name, "has ID " + std::to_string(*f.id) + ": field IDs must be between 1 and " + std::to_string(kMaxFieldId), f.line);
            spec.id = *f.id;
        } else {
            if(opts_.strict_field_ids) throw invalid_field_id_error(f.name, "does not have an explicit ID", f.line);
            spec.id = -(++implicit); // Apache Thrift numbering for id-less fields
        }
        spec.type = compile_type(f.type);
        group.add(std::move(spec), opts);
    }
    return group;
}

Spec Compiler::compile_struct(const ast::Definition& def){
    StructSpec st;
    FieldGroup::Options opts;
    switch(def.kind){
        case ast::Definition::Kind::Union:
            st.kind = StructKind::Union;
            opts.context = "union \"" + def.name + "\"";
            opts.forbid_required = true;
            break;
        case ast::Definition::Kind::Exception:
            st.kind = StructKind::Exception;
            opts.context = "exception \"" + def.name + "\"";
            break;
        default:
            opts.context = "struct \"" + def.name + "\"";
            break;
    }
    try {
        st.fields = compile_fields(def.fields, opts);
    } catch(const compile_error& e){
        throw wrapping_error(def.name, def.line, e);
    }
    Spec s;
    s.data = std::move(st);
    return s;
}

Spec Compiler::compile_enum(const ast::Definition& def){
    EnumSpec en;
    std::unordered_map<std::string, int> seen;
    int64_t next = 0;
    try {
        for(const auto& item : def.items){
            if(auto it = seen.find(item.name); it != seen.end())
                throw duplicate_name_error(item.name, it->second, item.line);
            seen.emplace(item.name, item.line);
            int64_t value = item.value ? *item.value : next;
            en.items.push_back(EnumItemSpec{item.name, value, item.line});
            next = value + 1;
        }
    } catch(const compile_error& e){
        throw wrapping_error(def.name, def.line, e);
    }
    Spec s;
    s.data = std::move(en);
    return s;
}

Spec Compiler::compile_typedef(const ast::Definition& def){
    Spec s;
    s.data = TypedefSpec{compile_type(def.target)};
    return s;
}

Spec Compiler::compile_service(const ast::Definition& def){
    ServiceSpec svc;
    if(def.extends) svc.parent = SpecRef{Unresolved{*def.extends, def.extends_line}};
    for(const auto& fn : def.functions){
        if(auto it = svc.function_index.find(fn.name); it != svc.function_index.end())
            throw duplicate_name_error(fn.name, svc.functions[it->second].line, fn.line);
        svc.function_index.emplace(fn.name, svc.functions.size());
        svc.functions.push_back(compile_function(fn));
    }
    Spec s;
    s.data = std::move(svc);
    return s;
}

FunctionSpec Compiler::compile_function(const ast::Function& fn){
    if(fn.oneway){
        if(fn.return_type) throw oneway_function_error(fn.name, "must return void", fn.line);
        if(!fn.exceptions.empty()) throw oneway_function_error(fn.name, "cannot declare exceptions", fn.line);
    }
    FunctionSpec out;
    out.name = fn.name;
    out.line = fn.line;
    out.oneway = fn.oneway;
    try {
        FieldGroup::Options args;
        args.context = "the argument list";
        out.args = compile_fields(fn.params, args);

        FieldGroup::Options throws;
        throws.context = "the exception list";
        throws.forbid_defaults = true;
        FieldGroup exceptions = compile_fields(fn.exceptions, throws);

        if(fn.return_type || !exceptions.empty()){
            ResultSpec result;
            if(fn.return_type) result.return_type = compile_type(fn.return_type);
            result.exceptions = std::move(exceptions);
            out.result = std::move(result);
        }
    } catch(const compile_error& e){
        throw wrapping_error(fn.name, fn.line, e);
    }
    return out;
}

} // namespace idlspec
