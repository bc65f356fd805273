#include <filesystem>
#include <iostream>
#include <string>
#include "../loader/loader.hpp"
#include "idlspec/session.hpp"

namespace fs = std::filesystem;
using namespace idlspec;

static const char* requiredness_prefix(Requiredness r){
    switch(r){
        case Requiredness::Required: return "required ";
        case Requiredness::Optional: return "optional ";
        default: return "";
    }
}

static std::string describe_fields(const SpecContext& ctx, const FieldGroup& g){
    std::string out;
    for(const auto& f : g){
        if(!out.empty()) out += ", ";
        out += std::to_string(f.id) + ": " + requiredness_prefix(f.requiredness) + ctx.to_string(f.type) + " " + f.name;
        if(f.default_value) out += " = ...";
    }
    return out;
}

static void print_spec(std::ostream& os, const SpecContext& ctx, SpecId id){
    const Spec& s = ctx.at(id);
    if(auto st = std::get_if<StructSpec>(&s.data)){
        const char* kw = st->kind == StructKind::Union ? "union" : st->kind == StructKind::Exception ? "exception" : "struct";
        os << kw << " " << s.name << " { " << describe_fields(ctx, st->fields) << " }\n";
    } else if(auto e = std::get_if<EnumSpec>(&s.data)){
        os << "enum " << s.name << " {";
        for(size_t i = 0; i < e->items.size(); ++i) os << (i ? ", " : " ") << e->items[i].name << " = " << e->items[i].value;
        os << " }\n";
    } else if(auto td = std::get_if<TypedefSpec>(&s.data)){
        os << "typedef " << ctx.to_string(td->target) << " " << s.name << "\n";
    } else if(auto svc = std::get_if<ServiceSpec>(&s.data)){
        os << "service " << s.name;
        if(svc->parent) os << " extends " << ctx.to_string(*svc->parent);
        os << "\n";
        for(const auto& fn : svc->functions){
            os << "  " << (fn.oneway ? "oneway " : "");
            os << (fn.result && fn.result->return_type ? ctx.to_string(*fn.result->return_type) : std::string("void"));
            os << " " << fn.name << "(" << describe_fields(ctx, fn.args) << ")";
            if(fn.result && !fn.result->exceptions.empty()) os << " throws (" << describe_fields(ctx, fn.result->exceptions) << ")";
            os << "\n";
        }
    }
}

int main(int argc, char** argv){
    try{
        if(argc < 2){
            std::cerr << "usage: idlspecc <input-file>\n";
            return 2;
        }
        const fs::path path = argv[1];
        Session session;
        thriftlang::Loader loader(session, std::cerr);
        const Unit* unit = loader.load(path);
        if(!unit) return 1;
        if(!unit->success) return 1;
        for(SpecId id : unit->specs) print_spec(std::cout, session.context(), id);
        return 0;
    } catch(const std::exception& e){
        std::cerr << "idlspecc: exception: " << e.what() << "\n";
        return 1;
    }
}
