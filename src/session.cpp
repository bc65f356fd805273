#include "idlspec/session.hpp"
#include "idlspec/compiler.hpp"
#include "idlspec/errors.hpp"
#include "idlspec/linker.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace idlspec {

namespace {

int edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    std::vector<int> prev(m+1), cur(m+1);
    for(size_t j=0;j<=m;++j) prev[j]=(int)j;
    for(size_t i=1;i<=n;++i){
        cur[0]=(int)i;
        for(size_t j=1;j<=m;++j){ int c = a[i-1]==b[j-1]?0:1; cur[j]=std::min({prev[j]+1, cur[j-1]+1, prev[j-1]+c}); }
        std::swap(prev,cur);
    }
    return prev[m];
}

std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist=2){
    std::vector<std::string> out; for(auto &c: pool){ if(c.empty()||c==target) continue; if(edit_distance(target,c)<=maxDist) out.push_back(c); }
    if(out.size()>5) out.resize(5); return out;
}

void append_suggestions(Diagnostic& d, const std::vector<std::string>& suggs){
    if(suggs.empty()) return;
    std::string msg="did you mean ";
    for(size_t i=0;i<suggs.size();++i){ msg+=suggs[i]; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
    d.notes.push_back(DiagnosticNote{msg,d.line});
}

std::string hint_for(const std::string& code){
    if(code=="E2001") return "rename one of the declarations";
    if(code=="E2002") return "give every field of the list its own ID";
    if(code=="E2003") return "remove the default value";
    if(code=="E2004") return "union fields must be optional";
    if(code=="E2005") return "oneway functions return void and throw nothing";
    if(code=="E2006") return "use a field ID between 1 and 32767";
    if(code=="E2101") return "define the name or include the unit that defines it";
    if(code=="E2102") return "refer to a type where a type is expected and to a service after extends";
    if(code=="E2103") return "make one typedef in the chain refer to a concrete type";
    if(code=="E2104") return "remove one extends clause from the chain";
    return "";
}

// Notes for each level of a wrapped error, outermost first.
void append_cause_notes(Diagnostic& d, const wrapping_error& w){
    try {
        std::rethrow_exception(w.cause());
    } catch(const wrapping_error& inner){
        d.notes.push_back(DiagnosticNote{"in \"" + inner.owner() + "\"", inner.line()});
        append_cause_notes(d, inner);
    } catch(const idl_error& inner){
        d.notes.push_back(DiagnosticNote{inner.what(), inner.line()});
    }
}

} // namespace

std::string include_alias(const std::string& path){
    auto slash = path.find_last_of("/\\");
    std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = base.rfind('.');
    return dot == std::string::npos ? base : base.substr(0, dot);
}

const Unit* Session::find_unit(const std::string& name) const {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : it->second;
}

Diagnostic Session::make_diagnostic(const idl_error& e, const Scope* scope) const {
    Diagnostic d{e.code(), e.what(), hint_for(e.code()), e.line(), {}};
    if(auto w = dynamic_cast<const wrapping_error*>(&e)) append_cause_notes(d, *w);
    if(auto u = dynamic_cast<const unresolved_reference_error*>(&e); u && scope && opts_.suggestions)
        append_suggestions(d, fuzzy_candidates(u->name(), scope->names()));
    return d;
}

const Unit& Session::compile_unit(const std::string& name, const ast::Program& program){
    if(by_name_.count(name)) throw std::invalid_argument("unit \"" + name + "\" has already been compiled");
    // Registered only once every phase ran; a throw leaves the session untouched.
    auto owned = std::make_unique<Unit>(name);
    Unit& unit = *owned;
    auto publish = [&]() -> const Unit& {
        by_name_[name] = &unit;
        units_.push_back(std::move(owned));
        return unit;
    };

    for(const auto& inc : program.includes){
        std::string alias = include_alias(inc.path);
        const Unit* other = find_unit(alias);
        if(!other){
            unit.errors.push_back(Diagnostic{"E2201", "include \"" + inc.path + "\" has not been compiled", "compile included units first", inc.line, {}});
            continue;
        }
        if(!other->success){
            unit.errors.push_back(Diagnostic{"E2202", "included unit \"" + other->scope.unit() + "\" failed to compile", "fix the errors in the included unit", inc.line, {}});
            continue;
        }
        unit.scope.include(alias, other->scope);
    }

    // Phase 1: compile every definition independently.
    Compiler compiler(ctx_, opts_);
    std::vector<const ast::Definition*> compiled;
    for(const auto& def : program.definitions){
        try {
            unit.specs.push_back(compiler.compile(def));
            compiled.push_back(&def);
        } catch(const compile_error& e){
            unit.errors.push_back(make_diagnostic(e, nullptr));
        }
    }

    // Phase 2: assemble the scope.
    for(size_t i = 0; i < compiled.size(); ++i){
        try {
            unit.scope.add(compiled[i]->name, unit.specs[i], compiled[i]->line);
        } catch(const duplicate_name_error& e){
            unit.errors.push_back(make_diagnostic(e, nullptr));
        }
    }
    unit.scope.seal();
    if(!unit.errors.empty()){
        if(opts_.trace) std::cerr << "[session] " << name << ": " << unit.errors.size() << " error(s) before linking\n";
        return publish();
    }

    // Phase 3: link every top-level spec. A spec that fails because one it
    // refers to failed reports the same error; report it once.
    Linker linker(ctx_, unit.scope, opts_);
    for(size_t i = 0; i < unit.specs.size(); ++i){
        try {
            linker.link(unit.specs[i]);
        } catch(const link_error& e){
            Diagnostic d = make_diagnostic(e, &unit.scope);
            bool seen = std::any_of(unit.errors.begin(), unit.errors.end(), [&](const Diagnostic& x){
                return x.code == d.code && x.message == d.message && x.line == d.line; });
            if(seen) continue;
            d.notes.insert(d.notes.begin(), DiagnosticNote{"while linking \"" + compiled[i]->name + "\"", compiled[i]->line});
            unit.errors.push_back(std::move(d));
        }
    }
    unit.success = unit.errors.empty();
    if(opts_.trace) std::cerr << "[session] " << name << ": " << unit.specs.size() << " spec(s), " << (unit.success ? "linked" : "failed") << "\n";
    return publish();
}

} // namespace idlspec
