#include "idlspec/linker.hpp"
#include "idlspec/errors.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace idlspec {

Linker::Linker(SpecContext& ctx, const Scope& scope, Options opts): ctx_(ctx), scope_(scope), opts_(opts) {
    if(!scope_.sealed()) throw std::logic_error("linking requires a sealed scope");
}

void Linker::link(SpecId id){
    Spec& s = ctx_.at(id);
    switch(s.state){
        case LinkState::Linked:
        case LinkState::Linking: return; // done, or a cycle back to a spec higher up
        case LinkState::Failed: std::rethrow_exception(s.failure);
        case LinkState::Unlinked: break;
    }
    if(opts_.trace) std::cerr << "[link] " << ctx_.to_string(id) << "\n";
    s.state = LinkState::Linking;
    ++depth_;
    try {
        link_data(id);
    } catch(const link_error&){
        --depth_;
        s.state = LinkState::Failed;
        s.failure = std::current_exception();
        rollback_pending();
        throw;
    } catch(...){
        --depth_;
        s.state = LinkState::Unlinked;
        rollback_pending();
        throw;
    }
    --depth_;
    pending_.push_back(id);
    if(depth_ == 0) commit_pending();
}

void Linker::commit_pending(){
    for(SpecId p : pending_) ctx_.at(p).state = LinkState::Linked;
    pending_.clear();
}

void Linker::rollback_pending(){
    for(SpecId p : pending_) ctx_.at(p).state = LinkState::Unlinked;
    pending_.clear();
}

void Linker::link_ref(SpecRef& ref, Expect expect){
    if(auto u = std::get_if<Unresolved>(&ref)){
        auto found = scope_.lookup(u->name);
        if(!found) throw unresolved_reference_error(u->name, u->line);
        const Spec& target = ctx_.at(*found);
        if(expect == Expect::Type && target.is_service())
            throw reference_kind_error(u->name, "is a service, not a type", u->line);
        if(expect == Expect::Service && !target.is_service())
            throw reference_kind_error(u->name, "is not a service", u->line);
        if(opts_.trace) std::cerr << "[link]   " << u->name << " -> #" << *found << "\n";
        ref = *found;
    }
    link(std::get<SpecId>(ref));
}

void Linker::link_fields(FieldGroup& group){
    for(auto& f : group) link_ref(f.type, Expect::Type);
}

void Linker::link_data(SpecId id){
    spec_data& data = ctx_.at(id).data;
    if(auto l = std::get_if<ListSpec>(&data)){
        link_ref(l->value, Expect::Type);
    } else if(auto st = std::get_if<SetSpec>(&data)){
        link_ref(st->value, Expect::Type);
    } else if(auto m = std::get_if<MapSpec>(&data)){
        link_ref(m->key, Expect::Type);
        link_ref(m->value, Expect::Type);
    } else if(auto s = std::get_if<StructSpec>(&data)){
        link_fields(s->fields);
    } else if(auto td = std::get_if<TypedefSpec>(&data)){
        link_ref(td->target, Expect::Type);
        check_typedef_chain(id);
    } else if(auto svc = std::get_if<ServiceSpec>(&data)){
        if(svc->parent){
            link_ref(*svc->parent, Expect::Service);
            check_inheritance_chain(id);
        }
        for(auto& fn : svc->functions){
            link_fields(fn.args);
            if(fn.result){
                if(fn.result->return_type) link_ref(*fn.result->return_type, Expect::Type);
                link_fields(fn.result->exceptions);
            }
        }
    }
    // primitives and enums hold no references
}

void Linker::check_typedef_chain(SpecId id){
    std::vector<SpecId> chain{id};
    std::unordered_set<SpecId> seen{id};
    SpecId cur = id;
    while(auto td = std::get_if<TypedefSpec>(&ctx_.at(cur).data)){
        if(!is_resolved(td->target)) return; // still being linked further up
        cur = std::get<SpecId>(td->target);
        chain.push_back(cur);
        if(!seen.insert(cur).second){
            std::string text;
            for(size_t i = 0; i < chain.size(); ++i){ if(i) text += " -> "; text += ctx_.at(chain[i]).name; }
            throw typedef_cycle_error(text, ctx_.at(id).line);
        }
    }
}

void Linker::check_inheritance_chain(SpecId id){
    std::vector<SpecId> chain{id};
    std::unordered_set<SpecId> seen{id};
    SpecId cur = id;
    for(;;){
        const auto& svc = std::get<ServiceSpec>(ctx_.at(cur).data);
        if(!svc.parent || !is_resolved(*svc.parent)) return;
        cur = std::get<SpecId>(*svc.parent);
        chain.push_back(cur);
        if(!seen.insert(cur).second){
            std::string text;
            for(size_t i = 0; i < chain.size(); ++i){ if(i) text += " -> "; text += ctx_.at(chain[i]).name; }
            throw inheritance_cycle_error(text, ctx_.at(id).line);
        }
    }
}

} // namespace idlspec
