#include "idlspec/scope.hpp"
#include "idlspec/errors.hpp"
#include <stdexcept>

namespace idlspec {

void Scope::check_open() const {
    if(sealed_) throw std::logic_error("scope \"" + unit_ + "\" is sealed");
}

void Scope::add(const std::string& name, SpecId id, int line){
    check_open();
    auto it = entries_.find(name);
    if(it != entries_.end()) throw duplicate_name_error(name, it->second.line, line);
    entries_.emplace(name, Entry{id, line});
    order_.push_back(name);
}

void Scope::include(const std::string& alias, const Scope& other){
    check_open();
    if(includes_.emplace(alias, &other).second) include_order_.push_back(alias);
}

std::optional<SpecId> Scope::lookup(const std::string& name) const {
    if(auto it = entries_.find(name); it != entries_.end()) return it->second.id;
    auto dot = name.find('.');
    if(dot == std::string::npos) return std::nullopt;
    auto inc = includes_.find(name.substr(0, dot));
    if(inc == includes_.end()) return std::nullopt;
    // included units expose only their own definitions
    return inc->second->lookup_local(name.substr(dot + 1));
}

std::optional<SpecId> Scope::lookup_local(const std::string& name) const {
    auto it = entries_.find(name);
    if(it == entries_.end()) return std::nullopt;
    return it->second.id;
}

std::vector<std::string> Scope::names() const {
    std::vector<std::string> out(order_);
    for(const auto& alias : include_order_)
        for(const auto& n : includes_.at(alias)->order_) out.push_back(alias + "." + n);
    return out;
}

} // namespace idlspec
