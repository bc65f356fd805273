// Name -> Spec registry used by the linker.
#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "idlspec/spec.hpp"

namespace idlspec {

// Built once per compilation unit after all of its definitions have been
// compiled, then sealed. Included units are layered by alias and reached
// through dotted names ("shared.Foo").
class Scope {
public:
    Scope() = default;
    explicit Scope(std::string unit): unit_(std::move(unit)) {}

    // Throws duplicate_name_error if `name` is already registered.
    void add(const std::string& name, SpecId id, int line);
    // Layer an included unit. The included scope must outlive this one.
    void include(const std::string& alias, const Scope& other);
    void seal(){ sealed_ = true; }
    bool sealed() const { return sealed_; }

    std::optional<SpecId> lookup(const std::string& name) const;
    // Every name this scope can resolve, local ones first (qualified for includes).
    std::vector<std::string> names() const;
    const std::string& unit() const { return unit_; }
    bool empty() const { return entries_.empty() && includes_.empty(); }

private:
    struct Entry { SpecId id; int line; };
    std::string unit_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, const Scope*> includes_;
    std::vector<std::string> include_order_;
    bool sealed_{false};
    void check_open() const;
    std::optional<SpecId> lookup_local(const std::string& name) const;
};

} // namespace idlspec
