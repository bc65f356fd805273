// Compilation session: drives compile -> scope assembly -> link for each unit
// and turns errors into diagnostics.
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "idlspec/ast.hpp"
#include "idlspec/features.hpp"
#include "idlspec/scope.hpp"
#include "idlspec/spec.hpp"

namespace idlspec {

struct DiagnosticNote { std::string message; int line=0; };
struct Diagnostic { std::string code; std::string message; std::string hint; int line=0; std::vector<DiagnosticNote> notes; };

struct Unit {
    std::string name;
    Scope scope;
    std::vector<SpecId> specs; // compiled definitions, declaration order
    bool success=false;
    std::vector<Diagnostic> errors;

    explicit Unit(std::string n): name(n), scope(std::move(n)) {}
    std::optional<SpecId> find(const std::string& spec_name) const { return scope.lookup(spec_name); }
};

class idl_error;

class Session {
public:
    explicit Session(Options opts = Options::from_env()): opts_(opts) {}

    SpecContext& context(){ return ctx_; }
    const SpecContext& context() const { return ctx_; }
    const Options& options() const { return opts_; }

    // Compile, assemble and link one unit. Included units must already have
    // been compiled in this session under their alias (see include_alias).
    // Every definition is compiled even if a sibling fails; linking only
    // happens once the whole unit compiled and its scope assembled cleanly.
    // Throws std::invalid_argument if a unit with this name already exists.
    const Unit& compile_unit(const std::string& name, const ast::Program& program);
    const Unit* find_unit(const std::string& name) const;

private:
    SpecContext ctx_;
    Options opts_;
    std::vector<std::unique_ptr<Unit>> units_;
    std::unordered_map<std::string, Unit*> by_name_;

    Diagnostic make_diagnostic(const idl_error& e, const Scope* scope) const;
};

// "path/to/shared.thrift" -> "shared"
std::string include_alias(const std::string& path);

} // namespace idlspec
