// Definition -> unlinked Spec, with all local validation done eagerly.
#pragma once
#include <vector>
#include "idlspec/ast.hpp"
#include "idlspec/features.hpp"
#include "idlspec/spec.hpp"

namespace idlspec {

class Compiler {
public:
    explicit Compiler(SpecContext& ctx, Options opts = {}): ctx_(ctx), opts_(opts) {}

    // Compile one definition into a new spec whose references to other
    // definitions are still Unresolved. Throws compile_error on the first
    // local problem; a failed compile leaves nothing behind in the arena.
    SpecId compile(const ast::Definition& def);

private:
    SpecContext& ctx_;
    Options opts_;

    Spec compile_struct(const ast::Definition& def);
    Spec compile_enum(const ast::Definition& def);
    Spec compile_typedef(const ast::Definition& def);
    Spec compile_service(const ast::Definition& def);
    FunctionSpec compile_function(const ast::Function& fn);
    // The shared uniqueness-checking builder for struct bodies, argument
    // lists and throws lists.
    FieldGroup compile_fields(const std::vector<ast::Field>& fields, const FieldGroup::Options& opts);
    SpecRef compile_type(const ast::type_ptr& t);
};

} // namespace idlspec
