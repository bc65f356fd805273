// Replaces Unresolved references with handles found through a Scope.
#pragma once
#include "idlspec/features.hpp"
#include "idlspec/scope.hpp"
#include "idlspec/spec.hpp"
#include <vector>

namespace idlspec {

class Linker {
public:
    // The scope must be sealed.
    Linker(SpecContext& ctx, const Scope& scope, Options opts = {});

    // Resolve every reference reachable from `id`, recursing into the specs
    // they point at. Linking an already linked spec (or one currently being
    // linked further up the stack) is a no-op; linking a spec that failed
    // before rethrows its original error. Throws link_error.
    //
    // Nested specs are only committed Linked when the outermost call returns.
    // If that call fails, the specs still on the stack are Failed and the
    // finished nested ones go back to Unlinked, so a later link reaches the
    // failure again (or succeeds if it never depended on it).
    void link(SpecId id);

private:
    enum class Expect { Type, Service };

    SpecContext& ctx_;
    const Scope& scope_;
    Options opts_;
    int depth_ = 0;
    std::vector<SpecId> pending_; // finished below the outermost call, not yet committed

    void commit_pending();
    void rollback_pending();
    void link_data(SpecId id);
    void link_ref(SpecRef& ref, Expect expect);
    void link_fields(FieldGroup& group);
    void check_typedef_chain(SpecId id);
    void check_inheritance_chain(SpecId id);
};

// One-shot helper.
inline void link(SpecContext& ctx, SpecId id, const Scope& scope){ Linker(ctx, scope).link(id); }

} // namespace idlspec
