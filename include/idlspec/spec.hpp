// Compiled specs and the arena that owns them.
#pragma once
#include <cstdint>
#include <deque>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include "idlspec/ast.hpp"

namespace idlspec
{

    // Stable handle into a SpecContext. Never an owning pointer.
    using SpecId = uint32_t;

    // A cross-definition reference: a name waiting for the linker, or the
    // handle it resolved to.
    struct Unresolved
    {
        std::string name;
        int line{0};
    };
    using SpecRef = std::variant<Unresolved, SpecId>;

    inline bool is_resolved(const SpecRef &r) { return std::holds_alternative<SpecId>(r); }
    // Handle of a resolved reference; throws std::logic_error if still a name.
    SpecId resolved(const SpecRef &r);

    using ast::BaseType;
    using ast::Requiredness;

    struct FieldSpec
    {
        int64_t id{0};
        std::string name;
        SpecRef type;
        Requiredness requiredness{Requiredness::Default};
        ast::const_ptr default_value; // opaque literal tree, null if absent
        int line{0};
    };

    // Ordered, name-unique and id-unique collection of fields. Insertion goes
    // through add(), which is the only place those invariants are enforced.
    class FieldGroup
    {
    public:
        struct Options
        {
            // Human-readable owner kind used in messages ("exception list", "union \"U\"").
            std::string context;
            bool forbid_defaults{false};
            bool forbid_required{false};
        };

        // Throws duplicate_name_error, duplicate_field_id_error,
        // illegal_default_value_error or illegal_requiredness_error.
        void add(FieldSpec field, const Options &opts);

        const FieldSpec *find(const std::string &name) const;
        const FieldSpec &at(const std::string &name) const;
        size_t size() const { return fields_.size(); }
        bool empty() const { return fields_.empty(); }

        std::vector<FieldSpec>::iterator begin() { return fields_.begin(); }
        std::vector<FieldSpec>::iterator end() { return fields_.end(); }
        std::vector<FieldSpec>::const_iterator begin() const { return fields_.begin(); }
        std::vector<FieldSpec>::const_iterator end() const { return fields_.end(); }

    private:
        std::vector<FieldSpec> fields_;
        std::unordered_map<std::string, size_t> by_name_;
        std::unordered_map<int64_t, size_t> by_id_;
    };

    struct ResultSpec
    {
        std::optional<SpecRef> return_type; // absent for void
        FieldGroup exceptions;
    };

    struct FunctionSpec
    {
        std::string name;
        FieldGroup args;
        std::optional<ResultSpec> result; // present iff non-void or throws
        bool oneway{false};
        int line{0};
    };

    struct PrimitiveSpec
    {
        BaseType base{};
    };
    struct ListSpec
    {
        SpecRef value;
    };
    struct SetSpec
    {
        SpecRef value;
    };
    struct MapSpec
    {
        SpecRef key;
        SpecRef value;
    };

    struct EnumItemSpec
    {
        std::string name;
        int64_t value{0};
        int line{0};
    };
    struct EnumSpec
    {
        std::vector<EnumItemSpec> items;
    };

    enum class StructKind
    {
        Struct,
        Union,
        Exception
    };
    struct StructSpec
    {
        StructKind kind{StructKind::Struct};
        FieldGroup fields;
    };

    struct TypedefSpec
    {
        SpecRef target;
    };

    struct ServiceSpec
    {
        std::optional<SpecRef> parent;
        // Declaration order is kept; lookup by name goes through find_function.
        std::vector<FunctionSpec> functions;
        std::unordered_map<std::string, size_t> function_index;

        const FunctionSpec *find_function(const std::string &name) const
        {
            auto it = function_index.find(name);
            return it == function_index.end() ? nullptr : &functions[it->second];
        }
    };

    using spec_data = std::variant<PrimitiveSpec, ListSpec, SetSpec, MapSpec, EnumSpec, StructSpec, TypedefSpec, ServiceSpec>;

    // Linking and Failed are transient/terminal markers around the single link.
    enum class LinkState
    {
        Unlinked,
        Linking,
        Linked,
        Failed
    };

    struct Spec
    {
        std::string name; // empty for containers
        int line{0};
        spec_data data;
        LinkState state{LinkState::Unlinked};
        std::exception_ptr failure; // set when state == Failed

        bool is_service() const { return std::holds_alternative<ServiceSpec>(data); }
        bool linked() const { return state == LinkState::Linked; }
    };

    // Arena owning every spec of a compilation session. References returned by
    // at() stay valid while specs are added (deque storage).
    class SpecContext
    {
    public:
        SpecContext();

        SpecId get_base(BaseType b) const { return base_ids_[static_cast<size_t>(b)]; }
        SpecId add(Spec s);

        const Spec &at(SpecId id) const { return specs_.at(id); }
        Spec &at(SpecId id) { return specs_.at(id); }
        size_t size() const { return specs_.size(); }

        // Drop every spec added after `mark` (a previous size()). Used to
        // discard the partial output of a failed compile.
        void truncate(size_t mark);

        // Thrift-style type name: "i32", "map<string, binary>", "KeyValue".
        std::string to_string(SpecId id) const;
        std::string to_string(const SpecRef &r) const;

    private:
        std::deque<Spec> specs_;
        std::vector<SpecId> base_ids_;
    };

    const char *base_name(BaseType b);

    // Follow typedef targets to the first non-typedef spec.
    SpecId root_type(const SpecContext &ctx, SpecId id);

    // Function lookup through the explicit parent chain of a linked service.
    const FunctionSpec *find_function(const SpecContext &ctx, SpecId service, const std::string &name);

    // Structural deep equality between two (possibly different) arenas. Handles
    // cycles by assuming equality for pairs already under comparison.
    bool equal(const SpecContext &ca, SpecId a, const SpecContext &cb, SpecId b);

} // namespace idlspec
