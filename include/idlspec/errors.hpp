// Error taxonomy for compile and link failures.
#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace idlspec {

// Root of every error raised by the compiler, scope and linker.
// code() is a stable diagnostic code (E2xxx); line() is the source line the
// error is attributed to (0 if unknown).
class idl_error : public std::runtime_error {
public:
    idl_error(std::string code, const std::string& message, int line)
        : std::runtime_error(message), code_(std::move(code)), line_(line) {}
    const std::string& code() const noexcept { return code_; }
    int line() const noexcept { return line_; }
private:
    std::string code_;
    int line_;
};

// ---- compile-time (local) errors ----

class compile_error : public idl_error {
public:
    using idl_error::idl_error;
};

// E2001: the same identifier was used twice in one namespace.
class duplicate_name_error : public compile_error {
public:
    duplicate_name_error(const std::string& name, int original_line, int line);
    const std::string& name() const noexcept { return name_; }
    int original_line() const noexcept { return original_line_; }
private:
    std::string name_;
    int original_line_;
};

// E2002: two fields of one group share an id.
class duplicate_field_id_error : public compile_error {
public:
    duplicate_field_id_error(int64_t id, const std::string& name, const std::string& original, int original_line, int line);
    int64_t id() const noexcept { return id_; }
    const std::string& name() const noexcept { return name_; }
private:
    int64_t id_;
    std::string name_;
};

// E2003: a field declares a default value where none is allowed.
class illegal_default_value_error : public compile_error {
public:
    illegal_default_value_error(const std::string& field, const std::string& context, int line);
    const std::string& field() const noexcept { return field_; }
private:
    std::string field_;
};

// E2004
class illegal_requiredness_error : public compile_error {
public:
    illegal_requiredness_error(const std::string& field, const std::string& context, int line);
    const std::string& field() const noexcept { return field_; }
private:
    std::string field_;
};

// E2005
class oneway_function_error : public compile_error {
public:
    oneway_function_error(const std::string& function, const std::string& reason, int line);
};

// E2006
class invalid_field_id_error : public compile_error {
public:
    invalid_field_id_error(const std::string& field, const std::string& reason, int line);
};

// Wraps a failure raised while compiling a nested list with the name of the
// owner: `cannot compile "bar": <cause>`. Carries the code of its cause.
// Must be constructed inside the handler that caught `cause`.
class wrapping_error : public compile_error {
public:
    wrapping_error(std::string owner, int owner_line, const compile_error& cause);
    const std::string& owner() const noexcept { return owner_; }
    // The wrapped error, rethrowable for programmatic inspection.
    std::exception_ptr cause() const noexcept { return cause_; }
    // Message of the wrapped error without the owner prefix.
    const std::string& reason() const noexcept { return reason_; }
private:
    std::string owner_;
    std::string reason_;
    std::exception_ptr cause_;
};

// ---- link-time (name resolution) errors ----

class link_error : public idl_error {
public:
    using idl_error::idl_error;
};

// E2101: `<name> is not defined`
class unresolved_reference_error : public link_error {
public:
    unresolved_reference_error(const std::string& name, int line);
    const std::string& name() const noexcept { return name_; }
private:
    std::string name_;
};

// E2102: a name resolved to a spec of the wrong kind.
class reference_kind_error : public link_error {
public:
    reference_kind_error(const std::string& name, const std::string& reason, int line);
    const std::string& name() const noexcept { return name_; }
private:
    std::string name_;
};

// E2103
class typedef_cycle_error : public link_error {
public:
    typedef_cycle_error(const std::string& chain, int line);
};

// E2104
class inheritance_cycle_error : public link_error {
public:
    inheritance_cycle_error(const std::string& chain, int line);
};

} // namespace idlspec
