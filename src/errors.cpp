#include "idlspec/errors.hpp"

namespace idlspec {

static std::string quoted(const std::string& s) { return "\"" + s + "\""; }

duplicate_name_error::duplicate_name_error(const std::string& name, int original_line, int line)
    : compile_error("E2001", "the name " + quoted(name) + " has already been used on line " + std::to_string(original_line), line),
      name_(name), original_line_(original_line) {}

duplicate_field_id_error::duplicate_field_id_error(int64_t id, const std::string& name, const std::string& original, int original_line, int line)
    : compile_error("E2002",
                    "field " + quoted(name) + ": the field ID " + std::to_string(id) + " has already been used by " + quoted(original) +
                        " on line " + std::to_string(original_line),
                    line),
      id_(id), name_(name) {}

illegal_default_value_error::illegal_default_value_error(const std::string& field, const std::string& context, int line)
    : compile_error("E2003", "field " + quoted(field) + " of " + context + " cannot have a default value", line), field_(field) {}

illegal_requiredness_error::illegal_requiredness_error(const std::string& field, const std::string& context, int line)
    : compile_error("E2004", "field " + quoted(field) + " of " + context + " cannot be required", line), field_(field) {}

oneway_function_error::oneway_function_error(const std::string& function, const std::string& reason, int line)
    : compile_error("E2005", "oneway function " + quoted(function) + " " + reason, line) {}

invalid_field_id_error::invalid_field_id_error(const std::string& field, const std::string& reason, int line)
    : compile_error("E2006", "field " + quoted(field) + " " + reason, line) {}

wrapping_error::wrapping_error(std::string owner, int owner_line, const compile_error& cause)
    : compile_error(cause.code(), "cannot compile " + quoted(owner) + ": " + cause.what(), owner_line),
      owner_(std::move(owner)), reason_(cause.what()), cause_(std::current_exception()) {}

unresolved_reference_error::unresolved_reference_error(const std::string& name, int line)
    : link_error("E2101", name + " is not defined", line), name_(name) {}

reference_kind_error::reference_kind_error(const std::string& name, const std::string& reason, int line)
    : link_error("E2102", quoted(name) + " " + reason, line), name_(name) {}

typedef_cycle_error::typedef_cycle_error(const std::string& chain, int line)
    : link_error("E2103", "typedef cycle: " + chain, line) {}

inheritance_cycle_error::inheritance_cycle_error(const std::string& chain, int line)
    : link_error("E2104", "service inheritance cycle: " + chain, line) {}

} // namespace idlspec
