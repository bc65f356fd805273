#pragma once
#include <cstdlib>

namespace idlspec {
inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}
// Flags that default to on unless explicitly disabled with 0/f/n.
inline bool flag_not_disabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return true;
    return !(*v=='0' || *v=='f' || *v=='F' || *v=='n' || *v=='N');
}
inline bool trace_enabled(){ return flag_enabled("IDLSPEC_TRACE"); }
inline bool diag_json_enabled(){ return flag_enabled("IDLSPEC_DIAG_JSON"); }

struct Options {
    // Reject fields without an explicit id instead of assigning one.
    bool strict_field_ids = false;
    // Attach "did you mean" notes to unresolved-reference diagnostics.
    bool suggestions = true;
    // [compile]/[link] lines on stderr.
    bool trace = false;

    static Options from_env(){
        Options o;
        o.strict_field_ids = flag_enabled("IDLSPEC_STRICT_FIELD_IDS");
        o.suggestions = flag_not_disabled("IDLSPEC_SUGGEST");
        o.trace = trace_enabled();
        return o;
    }
};
}
