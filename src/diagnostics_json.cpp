#include "idlspec/diagnostics_json.hpp"
#include "idlspec/features.hpp"
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace idlspec {

namespace {

// Appends a compact JSON document to a string. Commas between members and
// elements are tracked per nesting level.
class JsonWriter {
public:
    JsonWriter& begin_object(){ separate(); out_ += '{'; first_.push_back(true); return *this; }
    JsonWriter& end_object(){ out_ += '}'; first_.pop_back(); return *this; }
    JsonWriter& begin_array(){ separate(); out_ += '['; first_.push_back(true); return *this; }
    JsonWriter& end_array(){ out_ += ']'; first_.pop_back(); return *this; }

    JsonWriter& key(const std::string& k){
        separate();
        quote(k);
        out_ += ':';
        after_key_ = true;
        return *this;
    }

    JsonWriter& value(const std::string& s){ separate(); quote(s); return *this; }
    JsonWriter& value(int n){ separate(); out_ += std::to_string(n); return *this; }
    JsonWriter& value(bool b){ separate(); out_ += b ? "true" : "false"; return *this; }

    void quote(const std::string& s){
        out_ += '"';
        for(char c : s){
            switch(c){
                case '"': out_ += "\\\""; break;
                case '\\': out_ += "\\\\"; break;
                case '\n': out_ += "\\n"; break;
                case '\r': out_ += "\\r"; break;
                case '\t': out_ += "\\t"; break;
                default: {
                    auto u = static_cast<unsigned char>(c);
                    if(u >= 0x20){ out_ += c; break; }
                    char esc[8];
                    std::snprintf(esc, sizeof(esc), "\\u%04X", static_cast<unsigned>(u));
                    out_ += esc;
                }
            }
        }
        out_ += '"';
    }

    std::string take(){ return std::move(out_); }

private:
    std::string out_;
    std::vector<bool> first_;
    bool after_key_ = false;

    void separate(){
        if(after_key_){ after_key_ = false; return; }
        if(first_.empty()) return;
        if(!first_.back()) out_ += ',';
        first_.back() = false;
    }
};

void write_diagnostic(JsonWriter& w, const Diagnostic& d){
    w.begin_object()
        .key("code").value(d.code)
        .key("message").value(d.message)
        .key("hint").value(d.hint)
        .key("line").value(d.line)
        .key("notes").begin_array();
    for(const auto& n : d.notes)
        w.begin_object().key("message").value(n.message).key("line").value(n.line).end_object();
    w.end_array().end_object();
}

} // namespace

std::string json_escape(const std::string& s){
    JsonWriter w;
    w.quote(s);
    return w.take();
}

std::string diagnostics_to_json(const Unit& u){
    JsonWriter w;
    w.begin_object()
        .key("unit").value(u.name)
        .key("success").value(u.success)
        .key("errors").begin_array();
    for(const auto& e : u.errors) write_diagnostic(w, e);
    w.end_array().end_object();
    return w.take();
}

void maybe_print_json(const Unit& u){
    if(!diag_json_enabled()) return;
    std::fprintf(stderr, "%s\n", diagnostics_to_json(u).c_str());
}

} // namespace idlspec
