#include <cassert>
#include <iostream>
#include <string>
#include "idlspec/diagnostics_json.hpp"
#include "test_util.hpp"

using namespace idlspec;

// Compile in a fresh session and serialize directly (no reliance on IDLSPEC_DIAG_JSON).
static std::string to_json(const char* src){
    Options opts;
    Session session(opts);
    const Unit& u = session.compile_unit("json", idlspec_test::parse(src));
    return diagnostics_to_json(u);
}

static void test_json_success(){
    auto js = to_json("struct S { 1: i32 a }");
    assert(js.find("\"unit\":\"json\"")!=std::string::npos);
    assert(js.find("\"success\":true")!=std::string::npos);
    assert(js.find("\"errors\":[]")!=std::string::npos);
}

static void test_json_error_with_notes(){
    // wrapped duplicate: one cause note
    auto js = to_json("service Svc {\n  void f(1: string a, 2: string a)\n}");
    assert(js.find("\"success\":false")!=std::string::npos);
    auto pos = js.find("\"code\":\"E2001\"");
    assert(pos!=std::string::npos);
    // message quotes must be escaped
    assert(js.find("cannot compile \\\"f\\\"")!=std::string::npos);
    auto notesPos = js.find("\"notes\":[{", pos);
    assert(notesPos!=std::string::npos);
    assert(js.find("\"line\":2", pos)!=std::string::npos);
}

static void test_json_layout(){
    Unit u("layout");
    Diagnostic d;
    d.code = "E2101"; d.message = "X is not defined"; d.hint = ""; d.line = 3;
    d.notes.push_back(DiagnosticNote{"while linking \"S\"", 1});
    d.notes.push_back(DiagnosticNote{"did you mean \"Y\"?", 0});
    u.errors.push_back(d);
    u.errors.push_back(Diagnostic{"E2001", "dup", "", 7, {}});
    assert(diagnostics_to_json(u) ==
        "{\"unit\":\"layout\",\"success\":false,\"errors\":["
        "{\"code\":\"E2101\",\"message\":\"X is not defined\",\"hint\":\"\",\"line\":3,\"notes\":["
        "{\"message\":\"while linking \\\"S\\\"\",\"line\":1},"
        "{\"message\":\"did you mean \\\"Y\\\"?\",\"line\":0}]},"
        "{\"code\":\"E2001\",\"message\":\"dup\",\"hint\":\"\",\"line\":7,\"notes\":[]}]}");
}

static void test_json_escape(){
    assert(json_escape("a\"b") == "\"a\\\"b\"");
    assert(json_escape("line\nbreak\t") == "\"line\\nbreak\\t\"");
    assert(json_escape(std::string(1, '\x01')) == "\"\\u0001\"");
    assert(json_escape("\x1f\\") == "\"\\u001F\\\\\"");
}

int run_diagnostics_json_tests(){
    std::cout << "[diagnostics] JSON tests...\n";
    test_json_success();
    test_json_error_with_notes();
    test_json_layout();
    test_json_escape();
    std::cout << "[diagnostics] JSON tests passed\n";
    return 0;
}
