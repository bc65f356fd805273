#pragma once
#include <string>
#include <string_view>
#include "idlspec/ast.hpp"

namespace thriftlang {

struct ParseResult {
    bool success{false};
    idlspec::ast::Program program;
    std::string error_message; // If !success, human-readable message
    int line{0};
    int column{0};
};

class Parser {
public:
    // Parse Thrift IDL text into definitions with source lines. Supports
    // include/namespace headers, typedef, enum, struct, union, exception and
    // service (extends, oneway, throws). Annotations and const definitions
    // are not part of the accepted language.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;
};

} // namespace thriftlang
