// Loads a .thrift file and everything it includes into a Session.
#pragma once
#include <filesystem>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include "idlspec/session.hpp"

namespace thriftlang {

class Loader {
public:
    // Parse and compile problems are written to `err` as they happen.
    Loader(idlspec::Session& session, std::ostream& err): session_(session), err_(err) {}

    // Parse and compile `path` after its includes. Returns null if the file
    // could not be read or parsed, or if its alias is already bound to a
    // different file; the includer then reports the include as missing.
    const idlspec::Unit* load(const std::filesystem::path& path);

private:
    idlspec::Session& session_;
    std::ostream& err_;
    std::set<std::string> loading_;
    std::map<std::string, std::filesystem::path> files_; // alias -> file it names

    bool bound_elsewhere(const std::string& alias, const std::filesystem::path& file) const;
    void report(const std::string& path, const idlspec::Unit& unit);
};

} // namespace thriftlang
