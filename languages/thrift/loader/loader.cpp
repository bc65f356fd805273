#include "loader.hpp"
#include "../parser/parser.hpp"
#include "idlspec/diagnostics_json.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace thriftlang {

namespace {

std::string read_all(std::istream& is){
    std::ostringstream ss; ss << is.rdbuf(); return ss.str();
}

fs::path canonical_of(const fs::path& p){
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    return ec ? p.lexically_normal() : c;
}

// Drops the in-progress mark however load() leaves; a file that produced no
// unit also gives up its alias so a later include can try it again.
struct LoadingMark {
    std::set<std::string>& loading;
    std::map<std::string, fs::path>& files;
    std::string alias;
    bool loaded = false;
    ~LoadingMark(){
        loading.erase(alias);
        if(!loaded) files.erase(alias);
    }
};

} // namespace

bool Loader::bound_elsewhere(const std::string& alias, const fs::path& file) const {
    auto it = files_.find(alias);
    return it != files_.end() && it->second != file;
}

const idlspec::Unit* Loader::load(const fs::path& path){
    const std::string alias = idlspec::include_alias(path.string());
    const fs::path file = canonical_of(path);
    if(bound_elsewhere(alias, file)){
        err_ << path.string() << ": include alias \"" << alias << "\" is already used by '"
             << files_.at(alias).string() << "'\n";
        return nullptr;
    }
    if(loading_.count(alias)){
        err_ << path.string() << ": include cycle through \"" << alias << "\"\n";
        return nullptr;
    }
    if(const idlspec::Unit* done = session_.find_unit(alias)) return done;

    files_[alias] = file;
    loading_.insert(alias);
    LoadingMark mark{loading_, files_, alias};

    std::ifstream f(path, std::ios::binary);
    if(!f){ err_ << "idlspecc: cannot open '" << path.string() << "'\n"; return nullptr; }
    const auto src = read_all(f);

    Parser p;
    auto res = p.parse_string(src, path.string());
    if(!res.success){
        err_ << path.string() << ":" << res.line << ":" << res.column << ": parse error: " << res.error_message << "\n";
        return nullptr;
    }

    bool shadowed = false;
    for(const auto& inc : res.program.includes){
        const fs::path target = path.parent_path() / inc.path;
        load(target);
        if(bound_elsewhere(idlspec::include_alias(inc.path), canonical_of(target))){
            err_ << path.string() << ":" << inc.line << ": include \"" << inc.path << "\" is shadowed by another file\n";
            shadowed = true;
        }
    }
    if(shadowed) return nullptr;

    const idlspec::Unit& unit = session_.compile_unit(alias, res.program);
    mark.loaded = true;
    if(!unit.success) report(path.string(), unit);
    return &unit;
}

void Loader::report(const std::string& path, const idlspec::Unit& u){
    idlspec::maybe_print_json(u);
    for(const auto& d : u.errors){
        err_ << path << ":" << d.line << ": error " << d.code << ": " << d.message << "\n";
        for(const auto& n : d.notes) err_ << path << ":" << n.line << ": note: " << n.message << "\n";
        if(!d.hint.empty()) err_ << "  hint: " << d.hint << "\n";
    }
}

} // namespace thriftlang
