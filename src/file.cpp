#include "ini/file.hpp"
#include <fstream>
#include <sstream>

namespace ini {

std::string read_file(const std::string& path){
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if(!ifs) throw io_error("reading ini-file failed: cannot open " + path);
    std::stringstream ss; ss<<ifs.rdbuf();
    if(ifs.bad()) throw io_error("reading ini-file failed: " + path);
    return ss.str();
}

std::optional<mapping> load_file(const std::string& path){
    if(path.empty()) return std::nullopt;
    std::string src = read_file(path);
    try {
        return parse(src);
    } catch(const parse_error& e){
        throw parse_error(e.code(), e.line(), e.message(), path);
    }
}

} // namespace ini
