#include <iostream>
#include <algorithm>
#include <string>
#include <vector>
#include "ini/ini.hpp"
#include "ini/file.hpp"
#include "ini/diagnostics_json.hpp"

using namespace ini;

// Prints every section.key | value pair of an ini file, sorted by composite key.
int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: ini_dump <ini-file> [--json]\n"; return 1; }
    std::string file = argv[1];
    bool json = argc>2 && std::string(argv[2])=="--json";

    std::string src;
    try { src = read_file(file); }
    catch(const io_error& e){ std::cerr << e.what() << "\n"; return 1; }

    auto res = try_parse(src);
    if(json){ std::cout << diagnostics_to_json(res) << "\n"; }
    if(!res.success){
        for(auto &e : res.errors) std::cerr << file << ": line " << e.line << ": " << error_code_name(e.code) << ": " << e.message << "\n";
        return 2;
    }
    if(json) return 0;

    std::vector<std::pair<std::string,std::string>> kv(res.values.begin(), res.values.end());
    std::sort(kv.begin(), kv.end());
    for(auto &p : kv) std::cout << p.first << " | " << p.second << "\n";
    return 0;
}
