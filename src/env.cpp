#include "ini/env.hpp"
#include <cstdlib>

namespace ini {

// Reads process env vars and constructs a ParseEnv.
ParseEnv detect_env(){
    ParseEnv e{};
    auto flag = [](const char* k)->bool{
        const char* v = std::getenv(k);
        return v && (v[0]=='1' || v[0]=='t' || v[0]=='T' || v[0]=='y' || v[0]=='Y');
    };

    e.debugScan = flag("INI_DEBUG_SCAN");
    e.diagJson = flag("INI_DIAG_JSON");

    return e;
}

} // namespace ini
