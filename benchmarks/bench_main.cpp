#include "ini/ini.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; size_t entries; };

static RunResult bench_case(const char* name, const std::string &doc, int reps){
    size_t n = 0;
    auto t0 = Clock::now();
    for(int i=0;i<reps;++i){
        try {
            n = ini::parse(doc).size();
        } catch(const ini::parse_error& e){
            std::cerr << "[bench] case '" << name << "' failed: " << e.what() << "\n";
            return {0.0, 0};
        }
    }
    auto t1 = Clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count() / reps;
    return { ms, n };
}

static std::string make_doc(int sections, int keys, const std::string& valueOf, bool continued){
    std::string out;
    for(int s=0;s<sections;++s){
        out += "; section " + std::to_string(s) + "\n[sec" + std::to_string(s) + "]\n";
        for(int k=0;k<keys;++k){
            out += "key" + std::to_string(k) + " = " + valueOf;
            if(continued) out += " \\\n    tail " + std::to_string(k);
            out += "   ; trailing comment\n";
        }
        out += "\n";
    }
    return out;
}

int main(){
    struct Case { const char* name; std::string doc; };
    std::vector<Case> cases;

    // Case 1: plain unquoted values
    cases.push_back({ "plain", make_doc(100, 50, "some plain value", false) });
    // Case 2: quoted values holding comment characters
    cases.push_back({ "quoted", make_doc(100, 50, "\"DSN='server'; UID='user'; PWD='pas#word';\"", false) });
    // Case 3: values continued across two lines
    cases.push_back({ "continued", make_doc(100, 50, "Aname, Bname,", true) });

    std::cout << "name,ms_parse,entries\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, c.doc, 20);
        std::cout << c.name << "," << r.ms_parse << "," << r.entries << "\n";
    }
    return 0;
}
