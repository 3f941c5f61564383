// Pretty printer output and its limits
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "ini/ini.hpp"

using namespace ini;

static bool rejects(const std::vector<entry>& es){
    try { (void)to_string(es); } catch(const std::invalid_argument&){ return true; }
    return false;
}

void run_writer_tests(){
    std::vector<entry> es{
        {"General", "Cases", "5000"},
        {"General", "Empty", ""},
        {"General", "Dsn", "DSN='server'; PWD='pas#word';"},
        {"escape", "t w", "  padded  "},
        {"escape", "a=b", "say \"hi\" ; now"},
        {"escape", "[x", "v"},
        {"escape", "path", "C:\\dir\\"},
    };
    std::string text = to_string(es);
    assert(text ==
        "[General]\n"
        "Cases = 5000\n"
        "Empty =\n"
        "Dsn = \"DSN='server'; PWD='pas#word';\"\n"
        "\n"
        "[escape]\n"
        "t w = \"  padded  \"\n"
        "\"a=b\" = 'say \"hi\" ; now'\n"
        "\"[x\" = v\n"
        "path = \"C:\\dir\\\"\n");

    auto m = parse(text);
    assert(m.size() == 7);
    for(const auto& e : es) assert(m.at(composite_key(e.section, e.key)) == e.value);

    // mapping form is sorted by section then key
    mapping mm{{"b.z", "1"}, {"a.y", "2"}, {"a.x", "3"}};
    assert(to_string(mm) == "[a]\nx = 3\ny = 2\n\n[b]\nz = 1\n");
    // a section name starting with '.' is split after it
    assert(to_string(parse("[.x]\nk = 1\n")) == "[.x]\nk = 1\n");
    assert(to_string(mapping{{"..v", "3"}}) == "[.]\nv = 3\n");

    assert(rejects({{"s", "k", "two\nlines"}}));
    assert(rejects({{"s", "", "v"}}));
    assert(rejects({{"", "k", "v"}}));
    assert(rejects({{"a]b", "k", "v"}}));
    assert(rejects({{" s", "k", "v"}}));
    // both quote kinds and a comment character: no spelling survives
    assert(rejects({{"s", "k", "'a' \"b\" ;c"}}));

    bool threw = false;
    try { (void)to_string(mapping{{"nodot", "v"}}); } catch(const std::invalid_argument&){ threw = true; }
    assert(threw);

    std::cout << "Writer tests passed\n";
}
