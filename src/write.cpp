// Pretty printer: entries or mappings back to ini text that re-parses to the same values.
#include "ini/ini.hpp"
#include "ini/scan.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace ini {

namespace {

bool has_line_break(std::string_view s){ return s.find_first_of("\r\n") != std::string_view::npos; }

// Does `spelled`, written after "key = ", read back as `v`?
bool survives_as_value(const std::string& spelled, const std::string& v){
    detail::quote_state qs = detail::quote_state::normal;
    auto f = detail::scan_value(spelled, qs);
    return !f.continued && detail::unquote(f.text) == v;
}

// Does `spelled`, written before " = ", read back as key `k`?
bool survives_as_key(const std::string& spelled, const std::string& k){
    if(spelled.empty() || spelled[0]=='[' || detail::is_comment_start(spelled[0])) return false;
    const std::string line = spelled + " = x";
    try {
        auto ks = detail::scan_key(line, 0);
        return ks.key == k && detail::trim(ks.rest) == "x";
    } catch(const parse_error&){
        return false;
    }
}

// First of raw, "..." and '...' that reads back as `s`; empty when none does.
template <class Survives>
std::optional<std::string> try_spell(const std::string& s, Survives survives){
    if(!has_line_break(s)){
        const std::string candidates[] = { s, '"' + s + '"', '\'' + s + '\'' };
        for(const auto& c : candidates) if(survives(c, s)) return c;
    }
    return std::nullopt;
}

template <class Survives>
std::string spell(const std::string& s, const char* what, Survives survives){
    if(auto c = try_spell(s, survives)) return *c;
    throw std::invalid_argument(std::string(what) + " has no ini spelling: " + s);
}

bool section_spellable(const std::string& name){
    return !name.empty() && !has_line_break(name) && detail::trim(name).size()==name.size()
        && name.find_first_of("];#") == std::string::npos;
}

std::string spell_section(const std::string& name){
    if(!section_spellable(name)) throw std::invalid_argument("section has no ini spelling: " + name);
    return "[" + name + "]";
}

// Split "section.key" at the first '.' that leaves a printable section and key.
// Section names may themselves contain dots ("[.x]" yields ".x.k").
entry split_composite(const std::string& composite, const std::string& value){
    for(size_t dot = composite.find('.'); dot != std::string::npos; dot = composite.find('.', dot+1)){
        std::string section = composite.substr(0, dot);
        std::string key = composite.substr(dot+1);
        if(section_spellable(section) && try_spell(key, survives_as_key))
            return entry{std::move(section), std::move(key), value};
    }
    throw std::invalid_argument("not a section.key composite: " + composite);
}

} // namespace

std::string to_string(const std::vector<entry>& entries){
    std::string out;
    const std::string* cur = nullptr;
    for(const auto& e : entries){
        if(!cur || *cur != e.section){
            if(cur) out += '\n';
            out += spell_section(e.section);
            out += '\n';
            cur = &e.section;
        }
        out += spell(e.key, "key", survives_as_key);
        out += " =";
        if(!e.value.empty()){ out += ' '; out += spell(e.value, "value", survives_as_value); }
        out += '\n';
    }
    return out;
}

std::string to_string(const mapping& values){
    std::vector<entry> entries;
    entries.reserve(values.size());
    for(const auto& kv : values){
        entries.push_back(split_composite(kv.first, kv.second));
    }
    std::sort(entries.begin(), entries.end(), [](const entry& a, const entry& b){
        if(a.section != b.section) return a.section < b.section;
        return a.key < b.key;
    });
    return to_string(entries);
}

} // namespace ini
