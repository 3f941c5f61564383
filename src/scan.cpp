// Line classification and quote-aware scanning for ini entries.
#include "ini/scan.hpp"

namespace ini::detail {

classified_line classify_line(std::string_view text, bool pending, quote_state carried, int line){
    std::string_view t = trim(text);
    if(t.empty()) return {line_kind::blank, {}};
    // comment lines only exist between entries; inside a continuation they are value text
    if(!pending && is_comment_start(t[0])) return {line_kind::blank, {}};

    if(t[0]=='[' && (!pending || carried==quote_state::normal)){
        size_t nEnd = t.find(']');
        size_t nRem = t.find_first_of(";#");
        bool bad = nEnd==std::string_view::npos || (nRem!=std::string_view::npos && nRem<nEnd);
        std::string_view name = bad ? std::string_view{} : trim(t.substr(1, nEnd-1));
        if(!name.empty()) return {line_kind::section_header, name};
        if(!pending) throw parse_error(error_code::invalid_section_header, line, "invalid section name");
    }
    return {line_kind::content, text};
}

key_scan scan_key(std::string_view text, int line){
    quote_state qs = quote_state::normal;
    for(size_t i=0; i<text.size(); ++i){
        char c = text[i];
        if(qs==quote_state::normal){
            if(c=='='){
                std::string key = unquote(text.substr(0, i));
                if(key.empty()) throw parse_error(error_code::empty_key, line, "empty key");
                return {std::move(key), text.substr(i+1)};
            }
            if(is_comment_start(c)) break;
        }
        qs = step_quote(qs, c);
    }
    throw parse_error(error_code::expected_key_equals, line, "expected key=...");
}

value_fragment scan_value(std::string_view text, quote_state &qs){
    size_t end = text.size();
    for(size_t i=0; i<text.size(); ++i){
        char c = text[i];
        if(qs==quote_state::normal && is_comment_start(c)){ end = i; break; }
        qs = step_quote(qs, c);
    }

    value_fragment f;
    std::string_view v = trim_right(text.substr(0, end));
    if(!v.empty() && v.back()=='\\'){
        f.continued = true;
        v.remove_suffix(1);
        // '\' is not a quote character, so qs is also the state at the backslash
        if(qs==quote_state::normal){
            std::string_view t = trim_right(v);
            f.trailing_space = t.size()!=v.size();
            v = t;
        }
    }
    f.text.assign(v.data(), v.size());
    return f;
}

std::string unquote(std::string_view s){
    s = trim(s);
    if(s.size()<2 || !is_quote(s.front()) || s.back()!=s.front()) return std::string(s);
    const char q = s.front();
    std::string_view inner = s.substr(1, s.size()-2);
    for(size_t i=0; i<inner.size(); ++i){
        if(inner[i]!=q) continue;
        if(i+1<inner.size() && inner[i+1]==q){ ++i; continue; } // doubled quote is escaped
        return std::string(s);
    }
    return std::string(inner);
}

} // namespace ini::detail
