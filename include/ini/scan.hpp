// Line splitting, classification and quote-aware key/value scanning
#pragma once
#include "ini/ini.hpp"
#include <string>
#include <string_view>

namespace ini
{
    namespace detail
    {
        enum class quote_state
        {
            normal,
            in_single,
            in_double
        };

        inline bool is_space(char c) { return c == ' ' || c == '\t' || c == '\f' || c == '\v'; }
        inline bool is_comment_start(char c) { return c == ';' || c == '#'; }
        inline bool is_quote(char c) { return c == '"' || c == '\''; }

        inline std::string_view trim_left(std::string_view s)
        {
            size_t b = 0;
            while (b < s.size() && is_space(s[b]))
                ++b;
            return s.substr(b);
        }
        inline std::string_view trim_right(std::string_view s)
        {
            size_t e = s.size();
            while (e > 0 && is_space(s[e - 1]))
                --e;
            return s.substr(0, e);
        }
        inline std::string_view trim(std::string_view s) { return trim_right(trim_left(s)); }

        // Advance the quote state by one character. Any quote opens from normal;
        // only the matching character closes.
        inline quote_state step_quote(quote_state s, char c)
        {
            switch (s)
            {
            case quote_state::normal:
                if (c == '"')
                    return quote_state::in_double;
                if (c == '\'')
                    return quote_state::in_single;
                return s;
            case quote_state::in_double:
                return c == '"' ? quote_state::normal : s;
            case quote_state::in_single:
                return c == '\'' ? quote_state::normal : s;
            }
            return s;
        }

        // Splits a document into physical lines on CR, LF or CRLF.
        // reset() restarts from the beginning.
        struct line_reader
        {
            std::string_view d;
            size_t p = 0;
            int line = 0; // number of the line last returned
            explicit line_reader(std::string_view s) : d(s) {}
            bool eof() const { return p >= d.size(); }
            void reset()
            {
                p = 0;
                line = 0;
            }
            bool next(std::string_view &out)
            {
                if (eof())
                    return false;
                size_t e = d.find_first_of("\r\n", p);
                if (e == std::string_view::npos)
                {
                    out = d.substr(p);
                    p = d.size();
                }
                else
                {
                    out = d.substr(p, e - p);
                    p = e + 1;
                    if (d[e] == '\r' && p < d.size() && d[p] == '\n')
                        ++p;
                }
                ++line;
                return true;
            }
        };

        enum class line_kind
        {
            blank,
            section_header,
            content
        };

        struct classified_line
        {
            line_kind kind = line_kind::blank;
            std::string_view text; // content: the raw line; section_header: the name
        };

        // Classify one physical line. `pending` is true while a value continues from the
        // previous line and `carried` is the quote state it left open. Malformed headers
        // throw parse_error only when no continuation is pending; a pending entry treats
        // them as content.
        classified_line classify_line(std::string_view text, bool pending, quote_state carried, int line);

        struct key_scan
        {
            std::string key;        // trimmed and unquoted
            std::string_view rest;  // everything after the '='
        };

        // Locate the first unquoted '=' of an entry's first line.
        // Throws expected_key_equals / empty_key.
        key_scan scan_key(std::string_view text, int line);

        struct value_fragment
        {
            std::string text;
            bool continued = false;      // line ended with '\'
            bool trailing_space = false; // whitespace before an unquoted '\' was dropped
        };

        // Scan one line of value text, carrying `qs` across lines. Comments are dropped
        // only in normal state; an open quote keeps the rest of the line literal.
        value_fragment scan_value(std::string_view text, quote_state &qs);

        // Strip matching boundary quotes when the inner text holds that quote only
        // as doubled pairs; otherwise return the trimmed text unchanged.
        std::string unquote(std::string_view s);

        inline const char *kind_name(line_kind k)
        {
            switch (k)
            {
            case line_kind::blank:
                return "blank";
            case line_kind::section_header:
                return "section";
            case line_kind::content:
                return "content";
            }
            return "?";
        }

    } // namespace detail
} // namespace ini
