// INI document parser: sections, quoted keys/values, comments and line continuation
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <stdexcept>

namespace ini
{

    enum class error_code
    {
        key_before_section,
        invalid_section_header,
        expected_key_equals,
        empty_key
    };

    // Stable diagnostic name, e.g. "KeyBeforeSection".
    const char *error_code_name(error_code c);

    struct parse_error : std::runtime_error
    {
        parse_error(error_code c, int line, std::string message, std::string origin = {});

        error_code code() const { return code_; }
        int line() const { return line_; }
        const std::string &message() const { return message_; }
        const std::string &origin() const { return origin_; }

    private:
        error_code code_;
        int line_;
        std::string message_;
        std::string origin_;
    };

    // Thrown by load_file when the document cannot be read.
    struct io_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    struct entry
    {
        std::string section;
        std::string key;
        std::string value;
        int line = -1; // line the entry started on
    };

    // Composite key "section.key" -> value. Later duplicates overwrite earlier ones.
    using mapping = std::unordered_map<std::string, std::string>;

    inline std::string composite_key(std::string_view section, std::string_view key)
    {
        std::string out;
        out.reserve(section.size() + key.size() + 1);
        out.append(section);
        out += '.';
        out.append(key);
        return out;
    }

    // Parse a whole document. Throws parse_error; no partial result on failure.
    mapping parse(std::string_view src);

    // Same pass as parse(), entries in document order with duplicates kept.
    std::vector<entry> parse_entries(std::string_view src);

    struct ParseDiagnostic
    {
        error_code code;
        std::string message;
        int line = -1;
    };

    struct ParseResult
    {
        bool success = false;
        mapping values;
        std::vector<ParseDiagnostic> errors;
    };

    // Non-throwing form of parse().
    ParseResult try_parse(std::string_view src);

    // Pretty printers. Output re-parses to the same values; throws std::invalid_argument
    // for sections, keys or values that have no INI spelling (e.g. embedded newlines).
    std::string to_string(const std::vector<entry> &entries);
    // Composite keys are split at the first '.' leaving a printable section and key;
    // output is sorted by section then key.
    std::string to_string(const mapping &values);

} // namespace ini
