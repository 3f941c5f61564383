// ini.cpp - continuation accumulator and result builder over the line scanner
#include "ini/ini.hpp"
#include "ini/scan.hpp"
#include "ini/env.hpp"
#include "ini/diagnostics_json.hpp"

#include <cstdio>
#include <optional>
#include <utility>

namespace ini
{

const char* error_code_name(error_code c){
	switch(c){
		case error_code::key_before_section: return "KeyBeforeSection";
		case error_code::invalid_section_header: return "InvalidSectionHeader";
		case error_code::expected_key_equals: return "ExpectedKeyEquals";
		case error_code::empty_key: return "EmptyKey";
	}
	return "Unknown";
}

static std::string format_error(int line, const std::string& message, const std::string& origin){
	std::string out;
	if(!origin.empty()) out += origin + ": ";
	out += "line " + std::to_string(line) + ": " + message;
	return out;
}

parse_error::parse_error(error_code c, int line, std::string message, std::string origin)
	: std::runtime_error(format_error(line, message, origin)), code_(c), line_(line),
	  message_(std::move(message)), origin_(std::move(origin)) {}

namespace {

using detail::quote_state;
using detail::line_kind;

// Entry whose value is still being accumulated across continued lines.
struct pending_entry {
	std::string key;
	std::string value;
	int line = -1;
	quote_state quote = quote_state::normal;
	bool join_space = false; // previous fragment dropped whitespace before its '\'
};

class parser {
public:
	parser(std::string_view src, const ParseEnv& env): reader_(src), env_(env) {}

	std::vector<entry> run(){
		std::string_view text;
		while(reader_.next(text)){
			const int ln = reader_.line;
			quote_state carried = pending_ ? pending_->quote : quote_state::normal;
			auto cl = detail::classify_line(text, pending_.has_value(), carried, ln);
			if(env_.debugScan) std::fprintf(stderr, "[dbg][scan] line=%d kind=%s pending=%d\n", ln, detail::kind_name(cl.kind), pending_?1:0);

			switch(cl.kind){
				case line_kind::blank:
					if(pending_) flush("blank line");
					break;
				case line_kind::section_header:
					if(pending_) flush("section header");
					section_.assign(cl.text.data(), cl.text.size());
					break;
				case line_kind::content:
					if(pending_) continue_entry(cl.text);
					else start_entry(cl.text, ln);
					break;
			}
		}
		if(pending_) flush("end of document");
		return std::move(out_);
	}

private:
	void start_entry(std::string_view text, int ln){
		if(section_.empty()) throw parse_error(error_code::key_before_section, ln, "only comments or empty lines can be before first section");
		auto ks = detail::scan_key(text, ln);
		pending_entry pe;
		pe.key = std::move(ks.key);
		pe.line = ln;
		auto frag = detail::scan_value(detail::trim_left(ks.rest), pe.quote);
		pe.value = std::move(frag.text);
		pe.join_space = frag.trailing_space;
		pending_ = std::move(pe);
		if(!frag.continued) flush(nullptr);
	}

	void continue_entry(std::string_view text){
		auto frag = detail::scan_value(detail::trim_left(text), pending_->quote);
		if(pending_->join_space && !frag.text.empty()) pending_->value += ' ';
		pending_->value += frag.text;
		pending_->join_space = frag.trailing_space;
		if(!frag.continued) flush(nullptr);
	}

	// Emit the pending entry; `reason` is set when a boundary ends an open continuation.
	void flush(const char* reason){
		entry e{section_, std::move(pending_->key), detail::unquote(pending_->value), pending_->line};
		pending_.reset();
		if(env_.debugScan){
			if(reason) std::fprintf(stderr, "[dbg][flush] line=%d reason=%s\n", e.line, reason);
			std::fprintf(stderr, "[dbg][entry] %s.%s = %s\n", e.section.c_str(), e.key.c_str(), e.value.c_str());
		}
		out_.push_back(std::move(e));
	}

	detail::line_reader reader_;
	ParseEnv env_;
	std::string section_;
	std::optional<pending_entry> pending_;
	std::vector<entry> out_;
};

} // namespace

std::vector<entry> parse_entries(std::string_view src){
	parser p(src, detect_env());
	return p.run();
}

mapping parse(std::string_view src){
	mapping out;
	for(auto& e : parse_entries(src)){
		out[composite_key(e.section, e.key)] = std::move(e.value);
	}
	return out;
}

ParseResult try_parse(std::string_view src){
	ParseResult r;
	try {
		r.values = parse(src);
		r.success = true;
	} catch(const parse_error& e){
		r.values.clear();
		r.errors.push_back(ParseDiagnostic{e.code(), e.message(), e.line()});
		maybe_print_json(r);
	}
	return r;
}

} // namespace ini
