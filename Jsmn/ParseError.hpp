#ifndef JSMN_PARSEERROR_HPP
#define JSMN_PARSEERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Jsmn {

/* Thrown on malformed JSON text.  */
class ParseError : public Util::BacktraceException<std::runtime_error> {
private:
	static
	std::string describe(std::string const& input, unsigned int pos) {
		auto from = pos < 10 ? 0 : pos - 10;
		return "JSON parse error at offset " + std::to_string(pos)
		     + " near: " + input.substr(from, 20)
		     ;
	}

public:
	unsigned int position;

	ParseError(std::string const& input, unsigned int pos)
		: Util::BacktraceException<std::runtime_error>(
			describe(input, pos)
		  )
		, position(pos) { }
};

}

#endif /* !defined(JSMN_PARSEERROR_HPP) */
