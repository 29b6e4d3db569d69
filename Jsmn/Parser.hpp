#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<memory>
#include<string>
#include<vector>

namespace Jsmn { class Object; }

namespace Jsmn {

/** class Jsmn::Parser
 *
 * @brief incremental parser for a stream of JSON
 * values.
 *
 * @desc Text can be fed in arbitrary pieces.
 * Each `feed` returns every datum completed so far;
 * an incomplete trailing datum is kept for the next
 * `feed`.
 * Throws Jsmn::ParseError on malformed input.
 */
class Parser {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Parser();
	Parser(Parser&&);
	~Parser();

	std::vector<Jsmn::Object> feed(std::string const&);

	/* No partial datum is buffered.  */
	bool empty() const;
};

}

#endif /* !defined(JSMN_PARSER_HPP) */
