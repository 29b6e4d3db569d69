#ifndef JSMN_DETAIL_DATUMIDENTIFIER_HPP
#define JSMN_DETAIL_DATUMIDENTIFIER_HPP

namespace Jsmn { namespace Detail {

/** class Jsmn::Detail::DatumIdentifier
 *
 * @brief scans a JSON stream one character at a
 * time and reports where a top-level datum may
 * have ended, so that jsmn is only run on text
 * that can hold a whole datum.
 */
class DatumIdentifier {
private:
	unsigned int depth;
	bool in_string;
	bool escaped;
	/* A bare primitive (number, true...) is in progress.  */
	bool in_primitive;

public:
	DatumIdentifier()
		: depth(0), in_string(false)
		, escaped(false), in_primitive(false) { }

	/* true if a datum may end right after `c`.  */
	bool feed(char c) {
		if (in_string) {
			if (escaped)
				escaped = false;
			else if (c == '\\')
				escaped = true;
			else if (c == '"') {
				in_string = false;
				return depth == 0;
			}
			return false;
		}

		switch (c) {
		case '"':
			in_string = true;
			in_primitive = false;
			return false;
		case '{': case '[':
			++depth;
			in_primitive = false;
			return false;
		case '}': case ']':
			if (depth > 0)
				--depth;
			in_primitive = false;
			return depth == 0;
		case ' ': case '\t': case '\r': case '\n':
			if (in_primitive && depth == 0) {
				in_primitive = false;
				return true;
			}
			in_primitive = false;
			return false;
		default:
			in_primitive = true;
			return false;
		}
	}
};

}}

#endif /* !defined(JSMN_DETAIL_DATUMIDENTIFIER_HPP) */
