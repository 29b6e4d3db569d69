#ifndef JSMN_DETAIL_STR_HPP
#define JSMN_DETAIL_STR_HPP

#include<string>

namespace Jsmn { namespace Detail { namespace Str {

/* Raw text to the body of a JSON string literal.  */
std::string to_escaped(std::string const&);
/* Body of a JSON string literal to raw UTF-8 text.  */
std::string from_escaped(std::string const&);

/* Locale-independent number conversion.  */
double to_double(std::string const&);
std::string from_double(double);

}}}

#endif /* !defined(JSMN_DETAIL_STR_HPP) */
