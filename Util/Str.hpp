#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<cstdint>
#include<stdarg.h>
#include<stdexcept>
#include<string>
#include<vector>

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace Util {
namespace Str {

/* Hex representation of a byte buffer, lowercase.  */
std::string hexdump(void const* p, std::size_t s);

struct HexParseFailure : public Util::BacktraceException<std::runtime_error> {
	explicit
	HexParseFailure(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>("hexread: " + msg) { }
};
/* Parse an even-length hex string.  */
std::vector<std::uint8_t> hexread(std::string const&);
bool ishex(std::string const&);

std::string trim(std::string const& s);
/* ASCII-only lowercasing.  */
std::string lowercase(std::string s);

/* Like `sprintf` but into a std::string.  */
std::string fmt(char const* tpl, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const* tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
