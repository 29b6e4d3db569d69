#ifndef JSMN_OBJECT_HPP
#define JSMN_OBJECT_HPP

#include"Jsmn/Detail/Iterator.hpp"
#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail { struct ParseResult; }}
namespace Jsmn { class Parser; }

namespace Jsmn {

/* Thrown when a value is used as the wrong JSON type.  */
class TypeError : public Util::BacktraceException<std::invalid_argument> {
public:
	TypeError()
		: Util::BacktraceException<std::invalid_argument>(
			"JSON value has incorrect type."
		  ) { }
};

/** class Jsmn::Object
 *
 * @brief read-only view of one JSON value inside a
 * parsed datum.
 *
 * @desc Cheap to copy; copies share the parsed text.
 * A default-constructed Object, or a lookup of a
 * missing key or index, is JSON null.
 */
class Object {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	Object(std::shared_ptr<Detail::ParseResult>, std::size_t);

	friend class Jsmn::Parser;
	friend class Jsmn::Detail::Iterator;

public:
	Object();

	/* Parses text holding exactly one JSON datum.  */
	static Object parse_json(char const* text);

	bool is_null() const;
	bool is_boolean() const;
	bool is_string() const;
	bool is_object() const;
	bool is_array() const;
	bool is_number() const;

	/* null converts to false.  */
	explicit operator bool() const;
	explicit operator std::string() const;
	explicit operator double() const;

	/* Members of an object, elements of an array.  */
	std::size_t size() const;
	std::size_t length() const { return size(); }

	std::vector<std::string> keys() const;
	bool has(std::string const&) const;
	Object operator[](std::string const&) const;
	Object operator[](std::size_t) const;

	/* The JSON text of this value, as it appeared.  */
	std::string direct_text() const;

	typedef Detail::Iterator iterator;
	typedef Detail::Iterator const_iterator;
	iterator begin() const;
	iterator end() const;
};

/* Prints as compact JSON.  */
std::ostream& operator<<(std::ostream&, Jsmn::Object const&);

}

#endif /* !defined(JSMN_OBJECT_HPP) */
