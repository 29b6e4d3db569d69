#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<sstream>
#include<string>
#include<type_traits>

namespace Json { class Out; }

namespace Json { namespace Detail {

typedef std::ostringstream Content;
template<typename Up> class Array;
template<typename Up> class Object;

/* How a C++ value is written as JSON text.  */
template<typename t, typename Enable = void>
struct Serializer;

template<typename t>
struct Serializer< t
		 , typename std::enable_if<std::is_integral<t>::value>::type
		 > {
	static std::string serialize(t v) {
		if (std::is_signed<t>::value)
			return std::to_string(std::int64_t(v));
		return std::to_string(std::uint64_t(v));
	}
};
template<>
struct Serializer<bool> {
	static std::string serialize(bool v) {
		return v ? "true" : "false";
	}
};
template<typename t>
struct Serializer< t
		 , typename std::enable_if<std::is_floating_point<t>::value>::type
		 > {
	static std::string serialize(t v) {
		return Jsmn::Detail::Str::from_double(double(v));
	}
};
template<>
struct Serializer<std::string> {
	static std::string serialize(std::string const& v) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<std::size_t n>
struct Serializer<char[n]> {
	static std::string serialize(char const* v) {
		return Serializer<std::string>::serialize(v);
	}
};
template<>
struct Serializer<char const*> {
	static std::string serialize(char const* v) {
		return Serializer<std::string>::serialize(v);
	}
};
template<>
struct Serializer<std::nullptr_t> {
	static std::string serialize(std::nullptr_t) {
		return "null";
	}
};

/* Common state for object and array builders.  */
class Builder {
protected:
	Content& content;
	bool started;

	explicit
	Builder(Content& content_) : content(content_), started(false) { }

	void separate() {
		if (started)
			content << ", ";
		started = true;
	}
	void key(std::string const& name) {
		separate();
		content << Serializer<std::string>::serialize(name) << ": ";
	}
};

template<typename Up>
class Object : private Builder {
private:
	Up& up;

	template<typename U> friend class Object;
	template<typename U> friend class Array;

public:
	Object(Up& up_, Content& content_) : Builder(content_), up(up_) {
		content << "{";
	}

	template<typename a>
	Object& field(std::string const& name, a const& value) {
		key(name);
		content << Serializer<a>::serialize(value);
		return *this;
	}

	Array<Object> start_array(std::string const& name) {
		key(name);
		return Array<Object>(*this, content);
	}
	Object<Object> start_object(std::string const& name) {
		key(name);
		return Object<Object>(*this, content);
	}

	Up& end_object() {
		content << "}";
		return up;
	}
};

template<typename Up>
class Array : private Builder {
private:
	Up& up;

	template<typename U> friend class Object;
	template<typename U> friend class Array;

public:
	Array(Up& up_, Content& content_) : Builder(content_), up(up_) {
		content << "[";
	}

	template<typename a>
	Array& entry(a const& value) {
		separate();
		content << Serializer<a>::serialize(value);
		return *this;
	}

	Array<Array> start_array() {
		separate();
		return Array<Array>(*this, content);
	}
	Object<Array> start_object() {
		separate();
		return Object<Array>(*this, content);
	}

	Up& end_array() {
		content << "]";
		return up;
	}
};

}

/** class Json::Out
 *
 * @brief builds JSON text in a fluent style:
 *
 *     Json::Out()
 *         .start_object()
 *             .field("id", id)
 *             .start_array("parts")
 *                 .entry(1)
 *             .end_array()
 *         .end_object()
 *
 * @desc Copies share the same text buffer.
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }
	explicit
	Out(Jsmn::Object const& js) : Out() {
		*content << js;
	}

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object<Out> start_object() {
		return Json::Detail::Object<Out>(*this, *content);
	}
	Json::Detail::Array<Out> start_array() {
		return Json::Detail::Array<Out>(*this, *content);
	}

	static Out empty_object() {
		return Out().start_object().end_object();
	}
	/* A lone scalar value.  */
	template<typename a>
	static Out direct(a const& value) {
		auto ret = Out();
		*ret.content << Json::Detail::Serializer<a>::serialize(value);
		return ret;
	}
};

namespace Detail {

template<>
struct Serializer<Json::Out> {
	static std::string serialize(Json::Out const& v) {
		return v.output();
	}
};
template<>
struct Serializer<Jsmn::Object> {
	static std::string serialize(Jsmn::Object const& v) {
		auto os = std::ostringstream();
		os << v;
		return os.str();
	}
};

}

}

#endif /* !defined(JSON_OUT_HPP) */
