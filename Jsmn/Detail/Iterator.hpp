#ifndef JSMN_DETAIL_ITERATOR_HPP
#define JSMN_DETAIL_ITERATOR_HPP

#include<cstddef>
#include<iterator>
#include<memory>

namespace Jsmn { namespace Detail { struct ParseResult; }}
namespace Jsmn { class Object; }

namespace Jsmn { namespace Detail {

/* Walks the elements of an array.  */
class Iterator {
private:
	std::shared_ptr<ParseResult> r;
	std::size_t i;

	friend class Jsmn::Object;
	Iterator(std::shared_ptr<ParseResult> r_, std::size_t i_)
		: r(std::move(r_)), i(i_) { }

public:
	typedef std::forward_iterator_tag iterator_category;
	typedef Jsmn::Object value_type;
	typedef std::ptrdiff_t difference_type;
	typedef Jsmn::Object const* pointer;
	typedef Jsmn::Object reference;

	Iterator() : r(), i(0) { }

	bool operator==(Iterator const& o) const {
		return r == o.r && i == o.i;
	}
	bool operator!=(Iterator const& o) const {
		return !(*this == o);
	}

	Iterator& operator++();
	Iterator operator++(int) {
		auto prev = *this;
		++*this;
		return prev;
	}

	Jsmn::Object operator*() const;
};

}}

#endif /* !defined(JSMN_DETAIL_ITERATOR_HPP) */
