#ifndef LN_AMOUNT_HPP
#define LN_AMOUNT_HPP

#include<cstdint>
#include<ostream>
#include<string>

namespace Jsmn { class Object; }

namespace Ln {

/** class Ln::Amount
 *
 * @brief an amount in millisatoshi.
 *
 * @desc lightningd reports amounts either as plain
 * JSON numbers or as strings with an `msat` suffix;
 * both are accepted by `object`, and amounts are
 * always written back with the suffix.
 */
class Amount {
private:
	std::uint64_t v;

public:
	Amount() : v(0) { }

	static Amount msat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v;
		return ret;
	}
	static Amount sat(std::uint64_t v) {
		return msat(v * 1000);
	}
	std::uint64_t to_msat() const { return v; }

	/* "1234msat" */
	explicit Amount(std::string const&);
	explicit operator std::string() const;
	static bool valid_string(std::string const&);

	static bool valid_object(Jsmn::Object const&);
	static Amount object(Jsmn::Object const&);

	/* Both saturate.  */
	Amount& operator+=(Amount const& o) {
		v = (v + o.v < v) ? UINT64_MAX : v + o.v;
		return *this;
	}
	Amount& operator-=(Amount const& o) {
		v = (o.v > v) ? 0 : v - o.v;
		return *this;
	}
	Amount operator+(Amount const& o) const {
		return Amount(*this) += o;
	}
	Amount operator-(Amount const& o) const {
		return Amount(*this) -= o;
	}

	bool operator==(Amount const& o) const { return v == o.v; }
	bool operator!=(Amount const& o) const { return v != o.v; }
	bool operator<(Amount const& o) const { return v < o.v; }
	bool operator>(Amount const& o) const { return v > o.v; }
	bool operator<=(Amount const& o) const { return v <= o.v; }
	bool operator>=(Amount const& o) const { return v >= o.v; }
};

inline
std::ostream& operator<<(std::ostream& os, Amount const& a) {
	return os << std::string(a);
}

}

#endif /* !defined(LN_AMOUNT_HPP) */
