#ifndef UUID_HPP
#define UUID_HPP

#include<cstdint>
#include<functional>
#include<ostream>
#include<string>

/** class Uuid
 *
 * @brief a random 128-bit identifier, written as
 * 32 lowercase hex digits.
 *
 * @desc Not an RFC4122 UUID; just 16 random bytes.
 * Stream payments are keyed by these.
 */
class Uuid {
private:
	std::uint8_t data[16];

public:
	/* The all-zeroes id, which is false.  */
	Uuid();

	/* Fresh from the system CSPRNG.  */
	static Uuid random();

	explicit Uuid(std::string const&);
	explicit operator std::string() const;
	static bool valid_string(std::string const&);

	bool operator==(Uuid const& o) const;
	bool operator!=(Uuid const& o) const {
		return !(*this == o);
	}

	explicit operator bool() const;
	bool operator!() const { return !bool(*this); }

	std::size_t hash() const;
};

inline
std::ostream& operator<<(std::ostream& os, Uuid const& i) {
	return os << std::string(i);
}

namespace std {
template<>
struct hash<Uuid> {
	std::size_t operator()(Uuid const& i) const {
		return i.hash();
	}
};
}

#endif /* !defined(UUID_HPP) */
