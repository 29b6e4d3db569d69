#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

template<typename a>
class Io;

namespace Detail {

/* Io<a> -> a  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	typedef a type;
};

/* The continuation that receives an `a`.  */
template<typename a>
struct PassFunc {
	typedef std::function<void(a)> type;
};
template<>
struct PassFunc<void> {
	typedef std::function<void()> type;
};

typedef std::function<void(std::exception_ptr)> FailFunc;

/* Wraps a continuation so that it does nothing once
 * `done` is set, and sets `done` when invoked.  */
template<typename a>
struct Once {
	static
	typename PassFunc<a>::type
	wrap(std::shared_ptr<bool> done, typename PassFunc<a>::type f) {
		return [done, f](a value) {
			if (*done)
				return;
			*done = true;
			f(std::move(value));
		};
	}
};
template<>
struct Once<void> {
	static
	PassFunc<void>::type
	wrap(std::shared_ptr<bool> done, PassFunc<void>::type f) {
		return [done, f]() {
			if (*done)
				return;
			*done = true;
			f();
		};
	}
};

/* Parts of Io<a> that do not care whether `a` is void.  */
template<typename a>
class IoBase {
public:
	typedef
	std::function<void ( typename PassFunc<a>::type
			   , FailFunc
			   )> CoreFunc;

protected:
	CoreFunc core;

	template<typename b>
	friend class Ev::Io;
	template<typename b>
	friend class IoBase;

public:
	IoBase(CoreFunc core_) : core(std::move(core_)) { }

	/** Ev::Io<a>::catching<e>
	 *
	 * @brief if this action throws an exception of
	 * type `e`, run the handler and continue with
	 * its action instead.
	 * Other exceptions pass through.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ]( typename PassFunc<a>::type pass
			      , FailFunc fail
			      ) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr ep) {
				auto recovery = std::unique_ptr<Io<a>>();
				try {
					try {
						std::rethrow_exception(ep);
					} catch (e const& err) {
						recovery.reset(new Io<a>(
							handler(err)
						));
					}
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				recovery->core(pass, fail);
			};
			core_copy(pass, sub_fail);
		});
	}

	/** Ev::Io<a>::run
	 *
	 * @brief executes the action.
	 * Exactly one of `pass` or `fail` is called,
	 * at most once.
	 */
	void run( typename PassFunc<a>::type pass
		, FailFunc fail
		) const {
		auto done = std::make_shared<bool>(false);
		auto once_fail = [done, fail](std::exception_ptr ep) {
			if (*done)
				return;
			*done = true;
			fail(std::move(ep));
		};
		try {
			core(Once<a>::wrap(done, std::move(pass)), once_fail);
		} catch (...) {
			once_fail(std::current_exception());
		}
	}
};

}

template<typename a>
class Io : public Detail::IoBase<a> {
public:
	Io(typename Detail::IoBase<a>::CoreFunc core_)
		: Detail::IoBase<a>(std::move(core_)) { }

	/* (>>=) :: Io a -> (a -> Io b) -> Io b  */
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f(a)>::type>::type>
	then(f func) const {
		typedef typename Detail::IoInner<
			typename std::result_of<f(a)>::type
		>::type b;
		auto core_copy = this->core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail](a value) {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next.reset(new Io<b>(
						func(std::move(value))
					));
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->core(pass, fail);
			};
			try {
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}
};

template<>
class Io<void> : public Detail::IoBase<void> {
public:
	Io(Detail::IoBase<void>::CoreFunc core_)
		: Detail::IoBase<void>(std::move(core_)) { }

	/* (>>=) :: Io () -> (() -> Io b) -> Io b  */
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f()>::type>::type>
	then(f func) const {
		typedef typename Detail::IoInner<
			typename std::result_of<f()>::type
		>::type b;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail]() {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next.reset(new Io<b>(func()));
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->core(pass, fail);
			};
			try {
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}
};

template<typename a>
Io<a> lift(a val) {
	auto box = std::make_shared<a>(std::move(val));
	return Io<a>([box]( typename Detail::PassFunc<a>::type pass
			  , Detail::FailFunc
			  ) {
		pass(std::move(*box));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , Detail::FailFunc
			  ) {
		pass();
	});
}

/* Sequencing of void actions: x + y runs x, then y.  */
inline
Io<void> operator+(Io<void> x, Io<void> y) {
	return x.then([y]() { return y; });
}
inline
Io<void>& operator+=(Io<void>& x, Io<void> y) {
	x = x + std::move(y);
	return x;
}

}

#endif /* !defined(EV_IO_HPP) */
