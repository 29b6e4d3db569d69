#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"S/Detail/SignalBase.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

/* Subscribers of messages of type `a`.
 * Raising starts every subscriber as its own
 * greenthread and completes when all of them
 * have; the first exception thrown by any
 * subscriber is rethrown to the raiser.
 */
template<typename a>
class Signal : public SignalBase {
private:
	typedef std::function<Ev::Io<void>(a const&)> Callback;
	std::vector<Callback> callbacks;

	struct Join {
		std::size_t remaining;
		std::exception_ptr error;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;

		void finish(std::exception_ptr e) {
			if (e && !error)
				error = e;
			--remaining;
			if (remaining != 0)
				return;
			auto my_pass = std::move(pass);
			auto my_fail = std::move(fail);
			if (error)
				my_fail(error);
			else
				my_pass();
		}
	};

	static
	void launch( Callback const& cb
		   , std::shared_ptr<a> pvalue
		   , std::shared_ptr<Join> join
		   ) {
		auto act = Ev::lift().then([cb, pvalue]() {
			return cb(*pvalue);
		});
		auto wrapped = Ev::Io<void>([act, join]( std::function<void()> pass
						       , std::function<void(std::exception_ptr)>
						       ) {
			act.run([join, pass]() {
				pass();
				join->finish(nullptr);
			}, [join, pass](std::exception_ptr e) {
				pass();
				join->finish(e);
			});
		});
		Ev::concurrent(wrapped).run([]() { }, [join](std::exception_ptr e) {
			join->finish(e);
		});
	}

public:
	void subscribe(Callback cb) {
		if (cb)
			callbacks.push_back(std::move(cb));
	}

	/* `a` should be a plain data structure.  */
	Ev::Io<void> raise(a value) {
		auto snapshot = callbacks;
		auto pvalue = std::make_shared<a>(std::move(value));
		return Ev::yield().then([snapshot, pvalue]() {
			return Ev::Io<void>([ snapshot
					    , pvalue
					    ]( std::function<void()> pass
					     , std::function<void(std::exception_ptr)> fail
					     ) {
				auto join = std::make_shared<Join>();
				/* One extra count, held until every
				 * subscriber has been launched.  */
				join->remaining = snapshot.size() + 1;
				join->pass = std::move(pass);
				join->fail = std::move(fail);
				for (auto const& cb : snapshot)
					launch(cb, pvalue, join);
				join->finish(nullptr);
			});
		});
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
