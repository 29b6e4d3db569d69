#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include"Ev/Io.hpp"
#include<functional>
#include<memory>

namespace Ev {

/** class Ev::ThreadPool
 *
 * @brief runs blocking calls (stdin reads,
 * socket connects) on background threads so the
 * main loop stays responsive.
 *
 * @desc The greenthread calling `background`
 * suspends until the function completes, then
 * resumes on the main thread with its result or
 * exception.
 */
class ThreadPool {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* The outer function runs on a background
	 * thread and returns the continuation to run
	 * on the main thread.  */
	void submit(std::function<std::function<void()>()> job);

public:
	explicit
	ThreadPool(unsigned int num_threads = 2);
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	template<typename a>
	Ev::Io<a> background(std::function<a()> func) {
		auto pfunc = std::make_shared<std::function<a()>>(
			std::move(func)
		);
		return Ev::Io<a>([ pfunc
				 , this
				 ]( std::function<void(a)> pass
				  , std::function<void(std::exception_ptr)> fail
				  ) {
			submit([pfunc, pass, fail]() {
				try {
					auto result = std::make_shared<a>(
						(*pfunc)()
					);
					return std::function<void()>([pass, result]() {
						pass(std::move(*result));
					});
				} catch (...) {
					auto e = std::current_exception();
					return std::function<void()>([fail, e]() {
						fail(e);
					});
				}
			});
		});
	}
};

}

#endif /* EV_THREADPOOL_HPP */
