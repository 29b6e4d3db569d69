#include"Ev/ThreadPool.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<condition_variable>
#include<errno.h>
#include<ev.h>
#include<fcntl.h>
#include<mutex>
#include<queue>
#include<signal.h>
#include<stdexcept>
#include<string.h>
#include<thread>
#include<unistd.h>
#include<vector>

namespace Ev {

class ThreadPool::Impl {
private:
	/* Main thread only.  */
	std::vector<std::thread> workers;
	std::size_t outstanding;
	std::unique_ptr<ev_io> wakeup;
	int pipe_rd;
	int pipe_wr;

	/* Shared; hold mtx.  */
	std::mutex mtx;
	std::condition_variable cv;
	bool stopping;
	std::queue<std::function<std::function<void()>()>> jobs;
	std::queue<std::function<void()>> done;

	void worker() {
		auto lock = std::unique_lock<std::mutex>(mtx);
		for (;;) {
			while (jobs.empty() && !stopping)
				cv.wait(lock);
			if (stopping)
				return;
			auto job = std::move(jobs.front());
			jobs.pop();

			lock.unlock();
			auto cont = job();
			job = nullptr;
			lock.lock();

			done.push(std::move(cont));
			auto b = char(0);
			auto res = ssize_t();
			do {
				res = write(pipe_wr, &b, 1);
			} while (res < 0 && errno == EINTR);
		}
	}

	void on_wakeup(EV_P) {
		auto b = char(0);
		auto res = ssize_t();
		do {
			res = read(pipe_rd, &b, 1);
		} while (res < 0 && errno == EINTR);
		if (res != 1)
			return;

		auto cont = std::function<void()>();
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			cont = std::move(done.front());
			done.pop();
		}

		/* With nothing outstanding the watcher must
		 * not keep the loop alive.  */
		--outstanding;
		if (outstanding == 0) {
			ev_io_stop(EV_A_ wakeup.get());
			wakeup = nullptr;
		}

		cont();
	}
	static
	void on_wakeup_static(EV_P_ ev_io* w, int) {
		((Impl*) w->data)->on_wakeup(EV_A);
	}

public:
	explicit
	Impl(unsigned int num_threads) : outstanding(0), stopping(false) {
		int fds[2];
		if (pipe(fds) < 0)
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Ev::ThreadPool: pipe: ") +
				strerror(errno)
			);
		pipe_rd = fds[0];
		pipe_wr = fds[1];
		fcntl(pipe_rd, F_SETFL, fcntl(pipe_rd, F_GETFL) | O_NONBLOCK);

		/* Workers never take signals.  */
		sigset_t all;
		sigset_t old;
		sigfillset(&all);
		pthread_sigmask(SIG_SETMASK, &all, &old);
		for (auto i = 0u; i < num_threads; ++i)
			workers.emplace_back([this]() { worker(); });
		pthread_sigmask(SIG_SETMASK, &old, nullptr);
	}
	~Impl() {
		if (wakeup)
			ev_io_stop(EV_DEFAULT_ wakeup.get());
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			stopping = true;
		}
		cv.notify_all();
		for (auto& w : workers)
			w.join();
		close(pipe_rd);
		close(pipe_wr);
	}

	void submit(std::function<std::function<void()>()> job) {
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			jobs.push(std::move(job));
		}
		cv.notify_one();

		++outstanding;
		if (!wakeup) {
			wakeup = Util::make_unique<ev_io>();
			ev_io_init(wakeup.get(), &on_wakeup_static, pipe_rd, EV_READ);
			wakeup->data = this;
			ev_io_start(EV_DEFAULT_ wakeup.get());
		}
	}
};

ThreadPool::ThreadPool(unsigned int num_threads)
	: pimpl(Util::make_unique<Impl>(num_threads)) { }
ThreadPool::~ThreadPool() { }

void ThreadPool::submit(std::function<std::function<void()>()> job) {
	pimpl->submit(std::move(job));
}

}
