#ifndef UTIL_BACKTRACEEXCEPTION_HPP
#define UTIL_BACKTRACEEXCEPTION_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#if !ENABLE_EXCEPTION_BACKTRACE

#include<utility>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief marks an exception E as raised by the
 * infrastructure (database, sockets, parsers)
 * rather than by stream logic.
 *
 * @desc Behaves exactly like E; catch it as E.
 * Configure with ENABLE_EXCEPTION_BACKTRACE to have
 * `what()` also carry the stack at the throw site.
 */
template<typename E>
class BacktraceException : public E {
public:
	template<typename... As>
	BacktraceException(As&&... as) : E(std::forward<As>(as)...) { }
};

}

#else /* ENABLE_EXCEPTION_BACKTRACE */

#include<array>
#include<cstddef>
#include<errno.h>
#include<execinfo.h>
#include<iomanip>
#include<memory>
#include<sstream>
#include<stdio.h>
#include<stdlib.h>
#include<string>
#include<utility>
#include<vector>

#define UNW_LOCAL_ONLY
#include<libunwind.h>

/* Set by Streamer::Main; tests leave it empty.  */
extern std::string g_argv0;

namespace Util {

namespace Detail {

struct PcloseDeleter {
	void operator()(FILE* fp) const {
		if (fp)
			pclose(fp);
	}
};

}

/** class Util::BacktraceException<E>
 *
 * @brief an exception E that records the stack
 * when constructed.
 *
 * @desc The frames are only symbolized, through
 * addr2line, the first time `what()` is called.
 */
template<typename E>
class BacktraceException : public E {
public:
	template<typename... As>
	BacktraceException(As&&... as)
		: E(std::forward<As>(as)...)
		, formatted(false)
		, message(E::what()) {
		capture();
	}

	char const* what() const noexcept override {
		if (!formatted) {
			formatted = true;
			message = std::string(E::what())
				+ "\nBacktrace:\n" + format();
		}
		return message.c_str();
	}

private:
	static constexpr std::size_t max_frames = 100;

	mutable bool formatted;
	mutable std::string message;
	std::vector<unw_word_t> frames;

	void capture() {
		unw_cursor_t cursor;
		unw_context_t context;
		unw_getcontext(&context);
		unw_init_local(&cursor, &context);
		while (unw_step(&cursor) > 0 && frames.size() < max_frames) {
			unw_word_t ip;
			unw_get_reg(&cursor, UNW_REG_IP, &ip);
			frames.push_back(ip);
		}
	}

	std::string format() const {
		auto pointers = std::vector<void*>(frames.size());
		for (auto i = std::size_t(0); i < frames.size(); ++i)
			pointers[i] = reinterpret_cast<void*>(frames[i]);

		auto symbols = backtrace_symbols( pointers.data()
						, int(pointers.size())
						);
		auto os = std::ostringstream();
		for (auto i = std::size_t(0); i < pointers.size(); ++i) {
			os << '#' << std::left << std::setw(2) << i << ' ';
			auto line = addr2line(pointers[i]);
			if (line.empty() || line.find("??") != std::string::npos)
				os << (symbols ? symbols[i] : "?") << std::endl;
			else
				os << line;
		}
		free(symbols);
		return os.str();
	}

	static std::string progname() {
		if (!g_argv0.empty())
			return g_argv0;
		return program_invocation_name;
	}

	static std::string addr2line(void* addr) {
		char cmd[512];
		snprintf( cmd, sizeof(cmd)
			, "addr2line -C -f -p -e %s %p"
			, progname().c_str(), addr
			);
		auto pipe = std::unique_ptr<FILE, Detail::PcloseDeleter>(
			popen(cmd, "r")
		);
		if (!pipe)
			return "";
		auto buffer = std::array<char, 128>();
		auto result = std::string();
		while (fgets(buffer.data(), int(buffer.size()), pipe.get()))
			result += buffer.data();
		return result;
	}
};

}

#endif /* ENABLE_EXCEPTION_BACKTRACE */

#endif /* !defined(UTIL_BACKTRACEEXCEPTION_HPP) */
