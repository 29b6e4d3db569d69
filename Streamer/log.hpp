#ifndef STREAMER_LOG_HPP
#define STREAMER_LOG_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Streamer {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/** Streamer::log
 *
 * @brief formats a message printf-style and sends
 * it to lightningd as a `log` notification.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, char const* fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* !defined(STREAMER_LOG_HPP) */
