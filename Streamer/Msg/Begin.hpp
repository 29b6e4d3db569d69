#ifndef STREAMER_MSG_BEGIN_HPP
#define STREAMER_MSG_BEGIN_HPP

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::Begin
 *
 * @brief raised once all modules are constructed,
 * before any input is read.
 */
struct Begin {};

}}

#endif /* !defined(STREAMER_MSG_BEGIN_HPP) */
