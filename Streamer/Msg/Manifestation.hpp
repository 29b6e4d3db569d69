#ifndef STREAMER_MSG_MANIFESTATION_HPP
#define STREAMER_MSG_MANIFESTATION_HPP

namespace Streamer { namespace Msg {

/** struct Streamer::Msg::Manifestation
 *
 * @brief raised while answering `getmanifest`.
 * Modules respond by raising the Manifest*
 * messages for what they provide.
 */
struct Manifestation {};

}}

#endif /* !defined(STREAMER_MSG_MANIFESTATION_HPP) */
