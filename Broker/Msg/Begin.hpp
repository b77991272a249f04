#ifndef BROKER_MSG_BEGIN_HPP
#define BROKER_MSG_BEGIN_HPP

namespace Broker { namespace Msg {

/** struct Broker::Msg::Begin
 *
 * @brief raised after a successful `Init`, just
 * before console input starts; periodic tasks start
 * here.
 */
struct Begin { };

}}

#endif /* !defined(BROKER_MSG_BEGIN_HPP) */
