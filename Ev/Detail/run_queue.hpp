#ifndef EV_DETAIL_RUN_QUEUE_HPP
#define EV_DETAIL_RUN_QUEUE_HPP

#include<functional>

namespace Ev { namespace Detail {

/** Ev::Detail::post
 *
 * @brief queues `step` to run on the default loop
 * once it has no other events to handle.
 *
 * @desc Steps run in the order they were posted.
 * A step posted while the queue is being drained
 * runs on the next loop iteration, after pending
 * I/O and timers.
 * The queue keeps the loop alive only while it is
 * non-empty.
 *
 * Main thread only.
 */
void post(std::function<void()> step);

}}

#endif /* !defined(EV_DETAIL_RUN_QUEUE_HPP) */
