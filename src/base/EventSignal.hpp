#ifndef __DX_EVENT_SIGNAL__
#define __DX_EVENT_SIGNAL__

#include "Headers.hpp"

namespace dx {
/**
 * @brief Ordered list of observers for one named event.
 *
 * Handlers run synchronously, in registration order, on the thread that calls
 * emit().  The handler list is snapshotted before dispatch so a handler may
 * register or clear handlers (or destroy the emitter) while an emit is in
 * flight.
 */
template <typename... Args>
class EventSignal {
 public:
  typedef std::function<void(Args...)> Handler;

  void connect(const Handler& handler) { handlers.push_back(handler); }

  void emit(Args... args) const {
    vector<Handler> snapshot = handlers;
    for (auto& handler : snapshot) {
      handler(args...);
    }
  }

  void disconnectAll() { handlers.clear(); }

 protected:
  vector<Handler> handlers;
};
}  // namespace dx

#endif  // __DX_EVENT_SIGNAL__
