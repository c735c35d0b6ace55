#ifndef __DX_SESSION_HOST__
#define __DX_SESSION_HOST__

#include "Headers.hpp"
#include "HostConfig.hpp"
#include "HostEnvironment.hpp"
#include "MessagePort.hpp"
#include "PerformanceMonitor.hpp"
#include "ProcessSpawner.hpp"
#include "Scheduler.hpp"
#include "TerminalSession.hpp"

namespace dx {
/**
 * @brief Host-side owner of terminal sessions, driven by channel requests.
 *
 * Serves ChannelRequests arriving on attached ports and answers each with
 * exactly one ChannelResponse.  Session output and exits are pushed back as
 * unsolicited responses tagged with the terminal id.  Sessions outlive the
 * port that created them so a reconnected channel picks them up again.
 */
class SessionHost {
 public:
  SessionHost(shared_ptr<ProcessSpawner> _spawner,
              shared_ptr<HostEnvironment> _environment,
              shared_ptr<Scheduler> _scheduler, const HostConfig& _config);
  ~SessionHost();

  /** @brief Starts serving requests that arrive on @p port. */
  void attach(shared_ptr<MessagePort> port);
  /** @brief Kills every session. */
  void shutdown();

  size_t getSessionCount() const { return sessions.size(); }
  shared_ptr<TerminalSession> getSession(const string& id) const;
  /** @brief Samples the buffers of every running session. */
  PerformanceMonitor& getMonitor() { return monitor; }

 protected:
  struct SessionEntry {
    shared_ptr<TerminalSession> session;
    weak_ptr<MessagePort> port;
    bool created = false;
    string lastError;
    string lastOutput;
    int64_t lastOutputTime = 0;
    int duplicateCount = 0;
    DeferredTask removalTask;
  };

  void handlePacket(const Packet& packet, shared_ptr<MessagePort> port);
  ChannelResponse handleRequest(const ChannelRequest& request,
                                shared_ptr<MessagePort> port);
  ChannelResponse createSession(const ChannelRequest& request,
                                shared_ptr<MessagePort> port);
  ChannelResponse listSessions();
  void detach(shared_ptr<MessagePort> port);

  void sendOutput(const string& id, const string& output);
  void sendSessionError(const string& id, const string& error);
  void sendExit(const string& id, int exitCode, int exitSignal);
  bool shouldThrottle(SessionEntry* entry, const string& data);
  void post(shared_ptr<MessagePort> port, const ChannelResponse& response);
  shared_ptr<MessagePort> portFor(SessionEntry* entry);
  SessionEntry* findEntry(const string& id);

  shared_ptr<ProcessSpawner> spawner;
  shared_ptr<HostEnvironment> environment;
  shared_ptr<Scheduler> scheduler;
  HostConfig config;
  PerformanceMonitor monitor;
  map<string, SessionEntry> sessions;
  vector<shared_ptr<MessagePort>> ports;
};
}  // namespace dx

#endif  // __DX_SESSION_HOST__
