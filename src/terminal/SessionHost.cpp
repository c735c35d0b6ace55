#include "SessionHost.hpp"

namespace dx {
namespace {
ChannelResponse failure(const string& error) {
  ChannelResponse response;
  response.set_success(false);
  response.set_error(error);
  return response;
}
}  // namespace

SessionHost::SessionHost(shared_ptr<ProcessSpawner> _spawner,
                         shared_ptr<HostEnvironment> _environment,
                         shared_ptr<Scheduler> _scheduler,
                         const HostConfig& _config)
    : spawner(_spawner),
      environment(_environment),
      scheduler(_scheduler),
      config(_config),
      monitor(_scheduler, _config.monitor) {
  config.validate();
  monitor.onUpdate([](const GlobalPerformanceStats& stats) {
    VLOG(1) << "Terminals: " << stats.healthyTerminals << " healthy, "
            << stats.warningTerminals << " warning, "
            << stats.criticalTerminals << " critical";
  });
}

SessionHost::~SessionHost() {
  for (auto& port : ports) {
    port->clearHandlers();
  }
  monitor.destroy();
  // Sessions SIGKILL any child still alive when destroyed.
  sessions.clear();
}

void SessionHost::attach(shared_ptr<MessagePort> port) {
  weak_ptr<MessagePort> weakPort = port;
  port->onMessage([this, weakPort](const Packet& packet) {
    auto strongPort = weakPort.lock();
    if (strongPort) {
      handlePacket(packet, strongPort);
    }
  });
  port->onClose([this, weakPort]() {
    auto strongPort = weakPort.lock();
    if (strongPort) {
      detach(strongPort);
    }
  });
  ports.push_back(port);
  port->start();
  LOG(INFO) << "Session host attached a channel (" << ports.size()
            << " open)";
}

void SessionHost::detach(shared_ptr<MessagePort> port) {
  LOG(INFO) << "Session host lost a channel";
  port->clearHandlers();
  ports.erase(std::remove(ports.begin(), ports.end(), port), ports.end());
}

void SessionHost::shutdown() {
  LOG(INFO) << "Shutting down " << sessions.size() << " sessions";
  for (auto& it : sessions) {
    it.second.session->kill();
  }
}

shared_ptr<TerminalSession> SessionHost::getSession(const string& id) const {
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return shared_ptr<TerminalSession>();
  }
  return it->second.session;
}

SessionHost::SessionEntry* SessionHost::findEntry(const string& id) {
  auto it = sessions.find(id);
  return it == sessions.end() ? NULL : &(it->second);
}

void SessionHost::handlePacket(const Packet& packet,
                               shared_ptr<MessagePort> port) {
  ChannelRequest request;
  ChannelResponse response;
  if (packet.getHeader() != CHANNEL_REQUEST) {
    LOG(ERROR) << "Unexpected packet type " << int(packet.getHeader());
    response = failure("Unexpected packet type");
  } else {
    try {
      request = packet.parsePayload<ChannelRequest>();
      response = handleRequest(request, port);
    } catch (const std::runtime_error& ex) {
      LOG(ERROR) << "Malformed request: " << ex.what();
      response = failure(string("Malformed request: ") + ex.what());
    }
  }
  if (request.has_requestid()) {
    response.set_requestid(request.requestid());
  }
  if (request.has_timestamp()) {
    response.set_timestamp(request.timestamp());
  }
  if (request.has_terminalid()) {
    response.set_terminalid(request.terminalid());
  }
  post(port, response);
}

ChannelResponse SessionHost::handleRequest(const ChannelRequest& request,
                                           shared_ptr<MessagePort> port) {
  const string& id = request.terminalid();
  VLOG(1) << "Host request " << request.requestid() << " for " << id;
  if (request.type() == CREATE) {
    return createSession(request, port);
  }
  if (request.type() == LIST) {
    return listSessions();
  }

  SessionEntry* entry = findEntry(id);
  if (entry == NULL) {
    return failure("Terminal " + id + " not found");
  }
  entry->port = port;

  ChannelResponse response;
  response.set_success(true);
  switch (request.type()) {
    case WRITE:
    case DATA:
      entry->session->write(request.data().text());
      break;
    case RESIZE:
      entry->session->resize(request.data().cols(), request.data().rows());
      break;
    case KILL:
      // The entry stays until the exit arrives so escalation can finish.
      entry->session->kill();
      break;
    default:
      return failure("Unknown request type " + to_string(int(request.type())));
  }
  return response;
}

ChannelResponse SessionHost::createSession(const ChannelRequest& request,
                                           shared_ptr<MessagePort> port) {
  const string id = request.terminalid();
  if (id.empty()) {
    return failure("Missing terminal id");
  }
  if (sessions.find(id) != sessions.end()) {
    return failure("Terminal " + id + " already exists");
  }

  const TerminalCreateOptions& requested = request.data().options();
  TerminalSessionOptions options;
  if (requested.has_name()) options.name = requested.name();
  if (requested.has_cwd()) options.cwd = requested.cwd();
  if (requested.has_shell() && !requested.shell().empty()) {
    options.shell = requested.shell();
  } else if (!config.shell.empty()) {
    options.shell = config.shell;
  }
  for (auto& it : requested.env()) {
    options.env[it.first] = it.second;
  }
  options.cols = (requested.has_cols() && requested.cols() > 0)
                     ? requested.cols()
                     : config.defaultCols;
  options.rows = (requested.has_rows() && requested.rows() > 0)
                     ? requested.rows()
                     : config.defaultRows;

  shared_ptr<TerminalSession> session;
  try {
    session.reset(new TerminalSession(id, options, spawner, environment,
                                      scheduler, config.buffer,
                                      config.timings));
  } catch (const std::invalid_argument& ex) {
    return failure(ex.what());
  }

  SessionEntry& entry = sessions[id];
  entry.session = session;
  entry.port = port;
  session->onData([this, id](const string& data) { sendOutput(id, data); });
  session->onError(
      [this, id](const string& error) { sendSessionError(id, error); });
  session->onExit([this, id](int exitCode, int exitSignal) {
    sendExit(id, exitCode, exitSignal);
  });

  session->spawn();
  if (!session->isRunning()) {
    string error = entry.lastError.empty() ? "Failed to start terminal"
                                           : entry.lastError;
    sessions.erase(id);
    return failure(error);
  }
  entry.created = true;
  monitor.registerSession(session);

  LOG(INFO) << "Created terminal " << id << " (pid " << *session->getPid()
            << ")";
  ChannelResponse response;
  response.set_success(true);
  response.mutable_data()->set_id(id);
  response.mutable_data()->set_name(session->getName());
  response.mutable_data()->set_pid(*session->getPid());
  return response;
}

ChannelResponse SessionHost::listSessions() {
  ChannelResponse response;
  response.set_success(true);
  auto data = response.mutable_data();
  for (auto& it : sessions) {
    auto summary = data->add_terminals();
    summary->set_id(it.first);
    summary->set_name(it.second.session->getName());
    auto pid = it.second.session->getPid();
    summary->set_pid(pid ? *pid : 0);
    summary->set_isactive(it.second.session->isRunning());
  }
  return response;
}

bool SessionHost::shouldThrottle(SessionEntry* entry, const string& data) {
  int64_t now = scheduler->now();
  bool isDuplicate = entry->lastOutput == data;
  bool inWindow = now - entry->lastOutputTime < config.duplicateWindowMs;
  if (isDuplicate && inWindow) {
    entry->duplicateCount++;
    if (entry->duplicateCount > config.maxDuplicates) {
      return true;
    }
  } else {
    entry->duplicateCount = 0;
  }
  entry->lastOutput = data;
  entry->lastOutputTime = now;
  return false;
}

void SessionHost::sendOutput(const string& id, const string& output) {
  SessionEntry* entry = findEntry(id);
  if (entry == NULL) {
    return;
  }
  if (shouldThrottle(entry, output)) {
    VLOG(1) << "Suppressed repeated output from " << id << ": "
            << previewForLog(output, 40);
    return;
  }
  ChannelResponse response;
  response.set_success(true);
  response.set_terminalid(id);
  response.mutable_data()->set_output(output);
  post(portFor(entry), response);
}

void SessionHost::sendSessionError(const string& id, const string& error) {
  SessionEntry* entry = findEntry(id);
  if (entry == NULL) {
    return;
  }
  entry->lastError = error;
  if (!entry->created) {
    // Reported in the CREATE response instead.
    return;
  }
  ChannelResponse response = failure(error);
  response.set_terminalid(id);
  post(portFor(entry), response);
}

void SessionHost::sendExit(const string& id, int exitCode, int exitSignal) {
  SessionEntry* entry = findEntry(id);
  if (entry == NULL) {
    return;
  }
  ChannelResponse response;
  response.set_success(true);
  response.set_terminalid(id);
  response.mutable_data()->set_id(id);
  response.mutable_data()->set_exitcode(exitCode);
  response.mutable_data()->set_exitsignal(exitSignal);
  post(portFor(entry), response);

  // Erased on the next turn: we are inside the session's own exit event.
  entry->removalTask = DeferredTask(scheduler, scheduler->schedule(0, [this, id]() {
    LOG(INFO) << "Removing terminal " << id;
    monitor.unregisterSession(id);
    sessions.erase(id);
  }));
}

shared_ptr<MessagePort> SessionHost::portFor(SessionEntry* entry) {
  auto port = entry->port.lock();
  if (port && !port->isClosed()) {
    return port;
  }
  for (auto it = ports.rbegin(); it != ports.rend(); ++it) {
    if (!(*it)->isClosed()) {
      entry->port = *it;
      return *it;
    }
  }
  return shared_ptr<MessagePort>();
}

void SessionHost::post(shared_ptr<MessagePort> port,
                       const ChannelResponse& response) {
  if (!port || port->isClosed()) {
    VLOG(1) << "No open channel for response to "
            << (response.has_terminalid() ? response.terminalid()
                                          : string("unknown terminal"));
    return;
  }
  try {
    port->post(Packet::fromProto(CHANNEL_RESPONSE, response));
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Failed to post response: " << ex.what();
  }
}
}  // namespace dx
