#include "SessionHost.hpp"

#include "FakeChannelConnector.hpp"
#include "FakeHostEnvironment.hpp"
#include "FakeProcessSpawner.hpp"
#include "FakeScheduler.hpp"
#include "Packet.hpp"
#include "TestHeaders.hpp"

using namespace dx;

namespace {
struct HostFixture {
  HostFixture()
      : spawner(make_shared<FakeProcessSpawner>()),
        environment(make_shared<FakeHostEnvironment>()),
        scheduler(make_shared<FakeScheduler>()),
        client(make_shared<FakeMessagePort>()),
        server(make_shared<FakeMessagePort>()) {
    environment->env["SHELL"] = "/bin/bash";
    // Keep the welcome banner out of the way.
    config.timings.promptDelayMs = 3600 * 1000;
    FakeMessagePort::link(client, server);
    client->start();
    host.reset(new SessionHost(spawner, environment, scheduler, config));
    host->attach(server);
  }

  ChannelResponse send(ChannelRequestType type, const string& terminalId,
                       const ChannelRequestData& data = ChannelRequestData()) {
    ChannelRequest request;
    request.set_type(type);
    request.set_terminalid(terminalId);
    request.set_timestamp(scheduler->now());
    request.set_requestid("req-" + to_string(++sequence));
    *request.mutable_data() = data;
    size_t before = client->received.size();
    client->post(Packet::fromProto(CHANNEL_REQUEST, request));
    // Echoed output may be pushed ahead of the answer itself.
    for (size_t a = before; a < client->received.size(); a++) {
      auto response = client->received[a].parsePayload<ChannelResponse>();
      if (response.requestid() == request.requestid()) {
        return response;
      }
    }
    FAIL("No response to " << request.requestid());
    return ChannelResponse();
  }

  ChannelResponse create(const string& terminalId) {
    return send(CREATE, terminalId);
  }

  vector<ChannelResponse> unsolicited() const {
    vector<ChannelResponse> pushed;
    for (auto& response :
         client->receivedAs<ChannelResponse>(CHANNEL_RESPONSE)) {
      if (!response.has_requestid()) {
        pushed.push_back(response);
      }
    }
    return pushed;
  }

  vector<string> outputs() const {
    vector<string> texts;
    for (auto& response : unsolicited()) {
      if (response.data().has_output()) {
        texts.push_back(response.data().output());
      }
    }
    return texts;
  }

  shared_ptr<FakeProcessSpawner> spawner;
  shared_ptr<FakeHostEnvironment> environment;
  shared_ptr<FakeScheduler> scheduler;
  HostConfig config;
  shared_ptr<FakeMessagePort> client;
  shared_ptr<FakeMessagePort> server;
  unique_ptr<SessionHost> host;
  int sequence = 0;
};

ChannelRequestData textData(const string& text) {
  ChannelRequestData data;
  data.set_text(text);
  return data;
}
}  // namespace

TEST_CASE("Create starts a shell and answers with its pid", "[SessionHost]") {
  HostFixture fixture;
  auto response = fixture.create("term-a");
  REQUIRE(response.success());
  REQUIRE(response.terminalid() == "term-a");
  REQUIRE(response.data().id() == "term-a");
  REQUIRE(response.data().name() == "term-a");
  REQUIRE(response.data().pid() == 4242);
  REQUIRE(fixture.host->getSessionCount() == 1);
  REQUIRE(fixture.spawner->calls[0].command == "/bin/bash");
  REQUIRE(fixture.spawner->calls[0].options.env.at("COLUMNS") == "80");

  SECTION("Duplicate ids are refused") {
    auto duplicate = fixture.create("term-a");
    REQUIRE_FALSE(duplicate.success());
    REQUIRE(duplicate.error() == "Terminal term-a already exists");
    REQUIRE(fixture.spawner->calls.size() == 1);
  }

  SECTION("Create options are honored") {
    ChannelRequestData data;
    data.mutable_options()->set_name("logs");
    data.mutable_options()->set_shell("/bin/sh");
    data.mutable_options()->set_cols(132);
    (*data.mutable_options()->mutable_env())["PAGER"] = "cat";
    auto second = fixture.send(CREATE, "term-b", data);
    REQUIRE(second.success());
    REQUIRE(second.data().name() == "logs");
    auto& call = fixture.spawner->calls.back();
    REQUIRE(call.command == "/bin/sh");
    REQUIRE(call.options.env.at("COLUMNS") == "132");
    REQUIRE(call.options.env.at("LINES") == "24");
    REQUIRE(call.options.env.at("PAGER") == "cat");
  }
}

TEST_CASE("Create failures are answered", "[SessionHost]") {
  HostFixture fixture;

  SECTION("Missing id") {
    auto response = fixture.create("");
    REQUIRE_FALSE(response.success());
    REQUIRE(response.error() == "Missing terminal id");
  }

  SECTION("Spawn error is passed through") {
    fixture.spawner->failNext = true;
    auto response = fixture.create("term-x");
    REQUIRE_FALSE(response.success());
    REQUIRE(response.error().find("Failed to spawn terminal: ") == 0);
    REQUIRE(fixture.host->getSessionCount() == 0);
    REQUIRE(fixture.unsolicited().empty());
  }

  SECTION("Invalid geometry") {
    ChannelRequestData data;
    data.mutable_options()->set_cols(-3);
    // Non-positive requested geometry falls back to the configured default.
    auto response = fixture.send(CREATE, "term-y", data);
    REQUIRE(response.success());
    REQUIRE(fixture.spawner->calls.back().options.env.at("COLUMNS") == "80");
  }
}

TEST_CASE("Requests for unknown terminals fail", "[SessionHost]") {
  HostFixture fixture;
  for (auto type : {WRITE, DATA, RESIZE, KILL}) {
    auto response = fixture.send(type, "ghost", textData("x"));
    REQUIRE_FALSE(response.success());
    REQUIRE(response.error() == "Terminal ghost not found");
  }
}

TEST_CASE("Malformed packets are answered with errors", "[SessionHost]") {
  HostFixture fixture;
  fixture.client->post(Packet(CHANNEL_REQUEST, string("\xff\xff\xff", 3)));
  fixture.client->post(Packet(CHANNEL_RESPONSE, ""));
  auto responses =
      fixture.client->receivedAs<ChannelResponse>(CHANNEL_RESPONSE);
  REQUIRE(responses.size() == 2);
  REQUIRE_FALSE(responses[0].success());
  REQUIRE(responses[0].error().find("Malformed request: ") == 0);
  REQUIRE_FALSE(responses[1].success());
  REQUIRE(responses[1].error() == "Unexpected packet type");
}

TEST_CASE("Write, data and resize reach the session", "[SessionHost]") {
  HostFixture fixture;
  fixture.create("term-a");
  auto child = fixture.spawner->lastChild();

  REQUIRE(fixture.send(WRITE, "term-a", textData("ls\r")).success());
  REQUIRE(fixture.send(DATA, "term-a", textData("pwd\r")).success());
  REQUIRE(child->stdinData == "ls\npwd\n");
  // Local echo comes back as output.
  REQUIRE(fixture.outputs() == vector<string>{"ls\r\n", "pwd\r\n"});

  ChannelRequestData size;
  size.set_cols(100);
  size.set_rows(40);
  REQUIRE(fixture.send(RESIZE, "term-a", size).success());
  REQUIRE(fixture.host->getSession("term-a")->getCols() == 100);
  REQUIRE(child->countSignal(SIGWINCH) == 1);
}

TEST_CASE("Session output is pushed to the channel", "[SessionHost]") {
  HostFixture fixture;
  fixture.create("term-a");
  auto child = fixture.spawner->lastChild();

  child->emitStdout("\x1b[1mhello\x1b[0m\n");
  fixture.scheduler->advance(16);
  auto pushed = fixture.unsolicited();
  REQUIRE(pushed.size() == 1);
  REQUIRE(pushed[0].success());
  REQUIRE(pushed[0].terminalid() == "term-a");
  REQUIRE(pushed[0].data().output() == "hello\n");

  SECTION("Session errors are pushed once created") {
    child->emitError("read failed");
    pushed = fixture.unsolicited();
    REQUIRE(pushed.size() == 2);
    REQUIRE_FALSE(pushed[1].success());
    REQUIRE(pushed[1].error() == "read failed");
    REQUIRE(pushed[1].terminalid() == "term-a");
  }
}

TEST_CASE("Repeated identical output is throttled", "[SessionHost]") {
  HostFixture fixture;
  fixture.create("term-a");
  auto child = fixture.spawner->lastChild();

  for (int a = 0; a < 6; a++) {
    child->emitStdout("tick\n");
    fixture.scheduler->advance(16);
  }
  // The first copy plus three duplicates inside the window get through.
  REQUIRE(fixture.outputs().size() == 4);

  fixture.scheduler->advance(500);
  child->emitStdout("tick\n");
  fixture.scheduler->advance(16);
  REQUIRE(fixture.outputs().size() == 5);

  child->emitStdout("tock\n");
  fixture.scheduler->advance(16);
  REQUIRE(fixture.outputs().back() == "tock\n");
}

TEST_CASE("List reports every session", "[SessionHost]") {
  HostFixture fixture;
  auto empty = fixture.send(LIST, "");
  REQUIRE(empty.success());
  REQUIRE(empty.data().terminals_size() == 0);

  fixture.create("term-a");
  fixture.create("term-b");
  fixture.send(KILL, "term-b");

  auto listing = fixture.send(LIST, "");
  REQUIRE(listing.data().terminals_size() == 2);
  REQUIRE(listing.data().terminals(0).id() == "term-a");
  REQUIRE(listing.data().terminals(0).pid() == 4242);
  REQUIRE(listing.data().terminals(0).isactive());
  REQUIRE(listing.data().terminals(1).id() == "term-b");
  REQUIRE(listing.data().terminals(1).pid() == 4243);
  REQUIRE_FALSE(listing.data().terminals(1).isactive());
}

TEST_CASE("Kill reports the exit and removes the session", "[SessionHost]") {
  HostFixture fixture;
  fixture.create("term-a");
  auto child = fixture.spawner->lastChild();
  child->exitOnSignal.insert(SIGTERM);

  auto response = fixture.send(KILL, "term-a");
  REQUIRE(response.success());
  REQUIRE(child->countSignal(SIGTERM) == 1);

  auto pushed = fixture.unsolicited();
  REQUIRE(pushed.size() == 1);
  REQUIRE(pushed[0].terminalid() == "term-a");
  REQUIRE(pushed[0].data().id() == "term-a");
  REQUIRE(pushed[0].data().exitcode() == 0);
  REQUIRE(pushed[0].data().exitsignal() == SIGTERM);

  REQUIRE(fixture.host->getSessionCount() == 1);
  fixture.scheduler->advance(0);
  REQUIRE(fixture.host->getSessionCount() == 0);
  REQUIRE_FALSE(fixture.host->getSession("term-a"));

  SECTION("The id can be reused afterwards") {
    REQUIRE(fixture.create("term-a").success());
  }
}

TEST_CASE("Sessions survive a lost channel", "[SessionHost]") {
  HostFixture fixture;
  fixture.create("term-a");
  auto child = fixture.spawner->lastChild();

  fixture.client->close();
  REQUIRE(fixture.server->isClosed());
  REQUIRE(fixture.host->getSessionCount() == 1);

  auto client = make_shared<FakeMessagePort>();
  auto server = make_shared<FakeMessagePort>();
  FakeMessagePort::link(client, server);
  client->start();
  fixture.host->attach(server);

  child->emitStdout("still here\n");
  fixture.scheduler->advance(16);
  auto responses = client->receivedAs<ChannelResponse>(CHANNEL_RESPONSE);
  REQUIRE(responses.size() == 1);
  REQUIRE(responses[0].data().output() == "still here\n");
}

TEST_CASE("Shutdown kills every session", "[SessionHost]") {
  HostFixture fixture;
  fixture.create("term-a");
  fixture.create("term-b");
  fixture.host->shutdown();
  for (auto& child : fixture.spawner->children) {
    REQUIRE(child->countSignal(SIGTERM) == 1);
  }
  fixture.scheduler->advance(fixture.config.timings.killGraceMs);
  for (auto& child : fixture.spawner->children) {
    REQUIRE(child->countSignal(SIGKILL) == 1);
    child->emitExit(0, SIGKILL);
  }
  fixture.scheduler->advance(0);
  REQUIRE(fixture.host->getSessionCount() == 0);
}

TEST_CASE("Running sessions are monitored until removed", "[SessionHost]") {
  HostFixture fixture;
  PerformanceMonitor& monitor = fixture.host->getMonitor();
  REQUIRE_FALSE(monitor.isMonitoring());

  fixture.create("term-a");
  REQUIRE(monitor.isMonitoring());
  fixture.scheduler->advance(fixture.config.monitor.intervalMs);
  REQUIRE(monitor.getSessionSamples("term-a").size() == 1);
  REQUIRE(monitor.getGlobalStats().activeTerminals == 1);

  SECTION("Failed creates are not monitored") {
    fixture.spawner->failNext = true;
    REQUIRE_FALSE(fixture.create("term-b").success());
    REQUIRE(monitor.getGlobalStats().totalTerminals == 1);
  }

  SECTION("Exited sessions leave the monitor") {
    fixture.spawner->lastChild()->emitExit(0, 0);
    fixture.scheduler->advance(0);
    REQUIRE(fixture.host->getSessionCount() == 0);
    REQUIRE(monitor.getGlobalStats().totalTerminals == 0);
    REQUIRE_FALSE(monitor.isMonitoring());
  }
}
