#include "SocketChannelConnector.hpp"

namespace dx {
namespace {
void makeSocketPair(int* fds) {
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == -1) {
    throw std::runtime_error(string("socketpair failed: ") +
                             strerror(GetErrno()));
  }
}
}  // namespace

ChannelEndpoints SocketChannelConnector::connect(const string& channelId) {
  int frontEndFds[2];
  int hostFds[2];
  makeSocketPair(frontEndFds);
  try {
    makeSocketPair(hostFds);
  } catch (const std::runtime_error&) {
    ::close(frontEndFds[0]);
    ::close(frontEndFds[1]);
    throw;
  }

  ChannelEndpoints endpoints;
  endpoints.frontEnd = make_shared<SocketMessagePort>(loop, frontEndFds[0]);
  endpoints.host = make_shared<SocketMessagePort>(loop, hostFds[0]);

  frontEndPeer = make_shared<SocketMessagePort>(loop, frontEndFds[1]);
  frontEndPeer->start();
  attachHost(make_shared<SocketMessagePort>(loop, hostFds[1]));

  LOG(INFO) << "Created socket channel " << channelId;
  return endpoints;
}
}  // namespace dx
