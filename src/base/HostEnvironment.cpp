#include "HostEnvironment.hpp"

namespace dx {
string hostPlatformName(HostPlatform platform) {
  switch (platform) {
    case PLATFORM_LINUX:
      return "linux";
    case PLATFORM_MACOS:
      return "macos";
    case PLATFORM_WINDOWS:
      return "windows";
    case PLATFORM_OTHER_UNIX:
      return "unix";
  }
  return "unknown";
}

HostPlatform SystemHostEnvironment::getPlatform() const {
#if defined(_WIN32)
  return PLATFORM_WINDOWS;
#elif __APPLE__
  return PLATFORM_MACOS;
#elif __linux__
  return PLATFORM_LINUX;
#else
  return PLATFORM_OTHER_UNIX;
#endif
}

optional<string> SystemHostEnvironment::getEnv(const string& name) const {
  const char* value = ::getenv(name.c_str());
  if (value == NULL) {
    return nullopt;
  }
  return string(value);
}

string SystemHostEnvironment::getCwd() const {
  std::error_code ec;
  auto cwd = fs::current_path(ec);
  if (ec) {
    LOG(WARNING) << "Could not read the working directory: " << ec.message();
    return "/";
  }
  return cwd.string();
}

string SystemHostEnvironment::getHostName() const {
  char buf[256];
  if (::gethostname(buf, sizeof(buf)) == -1) {
    LOG(WARNING) << "gethostname failed: " << strerror(GetErrno());
    return "localhost";
  }
  buf[sizeof(buf) - 1] = '\0';
  return string(buf);
}

string SystemHostEnvironment::getUserName() const {
  passwd* pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_name != NULL) {
    return string(pwd->pw_name);
  }
  auto user = getEnv("USER");
  if (user && !user->empty()) {
    return *user;
  }
  return "user";
}
}  // namespace dx
