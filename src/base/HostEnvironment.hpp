#ifndef __DX_HOST_ENVIRONMENT__
#define __DX_HOST_ENVIRONMENT__

#include "Headers.hpp"

namespace dx {
enum HostPlatform {
  PLATFORM_LINUX = 0,
  PLATFORM_MACOS = 1,
  PLATFORM_WINDOWS = 2,
  PLATFORM_OTHER_UNIX = 3,
};

string hostPlatformName(HostPlatform platform);

/**
 * @brief Read-only view of the machine a session is launched on.
 */
class HostEnvironment {
 public:
  virtual ~HostEnvironment() {}

  virtual HostPlatform getPlatform() const = 0;
  /** @brief Value of an environment variable, empty when unset. */
  virtual optional<string> getEnv(const string& name) const = 0;
  virtual string getCwd() const = 0;
  virtual string getHostName() const = 0;
  virtual string getUserName() const = 0;
};

class SystemHostEnvironment : public HostEnvironment {
 public:
  virtual HostPlatform getPlatform() const;
  virtual optional<string> getEnv(const string& name) const;
  virtual string getCwd() const;
  virtual string getHostName() const;
  virtual string getUserName() const;
};
}  // namespace dx

#endif  // __DX_HOST_ENVIRONMENT__
