#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif
#include <httplib.h>

namespace ams::azure {

class ClientPool;

// Hands the client back to its pool when the lease ends.
struct ClientReturn {
  ClientPool* pool = nullptr;
  void operator()(httplib::Client* client) const;
};

using ClientLease = std::unique_ptr<httplib::Client, ClientReturn>;

// Keep-alive clients for one origin ("https://host[:port]"), shared by every
// request a store makes. httplib::Client is not thread-safe, so each client
// is leased to one caller at a time; idle clients keep their connection open
// for the next request.
class ClientPool {
public:
  ClientPool(std::string origin, int timeoutSeconds, size_t maxIdle = 16);
  ClientPool(const ClientPool&) = delete;
  ClientPool& operator=(const ClientPool&) = delete;

  ClientLease acquire();

  const std::string& origin() const { return origin_; }
  size_t idle() const;

private:
  friend struct ClientReturn;
  void release(httplib::Client* client);

  std::string origin_;
  int timeoutSeconds_;
  size_t maxIdle_;
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<httplib::Client>> idle_;
};

// Message for a request that never produced a response.
std::string transport_error(const char* service, const httplib::Result& res);

} // namespace ams::azure
