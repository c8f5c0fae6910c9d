#include "HttpClient.hpp"

#include <utility>

namespace ams::azure {

void ClientReturn::operator()(httplib::Client* client) const {
  if (pool) {
    pool->release(client);
  } else {
    delete client;
  }
}

ClientPool::ClientPool(std::string origin, int timeoutSeconds, size_t maxIdle)
  : origin_(std::move(origin)), timeoutSeconds_(timeoutSeconds), maxIdle_(maxIdle) {}

ClientLease ClientPool::acquire() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!idle_.empty()) {
      ClientLease lease(idle_.back().release(), ClientReturn{this});
      idle_.pop_back();
      return lease;
    }
  }

  // httplib::Client picks TLS from the scheme when built with OpenSSL.
  auto client = std::make_unique<httplib::Client>(origin_);
  client->set_connection_timeout(timeoutSeconds_, 0);
  client->set_read_timeout(timeoutSeconds_, 0);
  client->set_write_timeout(timeoutSeconds_, 0);
  client->set_keep_alive(true);
  return ClientLease(client.release(), ClientReturn{this});
}

void ClientPool::release(httplib::Client* client) {
  std::unique_ptr<httplib::Client> owned(client);
  std::lock_guard<std::mutex> lock(mutex_);
  if (idle_.size() < maxIdle_) idle_.push_back(std::move(owned));
}

size_t ClientPool::idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

std::string transport_error(const char* service, const httplib::Result& res) {
  return std::string(service) + " request failed: " + httplib::to_string(res.error());
}

} // namespace ams::azure
