#include "channel_client.hpp"

#include <spdlog/spdlog.h>

bool ChannelClient::reconnect(const CancellationToken& cancel) {
  std::lock_guard<std::mutex> g(reconnect_mu_);
  Backoff backoff(reconnect_backoff_);
  while (!connected()) {
    if (cancel.cancelled()) return false;
    try {
      connect();
      sessions_opened_.fetch_add(1);
      spdlog::info("Broker session established after {} attempt(s)", backoff.attempts() + 1);
      return true;
    } catch (const ConnectError& e) {
      auto delay = backoff.next();
      spdlog::warn("Broker connect failed: {} (retry in {} ms)", e.what(), delay.count());
      if (!cancel.wait_for(delay)) return false;
    }
  }
  return true;
}
