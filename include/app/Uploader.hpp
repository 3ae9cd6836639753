#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <stop_token>
#include "app/EventQueue.hpp"
#include "app/ServerClient.hpp"

namespace vigil::app {

// Drains the queue in batches. A batch is delivered only when the server
// answers 2xx; otherwise it goes back to the head of the queue.
class Uploader {
public:
  Uploader(std::shared_ptr<EventQueue> queue, std::shared_ptr<ServerClient> client, size_t batch_size);

  // Sends batches until the queue is empty, a delivery fails or st fires.
  // Returns the number of events delivered.
  size_t upload_once(std::stop_token st);

  [[nodiscard]] uint64_t delivered() const { return delivered_.load(); }
  [[nodiscard]] uint64_t failed_batches() const { return failed_batches_.load(); }

private:
  std::shared_ptr<EventQueue> queue_;
  std::shared_ptr<ServerClient> client_;
  size_t batch_size_;
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> failed_batches_{0};
};

} // namespace vigil::app
