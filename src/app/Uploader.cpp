#include "app/Uploader.hpp"

#include <spdlog/spdlog.h>

namespace vigil::app {

Uploader::Uploader(std::shared_ptr<EventQueue> queue, std::shared_ptr<ServerClient> client, size_t batch_size)
  : queue_(std::move(queue)), client_(std::move(client)), batch_size_(batch_size > 0 ? batch_size : 1) {}

size_t Uploader::upload_once(std::stop_token st) {
  size_t sent = 0;
  while (!st.stop_requested()) {
    auto batch = queue_->drain_batch(batch_size_);
    if (batch.empty()) break;
    if (!client_->send_events(batch, st)) {
      failed_batches_.fetch_add(1);
      spdlog::debug("Uploader: requeueing {} event(s)", batch.size());
      queue_->requeue_front(std::move(batch));
      break;
    }
    sent += batch.size();
    delivered_.fetch_add(batch.size());
  }
  return sent;
}

} // namespace vigil::app
