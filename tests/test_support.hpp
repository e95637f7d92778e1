#pragma once

#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

#include "sinks/event_sink.hpp"
#include "transport/http_client.hpp"

namespace omni_supervisor::testing {

// Replays a scripted response. Streamed bodies arrive as the configured chunks.
class FakeHttpClient final : public transport::HttpClient {
 public:
  transport::transport_status transport{transport::transport_status::OK};
  long status{200};
  std::vector<std::string> chunks{};
  std::string error{};
  // Raise a stop request after this many chunks were delivered. Negative disables.
  int stop_after_chunks{-1};
  std::stop_source* stop_source{nullptr};

  std::vector<transport::HttpRequest> requests{};

  transport::HttpResponse fetch(const transport::HttpRequest& request) override {
    requests.push_back(request);
    transport::HttpResponse response{};
    response.transport = transport;
    response.status = transport == transport::transport_status::OK ? status : 0;
    response.error = error;
    if (transport == transport::transport_status::OK) {
      for (const auto& chunk : chunks) {
        response.body += chunk;
      }
    }
    return response;
  }

  transport::HttpResponse stream(const transport::HttpRequest& request, const transport::ChunkHandler& on_chunk,
                                 const std::stop_token& stop) override {
    requests.push_back(request);
    transport::HttpResponse response{};
    response.status = status;
    if (transport != transport::transport_status::OK) {
      response.transport = transport;
      response.status = 0;
      response.error = error;
      return response;
    }

    if (status < 200 || status >= 300) {
      for (const auto& chunk : chunks) {
        response.body += chunk;
      }
      response.transport = transport::transport_status::OK;
      return response;
    }

    int delivered = 0;
    for (const auto& chunk : chunks) {
      if (stop.stop_requested()) {
        response.transport = transport::transport_status::CANCELLED;
        response.error = "request cancelled";
        return response;
      }
      if (!on_chunk(chunk)) {
        response.transport = transport::transport_status::ABORTED;
        response.error = "aborted by handler";
        return response;
      }
      ++delivered;
      if (stop_source != nullptr && delivered == stop_after_chunks) {
        stop_source->request_stop();
      }
    }

    if (stop.stop_requested()) {
      response.transport = transport::transport_status::CANCELLED;
      response.error = "request cancelled";
      return response;
    }

    response.transport = transport::transport_status::OK;
    return response;
  }
};

// Keeps every emitted event. Thread safe so background sessions can write to it.
class RecordingEventSink final : public sinks::EventSink {
 public:
  bool accept{true};

  bool emit(const sinks::OutboundEvent& event) noexcept override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    return accept;
  }

  std::vector<sinks::OutboundEvent> events() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::vector<std::string> names() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& event : events_) {
      out.push_back(event.name);
    }
    return out;
  }

 private:
  std::mutex mutex_{};
  std::vector<sinks::OutboundEvent> events_{};
};

}  // namespace omni_supervisor::testing
