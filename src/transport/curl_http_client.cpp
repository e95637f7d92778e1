#include "transport/curl_http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>

namespace omni_supervisor::transport {
namespace {

constexpr std::size_t kMaxErrorBodyBytes = 64 * 1024;

struct EasyDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const {
    if (list != nullptr) {
      curl_slist_free_all(list);
    }
  }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

struct TransferContext {
  CURL* handle{nullptr};
  const ChunkHandler* on_chunk{nullptr};
  const std::stop_token* stop{nullptr};
  std::string* body{nullptr};
  bool status_checked{false};
  bool deliver_chunks{false};
  bool handler_aborted{false};
};

void ensure_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::size_t write_body(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* ctx = static_cast<TransferContext*>(userdata);
  const std::size_t total = size * nmemb;

  if (ctx->on_chunk == nullptr) {
    ctx->body->append(data, total);
    return total;
  }

  if (!ctx->status_checked) {
    long status = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
    ctx->deliver_chunks = status >= 200 && status < 300;
    ctx->status_checked = true;
  }

  if (!ctx->deliver_chunks) {
    if (ctx->body->size() < kMaxErrorBodyBytes) {
      ctx->body->append(data, std::min(total, kMaxErrorBodyBytes - ctx->body->size()));
    }
    return total;
  }

  try {
    if (!(*ctx->on_chunk)(std::string_view(data, total))) {
      ctx->handler_aborted = true;
      return 0;
    }
  } catch (const std::exception&) {
    ctx->handler_aborted = true;
    return 0;
  }
  return total;
}

int check_cancel(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* ctx = static_cast<TransferContext*>(userdata);
  return (ctx->stop != nullptr && ctx->stop->stop_requested()) ? 1 : 0;
}

HttpResponse perform(const HttpRequest& request, const std::string& user_agent, const ChunkHandler* on_chunk,
                     const std::stop_token* stop) {
  ensure_global_init();

  HttpResponse response{};
  EasyHandle handle(curl_easy_init());
  if (handle == nullptr) {
    response.error = "curl_easy_init failed";
    return response;
  }

  HeaderList headers{};
  for (const auto& header : request.headers) {
    curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
    if (appended == nullptr) {
      response.error = "unable to allocate request headers";
      return response;
    }
    (void)headers.release();
    headers.reset(appended);
  }

  TransferContext ctx{};
  ctx.handle = handle.get();
  ctx.on_chunk = on_chunk;
  ctx.stop = stop;
  ctx.body = &response.body;

  CURL* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, check_cancel);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
  if (headers != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  }

  if (request.method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
  } else if (request.method != "GET") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (!request.body.empty()) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }
  }

  if (request.timeout.count() > 0) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  }
  if (request.idle_timeout.count() > 0) {
    const long idle_seconds = static_cast<long>((request.idle_timeout.count() + 999) / 1000);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.idle_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, idle_seconds);
  }

  const CURLcode rc = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

  switch (rc) {
    case CURLE_OK:
      response.transport = transport_status::OK;
      break;
    case CURLE_OPERATION_TIMEDOUT:
      response.transport = transport_status::TIMED_OUT;
      response.error = curl_easy_strerror(rc);
      break;
    case CURLE_ABORTED_BY_CALLBACK:
      response.transport = transport_status::CANCELLED;
      response.error = "request cancelled";
      break;
    case CURLE_WRITE_ERROR:
      response.transport = ctx.handler_aborted ? transport_status::ABORTED : transport_status::FAILED;
      response.error = curl_easy_strerror(rc);
      break;
    default:
      response.transport = transport_status::FAILED;
      response.error = curl_easy_strerror(rc);
      break;
  }

  return response;
}

}  // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) { ensure_global_init(); }

HttpResponse CurlHttpClient::fetch(const HttpRequest& request) {
  return perform(request, user_agent_, nullptr, nullptr);
}

HttpResponse CurlHttpClient::stream(const HttpRequest& request, const ChunkHandler& on_chunk,
                                    const std::stop_token& stop) {
  return perform(request, user_agent_, &on_chunk, &stop);
}

}  // namespace omni_supervisor::transport
