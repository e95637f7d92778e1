#include <iostream>
#include <stop_token>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "relay/ndjson_decoder.hpp"
#include "relay/stream_relay.hpp"
#include "test_support.hpp"

using omni_supervisor::core::RelaySettings;
using omni_supervisor::relay::make_generate_request;
using omni_supervisor::relay::NdjsonDecoder;
using omni_supervisor::relay::relay_error;
using omni_supervisor::relay::RelayResult;
using omni_supervisor::relay::RelayVocabulary;
using omni_supervisor::relay::StreamRelay;
using omni_supervisor::relay::StreamRequest;
using omni_supervisor::testing::FakeHttpClient;
using omni_supervisor::testing::RecordingEventSink;
using omni_supervisor::transport::transport_status;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

StreamRequest make_request(const std::string& subject = "hello") {
  StreamRequest request{};
  request.subject = subject;
  request.event_prefix = "ollama";
  request.http.method = "POST";
  request.http.url = "http://127.0.0.1:11434/api/generate";
  return request;
}

// Token payloads in arrival order.
std::vector<std::string> token_texts(RecordingEventSink& sink) {
  std::vector<std::string> out;
  for (const auto& event : sink.events()) {
    if (event.name == "ollama-token") {
      out.push_back(event.payload.get<std::string>());
    }
  }
  return out;
}

int test_events_follow_start_tokens_end_order() {
  FakeHttpClient client;
  client.chunks = {"{\"token\":\"a\"}\n{\"token\":\"b\"}\n", "{\"done\":true}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const RelayResult result = relay.relay(make_request(), sink);
  const auto names = sink.names();
  const std::vector<std::string> expected{"ollama-start", "ollama-token", "ollama-token", "ollama-end"};
  if (!result.ok() || names != expected) {
    return fail("test_events_follow_start_tokens_end_order", "unexpected event sequence");
  }
  if (token_texts(sink) != std::vector<std::string>{"a", "b"} || result.tokens != 2) {
    return fail("test_events_follow_start_tokens_end_order", "token payloads should be forwarded verbatim");
  }
  if (sink.events().front().payload != "hello") {
    return fail("test_events_follow_start_tokens_end_order", "start event should carry the subject");
  }

  return 0;
}

int test_token_field_and_terminal_fragment() {
  FakeHttpClient client;
  client.chunks = {"{\"token\":\"x\"}\n{\"token\":\"y\",\"done\":true}\n{\"token\":\"late\"}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  const std::vector<std::string> expected{"ollama-start", "ollama-token", "ollama-token", "ollama-end"};
  if (!result.ok() || sink.names() != expected) {
    return fail("test_token_field_and_terminal_fragment", "terminal record fragment should precede end");
  }
  if (token_texts(sink) != std::vector<std::string>{"x", "y"}) {
    return fail("test_token_field_and_terminal_fragment", "records after the terminal record must be ignored");
  }

  return 0;
}

int test_stream_without_terminal_record_fails() {
  FakeHttpClient client;
  client.chunks = {"{\"token\":\"a\"}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  const std::vector<std::string> expected{"ollama-start", "ollama-token"};
  if (result.error != relay_error::UPSTREAM_NOT_RESPONDING || sink.names() != expected) {
    return fail("test_stream_without_terminal_record_fails", "missing done should fail without an end event");
  }

  return 0;
}

int test_malformed_lines_are_skipped() {
  FakeHttpClient client;
  client.chunks = {"not json\n\n   \n[1,2]\n{\"response\":\"ok\"}\n{\"response\":42}\n{\"done\":true}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  if (!result.ok() || token_texts(sink) != std::vector<std::string>{"ok"}) {
    return fail("test_malformed_lines_are_skipped", "only the well-formed fragment should be relayed");
  }
  if (sink.names().back() != "ollama-end") {
    return fail("test_malformed_lines_are_skipped", "stream should still terminate");
  }

  return 0;
}

int test_records_split_across_chunks() {
  FakeHttpClient client;
  // "é" is C3 A9; the chunk boundary falls inside both the record and the sequence.
  client.chunks = {"{\"response\":\"caf\xC3", "\xA9\"}\n{\"do", "ne\":true}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  if (!result.ok() || token_texts(sink) != std::vector<std::string>{"caf\xC3\xA9"}) {
    return fail("test_records_split_across_chunks", "record split across chunks should be reassembled");
  }

  return 0;
}

int test_invalid_utf8_chunk_is_dropped() {
  FakeHttpClient client;
  client.chunks = {"{\"response\":\"a\"}\n", "{\"response\":\"\xFF\"}\n", "{\"response\":\"b\"}\n{\"done\":true}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  if (!result.ok() || token_texts(sink) != std::vector<std::string>{"a", "b"}) {
    return fail("test_invalid_utf8_chunk_is_dropped", "chunk with invalid UTF-8 should be skipped");
  }

  return 0;
}

int test_invalid_chunk_mid_line_does_not_swallow_next_record() {
  FakeHttpClient client;
  client.chunks = {"{\"token\":\"a\"}\n{\"token\":\"b", "\xFF\"}\n", "{\"token\":\"c\"}\n{\"done\":true}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  if (!result.ok() || sink.names().back() != "ollama-end") {
    return fail("test_invalid_chunk_mid_line_does_not_swallow_next_record", "stream should still complete");
  }
  if (token_texts(sink) != std::vector<std::string>{"a", "c"}) {
    return fail("test_invalid_chunk_mid_line_does_not_swallow_next_record",
                "record after the dropped chunk should not be joined to the broken line");
  }

  return 0;
}

int test_trailing_line_without_newline() {
  FakeHttpClient client;
  client.chunks = {"{\"response\":\"a\"}\n{\"response\":\"b\",\"done\":true}"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  if (!result.ok() || sink.names().back() != "ollama-end" || token_texts(sink).size() != 2) {
    return fail("test_trailing_line_without_newline", "unterminated final record should still be decoded");
  }

  return 0;
}

int test_http_error_status_is_upstream_error() {
  FakeHttpClient client;
  client.status = 500;
  client.chunks = {"{\"error\":\"model not found\"}"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  if (result.error != relay_error::UPSTREAM_ERROR) {
    return fail("test_http_error_status_is_upstream_error", "non-2xx should map to upstream error");
  }
  if (result.message.find("500") == std::string::npos || result.message.find("model not found") == std::string::npos) {
    return fail("test_http_error_status_is_upstream_error", "message should carry status and provider error");
  }
  if (sink.names() != std::vector<std::string>{"ollama-start"}) {
    return fail("test_http_error_status_is_upstream_error", "no token or end events expected");
  }

  return 0;
}

int test_error_record_fails_session() {
  FakeHttpClient client;
  client.chunks = {"{\"response\":\"a\"}\n{\"error\":\"out of memory\"}\n{\"done\":true}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  if (result.error != relay_error::UPSTREAM_ERROR || result.message != "out of memory") {
    return fail("test_error_record_fails_session", "error record should fail the session");
  }
  if (sink.names().back() == "ollama-end") {
    return fail("test_error_record_fails_session", "end must not follow an error record");
  }

  return 0;
}

int test_transport_failure_is_not_responding() {
  FakeHttpClient client;
  client.transport = transport_status::FAILED;
  client.error = "Couldn't connect to server";
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink);
  if (result.error != relay_error::UPSTREAM_NOT_RESPONDING || result.message != "Couldn't connect to server") {
    return fail("test_transport_failure_is_not_responding", "connect failure should be not responding");
  }
  if (std::string(omni_supervisor::relay::to_string(result.error)) != "upstream not responding") {
    return fail("test_transport_failure_is_not_responding", "reason text mismatch");
  }

  client.transport = transport_status::TIMED_OUT;
  client.error = "Timeout was reached";
  if (relay.relay(make_request(), sink).error != relay_error::UPSTREAM_NOT_RESPONDING) {
    return fail("test_transport_failure_is_not_responding", "idle timeout should be not responding");
  }

  client.transport = transport_status::OK;
  client.chunks.clear();
  if (relay.relay(make_request(), sink).error != relay_error::UPSTREAM_NOT_RESPONDING) {
    return fail("test_transport_failure_is_not_responding", "empty body should be not responding");
  }

  return 0;
}

int test_cancellation_stops_relay() {
  FakeHttpClient client;
  std::stop_source stop;
  client.stop_source = &stop;
  client.stop_after_chunks = 1;
  client.chunks = {"{\"response\":\"a\"}\n", "{\"response\":\"b\"}\n", "{\"done\":true}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  const auto result = relay.relay(make_request(), sink, stop.get_token());
  if (result.error != relay_error::CANCELLED) {
    return fail("test_cancellation_stops_relay", "stop request should cancel the relay");
  }
  if (token_texts(sink) != std::vector<std::string>{"a"} || sink.names().back() == "ollama-end") {
    return fail("test_cancellation_stops_relay", "no events expected after cancellation");
  }

  return 0;
}

int test_concurrent_prefixes_are_independent() {
  FakeHttpClient client;
  client.chunks = {"{\"response\":\"a\"}\n{\"done\":true}\n"};
  RecordingEventSink sink;
  const StreamRelay relay(client);

  auto first = make_request("one");
  first.event_prefix = "chat-1";
  auto second = make_request("two");
  second.event_prefix = "chat-2";
  (void)relay.relay(first, sink);
  (void)relay.relay(second, sink);

  const std::vector<std::string> expected{"chat-1-start", "chat-1-token", "chat-1-end",
                                          "chat-2-start", "chat-2-token", "chat-2-end"};
  if (sink.names() != expected) {
    return fail("test_concurrent_prefixes_are_independent", "each relay should use its own prefix");
  }

  return 0;
}

int test_custom_vocabulary() {
  FakeHttpClient client;
  client.chunks = {"{\"text\":\"hi\",\"finished\":false}\n{\"finished\":true}\n"};
  RecordingEventSink sink;
  RelayVocabulary vocabulary{};
  vocabulary.terminal_field = "finished";
  vocabulary.fragment_fields = {"text"};
  const StreamRelay relay(client, vocabulary);

  const auto result = relay.relay(make_request(), sink);
  if (!result.ok() || token_texts(sink) != std::vector<std::string>{"hi"}) {
    return fail("test_custom_vocabulary", "configured field names should drive decoding");
  }

  return 0;
}

int test_ndjson_decoder_line_handling() {
  NdjsonDecoder decoder;
  std::vector<std::string> lines;

  (void)decoder.feed("first\r\nsec", lines);
  (void)decoder.feed("ond\n\xE2\x82", lines);
  (void)decoder.feed("\xAC", lines);
  decoder.finish(lines);

  const std::vector<std::string> expected{"first", "second", "\xE2\x82\xAC"};
  if (lines != expected) {
    return fail("test_ndjson_decoder_line_handling", "CR stripping or carry-over mismatch");
  }

  lines.clear();
  // Overlong encoding of '/' and a lone surrogate are both rejected.
  if (decoder.feed("\xC0\xAF\n", lines) || decoder.feed("\xED\xA0\x80\n", lines)) {
    return fail("test_ndjson_decoder_line_handling", "invalid UTF-8 should be rejected");
  }
  if (!lines.empty() || decoder.chunks_skipped() != 2) {
    return fail("test_ndjson_decoder_line_handling", "rejected chunks should be counted and produce no lines");
  }

  return 0;
}

int test_ndjson_decoder_resyncs_after_dropped_chunk() {
  NdjsonDecoder decoder;
  std::vector<std::string> lines;

  (void)decoder.feed("one\ntw", lines);
  if (decoder.feed("o\xFF", lines)) {
    return fail("test_ndjson_decoder_resyncs_after_dropped_chunk", "invalid chunk should be rejected");
  }
  // The rest of the interrupted line is discarded; later lines survive.
  (void)decoder.feed("tail", lines);
  (void)decoder.feed(" of two\nthree\n", lines);
  (void)decoder.feed("four", lines);
  decoder.finish(lines);

  const std::vector<std::string> expected{"one", "three", "four"};
  if (lines != expected) {
    return fail("test_ndjson_decoder_resyncs_after_dropped_chunk", "broken line should be discarded up to the next newline");
  }

  return 0;
}

int test_generate_request_shape() {
  RelaySettings settings{};
  settings.base_url = "http://gpu-box:11434";
  settings.temperature = 0.5F;
  settings.max_tokens = 256;

  const auto request = make_generate_request(settings, "why is the sky blue?", "mistral");
  if (request.http.method != "POST" || request.http.url != "http://gpu-box:11434/api/generate") {
    return fail("test_generate_request_shape", "request target mismatch");
  }

  const auto body = nlohmann::json::parse(request.http.body);
  if (body.at("model") != "mistral" || body.at("prompt") != "why is the sky blue?" || body.at("stream") != true) {
    return fail("test_generate_request_shape", "request body mismatch");
  }
  if (body.at("options").at("num_predict") != 256 || request.event_prefix != "ollama") {
    return fail("test_generate_request_shape", "options or prefix mismatch");
  }
  if (request.http.idle_timeout != settings.idle_timeout) {
    return fail("test_generate_request_shape", "idle timeout should come from settings");
  }

  const auto defaulted = make_generate_request(settings, "hi");
  if (nlohmann::json::parse(defaulted.http.body).at("model") != "llama3.2") {
    return fail("test_generate_request_shape", "model should default from settings");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_events_follow_start_tokens_end_order(); rc != 0) return rc;
  if (int rc = test_token_field_and_terminal_fragment(); rc != 0) return rc;
  if (int rc = test_stream_without_terminal_record_fails(); rc != 0) return rc;
  if (int rc = test_malformed_lines_are_skipped(); rc != 0) return rc;
  if (int rc = test_records_split_across_chunks(); rc != 0) return rc;
  if (int rc = test_invalid_utf8_chunk_is_dropped(); rc != 0) return rc;
  if (int rc = test_invalid_chunk_mid_line_does_not_swallow_next_record(); rc != 0) return rc;
  if (int rc = test_trailing_line_without_newline(); rc != 0) return rc;
  if (int rc = test_http_error_status_is_upstream_error(); rc != 0) return rc;
  if (int rc = test_error_record_fails_session(); rc != 0) return rc;
  if (int rc = test_transport_failure_is_not_responding(); rc != 0) return rc;
  if (int rc = test_cancellation_stops_relay(); rc != 0) return rc;
  if (int rc = test_concurrent_prefixes_are_independent(); rc != 0) return rc;
  if (int rc = test_custom_vocabulary(); rc != 0) return rc;
  if (int rc = test_ndjson_decoder_line_handling(); rc != 0) return rc;
  if (int rc = test_ndjson_decoder_resyncs_after_dropped_chunk(); rc != 0) return rc;
  if (int rc = test_generate_request_shape(); rc != 0) return rc;

  std::cout << "[PASS] relay unit tests\n";
  return 0;
}
