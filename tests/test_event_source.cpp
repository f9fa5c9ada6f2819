#include <catch2/catch_test_macros.hpp>
#include "event_source.hpp"
#include "errors.hpp"
#include "mock_stream.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

using namespace eventsource;
using namespace std::chrono_literals;

namespace {

// Thread-safe record of what listeners saw.
struct Recorder {
    std::mutex mutex;
    std::vector<std::string> log;

    void add(const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex);
        log.push_back(entry);
    }
    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return log;
    }
    size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return log.size();
    }
};

const char* URL = "http://127.0.0.1:1236/sub";

} // namespace

// ── Construction ─────────────────────────────────────────────────

TEST_CASE("EventSource: connects through the connector", "[event_source]") {
    MockConnector connector;
    ClientOptions opts;
    opts.headers.emplace_back("Authorization", "Bearer t");

    EventSource source(URL, connector, opts);
    REQUIRE(connector.call_count == 1);
    REQUIRE(connector.last_endpoint.host == "127.0.0.1");
    REQUIRE(connector.last_endpoint.port == "1236");
    REQUIRE(connector.last_endpoint.path == "/sub");
    REQUIRE(connector.last_options.headers.size() == 1);
    REQUIRE(source.url() == URL);
}

TEST_CASE("EventSource: malformed URL throws before connecting", "[event_source]") {
    MockConnector connector;
    REQUIRE_THROWS_AS(EventSource("127.0.0.1:1236/sub", connector), EndpointError);
    REQUIRE(connector.call_count == 0);
}

TEST_CASE("EventSource: connection failure throws", "[event_source]") {
    MockConnector connector;
    connector.fail = true;
    REQUIRE_THROWS_AS(EventSource(URL, connector), ConnectionError);
    REQUIRE(connector.call_count == 1);
}

// ── Ready state ──────────────────────────────────────────────────

TEST_CASE("EventSource: connecting until headers end", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    REQUIRE(source.state() == ReadyState::Connecting);

    connector.pipe->send("HTTP/1.1 200 OK\n");
    std::this_thread::sleep_for(50ms);
    REQUIRE(source.state() == ReadyState::Connecting);
}

TEST_CASE("EventSource: open after blank line", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);

    connector.pipe->send("\n");
    REQUIRE(wait_until([&] { return source.state() == ReadyState::Open; }));
}

TEST_CASE("EventSource: closed after close()", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);

    source.close();
    REQUIRE(source.state() == ReadyState::Closed);
    REQUIRE(connector.pipe->shutdown_calls == 1);
    REQUIRE(wait_until([&] { return source.finished(); }));
}

TEST_CASE("EventSource: close is idempotent", "[event_source]") {
    MockConnector connector;
    {
        EventSource source(URL, connector);
        source.close();
        REQUIRE_NOTHROW(source.close());
        REQUIRE(source.state() == ReadyState::Closed);
    }
    REQUIRE(connector.pipe->shutdown_calls == 1);
}

TEST_CASE("EventSource: remote end leaves state unchanged", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);

    connector.pipe->send("\n");
    REQUIRE(wait_until([&] { return source.state() == ReadyState::Open; }));
    connector.pipe->close_remote();
    REQUIRE(wait_until([&] { return source.finished(); }));
    REQUIRE(source.state() == ReadyState::Open);
}

// ── Open callbacks ───────────────────────────────────────────────

TEST_CASE("EventSource: open callbacks fire once, in order, before messages", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    Recorder rec;

    source.on_open([&] { rec.add("open1"); });
    source.on_open([&] { rec.add("open2"); });
    source.on_message([&](Event ev) { rec.add("msg:" + ev.data); });

    connector.pipe->send("HTTP/1.1 200 OK\n");
    connector.pipe->send("Date: Thu, 24 May 2018 12:26:38 GMT\n");
    connector.pipe->send("\n");
    connector.pipe->send("\n");
    connector.pipe->send("data: hi\n\n");

    REQUIRE(wait_until([&] { return rec.size() == 3; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(rec.snapshot() == std::vector<std::string>{"open1", "open2", "msg:hi"});
}

// ── Message dispatch ─────────────────────────────────────────────

TEST_CASE("EventSource: message listener receives data", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    std::atomic<int> calls{0};
    std::mutex m;
    Event got;

    source.on_message([&](Event ev) {
        std::lock_guard<std::mutex> lock(m);
        got = ev;
        calls++;
    });

    connector.pipe->send("\ndata: some message\n\n");

    REQUIRE(wait_until([&] { return calls.load() == 1; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(calls.load() == 1);
    std::lock_guard<std::mutex> lock(m);
    REQUIRE(got.type == "message");
    REQUIRE(got.data == "some message");
}

TEST_CASE("EventSource: headers are skipped before parsing", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    std::atomic<int> calls{0};
    source.on_message([&](Event) { calls++; });

    connector.pipe->send("HTTP/1.1 200 OK\n");
    connector.pipe->send("Server: nginx/1.10.3\n");
    connector.pipe->send("Content-Type: text/event-stream; charset=utf-8\n");
    connector.pipe->send("Connection: keep-alive\n");
    connector.pipe->send("\n");
    connector.pipe->send("data: this is a message\n\n");

    REQUIRE(wait_until([&] { return calls.load() == 1; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(calls.load() == 1);
}

TEST_CASE("EventSource: comments do not trigger listeners", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    Recorder rec;
    source.on_message([&](Event ev) { rec.add(ev.data); });

    connector.pipe->send("\n");
    connector.pipe->send(":comment\n:comment\ndata: m\n\n");

    REQUIRE(wait_until([&] { return rec.size() == 1; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(rec.snapshot() == std::vector<std::string>{"m"});
}

TEST_CASE("EventSource: extra blank lines produce no empty events", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    Recorder rec;
    source.on_message([&](Event ev) { rec.add(ev.data); });

    connector.pipe->send("\ndata: x\n\n\n\ndata: y\n\n");

    REQUIRE(wait_until([&] { return rec.size() == 2; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(rec.snapshot() == std::vector<std::string>{"x", "y"});
}

TEST_CASE("EventSource: named event reaches only its listener", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    Recorder custom;
    std::atomic<int> message_calls{0};

    source.add_event_listener("custom", [&](Event ev) { custom.add(ev.type + "=" + ev.data); });
    source.on_message([&](Event) { message_calls++; });

    connector.pipe->send("\nevent: custom\ndata: v\n\n");

    REQUIRE(wait_until([&] { return custom.size() == 1; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(custom.snapshot() == std::vector<std::string>{"custom=v"});
    REQUIRE(message_calls.load() == 0);
}

TEST_CASE("EventSource: events dispatched in stream order", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    Recorder rec;
    source.on_message([&](Event ev) { rec.add(ev.data); });
    source.add_event_listener("other", [&](Event ev) { rec.add("other:" + ev.data); });

    connector.pipe->send("\ndata: 1\n\nevent: other\ndata: 2\n\ndata: 3\n\n");

    REQUIRE(wait_until([&] { return rec.size() == 3; }));
    REQUIRE(rec.snapshot() == std::vector<std::string>{"1", "other:2", "3"});
}

TEST_CASE("EventSource: unterminated event is not dispatched at end of stream", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    std::atomic<int> calls{0};
    source.on_message([&](Event) { calls++; });

    connector.pipe->send("\ndata: partial\n");
    connector.pipe->close_remote();

    REQUIRE(wait_until([&] { return source.finished(); }));
    REQUIRE(calls.load() == 0);
}

TEST_CASE("EventSource: trailing carriage return at end of stream completes nothing", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    std::atomic<int> calls{0};
    source.on_message([&](Event) { calls++; });

    connector.pipe->send("\ndata: x\n\r");
    connector.pipe->close_remote();

    REQUIRE(wait_until([&] { return source.finished(); }));
    REQUIRE(calls.load() == 0);
}

TEST_CASE("EventSource: lone carriage return in headers does not open", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    std::atomic<int> opens{0};
    source.on_open([&] { opens++; });

    connector.pipe->send("HTTP/1.1 200 OK\n\r");
    connector.pipe->close_remote();

    REQUIRE(wait_until([&] { return source.finished(); }));
    REQUIRE(opens.load() == 0);
    REQUIRE(source.state() == ReadyState::Connecting);
}

// ── Chunked responses ────────────────────────────────────────────

TEST_CASE("EventSource: chunked body is decoded before parsing", "[event_source]") {
    MockConnector connector;
    connector.http = true;
    EventSource source(URL, connector);
    Recorder rec;
    source.on_message([&](Event ev) { rec.add("[" + ev.data + "]"); });

    connector.pipe->send("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n");
    connector.pipe->send("3\r\n:\n\n\r\n");
    connector.pipe->send("d\r\ndata: hello\n\n\r\n");

    REQUIRE(wait_until([&] { return rec.size() == 1; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(rec.snapshot() == std::vector<std::string>{"[hello]"});
}

TEST_CASE("EventSource: line split across chunks", "[event_source]") {
    MockConnector connector;
    connector.http = true;
    EventSource source(URL, connector);
    Recorder rec;
    source.on_message([&](Event ev) { rec.add(ev.data); });

    connector.pipe->send("HTTP/1.1 200 OK\r\ntransfer-encoding: Chunked\r\n\r\n");
    connector.pipe->send("5\r\ndata:\r\n");
    connector.pipe->send("8;ext=1\r\n split\n\n\r\n");
    connector.pipe->send("0\r\n\r\n");

    REQUIRE(wait_until([&] { return source.finished(); }));
    REQUIRE(rec.snapshot() == std::vector<std::string>{"split"});
}

TEST_CASE("EventSource: listener registered late misses earlier events", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    std::atomic<int> early{0};
    std::atomic<int> late{0};
    source.on_message([&](Event) { early++; });

    connector.pipe->send("\ndata: a\n\n");
    REQUIRE(wait_until([&] { return early.load() == 1; }));

    source.on_message([&](Event) { late++; });
    connector.pipe->send("data: b\n\n");
    REQUIRE(wait_until([&] { return early.load() == 2; }));
    REQUIRE(wait_until([&] { return late.load() == 1; }));
}

// ── Close ────────────────────────────────────────────────────────

TEST_CASE("EventSource: no dispatch after close", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    std::atomic<int> calls{0};
    source.on_message([&](Event) { calls++; });

    connector.pipe->send("\ndata: some message\n\n");
    REQUIRE(wait_until([&] { return calls.load() == 1; }));

    source.close();
    connector.pipe->send("\ndata: some message\n\n");
    std::this_thread::sleep_for(100ms);

    REQUIRE(calls.load() == 1);
    REQUIRE(source.state() == ReadyState::Closed);
}

TEST_CASE("EventSource: close during header skip suppresses open", "[event_source]") {
    MockConnector connector;
    connector.pipe->paused = true;
    connector.pipe->drain_after_shutdown = true;
    EventSource source(URL, connector);
    std::atomic<int> opens{0};
    source.on_open([&] { opens++; });

    // The header block is already buffered when close() lands.
    connector.pipe->send("HTTP/1.1 200 OK\n\ndata: x\n\n");
    source.close();
    connector.pipe->resume();

    REQUIRE(wait_until([&] { return source.finished(); }));
    REQUIRE(opens.load() == 0);
    REQUIRE(source.state() == ReadyState::Closed);
}

TEST_CASE("EventSource: close from a listener", "[event_source]") {
    MockConnector connector;
    EventSource source(URL, connector);
    std::atomic<int> calls{0};
    source.on_message([&](Event) {
        calls++;
        source.close();
    });

    connector.pipe->send("\ndata: 1\n\ndata: 2\n\n");
    REQUIRE(wait_until([&] { return source.finished(); }));
    REQUIRE(calls.load() == 1);
    REQUIRE(source.state() == ReadyState::Closed);
}

TEST_CASE("EventSource: destructor stops a blocked worker", "[event_source]") {
    MockConnector connector;
    {
        EventSource source(URL, connector);
        connector.pipe->send("\n");
        REQUIRE(wait_until([&] { return source.state() == ReadyState::Open; }));
    }
    REQUIRE(connector.pipe->shutdown_calls == 1);
}

TEST_CASE("ready_state_name: names every state", "[event_source]") {
    REQUIRE(std::string(ready_state_name(ReadyState::Connecting)) == "CONNECTING");
    REQUIRE(std::string(ready_state_name(ReadyState::Open)) == "OPEN");
    REQUIRE(std::string(ready_state_name(ReadyState::Closed)) == "CLOSED");
}
