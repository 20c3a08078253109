#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace cidgate {

struct ProxyStreamerConfig {
    // scheme://host[:port] of the storage daemon's gateway port.
    std::string upstream_base = "http://127.0.0.1:8080";

    int read_timeout_sec = 120;
    int connect_timeout_sec = 10;

    // Upper bound of body bytes buffered between upstream and client.
    std::size_t channel_max_bytes = 1024 * 1024;
};

enum class StreamKind : int {
    OK = 0,
    NOT_FOUND,
    TIMEOUT,
    UNREACHABLE,
};

const char* stream_kind_str(StreamKind k);

// Cache-Control for a proxied success. CID paths are immutable; names are not.
std::string cache_control_for(bool name_based);

// Liveness probe: GET a well-known empty-directory CID. 200/301/302/404 count
// as "ok"; anything else is "error(<status>)" or "error: <transport error>".
std::string probe_upstream(const std::string& upstream_base, int timeout_sec = 4);

/*
ChunkChannel
============

Bounded single-producer / single-consumer byte queue.

- push() blocks while the buffered size is at the limit (backpressure on the
  upstream reader). A single chunk larger than the limit is still accepted
  when the queue is empty.
- cancel() is the consumer saying "stop": pending and future push() calls
  return false, which aborts the upstream transfer.
- close(failed) is the producer saying "no more data"; pop() drains what is
  left and then returns false.
- pop_for() waits at most `wait` and reports EMPTY when nothing arrived, so
  the consumer can check its own side between waits.
*/
class ChunkChannel {
public:
    enum class PopRc : int {
        CHUNK = 0,
        END,      // closed and drained, or cancelled
        EMPTY,    // timed out, producer still running
    };

    explicit ChunkChannel(std::size_t max_bytes);

    bool push(std::string chunk);
    bool pop(std::string* out);
    PopRc pop_for(std::string* out, std::chrono::milliseconds wait);

    void close(bool failed);
    void cancel();

    bool cancelled() const;
    bool failed() const;

private:
    const std::size_t max_bytes_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::string> q_;
    std::size_t bytes_ = 0;
    bool closed_ = false;
    bool failed_ = false;
    bool cancelled_ = false;
};

/*
BodyStream
==========

Consumer side of one upstream transfer. Owns the worker thread that runs the
upstream GET; destruction cancels the transfer and joins the worker.

cancel() closes the channel and runs `abort`, which shuts the upstream socket
down, so a worker stalled in a socket read returns at once.
*/
class BodyStream {
public:
    BodyStream(std::shared_ptr<ChunkChannel> ch, std::thread worker,
               std::function<void()> abort = nullptr);
    ~BodyStream();

    BodyStream(const BodyStream&) = delete;
    BodyStream& operator=(const BodyStream&) = delete;

    // Next chunk; false at end of body (complete, truncated or cancelled).
    bool read(std::string* chunk);

    // Like read(), but gives up after `wait` with EMPTY.
    ChunkChannel::PopRc read_for(std::string* chunk, std::chrono::milliseconds wait);

    void cancel();

    // Upstream failed after the head was sent; the body is incomplete.
    bool truncated() const;

private:
    std::shared_ptr<ChunkChannel> ch_;
    std::thread worker_;
    std::function<void()> abort_;
};

struct StreamOutcome {
    StreamKind kind = StreamKind::UNREACHABLE;

    int status = 0;                 // upstream status (OK only)
    std::string content_type;       // upstream Content-Type (OK only)
    std::string cache_control;      // directive to send (OK only)

    std::shared_ptr<BodyStream> body;   // OK only

    std::string detail;             // for logs, never sent to clients
};

/*
ProxyStreamer
=============

GET {upstream_base}/ipfs/{path} or {upstream_base}/ipns/{path} and hand the
body over incrementally.

stream() returns once the upstream response head has arrived (or the attempt
failed). Failure mapping:
- connect refused / DNS / reset before head   -> UNREACHABLE
- connect timeout, read timeout before head   -> TIMEOUT
- upstream 404                                -> NOT_FOUND
- anything else                               -> OK with the upstream status
*/
class ProxyStreamer {
public:
    explicit ProxyStreamer(ProxyStreamerConfig cfg);

    StreamOutcome stream(const std::string& path, bool name_based) const;

    const ProxyStreamerConfig& config() const { return cfg_; }

private:
    ProxyStreamerConfig cfg_;
};

} // namespace cidgate
