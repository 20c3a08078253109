#include "proxy_streamer.h"

#include "httplib.h"

#include <chrono>
#include <iostream>
#include <utility>

namespace cidgate {

const char* stream_kind_str(StreamKind k) {
    switch (k) {
        case StreamKind::OK:          return "ok";
        case StreamKind::NOT_FOUND:   return "not_found";
        case StreamKind::TIMEOUT:     return "timeout";
        case StreamKind::UNREACHABLE: return "unreachable";
    }
    return "unknown";
}

std::string cache_control_for(bool name_based) {
    if (name_based) return "public, max-age=60";
    return "public, max-age=29030400, immutable";
}

std::string probe_upstream(const std::string& upstream_base, int timeout_sec) {
    httplib::Client cli(upstream_base);
    cli.set_connection_timeout(timeout_sec, 0);
    cli.set_read_timeout(timeout_sec, 0);

    auto res = cli.Get("/ipfs/QmYwAPJzv5CZsnA625s3Xf2nemtYgPpHdWEz79ojWnPbdG");
    if (!res) return std::string("error: ") + httplib::to_string(res.error());

    const int st = res->status;
    if (st == 200 || st == 301 || st == 302 || st == 404) return "ok";
    return "error(" + std::to_string(st) + ")";
}

// ---- ChunkChannel ----------------------------------------------------------

ChunkChannel::ChunkChannel(std::size_t max_bytes)
    : max_bytes_(max_bytes == 0 ? 1 : max_bytes) {}

bool ChunkChannel::push(std::string chunk) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&]{
        return cancelled_ || q_.empty() || bytes_ + chunk.size() <= max_bytes_;
    });
    if (cancelled_) return false;

    bytes_ += chunk.size();
    q_.push_back(std::move(chunk));
    cv_.notify_all();
    return true;
}

bool ChunkChannel::pop(std::string* out) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&]{ return cancelled_ || closed_ || !q_.empty(); });
    if (cancelled_) return false;
    if (q_.empty()) return false;   // closed and drained

    *out = std::move(q_.front());
    q_.pop_front();
    bytes_ -= out->size();
    cv_.notify_all();
    return true;
}

ChunkChannel::PopRc ChunkChannel::pop_for(std::string* out, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lk(mu_);
    const bool woke = cv_.wait_for(lk, wait, [&]{ return cancelled_ || closed_ || !q_.empty(); });
    if (!woke) return PopRc::EMPTY;
    if (cancelled_ || q_.empty()) return PopRc::END;

    *out = std::move(q_.front());
    q_.pop_front();
    bytes_ -= out->size();
    cv_.notify_all();
    return PopRc::CHUNK;
}

void ChunkChannel::close(bool failed) {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    failed_ = failed_ || failed;
    cv_.notify_all();
}

void ChunkChannel::cancel() {
    std::lock_guard<std::mutex> lk(mu_);
    cancelled_ = true;
    q_.clear();
    bytes_ = 0;
    cv_.notify_all();
}

bool ChunkChannel::cancelled() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cancelled_;
}

bool ChunkChannel::failed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failed_;
}

// ---- BodyStream ------------------------------------------------------------

BodyStream::BodyStream(std::shared_ptr<ChunkChannel> ch, std::thread worker,
                       std::function<void()> abort)
    : ch_(std::move(ch)), worker_(std::move(worker)), abort_(std::move(abort)) {}

BodyStream::~BodyStream() {
    cancel();
    if (worker_.joinable()) worker_.join();
}

bool BodyStream::read(std::string* chunk) {
    return ch_->pop(chunk);
}

ChunkChannel::PopRc BodyStream::read_for(std::string* chunk, std::chrono::milliseconds wait) {
    return ch_->pop_for(chunk, wait);
}

void BodyStream::cancel() {
    ch_->cancel();
    if (abort_) abort_();
}

bool BodyStream::truncated() const {
    return ch_->failed();
}

// ---- ProxyStreamer ---------------------------------------------------------

namespace {

// Response head handed from the worker to stream().
struct HeadState {
    std::mutex mu;
    std::condition_variable cv;
    bool ready = false;

    StreamKind kind = StreamKind::UNREACHABLE;
    int status = 0;
    std::string content_type;
    std::string detail;

    void publish(StreamKind k, int st, std::string ct, std::string d) {
        std::lock_guard<std::mutex> lk(mu);
        if (ready) return;
        kind = k;
        status = st;
        content_type = std::move(ct);
        detail = std::move(d);
        ready = true;
        cv.notify_all();
    }

    bool is_ready() {
        std::lock_guard<std::mutex> lk(mu);
        return ready;
    }
};

} // namespace

ProxyStreamer::ProxyStreamer(ProxyStreamerConfig cfg) : cfg_(std::move(cfg)) {
    while (!cfg_.upstream_base.empty() && cfg_.upstream_base.back() == '/')
        cfg_.upstream_base.pop_back();
}

StreamOutcome ProxyStreamer::stream(const std::string& path, bool name_based) const {
    const std::string target = std::string(name_based ? "/ipns/" : "/ipfs/") + path;

    auto head = std::make_shared<HeadState>();
    auto ch = std::make_shared<ChunkChannel>(cfg_.channel_max_bytes);

    // Shared with BodyStream so cancel() can stop() a transfer stalled in a read.
    auto cli = std::make_shared<httplib::Client>(cfg_.upstream_base);
    cli->set_connection_timeout(cfg_.connect_timeout_sec, 0);
    cli->set_read_timeout(cfg_.read_timeout_sec, 0);
    cli->set_follow_location(true);

    const int read_to = cfg_.read_timeout_sec;

    std::thread worker([head, ch, cli, target, read_to]() {
        const auto t0 = std::chrono::steady_clock::now();

        auto res = cli->Get(target, httplib::Headers{},
            [&](const httplib::Response& r) {
                if (r.status == 404) {
                    head->publish(StreamKind::NOT_FOUND, r.status, "", "upstream 404");
                    return false;
                }
                head->publish(StreamKind::OK, r.status,
                              r.get_header_value("Content-Type"), "");
                return true;
            },
            [&](const char* data, size_t len) {
                return ch->push(std::string(data, len));
            });

        if (res) {
            head->publish(StreamKind::UNREACHABLE, 0, "", "no response head");
            ch->close(false);
            return;
        }

        const httplib::Error err = res.error();

        if (head->is_ready()) {
            // Head already delivered: NOT_FOUND abort, client cancel, or a
            // real mid-stream failure.
            const bool mid_stream_failure =
                err != httplib::Error::Canceled && !ch->cancelled();
            if (mid_stream_failure) {
                std::cerr << "[proxy] upstream error mid-stream target=" << target
                          << " err=" << httplib::to_string(err) << std::endl;
            }
            ch->close(mid_stream_failure);
            return;
        }

        // A read error that took (about) the whole read timeout is a timeout;
        // an early one is a reset.
        const long elapsed_ms = (long)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        const bool read_timed_out = elapsed_ms + 250 >= (long)read_to * 1000;

        StreamKind kind = StreamKind::UNREACHABLE;
        if (err == httplib::Error::ConnectionTimeout) kind = StreamKind::TIMEOUT;
        if (err == httplib::Error::Read && read_timed_out) kind = StreamKind::TIMEOUT;

        head->publish(kind, 0, "", httplib::to_string(err));
        ch->close(true);
    });

    {
        std::unique_lock<std::mutex> lk(head->mu);
        head->cv.wait(lk, [&]{ return head->ready; });
    }

    StreamOutcome out;
    out.kind = head->kind;
    out.detail = head->detail;

    if (out.kind != StreamKind::OK) {
        ch->cancel();
        worker.join();
        return out;
    }

    out.status = head->status;
    out.content_type = head->content_type.empty()
        ? std::string("application/octet-stream")
        : head->content_type;
    out.cache_control = cache_control_for(name_based);
    out.body = std::make_shared<BodyStream>(ch, std::move(worker), [cli]() { cli->stop(); });
    return out;
}

} // namespace cidgate
