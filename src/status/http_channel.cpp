#include "poslink/status/http_channel.hpp"

#include <exception>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "poslink/core/transport/parse_url.hpp"
#include "poslink/log/logger.hpp"
#include "poslink/version.hpp"


namespace poslink::status {

namespace asio = boost::asio;
namespace http = boost::beast::http;
using tcp = asio::ip::tcp;
using boost::beast::error_code;

namespace {

// Percent-encode a single path segment (RFC 3986 unreserved set kept as is)
std::string encode_segment(std::string_view s) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                             || c == '-' || c == '.' || c == '_' || c == '~';
        if (unreserved) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string join_path(const std::string& base, std::string_view tail) {
    std::string path = base;
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    path += tail;
    return path;
}

} // namespace


struct HttpChannel::Impl {
    // One in-flight HTTP exchange; kept alive by its pending handlers
    struct Exchange : std::enable_shared_from_this<Exchange> {
        Exchange(Impl& owner_, Completion done_)
            : owner(owner_)
            , resolver(owner_.ioc)
            , stream(owner_.ioc)
            , deadline(owner_.ioc)
            , done(std::move(done_))
        {}

        Impl& owner;
        tcp::resolver resolver;
        boost::beast::tcp_stream stream;
        asio::steady_timer deadline;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::response<http::string_body> res;
        Completion done;
        bool finished{false};

        void start() {
            auto self = shared_from_this();
            // One budget for the whole exchange, name resolution included
            deadline.expires_after(owner.cfg.timeout);
            deadline.async_wait([self](const error_code& ec) {
                if (!ec) {
                    self->fail("request", boost::beast::error::timeout);
                }
            });
            resolver.async_resolve(owner.url.host, owner.url.port,
                [self](const error_code& ec, const tcp::resolver::results_type& results) {
                    if (ec) {
                        self->fail("resolve", ec);
                        return;
                    }
                    self->stream.async_connect(results,
                        [self](const error_code& ec2, const tcp::endpoint&) {
                            if (ec2) {
                                self->fail("connect", ec2);
                                return;
                            }
                            self->write();
                        });
                });
        }

        void write() {
            auto self = shared_from_this();
            http::async_write(stream, req,
                [self](const error_code& ec, std::size_t) {
                    if (ec) {
                        self->fail("write", ec);
                        return;
                    }
                    http::async_read(self->stream, self->buffer, self->res,
                        [self](const error_code& ec2, std::size_t) {
                            if (ec2) {
                                self->fail("read", ec2);
                                return;
                            }
                            const unsigned code = self->res.result_int();
                            const bool ok = code >= 200 && code < 300;
                            if (ok) {
                                PL_DEBUG("[HTTP] " << self->req.method_string() << " " << self->req.target() << " -> " << code);
                            } else {
                                PL_WARN("[HTTP] " << self->req.method_string() << " " << self->req.target() << " -> " << code);
                            }
                            self->finish(ok);
                        });
                });
        }

        void fail(std::string_view what, const error_code& ec) {
            if (finished) {
                return; // aborted by the deadline or already answered
            }
            PL_WARN("[HTTP] " << req.method_string() << " " << req.target() << " " << what << " failed: " << ec.message());
            finish(false);
        }

        void finish(bool ok) {
            if (finished) {
                return;
            }
            finished = true;
            --owner.in_flight;
            deadline.cancel();
            resolver.cancel();
            error_code ignored;
            stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
            stream.close();
            Completion cb = std::move(done);
            if (!cb) {
                return;
            }
            try {
                cb(ok);
            }
            catch (const std::exception& e) {
                PL_ERROR("[HTTP] Completion handler threw: " << e.what());
            }
        }
    };

    explicit Impl(HttpChannelConfig c)
        : cfg(std::move(c))
    {
        const auto err = core::transport::parse_url(cfg.api_url, url);
        if (err != core::transport::Error::None || url.scheme != "http") {
            PL_ERROR("[HTTP] Unsupported API base URL '" << cfg.api_url << "' (plain http:// required)");
            valid = false;
        }
    }

    // Declared first: destroyed last, after every exchange bound to it
    asio::io_context ioc;
    HttpChannelConfig cfg;
    core::transport::ParsedUrl url;
    bool valid{true};
    std::size_t in_flight{0};

    void submit(http::verb method, std::string target, std::string body, Completion done) {
        if (!valid) {
            if (done) done(false);
            return;
        }
        auto ex = std::make_shared<Exchange>(*this, std::move(done));
        ex->req.method(method);
        ex->req.target(target);
        ex->req.version(11);
        ex->req.set(http::field::host, url.host + ":" + url.port);
        ex->req.set(http::field::user_agent, std::string("poslink/") + PL_VERSION_STRING);
        ex->req.set(http::field::content_type, "application/json");
        ex->req.set(http::field::connection, "close");
        if (!cfg.auth_token.empty()) {
            ex->req.set(http::field::authorization, "Bearer " + cfg.auth_token);
        }
        ex->req.body() = std::move(body);
        ex->req.prepare_payload();
        ++in_flight;
        PL_TRACE("[HTTP] " << ex->req.method_string() << " " << target);
        ex->start();
    }
};


HttpChannel::HttpChannel(HttpChannelConfig cfg)
    : impl_(std::make_unique<Impl>(std::move(cfg)))
{}

HttpChannel::~HttpChannel() = default;

void HttpChannel::register_terminal(const Snapshot& snapshot, Completion done) {
    impl_->submit(http::verb::post,
                  join_path(impl_->url.path, "/network/terminals"),
                  registration_body(snapshot),
                  std::move(done));
}

void HttpChannel::update_status(const Snapshot& snapshot, HostStatus status, Completion done) {
    impl_->submit(http::verb::patch,
                  join_path(impl_->url.path, "/network/terminals/by-terminal-id/") + encode_segment(snapshot.terminal_id) + "/status",
                  status_body(snapshot, status),
                  std::move(done));
}

void HttpChannel::poll() noexcept {
    Impl& s = *impl_;
    try {
        if (s.ioc.stopped()) {
            s.ioc.restart();
        }
        s.ioc.poll();
    }
    catch (const std::exception& e) {
        PL_ERROR("[HTTP] I/O loop failure: " << e.what());
    }
}

std::size_t HttpChannel::in_flight() const noexcept {
    return impl_->in_flight;
}

} // namespace poslink::status
