#include <tabstream/emit/emitter.hpp>
#include <tabstream/emit/ndjson.hpp>
#include <tabstream/pipeline/runner.hpp>
#include <tabstream/server/http_server.hpp>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <optional>
#include <string>
#include <utility>

namespace tabstream::server {

namespace {

constexpr const char* kJsonContentType = "application/json";

void reply_error(httplib::Response& res, const Error& error) {
    res.status = http_status_for(error.kind);
    res.set_content(error_body(error), kJsonContentType);
}

}  // namespace

struct HttpServer::Impl {
    ServerConfig config;
    httplib::Server svr;
    int port = 0;
    std::atomic<std::uint64_t> rejected{0};
    std::atomic<std::uint64_t> completed{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<std::uint64_t> cancelled{0};

    explicit Impl(ServerConfig c) : config(std::move(c)) {}

    void stream_rows(const httplib::Request& req, httplib::Response& res) {
        pipeline::ParamLookup lookup = [&req](std::string_view name) -> std::optional<std::string> {
            std::string key(name);
            if (!req.has_param(key)) {
                return std::nullopt;
            }
            return req.get_param_value(key);
        };

        auto request = parse_run_request(config, lookup);
        if (!request) {
            spdlog::info("GET /stream/rows rejected: {}", request.error().format());
            ++rejected;
            reply_error(res, request.error());
            return;
        }

        auto runner = std::make_shared<pipeline::PipelineRunner>(std::move(request->source),
                                                                 std::move(request->pipeline));
        // Validation reads the first chunk; nothing is committed yet.
        if (auto started = runner->start(); !started) {
            ++rejected;
            reply_error(res, started.error());
            return;
        }
        spdlog::info("run {}: streaming {} ({})", runner->id(), req.get_param_value("path"),
                     pipeline::transform_kind_name(runner->config().transform));

        res.set_chunked_content_provider(
            emit::kNdjsonContentType,
            [this, runner](std::size_t /*offset*/, httplib::DataSink& sink) -> bool {
                auto summary = emit::emit(*runner, [&sink](std::string_view frame) -> bool {
                    return sink.is_writable() && sink.write(frame.data(), frame.size());
                });
                switch (summary.outcome) {
                    case emit::EmitOutcome::Completed:
                        ++completed;
                        sink.done();
                        return true;
                    case emit::EmitOutcome::Cancelled:
                        ++cancelled;
                        spdlog::info("run {}: client disconnected after {} records", runner->id(),
                                     summary.records);
                        return false;
                    case emit::EmitOutcome::Failed:
                        ++failed;
                        // Headers are out; dropping the connection leaves the
                        // chunked body unterminated so the client sees the failure.
                        spdlog::error("run {}: aborted after {} records: {}", runner->id(),
                                      summary.records, summary.error->format());
                        return false;
                }
                return false;
            },
            [runner](bool success) {
                if (!success) {
                    runner->cancel();
                }
            });
    }

    void routes() {
        svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(usage_body(config), kJsonContentType);
        });

        svr.Get("/stream/rows", [this](const httplib::Request& req, httplib::Response& res) {
            stream_rows(req, res);
        });

        svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
        });
    }
};

HttpServer::HttpServer(ServerConfig config) : impl_(std::make_unique<Impl>(std::move(config))) {
    impl_->routes();
}

HttpServer::~HttpServer() = default;

auto HttpServer::start() -> bool {
    const auto& host = impl_->config.host;
    if (impl_->config.port == 0) {
        impl_->port = impl_->svr.bind_to_any_port(host);
    } else if (impl_->svr.bind_to_port(host, impl_->config.port)) {
        impl_->port = impl_->config.port;
    } else {
        impl_->port = -1;
    }
    if (impl_->port <= 0) {
        spdlog::error("cannot bind {}:{}", host, impl_->config.port);
        return false;
    }
    spdlog::info("listening on {}:{} (data root {})", host, impl_->port, impl_->config.data_root);
    return true;
}

auto HttpServer::serve() -> bool {
    return impl_->svr.listen_after_bind();
}

auto HttpServer::run() -> int {
    if (!start()) {
        return 1;
    }
    return serve() ? 0 : 1;
}

void HttpServer::stop() {
    impl_->svr.stop();
}

auto HttpServer::port() const noexcept -> int {
    return impl_->port;
}

auto HttpServer::stats() const -> Stats {
    return Stats{
        .rejected = impl_->rejected.load(),
        .completed = impl_->completed.load(),
        .failed = impl_->failed.load(),
        .cancelled = impl_->cancelled.load(),
    };
}

auto HttpServer::config() const noexcept -> const ServerConfig& {
    return impl_->config;
}

}  // namespace tabstream::server
