#pragma once

#include <tabstream/server/routing.hpp>

#include <cstdint>
#include <memory>

namespace tabstream::server {

/// cpp-httplib server exposing `/` (usage) and `/stream/rows` (NDJSON stream).
///
/// Each `/stream/rows` request builds its own PipelineRunner and validates it
/// before any byte of the response is sent, so configuration errors get a
/// proper status code. A client that disconnects mid-stream cancels its run.
class HttpServer {
   public:
    /// Outcome counters of `/stream/rows` requests.
    struct Stats {
        std::uint64_t rejected = 0;
        std::uint64_t completed = 0;
        std::uint64_t failed = 0;
        std::uint64_t cancelled = 0;
    };

    explicit HttpServer(ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    auto operator=(const HttpServer&) -> HttpServer& = delete;

    /// Bind host:port; port 0 picks a free port. False on bind error.
    [[nodiscard]] auto start() -> bool;

    /// Serve on the bound socket until stop().
    auto serve() -> bool;

    /// Bind and serve until stop(). Non-zero on bind error.
    auto run() -> int;

    void stop();

    /// Bound port once start() succeeded.
    [[nodiscard]] auto port() const noexcept -> int;
    [[nodiscard]] auto stats() const -> Stats;
    [[nodiscard]] auto config() const noexcept -> const ServerConfig&;

   private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tabstream::server
