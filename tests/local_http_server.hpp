#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <httplib.h>

/**
 * @brief Loopback HTTP server serving one in-memory body under every path
 *
 * Answers HEAD and ranged GET. Each GET is held for delay_ms before it is
 * answered; get_requests counts GETs only.
 */
class LocalHttpServer
{
public:
    explicit LocalHttpServer(std::string body, bool ranges = true)
        : body_(std::move(body)), ranges_(ranges)
    {
        server_.Get(R"(/.*)", [this](const httplib::Request &req, httplib::Response &res)
                    {
            if (req.method != "HEAD")
            {
                get_requests++;
                auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms.load());
                while (std::chrono::steady_clock::now() < until && !stopping_.load())
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            res.set_header("Accept-Ranges", ranges_ ? "bytes" : "none");
            res.set_content(body_, "application/octet-stream"); });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]()
                              { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~LocalHttpServer()
    {
        stopping_ = true;
        server_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    LocalHttpServer(const LocalHttpServer &) = delete;
    LocalHttpServer &operator=(const LocalHttpServer &) = delete;

    std::string url(const std::string &path) const
    {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::atomic<int> get_requests{0};
    std::atomic<int> delay_ms{0};

private:
    std::string body_;
    bool ranges_;
    std::atomic<bool> stopping_{false};
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
};
