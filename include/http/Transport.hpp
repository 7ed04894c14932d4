#pragma once

#include "util/curlWrappers.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gdfs::auth {
struct Token;
}

namespace gdfs::http {

struct TransportOptions {
    long connect_timeout_sec = 30;
    long transfer_timeout_sec = 0;
    std::string user_agent = "gdfs/0.1";
};

// Pull-style request body: fill at most `max` bytes, return 0 at end of input.
using BodyReader = std::function<size_t(char* out, size_t max)>;

struct Request {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers{};
    std::string body{};
    BodyReader reader{}; // when set, body is streamed with chunked transfer encoding
    bool authorize = true;
};

// Authenticated transport over libcurl. The token is owned by the caller and may be swapped on refresh.
class Transport {
public:
    explicit Transport(std::shared_ptr<const auth::Token> token, TransportOptions options = {});

    [[nodiscard]] util::HttpResponse perform(const Request& req) const;

    void setToken(std::shared_ptr<const auth::Token> token);
    [[nodiscard]] std::shared_ptr<const auth::Token> token() const;

    [[nodiscard]] static std::string escape(const std::string& s);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const auth::Token> token_;
    TransportOptions options_;
};

}
