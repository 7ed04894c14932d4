#include "http/Transport.hpp"
#include "auth/Token.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace gdfs::http;
using namespace gdfs::util;

Transport::Transport(std::shared_ptr<const auth::Token> token, TransportOptions options)
    : token_(std::move(token)), options_(std::move(options)) {
    if (!token_) throw std::invalid_argument("Transport requires a token");
    ensureCurlGlobalInit();
}

void Transport::setToken(std::shared_ptr<const auth::Token> token) {
    if (!token) throw std::invalid_argument("Transport requires a token");
    std::scoped_lock lock(mutex_);
    token_ = std::move(token);
}

std::shared_ptr<const gdfs::auth::Token> Transport::token() const {
    std::scoped_lock lock(mutex_);
    return token_;
}

std::string Transport::escape(const std::string& s) {
    CurlEasy tmpHandle;
    char* escaped = curl_easy_escape(tmpHandle, s.c_str(), static_cast<int>(s.size()));
    if (!escaped) throw std::runtime_error("curl_easy_escape failed");
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

HttpResponse Transport::perform(const Request& req) const {
    SList hdrs;
    if (req.authorize) {
        const auto tok = token();
        if (!tok->valid()) log::Registry::auth()->warn("[Transport] Token is empty or expired, request to {} will likely fail", req.url);
        hdrs.add(tok->authorizationHeader());
    }
    for (const auto& h : req.headers) hdrs.add(h);

    struct ReadCtx {
        const BodyReader* reader;
    } ctx{ &req.reader };

    if (req.reader) hdrs.add("Transfer-Encoding: chunked");
    hdrs.add("Expect:");

    HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_sec);
        if (options_.transfer_timeout_sec > 0) curl_easy_setopt(h, CURLOPT_TIMEOUT, options_.transfer_timeout_sec);

        if (req.reader) {
            curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
            curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
            curl_easy_setopt(h, CURLOPT_READFUNCTION,
                +[](char* out, size_t size, size_t nmemb, void* userdata) -> size_t {
                    const auto* c = static_cast<ReadCtx*>(userdata);
                    try {
                        return (*c->reader)(out, size * nmemb); // 0 signals EOF
                    } catch (const std::exception& e) {
                        log::Registry::drive()->error("[Transport] Request body source failed: {}", e.what());
                        return CURL_READFUNC_ABORT;
                    }
                });
        } else if (req.method == "GET") {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
            if (!req.body.empty() || req.method == "POST" || req.method == "PATCH" || req.method == "PUT") {
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
            }
        }
    });

    if (resp.curl != CURLE_OK)
        log::Registry::drive()->error("[Transport] {} {} failed: CURL={} {}",
                                      req.method, req.url, static_cast<int>(resp.curl), resp.error);

    return resp;
}
