#include "auth/Token.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>
#include <sodium.h>

using namespace gdfs::auth;
using namespace gdfs::util;

bool Token::valid() const {
    if (access_token.empty()) return false;
    return expiry == 0 || expiry > now();
}

std::string Token::authorizationHeader() const {
    return "Authorization: " + (token_type.empty() ? std::string("Bearer") : token_type) + " " + access_token;
}

void gdfs::auth::to_json(nlohmann::json& j, const Token& t) {
    j = {
        {"access_token", t.access_token},
        {"token_type", t.token_type},
        {"refresh_token", t.refresh_token},
    };
    if (t.expiry) j["expiry"] = formatRfc3339(t.expiry);
}

void gdfs::auth::from_json(const nlohmann::json& j, Token& t) {
    t.access_token = j.at("access_token").get<std::string>();
    t.token_type = j.value("token_type", std::string("Bearer"));
    t.refresh_token = j.value("refresh_token", std::string());
    t.expiry = j.contains("expiry") ? parseRfc3339(j.at("expiry").get<std::string>()) : 0;
}

Token gdfs::auth::loadTokenFromFile(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) throw std::runtime_error("couldn't open token file: " + file.string());

    try {
        return nlohmann::json::parse(in).get<Token>();
    } catch (const nlohmann::json::exception& e) {
        log::Registry::auth()->error("[Token] Unable to decode token file {}: {}", file.string(), e.what());
        throw std::runtime_error(std::string("unable to decode token: ") + e.what());
    }
}

void gdfs::auth::storeTokenToFile(const std::filesystem::path& file, const Token& token) {
    std::ofstream out(file, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("couldn't open token file: " + file.string());

    out << nlohmann::json(token).dump();
    if (!out) throw std::runtime_error("unable to encode token to " + file.string());
}

std::string gdfs::auth::toBase64(const Token& token) {
    const std::string data = nlohmann::json(token).dump();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_URLSAFE);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_URLSAFE);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

Token gdfs::auth::fromBase64(const std::string& b64) {
    std::vector<unsigned char> decoded(b64.size());
    size_t out_len = 0;

    const auto decode = [&](const int variant) {
        return sodium_base642bin(decoded.data(), decoded.size(),
                                 b64.c_str(), b64.size(),
                                 nullptr, &out_len, nullptr, variant) == 0;
    };

    if (!decode(sodium_base64_VARIANT_ORIGINAL) && !decode(sodium_base64_VARIANT_URLSAFE))
        throw std::runtime_error("Invalid base64 token");

    try {
        return nlohmann::json::parse(decoded.begin(), decoded.begin() + static_cast<std::ptrdiff_t>(out_len)).get<Token>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("unable to decode token: ") + e.what());
    }
}
