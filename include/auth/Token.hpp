#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace gdfs::auth {

// OAuth2 bearer token as issued by the credential collaborator. The core never refreshes it.
struct Token {
    std::string access_token{}, token_type{"Bearer"}, refresh_token{};
    std::time_t expiry{}; // 0 = no expiry recorded

    [[nodiscard]] bool valid() const;
    [[nodiscard]] std::string authorizationHeader() const;
};

void to_json(nlohmann::json& j, const Token& t);
void from_json(const nlohmann::json& j, Token& t);

Token loadTokenFromFile(const std::filesystem::path& file);
void storeTokenToFile(const std::filesystem::path& file, const Token& token);

// Text form of the token: base64 of its JSON. Encodes URL-safe, decodes both alphabets.
std::string toBase64(const Token& token);
Token fromBase64(const std::string& b64);

}
