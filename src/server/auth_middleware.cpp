#include "server/auth_middleware.h"
#include "meta/database_registry.h"
#include "utils/logger.h"

#include <cstdlib>

namespace chronodb {

AuthMiddleware::AuthMiddleware(const DatabaseRegistry* registry) : registry_(registry) {}

void AuthMiddleware::addToken(const TokenConfig& config) {
    if (config.token.empty()) {
        CHRONODB_WARN("Ignoring empty admin token for '{}'", config.user_id);
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_[config.token] = config;
    CHRONODB_INFO("Added admin token for '{}'", config.user_id);
}

void AuthMiddleware::removeToken(std::string_view token) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(std::string(token));
}

void AuthMiddleware::clearTokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.clear();
}

void AuthMiddleware::loadFromEnvironment() {
    if (const char* env = std::getenv("CHRONODB_ADMIN_TOKEN")) {
        if (*env) {
            addToken({env, "env-admin"});
        }
    }
}

bool AuthMiddleware::isEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !tokens_.empty();
}

AuthMiddleware::AuthResult AuthMiddleware::authorize(const std::optional<std::string>& token,
                                                     Access access,
                                                     const std::string& db) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tokens_.empty()) {
        return AuthResult::OK("anonymous");
    }
    if (!token || token->empty()) {
        metrics_.authz_invalid_token_total++;
        return AuthResult::Unauthorized("Missing credentials");
    }

    auto it = tokens_.find(*token);
    if (it != tokens_.end()) {
        metrics_.authz_success_total++;
        return AuthResult::OK(it->second.user_id);
    }

    if (registry_ && !db.empty()) {
        if (access != Access::Admin) {
            auto needed = access == Access::Read ? DatabaseRegistry::Permission::Read
                                                 : DatabaseRegistry::Permission::Write;
            if (registry_->checkKey(db, *token, needed)) {
                metrics_.authz_success_total++;
                return AuthResult::OK("key:" + db);
            }
        }
        // Valid key for this database, but not enough for the route
        if (registry_->checkKey(db, *token, DatabaseRegistry::Permission::Read) ||
            registry_->checkKey(db, *token, DatabaseRegistry::Permission::Write)) {
            metrics_.authz_denied_total++;
            CHRONODB_WARN("Key for database '{}' lacks permission for this route", db);
            return AuthResult::Forbidden("Access key does not grant this permission");
        }
    }

    metrics_.authz_invalid_token_total++;
    return AuthResult::Unauthorized("Invalid credentials");
}

std::optional<std::string> AuthMiddleware::extractBearerToken(std::string_view auth_header) {
    constexpr std::string_view prefix = "Bearer ";

    if (auth_header.size() <= prefix.size()) {
        return std::nullopt;
    }
    if (auth_header.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }

    std::string token(auth_header.substr(prefix.size()));
    auto start = token.find_first_not_of(" \t");
    auto end = token.find_last_not_of(" \t");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    return token.substr(start, end - start + 1);
}

} // namespace chronodb
