#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace chronodb {

class DatabaseRegistry;

/// Admin-token and per-database key authorization.
/// Authorization is off until at least one admin token is configured.
class AuthMiddleware {
public:
    enum class Access { Admin, Read, Write };

    struct AuthResult {
        bool authorized = false;
        int status = 200;          // 401 or 403 when denied
        std::string principal;
        std::string reason;        // for logs
        static AuthResult OK(std::string_view who) { return {true, 200, std::string(who), ""}; }
        static AuthResult Unauthorized(std::string msg) { return {false, 401, "", std::move(msg)}; }
        static AuthResult Forbidden(std::string msg) { return {false, 403, "", std::move(msg)}; }
    };

    struct TokenConfig {
        std::string token;
        std::string user_id;
    };

    struct Metrics {
        std::atomic<uint64_t> authz_success_total{0};
        std::atomic<uint64_t> authz_denied_total{0};
        std::atomic<uint64_t> authz_invalid_token_total{0};
    };

    /// @param registry Used to check database access keys (may be null: admin tokens only)
    explicit AuthMiddleware(const DatabaseRegistry* registry = nullptr);

    void addToken(const TokenConfig& config);
    void removeToken(std::string_view token);
    void clearTokens();

    /// Add CHRONODB_ADMIN_TOKEN if it is set
    void loadFromEnvironment();

    /**
     * @param token Credential from the request, if any
     * @param access What the route needs
     * @param db Target database (ignored for Admin)
     */
    AuthResult authorize(const std::optional<std::string>& token, Access access, const std::string& db) const;

    bool isEnabled() const;

    const Metrics& getMetrics() const { return metrics_; }

    /// Extract token from "Bearer <token>" header value
    static std::optional<std::string> extractBearerToken(std::string_view auth_header);

private:
    const DatabaseRegistry* registry_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TokenConfig> tokens_; // token -> config
    mutable Metrics metrics_;
};

} // namespace chronodb
