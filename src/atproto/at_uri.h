/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace atp {

struct AtUri {
    std::string authority;
    std::string collection;
    std::string rkey;
};

// at://<authority>[/<collection>[/<rkey>]]. Throws std::invalid_argument on a missing scheme or
// authority.
AtUri parse_at_uri(std::string_view uri);

struct HttpResponse {
    int status = 0;
    std::string body;
};

// Outbound transport used for handle resolution. Implementations own timeouts and TLS; a transport
// failure should be reported as a non-200 status rather than thrown.
class HttpClient {
   public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url) = 0;
};

class HandleResolver {
   public:
    static constexpr std::string_view kResolveEndpoint =
        "https://bsky.social/xrpc/app.bsky.identity.resolveHandle";

    explicit HandleResolver(HttpClient& http) : _http(http) {}

    static std::string resolve_url(std::string_view did);

    // std::nullopt on a non-200 status, unparseable body or missing "handle"; the failure is logged.
    std::optional<std::string> resolve(std::string_view did);

   private:
    HttpClient& _http;
};

// https://bsky.app/profile/<handle>/post/<rkey>, or std::nullopt when the DID cannot be resolved.
std::optional<std::string> get_url_from_uri(std::string_view uri, HandleResolver& resolver);

}  // namespace atp
