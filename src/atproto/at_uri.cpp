/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "atproto/at_uri.h"
#include "utils/log.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <vector>

namespace atp {
static std::vector<std::string_view> split_path(std::string_view s) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= s.size()) {
        const std::size_t slash = s.find('/', start);
        if (slash == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

AtUri parse_at_uri(std::string_view uri) {
    constexpr std::string_view scheme = "at://";
    if (uri.rfind(scheme, 0) != 0) {
        throw std::invalid_argument("Not an at:// URI: " + std::string(uri));
    }
    const auto parts = split_path(uri.substr(scheme.size()));
    if (parts.empty() || parts[0].empty()) {
        throw std::invalid_argument("at:// URI has no authority: " + std::string(uri));
    }

    AtUri out{};
    out.authority = std::string(parts[0]);
    if (parts.size() > 1) {
        out.collection = std::string(parts[1]);
    }
    if (parts.size() > 2) {
        out.rkey = std::string(parts.back());
    }
    return out;
}

std::string HandleResolver::resolve_url(std::string_view did) {
    std::string url(kResolveEndpoint);
    url += "?did=";
    url += did;
    return url;
}

std::optional<std::string> HandleResolver::resolve(std::string_view did) {
    const HttpResponse response = _http.get(resolve_url(did));
    if (response.status != 200) {
        ATP_LOG_ERROR("Failed to resolve DID %s: %d", std::string(did).c_str(), response.status);
        return std::nullopt;
    }

    const auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        ATP_LOG_ERROR("Failed to resolve DID %s: response is not a JSON object", std::string(did).c_str());
        return std::nullopt;
    }
    auto it = body.find("handle");
    if (it == body.end() || !it->is_string()) {
        ATP_LOG_ERROR("Failed to resolve DID %s: no handle in response", std::string(did).c_str());
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<std::string> get_url_from_uri(std::string_view uri, HandleResolver& resolver) {
    const AtUri parsed = parse_at_uri(uri);
    const auto handle = resolver.resolve(parsed.authority);
    if (!handle.has_value()) {
        ATP_LOG_ERROR("Failed to resolve handle.");
        return std::nullopt;
    }
    return "https://bsky.app/profile/" + *handle + "/post/" + parsed.rkey;
}
}  // namespace atp
