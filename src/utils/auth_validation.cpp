// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/auth_validation.h"

#include "utils/url.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace hackerai {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

} // namespace

bool is_valid_token_format(const std::string& token) {
    return token.size() == AUTH_TOKEN_LENGTH &&
           std::all_of(token.begin(), token.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::vector<std::string> get_allowed_hosts() {
    const char* env = std::getenv(ALLOWED_HOSTS_ENV);
    if (env == nullptr) {
        return {"hackerai.co", "localhost"};
    }

    std::vector<std::string> hosts;
    std::string value(env);
    size_t start = 0;
    while (start <= value.size()) {
        auto comma = value.find(',', start);
        std::string entry = trim(
            value.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!entry.empty()) {
            hosts.push_back(entry);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return hosts;
}

bool validate_origin(const std::string& origin) {
    auto parsed = parse_url(origin);
    if (!parsed) {
        spdlog::debug("[AuthValidation] Origin is not an absolute URL");
        return false;
    }

    const auto allowed = get_allowed_hosts();
    bool is_allowed_host =
        std::find(allowed.begin(), allowed.end(), parsed->host) != allowed.end();
    bool is_valid_scheme =
        parsed->scheme == "https" || (parsed->host == "localhost" && parsed->scheme == "http");

    if (!is_allowed_host) {
        spdlog::debug("[AuthValidation] Host '{}' not in allow-list", parsed->host);
    } else if (!is_valid_scheme) {
        spdlog::debug("[AuthValidation] Scheme '{}' not permitted for host '{}'", parsed->scheme,
                      parsed->host);
    }
    return is_allowed_host && is_valid_scheme;
}

std::string redact_token(const std::string& token) {
    return token.substr(0, std::min<size_t>(8, token.size())) + "...";
}

} // namespace hackerai
