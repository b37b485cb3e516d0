// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/url.h"

#include "hv/hurl.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace hackerai {

namespace {

bool is_special_scheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https" || scheme == "ws" || scheme == "wss" ||
           scheme == "ftp";
}

bool is_valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '+' || c == '-' || c == '.';
    });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_valid_host_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    if (uc < 0x21 || uc == 0x7f) {
        return false;
    }
    switch (c) {
    case '<':
    case '>':
    case '^':
    case '|':
    case '\\':
    case '"':
    case '`':
    case '{':
    case '}':
        return false;
    default:
        return true;
    }
}

// Split "host[:port]" (port already separated from IPv6 brackets by the caller)
bool parse_host_port(const std::string& hostport, std::string& host, int& port) {
    port = -1;
    std::string port_str;

    if (!hostport.empty() && hostport[0] == '[') {
        auto close = hostport.find(']');
        if (close == std::string::npos) {
            return false;
        }
        host = hostport.substr(0, close + 1);
        std::string rest = hostport.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                return false;
            }
            port_str = rest.substr(1);
        }
    } else {
        auto colon = hostport.rfind(':');
        if (colon != std::string::npos) {
            host = hostport.substr(0, colon);
            port_str = hostport.substr(colon + 1);
        } else {
            host = hostport;
        }
        if (!std::all_of(host.begin(), host.end(), is_valid_host_char)) {
            return false;
        }
    }

    if (!port_str.empty()) {
        if (port_str.size() > 5 ||
            !std::all_of(port_str.begin(), port_str.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        long value = std::strtol(port_str.c_str(), nullptr, 10);
        if (value > 65535) {
            return false;
        }
        port = static_cast<int>(value);
    }

    host = to_lower(HUrl::unescape(host));
    return true;
}

} // namespace

int default_port_for_scheme(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws")
        return 80;
    if (scheme == "https" || scheme == "wss")
        return 443;
    if (scheme == "ftp")
        return 21;
    return -1;
}

std::optional<Url> parse_url(const std::string& input) {
    // Leading/trailing C0 control or space is stripped by browsers; we reject instead
    for (char c : input) {
        auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f) {
            return std::nullopt;
        }
    }

    auto colon = input.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    Url url;
    url.scheme = to_lower(input.substr(0, colon));
    if (!is_valid_scheme(url.scheme)) {
        return std::nullopt;
    }

    std::string rest = input.substr(colon + 1);

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        url.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }

    auto question = rest.find('?');
    if (question != std::string::npos) {
        url.query = rest.substr(question + 1);
        rest.erase(question);
    }

    bool special = is_special_scheme(url.scheme);

    if (rest.compare(0, 2, "//") == 0) {
        rest.erase(0, 2);

        auto path_start = rest.find('/');
        std::string authority =
            (path_start == std::string::npos) ? rest : rest.substr(0, path_start);
        url.path = (path_start == std::string::npos) ? "" : rest.substr(path_start);

        // Drop userinfo
        auto at = authority.rfind('@');
        if (at != std::string::npos) {
            authority.erase(0, at + 1);
        }

        int port = -1;
        if (!parse_host_port(authority, url.host, port)) {
            return std::nullopt;
        }
        url.port = (port == default_port_for_scheme(url.scheme)) ? -1 : port;
    } else {
        if (special) {
            // "https:example.com" style is not something we accept as absolute
            return std::nullopt;
        }
        url.path = rest;
    }

    if (special) {
        if (url.host.empty()) {
            return std::nullopt;
        }
        if (url.path.empty()) {
            url.path = "/";
        }
    }

    return url;
}

std::string Url::origin() const {
    if (host.empty()) {
        return "";
    }
    std::string result = scheme + "://" + host;
    if (port >= 0) {
        result += ":" + std::to_string(port);
    }
    return result;
}

QueryPairs Url::query_pairs() const {
    return parse_query(query);
}

QueryPairs parse_query(const std::string& query) {
    QueryPairs pairs;
    size_t start = 0;
    while (start <= query.size()) {
        auto amp = query.find('&', start);
        std::string piece =
            query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);

        if (!piece.empty()) {
            std::replace(piece.begin(), piece.end(), '+', ' ');
            auto eq = piece.find('=');
            if (eq == std::string::npos) {
                pairs.emplace_back(HUrl::unescape(piece), "");
            } else {
                pairs.emplace_back(HUrl::unescape(piece.substr(0, eq)),
                                   HUrl::unescape(piece.substr(eq + 1)));
            }
        }

        if (amp == std::string::npos) {
            break;
        }
        start = amp + 1;
    }
    return pairs;
}

std::optional<std::string> query_value(const Url& url, const std::string& key) {
    for (const auto& [k, v] : url.query_pairs()) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

std::string form_urlencode(const std::string& value) {
    // libhv leaves '~' unescaped; the form serializer does not
    std::string escaped = HUrl::escape(value, "*-._ ");
    std::string out;
    out.reserve(escaped.size());
    for (char c : escaped) {
        if (c == ' ') {
            out.push_back('+');
        } else if (c == '~') {
            out += "%7E";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace hackerai
