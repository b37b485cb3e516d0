// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file url.h
 * @brief Minimal absolute-URL parsing and form encoding
 *
 * Covers what the shell needs from incoming deep links and redirect origins:
 * scheme/host/port/path/query/fragment splitting, query-pair decoding
 * (application/x-www-form-urlencoded) and the matching byte serializer.
 * Not a full WHATWG implementation: no IDNA, no path normalization.
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hackerai {

using QueryPairs = std::vector<std::pair<std::string, std::string>>;

struct Url {
    std::string scheme;   ///< Lowercased (e.g. "https", "hackerai")
    std::string host;     ///< Lowercased, may be empty for non-special schemes
    int port = -1;        ///< -1 when absent or equal to the scheme default
    std::string path;     ///< Raw, not decoded ("/auth", "auth", "")
    std::string query;    ///< Raw, without the leading '?'
    std::string fragment; ///< Raw, without the leading '#'

    /** @brief scheme://host[:port] (empty for URLs without a host) */
    std::string origin() const;

    /** @brief Decoded query pairs in order, duplicates preserved */
    QueryPairs query_pairs() const;
};

/**
 * @brief Parse an absolute URL
 *
 * Special schemes (http, https, ws, wss, ftp) require a host and get "/" as
 * path when none is given. Relative references, bad schemes, bad ports and
 * whitespace/control characters are rejected.
 *
 * @param input URL string
 * @return Parsed URL, or nullopt if input is not an absolute URL
 */
std::optional<Url> parse_url(const std::string& input);

/**
 * @brief Decode an application/x-www-form-urlencoded string
 *
 * '+' decodes to space, %XX to the byte. Malformed escapes are kept literally.
 */
QueryPairs parse_query(const std::string& query);

/**
 * @brief First value for a query key
 * @return Decoded value, or nullopt if the key is absent
 */
std::optional<std::string> query_value(const Url& url, const std::string& key);

/**
 * @brief application/x-www-form-urlencoded byte serializer
 *
 * Alphanumerics and "*-._" pass through, space becomes '+', everything else
 * becomes %XX (uppercase hex). Escaping is done by libhv's HUrl.
 */
std::string form_urlencode(const std::string& value);

/** @brief Default port for a special scheme, or -1 */
int default_port_for_scheme(const std::string& scheme);

} // namespace hackerai
