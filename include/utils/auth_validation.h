// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace hackerai {

/// Environment variable overriding the redirect allow-list (comma-separated hostnames)
constexpr const char* ALLOWED_HOSTS_ENV = "HACKERAI_ALLOWED_HOSTS";

/// Origin used when a deep link carries no usable origin
constexpr const char* PRODUCTION_ORIGIN = "https://hackerai.co";

/// Length of a desktop auth token (hex characters)
constexpr size_t AUTH_TOKEN_LENGTH = 64;

/**
 * @brief Validate desktop auth token format
 *
 * @param token Token from a deep link query
 * @return true if exactly 64 ASCII hex digits (either case)
 */
bool is_valid_token_format(const std::string& token);

/**
 * @brief Hostnames allowed as redirect origins
 *
 * Read on every call. HACKERAI_ALLOWED_HOSTS wins when set (values trimmed,
 * empty entries dropped); otherwise hackerai.co and localhost.
 */
std::vector<std::string> get_allowed_hosts();

/**
 * @brief Check that an origin may receive an authenticated redirect
 *
 * Host must exactly match an allowed host, and the scheme must be https,
 * or http for exactly "localhost".
 *
 * @param origin Absolute URL (e.g. "https://hackerai.co")
 * @return true if the origin is permitted
 */
bool validate_origin(const std::string& origin);

/**
 * @brief Shorten a token for logs
 * @return First 8 characters followed by "..."
 */
std::string redact_token(const std::string& token);

} // namespace hackerai
