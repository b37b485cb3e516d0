// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file update_service.h
 * @brief Update discovery and installation
 *
 * IUpdateService is what the update flow consumes. ManifestUpdateService is
 * the Linux implementation: it asks the update endpoint for a JSON manifest
 * and, on install, replaces the running AppImage.
 *
 * Manifest format (static file, or dynamic endpoint answering 204 for "none"):
 * @code
 * {
 *   "version": "1.4.0",
 *   "notes": "Bug fixes",
 *   "pub_date": "2026-01-01T00:00:00Z",
 *   "platforms": {
 *     "linux-x86_64": { "url": "https://.../HackerAI.AppImage", "signature": "..." }
 *   }
 * }
 * @endcode
 * A dynamic endpoint may put "url" at the top level instead of under
 * "platforms". Signatures are not verified and are ignored.
 */

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace hackerai {

/**
 * @brief A release newer than the running one
 */
struct UpdateInfo {
    std::string version;         ///< Version without 'v' prefix (e.g. "1.4.0")
    std::string current_version; ///< Version of the running binary
    std::string notes;           ///< Release notes (may be empty)
    std::string pub_date;        ///< RFC 3339 publish date (may be empty)
    std::string download_url;    ///< Artifact for this platform
};

/**
 * @brief Outcome of an update check
 *
 * error non-empty: the check failed. Otherwise update holds the newer
 * release, or nullopt when already up to date.
 */
struct UpdateCheckResult {
    std::string error;
    std::optional<UpdateInfo> update;

    bool ok() const {
        return error.empty();
    }
};

/// Download progress: (bytes received, total bytes or 0 if unknown)
using DownloadProgressCallback = std::function<void(size_t, size_t)>;

class IUpdateService {
  public:
    virtual ~IUpdateService() = default;

    /** @brief Ask the update endpoint whether a newer release exists */
    virtual UpdateCheckResult check() = 0;

    /**
     * @brief Download and install a release
     * @return Empty string on success, error message otherwise
     */
    virtual std::string download_and_install(const UpdateInfo& info,
                                             DownloadProgressCallback progress = nullptr) = 0;
};

/**
 * @brief Parse an update manifest
 *
 * @param body Response body
 * @param current_version Running version
 * @param platform_key Key under "platforms" (e.g. "linux-x86_64")
 * @return error set on malformed input; update set only if the manifest
 *         version is strictly newer than current_version
 */
UpdateCheckResult parse_update_manifest(const std::string& body,
                                        const std::string& current_version,
                                        const std::string& platform_key);

/** @brief Platform key for this build, e.g. "linux-x86_64" or "linux-aarch64" */
std::string update_platform_key();

/**
 * @brief Substitute {{target}}, {{arch}} and {{current_version}} in an endpoint
 */
std::string expand_update_endpoint(const std::string& endpoint, const std::string& current_version);

class ManifestUpdateService : public IUpdateService {
  public:
    static constexpr int HTTP_TIMEOUT_SECONDS = 30;
    static constexpr size_t MIN_ARTIFACT_BYTES = 1024 * 1024;

    /**
     * @param endpoint Endpoint template (see expand_update_endpoint())
     * @param current_version Running version
     */
    ManifestUpdateService(std::string endpoint, std::string current_version);

    UpdateCheckResult check() override;
    std::string download_and_install(const UpdateInfo& info,
                                     DownloadProgressCallback progress = nullptr) override;

  private:
    std::string endpoint_;
    std::string current_version_;
};

} // namespace hackerai
