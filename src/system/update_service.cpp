// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file update_service.cpp
 * @brief Manifest-based update checks and AppImage installation
 *
 * SAFETY:
 * - Only https artifact URLs are accepted
 * - Downloads land next to the AppImage and are swapped in with rename(),
 *   so a failed download never leaves a truncated binary behind
 * - All errors are returned as strings, never thrown
 */

#include "system/update_service.h"

#include "hackerai_version.h"
#include "hv/requests.h"
#include "spdlog/spdlog.h"
#include "utils/url.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sys/utsname.h>

#include "hv/json.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace hackerai {

namespace {

/// Safely get string value from JSON, handling null and non-strings
std::string json_string_or_empty(const json& j, const std::string& key) {
    if (!j.is_object() || !j.contains(key)) {
        return "";
    }
    const auto& val = j[key];
    if (val.is_string()) {
        return val.get<std::string>();
    }
    return "";
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string machine_arch() {
    struct utsname uts{};
    if (uname(&uts) != 0) {
        return "x86_64";
    }
    std::string machine(uts.machine);
    if (machine == "arm64") {
        return "aarch64";
    }
    if (machine == "armv7l") {
        return "armv7";
    }
    return machine;
}

} // namespace

std::string update_platform_key() {
    return "linux-" + machine_arch();
}

std::string expand_update_endpoint(const std::string& endpoint,
                                   const std::string& current_version) {
    std::string url = endpoint;
    replace_all(url, "{{target}}", "linux");
    replace_all(url, "{{arch}}", machine_arch());
    replace_all(url, "{{current_version}}", current_version);
    return url;
}

UpdateCheckResult parse_update_manifest(const std::string& body,
                                        const std::string& current_version,
                                        const std::string& platform_key) {
    UpdateCheckResult result;

    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        result.error = std::string("Invalid update manifest: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "Invalid update manifest: not a JSON object";
        return result;
    }

    UpdateInfo info;
    info.current_version = current_version;
    info.notes = json_string_or_empty(j, "notes");
    info.pub_date = json_string_or_empty(j, "pub_date");

    auto latest = version::parse_version(json_string_or_empty(j, "version"));
    if (!latest) {
        result.error = "Invalid update manifest: missing or malformed version";
        return result;
    }
    info.version = latest->to_string();

    auto current = version::parse_version(current_version);
    if (!current) {
        result.error = "Cannot compare against running version '" + current_version + "'";
        return result;
    }

    if (*latest <= *current) {
        spdlog::debug("[UpdateService] Manifest version {} is not newer than {}", info.version,
                      current_version);
        return result;
    }

    // Dynamic endpoints answer for this platform directly
    const json* entry = &j;
    if (j.contains("platforms")) {
        const auto& platforms = j["platforms"];
        if (!platforms.is_object() || !platforms.contains(platform_key)) {
            result.error = "No update available for platform " + platform_key;
            return result;
        }
        entry = &platforms[platform_key];
    }

    info.download_url = json_string_or_empty(*entry, "url");
    if (info.download_url.empty()) {
        result.error = "Invalid update manifest: missing download url";
        return result;
    }

    result.update = info;
    return result;
}

ManifestUpdateService::ManifestUpdateService(std::string endpoint, std::string current_version)
    : endpoint_(std::move(endpoint)), current_version_(std::move(current_version)) {}

UpdateCheckResult ManifestUpdateService::check() {
    UpdateCheckResult result;

    std::string url = expand_update_endpoint(endpoint_, current_version_);
    auto parsed = parse_url(url);
    if (!parsed || parsed->scheme != "https") {
        result.error = "Update endpoint must be an https URL: " + url;
        return result;
    }

    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_GET;
    req->url = url;
    req->timeout = HTTP_TIMEOUT_SECONDS;
    req->headers["User-Agent"] = std::string("HackerAI-Desktop/") + current_version_;
    req->headers["Accept"] = "application/json";

    spdlog::debug("[UpdateService] GET {}", url);
    auto resp = requests::request(req);

    if (!resp) {
        result.error = "Network error contacting update server";
        return result;
    }

    int status = static_cast<int>(resp->status_code);
    if (status == 204) {
        spdlog::debug("[UpdateService] Server reports no update (204)");
        return result;
    }
    if (status != 200) {
        result.error = "Update server returned HTTP " + std::to_string(status);
        return result;
    }

    return parse_update_manifest(resp->body, current_version_, update_platform_key());
}

std::string ManifestUpdateService::download_and_install(const UpdateInfo& info,
                                                        DownloadProgressCallback progress) {
    const char* appimage = std::getenv("APPIMAGE");
    if (appimage == nullptr || appimage[0] == '\0') {
        return "Automatic updates are only supported for AppImage installs";
    }

    auto parsed = parse_url(info.download_url);
    if (!parsed || parsed->scheme != "https") {
        return "Refusing to download update over a non-https URL";
    }

    fs::path target(appimage);
    fs::path download_path = target;
    download_path += ".download";

    spdlog::info("[UpdateService] Downloading {} to {}", info.download_url,
                 download_path.string());

    auto progress_cb = [&progress](size_t received, size_t total) {
        if (progress) {
            progress(received, total);
        }
    };

    size_t bytes =
        requests::downloadFile(info.download_url.c_str(), download_path.c_str(), progress_cb);
    if (bytes == 0) {
        std::remove(download_path.c_str());
        return "Failed to download update from " + info.download_url;
    }
    if (bytes < MIN_ARTIFACT_BYTES) {
        std::remove(download_path.c_str());
        return "Downloaded update is too small (" + std::to_string(bytes) + " bytes)";
    }

    std::error_code ec;
    fs::permissions(download_path,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        std::remove(download_path.c_str());
        return "Failed to make update executable: " + ec.message();
    }

    fs::rename(download_path, target, ec);
    if (ec) {
        std::remove(download_path.c_str());
        return "Failed to replace " + target.string() + ": " + ec.message();
    }

    spdlog::info("[UpdateService] Installed version {} ({} bytes)", info.version, bytes);
    return "";
}

} // namespace hackerai
