// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdlib>
#include <string>

/**
 * @brief RAII guard that sets (or unsets) an environment variable for one test
 *
 * The original value is restored on destruction.
 */
class EnvGuard {
  public:
    explicit EnvGuard(const char* name, const char* value = nullptr) : m_name(name) {
        const char* original = std::getenv(name);
        if (original) {
            m_had_original = true;
            m_original = original;
        }

        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }

    ~EnvGuard() {
        if (m_had_original) {
            setenv(m_name.c_str(), m_original.c_str(), 1);
        } else {
            unsetenv(m_name.c_str());
        }
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

  private:
    std::string m_name;
    std::string m_original;
    bool m_had_original = false;
};
