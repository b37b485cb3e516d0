// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    int rc = 0;
    {
        hackerai::Application app;
        rc = app.run(argc, argv);
    }

    // Shutdown spdlog BEFORE static destruction begins, so that late log
    // calls from destructors become safe no-ops.
    spdlog::shutdown();

    return rc;
}
