/*
 * system.cpp - System-level functionality.
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "icyrec.h"

std::string System::getHome()
{
    const char* home = getenv("HOME");
    if (home && strlen(home) > 0) {
        return home;
    }
    return ".";
}

std::string System::getStoragePath()
{
    // Use XDG config directory for unified storage
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && strlen(xdg_config) > 0) {
        return std::string(xdg_config) + "/icyrec";
    } else {
        return getHome() + "/.config/icyrec";
    }
}

std::string System::getDefaultConfigPath()
{
    return getStoragePath() + "/icyrec.conf";
}

/* Creates the given directory and every missing parent. Returns true if
 * the directory exists afterwards.
 */
bool System::createDirectories(const std::string& path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        Debug::log("main", "Cannot create directory ", path, ": ", ec.message());
        return false;
    }
    return std::filesystem::is_directory(path, ec);
}

void System::setThisThreadName(const std::string& name)
{
#if defined(__linux__)
    // Linux limits thread names to 16 bytes (including null terminator).
    std::string truncated_name = name.substr(0, 15);
    prctl(PR_SET_NAME, truncated_name.c_str(), 0, 0, 0);
#elif defined(__FreeBSD__)
    std::string truncated_name = name.substr(0, 15);
    pthread_set_name_np(pthread_self(), truncated_name.c_str());
#else
    (void)name;
#endif
}
