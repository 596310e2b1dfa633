/*
 * IOHandler.cpp - Abstract byte source interface
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "icyrec.h"

namespace IcyRec {
namespace IO {

static_assert(std::atomic<bool>::is_always_lock_free, "abort() must stay async-signal-safe");

IOHandler::IOHandler() {
}

IOHandler::~IOHandler() {
}

size_t IOHandler::read(void* buffer, size_t size, size_t count) {
    std::lock_guard<std::mutex> lock(m_operation_mutex);

    // Default implementation has nothing to deliver
    if (m_closed.load()) {
        updateErrorState(EBADF);
        return 0;
    }
    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }
    if (size == 0 || count == 0) {
        return 0;
    }
    updateEofState(true);
    return 0;
}

off_t IOHandler::tell() {
    if (m_closed.load()) {
        updateErrorState(EBADF);
        return -1;
    }
    return m_position.load();
}

int IOHandler::close() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    if (m_closed.load()) {
        // Already closed, not an error
        return 0;
    }
    updateClosedState(true);
    updateEofState(true);
    return 0;
}

bool IOHandler::eof() {
    return m_closed.load() || m_eof.load();
}

int IOHandler::getLastError() const {
    return m_error.load();
}

void IOHandler::abort() noexcept {
    m_aborted.store(true);
}

void IOHandler::advancePosition(size_t bytes) {
    m_position.fetch_add(static_cast<off_t>(bytes));
}

void IOHandler::updateErrorState(int error_code, const std::string& error_message) {
    m_error.store(error_code);

    if (!error_message.empty()) {
        Debug::log("io", "IOHandler::updateErrorState() - Error ", error_code, ": ", error_message);
    }
}

void IOHandler::updateEofState(bool eof_state) {
    m_eof.store(eof_state);
}

void IOHandler::updateClosedState(bool closed_state) {
    m_closed.store(closed_state);
}

} // namespace IO
} // namespace IcyRec
