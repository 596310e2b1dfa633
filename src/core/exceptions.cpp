/*
 * exceptions.cpp - Exception class implementations.
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

namespace IcyRec {
namespace Core {

/**
 * @brief Constructs a ConnectionError.
 *
 * Thrown when a stream cannot be opened: transport failure before the
 * response headers arrived, a non-success HTTP status, or a server that
 * does not announce a usable metadata interval.
 * @param why A string describing the reason for the failure.
 * @param status The HTTP status code, or 0 if none was received.
 */
ConnectionError::ConnectionError(std::string why, long status)
    : std::exception(), m_why(std::move(why)), m_status(status) {
  // ctor
}

const char *ConnectionError::what() const noexcept {
  return m_why.c_str();
}

long ConnectionError::status() const noexcept {
  return m_status;
}

/**
 * @brief Constructs a ConfigException.
 * @param why A string naming the file, line or key at fault.
 */
ConfigException::ConfigException(std::string why)
    : std::exception(), m_why(std::move(why)) {
  // ctor
}

const char *ConfigException::what() const noexcept {
  return m_why.c_str();
}

ArgumentException::ArgumentException(std::string why)
    : std::exception(), m_why(std::move(why)) {
  // ctor
}

const char *ArgumentException::what() const noexcept {
  return m_why.c_str();
}

RecordingException::RecordingException(std::string why)
    : std::exception(), m_why(std::move(why)) {
  // ctor
}

const char *RecordingException::what() const noexcept {
  return m_why.c_str();
}

} // namespace Core
} // namespace IcyRec
