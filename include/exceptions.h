/*
 * exceptions.h - Exception classes used across IcyRec.
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

// No direct includes - all includes should be in icyrec.h

namespace IcyRec {
namespace Core {

// The stream session could not be established (HTTP status, transport, icy-metaint).
class ConnectionError : public std::exception
{
    public:
        ConnectionError(std::string why, long status = 0);
        ~ConnectionError() noexcept override = default;
        const char *what() const noexcept override;
        long status() const noexcept;
    protected:
    private:
        std::string m_why;
        long m_status;
};

// Configuration file missing, unreadable or semantically invalid.
class ConfigException : public std::exception
{
    public:
        ConfigException(std::string why);
        ~ConfigException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

// Bad command line value.
class ArgumentException : public std::exception
{
    public:
        ArgumentException(std::string why);
        ~ArgumentException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

// The audio output file could not be created.
class RecordingException : public std::exception
{
    public:
        RecordingException(std::string why);
        ~RecordingException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        std::string m_why;
};

} // namespace Core
} // namespace IcyRec

#endif // EXCEPTIONS_H
