/*
 * about.cpp - version and usage text
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

static char _about_message[] = "This is IcyRec version " ICYREC_VERSION ".\n"\
            "\n"
            "Copyright © 2025 Kirn Gill II <segin2005@gmail.com>\n"
            "\n"
            "IcyRec is free software. You may redistribute and/or modify it under\n"
            "the terms of the ISC License <https://opensource.org/licenses/ISC>\n"
            "\n"
            "Permission to use, copy, modify, and/or distribute this software for any\n"
            "purpose with or without fee is hereby granted, provided that the above\n"
            "copyright notice and this permission notice appear in all copies.\n"
            "\n"
            "THE SOFTWARE IS PROVIDED \"AS IS\" AND THE AUTHOR DISCLAIMS ALL WARRANTIES\n"
            "WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF\n"
            "MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR\n"
            "ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES\n"
            "WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN\n"
            "ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF\n"
            "OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.\n"
            "\n"
            "Written by " ICYREC_MAINTAINER "\n";

/**
 * @brief Prints version, copyright and license to standard output.
 */
void about_console()
{
    std::cout << _about_message << std::endl;
}

/**
 * @brief Prints GNU-style help information to standard output.
 */
void print_help()
{
    std::cout << "Usage: icyrec --config=FILE [OPTION]...\n";
    std::cout << "Records Shoutcast/Icecast streams and writes track sheets for them.\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              display this help and exit\n";
    std::cout << "  -v, --version           output version information and exit\n";
    std::cout << "  -c, --config=FILE       recording configuration\n";
    std::cout << "                          (default: $XDG_CONFIG_HOME/icyrec/icyrec.conf)\n";
    std::cout << "  -o, --output=DIR        output directory, overrides the configuration\n";
    std::cout << "  -d, --duration=SECONDS  how many seconds to record (default: 60)\n";
    std::cout << "  -u, --until=DATETIME    record until '[YYYY-MM-DD] HH:MM[:SS]'\n";
    std::cout << "      --debug=CHANNELS    enable debug output for specified channels\n";
    std::cout << "                          (comma-separated list or 'all')\n";
    std::cout << "      --verbose           same as --debug=all\n";
    std::cout << "      --logfile=FILE      write log output to specified file\n\n";

    std::cout << "Available debug channels:\n";
    std::cout << "  config, http, icy, io, main, raii, recorder, writer\n\n";

    std::cout << "Examples:\n";
    std::cout << "  icyrec --config=radio.conf --duration=3600\n";
    std::cout << "  icyrec --config=radio.conf --until=\"2025-09-01 23:00\" --logfile=rec.log\n\n";

    std::cout << "Report bugs to: segin2005@gmail.com\n";
}

} // namespace Core
} // namespace IcyRec
