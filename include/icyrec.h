/*
 * icyrec.h - Master include file for IcyRec
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

#ifndef __ICYREC_H__
#define __ICYREC_H__

// defines
#define ICYREC_VERSION "1.0"
#define ICYREC_USER_AGENT "IcyRec/" ICYREC_VERSION
#define ICYREC_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <regex>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

// C Standard Library (wrapped)
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <getopt.h>
#if defined(__linux__)
#include <sys/prctl.h>
#elif defined(__FreeBSD__)
#include <pthread.h>
#include <pthread_np.h>
#endif

// cURL library
#include <curl/curl.h>

// Local project headers (in dependency order)
#include "core/about.h"
#include "debug.h"
#include "exceptions.h"
#include "system.h"
#include "BoundedQueue.h"
#include "RAIIFileHandle.h"
#include "core/utility/UTF8Util.h"
#include "core/utility/XMLUtil.h"
#include "core/utility/TimeUtil.h"
#include "io/IOHandler.h"
#include "io/MemoryIOHandler.h"
#include "io/http/HTTPIOHandler.h"
#include "config/Config.h"
#include "icy/IcyMetadataParser.h"
#include "icy/IcyStreamReader.h"
#include "track/TrackInfo.h"
#include "writer/TrackWriter.h"
#include "writer/CueSheetWriter.h"
#include "writer/TrackListWriter.h"
#include "writer/ChapterWriter.h"
#include "writer/TrackDispatcher.h"
#include "recorder/Recorder.h"

#endif // __ICYREC_H__
