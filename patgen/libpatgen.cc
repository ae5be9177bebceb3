/*
Copyright 2014 Google Inc. All rights reserved.

Licensed under the Apache License, Version 2.0 (the "License"); you may not use
this file except in compliance with the License.  You may obtain a copy of the
License at

http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software distributed
under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
CONDITIONS OF ANY KIND, either express or implied.  See the License for the
specific language governing permissions and limitations under the License.
*/

#include "patgen/config.h"

#include "patgen/libpatgen.h"

#include <string>

#include "spdlog/details/os.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/stdout_sinks.h"

namespace patgen {


extern "C" {
    const char* PATGEN_version() {
        static const std::string version = std::string("libpatgen version ") + PATGEN_VERSION;
        return version.c_str();
    }
}

const char* PatgenStatusToString(PatgenStatus status) {
    switch (status) {
    case STATUS_OK: return "STATUS_OK";
    case INVALID_INPUT: return "INVALID_INPUT";
    case NOT_IMPLEMENTED: return "NOT_IMPLEMENTED";
    case IO_ERROR: return "IO_ERROR";
    case ABORTED: return "ABORTED";
    case END_OF_STREAM: return "END_OF_STREAM";
    case INVALID_POSITION: return "INVALID_POSITION";
    default: return "UNKNOWN";
    };
}

std::shared_ptr<spdlog::logger> get_logger() {
    auto logger = spdlog::get(patgen::LOGGER);

    if (!logger) {
        if (!spdlog::details::os::in_terminal(stderr)) {
            return spdlog::stderr_logger_mt(patgen::LOGGER);
        }
        return spdlog::stderr_color_mt(patgen::LOGGER);
    }

    return logger;
}

void SetLogLevel(int verbosity) {
    auto logger = get_logger();

    switch (verbosity) {
    case 0:
        logger->set_level(spdlog::level::err);
        break;

    case 1:
        logger->set_level(spdlog::level::warn);
        break;

    case 2:
        logger->set_level(spdlog::level::info);
        break;

    case 3:
        logger->set_level(spdlog::level::debug);
        break;

    default:
        logger->set_level(spdlog::level::trace);
        break;
    }

    logger->set_pattern("%Y-%m-%d %T %L %v");
}

} // namespace patgen
