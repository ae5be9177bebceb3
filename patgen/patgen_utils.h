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

#ifndef SRC_PATGEN_UTILS_H_
#define SRC_PATGEN_UTILS_H_

#include "patgen/config.h"

#include <cstdint>
#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "patgen/patgen_errors.h"

namespace patgen {

#define UNUSED(x) (void)x

typedef int64_t patgen_off_t;

const char LOGGER[] = "patgen";

    // Returns the shared library logger, creating it on first use.
    std::shared_ptr<spdlog::logger> get_logger();

    /**
     * Sets the level of the library logger.
     *
     * @param verbosity 0 logs errors only, 1 adds warnings, 2 info, 3 debug
     *        and anything higher trace.
     */
    void SetLogLevel(int verbosity);

    // True for any status a caller must propagate. END_OF_STREAM only
    // terminates a read loop.
    inline bool IsError(PatgenStatus status) {
        return status != STATUS_OK && status != END_OF_STREAM;
    }

#define RETURN_IF_ERROR(expr)                   \
    do {                                        \
        PatgenStatus status_ = (expr);          \
        if (::patgen::IsError(status_)) {       \
            ::patgen::get_logger()->debug(      \
                "{}: at {}: {}", ::patgen::PatgenStatusToString(status_), \
                __FILE__, __LINE__);            \
            return status_;                     \
        };                                      \
    } while (0);

} // namespace patgen

#endif  // SRC_PATGEN_UTILS_H_
