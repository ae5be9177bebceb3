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

#ifndef PATGEN_ERRORS_H
#define PATGEN_ERRORS_H

#include "patgen/config.h"

namespace patgen {


/**
 * @file
 * @brief  This file contains the status codes that patgen streams may return.
 *
 * END_OF_STREAM is not a failure. A read may return it together with a
 * non-zero byte count when the chunk it produced was the last one.
 */

/// Return values from patgen methods and functions.
typedef enum {
    STATUS_OK = 0,                        /**< Function succeeded. */
    INVALID_INPUT = -5,                   /**< An argument was not one of the
                                         * recognized values. */
    NOT_IMPLEMENTED = -7,                 /**< This function is not supported
                                         * by the stream. */
    IO_ERROR = -8,                        /**< The stream can not perform
                                         * this kind of IO. */
    ABORTED = -11,                        /**< Stopped by a progress
                                         * callback. */
    END_OF_STREAM = -12,                  /**< No more data is available. */
    INVALID_POSITION = -13                /**< A seek resolved to a negative
                                         * offset. */
} PatgenStatus;

extern const char* PatgenStatusToString(PatgenStatus status);

} // namespace patgen

#endif // PATGEN_ERRORS_H
