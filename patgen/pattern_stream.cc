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

#include "patgen/pattern_stream.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace patgen {

namespace {

std::string MakeRamp(int pattern_size) {
    if (pattern_size <= 0) {
        pattern_size = PATGEN_DEFAULT_PATTERN_SIZE;
    }

    std::string result(pattern_size, '\0');
    for (int i = 0; i < pattern_size; i++) {
        result[i] = static_cast<char>(i % 256);
    }

    return result;
}

} // namespace

PatternStream::PatternStream(int pattern_size,
                             std::shared_ptr<spdlog::logger> logger):
    PatternStream(MakeRamp(pattern_size), logger) {}

PatternStream::PatternStream(std::string pattern,
                             std::shared_ptr<spdlog::logger> logger):
    PatgenStream(logger), pattern(std::move(pattern)) {
    properties.writable = false;
}

PatternStream::~PatternStream() {
    // NOP
}

void PatternStream::ResetSize(patgen_off_t new_size) {
    logger->trace("PatternStream: reset size {} -> {}", size, new_size);
    size = new_size;
    readptr = 0;
}

PatgenStatus PatternStream::ReadBuffer(char* data, size_t* length) {
    if (size <= 0 || pattern.empty() || readptr >= size) {
        *length = 0;
        return END_OF_STREAM;
    }

    const size_t to_read = std::min((patgen_off_t)*length, size - readptr);
    const size_t pSz = pattern.size();

    // Copy whole runs of the pattern, wrapping to its start as needed.
    size_t pOffset = readptr % pSz;
    size_t written = 0;
    while (written < to_read) {
        size_t run = std::min(to_read - written, pSz - pOffset);
        std::memcpy(data + written, pattern.data() + pOffset, run);
        written += run;
        pOffset = 0;
    }

    readptr += to_read;
    *length = to_read;

    // The last chunk carries both the data and the end of the stream.
    if (readptr >= size) {
        return END_OF_STREAM;
    }
    return STATUS_OK;
}

} // namespace patgen
