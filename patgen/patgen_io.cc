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

#include <algorithm>
#include <cstring>
#include <limits>

#include "patgen/patgen_io.h"

namespace patgen {

namespace {

// Adds offset to base, saturating at the int64 limits instead of
// overflowing.
patgen_off_t SaturatingAdd(patgen_off_t base, patgen_off_t offset) {
    if (offset > 0 &&
        base > std::numeric_limits<patgen_off_t>::max() - offset) {
        return std::numeric_limits<patgen_off_t>::max();
    }
    if (offset < 0 &&
        base < std::numeric_limits<patgen_off_t>::min() - offset) {
        return std::numeric_limits<patgen_off_t>::min();
    }
    return base + offset;
}

} // namespace


PatgenStatus PatgenStream::Seek(patgen_off_t offset, int whence) {
    if (!properties.seekable)
        return IO_ERROR;

    patgen_off_t new_offset;

    switch (whence) {
    case SEEK_SET:
        new_offset = offset;
        break;

    case SEEK_CUR:
        new_offset = SaturatingAdd(readptr, offset);
        break;

    case SEEK_END:
        // We cannot seek relative to size for streams which are non sizeable.
        if (!properties.sizeable) {
            return IO_ERROR;
        }

        new_offset = SaturatingAdd(Size(), offset);
        break;

    default:
        logger->debug("Seek: invalid whence {}", whence);
        return INVALID_INPUT;
    }

    // Seeking before the start is an error but seeking past the end just
    // lands on the end.
    if (new_offset < 0) {
        logger->debug("Seek: negative position {}", new_offset);
        return INVALID_POSITION;
    }

    if (properties.sizeable) {
        new_offset = std::min(new_offset,
                              std::max(Size(), (patgen_off_t)0));
    }

    readptr = new_offset;
    return STATUS_OK;
}

std::string PatgenStream::Read(size_t length) {
    if (length == 0) {
        return "";
    }

    std::string result(length, '\0');
    if (IsError(ReadBuffer(&result[0], &length))) {
        return "";
    }
    result.resize(length);
    return result;
}

PatgenStatus PatgenStream::Write(const std::string& data) {
    return Write(data.data(), data.size());
}

PatgenStatus PatgenStream::Write(const char* data, size_t length) {
    UNUSED(data);
    UNUSED(length);
    return NOT_IMPLEMENTED;
}

patgen_off_t PatgenStream::Tell() {
    return readptr;
}

patgen_off_t PatgenStream::Size() const {
    return size;
}


bool DefaultProgress::Report(patgen_off_t readptr) {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    std::chrono::duration<double> delta = std::chrono::duration_cast<std::chrono::duration<double>>(now - last_time);

    // At least 1/4 second has elapsed
    if (delta.count() >= 0.25 ) {
        total_read += readptr - last_offset;

        // Rate in MB/s.
        double rate = (double)(readptr - last_offset) / (1024.0*1024.0)
                     / delta.count();

        if (length > 0) {
            logger->info(
                " Reading {:x} {} MiB / {} ({:.0f} MiB/s)",
                readptr, total_read/1024/1024,
                length/1024/1024, rate);
        } else {
            logger->info(
                " Reading {:x} {} MiB ({:.0f} MiB/s)", readptr,
                total_read/1024/1024, rate);
        }
        last_time = now;
        last_offset = readptr;
    }

    return true;
}

PatgenStatus PatgenStream::CopyToStream(
    PatgenStream& output, patgen_off_t length,
    ProgressContext* progress, size_t buffer_size) {
    DefaultProgress default_progress(logger);
    if (!progress) {
        progress = &default_progress;
    }

    patgen_off_t length_remaining = length;
    if (length_remaining <= 0) {
        return STATUS_OK;
    }

    std::string buffer(std::min((patgen_off_t)buffer_size, length_remaining),
                       '\0');

    while (length_remaining > 0) {
        size_t to_read = std::min((patgen_off_t)buffer.size(), length_remaining);
        PatgenStatus res = ReadBuffer(&buffer[0], &to_read);
        RETURN_IF_ERROR(res);
        if (to_read == 0) {
            break;
        }
        length_remaining -= to_read;

        RETURN_IF_ERROR(output.Write(buffer.data(), to_read));
        if (!progress->Report(readptr)) {
            return ABORTED;
        }

        if (res == END_OF_STREAM) {
            break;
        }
    }

    return STATUS_OK;
}

PatgenStatus PatgenStream::WriteStream(PatgenStream* source,
                                       ProgressContext* progress) {
    DefaultProgress default_progress(logger);
    if (!progress) {
        progress = &default_progress;
    }

    // Rewind the source to the start.
    RETURN_IF_ERROR(source->Seek(0, SEEK_SET));

    char buffer[PATGEN_BUFF_SIZE];
    while (1) {
        size_t length = PATGEN_BUFF_SIZE;
        PatgenStatus res = source->ReadBuffer(buffer, &length);
        RETURN_IF_ERROR(res);

        if (length > 0) {
            RETURN_IF_ERROR(Write(buffer, length));
        }

        // Report the data read from the source.
        if (!progress->Report(source->Tell())) {
            return ABORTED;
        }

        if (res == END_OF_STREAM || length == 0) {
            break;
        }
    }

    return STATUS_OK;
}


PatgenStatus StringIO::Write(const char* data, size_t length) {
    buffer.replace(readptr, length, data, length);
    readptr += length;

    return STATUS_OK;
}

PatgenStatus StringIO::ReadBuffer(char* data, size_t* length) {
    patgen_off_t available = Size() - readptr;
    if (available <= 0) {
        *length = 0;
        return END_OF_STREAM;
    }

    *length = std::min((patgen_off_t)*length, available);
    std::memcpy(data, buffer.data() + readptr, *length);
    readptr += *length;

    if (readptr >= Size()) {
        return END_OF_STREAM;
    }
    return STATUS_OK;
}

patgen_off_t StringIO::Size() const {
    return buffer.size();
}

PatgenStatus StringIO::Truncate() {
    buffer = "";
    readptr = 0;
    return STATUS_OK;
}

} // namespace patgen
