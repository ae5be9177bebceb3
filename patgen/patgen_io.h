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

#ifndef     SRC_PATGEN_IO_H_
#define     SRC_PATGEN_IO_H_

#include "patgen/config.h"

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>

#include "patgen/patgen_errors.h"
#include "patgen/patgen_utils.h"

// A constant for various buffers used by the patgen library.
#define PATGEN_BUFF_SIZE (32 * 1024)

namespace patgen {


struct StreamProperties {
    // Set if the stream is non seekable (e.g. a pipe).
    bool seekable = true;

    // Do we know the size of this stream?
    bool sizeable = true;

    // Can we write to this stream.
    bool writable = false;
};


class ProgressContext {
  public:
    // Maintained by the callback.
    patgen_off_t last_offset = 0;

    // The following are set in advance by users in order to get accurate progress
    // reports.

    // Start offset of this current range.
    patgen_off_t start = 0;

    // Total length for this operation.
    patgen_off_t length = 0;

    // Total length read so far
    patgen_off_t total_read = 0;

    // This will be called periodically to report the progress. Note that readptr
    // is the absolute offset in the source stream. Returning false aborts the
    // operation.
    virtual bool Report(patgen_off_t readptr) {
        UNUSED(readptr);
        return true;
    }

    explicit ProgressContext(std::shared_ptr<spdlog::logger> logger)
        : logger(logger) {}

    virtual ~ProgressContext() {}

 protected:
    std::shared_ptr<spdlog::logger> logger;
};


// Logs the copy throughput at most four times a second.
class DefaultProgress: public ProgressContext {
 public:
    explicit DefaultProgress(std::shared_ptr<spdlog::logger> logger)
        : ProgressContext(logger) {
        last_time = std::chrono::steady_clock::now();
    }
    bool Report(patgen_off_t readptr) override;

 protected:
    // Managed internally by Report
    std::chrono::steady_clock::time_point last_time;
};


/**
 * A readable and seekable stream.
 *
 * Derived classes implement ReadBuffer() (and Write() when writable). The
 * cursor (readptr) and the logical size are kept here so Seek() behaves the
 * same for every stream:
 *
 *  - whence is one of SEEK_SET, SEEK_CUR or SEEK_END, otherwise INVALID_INPUT.
 *  - a target before the start of the stream is INVALID_POSITION.
 *  - a target past the end of a sizeable stream lands on the end.
 *
 * The cursor is not touched when Seek() fails.
 */
class PatgenStream {
  public:
    patgen_off_t readptr;
    patgen_off_t size;           // How many bytes are in the stream?

    StreamProperties properties;

    // All logging directives go through this handle. It can be replaced with
    // a different logger if needed.
    std::shared_ptr<spdlog::logger> logger;

    PatgenStream(): readptr(0), size(0), logger(get_logger()) {}

    explicit PatgenStream(std::shared_ptr<spdlog::logger> logger):
        readptr(0), size(0), logger(logger) {}

    virtual ~PatgenStream() {}

    // Convenience methods.
    PatgenStatus Write(const std::string& data);

    // Reads up to length bytes. The result is empty at the end of the stream.
    virtual std::string Read(size_t length);

    // Copies length bytes from this stream to the output stream.
    virtual PatgenStatus CopyToStream(
        PatgenStream& output, patgen_off_t length,
        ProgressContext* progress = nullptr,
        size_t buffer_size = 10*1024*1024);

    // Copies the entire source stream into this stream. This is the
    // opposite of CopyToStream. The source is rewound to its start first.
    virtual PatgenStatus WriteStream(
        PatgenStream* source,
        ProgressContext* progress = nullptr);

    // The following should be overriden by derived classes.
    virtual PatgenStatus Seek(patgen_off_t offset, int whence);

    /**
     * Fills data with up to *length bytes from the current position.
     *
     * @param data The buffer to fill.
     * @param length On entry the capacity of data, on return the number of
     *        bytes written to it.
     *
     * @return STATUS_OK if more data follows, END_OF_STREAM if the stream is
     *         exhausted. In the latter case *length may still be non zero.
     */
    virtual PatgenStatus ReadBuffer(char* data, size_t* length) = 0;

    virtual PatgenStatus Write(const char* data, size_t length);
    virtual patgen_off_t Tell();
    virtual patgen_off_t Size() const;

    /**
     * Streams can be truncated. This means the older stream data will be removed
     * and the object is returned to its initial state.
     *
     * @return STATUS_OK if we were able to truncate the stream successfully.
     */
    virtual PatgenStatus Truncate() {
        return NOT_IMPLEMENTED;
    }
};

// The stream size is always the length of buffer.
class StringIO: public PatgenStream {
  public:
    std::string buffer;
    StringIO() {
        properties.writable = true;
    }
    explicit StringIO(std::string data): buffer(data) {
        properties.writable = true;
    }

    // Convenience constructors.
    static std::unique_ptr<StringIO> NewStringIO() {
        return std::unique_ptr<StringIO>(new StringIO());
    }

    PatgenStatus ReadBuffer(char* data, size_t* length) override;
    PatgenStatus Write(const char* data, size_t length) override;

    PatgenStatus Truncate() override;
    patgen_off_t Size() const override;

    using PatgenStream::Write;
};

} // namespace patgen

#endif  // SRC_PATGEN_IO_H_
