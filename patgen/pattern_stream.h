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

#ifndef SRC_PATTERN_STREAM_H_
#define SRC_PATTERN_STREAM_H_

#include "patgen/config.h"

#include <memory>
#include <string>

#include "patgen/patgen_io.h"

// Pattern length used when a non-positive length is requested.
#define PATGEN_DEFAULT_PATTERN_SIZE (128 * 1024)

namespace patgen {

/*
  A read only stream of synthetic data.

  The stream content is a small pattern buffer (the byte ramp 0, 1, ..., 255,
  0, 1, ...) tiled out to a logical size set by ResetSize(). The byte at
  logical offset k is always pattern[k % pattern.size()], no matter how the
  reads were chunked or where the stream was seeked to, so any range can be
  verified without keeping a copy of the data.

  A freshly constructed stream has size 0 and reports END_OF_STREAM until
  ResetSize() is called. The same instance can be reused for many sizes
  without reallocating the pattern.

  Instances are not thread safe.
*/
class PatternStream: public PatgenStream {
 public:
    explicit PatternStream(int pattern_size,
                           std::shared_ptr<spdlog::logger> logger = get_logger());

    virtual ~PatternStream();

    // Sets a new logical size and rewinds to the start.
    void ResetSize(patgen_off_t new_size);

    PatgenStatus ReadBuffer(char* data, size_t* length) override;

    size_t PatternSize() const {
        return pattern.size();
    }

 protected:
    // Tiles an explicit pattern buffer. An empty pattern gives a stream which
    // is always at its end.
    PatternStream(std::string pattern,
                  std::shared_ptr<spdlog::logger> logger);

    const std::string pattern;
};

} // namespace patgen

#endif  // SRC_PATTERN_STREAM_H_
