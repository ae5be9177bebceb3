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


#ifndef     SRC_LIBPATGEN_H_
#define     SRC_LIBPATGEN_H_

#include "patgen/config.h"

#include "patgen/patgen_errors.h"
#include "patgen/patgen_utils.h"
#include "patgen/patgen_io.h"
#include "patgen/pattern_stream.h"


namespace patgen {

extern "C" {
    const char* PATGEN_version();
}

} // namespace patgen


#endif    // SRC_LIBPATGEN_H_
