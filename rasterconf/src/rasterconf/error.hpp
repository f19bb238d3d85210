/**
 * Copyright (c) 2017 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef rasterconf_error_hpp_included_
#define rasterconf_error_hpp_included_

#include <stdexcept>
#include <string>

struct Error : std::runtime_error {
    Error(const std::string &message) : std::runtime_error(message) {}
};

/** Flat parameter string cannot be parsed.
 */
struct MalformedDescriptor : Error {
    MalformedDescriptor(const std::string &message) : Error(message) {}
};

/** Descriptor document is malformed, unsafe or unreachable.
 */
struct DocumentParseError : Error {
    DocumentParseError(const std::string &message) : Error(message) {}
};

struct InvalidOverrideValue : Error {
    InvalidOverrideValue(const std::string &message) : Error(message) {}
};

/** No registered store family claims given backend parameters.
 */
struct NoMatchingBackend : Error {
    NoMatchingBackend(const std::string &message) : Error(message) {}
};

/** Override value queried without checking its presence first.
 */
struct OverrideNotSet : Error {
    OverrideNotSet(const std::string &message) : Error(message) {}
};

struct InvalidStoreOptions : Error {
    InvalidStoreOptions(const std::string &message) : Error(message) {}
};

/** Store handle cannot be created. Next request retries.
 */
struct StoreConstructionFailed : Error {
    StoreConstructionFailed(const std::string &message) : Error(message) {}
};

struct IOError : Error {
    IOError(const std::string &message) : Error(message) {}
};

struct FormatError : Error {
    FormatError(const std::string &message) : Error(message) {}
};

#endif // rasterconf_error_hpp_included_
