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

#ifndef rasterconf_overrides_hpp_included_
#define rasterconf_overrides_hpp_included_

#include <string>

#include <boost/optional.hpp>

#include "utility/enum-io.hpp"

#include "./params.hpp"

/** Interpolation used when mosaicking tiles. Numeric value is the code used
 *  in descriptors.
 */
enum class Interpolation {
    nearest = 0, bilinear = 1, bicubic = 2, bicubic2 = 3
};

UTILITY_GENERATE_ENUM_IO(Interpolation,
    ((nearest))
    ((bilinear))
    ((bicubic))
    ((bicubic2))
)

/** Interpolation from its numeric code.
 *
 * \throws InvalidOverrideValue for unknown code
 */
Interpolation interpolationFromCode(int code);

/** Well-known settings overriding behavior of stored raster data. Every
 *  value is optional, unset value means "use stored default".
 */
struct Overrides {
    /** Raw interpolation code, mapped to Interpolation on access.
     */
    boost::optional<int> interpolation;
    boost::optional<bool> scaleTo8Bit;
    boost::optional<bool> equalizeHistogram;
    boost::optional<std::string> authorizationProvider;
    boost::optional<std::string> authorizationUrl;

    /** Descriptor keys.
     */
    struct Key {
        static const std::string interpolation;
        static const std::string scaleTo8Bit;
        static const std::string equalizeHistogram;
        static const std::string authorizationProvider;
        static const std::string authorizationUrl;
    };
};

/** Removes all override keys from params and returns parsed overrides.
 *  Params are left untouched on failure.
 *
 * \throws InvalidOverrideValue when interpolation is not an integer
 */
Overrides extractOverrides(Params &params);

/** Descriptor boolean: true iff trimmed value equals (case-insensitive) to
 *  "true", anything else is false.
 */
bool parseFlag(const std::string &value);

std::ostream& operator<<(std::ostream &os, const Overrides &overrides);

#endif // rasterconf_overrides_hpp_included_
