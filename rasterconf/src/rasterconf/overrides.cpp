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

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/raise.hpp"

#include "./error.hpp"
#include "./overrides.hpp"

namespace ba = boost::algorithm;

const std::string Overrides::Key::interpolation("interpolationOverride");
const std::string Overrides::Key::scaleTo8Bit("scaleTo8Bit");
const std::string Overrides::Key::equalizeHistogram
    ("equalizeHistogramOverride");
const std::string Overrides::Key::authorizationProvider
    ("authorizationProvider");
const std::string Overrides::Key::authorizationUrl("authorizationUrl");

Interpolation interpolationFromCode(int code)
{
    switch (code) {
    case static_cast<int>(Interpolation::nearest):
        return Interpolation::nearest;
    case static_cast<int>(Interpolation::bilinear):
        return Interpolation::bilinear;
    case static_cast<int>(Interpolation::bicubic):
        return Interpolation::bicubic;
    case static_cast<int>(Interpolation::bicubic2):
        return Interpolation::bicubic2;
    }

    utility::raise<InvalidOverrideValue>
        ("Unknown interpolation code %d.", code);
    throw;
}

bool parseFlag(const std::string &value)
{
    return ba::iequals(ba::trim_copy(value), "true");
}

namespace {

boost::optional<std::string> pop(Params &params, const std::string &key)
{
    auto fparams(params.find(key));
    if (fparams == params.end()) { return boost::none; }
    auto value(fparams->second);
    params.erase(fparams);
    return value;
}

boost::optional<bool> flag(const boost::optional<std::string> &value)
{
    if (!value) { return boost::none; }
    return parseFlag(*value);
}

boost::optional<int>
interpolation(const boost::optional<std::string> &value)
{
    if (!value) { return boost::none; }

    try {
        return boost::lexical_cast<int>(ba::trim_copy(*value));
    } catch (const boost::bad_lexical_cast&) {
        LOGTHROW(err1, InvalidOverrideValue)
            << "Value <" << *value << "> of <"
            << Overrides::Key::interpolation << "> is not an integer.";
    }
    throw;
}

} // namespace

Overrides extractOverrides(Params &params)
{
    // work on a copy, commit only when everything has been parsed
    Params tmp(params);

    Overrides o;
    o.interpolation = interpolation(pop(tmp, Overrides::Key::interpolation));
    o.scaleTo8Bit = flag(pop(tmp, Overrides::Key::scaleTo8Bit));
    o.equalizeHistogram = flag(pop(tmp, Overrides::Key::equalizeHistogram));
    o.authorizationProvider = pop(tmp, Overrides::Key::authorizationProvider);
    o.authorizationUrl = pop(tmp, Overrides::Key::authorizationUrl);

    params.swap(tmp);
    return o;
}

namespace {

template <typename T>
void print(std::ostream &os, const std::string &key
           , const boost::optional<T> &value)
{
    os << key << " = ";
    if (value) { os << *value; } else { os << "(unset)"; }
    os << "\n";
}

} // namespace

std::ostream& operator<<(std::ostream &os, const Overrides &overrides)
{
    os << std::boolalpha;
    print(os, Overrides::Key::interpolation, overrides.interpolation);
    print(os, Overrides::Key::scaleTo8Bit, overrides.scaleTo8Bit);
    print(os, Overrides::Key::equalizeHistogram, overrides.equalizeHistogram);
    print(os, Overrides::Key::authorizationProvider
          , overrides.authorizationProvider);
    print(os, Overrides::Key::authorizationUrl, overrides.authorizationUrl);
    return os;
}
