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

#ifndef rasterconf_url_hpp_included_
#define rasterconf_url_hpp_included_

#include <string>
#include <iostream>

#include <boost/optional.hpp>

/** Validated URL.
 */
struct Url {
    /** Original string.
     */
    std::string url;

    /** Lowercase scheme.
     */
    std::string scheme;
    std::string host;
    boost::optional<unsigned int> port;

    /** Percent-encoded path.
     */
    std::string path;
    std::string query;

    /** Is this a file: URL?
     */
    bool local() const { return scheme == "file"; }

    /** Decoded filesystem path of a file: URL.
     */
    std::string localPath() const;
};

/** Parses and validates URL. Only http, https, ftp and file schemes are
 *  supported.
 *
 * \throws FormatError when URL is malformed
 */
Url parseUrl(const std::string &url);

/** Checks whether given string looks like URL (i.e. starts with a scheme)
 *  instead of a plain filesystem path.
 */
bool hasScheme(const std::string &str);

inline std::ostream& operator<<(std::ostream &os, const Url &url)
{
    return os << url.url;
}

#endif // rasterconf_url_hpp_included_
