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

#include <set>

#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/uri.hpp"

#include "./error.hpp"
#include "./url.hpp"

namespace ba = boost::algorithm;

namespace {

const std::set<std::string> KnownSchemes{ "http", "https", "ftp", "file" };

// scheme : [//authority] path [?query] [#fragment]
const boost::regex UrlRegex
("([A-Za-z][A-Za-z0-9+.-]*):(//([^/?#]*))?([^?#]*)(\\?([^#]*))?(#.*)?");

// [userinfo@] host [:port]
const boost::regex AuthorityRegex
("(?:[^@]*@)?(\\[[0-9A-Fa-f:.]+\\]|[^:\\[\\]]*)(?::([0-9]*))?");

const boost::regex SchemePrefix("[A-Za-z][A-Za-z0-9+.-]+:.*");

} // namespace

Url parseUrl(const std::string &url)
{
    boost::smatch m;
    if (!boost::regex_match(url, m, UrlRegex)) {
        LOGTHROW(err1, FormatError)
            << "Invalid URL <" << url << ">: no scheme.";
    }

    Url out;
    out.url = url;
    out.scheme = ba::to_lower_copy(m.str(1));
    out.path = m.str(4);
    out.query = m.str(6);

    if (!KnownSchemes.count(out.scheme)) {
        LOGTHROW(err1, FormatError)
            << "Invalid URL <" << url << ">: unknown scheme <"
            << out.scheme << ">.";
    }

    if (m[2].matched) {
        const auto authority(m.str(3));
        boost::smatch am;
        if (!boost::regex_match(authority, am, AuthorityRegex)) {
            LOGTHROW(err1, FormatError)
                << "Invalid URL <" << url << ">: invalid authority <"
                << authority << ">.";
        }

        out.host = am.str(1);
        if (am[2].matched && am.length(2)) {
            unsigned int port(0);
            try {
                port = boost::lexical_cast<unsigned int>(am.str(2));
            } catch (const boost::bad_lexical_cast&) {}

            if (!port || (port > 65535)) {
                LOGTHROW(err1, FormatError)
                    << "Invalid URL <" << url << ">: invalid port <"
                    << am.str(2) << ">.";
            }
            out.port = port;
        }
    }

    if (out.local()) {
        if (out.path.empty()) {
            LOGTHROW(err1, FormatError)
                << "Invalid URL <" << url << ">: empty file path.";
        }
    } else if (out.host.empty()) {
        LOGTHROW(err1, FormatError)
            << "Invalid URL <" << url << ">: missing host.";
    }

    return out;
}

std::string Url::localPath() const
{
    return utility::urlDecode(path);
}

bool hasScheme(const std::string &str)
{
    return boost::regex_match(str, SchemePrefix);
}
