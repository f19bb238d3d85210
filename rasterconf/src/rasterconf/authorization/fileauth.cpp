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

#include <map>
#include <fstream>

#include "dbglog/dbglog.hpp"

#include "utility/premain.hpp"

#include "jsoncpp/json.hpp"
#include "jsoncpp/io.hpp"

#include "../error.hpp"
#include "../authorization.hpp"

namespace authorization {

namespace {

typedef std::map<std::string, std::vector<std::string>> AuthorizationSet;

/** Loads {"authorizationSet": {"user": ["auth", ...], ...}} file.
 */
AuthorizationSet loadAuthorizationSet(const std::string &path)
{
    std::ifstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    try {
        f.open(path, std::ios_base::in);
    } catch (const std::exception &e) {
        LOGTHROW(err1, IOError)
            << "Unable to open authorization file <" << path << ">: <"
            << e.what() << ">.";
    }

    const auto config(Json::read<FormatError>(f, path, "authorizations"));

    AuthorizationSet set;
    const auto &jset(config["authorizationSet"]);
    if (!jset.isObject()) {
        LOGTHROW(err1, FormatError)
            << "Authorization file <" << path
            << ">: authorizationSet is not an object.";
    }

    for (const auto &user : jset.getMemberNames()) {
        auto &auths(set[user]);
        for (const auto &auth : jset[user]) {
            auths.push_back(auth.asString());
        }
    }

    LOG(info2) << "Loaded authorizations of " << set.size()
               << " user(s) from <" << path << ">.";
    return set;
}

struct FileProvider : AuthorizationProvider {
    FileProvider(const AuthorizationSet &set) : set(set) {}

    virtual std::vector<std::string>
    authorizations_impl(const std::string &user) const {
        auto fset(set.find(user));
        if (fset == set.end()) { return {}; }
        return fset->second;
    }

    const AuthorizationSet set;
};

/** Authorizations from a local JSON file given by authorization URL. Any
 *  problem with the file results in no authorizations.
 */
struct FileFactory : AuthorizationFactory {
    FileFactory() : AuthorizationFactory("fileAuth") {}

    virtual AuthorizationProvider::pointer
    create_impl(const boost::optional<Url> &url) const
    {
        AuthorizationSet set;
        if (!url) {
            LOG(warn2) << "No authorization file given.";
        } else if (!url->local()) {
            LOG(warn2) << "Authorization URL <" << *url
                       << "> is not a local file.";
        } else {
            try {
                set = loadAuthorizationSet(url->localPath());
            } catch (const std::exception &e) {
                LOG(warn2) << "Using no authorizations: " << e.what();
            }
        }
        return std::make_shared<FileProvider>(set);
    }
};

utility::PreMain register_([]()
{
    AuthorizationFactory::registerFactory(std::make_shared<FileFactory>());
});

} // namespace

} // namespace authorization
