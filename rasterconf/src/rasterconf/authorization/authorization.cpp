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

#include <mutex>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "../authorization.hpp"

namespace {

struct Registry {
    std::mutex mutex;
    std::vector<AuthorizationFactory::pointer> factories;
};

Registry& registry()
{
    static Registry registry;
    return registry;
}

} // namespace

void AuthorizationFactory::registerFactory(const pointer &factory)
{
    auto &r(registry());
    std::unique_lock<std::mutex> lock(r.mutex);
    r.factories.push_back(factory);
}

AuthorizationFactory::pointer
AuthorizationFactory::find(const boost::optional<std::string> &name)
{
    if (!name) { return empty(); }

    {
        auto &r(registry());
        std::unique_lock<std::mutex> lock(r.mutex);
        for (const auto &factory : r.factories) {
            if (factory->name() == *name) { return factory; }
        }
    }

    LOG(info2) << "No authorization provider <" << *name
               << "> registered; using empty provider.";
    return empty();
}

std::vector<std::string> AuthorizationFactory::listNames()
{
    std::vector<std::string> out;

    auto &r(registry());
    std::unique_lock<std::mutex> lock(r.mutex);
    for (const auto &factory : r.factories) {
        out.push_back(factory->name());
    }
    return out;
}

boost::optional<Url>
parseAuthorizationUrl(const boost::optional<std::string> &url)
{
    if (!url) { return boost::none; }

    try {
        return parseUrl(*url);
    } catch (const FormatError &e) {
        LOG(warn2)
            << "Malformed authorization service URL <" << *url
            << ">, ignored: <" << e.what() << ">.";
    }
    return boost::none;
}
