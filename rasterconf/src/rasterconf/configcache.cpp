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
#include <mutex>
#include <functional>

#include "dbglog/dbglog.hpp"

#include "./configcache.hpp"

struct ConfigCache::Detail {
    typedef std::function<Params()> Extract;

    RasterConfig::pointer get(const std::string &descriptor
                              , const Extract &extract);

    RasterConfig::pointer find(const std::string &descriptor) const {
        std::unique_lock<std::mutex> lock(mutex);
        auto fcache(cache.find(descriptor));
        if (fcache == cache.end()) { return {}; }
        return fcache->second;
    }

    mutable std::mutex mutex;
    std::map<std::string, RasterConfig::pointer> cache;
};

RasterConfig::pointer
ConfigCache::Detail::get(const std::string &descriptor
                         , const Extract &extract)
{
    if (auto config = find(descriptor)) { return config; }

    // resolve without holding the lock; may block on I/O
    auto config(RasterConfig::resolve(extract()));

    std::unique_lock<std::mutex> lock(mutex);
    auto res(cache.insert(std::make_pair(descriptor, config)));
    if (!res.second) {
        LOG(info1) << "Descriptor <" << descriptor
                   << "> resolved concurrently; using cached config.";
        return res.first->second;
    }

    LOG(info2) << "Resolved descriptor <" << descriptor
               << "> (store family <" << config->storeFamily()->type()
               << ">).";
    return config;
}

ConfigCache::ConfigCache()
    : detail_(new Detail())
{}

ConfigCache::~ConfigCache() {}

RasterConfig::pointer ConfigCache::fromParams(const std::string &descriptor)
{
    return detail().get(descriptor, [&]() { return parseParams(descriptor); });
}

RasterConfig::pointer ConfigCache::fromUrl(const std::string &locator)
{
    return detail().get(locator, [&]() { return loadDocument(locator); });
}

RasterConfig::pointer ConfigCache::find(const std::string &descriptor) const
{
    return detail().find(descriptor);
}

std::size_t ConfigCache::size() const
{
    std::unique_lock<std::mutex> lock(detail().mutex);
    return detail().cache.size();
}

void ConfigCache::clear()
{
    std::unique_lock<std::mutex> lock(detail().mutex);
    detail().cache.clear();
}

ConfigCache& ConfigCache::process()
{
    static ConfigCache *cache(new ConfigCache());
    return *cache;
}
