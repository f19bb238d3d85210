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

#ifndef rasterconf_configcache_hpp_included_
#define rasterconf_configcache_hpp_included_

#include <memory>
#include <string>

#include <boost/noncopyable.hpp>

#include "./rasterconfig.hpp"

/** Raw descriptor -> resolved configuration.
 *
 *  Resolution runs outside of the cache lock; when more callers resolve
 *  the same descriptor concurrently the first stored configuration wins and
 *  is returned to all of them. Failed resolutions are not cached. Entries
 *  are never evicted.
 */
class ConfigCache : boost::noncopyable {
public:
    ConfigCache();
    ~ConfigCache();

    /** Returns configuration for flat parameter string descriptor.
     *
     * \throws MalformedDescriptor, InvalidOverrideValue, NoMatchingBackend
     */
    RasterConfig::pointer fromParams(const std::string &descriptor);

    /** Returns configuration for document locator.
     *
     * \throws DocumentParseError, InvalidOverrideValue, NoMatchingBackend
     */
    RasterConfig::pointer fromUrl(const std::string &locator);

    /** Returns cached configuration or null pointer.
     */
    RasterConfig::pointer find(const std::string &descriptor) const;

    std::size_t size() const;

    /** Drops all cached configurations. Meant for tests.
     */
    void clear();

    /** Process-wide cache. Created on first use and never destroyed.
     */
    static ConfigCache& process();

    // internals
    struct Detail;

private:
    std::unique_ptr<Detail> detail_;
    Detail& detail() { return *detail_; }
    const Detail& detail() const { return *detail_; }
};

#endif // rasterconf_configcache_hpp_included_
