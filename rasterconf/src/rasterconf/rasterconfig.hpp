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

#ifndef rasterconf_rasterconfig_hpp_included_
#define rasterconf_rasterconfig_hpp_included_

#include <memory>
#include <string>
#include <iostream>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include "./params.hpp"
#include "./overrides.hpp"
#include "./stores.hpp"
#include "./storefamily.hpp"
#include "./authorization.hpp"
#include "./url.hpp"
#include "./lazy.hpp"

/** Resolved raster store configuration.
 *
 *  Holds backend parameters, selected store family, overrides and
 *  authorization setup. Store handles are created on first request and
 *  shared afterwards. All member functions are thread safe.
 */
class RasterConfig : boost::noncopyable {
public:
    typedef std::shared_ptr<RasterConfig> pointer;

    /** Resolves configuration from backend parameters (without override keys)
     *  and overrides.
     *
     * \throws NoMatchingBackend
     */
    RasterConfig(const Params &params, const Overrides &overrides);

    /** Creates uncached configuration.
     */
    static pointer create(const Params &params
                          , const Overrides &overrides = Overrides());

    /** Creates uncached configuration from raw parameters: override keys are
     *  extracted first.
     *
     * \throws InvalidOverrideValue, NoMatchingBackend
     */
    static pointer resolve(Params params);

    /** Cached configuration from flat parameter string.
     *  See ConfigCache::fromParams.
     */
    static pointer readFromParams(const std::string &descriptor);

    /** Cached configuration from document locator.
     *  See ConfigCache::fromUrl.
     */
    static pointer readFromUrl(const std::string &locator);

    /** Backend parameters, i.e. without override keys.
     */
    const Params& params() const { return params_; }
    const Overrides& overrides() const { return overrides_; }
    const StoreFamily::pointer& storeFamily() const { return storeFamily_; }

    const AuthorizationFactory::pointer& authorizationFactory() const {
        return authorizationFactory_;
    }

    /** Validated authorization URL; unset when not given or malformed.
     */
    const boost::optional<Url>& authorizationUrl() const {
        return authorizationUrl_;
    }

    /** Creates authorization provider from configured factory and URL.
     */
    AuthorizationProvider::pointer authorizationProvider() const;

    /** Store handles. Created on first call, later calls return the same
     *  handle.
     *
     * \throws StoreConstructionFailed; next call tries again
     */
    DataStore::pointer dataStore() const;
    IndexStore::pointer indexStore() const;
    PersistentAdapterStore::pointer adapterStore() const;
    InternalAdapterStore::pointer internalAdapterStore() const;
    DataStatisticsStore::pointer dataStatisticsStore() const;
    AdapterIndexMappingStore::pointer adapterIndexMappingStore() const;

    bool isInterpolationOverrideSet() const;

    /** \throws OverrideNotSet if not set
     *  \throws InvalidOverrideValue if set to an unknown code
     */
    Interpolation interpolationOverride() const;

    bool isScaleTo8BitSet() const;

    /** \throws OverrideNotSet if not set
     */
    bool isScaleTo8Bit() const;

    bool isEqualizeHistogramOverrideSet() const;

    /** \throws OverrideNotSet if not set
     */
    bool isEqualizeHistogramOverride() const;

    void printConfig(std::ostream &os) const;

private:
    const Params params_;
    const Overrides overrides_;
    const StoreFamily::pointer storeFamily_;
    const AuthorizationFactory::pointer authorizationFactory_;
    const boost::optional<Url> authorizationUrl_;

    mutable Lazy<DataStore> dataStore_;
    mutable Lazy<IndexStore> indexStore_;
    mutable Lazy<PersistentAdapterStore> adapterStore_;
    mutable Lazy<InternalAdapterStore> internalAdapterStore_;
    mutable Lazy<DataStatisticsStore> dataStatisticsStore_;
    mutable Lazy<AdapterIndexMappingStore> adapterIndexMappingStore_;
};

// inlines

inline bool RasterConfig::isInterpolationOverrideSet() const
{
    return bool(overrides_.interpolation);
}

inline bool RasterConfig::isScaleTo8BitSet() const
{
    return bool(overrides_.scaleTo8Bit);
}

inline bool RasterConfig::isEqualizeHistogramOverrideSet() const
{
    return bool(overrides_.equalizeHistogram);
}

#endif // rasterconf_rasterconfig_hpp_included_
