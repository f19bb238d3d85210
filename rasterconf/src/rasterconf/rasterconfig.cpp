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

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./rasterconfig.hpp"
#include "./configcache.hpp"

namespace {

/** Creates store of given kind from backend parameters using given factory.
 *  Any failure is reported as StoreConstructionFailed.
 */
template <typename StoreType>
std::shared_ptr<StoreType>
openStore(Lazy<StoreType> &slot
          , const StoreFamily::Factory<StoreType> &factory
          , const StoreFamily &family, const Params &params
          , const char *kind)
{
    return slot.get([&]() -> std::shared_ptr<StoreType>
    {
        std::shared_ptr<StoreType> store;
        try {
            auto options(factory.createOptions());
            options->populate(params);
            store = factory.createStore(*options);
        } catch (const std::exception &e) {
            LOGTHROW(err2, StoreConstructionFailed)
                << "Unable to create " << kind << " (store family <"
                << family.type() << ">): <" << e.what() << ">.";
        }

        if (!store) {
            LOGTHROW(err2, StoreConstructionFailed)
                << "Store family <" << family.type() << "> created no "
                << kind << ".";
        }

        LOG(info2) << "Created " << kind << " (store family <"
                   << family.type() << ">).";
        return store;
    });
}

} // namespace

RasterConfig::RasterConfig(const Params &params, const Overrides &overrides)
    : params_(params), overrides_(overrides)
    , storeFamily_(StoreFamily::find(params_))
    , authorizationFactory_(AuthorizationFactory::find
                            (overrides_.authorizationProvider))
    , authorizationUrl_(parseAuthorizationUrl(overrides_.authorizationUrl))
{}

RasterConfig::pointer RasterConfig::create(const Params &params
                                           , const Overrides &overrides)
{
    return std::make_shared<RasterConfig>(params, overrides);
}

RasterConfig::pointer RasterConfig::resolve(Params params)
{
    const auto overrides(extractOverrides(params));
    return create(params, overrides);
}

RasterConfig::pointer
RasterConfig::readFromParams(const std::string &descriptor)
{
    return ConfigCache::process().fromParams(descriptor);
}

RasterConfig::pointer RasterConfig::readFromUrl(const std::string &locator)
{
    return ConfigCache::process().fromUrl(locator);
}

AuthorizationProvider::pointer RasterConfig::authorizationProvider() const
{
    return authorizationFactory_->create(authorizationUrl_);
}

DataStore::pointer RasterConfig::dataStore() const
{
    return openStore(dataStore_, storeFamily_->dataStoreFactory()
                     , *storeFamily_, params_, "data store");
}

IndexStore::pointer RasterConfig::indexStore() const
{
    return openStore(indexStore_, storeFamily_->indexStoreFactory()
                     , *storeFamily_, params_, "index store");
}

PersistentAdapterStore::pointer RasterConfig::adapterStore() const
{
    return openStore(adapterStore_, storeFamily_->adapterStoreFactory()
                     , *storeFamily_, params_, "adapter store");
}

InternalAdapterStore::pointer RasterConfig::internalAdapterStore() const
{
    return openStore(internalAdapterStore_
                     , storeFamily_->internalAdapterStoreFactory()
                     , *storeFamily_, params_, "internal adapter store");
}

DataStatisticsStore::pointer RasterConfig::dataStatisticsStore() const
{
    return openStore(dataStatisticsStore_
                     , storeFamily_->dataStatisticsStoreFactory()
                     , *storeFamily_, params_, "data statistics store");
}

AdapterIndexMappingStore::pointer RasterConfig::adapterIndexMappingStore()
    const
{
    return openStore(adapterIndexMappingStore_
                     , storeFamily_->adapterIndexMappingStoreFactory()
                     , *storeFamily_, params_, "adapter-index mapping store");
}

Interpolation RasterConfig::interpolationOverride() const
{
    if (!overrides_.interpolation) {
        LOGTHROW(err1, OverrideNotSet)
            << "Interpolation override is not set for this config.";
    }
    return interpolationFromCode(*overrides_.interpolation);
}

bool RasterConfig::isScaleTo8Bit() const
{
    if (!overrides_.scaleTo8Bit) {
        LOGTHROW(err1, OverrideNotSet)
            << "Scale to 8-bit is not set for this config.";
    }
    return *overrides_.scaleTo8Bit;
}

bool RasterConfig::isEqualizeHistogramOverride() const
{
    if (!overrides_.equalizeHistogram) {
        LOGTHROW(err1, OverrideNotSet)
            << "Equalize histogram is not set for this config.";
    }
    return *overrides_.equalizeHistogram;
}

void RasterConfig::printConfig(std::ostream &os) const
{
    os << "storeFamily = " << storeFamily_->type() << "\n";
    for (const auto &item : params_) {
        os << "param." << item.first << " = " << item.second << "\n";
    }
    os << overrides_;
    os << "authorizationFactory = " << authorizationFactory_->name() << "\n";
    os << "authorizationUrl = ";
    if (authorizationUrl_) {
        os << *authorizationUrl_;
    } else {
        os << "(unset)";
    }
    os << "\n";
}
