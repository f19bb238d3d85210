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

#include "../stores/metadata.hpp"

#include "./operations.hpp"

namespace store_family {

struct OperationsFamily::Factories {
    Factory<DataStore> dataStore;
    Factory<IndexStore> indexStore;
    Factory<PersistentAdapterStore> adapterStore;
    Factory<InternalAdapterStore> internalAdapterStore;
    Factory<DataStatisticsStore> dataStatisticsStore;
    Factory<AdapterIndexMappingStore> adapterIndexMappingStore;

    Factories(const OperationsFamily &family)
        : dataStore(family, &stores::dataStore)
        , indexStore(family, &stores::indexStore)
        , adapterStore(family, &stores::adapterStore)
        , internalAdapterStore(family, &stores::internalAdapterStore)
        , dataStatisticsStore(family, &stores::dataStatisticsStore)
        , adapterIndexMappingStore(family, &stores::adapterIndexMappingStore)
    {}
};

OperationsFamily::OperationsFamily(const std::string &type
                                   , const std::string &description)
    : StoreFamily(type, description)
    , factories_(new Factories(*this))
{}

OperationsFamily::~OperationsFamily() {}

const StoreFamily::DataStoreFactory&
OperationsFamily::dataStoreFactory_impl() const
{
    return factories_->dataStore;
}

const StoreFamily::IndexStoreFactory&
OperationsFamily::indexStoreFactory_impl() const
{
    return factories_->indexStore;
}

const StoreFamily::AdapterStoreFactory&
OperationsFamily::adapterStoreFactory_impl() const
{
    return factories_->adapterStore;
}

const StoreFamily::InternalAdapterStoreFactory&
OperationsFamily::internalAdapterStoreFactory_impl() const
{
    return factories_->internalAdapterStore;
}

const StoreFamily::DataStatisticsStoreFactory&
OperationsFamily::dataStatisticsStoreFactory_impl() const
{
    return factories_->dataStatisticsStore;
}

const StoreFamily::AdapterIndexMappingStoreFactory&
OperationsFamily::adapterIndexMappingStoreFactory_impl() const
{
    return factories_->adapterIndexMappingStore;
}

} // namespace store_family
