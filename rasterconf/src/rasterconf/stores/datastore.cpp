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

#include "../error.hpp"
#include "./metadata.hpp"

namespace stores {

namespace {

/** Data store composed from metadata stores sharing the same operations.
 */
class DataStoreImpl : public DataStore {
public:
    DataStoreImpl(const StoreOperations::pointer &ops)
        : indexStore_(indexStore(ops))
        , internalAdapterStore_(internalAdapterStore(ops))
        , adapterStore_(adapterStore(ops))
        , mappingStore_(adapterIndexMappingStore(ops))
        , statisticsStore_(dataStatisticsStore(ops))
    {}

    virtual AdapterId addType(const std::string &typeName
                              , const std::string &kind
                              , const Index::list &indices);

    virtual Adapter::list types() const {
        return adapterStore_->list();
    }

    virtual Index::list indices(const std::string &typeName) const;

    virtual bool removeType(const std::string &typeName);

private:
    IndexStore::pointer indexStore_;
    InternalAdapterStore::pointer internalAdapterStore_;
    PersistentAdapterStore::pointer adapterStore_;
    AdapterIndexMappingStore::pointer mappingStore_;
    DataStatisticsStore::pointer statisticsStore_;
};

AdapterId DataStoreImpl::addType(const std::string &typeName
                                 , const std::string &kind
                                 , const Index::list &indices)
{
    if (typeName.empty()) {
        LOGTHROW(err1, Error) << "Cannot add type without name.";
    }

    for (const auto &index : indices) {
        if (!indexStore_->has(index.name)) { indexStore_->add(index); }
    }

    const auto id(internalAdapterStore_->add(typeName));
    adapterStore_->add(Adapter(id, typeName, kind));

    for (const auto &index : indices) {
        mappingStore_->add(id, index.name);
    }

    LOG(info2) << "Added type <" << typeName << "> (adapter " << id
               << ") with " << indices.size() << " index(es).";
    return id;
}

Index::list DataStoreImpl::indices(const std::string &typeName) const
{
    Index::list out;

    const auto id(internalAdapterStore_->adapterId(typeName));
    if (!id) { return out; }

    for (const auto &name : mappingStore_->indices(*id)) {
        if (auto index = indexStore_->get(name)) {
            out.push_back(*index);
        } else {
            LOG(warn2)
                << "Type <" << typeName << "> is mapped to unknown index <"
                << name << ">.";
        }
    }
    return out;
}

bool DataStoreImpl::removeType(const std::string &typeName)
{
    const auto id(internalAdapterStore_->adapterId(typeName));
    if (!id) { return false; }

    mappingStore_->remove(*id);
    adapterStore_->remove(*id);
    statisticsStore_->remove(typeName);
    internalAdapterStore_->remove(*id);

    LOG(info2) << "Removed type <" << typeName << "> (adapter " << *id
               << ").";
    return true;
}

} // namespace

DataStore::pointer dataStore(const StoreOperations::pointer &ops)
{
    return std::make_shared<DataStoreImpl>(ops);
}

} // namespace stores
