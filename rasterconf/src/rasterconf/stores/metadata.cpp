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

#include <limits>
#include <algorithm>

#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "jsoncpp/json.hpp"
#include "jsoncpp/as.hpp"

#include "../error.hpp"
#include "./metadata.hpp"

namespace stores {

namespace {

typedef MetadataTable::Records Records;

std::string adapterKey(AdapterId id)
{
    return boost::lexical_cast<std::string>(id);
}

AdapterId asAdapterId(const Json::Value &value, const char *name)
{
    int id(0);
    Json::get(id, value, name);
    if ((id < 0) || (id > std::numeric_limits<AdapterId>::max())) {
        LOGTHROW(err1, FormatError)
            << "Adapter ID " << id << " out of range.";
    }
    return AdapterId(id);
}

// index

void build(Json::Value &value, const Index &index)
{
    value = Json::objectValue;
    value["name"] = index.name;
    value["type"] = index.type;
    auto &options(value["options"] = Json::objectValue);
    for (const auto &item : index.options) {
        options[item.first] = item.second;
    }
}

void parse(Index &index, const Json::Value &value)
{
    Json::get(index.name, value, "name");
    Json::get(index.type, value, "type");
    if (value.isMember("options")) {
        const auto &options(value["options"]);
        for (const auto &name : options.getMemberNames()) {
            index.options[name] = options[name].asString();
        }
    }
}

// adapter

void build(Json::Value &value, const Adapter &adapter)
{
    value = Json::objectValue;
    value["id"] = int(adapter.id);
    value["typeName"] = adapter.typeName;
    value["kind"] = adapter.kind;
}

void parse(Adapter &adapter, const Json::Value &value)
{
    adapter.id = asAdapterId(value, "id");
    Json::get(adapter.typeName, value, "typeName");
    Json::get(adapter.kind, value, "kind");
}

// statistic

void build(Json::Value &value, const Statistic &statistic)
{
    value = Json::objectValue;
    value["typeName"] = statistic.key.typeName;
    value["statistic"] = statistic.key.statistic;
    value["tag"] = statistic.key.tag;
    value["value"] = statistic.value;
}

void parse(Statistic &statistic, const Json::Value &value)
{
    Json::get(statistic.key.typeName, value, "typeName");
    Json::get(statistic.key.statistic, value, "statistic");
    Json::get(statistic.key.tag, value, "tag");
    Json::get(statistic.value, value, "value");
}

template <typename T>
T fromJson(const Json::Value &value)
{
    T out;
    parse(out, value);
    return out;
}

template <typename T>
Json::Value toJson(const T &in)
{
    Json::Value value;
    build(value, in);
    return value;
}

/** Common part of all metadata stores: keeps operations alive and accesses
 *  single table.
 */
class TableStore {
public:
    TableStore(const StoreOperations::pointer &ops, const std::string &table)
        : ops_(ops), table_(ops->table(table))
    {}

protected:
    StoreOperations::pointer ops_;
    MetadataTable &table_;
};

class IndexStoreImpl : public IndexStore, TableStore {
public:
    IndexStoreImpl(const StoreOperations::pointer &ops)
        : TableStore(ops, StoreOperations::Table::index)
    {}

    virtual void add(const Index &index) {
        if (index.name.empty()) {
            LOGTHROW(err1, Error) << "Cannot add index without name.";
        }
        table_.put(index.name, toJson(index));
    }

    virtual boost::optional<Index> get(const std::string &name) const {
        if (auto value = table_.get(name)) { return fromJson<Index>(*value); }
        return boost::none;
    }

    virtual bool has(const std::string &name) const {
        return bool(table_.get(name));
    }

    virtual bool remove(const std::string &name) {
        return table_.remove(name);
    }

    virtual Index::list list() const {
        Index::list indices;
        for (const auto &item : table_.records()) {
            indices.push_back(fromJson<Index>(item.second));
        }
        return indices;
    }
};

/** Table content: typeName -> { "id": adapterId }
 */
class InternalAdapterStoreImpl : public InternalAdapterStore, TableStore {
public:
    InternalAdapterStoreImpl(const StoreOperations::pointer &ops)
        : TableStore(ops, StoreOperations::Table::internalAdapter)
    {}

    virtual AdapterId add(const std::string &typeName) {
        AdapterId id(0);
        table_.update([&](Records &records)
        {
            auto frecords(records.find(typeName));
            if (frecords != records.end()) {
                id = asAdapterId(frecords->second, "id");
                return;
            }

            // allocate next free ID
            int next(0);
            for (const auto &item : records) {
                next = std::max(next, asAdapterId(item.second, "id") + 1);
            }
            if (next > std::numeric_limits<AdapterId>::max()) {
                LOGTHROW(err1, Error)
                    << "No free adapter ID for type <" << typeName << ">.";
            }

            id = AdapterId(next);
            auto &value(records[typeName] = Json::objectValue);
            value["id"] = next;
        });
        return id;
    }

    virtual boost::optional<AdapterId>
    adapterId(const std::string &typeName) const {
        if (auto value = table_.get(typeName)) {
            return asAdapterId(*value, "id");
        }
        return boost::none;
    }

    virtual boost::optional<std::string> typeName(AdapterId id) const {
        for (const auto &item : table_.records()) {
            if (asAdapterId(item.second, "id") == id) { return item.first; }
        }
        return boost::none;
    }

    virtual bool remove(AdapterId id) {
        bool removed(false);
        table_.update([&](Records &records)
        {
            for (auto irecords(records.begin()), erecords(records.end())
                     ; irecords != erecords; ++irecords)
            {
                if (asAdapterId(irecords->second, "id") == id) {
                    records.erase(irecords);
                    removed = true;
                    return;
                }
            }
        });
        return removed;
    }

    virtual std::map<std::string, AdapterId> list() const {
        std::map<std::string, AdapterId> out;
        for (const auto &item : table_.records()) {
            out[item.first] = asAdapterId(item.second, "id");
        }
        return out;
    }
};

class PersistentAdapterStoreImpl : public PersistentAdapterStore, TableStore {
public:
    PersistentAdapterStoreImpl(const StoreOperations::pointer &ops)
        : TableStore(ops, StoreOperations::Table::adapter)
    {}

    virtual void add(const Adapter &adapter) {
        table_.put(adapterKey(adapter.id), toJson(adapter));
    }

    virtual boost::optional<Adapter> get(AdapterId id) const {
        if (auto value = table_.get(adapterKey(id))) {
            return fromJson<Adapter>(*value);
        }
        return boost::none;
    }

    virtual bool has(AdapterId id) const {
        return bool(table_.get(adapterKey(id)));
    }

    virtual bool remove(AdapterId id) {
        return table_.remove(adapterKey(id));
    }

    virtual Adapter::list list() const {
        Adapter::list adapters;
        for (const auto &item : table_.records()) {
            adapters.push_back(fromJson<Adapter>(item.second));
        }
        return adapters;
    }
};

/** Table content: adapterId -> [ indexName, ... ]
 */
class AdapterIndexMappingStoreImpl
    : public AdapterIndexMappingStore, TableStore
{
public:
    AdapterIndexMappingStoreImpl(const StoreOperations::pointer &ops)
        : TableStore(ops, StoreOperations::Table::adapterIndexMapping)
    {}

    virtual void add(AdapterId id, const std::string &indexName) {
        table_.update([&](Records &records)
        {
            auto &value(records[adapterKey(id)]);
            if (!value.isArray()) { value = Json::arrayValue; }
            for (const auto &name : value) {
                if (name.asString() == indexName) { return; }
            }
            value.append(indexName);
        });
    }

    virtual std::vector<std::string> indices(AdapterId id) const {
        std::vector<std::string> out;
        if (auto value = table_.get(adapterKey(id))) {
            for (const auto &name : *value) {
                out.push_back(name.asString());
            }
        }
        return out;
    }

    virtual bool remove(AdapterId id) {
        return table_.remove(adapterKey(id));
    }
};

class DataStatisticsStoreImpl : public DataStatisticsStore, TableStore {
public:
    DataStatisticsStoreImpl(const StoreOperations::pointer &ops)
        : TableStore(ops, StoreOperations::Table::statistics)
    {}

    virtual void add(const Statistic &statistic) {
        const auto key(statistic.key.str());
        table_.update([&](Records &records)
        {
            auto frecords(records.find(key));
            if (frecords == records.end()) {
                records[key] = toJson(statistic);
                return;
            }

            auto merged(fromJson<Statistic>(frecords->second));
            merged.value += statistic.value;
            frecords->second = toJson(merged);
        });
    }

    virtual boost::optional<Statistic> get(const Statistic::Key &key) const {
        if (auto value = table_.get(key.str())) {
            return fromJson<Statistic>(*value);
        }
        return boost::none;
    }

    virtual Statistic::list list(const std::string &typeName) const {
        Statistic::list out;
        for (const auto &item : table_.records()) {
            auto statistic(fromJson<Statistic>(item.second));
            if (statistic.key.typeName == typeName) {
                out.push_back(statistic);
            }
        }
        return out;
    }

    virtual std::size_t remove(const std::string &typeName) {
        std::size_t removed(0);
        table_.update([&](Records &records)
        {
            for (auto irecords(records.begin()); irecords != records.end(); )
            {
                if (fromJson<Statistic>(irecords->second).key.typeName
                    == typeName)
                {
                    irecords = records.erase(irecords);
                    ++removed;
                } else {
                    ++irecords;
                }
            }
        });
        return removed;
    }
};

} // namespace

IndexStore::pointer indexStore(const StoreOperations::pointer &ops)
{
    return std::make_shared<IndexStoreImpl>(ops);
}

InternalAdapterStore::pointer
internalAdapterStore(const StoreOperations::pointer &ops)
{
    return std::make_shared<InternalAdapterStoreImpl>(ops);
}

PersistentAdapterStore::pointer
adapterStore(const StoreOperations::pointer &ops)
{
    return std::make_shared<PersistentAdapterStoreImpl>(ops);
}

AdapterIndexMappingStore::pointer
adapterIndexMappingStore(const StoreOperations::pointer &ops)
{
    return std::make_shared<AdapterIndexMappingStoreImpl>(ops);
}

DataStatisticsStore::pointer
dataStatisticsStore(const StoreOperations::pointer &ops)
{
    return std::make_shared<DataStatisticsStoreImpl>(ops);
}

} // namespace stores
