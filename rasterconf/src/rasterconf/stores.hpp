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

#ifndef rasterconf_stores_hpp_included_
#define rasterconf_stores_hpp_included_

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <initializer_list>
#include <cstdint>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

/** Numeric (internal) identifier of a data type adapter.
 */
typedef std::uint16_t AdapterId;

struct Index {
    std::string name;

    /** Index type (e.g. "spatial", "spatial_temporal").
     */
    std::string type;
    std::map<std::string, std::string> options;

    typedef std::vector<Index> list;

    Index(const std::string &name = "", const std::string &type = "")
        : name(name), type(type)
    {}
};

/** Persisted data type adapter.
 */
struct Adapter {
    AdapterId id;
    std::string typeName;

    /** Kind of data served by this adapter (e.g. "raster").
     */
    std::string kind;

    typedef std::vector<Adapter> list;

    Adapter(AdapterId id = 0, const std::string &typeName = ""
            , const std::string &kind = "")
        : id(id), typeName(typeName), kind(kind)
    {}
};

struct Statistic {
    struct Key {
        std::string typeName;
        std::string statistic;
        std::string tag;

        Key(const std::string &typeName = "", const std::string &statistic = ""
            , const std::string &tag = "")
            : typeName(typeName), statistic(statistic), tag(tag)
        {}

        bool operator<(const Key &o) const;

        /** Flat string form used as storage key. Every component is
         *  prefixed with its length: "<len>:<typeName><len>:<statistic>..."
         */
        std::string str() const;
    };

    Key key;
    double value;

    typedef std::vector<Statistic> list;

    Statistic(const Key &key = Key(), double value = 0.0)
        : key(key), value(value)
    {}
};

/** Index metadata.
 */
class IndexStore : boost::noncopyable {
public:
    typedef std::shared_ptr<IndexStore> pointer;

    virtual ~IndexStore() {}

    /** Adds or replaces index.
     */
    virtual void add(const Index &index) = 0;
    virtual boost::optional<Index> get(const std::string &name) const = 0;
    virtual bool has(const std::string &name) const = 0;

    /** Returns false if there was no such index.
     */
    virtual bool remove(const std::string &name) = 0;
    virtual Index::list list() const = 0;
};

/** Type name <-> adapter ID mapping.
 */
class InternalAdapterStore : boost::noncopyable {
public:
    typedef std::shared_ptr<InternalAdapterStore> pointer;

    virtual ~InternalAdapterStore() {}

    /** Returns ID of given type, allocates new ID if type is not known yet.
     */
    virtual AdapterId add(const std::string &typeName) = 0;

    virtual boost::optional<AdapterId>
    adapterId(const std::string &typeName) const = 0;

    virtual boost::optional<std::string> typeName(AdapterId id) const = 0;

    virtual bool remove(AdapterId id) = 0;

    /** All type names and their IDs.
     */
    virtual std::map<std::string, AdapterId> list() const = 0;
};

class PersistentAdapterStore : boost::noncopyable {
public:
    typedef std::shared_ptr<PersistentAdapterStore> pointer;

    virtual ~PersistentAdapterStore() {}

    virtual void add(const Adapter &adapter) = 0;
    virtual boost::optional<Adapter> get(AdapterId id) const = 0;
    virtual bool has(AdapterId id) const = 0;
    virtual bool remove(AdapterId id) = 0;
    virtual Adapter::list list() const = 0;
};

/** Which indices hold data of given adapter.
 */
class AdapterIndexMappingStore : boost::noncopyable {
public:
    typedef std::shared_ptr<AdapterIndexMappingStore> pointer;

    virtual ~AdapterIndexMappingStore() {}

    virtual void add(AdapterId id, const std::string &indexName) = 0;
    virtual std::vector<std::string> indices(AdapterId id) const = 0;
    virtual bool remove(AdapterId id) = 0;
};

class DataStatisticsStore : boost::noncopyable {
public:
    typedef std::shared_ptr<DataStatisticsStore> pointer;

    virtual ~DataStatisticsStore() {}

    /** Adds statistic. Value is merged (summed) into existing statistic with
     *  the same key.
     */
    virtual void add(const Statistic &statistic) = 0;

    virtual boost::optional<Statistic> get(const Statistic::Key &key) const
        = 0;

    /** All statistics of given type.
     */
    virtual Statistic::list list(const std::string &typeName) const = 0;

    /** Removes all statistics of given type. Returns number of removed
     *  statistics.
     */
    virtual std::size_t remove(const std::string &typeName) = 0;
};

/** Data store facade: manages types and their indices.
 */
class DataStore : boost::noncopyable {
public:
    typedef std::shared_ptr<DataStore> pointer;

    virtual ~DataStore() {}

    /** Registers data type and its indices. Indices not known to the store are
     *  added. Returns adapter ID of the type.
     */
    virtual AdapterId addType(const std::string &typeName
                              , const std::string &kind
                              , const Index::list &indices) = 0;

    virtual Adapter::list types() const = 0;

    /** Indices of given type. Empty list for unknown type.
     */
    virtual Index::list indices(const std::string &typeName) const = 0;

    /** Removes type, its index mapping and statistics. Indices are kept.
     */
    virtual bool removeType(const std::string &typeName) = 0;
};

// inlines

inline bool Statistic::Key::operator<(const Key &o) const
{
    if (typeName < o.typeName) { return true; }
    if (o.typeName < typeName) { return false; }
    if (statistic < o.statistic) { return true; }
    if (o.statistic < statistic) { return false; }
    return tag < o.tag;
}

inline std::string Statistic::Key::str() const
{
    std::string out;
    for (const auto *component : { &typeName, &statistic, &tag }) {
        out += std::to_string(component->size());
        out += ':';
        out += *component;
    }
    return out;
}

#endif // rasterconf_stores_hpp_included_
