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

#ifndef rasterconf_storeoperations_hpp_included_
#define rasterconf_storeoperations_hpp_included_

#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <functional>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include "jsoncpp/json.hpp"

/** Named table of JSON records. All operations are atomic.
 */
class MetadataTable : boost::noncopyable {
public:
    typedef std::shared_ptr<MetadataTable> pointer;
    typedef std::map<std::string, Json::Value> Records;
    typedef std::function<void(Records&)> Update;

    MetadataTable(const std::string &name, const Records &records = Records())
        : name_(name), records_(records)
    {}

    virtual ~MetadataTable() {}

    const std::string& name() const { return name_; }

    boost::optional<Json::Value> get(const std::string &key) const;

    /** Snapshot of all records.
     */
    Records records() const;

    void put(const std::string &key, const Json::Value &value);

    bool remove(const std::string &key);

    /** Applies update on a copy of table content. Updated content is
     *  committed and published only if neither update nor commit throws.
     */
    void update(const Update &update);

private:
    /** Makes updated records durable. Called under table lock.
     */
    virtual void commit_impl(const Records &records) { (void) records; }

    const std::string name_;
    mutable std::mutex mutex_;
    Records records_;
};

/** Backend-specific access to metadata tables.
 */
class StoreOperations : boost::noncopyable {
public:
    typedef std::shared_ptr<StoreOperations> pointer;

    virtual ~StoreOperations() {}

    /** Returns table of given name. Table is opened on first access and
     *  shared by all its users afterwards.
     */
    MetadataTable& table(const std::string &name);

    struct Table {
        static const std::string index;
        static const std::string adapter;
        static const std::string internalAdapter;
        static const std::string adapterIndexMapping;
        static const std::string statistics;
    };

private:
    virtual MetadataTable::pointer openTable_impl(const std::string &name)
        = 0;

    std::mutex mutex_;
    std::map<std::string, MetadataTable::pointer> tables_;
};

#endif // rasterconf_storeoperations_hpp_included_
