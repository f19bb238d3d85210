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

#include "../storeoperations.hpp"

const std::string StoreOperations::Table::index("index");
const std::string StoreOperations::Table::adapter("adapter");
const std::string StoreOperations::Table::internalAdapter("internal_adapter");
const std::string StoreOperations::Table::adapterIndexMapping
    ("adapter_index_mapping");
const std::string StoreOperations::Table::statistics("statistics");

boost::optional<Json::Value> MetadataTable::get(const std::string &key) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    auto frecords(records_.find(key));
    if (frecords == records_.end()) { return boost::none; }
    return frecords->second;
}

MetadataTable::Records MetadataTable::records() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return records_;
}

void MetadataTable::put(const std::string &key, const Json::Value &value)
{
    update([&](Records &records)
    {
        records[key] = value;
    });
}

bool MetadataTable::remove(const std::string &key)
{
    bool removed(false);
    update([&](Records &records)
    {
        removed = records.erase(key);
    });
    return removed;
}

void MetadataTable::update(const Update &update)
{
    std::unique_lock<std::mutex> lock(mutex_);
    Records tmp(records_);
    update(tmp);
    commit_impl(tmp);
    records_.swap(tmp);
}

MetadataTable& StoreOperations::table(const std::string &name)
{
    std::unique_lock<std::mutex> lock(mutex_);
    auto ftables(tables_.find(name));
    if (ftables != tables_.end()) { return *ftables->second; }

    auto table(openTable_impl(name));
    tables_.insert(std::make_pair(name, table));
    return *table;
}
