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

#include "dbglog/dbglog.hpp"

#include "utility/premain.hpp"

#include "./memory.hpp"

namespace store_family {

const std::string Memory::Type("memory");

namespace {

class MemoryOperations : public StoreOperations {
private:
    virtual MetadataTable::pointer openTable_impl(const std::string &name) {
        return std::make_shared<MetadataTable>(name);
    }
};

/** Operations shared by all memory stores of the same namespace. Never
 *  released.
 */
class Namespaces {
public:
    StoreOperations::pointer operations(const std::string &gwNamespace) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto &ops(map_[gwNamespace]);
        if (!ops) {
            LOG(info2) << "Creating memory store namespace <"
                       << gwNamespace << ">.";
            ops = std::make_shared<MemoryOperations>();
        }
        return ops;
    }

private:
    std::mutex mutex_;
    std::map<std::string, StoreOperations::pointer> map_;
};

Namespaces& namespaces()
{
    static Namespaces namespaces;
    return namespaces;
}

utility::PreMain register_([]()
{
    StoreFamily::registerFamily(std::make_shared<Memory>());
});

} // namespace

Memory::Options::Options()
    : StoreOptions("memory store family")
{}

Memory::Memory()
    : OperationsFamily(Type, "In-memory store, selected by type=memory.")
{}

StoreOptions::pointer Memory::createOptions_impl() const
{
    return std::make_shared<Options>();
}

StoreOperations::pointer
Memory::operations_impl(const StoreOptions &options) const
{
    return namespaces().operations(options.gwNamespace);
}

} // namespace store_family
