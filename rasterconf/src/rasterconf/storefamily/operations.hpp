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

#ifndef rasterconf_storefamily_operations_hpp_included_
#define rasterconf_storefamily_operations_hpp_included_

#include <functional>

#include "../storefamily.hpp"
#include "../storeoperations.hpp"

namespace store_family {

/** Store family whose stores are the generic metadata stores on top of
 *  family-specific store operations.
 */
class OperationsFamily : public StoreFamily {
public:
    virtual ~OperationsFamily();

    StoreOptions::pointer createOptions() const {
        return createOptions_impl();
    }

    /** Opens store operations for populated options.
     */
    StoreOperations::pointer operations(const StoreOptions &options) const {
        return operations_impl(options);
    }

    template <typename StoreType> class Factory;

protected:
    OperationsFamily(const std::string &type, const std::string &description);

private:
    virtual StoreOptions::pointer createOptions_impl() const = 0;
    virtual StoreOperations::pointer
    operations_impl(const StoreOptions &options) const = 0;

    virtual const DataStoreFactory& dataStoreFactory_impl() const;
    virtual const IndexStoreFactory& indexStoreFactory_impl() const;
    virtual const AdapterStoreFactory& adapterStoreFactory_impl() const;
    virtual const InternalAdapterStoreFactory&
    internalAdapterStoreFactory_impl() const;
    virtual const DataStatisticsStoreFactory&
    dataStatisticsStoreFactory_impl() const;
    virtual const AdapterIndexMappingStoreFactory&
    adapterIndexMappingStoreFactory_impl() const;

    struct Factories;
    std::unique_ptr<Factories> factories_;
};

template <typename StoreType>
class OperationsFamily::Factory : public StoreFamily::Factory<StoreType> {
public:
    typedef std::shared_ptr<StoreType> StorePointer;
    typedef std::function<StorePointer(const StoreOperations::pointer&)> Open;

    Factory(const OperationsFamily &family, const Open &open)
        : family_(family), open_(open)
    {}

    virtual StoreOptions::pointer createOptions() const {
        return family_.createOptions();
    }

    virtual StorePointer createStore(const StoreOptions &options) const {
        return open_(family_.operations(options));
    }

private:
    const OperationsFamily &family_;
    Open open_;
};

} // namespace store_family

#endif // rasterconf_storefamily_operations_hpp_included_
