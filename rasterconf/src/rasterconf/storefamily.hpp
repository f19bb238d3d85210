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

#ifndef rasterconf_storefamily_hpp_included_
#define rasterconf_storefamily_hpp_included_

#include <memory>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

#include "./params.hpp"
#include "./stores.hpp"
#include "./storeoptions.hpp"

/** Family of store factories of one storage backend.
 *
 *  Families are registered (usually from utility::PreMain) under their type
 *  name. Registration order defines the order in which families are asked
 *  to claim backend parameters.
 */
class StoreFamily : boost::noncopyable {
public:
    typedef std::shared_ptr<StoreFamily> pointer;

    virtual ~StoreFamily() {}

    /** Factory of one store kind.
     */
    template <typename StoreType> struct Factory;

    typedef Factory<DataStore> DataStoreFactory;
    typedef Factory<IndexStore> IndexStoreFactory;
    typedef Factory<PersistentAdapterStore> AdapterStoreFactory;
    typedef Factory<InternalAdapterStore> InternalAdapterStoreFactory;
    typedef Factory<DataStatisticsStore> DataStatisticsStoreFactory;
    typedef Factory<AdapterIndexMappingStore> AdapterIndexMappingStoreFactory;

    const std::string& type() const { return type_; }
    const std::string& description() const { return description_; }

    /** Can this family serve given backend parameters?
     */
    bool claims(const Params &params) const { return claims_impl(params); }

    const DataStoreFactory& dataStoreFactory() const;
    const IndexStoreFactory& indexStoreFactory() const;
    const AdapterStoreFactory& adapterStoreFactory() const;
    const InternalAdapterStoreFactory& internalAdapterStoreFactory() const;
    const DataStatisticsStoreFactory& dataStatisticsStoreFactory() const;
    const AdapterIndexMappingStoreFactory& adapterIndexMappingStoreFactory()
        const;

    /** Finds family for given backend parameters.
     *
     *  Explicit type hint (TypeHint parameter) selects family by its type.
     *  Otherwise first family (in registration order) that claims the
     *  parameters is returned.
     *
     * \throws NoMatchingBackend if no family is found
     */
    static pointer find(const Params &params);

    /** Finds family by its type. Returns null pointer if not found.
     */
    static pointer findType(const std::string &type);

    /** Registers new family. Family with already registered type is ignored.
     */
    static void registerFamily(const pointer &family);

    /** Removes family from registry.
     */
    static void unregisterFamily(const std::string &type);

    static std::vector<std::string> listTypes();

    /** Name of parameter holding explicit family type.
     */
    static const std::string TypeHint;

protected:
    StoreFamily(const std::string &type, const std::string &description)
        : type_(type), description_(description)
    {}

private:
    /** Default implementation: required options of data store factory are
     *  satisfied by params.
     */
    virtual bool claims_impl(const Params &params) const;

    virtual const DataStoreFactory& dataStoreFactory_impl() const = 0;
    virtual const IndexStoreFactory& indexStoreFactory_impl() const = 0;
    virtual const AdapterStoreFactory& adapterStoreFactory_impl() const = 0;
    virtual const InternalAdapterStoreFactory&
    internalAdapterStoreFactory_impl() const = 0;
    virtual const DataStatisticsStoreFactory&
    dataStatisticsStoreFactory_impl() const = 0;
    virtual const AdapterIndexMappingStoreFactory&
    adapterIndexMappingStoreFactory_impl() const = 0;

    const std::string type_;
    const std::string description_;
};

template <typename StoreType>
struct StoreFamily::Factory {
    typedef std::shared_ptr<StoreType> StorePointer;

    virtual ~Factory() {}

    /** Creates fresh (unpopulated) options instance.
     */
    virtual StoreOptions::pointer createOptions() const = 0;

    /** Creates store from populated options.
     */
    virtual StorePointer createStore(const StoreOptions &options) const = 0;
};

// inlines

inline const StoreFamily::DataStoreFactory&
StoreFamily::dataStoreFactory() const
{
    return dataStoreFactory_impl();
}

inline const StoreFamily::IndexStoreFactory&
StoreFamily::indexStoreFactory() const
{
    return indexStoreFactory_impl();
}

inline const StoreFamily::AdapterStoreFactory&
StoreFamily::adapterStoreFactory() const
{
    return adapterStoreFactory_impl();
}

inline const StoreFamily::InternalAdapterStoreFactory&
StoreFamily::internalAdapterStoreFactory() const
{
    return internalAdapterStoreFactory_impl();
}

inline const StoreFamily::DataStatisticsStoreFactory&
StoreFamily::dataStatisticsStoreFactory() const
{
    return dataStatisticsStoreFactory_impl();
}

inline const StoreFamily::AdapterIndexMappingStoreFactory&
StoreFamily::adapterIndexMappingStoreFactory() const
{
    return adapterIndexMappingStoreFactory_impl();
}

#endif // rasterconf_storefamily_hpp_included_
