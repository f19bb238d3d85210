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

#include <mutex>
#include <algorithm>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "../storefamily.hpp"

const std::string StoreFamily::TypeHint("type");

namespace {

/** Registered families in registration order.
 */
struct Registry {
    std::mutex mutex;
    std::vector<StoreFamily::pointer> families;

    std::vector<StoreFamily::pointer> snapshot() {
        std::unique_lock<std::mutex> lock(mutex);
        return families;
    }
};

Registry& registry()
{
    static Registry registry;
    return registry;
}

} // namespace

bool StoreFamily::claims_impl(const Params &params) const
{
    return dataStoreFactory().createOptions()->satisfiedBy(params);
}

void StoreFamily::registerFamily(const pointer &family)
{
    auto &r(registry());
    std::unique_lock<std::mutex> lock(r.mutex);

    for (const auto &item : r.families) {
        if (item->type() == family->type()) {
            LOG(warn2)
                << "Store family <" << family->type()
                << "> already registered; ignoring.";
            return;
        }
    }

    r.families.push_back(family);
}

void StoreFamily::unregisterFamily(const std::string &type)
{
    auto &r(registry());
    std::unique_lock<std::mutex> lock(r.mutex);
    r.families.erase(std::remove_if(r.families.begin(), r.families.end()
                                    , [&](const pointer &family)
                                    {
                                        return family->type() == type;
                                    })
                     , r.families.end());
}

StoreFamily::pointer StoreFamily::findType(const std::string &type)
{
    for (const auto &family : registry().snapshot()) {
        if (family->type() == type) { return family; }
    }
    return {};
}

StoreFamily::pointer StoreFamily::find(const Params &params)
{
    if (const auto *type = findParam(params, TypeHint)) {
        if (auto family = findType(*type)) {
            LOG(info1) << "Using explicit store family <" << *type << ">.";
            return family;
        }
        LOGTHROW(err2, NoMatchingBackend)
            << "Unknown store family <" << *type << ">.";
    }

    for (const auto &family : registry().snapshot()) {
        if (family->claims(params)) {
            LOG(info1) << "Store family <" << family->type()
                       << "> claims parameters <" << formatParams(params)
                       << ">.";
            return family;
        }
    }

    LOGTHROW(err2, NoMatchingBackend)
        << "No store family claims parameters <" << formatParams(params)
        << ">.";
    throw;
}

std::vector<std::string> StoreFamily::listTypes()
{
    std::vector<std::string> out;
    for (const auto &family : registry().snapshot()) {
        out.push_back(family->type());
    }
    return out;
}
