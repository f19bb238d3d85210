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

#include "./error.hpp"
#include "./storeoptions.hpp"

namespace po = boost::program_options;

StoreOptions::StoreOptions(const std::string &caption)
    : description_(caption), caption_(caption)
{
    description_.add_options()
        ("gwNamespace", po::value(&gwNamespace)->default_value("")
         , "Namespace of store data.")
        ;
}

void StoreOptions::populate(const Params &params)
{
    po::parsed_options parsed(&description_);
    for (const auto &item : params) {
        if (!description_.find_nothrow(item.first, false)) { continue; }

        po::option option(item.first, { item.second });
        option.original_tokens = { item.first, item.second };
        parsed.options.push_back(option);
    }

    try {
        po::variables_map vars;
        po::store(parsed, vars);
        po::notify(vars);
    } catch (const po::error &e) {
        LOGTHROW(err1, InvalidStoreOptions)
            << "Invalid store options (" << caption_
            << "): " << e.what() << ".";
    }
}

bool StoreOptions::satisfiedBy(const Params &params) const
{
    std::size_t required(0);
    for (const auto &option : description_.options()) {
        if (!option->semantic()->is_required()) { continue; }
        ++required;
        if (!params.count(option->long_name())) { return false; }
    }
    return required;
}

void StoreOptions::printConfig(std::ostream &os) const
{
    os << "gwNamespace = " << gwNamespace << "\n";
    printConfig_impl(os);
}
