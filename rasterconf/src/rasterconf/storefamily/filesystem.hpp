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

#ifndef rasterconf_storefamily_filesystem_hpp_included_
#define rasterconf_storefamily_filesystem_hpp_included_

#include <boost/filesystem/path.hpp>

#include "./operations.hpp"

namespace store_family {

/** Store family keeping metadata tables in JSON files under given
 *  directory: <dir>/<namespace>/<table>.json
 */
class Filesystem : public OperationsFamily {
public:
    struct Options : StoreOptions {
        boost::filesystem::path dir;

        Options();

    private:
        virtual void printConfig_impl(std::ostream &os) const;
    };

    Filesystem();

    static const std::string Type;

    /** Namespace directory used for empty namespace.
     */
    static const std::string DefaultNamespace;

private:
    virtual StoreOptions::pointer createOptions_impl() const;
    virtual StoreOperations::pointer
    operations_impl(const StoreOptions &options) const;
};

} // namespace store_family

#endif // rasterconf_storefamily_filesystem_hpp_included_
