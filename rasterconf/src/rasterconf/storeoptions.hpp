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

#ifndef rasterconf_storeoptions_hpp_included_
#define rasterconf_storeoptions_hpp_included_

#include <memory>
#include <string>
#include <iostream>

#include <boost/noncopyable.hpp>
#include <boost/program_options.hpp>

#include "./params.hpp"

/** Store options filled in from backend parameters.
 *
 *  Derived classes register their options (bound to their members) in
 *  description() in their constructors.
 */
class StoreOptions : boost::noncopyable {
public:
    typedef std::shared_ptr<StoreOptions> pointer;

    virtual ~StoreOptions() {}

    /** Fills in options from given parameters. Parameters not known to these
     *  options are ignored.
     *
     * \throws InvalidStoreOptions on missing required option or invalid value
     */
    void populate(const Params &params);

    /** Checks whether options declare at least one required option and all
     *  required options are present in params.
     */
    bool satisfiedBy(const Params &params) const;

    const boost::program_options::options_description& description() const {
        return description_;
    }

    void printConfig(std::ostream &os) const;

    /** Namespace of store data. Common to all stores.
     */
    std::string gwNamespace;

protected:
    StoreOptions(const std::string &caption);

    boost::program_options::options_description description_;

private:
    virtual void printConfig_impl(std::ostream &os) const { (void) os; }

    const std::string caption_;
};

#endif // rasterconf_storeoptions_hpp_included_
