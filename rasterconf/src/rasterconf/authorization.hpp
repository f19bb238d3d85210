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

#ifndef rasterconf_authorization_hpp_included_
#define rasterconf_authorization_hpp_included_

#include <memory>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include "./url.hpp"

/** Provides data authorizations granted to a user.
 */
class AuthorizationProvider : boost::noncopyable {
public:
    typedef std::shared_ptr<AuthorizationProvider> pointer;

    virtual ~AuthorizationProvider() {}

    std::vector<std::string> authorizations(const std::string &user) const {
        return authorizations_impl(user);
    }

private:
    virtual std::vector<std::string>
    authorizations_impl(const std::string &user) const = 0;
};

/** Named authorization strategy.
 */
class AuthorizationFactory : boost::noncopyable {
public:
    typedef std::shared_ptr<AuthorizationFactory> pointer;

    virtual ~AuthorizationFactory() {}

    const std::string& name() const { return name_; }

    /** Creates provider using given authorization service URL.
     */
    AuthorizationProvider::pointer create(const boost::optional<Url> &url)
        const
    {
        return create_impl(url);
    }

    /** Returns first registered factory of given name. Returns empty() if
     *  name is not set or there is no such factory.
     */
    static pointer find(const boost::optional<std::string> &name);

    /** No-op factory: its provider grants no authorizations.
     */
    static pointer empty();

    /** Registers new factory. Registration order is the lookup order.
     */
    static void registerFactory(const pointer &factory);

    static std::vector<std::string> listNames();

protected:
    AuthorizationFactory(const std::string &name) : name_(name) {}

private:
    virtual AuthorizationProvider::pointer
    create_impl(const boost::optional<Url> &url) const = 0;

    const std::string name_;
};

/** Validates authorization service URL. Malformed URL is logged and
 *  treated as not set.
 */
boost::optional<Url>
parseAuthorizationUrl(const boost::optional<std::string> &url);

#endif // rasterconf_authorization_hpp_included_
