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

#include <gtest/gtest.h>

#include "../error.hpp"
#include "../url.hpp"
#include "../authorization.hpp"

TEST(Url, Http)
{
    const auto url(parseUrl("HTTPS://auth.example.com:8443/v1/check?x=1"));
    EXPECT_EQ("https", url.scheme);
    EXPECT_EQ("auth.example.com", url.host);
    ASSERT_TRUE(bool(url.port));
    EXPECT_EQ(8443u, *url.port);
    EXPECT_EQ("/v1/check", url.path);
    EXPECT_EQ("x=1", url.query);
    EXPECT_FALSE(url.local());
}

TEST(Url, File)
{
    const auto url(parseUrl("file:///var/lib/auth%20set.json"));
    EXPECT_TRUE(url.local());
    EXPECT_EQ("", url.host);
    EXPECT_EQ("/var/lib/auth set.json", url.localPath());

    EXPECT_EQ("/tmp/a.json", parseUrl("file:/tmp/a.json").localPath());
}

TEST(Url, Malformed)
{
    EXPECT_THROW(parseUrl("not a url"), FormatError);
    EXPECT_THROW(parseUrl("/tmp/auth.json"), FormatError);
    EXPECT_THROW(parseUrl("gopher://example.com/"), FormatError);
    EXPECT_THROW(parseUrl("http:///path"), FormatError);
    EXPECT_THROW(parseUrl("http://example.com:0/"), FormatError);
    EXPECT_THROW(parseUrl("http://example.com:70000/"), FormatError);
    EXPECT_THROW(parseUrl("http://example.com:port/"), FormatError);
    EXPECT_THROW(parseUrl("file://"), FormatError);
}

TEST(Url, HasScheme)
{
    EXPECT_TRUE(hasScheme("file:///tmp/x.xml"));
    EXPECT_TRUE(hasScheme("http://example.com/x.xml"));
    EXPECT_FALSE(hasScheme("/tmp/x.xml"));
    EXPECT_FALSE(hasScheme("relative/x.xml"));
    EXPECT_FALSE(hasScheme("C:\\config.xml"));
}

TEST(Url, AuthorizationUrlIsOptional)
{
    EXPECT_FALSE(parseAuthorizationUrl(boost::none));
    EXPECT_FALSE(parseAuthorizationUrl(std::string("::bogus::")));

    const auto url(parseAuthorizationUrl
                   (std::string("http://auth.example.com/")));
    ASSERT_TRUE(bool(url));
    EXPECT_EQ("auth.example.com", url->host);
}
