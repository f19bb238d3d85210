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

#include <sstream>

#include <gtest/gtest.h>

#include "../error.hpp"
#include "../overrides.hpp"

TEST(Overrides, NoneSet)
{
    auto params(parseParams("dir=/data"));
    const auto o(extractOverrides(params));

    EXPECT_FALSE(o.interpolation);
    EXPECT_FALSE(o.scaleTo8Bit);
    EXPECT_FALSE(o.equalizeHistogram);
    EXPECT_FALSE(o.authorizationProvider);
    EXPECT_FALSE(o.authorizationUrl);
    EXPECT_EQ(1u, params.size());
}

TEST(Overrides, ExtractsAndRemovesKeys)
{
    auto params(parseParams("dir=/data;interpolationOverride=1"
                            ";scaleTo8Bit=TRUE;equalizeHistogramOverride=no"
                            ";authorizationProvider=fileAuth"
                            ";authorizationUrl=file:///tmp/auth.json"));
    const auto o(extractOverrides(params));

    ASSERT_TRUE(bool(o.interpolation));
    EXPECT_EQ(1, *o.interpolation);
    ASSERT_TRUE(bool(o.scaleTo8Bit));
    EXPECT_TRUE(*o.scaleTo8Bit);
    ASSERT_TRUE(bool(o.equalizeHistogram));
    EXPECT_FALSE(*o.equalizeHistogram);
    EXPECT_EQ(std::string("fileAuth"), *o.authorizationProvider);
    EXPECT_EQ(std::string("file:///tmp/auth.json"), *o.authorizationUrl);

    ASSERT_EQ(1u, params.size());
    EXPECT_EQ("/data", params.at("dir"));
}

TEST(Overrides, InterpolationCodes)
{
    EXPECT_EQ(Interpolation::nearest, interpolationFromCode(0));
    EXPECT_EQ(Interpolation::bilinear, interpolationFromCode(1));
    EXPECT_EQ(Interpolation::bicubic, interpolationFromCode(2));
    EXPECT_EQ(Interpolation::bicubic2, interpolationFromCode(3));
    EXPECT_THROW(interpolationFromCode(4), InvalidOverrideValue);
    EXPECT_THROW(interpolationFromCode(-1), InvalidOverrideValue);
}

TEST(Overrides, InvalidInterpolationLeavesParamsIntact)
{
    auto params(parseParams("dir=/data;scaleTo8Bit=true"
                            ";interpolationOverride=cubic"));
    const auto copy(params);

    EXPECT_THROW(extractOverrides(params), InvalidOverrideValue);
    EXPECT_EQ(copy, params);
}

TEST(Overrides, UnknownInterpolationCodeIsKept)
{
    auto params(parseParams("dir=/data;interpolationOverride=7"));
    const auto o(extractOverrides(params));

    ASSERT_TRUE(bool(o.interpolation));
    EXPECT_EQ(7, *o.interpolation);
    EXPECT_EQ(1u, params.size());
}

TEST(Overrides, InterpolationIsTrimmed)
{
    auto params(parseParams("interpolationOverride=2"));
    params[Overrides::Key::interpolation] = " 2 ";
    EXPECT_EQ(2, *extractOverrides(params).interpolation);
}

TEST(Overrides, Flags)
{
    EXPECT_TRUE(parseFlag("true"));
    EXPECT_TRUE(parseFlag("TRUE"));
    EXPECT_TRUE(parseFlag(" True "));
    EXPECT_FALSE(parseFlag("false"));
    EXPECT_FALSE(parseFlag("1"));
    EXPECT_FALSE(parseFlag("yes"));
    EXPECT_FALSE(parseFlag(""));
}

TEST(Overrides, Print)
{
    auto params(parseParams("interpolationOverride=3"));
    std::ostringstream os;
    os << extractOverrides(params);

    EXPECT_NE(std::string::npos
              , os.str().find("interpolationOverride = 3"));
    EXPECT_NE(std::string::npos, os.str().find("scaleTo8Bit = (unset)"));
}
