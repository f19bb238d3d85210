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

#include <fstream>
#include <thread>
#include <vector>
#include <sstream>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

#include "../error.hpp"
#include "../rasterconfig.hpp"
#include "../configcache.hpp"

#include "./testfamily.hpp"

namespace fs = boost::filesystem;

namespace {

/** Runs given function in given number of threads at once and returns
 *  their results.
 */
template <typename Result, typename Function>
std::vector<Result> concurrently(int count, Function function)
{
    std::vector<Result> results(count);
    std::vector<std::thread> threads;
    for (int i(0); i < count; ++i) {
        threads.emplace_back([&, i]() { results[i] = function(); });
    }
    for (auto &thread : threads) { thread.join(); }
    return results;
}

/** Temporary document removed at scope exit.
 */
struct Document {
    fs::path path;

    Document(const std::string &content)
        : path(fs::temp_directory_path()
               / fs::unique_path("rasterconf-%%%%-%%%%.xml"))
    {
        std::ofstream f(path.string());
        f << content;
    }

    ~Document() {
        boost::system::error_code ec;
        fs::remove(path, ec);
    }
};

} // namespace

TEST(ConfigCache, SameDescriptorSameConfig)
{
    ConfigCache cache;
    const auto a(cache.fromParams("type=memory;gwNamespace=cache-same"));
    const auto b(cache.fromParams("type=memory;gwNamespace=cache-same"));
    EXPECT_EQ(a, b);
    EXPECT_EQ(1u, cache.size());
    EXPECT_EQ(a, cache.find("type=memory;gwNamespace=cache-same"));
}

TEST(ConfigCache, KeyedByRawDescriptor)
{
    ConfigCache cache;
    const auto a(cache.fromParams("type=memory;gwNamespace=cache-raw"));
    const auto b(cache.fromParams("gwNamespace=cache-raw;type=memory"));
    EXPECT_NE(a, b);
    EXPECT_EQ(a->params(), b->params());
    EXPECT_EQ(2u, cache.size());

    cache.clear();
    EXPECT_EQ(0u, cache.size());
    EXPECT_FALSE(cache.find("type=memory;gwNamespace=cache-raw"));
}

TEST(ConfigCache, ConcurrentFirstAccess)
{
    ConfigCache cache;
    const std::string descriptor("type=memory;gwNamespace=cache-concurrent");

    const auto configs(concurrently<RasterConfig::pointer>(16, [&]()
    {
        return cache.fromParams(descriptor);
    }));

    ASSERT_TRUE(bool(configs.front()));
    for (const auto &config : configs) {
        EXPECT_EQ(configs.front(), config);
    }
    EXPECT_EQ(1u, cache.size());
}

TEST(ConfigCache, FailureIsNotCached)
{
    ConfigCache cache;
    const std::string descriptor("lateKey=1;gwNamespace=cache-late");

    EXPECT_THROW(cache.fromParams(descriptor), NoMatchingBackend);
    EXPECT_EQ(0u, cache.size());

    test::Registration late("test-late", "lateKey");
    const auto config(cache.fromParams(descriptor));
    EXPECT_EQ(late.family, config->storeFamily());
    EXPECT_EQ(1u, cache.size());
}

TEST(ConfigCache, MalformedDescriptor)
{
    ConfigCache cache;
    EXPECT_THROW(cache.fromParams("type=memory;=x"), MalformedDescriptor);
    EXPECT_THROW(cache.fromParams("type=memory;interpolationOverride=x9")
                 , InvalidOverrideValue);
    EXPECT_EQ(0u, cache.size());
}

TEST(ConfigCache, ProcessWide)
{
    const auto a(RasterConfig::readFromParams
                 ("type=memory;gwNamespace=process-wide"));
    EXPECT_EQ(a, RasterConfig::readFromParams
              ("type=memory;gwNamespace=process-wide"));
    EXPECT_EQ(a, ConfigCache::process().find
              ("type=memory;gwNamespace=process-wide"));
}

TEST(ConfigCache, Document)
{
    Document doc("<?xml version=\"1.0\"?>\n"
                 "<config>\n"
                 "  <type>memory</type>\n"
                 "  <gwNamespace>document</gwNamespace>\n"
                 "  <scaleTo8Bit>true</scaleTo8Bit>\n"
                 "</config>\n");

    ConfigCache cache;
    const auto config(cache.fromUrl(doc.path.string()));
    EXPECT_EQ("memory", config->storeFamily()->type());
    EXPECT_EQ("document", config->params().at("gwNamespace"));
    EXPECT_TRUE(config->isScaleTo8Bit());
    EXPECT_EQ(config, cache.fromUrl(doc.path.string()));
}

TEST(ConfigCache, UnsafeDocument)
{
    Document doc("<?xml version=\"1.0\"?>\n"
                 "<!DOCTYPE config [ <!ENTITY ns \"x\"> ]>\n"
                 "<config><type>memory</type></config>\n");

    ConfigCache cache;
    EXPECT_THROW(cache.fromUrl(doc.path.string()), DocumentParseError);
    EXPECT_EQ(0u, cache.size());
}

TEST(RasterConfig, Overrides)
{
    const auto config(RasterConfig::resolve
                      (parseParams("type=memory;interpolationOverride=2"
                                   ";scaleTo8Bit=TRUE")));

    ASSERT_TRUE(config->isInterpolationOverrideSet());
    EXPECT_EQ(Interpolation::bicubic, config->interpolationOverride());
    ASSERT_TRUE(config->isScaleTo8BitSet());
    EXPECT_TRUE(config->isScaleTo8Bit());
    EXPECT_FALSE(config->isEqualizeHistogramOverrideSet());
    EXPECT_THROW(config->isEqualizeHistogramOverride(), OverrideNotSet);

    // override keys are not backend parameters
    EXPECT_EQ(1u, config->params().size());
    EXPECT_EQ("memory", config->params().at("type"));
}

TEST(RasterConfig, UnknownInterpolationCode)
{
    ConfigCache cache;
    const auto config(cache.fromParams
                      ("type=memory;interpolationOverride=7"));

    ASSERT_TRUE(bool(config));
    EXPECT_TRUE(config->isInterpolationOverrideSet());
    EXPECT_THROW(config->interpolationOverride(), InvalidOverrideValue);
    EXPECT_EQ(1u, cache.size());
}

TEST(RasterConfig, FalseFlags)
{
    const auto config(RasterConfig::resolve
                      (parseParams("type=memory;scaleTo8Bit=yes"
                                   ";equalizeHistogramOverride=false")));

    ASSERT_TRUE(config->isScaleTo8BitSet());
    EXPECT_FALSE(config->isScaleTo8Bit());
    ASSERT_TRUE(config->isEqualizeHistogramOverrideSet());
    EXPECT_FALSE(config->isEqualizeHistogramOverride());
    EXPECT_FALSE(config->isInterpolationOverrideSet());
    EXPECT_THROW(config->interpolationOverride(), OverrideNotSet);
}

TEST(RasterConfig, Authorization)
{
    const auto unknown(RasterConfig::resolve
                       (parseParams("type=memory"
                                    ";authorizationProvider="
                                    "none-registered-xyz")));
    EXPECT_EQ(AuthorizationFactory::empty(), unknown->authorizationFactory());
    EXPECT_TRUE(unknown->authorizationProvider()->authorizations("u")
                .empty());

    const auto malformed(RasterConfig::resolve
                         (parseParams("type=memory"
                                      ";authorizationProvider=fileAuth"
                                      ";authorizationUrl=::bogus::")));
    EXPECT_EQ("fileAuth", malformed->authorizationFactory()->name());
    EXPECT_FALSE(malformed->authorizationUrl());

    const auto valid(RasterConfig::resolve
                     (parseParams("type=memory"
                                  ";authorizationUrl=http://auth.example.com"
                                  "/check")));
    ASSERT_TRUE(bool(valid->authorizationUrl()));
    EXPECT_EQ("auth.example.com", valid->authorizationUrl()->host);
    EXPECT_EQ(AuthorizationFactory::empty(), valid->authorizationFactory());
}

TEST(RasterConfig, StoresAreShared)
{
    const auto config(RasterConfig::resolve
                      (parseParams("type=memory;gwNamespace=shared")));

    const auto store(config->dataStore());
    ASSERT_TRUE(bool(store));
    EXPECT_EQ(store, config->dataStore());

    EXPECT_EQ(config->indexStore(), config->indexStore());
    EXPECT_EQ(config->adapterStore(), config->adapterStore());
    EXPECT_EQ(config->internalAdapterStore()
              , config->internalAdapterStore());
    EXPECT_EQ(config->dataStatisticsStore(), config->dataStatisticsStore());
    EXPECT_EQ(config->adapterIndexMappingStore()
              , config->adapterIndexMappingStore());

    // all kinds work on the same data
    store->addType("elevation", "raster", { Index("idx", "spatial") });
    EXPECT_TRUE(config->indexStore()->has("idx"));
    EXPECT_TRUE(bool(config->internalAdapterStore()->adapterId("elevation")));
}

TEST(RasterConfig, ConcurrentStoreAccess)
{
    test::Registration registration("test-concurrent", "concurrentKey");
    const auto config(RasterConfig::resolve
                      (parseParams("concurrentKey=1")));

    const auto stores(concurrently<DataStore::pointer>(16, [&]()
    {
        return config->dataStore();
    }));

    ASSERT_TRUE(bool(stores.front()));
    for (const auto &store : stores) { EXPECT_EQ(stores.front(), store); }
    EXPECT_EQ(1, registration.family->created.load());
}

TEST(RasterConfig, StoreConstructionFailure)
{
    test::Registration registration("test-failing", "failingKey");
    const auto config(RasterConfig::resolve(parseParams("failingKey=1")));
    auto &family(*registration.family);

    family.failures = 1;
    EXPECT_THROW(config->indexStore(), StoreConstructionFailed);

    // next request tries again
    const auto store(config->indexStore());
    ASSERT_TRUE(bool(store));
    EXPECT_EQ(store, config->indexStore());
    EXPECT_EQ(1, family.created.load());

    family.nulls = 1;
    EXPECT_THROW(config->adapterStore(), StoreConstructionFailed);
    EXPECT_TRUE(bool(config->adapterStore()));

    // other kinds are independent
    family.failures = 1;
    EXPECT_THROW(config->dataStore(), StoreConstructionFailed);
    EXPECT_EQ(store, config->indexStore());
}

TEST(RasterConfig, InvalidStoreOptions)
{
    // filesystem family selected explicitly without its directory
    const auto config(RasterConfig::resolve(parseParams("type=filesystem")));
    EXPECT_EQ("filesystem", config->storeFamily()->type());
    EXPECT_THROW(config->dataStore(), StoreConstructionFailed);
}

TEST(RasterConfig, FilesystemDocument)
{
    const auto dir(fs::temp_directory_path()
                   / fs::unique_path("rasterconf-%%%%-%%%%-%%%%"));
    Document doc("<config><dir>" + dir.string() + "</dir>"
                 "<gwNamespace>doc</gwNamespace>"
                 "<interpolationOverride>0</interpolationOverride>"
                 "</config>");

    ConfigCache cache;
    const auto config(cache.fromUrl("file://" + doc.path.string()));
    EXPECT_EQ("filesystem", config->storeFamily()->type());
    EXPECT_EQ(Interpolation::nearest, config->interpolationOverride());

    config->dataStore()->addType("imagery", "raster", {});
    EXPECT_TRUE(fs::exists(dir / "doc" / "internal_adapter.json"));

    boost::system::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(RasterConfig, PrintConfig)
{
    const auto config(RasterConfig::resolve
                      (parseParams("type=memory;scaleTo8Bit=true")));
    std::ostringstream os;
    config->printConfig(os);

    EXPECT_NE(std::string::npos, os.str().find("storeFamily = memory"));
    EXPECT_NE(std::string::npos, os.str().find("scaleTo8Bit = true"));
    EXPECT_NE(std::string::npos, os.str().find("authorizationFactory = empty"));
}
