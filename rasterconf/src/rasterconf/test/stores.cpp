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
#include <sstream>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

#include "../error.hpp"
#include "../storefamily.hpp"
#include "../storefamily/memory.hpp"
#include "../storefamily/filesystem.hpp"

namespace fs = boost::filesystem;

namespace {

template <typename StoreType>
std::shared_ptr<StoreType>
open(const StoreFamily::Factory<StoreType> &factory, const Params &params)
{
    auto options(factory.createOptions());
    options->populate(params);
    return factory.createStore(*options);
}

StoreFamily::pointer memory()
{
    auto family(StoreFamily::findType(store_family::Memory::Type));
    if (!family) { throw std::runtime_error("memory family not registered"); }
    return family;
}

StoreFamily::pointer filesystem()
{
    auto family(StoreFamily::findType(store_family::Filesystem::Type));
    if (!family) {
        throw std::runtime_error("filesystem family not registered");
    }
    return family;
}

Params ns(const std::string &name)
{
    return { { "gwNamespace", name } };
}

class FilesystemStore : public ::testing::Test {
protected:
    FilesystemStore()
        : root(fs::temp_directory_path()
               / fs::unique_path("rasterconf-%%%%-%%%%-%%%%"))
    {}

    ~FilesystemStore() {
        boost::system::error_code ec;
        fs::remove_all(root, ec);
    }

    Params params(const std::string &gwNamespace = "") const {
        return { { "dir", root.string() }, { "gwNamespace", gwNamespace } };
    }

    fs::path root;
};

} // namespace

TEST(MemoryStore, IndexStore)
{
    const auto store(open(memory()->indexStoreFactory()
                          , ns("index-store")));

    Index index("spatial-idx", "spatial");
    index.options["tileSize"] = "256";
    store->add(index);

    EXPECT_TRUE(store->has("spatial-idx"));
    EXPECT_FALSE(store->has("other"));

    const auto loaded(store->get("spatial-idx"));
    ASSERT_TRUE(bool(loaded));
    EXPECT_EQ("spatial", loaded->type);
    EXPECT_EQ("256", loaded->options.at("tileSize"));
    EXPECT_EQ(1u, store->list().size());

    EXPECT_TRUE(store->remove("spatial-idx"));
    EXPECT_FALSE(store->remove("spatial-idx"));
    EXPECT_TRUE(store->list().empty());

    EXPECT_THROW(store->add(Index()), Error);
}

TEST(MemoryStore, InternalAdapterStoreAllocatesIds)
{
    const auto store(open(memory()->internalAdapterStoreFactory()
                          , ns("internal-adapter-store")));

    const auto a(store->add("elevation"));
    const auto b(store->add("imagery"));
    EXPECT_NE(a, b);
    EXPECT_EQ(a, store->add("elevation"));

    EXPECT_EQ(a, *store->adapterId("elevation"));
    EXPECT_EQ(std::string("imagery"), *store->typeName(b));
    EXPECT_FALSE(store->adapterId("unknown"));
    EXPECT_EQ(2u, store->list().size());

    EXPECT_TRUE(store->remove(a));
    EXPECT_FALSE(store->remove(a));
    EXPECT_FALSE(store->typeName(a));
}

TEST(MemoryStore, AdapterStore)
{
    const auto store(open(memory()->adapterStoreFactory()
                          , ns("adapter-store")));

    store->add(Adapter(3, "elevation", "raster"));
    ASSERT_TRUE(store->has(3));
    EXPECT_EQ("elevation", store->get(3)->typeName);
    EXPECT_EQ("raster", store->get(3)->kind);
    EXPECT_FALSE(store->get(4));
    EXPECT_TRUE(store->remove(3));
    EXPECT_TRUE(store->list().empty());
}

TEST(MemoryStore, AdapterIndexMappingStore)
{
    const auto store(open(memory()->adapterIndexMappingStoreFactory()
                          , ns("mapping-store")));

    store->add(1, "spatial-idx");
    store->add(1, "temporal-idx");
    store->add(1, "spatial-idx");

    const std::vector<std::string> expected{ "spatial-idx", "temporal-idx" };
    EXPECT_EQ(expected, store->indices(1));
    EXPECT_TRUE(store->indices(2).empty());

    EXPECT_TRUE(store->remove(1));
    EXPECT_TRUE(store->indices(1).empty());
}

TEST(MemoryStore, StatisticsAreMerged)
{
    const auto store(open(memory()->dataStatisticsStoreFactory()
                          , ns("statistics-store")));

    const Statistic::Key key("elevation", "count", "band1");
    store->add(Statistic(key, 10));
    store->add(Statistic(key, 5));
    store->add(Statistic(Statistic::Key("imagery", "count"), 1));

    ASSERT_TRUE(bool(store->get(key)));
    EXPECT_DOUBLE_EQ(15.0, store->get(key)->value);
    EXPECT_EQ(1u, store->list("elevation").size());

    EXPECT_EQ(1u, store->remove("elevation"));
    EXPECT_FALSE(store->get(key));
    EXPECT_EQ(1u, store->list("imagery").size());
}

TEST(MemoryStore, StatisticKeysWithSeparatorsStayDistinct)
{
    const auto store(open(memory()->dataStatisticsStoreFactory()
                          , ns("statistics-separators")));

    const Statistic::Key first("a/b", "c");
    const Statistic::Key second("a", "b/c");
    EXPECT_NE(first.str(), second.str());

    store->add(Statistic(first, 1));
    store->add(Statistic(second, 2));

    ASSERT_TRUE(bool(store->get(first)));
    EXPECT_DOUBLE_EQ(1.0, store->get(first)->value);
    EXPECT_EQ("a/b", store->get(first)->key.typeName);

    ASSERT_TRUE(bool(store->get(second)));
    EXPECT_DOUBLE_EQ(2.0, store->get(second)->value);
    EXPECT_EQ("b/c", store->get(second)->key.statistic);
}

TEST(MemoryStore, DataStore)
{
    const auto family(memory());
    const auto store(open(family->dataStoreFactory(), ns("data-store")));

    const Index::list indices{ Index("spatial-idx", "spatial") };
    const auto id(store->addType("elevation", "raster", indices));

    ASSERT_EQ(1u, store->types().size());
    EXPECT_EQ(id, store->types().front().id);
    ASSERT_EQ(1u, store->indices("elevation").size());
    EXPECT_EQ("spatial", store->indices("elevation").front().type);
    EXPECT_TRUE(store->indices("unknown").empty());

    // other stores of the same namespace see the same data
    const auto indexStore(open(family->indexStoreFactory()
                               , ns("data-store")));
    EXPECT_TRUE(indexStore->has("spatial-idx"));

    const auto statistics(open(family->dataStatisticsStoreFactory()
                               , ns("data-store")));
    statistics->add(Statistic(Statistic::Key("elevation", "count"), 1));

    EXPECT_TRUE(store->removeType("elevation"));
    EXPECT_FALSE(store->removeType("elevation"));
    EXPECT_TRUE(store->types().empty());
    EXPECT_TRUE(statistics->list("elevation").empty());
    EXPECT_TRUE(indexStore->has("spatial-idx"));
}

TEST(MemoryStore, NamespacesAreSeparated)
{
    const auto a(open(memory()->indexStoreFactory(), ns("separated-a")));
    const auto b(open(memory()->indexStoreFactory(), ns("separated-b")));

    a->add(Index("idx", "spatial"));
    EXPECT_TRUE(a->has("idx"));
    EXPECT_FALSE(b->has("idx"));
}

TEST(MemoryStore, NeverClaims)
{
    EXPECT_FALSE(memory()->claims(ns("x")));
    EXPECT_FALSE(memory()->claims(Params()));
}

TEST_F(FilesystemStore, Claims)
{
    EXPECT_TRUE(filesystem()->claims(params()));
    EXPECT_FALSE(filesystem()->claims(ns("x")));
}

TEST_F(FilesystemStore, MissingDirectory)
{
    auto options(filesystem()->dataStoreFactory().createOptions());
    EXPECT_THROW(options->populate(ns("x")), InvalidStoreOptions);
}

TEST_F(FilesystemStore, Persistence)
{
    const auto family(filesystem());
    {
        const auto store(open(family->dataStoreFactory(), params("ns1")));
        store->addType("elevation", "raster"
                       , { Index("spatial-idx", "spatial") });
    }

    EXPECT_TRUE(fs::exists(root / "ns1" / "index.json"));
    EXPECT_TRUE(fs::exists(root / "ns1" / "adapter.json"));
    EXPECT_TRUE(fs::exists(root / "ns1" / "internal_adapter.json"));
    EXPECT_TRUE(fs::exists(root / "ns1" / "adapter_index_mapping.json"));

    const auto indexStore(open(family->indexStoreFactory(), params("ns1")));
    EXPECT_TRUE(indexStore->has("spatial-idx"));

    const auto other(open(family->indexStoreFactory(), params("ns2")));
    EXPECT_FALSE(other->has("spatial-idx"));
}

TEST_F(FilesystemStore, DefaultNamespace)
{
    const auto store(open(filesystem()->indexStoreFactory(), params()));
    store->add(Index("idx", "spatial"));

    EXPECT_TRUE(fs::exists(root / store_family::Filesystem::DefaultNamespace
                           / "index.json"));
}

TEST_F(FilesystemStore, NamespaceStaysUnderDirectory)
{
    for (const auto *gwNamespace : { "../../x", "..", "a/b", "a\\b" }) {
        EXPECT_THROW(open(filesystem()->indexStoreFactory()
                          , params(gwNamespace))
                     , InvalidStoreOptions) << gwNamespace;
    }
    EXPECT_FALSE(fs::exists(root.parent_path().parent_path() / "x"));
}

TEST_F(FilesystemStore, UnwritableDirectory)
{
    // regular file in place of the store directory
    fs::create_directories(root);
    const auto file(root / "file");
    {
        std::ofstream f(file.string());
        f << "x";
    }

    Params p{ { "dir", file.string() } };
    EXPECT_THROW(open(filesystem()->indexStoreFactory(), p), IOError);
}

TEST_F(FilesystemStore, PrintOptions)
{
    auto options(filesystem()->dataStoreFactory().createOptions());
    options->populate(params("ns1"));

    std::ostringstream os;
    options->printConfig(os);
    EXPECT_NE(std::string::npos, os.str().find("gwNamespace = ns1"));
    EXPECT_NE(std::string::npos, os.str().find("dir = " + root.string()));
}
