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

#include <map>
#include <mutex>
#include <fstream>

#include <boost/filesystem.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/premain.hpp"

#include "jsoncpp/json.hpp"
#include "jsoncpp/io.hpp"

#include "../error.hpp"
#include "./filesystem.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace store_family {

const std::string Filesystem::Type("filesystem");
const std::string Filesystem::DefaultNamespace("default");

namespace {

const std::string TableExtension(".json");

/** Table persisted in a single JSON file. Whole file is rewritten on every
 *  change.
 */
class FileTable : public MetadataTable {
public:
    FileTable(const std::string &name, const fs::path &path
              , const Records &records)
        : MetadataTable(name, records), path_(path)
    {}

private:
    virtual void commit_impl(const Records &records);

    const fs::path path_;
};

void FileTable::commit_impl(const Records &records)
{
    Json::Value value(Json::objectValue);
    for (const auto &item : records) { value[item.first] = item.second; }

    const auto tmp(fs::path(path_).concat(".tmp"));
    try {
        std::ofstream f;
        f.exceptions(std::ios::badbit | std::ios::failbit);
        f.open(tmp.string(), std::ios_base::out | std::ios_base::trunc);
        f.precision(15);
        Json::write(f, value);
        f.close();
        fs::rename(tmp, path_);
    } catch (const std::exception &e) {
        LOGTHROW(err2, IOError)
            << "Unable to save table <" << name() << "> to " << path_
            << ": <" << e.what() << ">.";
    }
}

MetadataTable::Records loadTable(const fs::path &path)
{
    MetadataTable::Records records;
    if (!fs::exists(path)) { return records; }

    std::ifstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    try {
        f.open(path.string(), std::ios_base::in);
    } catch (const std::exception &e) {
        LOGTHROW(err2, IOError)
            << "Unable to open table " << path << ": <" << e.what() << ">.";
    }

    const auto value(Json::read<FormatError>(f, path, "table"));
    if (!value.isObject()) {
        LOGTHROW(err2, FormatError)
            << "Table " << path << " is not a JSON object.";
    }

    for (const auto &key : value.getMemberNames()) {
        records[key] = value[key];
    }
    return records;
}

class FilesystemOperations : public StoreOperations {
public:
    FilesystemOperations(const fs::path &root) : root_(root) {}

private:
    virtual MetadataTable::pointer openTable_impl(const std::string &name) {
        const auto path(root_ / (name + TableExtension));
        LOG(info1) << "Opening table <" << name << "> at " << path << ".";
        return std::make_shared<FileTable>(name, path, loadTable(path));
    }

    const fs::path root_;
};

/** Operations shared by all stores living in the same directory.
 */
class Roots {
public:
    StoreOperations::pointer operations(const fs::path &root) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto &ops(map_[root.string()]);
        if (!ops) {
            boost::system::error_code ec;
            fs::create_directories(root, ec);
            if (ec) {
                LOGTHROW(err2, IOError)
                    << "Unable to create store directory " << root
                    << ": <" << ec.message() << ">.";
            }
            ops = std::make_shared<FilesystemOperations>(root);
        }
        return ops;
    }

private:
    std::mutex mutex_;
    std::map<std::string, StoreOperations::pointer> map_;
};

Roots& roots()
{
    static Roots roots;
    return roots;
}

utility::PreMain register_([]()
{
    StoreFamily::registerFamily(std::make_shared<Filesystem>());
});

} // namespace

Filesystem::Options::Options()
    : StoreOptions("filesystem store family")
{
    description_.add_options()
        ("dir", po::value(&dir)->required()
         , "Root directory of store data.")
        ;
}

void Filesystem::Options::printConfig_impl(std::ostream &os) const
{
    os << "dir = " << dir.string() << "\n";
}

Filesystem::Filesystem()
    : OperationsFamily(Type, "JSON files under given directory.")
{}

StoreOptions::pointer Filesystem::createOptions_impl() const
{
    return std::make_shared<Options>();
}

StoreOperations::pointer
Filesystem::operations_impl(const StoreOptions &options) const
{
    const auto *o(dynamic_cast<const Options*>(&options));
    if (!o) {
        LOGTHROW(err1, InvalidStoreOptions)
            << "Options passed to store family <" << type()
            << "> are not filesystem options.";
    }

    if (o->dir.empty()) {
        LOGTHROW(err1, InvalidStoreOptions)
            << "Store family <" << type() << ">: empty directory.";
    }

    // namespace is a single directory under dir
    if ((o->gwNamespace.find_first_of("/\\") != std::string::npos)
        || (o->gwNamespace.find("..") != std::string::npos))
    {
        LOGTHROW(err1, InvalidStoreOptions)
            << "Store family <" << type() << ">: invalid namespace <"
            << o->gwNamespace << ">.";
    }

    const auto root(fs::absolute(o->dir)
                    / (o->gwNamespace.empty()
                       ? DefaultNamespace : o->gwNamespace));
    return roots().operations(root);
}

} // namespace store_family
