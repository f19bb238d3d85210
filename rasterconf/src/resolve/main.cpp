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

#include <cstdlib>
#include <iostream>
#include <vector>
#include <string>
#include <iterator>
#include <algorithm>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "dbglog/dbglog.hpp"

#include "service/cmdline.hpp"

#include "rasterconf/error.hpp"
#include "rasterconf/rasterconfig.hpp"

namespace po = boost::program_options;
namespace ba = boost::algorithm;

namespace {

const std::string StoreKinds[] = {
    "data", "index", "adapter", "internalAdapter", "statistics", "mapping"
};

} // namespace

class Resolve : public service::Cmdline {
public:
    Resolve()
        : service::Cmdline("rasterconf-resolve", BUILD_TARGET_VERSION)
    {
    }

private:
    void configuration(po::options_description &cmdline
                       , po::options_description &config
                       , po::positional_options_description &pd);

    void configure(const po::variables_map &vars);

    bool help(std::ostream &out, const std::string &what) const;

    int run();

    void open(const RasterConfig &config, const std::string &kind) const;

    std::string params_;
    std::string url_;
    std::vector<std::string> open_;
    std::string user_;
};

void Resolve::configuration(po::options_description &cmdline
                            , po::options_description &config
                            , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("params", po::value(&params_)
         , "Flat parameter string descriptor (key=value;key=value...).")
        ("url", po::value(&url_)
         , "Path or file: URL of XML descriptor document.")
        ("open", po::value<std::string>()
         , "Comma-separated list of stores to open: data, index, adapter, "
         "internalAdapter, statistics, mapping or all.")
        ("user", po::value(&user_)
         , "Print authorizations granted to this user.")
        ;

    (void) config;
    (void) pd;
}

void Resolve::configure(const po::variables_map &vars)
{
    if (vars.count("params") == vars.count("url")) {
        throw po::error("exactly one of --params and --url must be given");
    }

    if (vars.count("open")) {
        ba::split(open_, vars["open"].as<std::string>(), ba::is_any_of(",")
                  , ba::token_compress_on);
        if (open_.size() == 1 && open_.front() == "all") {
            open_.assign(std::begin(StoreKinds), std::end(StoreKinds));
        }

        for (const auto &kind : open_) {
            if (std::find(std::begin(StoreKinds), std::end(StoreKinds), kind)
                == std::end(StoreKinds))
            {
                throw po::error("unknown store kind <" + kind + ">");
            }
        }
    }
}

bool Resolve::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        out << ("rasterconf-resolve: resolves raster store descriptor and "
                "prints resolved configuration\n"
                "\n"
                "Registered store families:");
        for (const auto &type : StoreFamily::listTypes()) {
            out << " " << type;
        }
        out << "\n\n";
        for (const auto &type : StoreFamily::listTypes()) {
            if (const auto family = StoreFamily::findType(type)) {
                out << type << ": " << family->description() << "\n";
                out << family->dataStoreFactory().createOptions()
                    ->description() << "\n";
            }
        }
        out << "Registered authorization providers:";
        for (const auto &name : AuthorizationFactory::listNames()) {
            out << " " << name;
        }
        out << "\n\n";
        return true;
    }

    return false;
}

void Resolve::open(const RasterConfig &config, const std::string &kind) const
{
    if (kind == "data") {
        const auto store(config.dataStore());

        // already validated by store creation
        const auto &factory(config.storeFamily()->dataStoreFactory());
        const auto options(factory.createOptions());
        options->populate(config.params());
        options->printConfig(std::cout);

        for (const auto &adapter : store->types()) {
            std::cout << "type " << adapter.typeName << " (" << adapter.id
                      << ", " << adapter.kind << ")\n";
        }
    } else if (kind == "index") {
        for (const auto &index : config.indexStore()->list()) {
            std::cout << "index " << index.name << " (" << index.type
                      << ")\n";
        }
    } else if (kind == "adapter") {
        std::cout << "adapters: " << config.adapterStore()->list().size()
                  << "\n";
    } else if (kind == "internalAdapter") {
        for (const auto &item : config.internalAdapterStore()->list()) {
            std::cout << "adapter id " << item.first << " = " << item.second
                      << "\n";
        }
    } else if (kind == "statistics") {
        config.dataStatisticsStore();
        std::cout << "statistics store open\n";
    } else if (kind == "mapping") {
        config.adapterIndexMappingStore();
        std::cout << "adapter-index mapping store open\n";
    } else {
        LOGTHROW(err2, std::runtime_error)
            << "Unknown store kind <" << kind << ">.";
    }
}

int Resolve::run()
{
    try {
        const auto config(params_.empty()
                          ? RasterConfig::readFromUrl(url_)
                          : RasterConfig::readFromParams(params_));

        config->printConfig(std::cout);

        for (const auto &kind : open_) { open(*config, kind); }

        if (!user_.empty()) {
            std::cout << "authorizations of <" << user_ << ">:";
            for (const auto &auth
                     : config->authorizationProvider()->authorizations(user_))
            {
                std::cout << " " << auth;
            }
            std::cout << "\n";
        }
    } catch (const MalformedDescriptor &e) {
        std::cerr << "Invalid descriptor: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const DocumentParseError &e) {
        std::cerr << "Invalid descriptor document: " << e.what()
                  << std::endl;
        return EXIT_FAILURE;
    } catch (const InvalidOverrideValue &e) {
        std::cerr << "Invalid descriptor: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const NoMatchingBackend &e) {
        std::cerr << "No store family: " << e.what() << std::endl;
        return 2;
    } catch (const StoreConstructionFailed &e) {
        std::cerr << "Store unavailable: " << e.what() << std::endl;
        return 3;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    return Resolve()(argc, argv);
}
