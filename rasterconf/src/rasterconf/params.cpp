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
#include <vector>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <tinyxml2.h>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./url.hpp"
#include "./params.hpp"

namespace ba = boost::algorithm;
namespace xml = tinyxml2;

namespace {

const char EntrySeparator(';');
const char EntrySeparators[] = ";";
const char KeyValueSeparator('=');

void setParam(Params &params, const std::string &key
              , const std::string &value, const std::string &source)
{
    auto res(params.insert(Params::value_type(key, value)));
    if (!res.second) {
        LOG(warn2)
            << "Duplicate parameter <" << key << "> in " << source
            << "; using last value.";
        res.first->second = value;
    }
}

/** Concatenated text of all descendants, i.e. the node's text content.
 */
void textContent(std::string &out, const xml::XMLNode *node)
{
    for (auto *child(node->FirstChild()); child
             ; child = child->NextSibling())
    {
        if (const auto *text = child->ToText()) {
            out.append(text->Value());
        } else if (child->ToElement()) {
            textContent(out, child);
        }
    }
}

/** Any <!...> declaration other than comment and CDATA ends up as
 *  XMLUnknown. We do not allow any of them.
 */
void checkDeclarations(const xml::XMLNode *node, const std::string &source)
{
    for (auto *child(node->FirstChild()); child
             ; child = child->NextSibling())
    {
        if (const auto *unknown = child->ToUnknown()) {
            LOGTHROW(err1, DocumentParseError)
                << "Document " << source
                << " contains forbidden markup declaration <!"
                << std::string(unknown->Value()).substr(0, 32) << ">.";
        }
        checkDeclarations(child, source);
    }
}

} // namespace

Params parseParams(const std::string &descriptor)
{
    std::vector<std::string> entries;
    ba::split(entries, descriptor, ba::is_any_of(EntrySeparators));

    Params params;
    for (const auto &entry : entries) {
        if (ba::all(entry, ba::is_space())) { continue; }

        std::string key, value;
        const auto sep(entry.find(KeyValueSeparator));
        if (sep == std::string::npos) {
            key = ba::trim_copy(entry);
        } else {
            key = ba::trim_copy(entry.substr(0, sep));
            value = ba::trim_copy(entry.substr(sep + 1));
        }

        if (key.empty()) {
            LOGTHROW(err1, MalformedDescriptor)
                << "Parameter <" << entry << "> in descriptor <"
                << descriptor << "> has no key.";
        }

        setParam(params, key, value, "descriptor <" + descriptor + ">");
    }

    return params;
}

Params parseDocument(std::istream &in, const std::string &source)
{
    std::ostringstream os;
    os << in.rdbuf();
    if (in.bad()) {
        LOGTHROW(err1, DocumentParseError)
            << "Unable to read document " << source << ".";
    }
    const auto content(os.str());

    xml::XMLDocument doc(true, xml::PRESERVE_WHITESPACE);
    if (doc.Parse(content.data(), content.size()) != xml::XML_SUCCESS) {
        LOGTHROW(err1, DocumentParseError)
            << "Unable to parse document " << source << ": <"
            << doc.ErrorStr() << ">.";
    }

    checkDeclarations(&doc, source);

    const auto *root(doc.RootElement());
    if (!root) {
        LOGTHROW(err1, DocumentParseError)
            << "Document " << source << " has no root element.";
    }

    Params params;
    for (auto *child(root->FirstChildElement()); child
             ; child = child->NextSiblingElement())
    {
        std::string value;
        textContent(value, child);
        setParam(params, child->Name(), ba::trim_copy(value)
                 , "document " + source);
    }

    LOG(info1) << "Loaded " << params.size() << " parameter(s) from document "
               << source << ".";
    return params;
}

Params loadDocument(const std::string &locator)
{
    std::string path(locator);
    if (hasScheme(locator)) {
        Url url;
        try {
            url = parseUrl(locator);
        } catch (const FormatError &e) {
            LOGTHROW(err1, DocumentParseError)
                << "Invalid document locator <" << locator << ">: <"
                << e.what() << ">.";
        }
        if (!url.local()) {
            LOGTHROW(err1, DocumentParseError)
                << "Unable to fetch document <" << locator
                << ">: only local (file:) documents are supported.";
        }
        path = url.localPath();
    }

    std::ifstream f(path);
    if (!f) {
        LOGTHROW(err1, DocumentParseError)
            << "Unable to open document <" << locator << ">.";
    }

    return parseDocument(f, "<" + locator + ">");
}

const std::string* findParam(const Params &params, const std::string &key)
{
    auto fparams(params.find(key));
    if (fparams == params.end()) { return nullptr; }
    return &fparams->second;
}

std::string formatParams(const Params &params)
{
    std::ostringstream os;
    bool first(true);
    for (const auto &item : params) {
        if (!first) { os << EntrySeparator; }
        first = false;
        os << item.first << KeyValueSeparator << item.second;
    }
    return os.str();
}
