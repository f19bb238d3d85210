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

#ifndef rasterconf_params_hpp_included_
#define rasterconf_params_hpp_included_

#include <map>
#include <string>
#include <iostream>

/** Raw descriptor parameters: key -> value.
 */
typedef std::map<std::string, std::string> Params;

/** Parses flat parameter string "key=value;key2=value2;flag".
 *
 *  Keys and values are trimmed, entries without value map to an empty string
 *  and empty entries are skipped. Throws MalformedDescriptor on entry without
 *  key; nothing is returned in such case.
 */
Params parseParams(const std::string &descriptor);

/** Parses single-level XML document: every element under the root element is
 *  one key (element name) / value (text content) pair.
 *
 *  Documents with any markup declaration (DOCTYPE, ENTITY, ...) are rejected.
 *
 * \param in input stream
 * \param source document source used in error messages
 * \throws DocumentParseError
 */
Params parseDocument(std::istream &in, const std::string &source);

/** Loads document from given locator (filesystem path or file: URL) and
 *  parses it by parseDocument.
 */
Params loadDocument(const std::string &locator);

/** Returns value under given key or null pointer if not present.
 */
const std::string* findParam(const Params &params, const std::string &key);

/** Dumps parameters in flat parameter string format.
 */
std::string formatParams(const Params &params);

#endif // rasterconf_params_hpp_included_
