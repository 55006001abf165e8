/** MultistatusWriter [DAVBridge]
 *
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef MultistatusWriter_hpp
#define MultistatusWriter_hpp

#include <map>
#include <string>
#include <vector>
#include <libxml/xmlwriter.h>

#include "davbridge/constants.hpp"

/*
 One WebDAV property value. A property renders as an element in `ns` named
 `name`, containing `text`, a <d:href> per entry in `hrefs`, then `children`.
 */
struct DAVProperty {
    std::string ns;
    std::string name;
    std::string text;
    std::vector<std::string> hrefs;
    std::vector<DAVProperty> children;
    std::map<std::string, std::string> attributes;

    DAVProperty() {}
    DAVProperty(std::string ns, std::string name, std::string text = "") :
        ns(ns), name(name), text(text) {}

    // Property identity for lookups, "{ns}name".
    std::string key() const;
};

/*
 Streams a DAV:multistatus document through libxml2's xmlTextWriter. The
 DAV:, CalDAV and CalendarServer namespaces are declared once on the root as
 "d", "C" and "cs"; other namespaces are declared on the element that uses
 them. Writer failures throw DAVException 500.
 */
class MultistatusWriter {
    xmlBufferPtr _buffer;
    xmlTextWriterPtr _writer;
    bool _inResponse;
    bool _finished;

public:
    MultistatusWriter();
    ~MultistatusWriter();

    void startResponse(const std::string & href);
    void writePropstat(const std::vector<DAVProperty> & props, int status, bool namesOnly = false);
    void writeStatus(int status);
    void endResponse();

    // A response with only a status, e.g. a removed member in sync-collection.
    void writeStatusResponse(const std::string & href, int status);

    void writeSyncToken(const std::string & token);

    std::string finish();

    static std::string errorBody(const std::string & precondition, const std::string & ns = NS_DAV);
    static std::string statusLine(int status);
    static std::string reasonPhrase(int status);

private:
    MultistatusWriter(const MultistatusWriter&);
    MultistatusWriter& operator=(const MultistatusWriter&);

    void check(int rc, const char * what);
    void startElement(const std::string & ns, const std::string & name);
    void endElement();
    void writeTextElement(const std::string & ns, const std::string & name, const std::string & text);
    void writeProperty(const DAVProperty & prop, bool nameOnly);
};

#endif /* MultistatusWriter_hpp */
