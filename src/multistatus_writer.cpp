#include "davbridge/multistatus_writer.hpp"
#include "davbridge/dav_exception.hpp"

using namespace std;

static const char * prefixFor(const string & ns) {
    if (ns == NS_DAV) {
        return "d";
    }
    if (ns == NS_CALDAV) {
        return "C";
    }
    if (ns == NS_CALSERVER) {
        return "cs";
    }
    return nullptr;
}

string DAVProperty::key() const {
    return "{" + ns + "}" + name;
}

MultistatusWriter::MultistatusWriter() :
    _buffer(nullptr), _writer(nullptr), _inResponse(false), _finished(false)
{
    _buffer = xmlBufferCreate();
    if (_buffer == nullptr) {
        throw DAVException(500, ERROR_PROTOCOL_REQUEST, "Error allocating memory to xmlBuffer");
    }
    _writer = xmlNewTextWriterMemory(_buffer, 0);
    if (_writer == nullptr) {
        xmlBufferFree(_buffer);
        throw DAVException(500, ERROR_PROTOCOL_REQUEST, "Error initializing xmlWriter");
    }

    try {
        // some clients refuse unindented multistatus bodies
        check(xmlTextWriterSetIndent(_writer, 1), "SetIndent");
        check(xmlTextWriterStartDocument(_writer, NULL, "UTF-8", NULL), "StartDocument");
        check(xmlTextWriterStartElementNS(_writer, (const xmlChar *)"d", (const xmlChar *)"multistatus", (const xmlChar *)NS_DAV), "StartElement multistatus");
        check(xmlTextWriterWriteAttribute(_writer, (const xmlChar *)"xmlns:C", (const xmlChar *)NS_CALDAV), "WriteAttribute xmlns:C");
        check(xmlTextWriterWriteAttribute(_writer, (const xmlChar *)"xmlns:cs", (const xmlChar *)NS_CALSERVER), "WriteAttribute xmlns:cs");
    } catch (DAVException &) {
        xmlFreeTextWriter(_writer);
        xmlBufferFree(_buffer);
        throw;
    }
}

MultistatusWriter::~MultistatusWriter() {
    if (_writer != nullptr) {
        xmlFreeTextWriter(_writer);
    }
    if (_buffer != nullptr) {
        xmlBufferFree(_buffer);
    }
}

void MultistatusWriter::check(int rc, const char * what) {
    if (rc < 0) {
        throw DAVException(500, ERROR_PROTOCOL_REQUEST, string("Error writing xml data: ") + what);
    }
}

void MultistatusWriter::startElement(const string & ns, const string & name) {
    if (ns == "") {
        check(xmlTextWriterStartElement(_writer, (const xmlChar *)name.c_str()), name.c_str());
        return;
    }
    const char * prefix = prefixFor(ns);
    if (prefix != nullptr) {
        check(xmlTextWriterStartElementNS(_writer, (const xmlChar *)prefix, (const xmlChar *)name.c_str(), NULL), name.c_str());
    } else {
        check(xmlTextWriterStartElementNS(_writer, (const xmlChar *)"x", (const xmlChar *)name.c_str(), (const xmlChar *)ns.c_str()), name.c_str());
    }
}

void MultistatusWriter::endElement() {
    check(xmlTextWriterEndElement(_writer), "EndElement");
}

void MultistatusWriter::writeTextElement(const string & ns, const string & name, const string & text) {
    startElement(ns, name);
    check(xmlTextWriterWriteString(_writer, (const xmlChar *)text.c_str()), "WriteString");
    endElement();
}

void MultistatusWriter::writeProperty(const DAVProperty & prop, bool nameOnly) {
    startElement(prop.ns, prop.name);
    if (!nameOnly) {
        for (const auto & attr : prop.attributes) {
            check(xmlTextWriterWriteAttribute(_writer, (const xmlChar *)attr.first.c_str(), (const xmlChar *)attr.second.c_str()), "WriteAttribute");
        }
        if (prop.text != "") {
            check(xmlTextWriterWriteString(_writer, (const xmlChar *)prop.text.c_str()), "WriteString");
        }
        for (const auto & href : prop.hrefs) {
            writeTextElement(NS_DAV, "href", href);
        }
        for (const auto & child : prop.children) {
            writeProperty(child, false);
        }
    }
    endElement();
}

void MultistatusWriter::startResponse(const string & href) {
    if (_inResponse) {
        endResponse();
    }
    startElement(NS_DAV, "response");
    writeTextElement(NS_DAV, "href", href);
    _inResponse = true;
}

void MultistatusWriter::writePropstat(const vector<DAVProperty> & props, int status, bool namesOnly) {
    if (props.empty()) {
        return;
    }
    startElement(NS_DAV, "propstat");
    startElement(NS_DAV, "prop");
    for (const auto & prop : props) {
        writeProperty(prop, namesOnly);
    }
    endElement();
    writeTextElement(NS_DAV, "status", statusLine(status));
    endElement();
}

void MultistatusWriter::writeStatus(int status) {
    writeTextElement(NS_DAV, "status", statusLine(status));
}

void MultistatusWriter::endResponse() {
    if (!_inResponse) {
        return;
    }
    endElement();
    _inResponse = false;
}

void MultistatusWriter::writeStatusResponse(const string & href, int status) {
    startResponse(href);
    writeStatus(status);
    endResponse();
}

void MultistatusWriter::writeSyncToken(const string & token) {
    if (_inResponse) {
        endResponse();
    }
    writeTextElement(NS_DAV, "sync-token", token);
}

string MultistatusWriter::finish() {
    if (!_finished) {
        if (_inResponse) {
            endResponse();
        }
        // closes </d:multistatus>
        check(xmlTextWriterEndDocument(_writer), "EndDocument");
        check(xmlTextWriterFlush(_writer), "Flush");
        _finished = true;
    }
    return string((const char *)xmlBufferContent(_buffer), (size_t)xmlBufferLength(_buffer));
}

string MultistatusWriter::errorBody(const string & precondition, const string & ns) {
    xmlBufferPtr buffer = xmlBufferCreate();
    if (buffer == nullptr) {
        throw DAVException(500, ERROR_PROTOCOL_REQUEST, "Error allocating memory to xmlBuffer");
    }
    xmlTextWriterPtr writer = xmlNewTextWriterMemory(buffer, 0);
    if (writer == nullptr) {
        xmlBufferFree(buffer);
        throw DAVException(500, ERROR_PROTOCOL_REQUEST, "Error initializing xmlWriter");
    }

    int rc = xmlTextWriterStartDocument(writer, NULL, "UTF-8", NULL);
    if (rc >= 0) {
        rc = xmlTextWriterStartElementNS(writer, (const xmlChar *)"d", (const xmlChar *)"error", (const xmlChar *)NS_DAV);
    }
    if (rc >= 0) {
        if (ns == NS_DAV) {
            rc = xmlTextWriterStartElementNS(writer, (const xmlChar *)"d", (const xmlChar *)precondition.c_str(), NULL);
        } else {
            const char * prefix = prefixFor(ns);
            rc = xmlTextWriterStartElementNS(writer, (const xmlChar *)(prefix ? prefix : "x"), (const xmlChar *)precondition.c_str(), (const xmlChar *)ns.c_str());
        }
    }
    if (rc >= 0) {
        rc = xmlTextWriterEndDocument(writer);
    }
    if (rc >= 0) {
        rc = xmlTextWriterFlush(writer);
    }

    string result;
    if (rc >= 0) {
        result.assign((const char *)xmlBufferContent(buffer), (size_t)xmlBufferLength(buffer));
    }
    xmlFreeTextWriter(writer);
    xmlBufferFree(buffer);

    if (rc < 0) {
        throw DAVException(500, ERROR_PROTOCOL_REQUEST, "Error writing xml error body");
    }
    return result;
}

string MultistatusWriter::reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 207: return "Multi-Status";
        case 301: return "Moved Permanently";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 412: return "Precondition Failed";
        case 415: return "Unsupported Media Type";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        case 507: return "Insufficient Storage";
        default: return "Unknown";
    }
}

string MultistatusWriter::statusLine(int status) {
    return "HTTP/1.1 " + to_string(status) + " " + reasonPhrase(status);
}
