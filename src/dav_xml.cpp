#include "davbridge/dav_xml.hpp"
#include "davbridge/constants.hpp"
#include "davbridge/dav_exception.hpp"

#include <memory>

using namespace std;

DavXML::DavXML(string xml, string url):
    xpathContext(nullptr)
{
    doc = xmlReadMemory(xml.c_str(), (int)xml.size(), url.c_str(), "utf-8", XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    if (doc == nullptr) {
        throw DAVException(400, ERROR_PROTOCOL_REQUEST, "Unable to parse request XML for " + url);
    }
    if (xmlDocGetRootElement(doc) == nullptr) {
        xmlFreeDoc(doc);
        throw DAVException(400, ERROR_PROTOCOL_REQUEST, "Request XML for " + url + " has no root element");
    }

    xpathContext = xmlXPathNewContext(doc);
    if (xpathContext == nullptr) {
        xmlFreeDoc(doc);
        throw DAVException(500, ERROR_PROTOCOL_REQUEST, "Unable to create XPath context");
    }
    xmlXPathRegisterNs(xpathContext, (const xmlChar *)"d", (const xmlChar *)NS_DAV);
    xmlXPathRegisterNs(xpathContext, (const xmlChar *)"C", (const xmlChar *)NS_CALDAV);
    xmlXPathRegisterNs(xpathContext, (const xmlChar *)"cs", (const xmlChar *)NS_CALSERVER);
}

DavXML::~DavXML() noexcept // nothrow
{
    if (xpathContext != nullptr) {
        xmlXPathFreeContext(xpathContext);
    }
    if (doc != nullptr) {
        xmlFreeDoc(doc);
    }
}

xmlNodePtr DavXML::root() const {
    return xmlDocGetRootElement(doc);
}

void DavXML::evaluateXPath(string expr, std::function<void(xmlNodePtr)> yieldBlock, xmlNodePtr withinNode)
{
    xpathContext->node = withinNode != nullptr ? withinNode : xmlDocGetRootElement(doc);

    std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)> xpathObj(
        xmlXPathEvalExpression((const xmlChar *)expr.c_str(), xpathContext), xmlXPathFreeObject);
    if (xpathObj == nullptr) {
        throw DAVException(500, ERROR_PROTOCOL_REQUEST, "Unable to evaluate xpath expression " + expr);
    }

    // the callback may throw; the object is released either way
    auto nodes = xpathObj->nodesetval;
    if (nodes != nullptr) {
        for (int i = 0; i < nodes->nodeNr; ++i) {
            xmlNodePtr cur = nodes->nodeTab[i];
            if (cur->type == XML_NAMESPACE_DECL) {
                yieldBlock((xmlNodePtr)cur->next);
            } else {
                yieldBlock(cur);
            }
        }
    }
}

string DavXML::nodeContentAtXPath(string expr, xmlNodePtr withinNode) {
    string result = "";
    evaluateXPath(expr, ([&](xmlNodePtr node) {
        result += nodeContent(node);
    }), withinNode);
    return result;
}

string DavXML::nodeName(xmlNodePtr node) {
    if (node == nullptr || node->name == nullptr) {
        return "";
    }
    return string((const char *)node->name);
}

string DavXML::nodeNamespace(xmlNodePtr node) {
    if (node == nullptr || node->ns == nullptr || node->ns->href == nullptr) {
        return "";
    }
    return string((const char *)node->ns->href);
}

string DavXML::nodeContent(xmlNodePtr node) {
    if (node == nullptr) {
        return "";
    }
    xmlChar * content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return "";
    }
    string result((const char *)content);
    xmlFree(content);
    return result;
}

string DavXML::nodeAttribute(xmlNodePtr node, const char * name) {
    if (node == nullptr) {
        return "";
    }
    xmlChar * value = xmlGetProp(node, (const xmlChar *)name);
    if (value == nullptr) {
        return "";
    }
    string result((const char *)value);
    xmlFree(value);
    return result;
}

vector<xmlNodePtr> DavXML::childElements(xmlNodePtr node) {
    vector<xmlNodePtr> children;
    if (node == nullptr) {
        return children;
    }
    for (xmlNodePtr cur = node->children; cur != nullptr; cur = cur->next) {
        if (cur->type == XML_ELEMENT_NODE) {
            children.push_back(cur);
        }
    }
    return children;
}
