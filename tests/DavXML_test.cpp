#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "davbridge/dav_exception.hpp"
#include "davbridge/dav_xml.hpp"
#include "davbridge/multistatus_writer.hpp"

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(DavXML, EvaluatesNamespacedXPath) {
    DavXML xml(
        "<?xml version=\"1.0\"?>"
        "<D:propfind xmlns:D=\"DAV:\" xmlns:cal=\"urn:ietf:params:xml:ns:caldav\">"
        "<D:prop><D:displayname/><cal:calendar-data/></D:prop>"
        "</D:propfind>", "/calendars/");

    // prefixes in the document do not matter, the registered ones do
    std::vector<std::string> names;
    xml.evaluateXPath("/d:propfind/d:prop/*", [&](xmlNodePtr node) {
        names.push_back(DavXML::nodeNamespace(node) + " " + DavXML::nodeName(node));
    });
    EXPECT_THAT(names, ElementsAre("DAV: displayname", "urn:ietf:params:xml:ns:caldav calendar-data"));

    EXPECT_EQ(DavXML::nodeName(xml.root()), "propfind");
    EXPECT_EQ(DavXML::childElements(xml.root()).size(), 1u);
}

TEST(DavXML, ReadsContentAndAttributes) {
    DavXML xml(
        "<C:comp-filter xmlns:C=\"urn:ietf:params:xml:ns:caldav\" name=\"VCALENDAR\">"
        "  <C:comp-filter name=\"VTODO\"><C:time-range start=\"20240601T000000Z\"/></C:comp-filter>"
        "  <C:text>a &amp; b</C:text>"
        "</C:comp-filter>", "/calendars/p1/");

    EXPECT_EQ(DavXML::nodeAttribute(xml.root(), "name"), "VCALENDAR");
    EXPECT_EQ(DavXML::nodeAttribute(xml.root(), "missing"), "");
    EXPECT_EQ(xml.nodeContentAtXPath("//C:text"), "a & b");

    auto children = DavXML::childElements(xml.root());
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(DavXML::nodeAttribute(children[0], "name"), "VTODO");

    std::string start;
    xml.evaluateXPath("C:time-range", [&](xmlNodePtr node) {
        start = DavXML::nodeAttribute(node, "start");
    }, children[0]);
    EXPECT_EQ(start, "20240601T000000Z");
}

TEST(DavXML, MalformedDocumentIsBadRequest) {
    try {
        DavXML xml("<d:propfind xmlns:d=\"DAV:\">", "/");
        FAIL() << "expected a parse failure";
    } catch (DAVException & ex) {
        EXPECT_EQ(ex.status, 400);
    }
    EXPECT_THROW(DavXML("", "/"), DAVException);
}

TEST(MultistatusWriter, WritesResponsesAndSyncToken) {
    MultistatusWriter writer;
    DAVProperty name(NS_DAV, "displayname");
    name.text = "Website & Co";
    DAVProperty type(NS_DAV, "resourcetype");
    type.children.push_back(DAVProperty(NS_DAV, "collection"));
    type.children.push_back(DAVProperty(NS_CALDAV, "calendar"));

    writer.startResponse("/calendars/p1/");
    writer.writePropstat({name, type}, 200);
    writer.writePropstat({DAVProperty("urn:example", "color")}, 404);
    writer.endResponse();
    writer.writeStatusResponse("/calendars/p1/gone.ics", 404);
    writer.writeSyncToken("http://davbridge.local/ns/sync/abc");
    std::string body = writer.finish();

    DavXML xml(body, "test");
    EXPECT_EQ(xml.nodeContentAtXPath("/d:multistatus/d:response[1]/d:propstat[1]/d:prop/d:displayname"), "Website & Co");
    EXPECT_EQ(xml.nodeContentAtXPath("/d:multistatus/d:response[1]/d:propstat[2]/d:status"), "HTTP/1.1 404 Not Found");
    int calendarTypes = 0;
    xml.evaluateXPath("//d:resourcetype/C:calendar", [&](xmlNodePtr) { calendarTypes++; });
    EXPECT_EQ(calendarTypes, 1);
    EXPECT_EQ(xml.nodeContentAtXPath("/d:multistatus/d:response[2]/d:status"), "HTTP/1.1 404 Not Found");
    EXPECT_EQ(xml.nodeContentAtXPath("/d:multistatus/d:sync-token"), "http://davbridge.local/ns/sync/abc");
    EXPECT_THAT(body, HasSubstr("xmlns:x=\"urn:example\""));
}

TEST(MultistatusWriter, EmptyPropstatsAreOmitted) {
    MultistatusWriter writer;
    writer.startResponse("/");
    writer.writePropstat({}, 404);
    std::string body = writer.finish();
    EXPECT_THAT(body, testing::Not(HasSubstr("propstat")));
    EXPECT_THAT(body, HasSubstr("<d:href>/</d:href>"));
}

TEST(MultistatusWriter, ErrorBodyNamesPrecondition) {
    std::string dav = MultistatusWriter::errorBody("valid-sync-token", NS_DAV);
    DavXML davXML(dav, "test");
    EXPECT_EQ(DavXML::nodeName(xmlFirstElementChild(davXML.root())), "valid-sync-token");

    std::string caldav = MultistatusWriter::errorBody("valid-filter", NS_CALDAV);
    DavXML caldavXML(caldav, "test");
    xmlNodePtr condition = xmlFirstElementChild(caldavXML.root());
    EXPECT_EQ(DavXML::nodeNamespace(condition), NS_CALDAV);
    EXPECT_EQ(DavXML::nodeName(condition), "valid-filter");
}

TEST(MultistatusWriter, StatusLines) {
    EXPECT_EQ(MultistatusWriter::statusLine(207), "HTTP/1.1 207 Multi-Status");
    EXPECT_EQ(MultistatusWriter::statusLine(403), "HTTP/1.1 403 Forbidden");
}
