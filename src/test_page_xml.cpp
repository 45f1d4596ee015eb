#include "LayoutErrors.hpp"
#include "LayoutXml.hpp"

#include <iostream>
#include <string>

int failures = 0;

void check(bool condition, const std::string &name) {
  std::cout << (condition ? "[PASS] " : "[FAIL] ") << name << std::endl;
  if (!condition) {
    ++failures;
  }
}

bool malformed(const std::string &xml) {
  try {
    layout::readPageXmlString(xml);
  } catch (const layout::MalformedDocument &e) {
    std::cout << "  MalformedDocument: " << e.what() << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cout << "  unexpected exception: " << e.what() << std::endl;
  }
  return false;
}

const char *const kSample = R"(<?xml version="1.0" encoding="UTF-8"?>
<pc:PcGts xmlns:pc="http://schema.primaresearch.org/PAGE/gts/pagecontent/2019-07-15">
  <pc:Page imageFilename="scan_001.jpg" imageWidth="1200" imageHeight="800">
    <pc:TextRegion id="r1">
      <pc:Coords points="10,10 500.4,10 500,200.6 10,200"/>
      <pc:TextLine id="r1-l1" custom="heights_v2:[12.5,7.25]">
        <pc:Coords points="10,20 500,20 500,40 10,40"/>
        <pc:Baseline points="10,35 500,35"/>
        <pc:TextEquiv><pc:Unicode>Hello &amp; world</pc:Unicode></pc:TextEquiv>
      </pc:TextLine>
      <pc:TextLine id="r1-l2" custom="heights: [10, 0, 10, 30]">
        <pc:Baseline points="10,75 500,75"/>
        <pc:TextEquiv><pc:Unicode/></pc:TextEquiv>
      </pc:TextLine>
      <pc:TextLine id="r1-l3" custom="readingOrder heights [5,15,25]">
        <pc:TextEquiv/>
      </pc:TextLine>
      <pc:TextLine id="r1-l4" custom="heights {12,18}"/>
      <pc:TextRegion id="r1-nested">
        <pc:Coords>
          <pc:Point x="20" y="100"/>
          <pc:Point x="80.7" y="100"/>
          <pc:Point x="80" y="150.2"/>
        </pc:Coords>
        <pc:TextLine id="nested-l1"/>
      </pc:TextRegion>
      <pc:TextEquiv><pc:Unicode>Region text</pc:Unicode></pc:TextEquiv>
    </pc:TextRegion>
  </pc:Page>
</pc:PcGts>
)";

int main() {
  std::cout << "=== Test PAGE XML reading ===" << std::endl << std::endl;

  layout::Page page = layout::readPageXmlString(kSample);
  check(page.id == "scan_001.jpg", "page id from imageFilename");
  check(page.width == 1200 && page.height == 800, "page size");
  check(page.regions.size() == 2, "nested regions are read");
  check(page.regions[0].id == "r1" && page.regions[1].id == "r1-nested",
        "regions in document order");
  check(page.regions[0].polygon[1] == cv::Point(500, 10) &&
            page.regions[0].polygon[2] == cv::Point(500, 201),
        "real coordinates are rounded");
  check(page.regions[0].transcription == std::string("Region text"),
        "region transcription");
  check(page.regions[1].polygon.size() == 3 &&
            page.regions[1].polygon[1] == cv::Point(81, 100),
        "Point children");

  const auto &lines = page.regions[0].lines;
  check(lines.size() == 4, "lines of a nested region stay there");
  check(page.regions[1].lines.size() == 1 &&
            page.regions[1].lines[0].id == "nested-l1",
        "nested region owns its line");

  check(lines[0].heights == layout::LineHeights{12.5f, 7.25f},
        "heights_v2 tag");
  check(lines[0].baseline.size() == 2 && lines[0].polygon.size() == 4,
        "baseline and polygon");
  check(lines[0].transcription == std::string("Hello & world"),
        "transcription is unescaped");
  check(lines[1].heights == layout::LineHeights{10.0f, 10.0f},
        "legacy heights with four numbers");
  check(lines[1].polygon.empty(), "line without Coords has no polygon");
  check(lines[1].transcription == std::string(""),
        "empty Unicode gives empty transcription");
  check(lines[2].heights == layout::LineHeights{15.0f, 20.0f},
        "legacy heights with three numbers");
  check(lines[2].transcription == std::string(""),
        "TextEquiv without Unicode gives empty transcription");
  check(lines[3].heights == layout::LineHeights{12.0f, 18.0f},
        "legacy heights with two numbers");
  check(!lines[3].transcription, "no TextEquiv means no transcription");
  check(!page.regions[1].lines[0].heights, "no custom means no heights");

  std::cout << std::endl << "=== Test heights encoding ===" << std::endl
            << std::endl;

  check(layout::formatHeights({12.0f, 18.0f}) == "heights_v2:[12.0,18.0]",
        "one decimal when exact");
  const layout::LineHeights third{1.0f / 3.0f, 2.1f};
  std::cout << "  " << layout::formatHeights(third) << std::endl;
  check(layout::parseHeights(layout::formatHeights(third)) == third,
        "heights round-trip exactly");
  check(!layout::parseHeights("readingOrder {index:0;}"),
        "no heights in custom");
  check(layout::parseHeights("structure {type:x;} heights_v2:[3.5,4.0]") ==
            layout::LineHeights{3.5f, 4.0f},
        "heights_v2 among other tags");

  bool rejected = false;
  try {
    layout::parseHeights("heights [1,2,3,4,5]");
  } catch (const layout::MalformedDocument &) {
    rejected = true;
  }
  check(rejected, "legacy heights with five numbers are malformed");

  std::cout << std::endl << "=== Test PAGE XML round trip ===" << std::endl
            << std::endl;

  page.regions[0].lines[0].heights = third;
  page.regions[0].lines[0].transcription = std::string("a < b > \"c\" ž");
  const std::string written = layout::toPageXmlString(page);
  check(written.find(layout::kPageXmlNamespace) != std::string::npos,
        "PAGE namespace is written");

  layout::Page reread = layout::readPageXmlString(written);
  check(reread.id == page.id && reread.width == page.width &&
            reread.height == page.height,
        "page attributes");
  check(reread.regions.size() == page.regions.size(), "region count");

  bool same = true;
  for (size_t r = 0; r < page.regions.size(); ++r) {
    const layout::Region &a = page.regions[r];
    const layout::Region &b = reread.regions[r];
    same = same && a.id == b.id && a.polygon == b.polygon &&
           a.transcription == b.transcription &&
           a.lines.size() == b.lines.size();
    for (size_t l = 0; same && l < a.lines.size(); ++l) {
      const layout::TextLine &x = a.lines[l];
      const layout::TextLine &y = b.lines[l];
      same = x.id == y.id && x.baseline == y.baseline &&
             x.polygon == y.polygon && x.heights == y.heights &&
             x.transcription == y.transcription;
    }
  }
  check(same, "regions and lines survive the round trip");

  std::cout << std::endl << "=== Test malformed PAGE XML ===" << std::endl
            << std::endl;

  check(malformed("<PcGts><Page"), "not well-formed");
  check(malformed("<PcGts></PcGts>"), "no Page element");
  check(malformed("<PcGts><Page imageFilename=\"a\" imageHeight=\"10\"/>"
                  "</PcGts>"),
        "missing imageWidth");
  check(malformed("<PcGts><Page imageFilename=\"a\" imageWidth=\"x\" "
                  "imageHeight=\"10\"/></PcGts>"),
        "non-numeric imageWidth");
  check(malformed("<PcGts><Page imageFilename=\"a\" imageWidth=\"10\" "
                  "imageHeight=\"10\"><TextRegion id=\"r\"/></Page></PcGts>"),
        "region without Coords");
  check(malformed("<PcGts><Page imageFilename=\"a\" imageWidth=\"10\" "
                  "imageHeight=\"10\"><TextRegion id=\"r\"><Coords "
                  "points=\"1,a\"/></TextRegion></Page></PcGts>"),
        "bad coordinates");
  check(malformed("<PcGts><Page imageFilename=\"a\" imageWidth=\"10\" "
                  "imageHeight=\"10\"><TextRegion id=\"r\"><Coords "
                  "points=\"0,0 1,1\"/><TextLine id=\"l\"/><TextLine "
                  "id=\"l\"/></TextRegion></Page></PcGts>"),
        "duplicate line id");
  check(malformed("<PcGts><Page imageFilename=\"a\" imageWidth=\"10\" "
                  "imageHeight=\"10\"><TextRegion id=\"r\"><Coords "
                  "points=\"0,0 1,1\"/><TextLine id=\"l\" custom=\"heights "
                  "1 2 3 4 5\"/></TextRegion></Page></PcGts>"),
        "unsupported legacy heights");

  std::cout << std::endl
            << (failures == 0 ? "All tests passed"
                              : std::to_string(failures) + " test(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
