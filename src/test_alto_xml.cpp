#include "ForcedAligner.hpp"
#include "LayoutErrors.hpp"
#include "LayoutXml.hpp"
#include "LineCropper.hpp"
#include "LogitsStore.hpp"
#include "WordAlignment.hpp"

#include <iostream>
#include <regex>
#include <string>
#include <vector>

int failures = 0;

void check(bool condition, const std::string &name) {
  std::cout << (condition ? "[PASS] " : "[FAIL] ") << name << std::endl;
  if (!condition) {
    ++failures;
  }
}

bool contains(const std::string &text, const std::string &part) {
  return text.find(part) != std::string::npos;
}

cv::SparseMat peakLogits(const std::vector<int> &peaks, int columns) {
  const int sizes[] = {static_cast<int>(peaks.size()), columns};
  cv::SparseMat logits(2, sizes, CV_32F);
  for (size_t t = 0; t < peaks.size(); ++t) {
    logits.ref<float>(static_cast<int>(t), peaks[t]) = 10.0f;
  }
  return logits;
}

layout::TextLine makeLine(const std::string &id, int baselineY,
                          const std::string &transcription) {
  layout::TextLine line;
  line.id = id;
  line.baseline = {{0, baselineY}, {100, baselineY}};
  line.polygon = {{0, baselineY - 10},
                  {100, baselineY - 10},
                  {100, baselineY + 5},
                  {0, baselineY + 5}};
  line.heights = layout::LineHeights{10.0f, 5.0f};
  line.transcription = transcription;
  return line;
}

layout::Page makePage() {
  layout::Page page;
  page.id = "page.jpg";
  page.width = 200;
  page.height = 300;

  layout::Region first;
  first.id = "r1";
  first.polygon = {{0, 30}, {110, 30}, {110, 70}, {0, 70}};
  first.lines.push_back(makeLine("l1", 50, "ab c"));
  first.lines.push_back(makeLine("l2", 65, "xy z"));
  first.lines.push_back(makeLine("l3", 65, ""));
  layout::TextLine untranscribed = makeLine("l4", 65, "");
  untranscribed.transcription.reset();
  first.lines.push_back(untranscribed);

  layout::Region second;
  second.id = "r2";
  second.polygon = {{50, 80}, {150, 80}, {150, 120}, {50, 120}};

  page.regions.push_back(first);
  page.regions.push_back(second);
  return page;
}

int main() {
  std::cout << "=== Test ALTO XML writing ===" << std::endl << std::endl;

  layout::Page page = makePage();

  // Logits for l1 only: l2 falls back to a single String
  layout::LogitsStore store;
  store.attach("l1", peakLogits({0, 0, 1, 4, 2, 4, 4, 3, 4, 4}, 5), U"ab c");

  layout::CtcForcedAligner aligner;
  layout::BaselineLineCropper cropper;
  layout::LayoutConfig config;
  config.cropHeight = 15;
  config.processingDate = "2024-01-02";
  layout::WordGeometryReconstructor reconstructor(store, aligner, cropper,
                                                  config);

  std::vector<std::string> failedLines;
  const std::string alto =
      layout::toAltoXmlString(page, reconstructor, config, &failedLines);
  std::cout << alto << std::endl;

  check(contains(alto, "standalone=\"yes\""), "standalone declaration");
  check(contains(alto, layout::kAltoXmlNamespace), "ALTO namespace");
  check(contains(alto, "xmlns:xlink=\"http://www.w3.org/1999/xlink\"") &&
            contains(alto, "xmlns:xsi="),
        "xlink and xsi namespaces");
  check(contains(alto, "<MeasurementUnit>pixel</MeasurementUnit>"),
        "measurement unit");
  check(contains(alto, "<processingDateTime>2024-01-02</processingDateTime>"),
        "configured processing date");
  check(contains(alto, "<softwareName>PERO OCR</softwareName>") &&
            contains(alto, "<softwareCreator>Project PERO</softwareCreator>") &&
            contains(alto, "<softwareVersion>v0.1.0</softwareVersion>"),
        "processing software");
  check(contains(alto, "<Page ID=\"id_page.jpg\" PHYSICAL_IMG_NR=\"1\" "
                       "HEIGHT=\"300\" WIDTH=\"200\""),
        "page element");

  check(contains(alto, "<TopMargin HEIGHT=\"30\" WIDTH=\"200\" VPOS=\"0\" "
                       "HPOS=\"0\""),
        "top margin");
  check(contains(alto, "<LeftMargin HEIGHT=\"300\" WIDTH=\"0\" VPOS=\"0\" "
                       "HPOS=\"0\""),
        "left margin");
  check(contains(alto, "<RightMargin HEIGHT=\"300\" WIDTH=\"50\" VPOS=\"0\" "
                       "HPOS=\"150\""),
        "right margin");
  check(contains(alto, "<BottomMargin HEIGHT=\"180\" WIDTH=\"200\" "
                       "VPOS=\"120\" HPOS=\"0\""),
        "bottom margin");
  check(contains(alto, "<PrintSpace HEIGHT=\"90\" WIDTH=\"150\" VPOS=\"30\" "
                       "HPOS=\"0\""),
        "print space envelops all blocks");

  check(contains(alto, "<TextBlock ID=\"r1\" HEIGHT=\"40\" WIDTH=\"110\" "
                       "VPOS=\"30\" HPOS=\"0\""),
        "text block box");
  check(contains(alto, "<TextLine ID=\"l1\" BASELINE=\"50\" VPOS=\"40\" "
                       "HPOS=\"0\" HEIGHT=\"15\" WIDTH=\"100\""),
        "text line box and baseline");
  check(contains(alto, "<String CONTENT=\"ab\" HEIGHT=\"14\" WIDTH=\"19\" "
                       "VPOS=\"40\" HPOS=\"0\""),
        "reconstructed word box");
  check(contains(alto, "<SP WIDTH=\"49\" VPOS=\"40\" HPOS=\"20\""),
        "reconstructed gap box");
  check(contains(alto, "<String CONTENT=\"xy z\" HEIGHT=\"15\" "
                       "WIDTH=\"100\" VPOS=\"55\" HPOS=\"0\""),
        "failed line is written as one String at the line box");
  check(failedLines == std::vector<std::string>({"l2"}),
        "failed line is reported");
  check(!contains(alto, "ID=\"l3\"") && !contains(alto, "ID=\"l4\""),
        "lines without text are skipped");

  layout::Page empty;
  empty.id = "blank.png";
  empty.width = 640;
  empty.height = 480;
  const std::string emptyAlto = layout::toAltoXmlString(empty, reconstructor);
  check(contains(emptyAlto, "<PrintSpace HEIGHT=\"0\" WIDTH=\"0\" "
                            "VPOS=\"480\" HPOS=\"640\""),
        "empty page has a zero-size print space");
  check(std::regex_search(
            emptyAlto,
            std::regex("<processingDateTime>\\d{4}-\\d{2}-\\d{2}<")),
        "processing date defaults to today");

  std::cout << std::endl << "=== Test ALTO XML reading ===" << std::endl
            << std::endl;

  layout::Page reread = layout::readAltoXmlString(alto);
  check(reread.id == "page.jpg", "id_ prefix is removed");
  check(reread.width == 200 && reread.height == 300, "page size");
  check(reread.regions.size() == 2, "blocks become regions");
  check(reread.regions[0].polygon ==
            layout::PointList({{0, 30}, {110, 30}, {110, 70}, {0, 70}}),
        "block becomes a rectangle polygon");
  check(reread.regions[0].lines.size() == 2, "written lines are read");

  const layout::TextLine &line = reread.regions[0].lines[0];
  check(line.id == "l1", "line id");
  check(line.transcription == std::string("ab c"),
        "words are joined with spaces");
  check(line.baseline ==
            layout::PointList({cv::Point(0, 50), cv::Point(100, 50)}),
        "two-point baseline");
  check(line.heights == layout::LineHeights{10.0f, 5.0f},
        "ascent above and descent below the baseline");
  check(line.polygon.size() == 4, "line rectangle");
  check(reread.regions[0].lines[1].transcription == std::string("xy z"),
        "fallback String reads back");

  layout::Page noIds = layout::readAltoXmlString(
      "<alto><Layout><Page ID=\"scan\" HEIGHT=\"10\" WIDTH=\"10\">"
      "<PrintSpace><TextBlock ID=\"b\" HPOS=\"0\" VPOS=\"0\" WIDTH=\"10\" "
      "HEIGHT=\"10\"><TextLine HPOS=\"0\" VPOS=\"0\" WIDTH=\"10\" "
      "HEIGHT=\"10\" BASELINE=\"8\"/></TextBlock></PrintSpace></Page>"
      "</Layout></alto>");
  check(noIds.id == "scan", "page id without prefix is kept");
  check(noIds.regions[0].lines.size() == 1 &&
            !noIds.regions[0].lines[0].id.empty(),
        "line without ID gets one");
  check(noIds.regions[0].lines[0].transcription == std::string(""),
        "line without words has empty text");

  bool rejected = false;
  try {
    layout::readAltoXmlString("<alto><Description/></alto>");
  } catch (const layout::MalformedDocument &e) {
    std::cout << "  MalformedDocument: " << e.what() << std::endl;
    rejected = true;
  }
  check(rejected, "document without Layout is malformed");

  std::cout << std::endl
            << (failures == 0 ? "All tests passed"
                              : std::to_string(failures) + " test(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
