#include "LayoutErrors.hpp"
#include "LayoutXml.hpp"
#include "WordAlignment.hpp"
#include "XmlTree.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace layout {

const char *const kAltoXmlNamespace = "http://www.loc.gov/standards/alto/ns-v2#";

namespace {

const char *const kXlinkNamespace = "http://www.w3.org/1999/xlink";
const char *const kXsiNamespace = "http://www.w3.org/2001/XMLSchema-instance";
const char *const kPageIdPrefix = "id_";

const xmlChar *toXml(const char *text) {
  return reinterpret_cast<const xmlChar *>(text);
}

std::string today() {
  std::time_t now = std::time(nullptr);
  std::tm local = *std::localtime(&now);
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d");
  return out.str();
}

void setBox(xmlNode *element, const cv::Rect &box) {
  xml::setAttribute(element, "HEIGHT", box.height);
  xml::setAttribute(element, "WIDTH", box.width);
  xml::setAttribute(element, "VPOS", box.y);
  xml::setAttribute(element, "HPOS", box.x);
}

cv::Rect readBox(xmlNode *element) {
  return cv::Rect(xml::intAttribute(element, "HPOS"),
                  xml::intAttribute(element, "VPOS"),
                  xml::intAttribute(element, "WIDTH"),
                  xml::intAttribute(element, "HEIGHT"));
}

void writeDescription(xmlNode *root, const LayoutConfig &config) {
  xmlNode *description = xml::addChild(root, "Description");
  xml::addTextChild(description, "MeasurementUnit", "pixel");

  xmlNode *processing = xml::addChild(description, "OCRProcessing");
  xml::setAttribute(processing, "ID", "IdOcr");
  xmlNode *step = xml::addChild(processing, "ocrProcessingStep");
  xml::addTextChild(step, "processingDateTime",
                    config.processingDate.empty() ? today()
                                                  : config.processingDate);

  xmlNode *software = xml::addChild(step, "processingSoftware");
  xml::addTextChild(software, "softwareCreator", config.softwareCreator);
  xml::addTextChild(software, "softwareName", config.softwareName);
  xml::addTextChild(software, "softwareVersion", config.softwareVersion);
}

void writeLine(xmlNode *block, const TextLine &line,
               const WordGeometryReconstructor &reconstructor,
               std::vector<std::string> *failedLines) {
  xmlNode *lineElement = xml::addChild(block, "TextLine");
  xml::setAttribute(lineElement, "ID", line.id);

  const cv::Rect lineBox =
      boundingBox(line.polygon.empty() ? line.baseline : line.polygon);
  const int baseline = line.baseline.empty()
                           ? lineBox.y + lineBox.height
                           : static_cast<int>(averageY(line.baseline));

  xml::setAttribute(lineElement, "BASELINE", baseline);
  xml::setAttribute(lineElement, "VPOS", lineBox.y);
  xml::setAttribute(lineElement, "HPOS", lineBox.x);
  xml::setAttribute(lineElement, "HEIGHT", lineBox.height);
  xml::setAttribute(lineElement, "WIDTH", lineBox.width);

  std::vector<WordBox> words;
  try {
    words = reconstructor.reconstruct(line);
  } catch (const MissingPrerequisite &e) {
    std::cerr << "Warning: No word geometry for line " << line.id << ": "
              << e.what() << std::endl;
    if (failedLines != nullptr) {
      failedLines->push_back(line.id);
    }
    words = {WordBox{*line.transcription, lineBox, false, cv::Rect()}};
  } catch (const AlignmentError &e) {
    std::cerr << "Warning: Alignment failed for line " << line.id << ": "
              << e.what() << std::endl;
    if (failedLines != nullptr) {
      failedLines->push_back(line.id);
    }
    words = {WordBox{*line.transcription, lineBox, false, cv::Rect()}};
  }

  for (const auto &word : words) {
    xmlNode *string = xml::addChild(lineElement, "String");
    xml::setAttribute(string, "CONTENT", word.content);
    setBox(string, word.box);

    if (word.hasGap) {
      xmlNode *space = xml::addChild(lineElement, "SP");
      xml::setAttribute(space, "WIDTH", word.gap.width);
      xml::setAttribute(space, "VPOS", word.gap.y);
      xml::setAttribute(space, "HPOS", word.gap.x);
    }
  }
}

std::string joinedContent(xmlNode *lineElement) {
  std::string text;
  bool first = true;
  for (xmlNode *string : xml::descendants(lineElement, "String")) {
    if (!first) {
      text += " ";
    }
    text += xml::attribute(string, "CONTENT");
    first = false;
  }
  return text;
}

TextLine readLine(xmlNode *element, const std::string &fallbackId) {
  TextLine line;
  line.id = xml::hasAttribute(element, "ID") ? xml::attribute(element, "ID")
                                             : fallbackId;

  const cv::Rect box = readBox(element);
  const int baseline = xml::intAttribute(element, "BASELINE");

  line.polygon = rectanglePolygon(box);
  line.baseline = {cv::Point(box.x, baseline),
                   cv::Point(box.x + box.width, baseline)};
  line.heights = LineHeights{static_cast<float>(baseline - box.y),
                             static_cast<float>(box.y + box.height - baseline)};
  line.transcription = joinedContent(element);
  return line;
}

Page readAltoDocument(xmlDoc *doc) {
  xmlNode *root = xmlDocGetRootElement(doc);
  xmlNode *layoutElement = xml::firstChild(root, "Layout");
  xmlNode *pageElement =
      layoutElement != nullptr ? xml::firstChild(layoutElement, "Page")
                               : nullptr;
  if (pageElement == nullptr) {
    throw MalformedDocument("ALTO XML document has no Layout/Page element");
  }

  Page page;
  page.id = xml::requiredAttribute(pageElement, "ID");
  if (page.id.compare(0, std::string(kPageIdPrefix).size(), kPageIdPrefix) ==
      0) {
    page.id = page.id.substr(std::string(kPageIdPrefix).size());
  }
  page.height = xml::intAttribute(pageElement, "HEIGHT");
  page.width = xml::intAttribute(pageElement, "WIDTH");

  xmlNode *printSpace = xml::firstChild(pageElement, "PrintSpace");
  if (printSpace == nullptr) {
    throw MalformedDocument("ALTO Page " + page.id + " has no PrintSpace");
  }

  for (xmlNode *blockElement : xml::descendants(printSpace, "TextBlock")) {
    Region region;
    region.id = xml::requiredAttribute(blockElement, "ID");
    region.polygon = rectanglePolygon(readBox(blockElement));

    int lineNumber = 0;
    for (xmlNode *lineElement : xml::descendants(blockElement, "TextLine")) {
      region.lines.push_back(readLine(
          lineElement, region.id + "_l" + std::to_string(lineNumber++)));
    }
    page.regions.push_back(region);
  }

  validateIdentifiers(page);
  return page;
}

} // anonymous namespace

std::string toAltoXmlString(const Page &page,
                            const WordGeometryReconstructor &reconstructor,
                            const LayoutConfig &config,
                            std::vector<std::string> *failedLines) {
  xml::DocPtr doc(xmlNewDoc(toXml("1.0")));
  doc->standalone = 1;
  xmlNode *root = xmlNewNode(nullptr, toXml("alto"));
  xmlDocSetRootElement(doc.get(), root);
  xmlSetNs(root, xmlNewNs(root, toXml(kAltoXmlNamespace), nullptr));
  xmlNewNs(root, toXml(kXlinkNamespace), toXml("xlink"));
  xmlNewNs(root, toXml(kXsiNamespace), toXml("xsi"));

  writeDescription(root, config);

  xmlNode *layoutElement = xml::addChild(root, "Layout");
  xmlNode *pageElement = xml::addChild(layoutElement, "Page");
  xml::setAttribute(pageElement, "ID", kPageIdPrefix + page.id);
  xml::setAttribute(pageElement, "PHYSICAL_IMG_NR", 1);
  xml::setAttribute(pageElement, "HEIGHT", page.height);
  xml::setAttribute(pageElement, "WIDTH", page.width);

  // Margins precede the print space but depend on all blocks
  xmlNode *topMargin = xml::addChild(pageElement, "TopMargin");
  xmlNode *leftMargin = xml::addChild(pageElement, "LeftMargin");
  xmlNode *rightMargin = xml::addChild(pageElement, "RightMargin");
  xmlNode *bottomMargin = xml::addChild(pageElement, "BottomMargin");
  xmlNode *printSpace = xml::addChild(pageElement, "PrintSpace");

  int left = page.width;
  int top = page.height;
  int right = page.width;
  int bottom = page.height;
  bool anyRegion = false;

  for (const auto &region : page.regions) {
    const cv::Rect regionBox = boundingBox(region.polygon);
    xmlNode *block = xml::addChild(printSpace, "TextBlock");
    xml::setAttribute(block, "ID", region.id);
    setBox(block, regionBox);

    if (!anyRegion) {
      left = regionBox.x;
      top = regionBox.y;
      right = regionBox.x + regionBox.width;
      bottom = regionBox.y + regionBox.height;
      anyRegion = true;
    } else {
      left = std::min(left, regionBox.x);
      top = std::min(top, regionBox.y);
      right = std::max(right, regionBox.x + regionBox.width);
      bottom = std::max(bottom, regionBox.y + regionBox.height);
    }

    for (const auto &line : region.lines) {
      if (!line.transcription || line.transcription->empty()) {
        continue;
      }
      writeLine(block, line, reconstructor, failedLines);
    }
  }

  const cv::Rect space(left, top, right - left, bottom - top);

  setBox(topMargin, cv::Rect(0, 0, page.width, space.y));
  setBox(leftMargin, cv::Rect(0, 0, space.x, page.height));
  setBox(rightMargin, cv::Rect(space.x + space.width, 0,
                               page.width - (space.x + space.width),
                               page.height));
  setBox(bottomMargin, cv::Rect(0, space.y + space.height, page.width,
                                page.height - (space.y + space.height)));
  setBox(printSpace, space);

  return xml::toString(doc.get());
}

void writeAltoXml(const Page &page,
                  const WordGeometryReconstructor &reconstructor,
                  const std::string &path, const LayoutConfig &config,
                  std::vector<std::string> *failedLines) {
  xml::writeFile(path,
                 toAltoXmlString(page, reconstructor, config, failedLines));
}

Page readAltoXml(const std::string &path) {
  xml::DocPtr doc = xml::parseFile(path);
  return readAltoDocument(doc.get());
}

Page readAltoXmlString(const std::string &xmlText) {
  xml::DocPtr doc = xml::parseString(xmlText);
  return readAltoDocument(doc.get());
}

} // namespace layout
