#include "LayoutErrors.hpp"
#include "LayoutXml.hpp"
#include "XmlTree.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>

namespace layout {

const char *const kPageXmlNamespace =
    "http://schema.primaresearch.org/PAGE/gts/pagecontent/2013-07-15";

namespace {

const char *const kHeightsV2 = "heights_v2";

double parseNumber(const std::string &text, const std::string &context) {
  const char *begin = text.c_str();
  char *end = nullptr;
  double value = std::strtod(begin, &end);
  if (end == begin || *end != '\0') {
    throw MalformedDocument("Invalid number \"" + text + "\" in " + context);
  }
  return value;
}

/**
 * @brief Coordinates of a Coords or Baseline element
 *
 * Reads the points attribute, or Point children when it is missing.
 */
PointList readCoords(xmlNode *coords) {
  if (xml::hasAttribute(coords, "points")) {
    return stringToPoints(xml::attribute(coords, "points"));
  }

  PointList points;
  for (xmlNode *point : xml::children(coords, "Point")) {
    double x = parseNumber(xml::requiredAttribute(point, "x"), "Point x");
    double y = parseNumber(xml::requiredAttribute(point, "y"), "Point y");
    points.emplace_back(static_cast<int>(std::lround(x)),
                        static_cast<int>(std::lround(y)));
  }
  return points;
}

/**
 * @brief Text of a TextEquiv/Unicode pair
 *
 * A TextEquiv without text yields an empty transcription, not a missing one.
 */
std::optional<std::string> readTextEquiv(xmlNode *element) {
  xmlNode *textEquiv = xml::firstChild(element, "TextEquiv");
  if (textEquiv == nullptr) {
    return std::nullopt;
  }
  xmlNode *unicode = xml::firstChild(textEquiv, "Unicode");
  if (unicode == nullptr) {
    return std::string();
  }
  return xml::textContent(unicode);
}

/// The TextRegion a line belongs to (its nearest TextRegion ancestor)
const xmlNode *owningRegion(const xmlNode *line) {
  for (const xmlNode *node = line->parent; node != nullptr;
       node = node->parent) {
    if (xml::isElement(node, "TextRegion")) {
      return node;
    }
  }
  return nullptr;
}

TextLine readLine(xmlNode *element) {
  TextLine line;
  line.id = xml::requiredAttribute(element, "id");

  if (xml::hasAttribute(element, "custom")) {
    line.heights = parseHeights(xml::attribute(element, "custom"));
  }

  if (xmlNode *baseline = xml::firstChild(element, "Baseline")) {
    line.baseline = readCoords(baseline);
  }
  if (xmlNode *coords = xml::firstChild(element, "Coords")) {
    line.polygon = readCoords(coords);
  }
  line.transcription = readTextEquiv(element);
  return line;
}

Region readRegion(xmlNode *element) {
  Region region;
  region.id = xml::requiredAttribute(element, "id");

  xmlNode *coords = xml::firstChild(element, "Coords");
  if (coords == nullptr) {
    throw MalformedDocument("TextRegion " + region.id + " has no Coords");
  }
  region.polygon = readCoords(coords);
  region.transcription = readTextEquiv(element);

  for (xmlNode *lineElement : xml::descendants(element, "TextLine")) {
    if (owningRegion(lineElement) == element) {
      region.lines.push_back(readLine(lineElement));
    }
  }
  return region;
}

Page readPageDocument(xmlDoc *doc) {
  xmlNode *root = xmlDocGetRootElement(doc);
  xmlNode *pageElement = xml::firstChild(root, "Page");
  if (pageElement == nullptr) {
    throw MalformedDocument("PAGE XML document has no Page element");
  }

  Page page;
  page.id = xml::requiredAttribute(pageElement, "imageFilename");
  page.height = xml::intAttribute(pageElement, "imageHeight");
  page.width = xml::intAttribute(pageElement, "imageWidth");

  for (xmlNode *regionElement : xml::descendants(pageElement, "TextRegion")) {
    page.regions.push_back(readRegion(regionElement));
  }

  validateIdentifiers(page);
  return page;
}

std::string formatHeightValue(float value) {
  std::ostringstream shortForm;
  shortForm << std::fixed << std::setprecision(1) << value;
  if (std::strtof(shortForm.str().c_str(), nullptr) == value) {
    return shortForm.str();
  }

  std::ostringstream exactForm;
  exactForm << std::setprecision(std::numeric_limits<float>::max_digits10)
            << value;
  return exactForm.str();
}

} // anonymous namespace

std::optional<LineHeights> parseHeights(const std::string &custom) {
  if (custom.find(kHeightsV2) != std::string::npos) {
    std::istringstream words(custom);
    std::string word;
    std::optional<LineHeights> heights;

    while (words >> word) {
      if (word.find(kHeightsV2) == std::string::npos) {
        continue;
      }
      size_t open = word.find('[');
      size_t close = word.find(']', open);
      if (open == std::string::npos || close == std::string::npos) {
        throw MalformedDocument("Invalid heights tag \"" + word + "\"");
      }

      std::vector<double> values;
      std::istringstream list(word.substr(open + 1, close - open - 1));
      std::string item;
      while (std::getline(list, item, ',')) {
        values.push_back(parseNumber(item, "heights tag"));
      }
      if (values.size() != 2) {
        throw MalformedDocument("Heights tag \"" + word +
                                "\" must hold two values");
      }
      heights = LineHeights{static_cast<float>(values[0]),
                            static_cast<float>(values[1])};
    }
    return heights;
  }

  if (custom.find("heights") == std::string::npos) {
    return std::nullopt;
  }

  // Legacy encodings: the digit runs of the attribute are the values
  static const std::regex digits("\\d+");
  std::vector<float> numbers;
  for (std::sregex_iterator it(custom.begin(), custom.end(), digits), end;
       it != end; ++it) {
    numbers.push_back(std::stof(it->str()));
  }

  switch (numbers.size()) {
  case 4:
    return LineHeights{numbers[0], numbers[2]};
  case 3:
    return LineHeights{numbers[1], numbers[2] - numbers[0]};
  case 2:
    return LineHeights{numbers[0], numbers[1]};
  default:
    throw MalformedDocument("Unsupported legacy heights \"" + custom +
                            "\" with " + std::to_string(numbers.size()) +
                            " values");
  }
}

std::string formatHeights(const LineHeights &heights) {
  return std::string(kHeightsV2) + ":[" + formatHeightValue(heights.ascent) +
         "," + formatHeightValue(heights.descent) + "]";
}

Page readPageXml(const std::string &path) {
  xml::DocPtr doc = xml::parseFile(path);
  return readPageDocument(doc.get());
}

Page readPageXmlString(const std::string &xmlText) {
  xml::DocPtr doc = xml::parseString(xmlText);
  return readPageDocument(doc.get());
}

std::string toPageXmlString(const Page &page) {
  xml::DocPtr doc(xmlNewDoc(reinterpret_cast<const xmlChar *>("1.0")));
  xmlNode *root =
      xmlNewNode(nullptr, reinterpret_cast<const xmlChar *>("PcGts"));
  xmlDocSetRootElement(doc.get(), root);
  xmlNs *ns = xmlNewNs(
      root, reinterpret_cast<const xmlChar *>(kPageXmlNamespace), nullptr);
  xmlSetNs(root, ns);

  xmlNode *pageElement = xml::addChild(root, "Page");
  xml::setAttribute(pageElement, "imageFilename", page.id);
  xml::setAttribute(pageElement, "imageWidth", page.width);
  xml::setAttribute(pageElement, "imageHeight", page.height);

  for (const auto &region : page.regions) {
    xmlNode *regionElement = xml::addChild(pageElement, "TextRegion");
    xml::setAttribute(regionElement, "id", region.id);
    xmlNode *coords = xml::addChild(regionElement, "Coords");
    xml::setAttribute(coords, "points", pointsToString(region.polygon));

    for (const auto &line : region.lines) {
      xmlNode *lineElement = xml::addChild(regionElement, "TextLine");
      xml::setAttribute(lineElement, "id", line.id);
      if (line.heights) {
        xml::setAttribute(lineElement, "custom", formatHeights(*line.heights));
      }

      xmlNode *lineCoords = xml::addChild(lineElement, "Coords");
      if (!line.polygon.empty()) {
        xml::setAttribute(lineCoords, "points", pointsToString(line.polygon));
      }
      if (!line.baseline.empty()) {
        xmlNode *baseline = xml::addChild(lineElement, "Baseline");
        xml::setAttribute(baseline, "points", pointsToString(line.baseline));
      }
      if (line.transcription) {
        xmlNode *textEquiv = xml::addChild(lineElement, "TextEquiv");
        xml::addTextChild(textEquiv, "Unicode", *line.transcription);
      }
    }

    if (region.transcription) {
      xmlNode *textEquiv = xml::addChild(regionElement, "TextEquiv");
      xml::addTextChild(textEquiv, "Unicode", *region.transcription);
    }
  }

  return xml::toString(doc.get());
}

void writePageXml(const Page &page, const std::string &path) {
  xml::writeFile(path, toPageXmlString(page));
}

} // namespace layout
