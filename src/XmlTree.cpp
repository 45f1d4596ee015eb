#include "XmlTree.hpp"
#include "LayoutErrors.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace layout {
namespace xml {

namespace {

const xmlChar *toXml(const char *text) {
  return reinterpret_cast<const xmlChar *>(text);
}

void collectDescendants(xmlNode *node, const char *name,
                        std::vector<xmlNode *> &result) {
  for (xmlNode *child = node->children; child != nullptr;
       child = child->next) {
    if (isElement(child, name)) {
      result.push_back(child);
    }
    if (child->type == XML_ELEMENT_NODE) {
      collectDescendants(child, name, result);
    }
  }
}

} // anonymous namespace

DocPtr parseString(const std::string &xml) {
  xmlDoc *doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                              nullptr, nullptr,
                              XML_PARSE_NONET | XML_PARSE_NOBLANKS);
  if (doc == nullptr || xmlDocGetRootElement(doc) == nullptr) {
    if (doc != nullptr) {
      xmlFreeDoc(doc);
    }
    throw MalformedDocument("Failed to parse XML document");
  }
  return DocPtr(doc);
}

DocPtr parseFile(const std::string &path) {
  xmlDoc *doc = xmlReadFile(path.c_str(), nullptr,
                            XML_PARSE_NONET | XML_PARSE_NOBLANKS);
  if (doc == nullptr || xmlDocGetRootElement(doc) == nullptr) {
    if (doc != nullptr) {
      xmlFreeDoc(doc);
    }
    throw MalformedDocument("Failed to parse XML file: " + path);
  }
  return DocPtr(doc);
}

std::string toString(xmlDoc *doc) {
  xmlChar *buffer = nullptr;
  int size = 0;
  xmlDocDumpFormatMemoryEnc(doc, &buffer, &size, "UTF-8", 1);
  if (buffer == nullptr) {
    throw LayoutError("Failed to serialize XML document");
  }
  std::string result(reinterpret_cast<const char *>(buffer),
                     static_cast<size_t>(size));
  xmlFree(buffer);
  return result;
}

void writeFile(const std::string &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    throw LayoutError("Failed to open output file: " + path);
  }
  out << content;
  if (!out) {
    throw LayoutError("Failed to write output file: " + path);
  }
}

bool isElement(const xmlNode *node, const char *name) {
  return node != nullptr && node->type == XML_ELEMENT_NODE &&
         xmlStrcmp(node->name, toXml(name)) == 0;
}

std::vector<xmlNode *> children(xmlNode *node, const char *name) {
  std::vector<xmlNode *> result;
  for (xmlNode *child = node->children; child != nullptr;
       child = child->next) {
    if (isElement(child, name)) {
      result.push_back(child);
    }
  }
  return result;
}

xmlNode *firstChild(xmlNode *node, const char *name) {
  for (xmlNode *child = node->children; child != nullptr;
       child = child->next) {
    if (isElement(child, name)) {
      return child;
    }
  }
  return nullptr;
}

std::vector<xmlNode *> descendants(xmlNode *node, const char *name) {
  std::vector<xmlNode *> result;
  collectDescendants(node, name, result);
  return result;
}

bool hasAttribute(xmlNode *node, const char *name) {
  return xmlHasProp(node, toXml(name)) != nullptr;
}

std::string attribute(xmlNode *node, const char *name) {
  xmlChar *value = xmlGetProp(node, toXml(name));
  if (value == nullptr) {
    return std::string();
  }
  std::string result(reinterpret_cast<const char *>(value));
  xmlFree(value);
  return result;
}

std::string requiredAttribute(xmlNode *node, const char *name) {
  if (!hasAttribute(node, name)) {
    throw MalformedDocument(std::string("Element ") +
                            reinterpret_cast<const char *>(node->name) +
                            " (line " + std::to_string(xmlGetLineNo(node)) +
                            ") has no " + name + " attribute");
  }
  return attribute(node, name);
}

int intAttribute(xmlNode *node, const char *name) {
  std::string text = requiredAttribute(node, name);
  try {
    size_t used = 0;
    double value = std::stod(text, &used);
    if (used != text.size()) {
      throw std::invalid_argument(text);
    }
    return static_cast<int>(std::lround(value));
  } catch (const std::logic_error &) {
    throw MalformedDocument(std::string("Attribute ") + name + "=\"" + text +
                            "\" is not a number");
  }
}

std::string textContent(xmlNode *node) {
  xmlChar *content = xmlNodeGetContent(node);
  if (content == nullptr) {
    return std::string();
  }
  std::string result(reinterpret_cast<const char *>(content));
  xmlFree(content);
  return result;
}

xmlNode *addChild(xmlNode *parent, const char *name) {
  return xmlNewChild(parent, parent->ns, toXml(name), nullptr);
}

xmlNode *addTextChild(xmlNode *parent, const char *name,
                      const std::string &text) {
  return xmlNewTextChild(parent, parent->ns, toXml(name),
                         toXml(text.c_str()));
}

void setAttribute(xmlNode *node, const char *name, const std::string &value) {
  xmlSetProp(node, toXml(name), toXml(value.c_str()));
}

void setAttribute(xmlNode *node, const char *name, int value) {
  setAttribute(node, name, std::to_string(value));
}

} // namespace xml
} // namespace layout
