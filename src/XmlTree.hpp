#ifndef LAYOUT_XML_TREE_HPP
#define LAYOUT_XML_TREE_HPP

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <memory>
#include <string>
#include <vector>

namespace layout {
namespace xml {

struct DocDeleter {
  void operator()(xmlDoc *doc) const { xmlFreeDoc(doc); }
};

/// Owning pointer to a libxml2 document
using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;

/**
 * @brief Parse a document from memory
 * @throws MalformedDocument if the text is not well-formed XML
 */
DocPtr parseString(const std::string &xml);

/**
 * @brief Parse a document from a file
 * @throws MalformedDocument if the file cannot be read or parsed
 */
DocPtr parseFile(const std::string &path);

/**
 * @brief Serialize a document as indented UTF-8 text
 */
std::string toString(xmlDoc *doc);

/**
 * @brief Write text to a file
 * @throws LayoutError if the file cannot be written
 */
void writeFile(const std::string &path, const std::string &content);

/// True if @p node is an element with local name @p name (any namespace)
bool isElement(const xmlNode *node, const char *name);

/// Direct child elements with local name @p name
std::vector<xmlNode *> children(xmlNode *node, const char *name);

/// First direct child element with local name @p name, or nullptr
xmlNode *firstChild(xmlNode *node, const char *name);

/// Descendant elements with local name @p name, in document order
std::vector<xmlNode *> descendants(xmlNode *node, const char *name);

/// True if the element has the attribute (namespace ignored)
bool hasAttribute(xmlNode *node, const char *name);

/// Attribute value, empty if the attribute is missing
std::string attribute(xmlNode *node, const char *name);

/**
 * @brief Attribute value of a required attribute
 * @throws MalformedDocument if the attribute is missing
 */
std::string requiredAttribute(xmlNode *node, const char *name);

/**
 * @brief Integer value of a required attribute
 * @throws MalformedDocument if the attribute is missing or not a number
 */
int intAttribute(xmlNode *node, const char *name);

/// Concatenated text content of an element, empty if it has none
std::string textContent(xmlNode *node);

/// Create a child element in the namespace of @p parent
xmlNode *addChild(xmlNode *parent, const char *name);

/// Create a child element holding escaped text
xmlNode *addTextChild(xmlNode *parent, const char *name,
                      const std::string &text);

/// Set (or replace) an attribute
void setAttribute(xmlNode *node, const char *name, const std::string &value);
void setAttribute(xmlNode *node, const char *name, int value);

} // namespace xml
} // namespace layout

#endif // LAYOUT_XML_TREE_HPP
