#ifndef LAYOUT_XML_HPP
#define LAYOUT_XML_HPP

#include "LayoutConfig.hpp"
#include "PageLayout.hpp"

#include <optional>
#include <string>
#include <vector>

namespace layout {

class WordGeometryReconstructor;

/// Namespace written on PAGE XML documents
extern const char *const kPageXmlNamespace;
/// Namespace written on ALTO XML documents
extern const char *const kAltoXmlNamespace;

// ---------------------------------------------------------------------------
// PAGE XML
// ---------------------------------------------------------------------------

/**
 * @brief Read a PAGE XML file
 *
 * Elements are matched by local name, so any namespace prefix (or none)
 * is accepted.
 *
 * @throws MalformedDocument if the document is invalid
 */
Page readPageXml(const std::string &path);

/**
 * @brief Read a PAGE XML document from memory
 * @throws MalformedDocument if the document is invalid
 */
Page readPageXmlString(const std::string &xml);

/**
 * @brief Serialize a page as PAGE XML
 *
 * Line heights are always written in the heights_v2 form.
 */
std::string toPageXmlString(const Page &page);

/**
 * @brief Write a page to a PAGE XML file
 * @throws LayoutError if the file cannot be written
 */
void writePageXml(const Page &page, const std::string &path);

/**
 * @brief Decode the heights stored in a TextLine custom attribute
 *
 * Understands heights_v2:[ascent,descent] and the legacy forms where the
 * digit runs of the attribute are the numbers: four numbers give
 * (n0, n2), three give (n1, n2 - n0), two are used as they are.
 *
 * @return Heights, or nothing if the attribute holds no heights
 * @throws MalformedDocument for an unsupported number of values
 */
std::optional<LineHeights> parseHeights(const std::string &custom);

/**
 * @brief Encode heights as the heights_v2 custom attribute value
 */
std::string formatHeights(const LineHeights &heights);

// ---------------------------------------------------------------------------
// ALTO XML
// ---------------------------------------------------------------------------

/**
 * @brief Read an ALTO XML file
 *
 * Blocks and lines become rectangles; the words of a line are joined with
 * single spaces into its transcription.
 *
 * @throws MalformedDocument if the document is invalid
 */
Page readAltoXml(const std::string &path);

/**
 * @brief Read an ALTO XML document from memory
 * @throws MalformedDocument if the document is invalid
 */
Page readAltoXmlString(const std::string &xml);

/**
 * @brief Serialize a page as ALTO XML with reconstructed word boxes
 *
 * Lines whose reconstruction fails are still written, with one String
 * holding the whole transcription at the line box.
 *
 * @param page Page to write
 * @param reconstructor Source of word and gap boxes
 * @param config Processing metadata and logging options
 * @param failedLines If not null, receives the ids of lines whose word
 * geometry could not be reconstructed
 */
std::string toAltoXmlString(const Page &page,
                            const WordGeometryReconstructor &reconstructor,
                            const LayoutConfig &config = LayoutConfig(),
                            std::vector<std::string> *failedLines = nullptr);

/**
 * @brief Write a page to an ALTO XML file
 * @throws LayoutError if the file cannot be written
 */
void writeAltoXml(const Page &page,
                  const WordGeometryReconstructor &reconstructor,
                  const std::string &path,
                  const LayoutConfig &config = LayoutConfig(),
                  std::vector<std::string> *failedLines = nullptr);

} // namespace layout

#endif // LAYOUT_XML_HPP
