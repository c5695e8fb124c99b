/**
 * @file DocxDocument.hpp
 * @brief WordprocessingML (.docx) adapter for the WordDocument interface.
 *
 * The zip container is read with libzip and the XML parts are held as pugixml
 * trees. Only the main document part, its relationships and the settings part
 * are parsed; every other entry is carried over untouched on save.
 */

#pragma once
#include <memory>
#include <string>
#include <pugixml.hpp>
#include "domain/WordDocument.hpp"

namespace linkwalker::infrastructure {

/**
 * @struct DocxNames
 * @brief Qualified element and attribute names, resolved from the part's namespace prefixes.
 */
struct DocxNames {
    std::string body, p, pPr, r, t, tab, br, cr, tbl, tr, tc, hyperlink, instrText;
    std::string relationshipId; ///< e.g. "r:id"

    static DocxNames FromRoot(pugi::xml_node root);
};

class DocxDocument : public domain::WordDocument {
    struct OpenTag {
        explicit OpenTag() = default;
    };

public:
    /**
     * @brief Opens and parses a .docx file.
     * @throws domain::DocumentOpenError if the file is unreadable or has no main document part.
     * @throws domain::DocumentParseError if the main part or its relationships are malformed.
     */
    static std::unique_ptr<DocxDocument> Open(const std::string& path);

    DocxDocument(OpenTag, std::string path);
    DocxDocument(const DocxDocument&) = delete;
    DocxDocument& operator=(const DocxDocument&) = delete;

    const std::string& getPath() const override { return m_path; }
    std::vector<std::unique_ptr<domain::Paragraph>> getParagraphs() override;
    std::vector<std::unique_ptr<domain::Table>> getTables() override;
    std::vector<domain::Relationship> getHyperlinkRelationships() const override;
    std::optional<domain::Relationship> findRelationship(const std::string& relationshipId) const override;
    std::string createHyperlinkRelationship(const std::string& target, bool isExternal) override;
    bool hasSetting(const std::string& name) const override;
    void save(const std::string& path) override;

private:
    std::string nextRelationshipId() const;
    pugi::xml_node body() const;

    std::string m_path;
    std::string m_documentPart;      ///< e.g. "word/document.xml"
    std::string m_relationshipsPart; ///< e.g. "word/_rels/document.xml.rels"
    pugi::xml_document m_document;
    pugi::xml_document m_relationships;
    pugi::xml_document m_settings;
    std::string m_settingsPrefix;    ///< WordprocessingML prefix used by the settings part.
    bool m_hasRelationshipsPart = false;
    DocxNames m_names;
};

/**
 * @class DocxDocumentLoader
 * @brief DocumentLoader that opens .docx files.
 */
class DocxDocumentLoader : public domain::DocumentLoader {
public:
    std::unique_ptr<domain::WordDocument> open(const std::string& path) override;
};

} // namespace linkwalker::infrastructure
