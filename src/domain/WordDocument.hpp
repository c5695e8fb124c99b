/**
 * @file WordDocument.hpp
 * @brief Capability interface over an open word-processing document.
 *
 * The engines only need to read and mutate paragraphs, table cells, runs and
 * hyperlink relationships and to persist the result. Element views returned
 * here borrow from the document and must not outlive it.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace linkwalker::domain {

/**
 * @class TextRun
 * @brief A run of literal text (or a field instruction text node).
 */
class TextRun {
public:
    virtual ~TextRun() = default;
    virtual std::string getText() const = 0;
    virtual void setText(const std::string& text) = 0;
};

/**
 * @class HyperlinkReference
 * @brief A relationship-based hyperlink: an element carrying a relationship id.
 */
class HyperlinkReference {
public:
    virtual ~HyperlinkReference() = default;

    /** @brief Relationship id, empty when the hyperlink only carries an anchor. */
    virtual std::string getRelationshipId() const = 0;
    virtual void setRelationshipId(const std::string& relationshipId) = 0;

    /** @brief Runs nested under the hyperlink, in document order. */
    virtual std::vector<std::unique_ptr<TextRun>> getRuns() = 0;
};

/**
 * @class Paragraph
 * @brief A paragraph in the body or in a table cell.
 */
class Paragraph {
public:
    virtual ~Paragraph() = default;

    /** @brief Rendered text: direct runs and hyperlink runs, in order. */
    virtual std::string getText() const = 0;

    /** @brief Replaces the paragraph content with a single run holding @p text. */
    virtual void setText(const std::string& text) = 0;

    /** @brief Runs that are direct children of the paragraph. */
    virtual std::vector<std::unique_ptr<TextRun>> getRuns() = 0;

    /** @brief Relationship-based hyperlinks that are direct children of the paragraph. */
    virtual std::vector<std::unique_ptr<HyperlinkReference>> getHyperlinks() = 0;

    /** @brief Every field instruction text node inside the paragraph. */
    virtual std::vector<std::unique_ptr<TextRun>> getFieldInstructions() = 0;
};

class Table;

/**
 * @class TableCell
 * @brief A table cell: paragraphs plus any nested tables.
 */
class TableCell {
public:
    virtual ~TableCell() = default;
    virtual std::vector<std::unique_ptr<Paragraph>> getParagraphs() = 0;
    virtual std::vector<std::unique_ptr<Table>> getTables() = 0;
};

/**
 * @class Table
 * @brief Rows of cells.
 */
class Table {
public:
    virtual ~Table() = default;
    virtual std::vector<std::vector<std::unique_ptr<TableCell>>> getRows() = 0;
};

/**
 * @struct Relationship
 * @brief A hyperlink relationship record.
 */
struct Relationship {
    std::string id;
    std::string target;
    bool isExternal = true;
};

/**
 * @class WordDocument
 * @brief An open document, owned by the call that opened it.
 */
class WordDocument {
public:
    virtual ~WordDocument() = default;

    /** @brief Path the document was opened from. */
    virtual const std::string& getPath() const = 0;

    /** @brief Top-level body paragraphs. */
    virtual std::vector<std::unique_ptr<Paragraph>> getParagraphs() = 0;

    /** @brief Top-level body tables. */
    virtual std::vector<std::unique_ptr<Table>> getTables() = 0;

    /** @brief All hyperlink relationships of the main document part. */
    virtual std::vector<Relationship> getHyperlinkRelationships() const = 0;

    /** @brief Looks up a hyperlink relationship by id. */
    virtual std::optional<Relationship> findRelationship(const std::string& relationshipId) const = 0;

    /**
     * @brief Creates a hyperlink relationship, or reuses an identical one.
     * @return The relationship id.
     * @throws MutationError if the relationship table cannot be changed.
     */
    virtual std::string createHyperlinkRelationship(const std::string& target, bool isExternal) = 0;

    /** @brief True when the named element is present in the document settings. */
    virtual bool hasSetting(const std::string& name) const = 0;

    /** @throws DocumentSaveError on I/O failure. */
    virtual void save(const std::string& path) = 0;
};

/**
 * @class DocumentLoader
 * @brief Opens documents; the seam between the engines and the file format.
 */
class DocumentLoader {
public:
    virtual ~DocumentLoader() = default;

    /** @throws DocumentOpenError, DocumentParseError */
    virtual std::unique_ptr<WordDocument> open(const std::string& path) = 0;
};

} // namespace linkwalker::domain
