/**
 * @file DocxFixture.hpp
 * @brief Builds small .docx packages on disk for the tests.
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include <zip.h>

namespace linkwalker::test {

struct FixtureLink {
    std::string id;
    std::string target;
    bool external = true;
};

inline std::string Run(const std::string& text) {
    return "<w:r><w:t xml:space=\"preserve\">" + text + "</w:t></w:r>";
}

inline std::string Para(const std::string& text) {
    return "<w:p><w:pPr><w:pStyle w:val=\"Normal\"/></w:pPr>" + Run(text) + "</w:p>";
}

inline std::string HyperlinkPara(const std::string& rId, const std::vector<std::string>& runs) {
    std::string xml = "<w:p><w:hyperlink r:id=\"" + rId + "\">";
    for (const auto& run : runs) xml += Run(run);
    return xml + "</w:hyperlink></w:p>";
}

inline std::string FieldHyperlinkPara(const std::string& instruction, const std::string& display) {
    return "<w:p>"
           "<w:r><w:fldChar w:fldCharType=\"begin\"/></w:r>"
           "<w:r><w:instrText xml:space=\"preserve\">" + instruction + "</w:instrText></w:r>"
           "<w:r><w:fldChar w:fldCharType=\"separate\"/></w:r>" +
           Run(display) +
           "<w:r><w:fldChar w:fldCharType=\"end\"/></w:r>"
           "</w:p>";
}

/** @brief A one-row table; each entry is the inner XML of a cell. */
inline std::string Table(const std::vector<std::string>& cells) {
    std::string xml = "<w:tbl><w:tr>";
    for (const auto& cell : cells) xml += "<w:tc>" + cell + "</w:tc>";
    return xml + "</w:tr></w:tbl>";
}

/**
 * @brief Writes a minimal WordprocessingML package.
 * @param bodyXml Inner XML of w:body.
 */
inline void WriteDocx(const std::string& path,
                      const std::string& bodyXml,
                      const std::vector<FixtureLink>& links = {},
                      bool trackRevisions = false) {
    const std::string contentTypes =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
        "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        "<Override PartName=\"/word/document.xml\" "
        "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
        "<Override PartName=\"/word/settings.xml\" "
        "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.settings+xml\"/>"
        "</Types>";

    const std::string packageRels =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId1\" "
        "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
        "Target=\"word/document.xml\"/>"
        "</Relationships>";

    const std::string documentXml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
        "<w:body>" + bodyXml + "<w:sectPr/></w:body></w:document>";

    std::string documentRels =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
    for (const auto& link : links) {
        documentRels += "<Relationship Id=\"" + link.id + "\" "
                        "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink\" "
                        "Target=\"" + link.target + "\"";
        if (link.external) documentRels += " TargetMode=\"External\"";
        documentRels += "/>";
    }
    documentRels += "</Relationships>";

    const std::string settingsXml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<w:settings xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">" +
        std::string(trackRevisions ? "<w:trackRevisions/>" : "") +
        "<w:defaultTabStop w:val=\"720\"/></w:settings>";

    std::filesystem::path target(path);
    if (target.has_parent_path()) std::filesystem::create_directories(target.parent_path());

    int error = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error);
    if (!archive) throw std::runtime_error("zip_open failed for fixture " + path);

    auto add = [&](const char* name, const std::string& data) {
        zip_source_t* source = zip_source_buffer(archive, data.data(), data.size(), 0);
        if (!source || zip_file_add(archive, name, source, ZIP_FL_OVERWRITE) < 0) {
            if (source) zip_source_free(source);
            zip_discard(archive);
            throw std::runtime_error(std::string("zip_file_add failed for ") + name);
        }
    };
    add("[Content_Types].xml", contentTypes);
    add("_rels/.rels", packageRels);
    add("word/document.xml", documentXml);
    add("word/_rels/document.xml.rels", documentRels);
    add("word/settings.xml", settingsXml);

    if (zip_close(archive) != 0) {
        zip_discard(archive);
        throw std::runtime_error("zip_close failed for fixture " + path);
    }
}

inline std::string ReadBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/** @brief Fresh, empty scratch directory under the system temp folder. */
inline std::filesystem::path MakeScratchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace linkwalker::test
