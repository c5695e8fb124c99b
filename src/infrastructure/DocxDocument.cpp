/**
 * @file DocxDocument.cpp
 * @brief Implementation of DocxDocument and its element views.
 */

#include "infrastructure/DocxDocument.hpp"
#include "domain/Errors.hpp"
#include "domain/LexicalPath.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>
#include <zip.h>

namespace fs = std::filesystem;

namespace linkwalker::infrastructure {

namespace {

constexpr const char* kWordMlNs = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
constexpr const char* kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kPackageRelNs = "http://schemas.openxmlformats.org/package/2006/relationships";
const std::string kHyperlinkType = std::string(kRelNs) + "/hyperlink";
const std::string kOfficeDocumentType = std::string(kRelNs) + "/officeDocument";
const std::string kSettingsType = std::string(kRelNs) + "/settings";

constexpr unsigned int kParseFlags = pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata;

using ZipHandle = std::unique_ptr<zip_t, decltype(&zip_discard)>;

std::string ZipErrorMessage(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

std::optional<std::string> ReadEntry(zip_t* archive, const std::string& name) {
    zip_stat_t entryStat;
    zip_stat_init(&entryStat);
    if (zip_stat(archive, name.c_str(), 0, &entryStat) != 0) return std::nullopt;
    if (!(entryStat.valid & ZIP_STAT_SIZE)) return std::nullopt;

    zip_file_t* file = zip_fopen(archive, name.c_str(), 0);
    if (!file) return std::nullopt;

    std::string contents(entryStat.size, '\0');
    zip_int64_t bytesRead = entryStat.size > 0 ? zip_fread(file, &contents[0], entryStat.size) : 0;
    zip_fclose(file);

    if (bytesRead < 0 || static_cast<zip_uint64_t>(bytesRead) != entryStat.size) return std::nullopt;
    return contents;
}

std::string PrefixFor(pugi::xml_node root, const char* ns, const std::string& fallback) {
    for (pugi::xml_attribute attr : root.attributes()) {
        std::string name = attr.name();
        if (std::string(attr.value()) != ns) continue;
        if (name == "xmlns") return "";
        if (name.rfind("xmlns:", 0) == 0) return name.substr(6);
    }
    return fallback;
}

std::string Qualify(const std::string& prefix, const char* local) {
    return prefix.empty() ? std::string(local) : prefix + ":" + local;
}

// Part name of a relationship target, resolved against the source part's folder.
std::string ResolvePartName(const std::string& sourceDir, const std::string& target) {
    if (!target.empty() && target[0] == '/') return target.substr(1);
    std::string joined = sourceDir.empty() ? target : sourceDir + "/" + target;
    return domain::lexical::Normalize(joined);
}

std::string RelationshipsPartFor(const std::string& partName) {
    std::string dir = domain::lexical::DirName(partName);
    std::string file = dir.empty() ? partName : partName.substr(dir.size() + 1);
    return (dir.empty() ? "" : dir + "/") + "_rels/" + file + ".rels";
}

std::optional<std::string> FindRelationshipTarget(pugi::xml_node relationshipsRoot, const std::string& type) {
    for (pugi::xml_node rel : relationshipsRoot.children("Relationship")) {
        if (type == rel.attribute("Type").value()) {
            return std::string(rel.attribute("Target").value());
        }
    }
    return std::nullopt;
}

void SetPreservedText(pugi::xml_node element, const std::string& text) {
    element.text().set(text.c_str());
    pugi::xml_attribute space = element.attribute("xml:space");
    if (!space) space = element.append_attribute("xml:space");
    space.set_value("preserve");
}

void CollectDescendants(pugi::xml_node node, const std::string& name, std::vector<pugi::xml_node>& out) {
    for (pugi::xml_node child : node.children()) {
        if (child.type() != pugi::node_element) continue;
        if (name == child.name()) out.push_back(child);
        CollectDescendants(child, name, out);
    }
}

std::string RunRenderedText(pugi::xml_node run, const DocxNames& names) {
    std::string text;
    for (pugi::xml_node child : run.children()) {
        const char* name = child.name();
        if (names.t == name) text += child.text().get();
        else if (names.tab == name) text += '\t';
        else if (names.br == name || names.cr == name) text += '\n';
    }
    return text;
}

class DocxRun : public domain::TextRun {
public:
    DocxRun(pugi::xml_node run, const DocxNames& names) : m_run(run), m_names(names) {}

    std::string getText() const override {
        std::string text;
        for (pugi::xml_node t : m_run.children(m_names.t.c_str())) {
            text += t.text().get();
        }
        return text;
    }

    void setText(const std::string& text) override {
        pugi::xml_node first = m_run.child(m_names.t.c_str());
        if (!first) first = m_run.append_child(m_names.t.c_str());

        std::vector<pugi::xml_node> extra;
        for (pugi::xml_node t : m_run.children(m_names.t.c_str())) {
            if (t != first) extra.push_back(t);
        }
        for (pugi::xml_node t : extra) m_run.remove_child(t);

        SetPreservedText(first, text);
    }

private:
    pugi::xml_node m_run;
    const DocxNames& m_names;
};

class DocxInstruction : public domain::TextRun {
public:
    explicit DocxInstruction(pugi::xml_node instr) : m_instr(instr) {}

    std::string getText() const override { return m_instr.text().get(); }
    void setText(const std::string& text) override { SetPreservedText(m_instr, text); }

private:
    pugi::xml_node m_instr;
};

class DocxHyperlink : public domain::HyperlinkReference {
public:
    DocxHyperlink(pugi::xml_node link, const DocxNames& names) : m_link(link), m_names(names) {}

    std::string getRelationshipId() const override {
        return m_link.attribute(m_names.relationshipId.c_str()).value();
    }

    void setRelationshipId(const std::string& relationshipId) override {
        pugi::xml_attribute attr = m_link.attribute(m_names.relationshipId.c_str());
        if (!attr) attr = m_link.append_attribute(m_names.relationshipId.c_str());
        attr.set_value(relationshipId.c_str());
    }

    std::vector<std::unique_ptr<domain::TextRun>> getRuns() override {
        std::vector<pugi::xml_node> runs;
        CollectDescendants(m_link, m_names.r, runs);
        std::vector<std::unique_ptr<domain::TextRun>> views;
        for (pugi::xml_node run : runs) views.push_back(std::make_unique<DocxRun>(run, m_names));
        return views;
    }

private:
    pugi::xml_node m_link;
    const DocxNames& m_names;
};

class DocxParagraph : public domain::Paragraph {
public:
    DocxParagraph(pugi::xml_node paragraph, const DocxNames& names) : m_p(paragraph), m_names(names) {}

    std::string getText() const override {
        std::string text;
        for (pugi::xml_node child : m_p.children()) {
            if (m_names.r == child.name()) {
                text += RunRenderedText(child, m_names);
            } else if (m_names.hyperlink == child.name()) {
                std::vector<pugi::xml_node> runs;
                CollectDescendants(child, m_names.r, runs);
                for (pugi::xml_node run : runs) text += RunRenderedText(run, m_names);
            }
        }
        return text;
    }

    void setText(const std::string& text) override {
        std::vector<pugi::xml_node> content;
        for (pugi::xml_node child : m_p.children()) {
            if (m_names.pPr != child.name()) content.push_back(child);
        }
        for (pugi::xml_node child : content) m_p.remove_child(child);

        pugi::xml_node run = m_p.append_child(m_names.r.c_str());
        std::string segment;
        auto flush = [&]() {
            if (segment.empty()) return;
            SetPreservedText(run.append_child(m_names.t.c_str()), segment);
            segment.clear();
        };
        for (char c : text) {
            if (c == '\t') {
                flush();
                run.append_child(m_names.tab.c_str());
            } else if (c == '\n') {
                flush();
                run.append_child(m_names.br.c_str());
            } else {
                segment.push_back(c);
            }
        }
        flush();
    }

    std::vector<std::unique_ptr<domain::TextRun>> getRuns() override {
        std::vector<std::unique_ptr<domain::TextRun>> views;
        for (pugi::xml_node run : m_p.children(m_names.r.c_str())) {
            views.push_back(std::make_unique<DocxRun>(run, m_names));
        }
        return views;
    }

    std::vector<std::unique_ptr<domain::HyperlinkReference>> getHyperlinks() override {
        std::vector<std::unique_ptr<domain::HyperlinkReference>> views;
        for (pugi::xml_node link : m_p.children(m_names.hyperlink.c_str())) {
            views.push_back(std::make_unique<DocxHyperlink>(link, m_names));
        }
        return views;
    }

    std::vector<std::unique_ptr<domain::TextRun>> getFieldInstructions() override {
        std::vector<pugi::xml_node> nodes;
        CollectDescendants(m_p, m_names.instrText, nodes);
        std::vector<std::unique_ptr<domain::TextRun>> views;
        for (pugi::xml_node node : nodes) views.push_back(std::make_unique<DocxInstruction>(node));
        return views;
    }

private:
    pugi::xml_node m_p;
    const DocxNames& m_names;
};

class DocxTable;

class DocxTableCell : public domain::TableCell {
public:
    DocxTableCell(pugi::xml_node cell, const DocxNames& names) : m_tc(cell), m_names(names) {}

    std::vector<std::unique_ptr<domain::Paragraph>> getParagraphs() override {
        std::vector<std::unique_ptr<domain::Paragraph>> views;
        for (pugi::xml_node p : m_tc.children(m_names.p.c_str())) {
            views.push_back(std::make_unique<DocxParagraph>(p, m_names));
        }
        return views;
    }

    std::vector<std::unique_ptr<domain::Table>> getTables() override;

private:
    pugi::xml_node m_tc;
    const DocxNames& m_names;
};

class DocxTable : public domain::Table {
public:
    DocxTable(pugi::xml_node table, const DocxNames& names) : m_tbl(table), m_names(names) {}

    std::vector<std::vector<std::unique_ptr<domain::TableCell>>> getRows() override {
        std::vector<std::vector<std::unique_ptr<domain::TableCell>>> rows;
        for (pugi::xml_node tr : m_tbl.children(m_names.tr.c_str())) {
            std::vector<std::unique_ptr<domain::TableCell>> cells;
            for (pugi::xml_node tc : tr.children(m_names.tc.c_str())) {
                cells.push_back(std::make_unique<DocxTableCell>(tc, m_names));
            }
            rows.push_back(std::move(cells));
        }
        return rows;
    }

private:
    pugi::xml_node m_tbl;
    const DocxNames& m_names;
};

std::vector<std::unique_ptr<domain::Table>> DocxTableCell::getTables() {
    std::vector<std::unique_ptr<domain::Table>> views;
    for (pugi::xml_node tbl : m_tc.children(m_names.tbl.c_str())) {
        views.push_back(std::make_unique<DocxTable>(tbl, m_names));
    }
    return views;
}

} // namespace

DocxNames DocxNames::FromRoot(pugi::xml_node root) {
    const std::string w = PrefixFor(root, kWordMlNs, "w");
    const std::string r = PrefixFor(root, kRelNs, "r");

    DocxNames names;
    names.body = Qualify(w, "body");
    names.p = Qualify(w, "p");
    names.pPr = Qualify(w, "pPr");
    names.r = Qualify(w, "r");
    names.t = Qualify(w, "t");
    names.tab = Qualify(w, "tab");
    names.br = Qualify(w, "br");
    names.cr = Qualify(w, "cr");
    names.tbl = Qualify(w, "tbl");
    names.tr = Qualify(w, "tr");
    names.tc = Qualify(w, "tc");
    names.hyperlink = Qualify(w, "hyperlink");
    names.instrText = Qualify(w, "instrText");
    names.relationshipId = Qualify(r, "id");
    return names;
}

DocxDocument::DocxDocument(OpenTag, std::string path) : m_path(std::move(path)) {}

std::unique_ptr<DocxDocument> DocxDocument::Open(const std::string& path) {
    int zipError = 0;
    ZipHandle archive(zip_open(path.c_str(), ZIP_RDONLY, &zipError), &zip_discard);
    if (!archive) {
        throw domain::DocumentOpenError("Cannot open " + path + ": " + ZipErrorMessage(zipError));
    }

    auto doc = std::make_unique<DocxDocument>(OpenTag{}, path);

    doc->m_documentPart = "word/document.xml";
    if (auto packageRels = ReadEntry(archive.get(), "_rels/.rels")) {
        pugi::xml_document rels;
        if (rels.load_buffer(packageRels->data(), packageRels->size())) {
            if (auto target = FindRelationshipTarget(rels.child("Relationships"), kOfficeDocumentType)) {
                doc->m_documentPart = ResolvePartName("", *target);
            }
        }
    }

    auto documentXml = ReadEntry(archive.get(), doc->m_documentPart);
    if (!documentXml) {
        throw domain::DocumentOpenError("Not a word-processing document (missing " + doc->m_documentPart + "): " + path);
    }
    pugi::xml_parse_result parsed = doc->m_document.load_buffer(documentXml->data(), documentXml->size(), kParseFlags);
    if (!parsed) {
        throw domain::DocumentParseError("Failed to parse " + doc->m_documentPart + " in " + path + ": " + parsed.description());
    }
    doc->m_names = DocxNames::FromRoot(doc->m_document.document_element());

    const std::string partDir = domain::lexical::DirName(doc->m_documentPart);
    doc->m_relationshipsPart = RelationshipsPartFor(doc->m_documentPart);
    if (auto relsXml = ReadEntry(archive.get(), doc->m_relationshipsPart)) {
        pugi::xml_parse_result relsParsed = doc->m_relationships.load_buffer(relsXml->data(), relsXml->size(), kParseFlags);
        if (!relsParsed) {
            throw domain::DocumentParseError("Failed to parse " + doc->m_relationshipsPart + " in " + path + ": " + relsParsed.description());
        }
        doc->m_hasRelationshipsPart = true;
    }

    std::string settingsPart = partDir.empty() ? "settings.xml" : partDir + "/settings.xml";
    if (auto target = FindRelationshipTarget(doc->m_relationships.child("Relationships"), kSettingsType)) {
        settingsPart = ResolvePartName(partDir, *target);
    }
    if (auto settingsXml = ReadEntry(archive.get(), settingsPart)) {
        if (doc->m_settings.load_buffer(settingsXml->data(), settingsXml->size(), kParseFlags)) {
            doc->m_settingsPrefix = PrefixFor(doc->m_settings.document_element(), kWordMlNs, "w");
        } else {
            std::cerr << "[DocxDocument] Ignoring unreadable settings part in " << path << std::endl;
            doc->m_settings.reset();
        }
    }

    return doc;
}

pugi::xml_node DocxDocument::body() const {
    return m_document.document_element().child(m_names.body.c_str());
}

std::vector<std::unique_ptr<domain::Paragraph>> DocxDocument::getParagraphs() {
    std::vector<std::unique_ptr<domain::Paragraph>> views;
    for (pugi::xml_node p : body().children(m_names.p.c_str())) {
        views.push_back(std::make_unique<DocxParagraph>(p, m_names));
    }
    return views;
}

std::vector<std::unique_ptr<domain::Table>> DocxDocument::getTables() {
    std::vector<std::unique_ptr<domain::Table>> views;
    for (pugi::xml_node tbl : body().children(m_names.tbl.c_str())) {
        views.push_back(std::make_unique<DocxTable>(tbl, m_names));
    }
    return views;
}

std::vector<domain::Relationship> DocxDocument::getHyperlinkRelationships() const {
    std::vector<domain::Relationship> result;
    for (pugi::xml_node rel : m_relationships.child("Relationships").children("Relationship")) {
        if (kHyperlinkType != rel.attribute("Type").value()) continue;
        domain::Relationship item;
        item.id = rel.attribute("Id").value();
        item.target = rel.attribute("Target").value();
        item.isExternal = std::string(rel.attribute("TargetMode").value()) == "External";
        result.push_back(item);
    }
    return result;
}

std::optional<domain::Relationship> DocxDocument::findRelationship(const std::string& relationshipId) const {
    if (relationshipId.empty()) return std::nullopt;
    for (const auto& rel : getHyperlinkRelationships()) {
        if (rel.id == relationshipId) return rel;
    }
    return std::nullopt;
}

std::string DocxDocument::nextRelationshipId() const {
    std::set<std::string> used;
    for (pugi::xml_node rel : m_relationships.child("Relationships").children("Relationship")) {
        used.insert(rel.attribute("Id").value());
    }
    for (int n = 1;; ++n) {
        std::string candidate = "rId" + std::to_string(n);
        if (used.count(candidate) == 0) return candidate;
    }
}

std::string DocxDocument::createHyperlinkRelationship(const std::string& target, bool isExternal) {
    for (const auto& rel : getHyperlinkRelationships()) {
        if (rel.target == target && rel.isExternal == isExternal) return rel.id;
    }

    pugi::xml_node root = m_relationships.child("Relationships");
    if (!root) {
        root = m_relationships.append_child("Relationships");
        if (!root) throw domain::MutationError("Cannot create relationship table in " + m_path);
        root.append_attribute("xmlns") = kPackageRelNs;
        m_hasRelationshipsPart = true;
    }

    const std::string id = nextRelationshipId();
    pugi::xml_node rel = root.append_child("Relationship");
    if (!rel) throw domain::MutationError("Cannot append relationship to " + m_relationshipsPart);
    rel.append_attribute("Id") = id.c_str();
    rel.append_attribute("Type") = kHyperlinkType.c_str();
    rel.append_attribute("Target") = target.c_str();
    if (isExternal) rel.append_attribute("TargetMode") = "External";

    return id;
}

bool DocxDocument::hasSetting(const std::string& name) const {
    pugi::xml_node root = m_settings.document_element();
    if (!root) return false;
    return static_cast<bool>(root.child(Qualify(m_settingsPrefix, name.c_str()).c_str()));
}

void DocxDocument::save(const std::string& path) {
    std::ostringstream documentOut;
    m_document.save(documentOut, "", pugi::format_raw);
    const std::string documentXml = documentOut.str();

    std::string relationshipsXml;
    if (m_hasRelationshipsPart) {
        std::ostringstream relsOut;
        m_relationships.save(relsOut, "", pugi::format_raw);
        relationshipsXml = relsOut.str();
    }

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path finalPath = path;
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        fs::copy_file(m_path, tempPath, fs::copy_options::overwrite_existing);
    } catch (const fs::filesystem_error& e) {
        throw domain::DocumentSaveError("Cannot stage " + path + ": " + e.what());
    }

    auto fail = [&](const std::string& message) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw domain::DocumentSaveError(message);
    };

    int zipError = 0;
    zip_t* archive = zip_open(tempPath.string().c_str(), 0, &zipError);
    if (!archive) {
        fail("Cannot reopen staged copy of " + path + ": " + ZipErrorMessage(zipError));
    }

    auto replaceEntry = [&](const std::string& name, const std::string& data) {
        zip_source_t* source = zip_source_buffer(archive, data.data(), data.size(), 0);
        if (!source) return false;
        if (zip_file_add(archive, name.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
            zip_source_free(source);
            return false;
        }
        return true;
    };

    bool staged = replaceEntry(m_documentPart, documentXml);
    if (staged && m_hasRelationshipsPart) {
        staged = replaceEntry(m_relationshipsPart, relationshipsXml);
    }
    if (!staged) {
        std::string message = zip_strerror(archive);
        zip_discard(archive);
        fail("Cannot write parts of " + path + ": " + message);
    }
    if (zip_close(archive) != 0) {
        std::string message = zip_strerror(archive);
        zip_discard(archive);
        fail("Cannot finalize " + path + ": " + message);
    }

    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        fail("Cannot replace " + path + ": " + e.what());
    }
}

std::unique_ptr<domain::WordDocument> DocxDocumentLoader::open(const std::string& path) {
    return DocxDocument::Open(path);
}

} // namespace linkwalker::infrastructure
