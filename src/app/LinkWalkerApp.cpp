/**
 * @file LinkWalkerApp.cpp
 * @brief Implementation of the LinkWalkerApp class.
 */
#include "app/LinkWalkerApp.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include "application/DependencyGraphService.hpp"
#include "application/LinkExportService.hpp"
#include "domain/Errors.hpp"
#include "domain/LinkNormalizer.hpp"
#include "infrastructure/DocxDocument.hpp"
#include "infrastructure/FileSystemDocumentScanner.hpp"
#include "infrastructure/JsonMapper.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;

namespace linkwalker::app {

namespace {
    const char* const kPathMissing = "Path does not exist";
    const char* const kFileMissing = "File not found";

    bool PathExists(const std::string& path) {
        std::error_code ec;
        return !path.empty() && fs::exists(path, ec);
    }

    bool IsDirectory(const std::string& path) {
        std::error_code ec;
        return fs::is_directory(path, ec);
    }
}

void LinkWalkerApp::Init() {
    m_config = infrastructure::ConfigLoader::LoadOrDefault(m_options.configPath);

    // Composition root
    m_services.documentLoader = std::make_shared<infrastructure::DocxDocumentLoader>();
    domain::LinkNormalizer normalizer(m_config.hubDomain, m_config.orgKeyword);
    m_services.linkExtractionService =
        std::make_unique<application::LinkExtractionService>(m_services.documentLoader, normalizer);
    m_services.textFindReplaceService =
        std::make_shared<application::TextFindReplaceService>(m_services.documentLoader);
    m_services.linkFindReplaceService =
        std::make_shared<application::LinkFindReplaceService>(m_services.documentLoader);
    m_services.bulkFindReplaceService = std::make_unique<application::BulkFindReplaceService>(
        m_services.textFindReplaceService, m_services.linkFindReplaceService);
}

int LinkWalkerApp::Run(int argc, char** argv) {
    CLI::App cli{"LinkWalker - hyperlink inventory and find/replace for .docx trees"};
    cli.require_subcommand(1);
    cli.add_option("--config", m_options.configPath, "Path to settings.json");

    auto* scan = cli.add_subcommand("scan", "Print the folder tree of eligible documents");
    scan->add_option("path", m_options.path, "Root folder");

    auto* links = cli.add_subcommand("links", "Extract links from every document and build the dependency graph");
    links->add_option("path", m_options.path, "Root folder");

    auto* exportCmd = cli.add_subcommand("export", "Write every extracted link to a CSV file");
    exportCmd->add_option("path", m_options.path, "Root folder");
    exportCmd->add_option("-o,--output", m_options.outputPath, "Destination CSV file")->default_val("links.csv");

    auto* findReplace = cli.add_subcommand("find-replace", "Find or replace body text in a file or folder");
    findReplace->add_option("path", m_options.path, "Document or root folder");
    findReplace->add_option("-f,--find", m_options.findText, "Literal text to find (case-insensitive)");
    findReplace->add_option("-r,--replace", m_options.replaceText, "Replacement text");
    findReplace->add_flag("--no-save-copies", m_options.noSaveCopies, "Do not back up files before changing them");

    auto* linksFindReplace = cli.add_subcommand("links-find-replace", "Find or replace hyperlink text or targets");
    linksFindReplace->add_option("path", m_options.path, "Document or root folder");
    linksFindReplace->add_option("-f,--find", m_options.findText, "Literal text to find (case-insensitive)");
    linksFindReplace->add_option("-r,--replace", m_options.replaceText, "Replacement text");
    linksFindReplace->add_option("-t,--target", m_options.target, "name, url or both")->default_val("both");
    linksFindReplace->add_flag("--no-save-copies", m_options.noSaveCopies, "Do not back up files before changing them");

    auto* analyze = cli.add_subcommand("analyze", "Report tracked-changes state and links of one document");
    analyze->add_option("path", m_options.path, "Document");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli.exit(e);
    }

    Init();

    try {
        if (scan->parsed()) return runScan();
        if (links->parsed()) return runLinks();
        if (exportCmd->parsed()) return runExport();
        if (findReplace->parsed()) return runFindReplace();
        if (linksFindReplace->parsed()) return runLinksFindReplace();
        if (analyze->parsed()) return runAnalyze();
    } catch (const domain::LinkWalkerError& e) {
        return reportError(e.what(), 2);
    } catch (const std::exception& e) {
        std::cerr << "[LinkWalkerApp] Unexpected failure: " << e.what() << std::endl;
        return reportError(e.what(), 2);
    }
    return 1;
}

std::optional<std::string> LinkWalkerApp::backupRootFor(const std::string& scanRoot) const {
    if (m_options.noSaveCopies) return std::nullopt;
    return application::BulkFindReplaceService::ResolveBackupRoot(
        scanRoot, infrastructure::PathUtils::GetDesktopDir().string(), m_config.backupFolderName);
}

void LinkWalkerApp::printJson(const nlohmann::json& value) const {
    std::cout << value.dump(2) << std::endl;
}

int LinkWalkerApp::reportError(const std::string& message, int exitCode) const {
    printJson(nlohmann::json{{"error", message}});
    return exitCode;
}

int LinkWalkerApp::runScan() {
    if (!PathExists(m_options.path)) return reportError(kPathMissing);

    infrastructure::FileSystemDocumentScanner scanner(m_config.documentExtension, m_config.lockPrefix);
    printJson(nlohmann::json{{"structure", scanner.scanTree(m_options.path)}});
    return 0;
}

int LinkWalkerApp::runLinks() {
    if (!PathExists(m_options.path)) return reportError(kPathMissing);

    infrastructure::FileSystemDocumentScanner scanner(m_config.documentExtension, m_config.lockPrefix);
    const auto files = scanner.listDocuments(m_options.path);
    const auto linkData = m_services.linkExtractionService->collectLinks(files, m_options.path);
    const auto dependencies = application::DependencyGraphService::Build(m_options.path, files, linkData);

    printJson(nlohmann::json{
        {"files", linkData},
        {"total_links", application::LinkExtractionService::CountLinks(linkData)},
        {"dependencies", dependencies}
    });
    return 0;
}

int LinkWalkerApp::runExport() {
    if (!PathExists(m_options.path)) return reportError(kPathMissing);

    infrastructure::FileSystemDocumentScanner scanner(m_config.documentExtension, m_config.lockPrefix);
    const auto files = scanner.listDocuments(m_options.path);
    const auto linkData = m_services.linkExtractionService->collectLinks(files, m_options.path);
    const auto rows = application::LinkExportService::BuildRows(linkData);

    if (!application::LinkExportService::ExportToFile(m_options.outputPath, rows)) {
        return reportError("Cannot write " + m_options.outputPath);
    }
    printJson(nlohmann::json{{"output", m_options.outputPath}, {"rows", rows.size()}});
    return 0;
}

int LinkWalkerApp::runFindReplace() {
    if (!PathExists(m_options.path)) return reportError(kPathMissing);
    const bool directory = IsDirectory(m_options.path);
    if (!m_options.findText || m_options.findText->empty()) return reportError(domain::status::kNoFindText);

    if (!directory) {
        auto result = m_services.textFindReplaceService->process(m_options.path, *m_options.findText, m_options.replaceText);
        printJson(result);
        return 0;
    }

    infrastructure::FileSystemDocumentScanner scanner(m_config.documentExtension, m_config.lockPrefix);
    application::BulkOptions options{backupRootFor(m_options.path), m_options.path};
    auto bulk = m_services.bulkFindReplaceService->runText(
        scanner.listDocuments(m_options.path), *m_options.findText, m_options.replaceText, options);
    printJson(bulk);
    return 0;
}

int LinkWalkerApp::runLinksFindReplace() {
    if (!PathExists(m_options.path)) return reportError(kPathMissing);
    const bool directory = IsDirectory(m_options.path);
    if (!m_options.findText || m_options.findText->empty()) return reportError(domain::status::kNoFindText);
    auto scope = domain::ParseLinkScope(m_options.target);
    if (!scope) return reportError("Invalid target: " + m_options.target + " (expected name, url or both)");

    if (!directory) {
        auto result = m_services.linkFindReplaceService->process(
            m_options.path, *m_options.findText, m_options.replaceText, *scope);
        printJson(result);
        return 0;
    }

    infrastructure::FileSystemDocumentScanner scanner(m_config.documentExtension, m_config.lockPrefix);
    application::BulkOptions options{backupRootFor(m_options.path), m_options.path};
    auto bulk = m_services.bulkFindReplaceService->runLinks(
        scanner.listDocuments(m_options.path), *m_options.findText, m_options.replaceText, *scope, options);
    printJson(bulk);
    return 0;
}

int LinkWalkerApp::runAnalyze() {
    if (!PathExists(m_options.path) || IsDirectory(m_options.path)) return reportError(kFileMissing);

    printJson(m_services.linkExtractionService->analyze(m_options.path));
    return 0;
}

} // namespace linkwalker::app
