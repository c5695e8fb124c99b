#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "DocxFixture.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace linkwalker;
using infrastructure::ConfigLoader;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    auto root = test::MakeScratchDir("linkwalker_config");

    auto defaults = ConfigLoader::Load((root / "missing.json").string());
    assert(defaults.hubDomain == "skfgroup.sharepoint.com");
    assert(defaults.orgKeyword == "skf");
    assert(defaults.documentExtension == ".docx");
    assert(defaults.lockPrefix == "~$");
    assert(defaults.backupFolderName == "bulk_found");

    const fs::path partial = root / "settings.json";
    {
        std::ofstream out(partial);
        out << R"({"hub_domain": "contoso.sharepoint.com", "org_keyword": "contoso", "unknown": 1})";
    }
    auto overridden = ConfigLoader::LoadOrDefault(partial.string());
    assert(overridden.hubDomain == "contoso.sharepoint.com");
    assert(overridden.orgKeyword == "contoso");
    assert(overridden.backupFolderName == "bulk_found");
    std::cout << "[PASS] Defaults and overrides." << std::endl;

    const fs::path malformed = root / "broken.json";
    {
        std::ofstream out(malformed);
        out << "{ \"hub_domain\": ";
    }
    auto fallback = ConfigLoader::Load(malformed.string());
    assert(fallback.hubDomain == "skfgroup.sharepoint.com");

    const fs::path wrongType = root / "wrong.json";
    {
        std::ofstream out(wrongType);
        out << R"({"org_keyword": 42})";
    }
    assert(ConfigLoader::Load(wrongType.string()).orgKeyword == "skf");

    fs::remove_all(root);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
