#include "ryuri/filter/FilterChain.hpp"
#include "ryuri/filter/FilterRegistry.hpp"
#include "ryuri/filter/MetadataNormalizeFilter.hpp"
#include "ryuri/filter/PrivacyScrubFilter.hpp"
#include "ryuri/filter/StructuralRepairFilter.hpp"
#include "ryuri/filter/VersionUpgradeFilter.hpp"
#include "ryuri/utils/Logger.hpp"
#include "ryuri/xml/Document.hpp"
#include "TestPackages.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ryuri {
namespace filter {

class BuiltinFiltersTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/builtin_filters_test.log", Logger::Level::DEBUG, false);
        store_ = test::makeSampleStore();
        cache_ = std::make_unique<cache::DocumentCache>(*store_);
    }

    void TearDown() override {
        cache_.reset();
        store_.reset();
        Logger::getInstance().shutdown();
    }

    core::VoidResult runFilters(const std::vector<FilterSpec>& specs) {
        auto chain = FilterChain::build(specs, FilterRegistry::withBuiltins());
        if (!chain) {
            return chain.error();
        }
        return chain.value().run(*store_, *cache_);
    }

    std::string opfText() const {
        return store_->getString("OEBPS/content.opf");
    }

    std::unique_ptr<store::ArchivePackageStore> store_;
    std::unique_ptr<cache::DocumentCache> cache_;
};

// ========== 结构修复 ==========

// 测试1: 重建 mimetype 与 container
TEST_F(BuiltinFiltersTest, StructuralRepairRegeneratesInfrastructure) {
    store_->remove("mimetype");
    store_->put("META-INF/container.xml", std::string("<container><rootfiles><rootfile full-path=\"gone.opf\"/>"
                                                      "</rootfiles></container>"));

    ASSERT_TRUE(runFilters({FilterSpec(StructuralRepairFilter::kName)}));
    EXPECT_EQ(store_->getString("mimetype"), "application/epub+zip");

    const std::string container = store_->getString("META-INF/container.xml");
    EXPECT_NE(container.find("full-path=\"OEBPS/content.opf\""), std::string::npos);
    EXPECT_NE(container.find("urn:oasis:names:tc:opendocument:xmlns:container"), std::string::npos);
    EXPECT_EQ(store_->list().front(), "mimetype");
}

// 测试2: 清单修复
TEST_F(BuiltinFiltersTest, StructuralRepairFixesManifest) {
    store_->remove("OEBPS/Text/c2.xhtml");
    store_->put("OEBPS/Images/extra photo.png", std::vector<uint8_t>{0x89, 'P', 'N', 'G'});
    std::string opf = opfText();
    opf.replace(opf.find("href=\"Styles/main.css\" media-type=\"text/css\""),
                std::string("href=\"Styles/main.css\" media-type=\"text/css\"").size(),
                "href=\"Styles/main.css\" media-type=\"text/plain\"");
    store_->put("OEBPS/content.opf", opf);

    ASSERT_TRUE(runFilters({FilterSpec(StructuralRepairFilter::kName)}));
    const std::string repaired = opfText();
    EXPECT_EQ(repaired.find("Text/c2.xhtml"), std::string::npos);
    EXPECT_EQ(repaired.find("idref=\"c2\""), std::string::npos);
    EXPECT_NE(repaired.find("href=\"Images/extra%20photo.png\""), std::string::npos);
    EXPECT_NE(repaired.find("media-type=\"image/png\""), std::string::npos);
    EXPECT_NE(repaired.find("href=\"Styles/main.css\" media-type=\"text/css\""), std::string::npos);
    // 字体类型别名视为等价
    EXPECT_NE(repaired.find("application/x-font-ttf"), std::string::npos);
}

// 测试3: 关闭媒体类型纠正
TEST_F(BuiltinFiltersTest, StructuralRepairCorrectMimeDisabled) {
    std::string opf = opfText();
    const std::string from = "href=\"Images/cover.jpg\" media-type=\"image/jpeg\"";
    opf.replace(opf.find(from), from.size(), "href=\"Images/cover.jpg\" media-type=\"image/png\"");
    store_->put("OEBPS/content.opf", opf);

    ASSERT_TRUE(runFilters({FilterSpec(StructuralRepairFilter::kName, {{"correct_mime", "false"}})}));
    EXPECT_NE(opfText().find("media-type=\"image/png\""), std::string::npos);
}

// 测试4: 没有 OPF 时失败
TEST_F(BuiltinFiltersTest, StructuralRepairWithoutPackageDocument) {
    store_->remove("OEBPS/content.opf");
    core::VoidResult result = runFilters({FilterSpec(StructuralRepairFilter::kName)});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::FilterFailure);
    EXPECT_EQ(result.error().context, "structural-repair");
    EXPECT_EQ(result.error().cause, core::ErrorCode::NotFound);
}

// ========== 版本升级 ==========

// 测试5: EPUB 2 升级到 3
TEST_F(BuiltinFiltersTest, VersionUpgradeProducesEpub3) {
    ASSERT_TRUE(runFilters({FilterSpec(VersionUpgradeFilter::kName, {{"modified", "2024-01-02T03:04:05Z"}})}));

    const std::string opf = opfText();
    EXPECT_NE(opf.find("version=\"3.0\""), std::string::npos);
    EXPECT_EQ(opf.find("opf:role"), std::string::npos);
    EXPECT_EQ(opf.find("opf:file-as"), std::string::npos);
    EXPECT_NE(opf.find("<dc:creator id=\"creator01\">Jane Doe</dc:creator>"), std::string::npos);
    EXPECT_NE(opf.find("<meta refines=\"#creator01\" property=\"role\" scheme=\"marc:relators\">aut</meta>"),
              std::string::npos);
    EXPECT_NE(opf.find("<meta refines=\"#creator01\" property=\"file-as\">Doe, Jane</meta>"), std::string::npos);
    EXPECT_NE(opf.find("<meta refines=\"#BookId\" property=\"identifier-type\">ISBN</meta>"), std::string::npos);
    EXPECT_NE(opf.find("<meta property=\"dcterms:modified\">2024-01-02T03:04:05Z</meta>"), std::string::npos);
    EXPECT_NE(opf.find("properties=\"cover-image\""), std::string::npos);
    EXPECT_NE(opf.find("href=\"nav.xhtml\""), std::string::npos);
    EXPECT_NE(opf.find("properties=\"nav\""), std::string::npos);

    ASSERT_TRUE(store_->exists("OEBPS/nav.xhtml"));
    const std::string nav = store_->getString("OEBPS/nav.xhtml");
    EXPECT_NE(nav.find("<nav epub:type=\"toc\" id=\"toc\">"), std::string::npos);
    EXPECT_NE(nav.find("<a href=\"Text/c1.xhtml\">Chapter One</a>"), std::string::npos);
    EXPECT_NE(nav.find("<a href=\"Text/c2.xhtml\">Chapter Two</a>"), std::string::npos);
}

// 测试6: 重复升级不再改变包
TEST_F(BuiltinFiltersTest, VersionUpgradeIsIdempotent) {
    const FilterSpec spec(VersionUpgradeFilter::kName, {{"modified", "2024-01-02T03:04:05Z"}});
    ASSERT_TRUE(runFilters({spec}));
    const auto once = test::snapshot(*store_);

    ASSERT_TRUE(runFilters({spec}));
    EXPECT_EQ(test::snapshot(*store_), once);
}

// 测试7: 没有 NCX 时按阅读顺序生成导航
TEST_F(BuiltinFiltersTest, VersionUpgradeNavFromSpine) {
    std::string opf = opfText();
    const std::string ncx_item = "<item id=\"ncx\" href=\"toc.ncx\" media-type=\"application/x-dtbncx+xml\"/>";
    opf.erase(opf.find(ncx_item), ncx_item.size());
    opf.replace(opf.find("<spine toc=\"ncx\">"), std::string("<spine toc=\"ncx\">").size(), "<spine>");
    store_->put("OEBPS/content.opf", opf);
    store_->remove("OEBPS/toc.ncx");

    ASSERT_TRUE(runFilters({FilterSpec(VersionUpgradeFilter::kName)}));
    const std::string nav = store_->getString("OEBPS/nav.xhtml");
    EXPECT_NE(nav.find("<a href=\"Text/c1.xhtml\">Chapter One</a>"), std::string::npos);
    EXPECT_NE(nav.find("href=\"Text/c2.xhtml\""), std::string::npos);
}

// ========== 隐私清理 ==========

// 测试8: 阅读器状态判定
TEST_F(BuiltinFiltersTest, PrivacyScrubClassification) {
    EXPECT_TRUE(PrivacyScrubFilter::isReaderState("META-INF/calibre_bookmarks.txt"));
    EXPECT_TRUE(PrivacyScrubFilter::isReaderState("iTunesMetadata.plist"));
    EXPECT_TRUE(PrivacyScrubFilter::isReaderState("__MACOSX/OEBPS/._c1.xhtml"));
    EXPECT_TRUE(PrivacyScrubFilter::isReaderState("OEBPS/Images/.DS_Store"));
    EXPECT_TRUE(PrivacyScrubFilter::isReaderState("OEBPS/book.annot"));
    EXPECT_FALSE(PrivacyScrubFilter::isReaderState("OEBPS/Text/c1.xhtml"));

    EXPECT_TRUE(PrivacyScrubFilter::isReaderStateMeta("calibre:timestamp"));
    EXPECT_TRUE(PrivacyScrubFilter::isReaderStateMeta("calibre:rating"));
    EXPECT_FALSE(PrivacyScrubFilter::isReaderStateMeta("calibre:series"));
    EXPECT_FALSE(PrivacyScrubFilter::isReaderStateMeta("cover"));
}

// 测试9: 清理条目与清单项
TEST_F(BuiltinFiltersTest, PrivacyScrubRemovesReaderState) {
    store_->put("META-INF/calibre_bookmarks.txt", std::string("bookmark data"));
    store_->put("iTunesMetadata.plist", std::string("<plist/>"));
    store_->put("OEBPS/Misc/.DS_Store", std::string("x"));
    std::string opf = opfText();
    opf.replace(opf.find("</manifest>"), 11,
                "<item id=\"junk\" href=\"Misc/.DS_Store\" media-type=\"application/octet-stream\"/></manifest>");
    store_->put("OEBPS/content.opf", opf);

    ASSERT_TRUE(runFilters({FilterSpec(PrivacyScrubFilter::kName)}));
    EXPECT_FALSE(store_->exists("META-INF/calibre_bookmarks.txt"));
    EXPECT_FALSE(store_->exists("iTunesMetadata.plist"));
    EXPECT_FALSE(store_->exists("OEBPS/Misc/.DS_Store"));

    const std::string scrubbed = opfText();
    EXPECT_EQ(scrubbed.find("id=\"junk\""), std::string::npos);
    EXPECT_EQ(scrubbed.find("calibre:timestamp"), std::string::npos);
    EXPECT_NE(scrubbed.find("name=\"cover\""), std::string::npos);
}

// ========== 元数据规范化 ==========

// 测试10: 语言标签
TEST_F(BuiltinFiltersTest, CanonicalLanguage) {
    EXPECT_EQ(MetadataNormalizeFilter::canonicalLanguage("zh_cn"), "zh-CN");
    EXPECT_EQ(MetadataNormalizeFilter::canonicalLanguage("EN-us"), "en-US");
    EXPECT_EQ(MetadataNormalizeFilter::canonicalLanguage("zh-hans-cn"), "zh-Hans-CN");
    EXPECT_EQ(MetadataNormalizeFilter::canonicalLanguage(" ja "), "ja");
}

// 测试11: 折叠空白、去重与语言规范化
TEST_F(BuiltinFiltersTest, MetadataNormalizeCleansFields) {
    std::string opf = opfText();
    opf.replace(opf.find("<dc:language>"), 13,
                "<dc:subject>  </dc:subject><dc:subject>Fiction</dc:subject><dc:subject>Fiction</dc:subject>"
                "<dc:language>");
    store_->put("OEBPS/content.opf", opf);

    ASSERT_TRUE(runFilters({FilterSpec(MetadataNormalizeFilter::kName)}));
    const std::string normalized = opfText();
    EXPECT_NE(normalized.find("<dc:title>Sample Book</dc:title>"), std::string::npos);
    EXPECT_NE(normalized.find("<dc:language>en-US</dc:language>"), std::string::npos);
    EXPECT_EQ(test::countOccurrences(normalized, "<dc:subject>"), 1u);
    EXPECT_EQ(normalized.find("<dc:subject>  </dc:subject>"), std::string::npos);
}

// 测试12: 补全书名与唯一标识符
TEST_F(BuiltinFiltersTest, MetadataNormalizeAddsTitleAndIdentifier) {
    store_->put("OEBPS/content.opf", std::string(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"2.0\">"
        "<metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\"></metadata>"
        "<manifest><item id=\"c1\" href=\"Text/c1.xhtml\" media-type=\"application/xhtml+xml\"/></manifest>"
        "<spine><itemref idref=\"c1\"/></spine></package>"));

    ASSERT_TRUE(runFilters({FilterSpec(MetadataNormalizeFilter::kName, {{"default_title", "Nameless"}})}));
    const std::string normalized = opfText();
    EXPECT_NE(normalized.find("<dc:title>Nameless</dc:title>"), std::string::npos);
    EXPECT_NE(normalized.find("unique-identifier=\"BookId\""), std::string::npos);
    EXPECT_NE(normalized.find("<dc:identifier id=\"BookId\">urn:uuid:"), std::string::npos);

    // 同样的条目集合得到同样的标识符
    const std::string first = normalized;
    store_->put("OEBPS/content.opf", first);
    ASSERT_TRUE(runFilters({FilterSpec(MetadataNormalizeFilter::kName, {{"default_title", "Nameless"}})}));
    EXPECT_EQ(opfText(), first);
}

}} // namespace ryuri::filter
