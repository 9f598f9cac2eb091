#include "ryuri/cache/DocumentCache.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/package/MediaTypes.hpp"
#include "ryuri/package/PackageLayout.hpp"
#include "ryuri/package/PathUtils.hpp"
#include "ryuri/utils/Logger.hpp"
#include "TestPackages.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ryuri {
namespace package {

class PackageLayoutTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/package_layout_test.log", Logger::Level::DEBUG, false);
        store_ = test::makeSampleStore();
        cache_ = std::make_unique<cache::DocumentCache>(*store_);
    }

    void TearDown() override {
        cache_.reset();
        store_.reset();
        Logger::getInstance().shutdown();
    }

    std::unique_ptr<store::ArchivePackageStore> store_;
    std::unique_ptr<cache::DocumentCache> cache_;
};

// 测试1: 相对路径换算
TEST_F(PackageLayoutTest, RelativePath) {
    EXPECT_EQ(PathUtils::relativePath("OEBPS/Text/c1.xhtml", "OEBPS/Styles/a.css"), "../Styles/a.css");
    EXPECT_EQ(PathUtils::relativePath("OEBPS/content.opf", "OEBPS/Text/c1.xhtml"), "Text/c1.xhtml");
    EXPECT_EQ(PathUtils::relativePath("OEBPS/Text/c1.xhtml", "OEBPS/Text/c2.xhtml"), "c2.xhtml");
    EXPECT_EQ(PathUtils::relativePath("content.opf", "OEBPS/x.css"), "OEBPS/x.css");
    EXPECT_EQ(PathUtils::relativePath("a/b/c.xhtml", "d.css"), "../../d.css");
}

// 测试2: href 解析为包内路径
TEST_F(PackageLayoutTest, BookPath) {
    EXPECT_EQ(PathUtils::bookPath("../Styles/a.css", "OEBPS/Text/c1.xhtml"), "OEBPS/Styles/a.css");
    EXPECT_EQ(PathUtils::bookPath("c2.xhtml#sec1", "OEBPS/Text/c1.xhtml"), "OEBPS/Text/c2.xhtml");
    EXPECT_EQ(PathUtils::bookPath("Text/My%20Chapter.xhtml", "OEBPS/content.opf"), "OEBPS/Text/My Chapter.xhtml");
    EXPECT_EQ(PathUtils::bookPath("./Images/./a.png?x=1", "OEBPS/content.opf"), "OEBPS/Images/a.png");
    EXPECT_EQ(PathUtils::bookPath("../../../escape.css", "OEBPS/Text/c1.xhtml"), "");
    EXPECT_EQ(PathUtils::bookPath("http://example.com/a.css", "OEBPS/Text/c1.xhtml"), "");
    EXPECT_EQ(PathUtils::bookPath("#note", "OEBPS/Text/c1.xhtml"), "");

    EXPECT_TRUE(PathUtils::isExternal("mailto:someone@example.com"));
    EXPECT_TRUE(PathUtils::isExternal("https://example.com"));
    EXPECT_FALSE(PathUtils::isExternal("Text/c1.xhtml"));
    EXPECT_FALSE(PathUtils::isExternal("_*:*:.ttf"));
    EXPECT_EQ(PathUtils::fragment("c1.xhtml#B_1"), "B_1");
    EXPECT_EQ(PathUtils::fragment("c1.xhtml"), "");
}

// 测试3: 百分号编解码
TEST_F(PackageLayoutTest, PercentCoding) {
    EXPECT_EQ(PathUtils::percentEncode("Text/My Chapter.xhtml"), "Text/My%20Chapter.xhtml");
    EXPECT_EQ(PathUtils::percentEncode("Fonts/_*:*:.ttf"), "Fonts/_*:*:.ttf");
    EXPECT_EQ(PathUtils::percentDecode("a%20b%2Fc"), "a b/c");
    EXPECT_EQ(PathUtils::percentDecode("100%"), "100%");
    EXPECT_EQ(PathUtils::percentDecode("%zz"), "%zz");
    EXPECT_EQ(PathUtils::percentDecode(PathUtils::percentEncode("图片/封面 1.jpg")), "图片/封面 1.jpg");
}

// 测试4: 媒体类型
TEST_F(PackageLayoutTest, MediaTypes) {
    EXPECT_EQ(MediaTypes::forPath("OEBPS/Text/c1.xhtml"), "application/xhtml+xml");
    EXPECT_EQ(MediaTypes::forPath("OEBPS/Fonts/a.TTF"), "font/ttf");
    EXPECT_EQ(MediaTypes::forPath("OEBPS/unknown.bin"), "application/octet-stream");
    EXPECT_TRUE(MediaTypes::isFont("application/x-font-ttf"));
    EXPECT_TRUE(MediaTypes::isImage("image/svg+xml"));
    EXPECT_TRUE(MediaTypes::equivalent("font/ttf", "application/vnd.ms-opentype"));
    EXPECT_FALSE(MediaTypes::equivalent("image/png", "image/jpeg"));
}

// 测试5: 加载包结构
TEST_F(PackageLayoutTest, LoadSamplePackage) {
    const PackageLayout layout = PackageLayout::load(*cache_);
    EXPECT_EQ(layout.opfPath(), "OEBPS/content.opf");
    EXPECT_EQ(layout.opfDirectory(), "OEBPS");
    EXPECT_EQ(layout.version(), "2.0");
    EXPECT_FALSE(layout.isVersion3());
    EXPECT_EQ(layout.uniqueIdentifier(), "urn:isbn:9780000000001");
    EXPECT_EQ(layout.items().size(), 6u);

    EXPECT_EQ(layout.spinePaths(), (std::vector<std::string>{"OEBPS/Text/c1.xhtml", "OEBPS/Text/c2.xhtml"}));
    EXPECT_EQ(layout.markupPaths().size(), 2u);
    EXPECT_EQ(layout.stylePaths(), (std::vector<std::string>{"OEBPS/Styles/main.css"}));
    EXPECT_EQ(layout.ncxPath(), "OEBPS/toc.ncx");
    EXPECT_EQ(layout.navPath(), "");

    const ManifestItem* font = layout.findByPath("OEBPS/Fonts/st.ttf");
    ASSERT_NE(font, nullptr);
    EXPECT_EQ(font->id, "font");
    EXPECT_EQ(layout.hrefFor("OEBPS/Images/cover.jpg"), "Images/cover.jpg");

    EXPECT_EQ(layout.uniqueId("nav"), "nav");
    EXPECT_EQ(layout.uniqueId("c1"), "c1-1");
}

// 测试6: 清单顺序
TEST_F(PackageLayoutTest, ManifestOrder) {
    store_->put("OEBPS/extra.txt", std::string("x"));
    const PackageLayout layout = PackageLayout::load(*cache_);
    layout.applyManifestOrder(*store_);

    const std::vector<std::string> expected = {
        "mimetype", "META-INF/container.xml", "OEBPS/content.opf",
        "OEBPS/Text/c1.xhtml", "OEBPS/Text/c2.xhtml",
        "OEBPS/toc.ncx", "OEBPS/Styles/main.css", "OEBPS/Fonts/st.ttf", "OEBPS/Images/cover.jpg",
        "OEBPS/extra.txt"};
    EXPECT_EQ(store_->list(), expected);
}

// 测试7: 没有 container 时扫描 .opf 条目
TEST_F(PackageLayoutTest, LocateOpfWithoutContainer) {
    store_->remove("META-INF/container.xml");
    EXPECT_EQ(PackageLayout::locateOpf(*cache_), "OEBPS/content.opf");

    store_->put("META-INF/container.xml", std::string("<container><broken"));
    EXPECT_EQ(PackageLayout::locateOpf(*cache_), "OEBPS/content.opf");

    store_->remove("OEBPS/content.opf");
    EXPECT_EQ(PackageLayout::locateOpf(*cache_), "");
    try {
        PackageLayout::load(*cache_);
        FAIL() << "expected NotFound";
    } catch (const core::PackageException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::NotFound);
    }
}

}} // namespace ryuri::package
