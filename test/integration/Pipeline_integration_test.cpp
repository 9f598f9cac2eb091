// RyuriCore - EPUB 包处理引擎
// 组件：处理流程集成测试
//
// 打开、过滤、排版、保护、导出、重新打开、解除保护的完整流程。

#include "ryuri/RyuriCore.hpp"
#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/layout/TrackingSpans.hpp"
#include "ryuri/protect/ProtectionCodec.hpp"
#include "ryuri/store/ArchivePackageStore.hpp"
#include "ryuri/store/PackageExporter.hpp"
#include "../unit/TestPackages.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>

namespace ryuri {

class PipelineIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ryuri::initialize("logs/integration_test.log", Logger::Level::DEBUG, false));
        test_dir_ = std::filesystem::temp_directory_path() / "ryuri_integration_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        ryuri::cleanup();
    }

    core::Path pathOf(const std::string& name) const {
        return core::Path((test_dir_ / name).string());
    }

    static std::vector<filter::FilterSpec> fullChain() {
        return {
            filter::FilterSpec("structural-repair"),
            filter::FilterSpec("version-upgrade", {{"modified", "2024-01-02T03:04:05Z"}}),
            filter::FilterSpec("privacy-scrub"),
            filter::FilterSpec("metadata-normalize"),
            filter::FilterSpec("style-optimize"),
            filter::FilterSpec("markup-optimize"),
            filter::FilterSpec("layout", {{"platform", "duokan"}}),
        };
    }

    std::filesystem::path test_dir_;
};

// 完整流程
TEST_F(PipelineIntegrationTest, CompleteWorkflow) {
    const core::Path source = pathOf("book.epub");
    exportPackage(*test::makeSampleStore(), source);

    // 过滤与排版
    auto book = openPackage(source);
    ASSERT_NE(book, nullptr);
    const auto result = runPipeline(*book, fullChain());
    ASSERT_TRUE(result) << result.error().fullMessage();

    const std::string opf = book->getString("OEBPS/content.opf");
    EXPECT_NE(opf.find("version=\"3.0\""), std::string::npos);
    EXPECT_NE(opf.find("2024-01-02T03:04:05Z"), std::string::npos);
    EXPECT_NE(opf.find("duokan-body-font"), std::string::npos);
    EXPECT_EQ(opf.find("calibre:timestamp"), std::string::npos);
    EXPECT_TRUE(book->exists("OEBPS/nav.xhtml"));
    EXPECT_TRUE(book->exists("OEBPS/Styles/fonts.css"));
    EXPECT_TRUE(book->exists("OEBPS/Images/note.svg"));

    const std::string chapter = book->getString("OEBPS/Text/c1.xhtml");
    EXPECT_NE(chapter.find(layout::TrackingSpans::kSpanClass), std::string::npos);
    EXPECT_NE(chapter.find("duokan-footnote"), std::string::npos);
    EXPECT_NE(chapter.find("id=\"B_1\""), std::string::npos);
    EXPECT_EQ(book->list().front(), "mimetype");

    const auto filtered = test::snapshot(*book);

    // 保护后导出
    const protect::ProtectionCodec codec;
    ASSERT_TRUE(codec.protect(*book, "integration-key"));
    EXPECT_FALSE(book->exists("OEBPS/Fonts/st.ttf"));
    const core::Path protected_path = pathOf("book.protected.epub");
    exportPackage(*book, protected_path, ExportFormat::Archive, 9);

    // 重新打开：mimetype 仍为首个 STORED 条目
    auto reopened = openPackage(protected_path);
    ASSERT_NE(reopened, nullptr);
    EXPECT_EQ(reopened->list().front(), "mimetype");
    EXPECT_EQ(reopened->getString("mimetype"), "application/epub+zip");
    EXPECT_TRUE(reopened->exists(core::EpubConstants::kProtectionManifestPath));

    // 错误密钥不改动包
    const auto before_wrong_key = test::snapshot(*reopened);
    const auto wrong = codec.unprotect(*reopened, "not-the-key");
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code, core::ErrorCode::AuthenticationFailure);
    EXPECT_EQ(test::snapshot(*reopened), before_wrong_key);

    // 解除保护后恢复过滤结果
    ASSERT_TRUE(codec.unprotect(*reopened, "integration-key"));
    EXPECT_EQ(test::snapshot(*reopened), filtered);

    // 目录导出再打开内容一致
    const core::Path unpacked = pathOf("unpacked");
    exportPackage(*reopened, unpacked, ExportFormat::Directory);
    EXPECT_EQ(test::snapshot(*openPackage(unpacked)), filtered);
}

// 过滤器失败时报告过滤器名与原因
TEST_F(PipelineIntegrationTest, FailureCarriesFilterName) {
    auto store = test::makeSampleStore();
    store->remove("META-INF/container.xml");
    store->remove("OEBPS/content.opf");

    const auto result = runPipeline(*store, {filter::FilterSpec("version-upgrade")});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::FilterFailure);
    EXPECT_EQ(result.error().context, "version-upgrade");
    EXPECT_EQ(result.error().cause, core::ErrorCode::NotFound);

    const auto unknown = runPipeline(*store, {filter::FilterSpec("no-such-filter")});
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, core::ErrorCode::InvalidArgument);
}

// 打开失败
TEST_F(PipelineIntegrationTest, OpenErrors) {
    try {
        openPackage(pathOf("missing.epub"));
        FAIL() << "expected PackageException";
    } catch (const core::PackageException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::IOFailure);
    }
    EXPECT_EQ(getVersion(), RYURI_VERSION_STRING);
}

} // namespace ryuri
