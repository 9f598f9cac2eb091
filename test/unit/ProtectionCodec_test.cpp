#include "ryuri/core/Constants.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/protect/ProtectionCodec.hpp"
#include "ryuri/protect/ProtectionManifest.hpp"
#include "ryuri/store/EntryPath.hpp"
#include "ryuri/utils/Digest.hpp"
#include "ryuri/utils/Logger.hpp"
#include "TestPackages.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ryuri {
namespace protect {

class ProtectionCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/protection_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    static std::unique_ptr<store::ArchivePackageStore> makeAssetStore() {
        auto store = std::make_unique<store::ArchivePackageStore>();
        store->put("fonts/a.ttf", std::vector<uint8_t>(16, 0xFF));
        store->put("images/b.png", std::vector<uint8_t>());
        return store;
    }

    static ProtectionManifest readManifest(store::PackageStore& store) {
        const std::string path = core::EpubConstants::kProtectionManifestPath;
        return ProtectionManifest::fromDocument(xml::Document::parse(store.get(path), path), path);
    }
};

// ========== 方案细节 ==========

// 测试1: 混淆路径格式
TEST_F(ProtectionCodecTest, ObfuscatedPathFormat) {
    const std::string obfuscated = ProtectionCodec::obfuscatedPath("fonts/a.ttf", "salt");
    ASSERT_EQ(obfuscated.size(), std::string("fonts/_").size() + 32 + std::string(".ttf").size());
    EXPECT_EQ(obfuscated.compare(0, 7, "fonts/_"), 0);
    EXPECT_EQ(store::EntryPath::extension(obfuscated), "ttf");
    EXPECT_TRUE(ProtectionCodec::isObfuscatedName(store::EntryPath::fileName(obfuscated)));
    EXPECT_EQ(ProtectionCodec::obfuscatedPath("fonts/a.ttf", "salt"), obfuscated);
    EXPECT_NE(ProtectionCodec::obfuscatedPath("fonts/a.ttf", "pepper"), obfuscated);

    const std::string root_level = ProtectionCodec::obfuscatedPath("a.png", "salt");
    EXPECT_EQ(root_level.front(), '_');
    EXPECT_EQ(root_level.find('/'), std::string::npos);

    EXPECT_FALSE(ProtectionCodec::isObfuscatedName("a.ttf"));
    EXPECT_FALSE(ProtectionCodec::isObfuscatedName("_" + std::string(31, '*') + "x.ttf"));
}

// 测试2: 密钥流加扰可逆
TEST_F(ProtectionCodecTest, TransformIsInvolution) {
    std::vector<uint8_t> data(40);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i);

    const auto scrambled = ProtectionCodec::transform(data, "pw", "salt", "fonts/a.ttf");
    ASSERT_EQ(scrambled.size(), data.size());
    EXPECT_NE(scrambled, data);
    EXPECT_EQ(ProtectionCodec::transform(scrambled, "pw", "salt", "fonts/a.ttf"), data);
    EXPECT_NE(ProtectionCodec::transform(data, "other", "salt", "fonts/a.ttf"), scrambled);
    EXPECT_TRUE(ProtectionCodec::transform({}, "pw", "salt", "x").empty());
}

// 测试3: 盐值来源
TEST_F(ProtectionCodecTest, SaltSources) {
    auto sample = test::makeSampleStore();
    cache::DocumentCache sample_cache(*sample);
    EXPECT_EQ(ProtectionCodec::computeSalt(sample_cache), utils::Digest::md5Hex("urn:isbn:9780000000001"));

    auto assets = makeAssetStore();
    cache::DocumentCache asset_cache(*assets);
    EXPECT_EQ(ProtectionCodec::computeSalt(asset_cache), utils::Digest::md5Hex("fonts/a.ttf\nimages/b.png"));
}

// 测试4: 引用改写只匹配完整路径
TEST_F(ProtectionCodecTest, RewriteReferences) {
    std::string text = "<img src=\"../Images/a b.png\"/><img src=\"../Images/a%20b.png\"/>"
                       "<img src=\"../Images/xa b.png\"/>";
    const std::map<std::string, std::string> mapping = {{"OEBPS/Images/a b.png", "OEBPS/Images/_x.png"}};
    EXPECT_EQ(ProtectionCodec::rewriteReferences(text, "OEBPS/Text/c.xhtml", mapping), 2u);
    EXPECT_EQ(text, "<img src=\"../Images/_x.png\"/><img src=\"../Images/_x.png\"/>"
                    "<img src=\"../Images/xa b.png\"/>");
}

// ========== protect / unprotect ==========

// 测试5: 字体与图片的保护和恢复
TEST_F(ProtectionCodecTest, ProtectAndRestoreAssets) {
    auto store = makeAssetStore();
    const auto original = test::snapshot(*store);
    const ProtectionCodec codec;

    ASSERT_TRUE(codec.protect(*store, "pw"));
    EXPECT_FALSE(store->exists("fonts/a.ttf"));
    EXPECT_FALSE(store->exists("images/b.png"));

    const ProtectionManifest manifest = readManifest(*store);
    ASSERT_EQ(manifest.records().size(), 2u);
    const ProtectionRecord* font = manifest.findByPath("fonts/a.ttf");
    ASSERT_NE(font, nullptr);
    EXPECT_EQ(font->size, 16u);
    EXPECT_EQ(font->algorithm, "basic");
    ASSERT_TRUE(store->exists(font->obfuscated));
    EXPECT_NE(store->get(font->obfuscated), std::vector<uint8_t>(16, 0xFF));
    const ProtectionRecord* image = manifest.findByPath("images/b.png");
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->size, 0u);
    EXPECT_TRUE(store->get(image->obfuscated).empty());

    ASSERT_TRUE(codec.unprotect(*store, "pw"));
    EXPECT_EQ(test::snapshot(*store), original);
}

// 测试6: 完整书籍往返后字节一致
TEST_F(ProtectionCodecTest, SamplePackageRoundTrip) {
    auto store = test::makeSampleStore();
    const auto original = test::snapshot(*store);
    const ProtectionCodec codec;

    ASSERT_TRUE(codec.protect(*store, "secret"));
    EXPECT_FALSE(store->exists("OEBPS/Fonts/st.ttf"));
    EXPECT_FALSE(store->exists("OEBPS/Images/cover.jpg"));
    EXPECT_TRUE(store->exists("OEBPS/Styles/main.css"));
    EXPECT_EQ(store->list().front(), "mimetype");

    // 引用随之改写
    const std::string opf = store->getString("OEBPS/content.opf");
    EXPECT_EQ(opf.find("Fonts/st.ttf"), std::string::npos);
    EXPECT_EQ(store->getString("OEBPS/Text/c1.xhtml").find("cover.jpg"), std::string::npos);

    ASSERT_TRUE(codec.unprotect(*store, "secret"));
    EXPECT_EQ(test::snapshot(*store), original);
    EXPECT_FALSE(store->exists(core::EpubConstants::kProtectionManifestPath));
}

// 测试7: 重复保护只处理新条目
TEST_F(ProtectionCodecTest, ProtectTwiceKeepsRecords) {
    auto store = makeAssetStore();
    const ProtectionCodec codec;
    ASSERT_TRUE(codec.protect(*store, "pw"));
    const auto protected_state = test::snapshot(*store);

    ASSERT_TRUE(codec.protect(*store, "pw"));
    EXPECT_EQ(test::snapshot(*store), protected_state);
    EXPECT_EQ(readManifest(*store).records().size(), 2u);
}

// 测试8: 错误密钥不修改存储
TEST_F(ProtectionCodecTest, WrongKeyRejected) {
    auto store = makeAssetStore();
    const ProtectionCodec codec;
    ASSERT_TRUE(codec.protect(*store, "pw"));
    const auto protected_state = test::snapshot(*store);

    const auto result = codec.unprotect(*store, "wrong");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::AuthenticationFailure);
    EXPECT_EQ(test::snapshot(*store), protected_state);
}

// 测试9: 没有清单
TEST_F(ProtectionCodecTest, UnprotectWithoutManifest) {
    auto store = makeAssetStore();
    const auto result = ProtectionCodec().unprotect(*store, "pw");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::NotFound);
}

// 测试10: 清单与内容不符
TEST_F(ProtectionCodecTest, InconsistentManifest) {
    auto store = makeAssetStore();
    const ProtectionCodec codec;
    ASSERT_TRUE(codec.protect(*store, "pw"));
    const ProtectionRecord* font = readManifest(*store).findByPath("fonts/a.ttf");
    ASSERT_NE(font, nullptr);
    const std::string obfuscated = font->obfuscated;

    // 大小不符
    store->put(obfuscated, std::vector<uint8_t>(3, 0));
    auto result = codec.unprotect(*store, "pw");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::ManifestInconsistent);

    // 原路径被占用
    store->put(obfuscated, std::vector<uint8_t>(16, 0));
    store->put("fonts/a.ttf", std::vector<uint8_t>{1});
    result = codec.unprotect(*store, "pw");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::ManifestInconsistent);

    // 混淆条目缺失
    store->remove("fonts/a.ttf");
    store->remove(obfuscated);
    result = codec.unprotect(*store, "pw");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::ManifestInconsistent);
    EXPECT_TRUE(store->exists(core::EpubConstants::kProtectionManifestPath));
}

// 测试11: 未知算法
TEST_F(ProtectionCodecTest, UnknownAlgorithm) {
    auto store = makeAssetStore();
    const auto original = test::snapshot(*store);
    ProtectionOptions options;
    options.algorithm = "rot13";

    const auto result = ProtectionCodec(options).protect(*store, "pw");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::InvalidArgument);
    EXPECT_EQ(test::snapshot(*store), original);
}

// 测试12: 扩展名选择
TEST_F(ProtectionCodecTest, ExtensionSelection) {
    auto store = makeAssetStore();
    ProtectionOptions options;
    options.extensions = {".TTF"};

    ASSERT_TRUE(ProtectionCodec(options).protect(*store, "pw"));
    EXPECT_FALSE(store->exists("fonts/a.ttf"));
    EXPECT_TRUE(store->exists("images/b.png"));
    EXPECT_EQ(readManifest(*store).records().size(), 1u);
}

// ========== 清单 ==========

// 测试13: 清单解析错误
TEST_F(ProtectionCodecTest, ManifestParseErrors) {
    const auto parse = [](const std::string& text) {
        return ProtectionManifest::fromDocument(xml::Document::parse(text, "m.xml"), "m.xml");
    };
    const std::string entry = "<entry path=\"a.ttf\" obfuscated=\"_x.ttf\" algorithm=\"basic\" salt=\"s\" "
                              "size=\"4\" checksum=\"c\"/>";

    EXPECT_EQ(parse("<protection version=\"1.0\">" + entry + "</protection>").records().size(), 1u);

    try {
        parse("<manifest/>");
        FAIL() << "expected PackageException";
    } catch (const core::PackageException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::ManifestInconsistent);
        EXPECT_EQ(e.getEntryPath(), "m.xml");
    }
    EXPECT_THROW(parse("<protection><entry path=\"a.ttf\"/></protection>"), core::PackageException);
    EXPECT_THROW(parse("<protection>" + entry + entry + "</protection>"), core::PackageException);

    std::string bad_size = entry;
    bad_size.replace(bad_size.find("size=\"4\""), 8, "size=\"-4\"");
    EXPECT_THROW(parse("<protection>" + bad_size + "</protection>"), core::PackageException);
}

// 测试14: 合并替换同路径记录
TEST_F(ProtectionCodecTest, ManifestMerge) {
    ProtectionManifest manifest;
    ProtectionRecord record;
    record.path = "a.ttf";
    record.obfuscated = "_1.ttf";
    record.size = 1;
    manifest.merge(record);
    record.obfuscated = "_2.ttf";
    record.size = 2;
    manifest.merge(record);
    record.path = "b.ttf";
    manifest.merge(record);

    ASSERT_EQ(manifest.records().size(), 2u);
    EXPECT_EQ(manifest.findByPath("a.ttf")->obfuscated, "_2.ttf");
    EXPECT_EQ(manifest.findByPath("a.ttf")->size, 2u);
    EXPECT_EQ(manifest.findByObfuscated("_1.ttf"), nullptr);

    const xml::Document document = manifest.toDocument();
    EXPECT_EQ(document.root()->name(), "protection");
    EXPECT_EQ(document.root()->attributeOr("version"), "1.0");
    EXPECT_EQ(document.root()->childElements("entry").size(), 2u);
}

}} // namespace ryuri::protect
