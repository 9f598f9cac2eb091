#include "ryuri/RyuriCore.hpp"
#include "ryuri/archive/ZipReader.hpp"
#include "ryuri/archive/ZipWriter.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/store/ArchivePackageStore.hpp"
#include "ryuri/store/DirectoryPackageStore.hpp"
#include "ryuri/store/EntryPath.hpp"
#include "ryuri/store/PackageExporter.hpp"
#include "ryuri/utils/Logger.hpp"
#include "TestPackages.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>

namespace ryuri {
namespace store {

namespace {

std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string reorderedOpf(const std::string& first, const std::string& second) {
    return std::string(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"3.0\" unique-identifier=\"uid\">"
        "<metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\">"
        "<dc:identifier id=\"uid\">urn:uuid:order</dc:identifier><dc:title>Order</dc:title>"
        "</metadata><manifest>"
        "<item id=\"") + first + "\" href=\"" + first + ".xhtml\" media-type=\"application/xhtml+xml\"/>"
        "<item id=\"" + second + "\" href=\"" + second + ".xhtml\" media-type=\"application/xhtml+xml\"/>"
        "</manifest><spine>"
        "<itemref idref=\"" + first + "\"/><itemref idref=\"" + second + "\"/>"
        "</spine></package>";
}

std::vector<archive::ZipReader::Entry> readEntries(std::vector<uint8_t> blob) {
    archive::ZipReader reader(std::move(blob));
    EXPECT_EQ(reader.open(), archive::ZipError::Ok);
    std::vector<archive::ZipReader::Entry> entries;
    std::string failed;
    EXPECT_EQ(reader.readAll(entries, failed), archive::ZipError::Ok);
    return entries;
}

} // namespace

class PackageStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/package_store_test.log", Logger::Level::DEBUG, false);
        test_dir_ = std::filesystem::temp_directory_path() / "ryuri_package_store_test";
        std::filesystem::remove_all(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        Logger::getInstance().shutdown();
    }

    // 构建一个带不同压缩方式与时间戳的归档
    std::vector<uint8_t> buildArchive() {
        archive::ZipWriter writer(6);
        EXPECT_EQ(writer.open(), archive::ZipError::Ok);

        archive::ZipWriter::EntryOptions stored;
        stored.method = archive::ZipWriter::Method::Store;
        stored.modified_date = 1600000000;
        archive::ZipWriter::EntryOptions deflated;
        deflated.method = archive::ZipWriter::Method::Deflate;
        deflated.modified_date = 1500000000;

        EXPECT_EQ(writer.addEntry("mimetype", bytesOf("application/epub+zip"), stored), archive::ZipError::Ok);
        EXPECT_EQ(writer.addEntry("META-INF/container.xml", bytesOf(test::sampleContainer()), deflated),
                  archive::ZipError::Ok);
        EXPECT_EQ(writer.addEntry("OEBPS/content.opf", bytesOf(test::sampleOpf()), deflated),
                  archive::ZipError::Ok);
        EXPECT_EQ(writer.addEntry("OEBPS/Images/cover.jpg", test::sampleCoverBytes(), stored),
                  archive::ZipError::Ok);
        EXPECT_EQ(writer.addEntry("OEBPS/Text/c1.xhtml", bytesOf(test::sampleChapterOne()), deflated),
                  archive::ZipError::Ok);

        std::vector<uint8_t> blob;
        EXPECT_EQ(writer.finish(blob), archive::ZipError::Ok);
        return blob;
    }

    std::filesystem::path test_dir_;
};

// 测试1: 条目路径校验
TEST_F(PackageStoreTest, EntryPathValidation) {
    EXPECT_TRUE(EntryPath::isValid("mimetype"));
    EXPECT_TRUE(EntryPath::isValid("OEBPS/Text/c1.xhtml"));
    EXPECT_FALSE(EntryPath::isValid(""));
    EXPECT_FALSE(EntryPath::isValid("/abs/path"));
    EXPECT_FALSE(EntryPath::isValid("dir/"));
    EXPECT_FALSE(EntryPath::isValid("a//b"));
    EXPECT_FALSE(EntryPath::isValid("a/../b"));
    EXPECT_FALSE(EntryPath::isValid("./a"));
    EXPECT_FALSE(EntryPath::isValid("a\\b"));
    EXPECT_THROW(EntryPath::validate("../escape"), core::ParameterException);

    EXPECT_EQ(EntryPath::extension("OEBPS/Fonts/ST.TTF"), "ttf");
    EXPECT_EQ(EntryPath::extension("OEBPS/.hidden"), "");
    EXPECT_EQ(EntryPath::directory("OEBPS/Text/c1.xhtml"), "OEBPS/Text");
    EXPECT_EQ(EntryPath::directory("mimetype"), "");
    EXPECT_EQ(EntryPath::fileName("OEBPS/Text/c1.xhtml"), "c1.xhtml");
    EXPECT_EQ(EntryPath::stem("OEBPS/Text/c1.xhtml"), "c1");

    EXPECT_EQ(EntryPath::contentFlag("OEBPS/content.opf"), ContentFlag::Markup);
    EXPECT_EQ(EntryPath::contentFlag("OEBPS/Styles/main.css"), ContentFlag::Text);
    EXPECT_EQ(EntryPath::contentFlag("mimetype"), ContentFlag::Text);
    EXPECT_EQ(EntryPath::contentFlag("OEBPS/Fonts/st.ttf"), ContentFlag::Binary);
}

// 测试2: 内存存储的基本读写与修订号
TEST_F(PackageStoreTest, ArchiveStoreBasicOperations) {
    ArchivePackageStore store;
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.revision("a.txt"), 0u);

    store.put("a.txt", std::string("hello"));
    EXPECT_TRUE(store.exists("a.txt"));
    EXPECT_EQ(store.getString("a.txt"), "hello");
    EXPECT_EQ(store.revision("a.txt"), 1u);

    store.put("a.txt", std::string("world"));
    EXPECT_EQ(store.getString("a.txt"), "world");
    EXPECT_EQ(store.revision("a.txt"), 2u);
    EXPECT_EQ(store.size(), 1u);

    // SHA-256("world")
    EXPECT_EQ(store.contentHash("a.txt"),
              "486ea46224d1bb4fb680f34f7c9ad96a8f24ec88be73ea8e5a6c65260e9cb8a7");

    store.remove("a.txt");
    EXPECT_FALSE(store.exists("a.txt"));
    EXPECT_EQ(store.revision("a.txt"), 3u);

    try {
        store.get("a.txt");
        FAIL() << "expected NotFound";
    } catch (const core::PackageException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::NotFound);
        EXPECT_EQ(e.getEntryPath(), "a.txt");
    }
    EXPECT_THROW(store.remove("a.txt"), core::PackageException);
    EXPECT_THROW(store.put("../x", std::string("x")), core::ParameterException);
    EXPECT_FALSE(store.exists("../x"));
}

// 测试3: 列表顺序先清单后插入
TEST_F(PackageStoreTest, ListHonoursManifestOrder) {
    ArchivePackageStore store;
    store.put("c", std::string("3"));
    store.put("a", std::string("1"));
    store.put("b", std::string("2"));
    EXPECT_EQ(store.list(), (std::vector<std::string>{"c", "a", "b"}));

    store.setManifestOrder({"b", "missing", "a"});
    EXPECT_EQ(store.list(), (std::vector<std::string>{"b", "a", "c"}));
}

// 测试4: 未改写的条目导出后与原归档逐项一致
TEST_F(PackageStoreTest, ArchiveRoundTripPreservesEntries) {
    const std::vector<uint8_t> original = buildArchive();
    auto store = ArchivePackageStore::fromBlob(original);
    ASSERT_EQ(store->size(), 5u);

    const EntryAttributes cover = store->attributes("OEBPS/Images/cover.jpg");
    EXPECT_EQ(cover.compression_method, 0);
    EXPECT_FALSE(cover.modified);

    const std::vector<uint8_t> exported = PackageExporter().toArchive(*store);

    const auto before = readEntries(original);
    const auto after = readEntries(exported);
    ASSERT_EQ(before.size(), after.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(before[i].info.path, after[i].info.path);
        EXPECT_EQ(before[i].data, after[i].data);
        EXPECT_EQ(before[i].info.compression_method, after[i].info.compression_method) << before[i].info.path;
        EXPECT_EQ(before[i].info.modified_date, after[i].info.modified_date) << before[i].info.path;
    }
}

// 测试5: 导出时 mimetype 总在首位且不压缩
TEST_F(PackageStoreTest, ExportPutsMimetypeFirst) {
    ArchivePackageStore store;
    store.put("OEBPS/content.opf", std::string(test::sampleOpf()));
    store.put("META-INF/container.xml", std::string(test::sampleContainer()));

    const auto entries = readEntries(PackageExporter().toArchive(store));
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].info.path, "mimetype");
    EXPECT_EQ(entries[0].info.compression_method, 0);
    EXPECT_EQ(std::string(entries[0].data.begin(), entries[0].data.end()), "application/epub+zip");
    EXPECT_EQ(entries[1].info.path, "OEBPS/content.opf");
    EXPECT_EQ(entries[2].info.path, "META-INF/container.xml");
}

// 测试6: 损坏的归档
TEST_F(PackageStoreTest, CorruptArchiveIsRejected) {
    std::vector<uint8_t> garbage(256, 0x5A);
    try {
        ArchivePackageStore::fromBlob(garbage);
        FAIL() << "expected CorruptArchive";
    } catch (const core::PackageException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::CorruptArchive);
    }

    std::vector<uint8_t> truncated = buildArchive();
    truncated.resize(truncated.size() / 2);
    EXPECT_THROW(ArchivePackageStore::fromBlob(truncated), core::PackageException);

    EXPECT_THROW(ArchivePackageStore::fromFile(core::Path((test_dir_ / "missing.epub").string())),
                 core::PackageException);
}

// 测试7: 目录存储与内存存储行为一致
TEST_F(PackageStoreTest, DirectoryStoreMatchesArchiveStore) {
    auto directory = DirectoryPackageStore::create(core::Path(test_dir_.string()));
    ArchivePackageStore memory;

    for (PackageStore* store : {static_cast<PackageStore*>(directory.get()), static_cast<PackageStore*>(&memory)}) {
        test::fillSamplePackage(*store);
        store->put("OEBPS/Text/c2.xhtml", std::string("<html/>"));
        store->remove("OEBPS/Images/cover.jpg");
        EXPECT_THROW(store->get("OEBPS/Images/cover.jpg"), core::PackageException) << store->backendName();
        EXPECT_EQ(store->revision("OEBPS/Text/c2.xhtml"), 2u) << store->backendName();
    }
    EXPECT_EQ(directory->list(), memory.list());
    EXPECT_EQ(test::snapshot(*directory), test::snapshot(memory));

    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "OEBPS" / "Fonts" / "st.ttf"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "OEBPS" / "Images" / "cover.jpg"));
}

// 测试8: 重新打开目录得到同样的内容
TEST_F(PackageStoreTest, DirectoryStoreReopen) {
    auto memory = test::makeSampleStore();
    PackageExporter().toDirectory(*memory, core::Path(test_dir_.string()));

    auto reopened = DirectoryPackageStore::open(core::Path(test_dir_.string()));
    EXPECT_EQ(test::snapshot(*reopened), test::snapshot(*memory));
    EXPECT_STREQ(reopened->backendName(), "directory");

    EXPECT_THROW(DirectoryPackageStore::open(core::Path((test_dir_ / "nope").string())), core::PackageException);
}

// 测试9: 写入归档文件后重新读取
TEST_F(PackageStoreTest, ArchiveFileRoundTrip) {
    auto memory = test::makeSampleStore();
    const core::Path target((test_dir_ / "out" / "book.epub").string());
    PackageExporter(9).toArchiveFile(*memory, target);
    ASSERT_TRUE(target.isFile());

    auto reopened = ArchivePackageStore::fromFile(target);
    EXPECT_EQ(test::snapshot(*reopened), test::snapshot(*memory));
    EXPECT_EQ(reopened->list().front(), "mimetype");
}

// 测试10: 打开后与过滤后 list() 按 OPF 清单排序
TEST_F(PackageStoreTest, OpenedPackageFollowsManifestOrder) {
    {
        auto directory = DirectoryPackageStore::create(core::Path(test_dir_.string()));
        directory->put("mimetype", std::string("application/epub+zip"));
        directory->put("META-INF/container.xml", std::string(test::sampleContainer()));
        directory->put("OEBPS/content.opf", reorderedOpf("z", "a"));
        directory->put("OEBPS/a.xhtml", std::string("<html xmlns=\"http://www.w3.org/1999/xhtml\"/>"));
        directory->put("OEBPS/z.xhtml", std::string("<html xmlns=\"http://www.w3.org/1999/xhtml\"/>"));
    }

    auto opened = openPackage(core::Path(test_dir_.string()));
    const std::vector<std::string> expected = {"mimetype", "META-INF/container.xml", "OEBPS/content.opf",
                                               "OEBPS/z.xhtml", "OEBPS/a.xhtml"};
    EXPECT_EQ(opened->list(), expected);

    // 改写 OPF 后，过滤链结束时顺序随之更新
    opened->put("OEBPS/content.opf", reorderedOpf("a", "z"));
    ASSERT_TRUE(runPipeline(*opened, {filter::FilterSpec("privacy-scrub")}));
    const std::vector<std::string> swapped = {"mimetype", "META-INF/container.xml", "OEBPS/content.opf",
                                              "OEBPS/a.xhtml", "OEBPS/z.xhtml"};
    EXPECT_EQ(opened->list(), swapped);

    // 没有 OPF 的目录按原顺序打开
    std::filesystem::remove(test_dir_ / "OEBPS" / "content.opf");
    std::filesystem::remove(test_dir_ / "META-INF" / "container.xml");
    auto bare = openPackage(core::Path(test_dir_.string()));
    EXPECT_EQ(bare->size(), 3u);
    EXPECT_EQ(bare->list(), DirectoryPackageStore::open(core::Path(test_dir_.string()))->list());
}

}} // namespace ryuri::store
