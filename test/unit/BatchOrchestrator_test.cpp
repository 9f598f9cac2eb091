#include "ryuri/batch/BatchOrchestrator.hpp"
#include "ryuri/store/PackageExporter.hpp"
#include "ryuri/utils/Logger.hpp"
#include "TestPackages.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace ryuri {
namespace batch {

class BatchOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/batch_test.log", Logger::Level::DEBUG, false);
        test_dir_ = std::filesystem::temp_directory_path() / "ryuri_batch_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        sample_ = pathOf("sample.epub");
        store::PackageExporter().toArchiveFile(*test::makeSampleStore(), sample_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        Logger::getInstance().shutdown();
    }

    core::Path pathOf(const std::string& name) const {
        return core::Path((test_dir_ / name).string());
    }

    static BatchJob pipelineJob(const core::Path& input, const core::Path& output) {
        BatchJob job;
        job.input = input;
        job.output = output;
        return job;
    }

    std::map<std::string, std::vector<uint8_t>> reopen(const core::Path& path) const {
        return test::snapshot(*openPackage(path));
    }

    std::filesystem::path test_dir_;
    core::Path sample_;
};

// 测试1: 结果按提交顺序返回，失败任务不影响其他任务
TEST_F(BatchOrchestratorTest, ResultsInSubmissionOrder) {
    {
        std::ofstream garbage((test_dir_ / "garbage.epub").string(), std::ios::binary);
        garbage << "this is not a zip archive";
    }

    BatchOrchestrator orchestrator(2);
    const JobId first = orchestrator.submit(pipelineJob(sample_, pathOf("out1.epub")));
    orchestrator.submit(pipelineJob(pathOf("missing.epub"), pathOf("out2.epub")));
    orchestrator.submit(pipelineJob(pathOf("garbage.epub"), pathOf("out3.epub")));
    const JobId last = orchestrator.submit(pipelineJob(sample_, pathOf("out4.epub")));
    EXPECT_EQ(orchestrator.pendingCount(), 4u);

    const auto results = orchestrator.runAll();
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].id, first);
    EXPECT_EQ(results[3].id, last);

    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[0].error.has_value());
    EXPECT_FALSE(results[1].success);
    ASSERT_TRUE(results[1].error.has_value());
    EXPECT_EQ(results[1].error->code, core::ErrorCode::IOFailure);
    EXPECT_FALSE(results[2].success);
    ASSERT_TRUE(results[2].error.has_value());
    EXPECT_EQ(results[2].error->code, core::ErrorCode::CorruptArchive);
    EXPECT_TRUE(results[3].success);
    EXPECT_EQ(results[1].input, pathOf("missing.epub"));

    EXPECT_TRUE(pathOf("out1.epub").exists());
    EXPECT_FALSE(pathOf("out2.epub").exists());
    EXPECT_FALSE(pathOf("out3.epub").exists());
    EXPECT_TRUE(pathOf("out4.epub").exists());

    // 默认过滤器链已执行
    const auto output = reopen(pathOf("out1.epub"));
    ASSERT_TRUE(output.count("OEBPS/content.opf"));
    const auto& opf = output.at("OEBPS/content.opf");
    EXPECT_NE(std::string(opf.begin(), opf.end()).find("version=\"3.0\""), std::string::npos);
    EXPECT_TRUE(reopen(pathOf("out4.epub")).count("OEBPS/nav.xhtml"));

    EXPECT_EQ(orchestrator.pendingCount(), 0u);
    EXPECT_TRUE(orchestrator.runAll().empty());
}

// 测试2: 取消尚未开始的任务
TEST_F(BatchOrchestratorTest, CancelPendingJob) {
    BatchOrchestrator orchestrator(1);
    orchestrator.submit(pipelineJob(sample_, pathOf("kept.epub")));
    const JobId cancelled = orchestrator.submit(pipelineJob(sample_, pathOf("cancelled.epub")));

    EXPECT_TRUE(orchestrator.cancel(cancelled));
    EXPECT_FALSE(orchestrator.cancel(cancelled));
    EXPECT_FALSE(orchestrator.cancel(999));
    EXPECT_EQ(orchestrator.pendingCount(), 1u);

    const auto results = orchestrator.runAll();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[1].success);
    ASSERT_TRUE(results[1].error.has_value());
    EXPECT_EQ(results[1].error->code, core::ErrorCode::Cancelled);
    EXPECT_FALSE(pathOf("cancelled.epub").exists());
}

// 测试3: 超时任务不导出
TEST_F(BatchOrchestratorTest, TimeoutSkipsExport) {
    BatchOrchestrator orchestrator(1);
    BatchJob job = pipelineJob(sample_, pathOf("late.epub"));
    job.timeout = std::chrono::milliseconds(0);
    orchestrator.submit(job);

    const auto results = orchestrator.runAll();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].success);
    ASSERT_TRUE(results[0].error.has_value());
    EXPECT_EQ(results[0].error->code, core::ErrorCode::Timeout);
    EXPECT_FALSE(pathOf("late.epub").exists());
}

// 测试4: 任务自带过滤器链
TEST_F(BatchOrchestratorTest, JobSpecificFilters) {
    BatchOrchestrator orchestrator(2);
    BatchJob repair = pipelineJob(sample_, pathOf("repair.epub"));
    repair.filters = std::vector<filter::FilterSpec>{filter::FilterSpec("structural-repair")};
    orchestrator.submit(repair);

    BatchJob unknown = pipelineJob(sample_, pathOf("unknown.epub"));
    unknown.filters = std::vector<filter::FilterSpec>{filter::FilterSpec("no-such-filter")};
    orchestrator.submit(unknown);

    const auto results = orchestrator.runAll();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].success);
    const auto output = reopen(pathOf("repair.epub"));
    const auto& opf = output.at("OEBPS/content.opf");
    EXPECT_NE(std::string(opf.begin(), opf.end()).find("version=\"2.0\""), std::string::npos);

    ASSERT_TRUE(results[1].error.has_value());
    EXPECT_EQ(results[1].error->code, core::ErrorCode::InvalidArgument);
    EXPECT_FALSE(pathOf("unknown.epub").exists());
}

// 测试5: 保护与解除保护任务
TEST_F(BatchOrchestratorTest, ProtectThenUnprotect) {
    BatchOrchestrator orchestrator(2);
    BatchJob protect_job = pipelineJob(sample_, pathOf("protected.epub"));
    protect_job.kind = JobKind::Protect;
    protect_job.key = "k";
    orchestrator.submit(protect_job);
    auto results = orchestrator.runAll();
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].success);
    EXPECT_TRUE(reopen(pathOf("protected.epub")).count("META-INF/protection.xml"));

    BatchJob wrong = pipelineJob(pathOf("protected.epub"), pathOf("wrong.epub"));
    wrong.kind = JobKind::Unprotect;
    wrong.key = "nope";
    BatchJob right = pipelineJob(pathOf("protected.epub"), pathOf("restored"));
    right.kind = JobKind::Unprotect;
    right.key = "k";
    right.format = ExportFormat::Directory;
    orchestrator.submit(wrong);
    orchestrator.submit(right);

    results = orchestrator.runAll();
    ASSERT_EQ(results.size(), 2u);
    ASSERT_TRUE(results[0].error.has_value());
    EXPECT_EQ(results[0].error->code, core::ErrorCode::AuthenticationFailure);
    EXPECT_FALSE(pathOf("wrong.epub").exists());
    ASSERT_TRUE(results[1].success);
    EXPECT_TRUE(pathOf("restored").isDirectory());
    EXPECT_EQ(reopen(pathOf("restored")), reopen(sample_));
}

// 测试6: 宽度与配置
TEST_F(BatchOrchestratorTest, WidthFromConfig) {
    EXPECT_EQ(BatchOrchestrator(0).width(), 1u);

    auto config = config::resolveConfig(config::defaultLayer(), config::ConfigLayer(),
                                        config::ConfigLayer{{"sanitizer.threads", "3"}});
    ASSERT_TRUE(config);
    const BatchOrchestrator orchestrator(config.value());
    EXPECT_EQ(orchestrator.width(), 3u);
    EXPECT_EQ(orchestrator.config().threads(), 3u);
    EXPECT_STREQ(toString(JobKind::Unprotect), "unprotect");
}

}} // namespace ryuri::batch
