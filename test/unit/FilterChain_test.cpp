#include "ryuri/core/Exception.hpp"
#include "ryuri/filter/FilterChain.hpp"
#include "ryuri/filter/FilterRegistry.hpp"
#include "ryuri/utils/Logger.hpp"
#include "TestPackages.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>

namespace ryuri {
namespace filter {

namespace {

// 写入一个标记条目
class MarkerFilter : public IFilter {
public:
    explicit MarkerFilter(std::string marker) : marker_(std::move(marker)) {}
    const char* name() const override { return "marker"; }
    void apply(FilterContext& context) override {
        context.cache().put("OEBPS/" + marker_ + ".txt", marker_);
    }

private:
    std::string marker_;
};

// 读取不存在的条目
class BrokenFilter : public IFilter {
public:
    const char* name() const override { return "broken"; }
    void apply(FilterContext& context) override {
        context.store().get("OEBPS/does-not-exist.xhtml");
    }
};

// 记录看到的 OPF 版本
class VersionProbe : public IFilter {
public:
    VersionProbe(const char* name, std::vector<std::string>& seen) : name_(name), seen_(seen) {}
    const char* name() const override { return name_; }
    void apply(FilterContext& context) override {
        seen_.push_back(context.layout().version());
    }

private:
    const char* name_;
    std::vector<std::string>& seen_;
};

} // namespace

class FilterChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/filter_chain_test.log", Logger::Level::DEBUG, false);
        store_ = test::makeSampleStore();
        cache_ = std::make_unique<cache::DocumentCache>(*store_);

        registry_.registerFilter("marker", [](const FilterOptions& options) {
            return std::unique_ptr<IFilter>(new MarkerFilter(stringOption(options, "text", "a")));
        });
        registry_.registerFilter("broken", [](const FilterOptions&) {
            return std::unique_ptr<IFilter>(new BrokenFilter());
        });
        registry_.registerFilter("strict", [](const FilterOptions& options) {
            boolOption(options, "flag", false);
            return std::unique_ptr<IFilter>(new MarkerFilter("strict"));
        });
    }

    void TearDown() override {
        cache_.reset();
        store_.reset();
        Logger::getInstance().shutdown();
    }

    FilterRegistry registry_;
    std::unique_ptr<store::ArchivePackageStore> store_;
    std::unique_ptr<cache::DocumentCache> cache_;
};

// 测试1: 内置注册表
TEST_F(FilterChainTest, BuiltinRegistry) {
    const FilterRegistry builtins = FilterRegistry::withBuiltins();
    for (const char* name : {"structural-repair", "version-upgrade", "privacy-scrub", "metadata-normalize",
                             "style-optimize", "markup-optimize", "layout"}) {
        EXPECT_TRUE(builtins.contains(name)) << name;
    }
    EXPECT_EQ(builtins.names().size(), 7u);
    EXPECT_FALSE(builtins.contains("no-such-filter"));
}

// 测试2: 构建时拒绝未知名称、重复名称与非法选项
TEST_F(FilterChainTest, BuildRejectsBadSpecs) {
    auto unknown = FilterChain::build({FilterSpec("marker"), FilterSpec("nope")}, registry_);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, core::ErrorCode::InvalidArgument);
    EXPECT_EQ(unknown.error().context, "nope");

    auto duplicate = FilterChain::build({FilterSpec("marker"), FilterSpec("marker")}, registry_);
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, core::ErrorCode::InvalidArgument);

    auto bad_option = FilterChain::build({FilterSpec("strict", {{"flag", "maybe"}})}, registry_);
    ASSERT_FALSE(bad_option);
    EXPECT_EQ(bad_option.error().code, core::ErrorCode::InvalidArgument);

    auto layout = FilterChain::build({FilterSpec("layout", {{"platform", "kobo-forma"}})},
                                     FilterRegistry::withBuiltins());
    ASSERT_FALSE(layout);
    EXPECT_EQ(layout.error().code, core::ErrorCode::InvalidArgument);

    auto good = FilterChain::build({FilterSpec("marker"), FilterSpec("broken")}, registry_);
    ASSERT_TRUE(good);
    EXPECT_EQ(good.value().names(), (std::vector<std::string>{"marker", "broken"}));
}

// 测试3: 第二个过滤器失败时第一个的改写保留
TEST_F(FilterChainTest, FailureKeepsEarlierWrites) {
    auto chain = FilterChain::build({FilterSpec("marker", {{"text", "first"}}), FilterSpec("broken")}, registry_);
    ASSERT_TRUE(chain);

    core::VoidResult result = chain.value().run(*store_, *cache_);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::FilterFailure);
    EXPECT_EQ(result.error().context, "broken");
    EXPECT_EQ(result.error().cause, core::ErrorCode::NotFound);

    EXPECT_TRUE(store_->exists("OEBPS/first.txt"));
    EXPECT_EQ(store_->getString("OEBPS/first.txt"), "first");
}

// 测试4: 截止时间已过时不运行任何过滤器
TEST_F(FilterChainTest, ExpiredDeadlineTimesOut) {
    auto chain = FilterChain::build({FilterSpec("marker")}, registry_);
    ASSERT_TRUE(chain);

    const Deadline past = std::chrono::steady_clock::now() - std::chrono::seconds(1);
    core::VoidResult result = chain.value().run(*store_, *cache_, past);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::Timeout);
    EXPECT_EQ(result.error().context, "marker");
    EXPECT_FALSE(store_->exists("OEBPS/a.txt"));

    const Deadline future = std::chrono::steady_clock::now() + std::chrono::minutes(5);
    EXPECT_TRUE(chain.value().run(*store_, *cache_, future));
    EXPECT_TRUE(store_->exists("OEBPS/a.txt"));
}

// 测试5: 过滤器之间重新加载包结构
TEST_F(FilterChainTest, LayoutReloadsBetweenFilters) {
    std::vector<std::string> seen;
    FilterChain chain;
    ASSERT_TRUE(chain.append(std::make_unique<VersionProbe>("probe", seen)));

    auto upgrade = FilterRegistry::withBuiltins().create(FilterSpec("version-upgrade"));
    ASSERT_TRUE(upgrade);
    ASSERT_TRUE(chain.append(std::move(upgrade).value()));

    ASSERT_TRUE(chain.append(std::make_unique<VersionProbe>("probe-2", seen)));

    core::VoidResult duplicate = chain.append(std::make_unique<VersionProbe>("probe", seen));
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, core::ErrorCode::InvalidArgument);

    ASSERT_TRUE(chain.run(*store_, *cache_));
    EXPECT_EQ(seen, (std::vector<std::string>{"2.0", "3.0"}));
}

// 测试6: 不保留文档时每个过滤器后清空缓存
TEST_F(FilterChainTest, DocumentRetention) {
    auto chain = FilterChain::build({FilterSpec("version-upgrade"), FilterSpec("marker")},
                                    []() {
                                        FilterRegistry registry = FilterRegistry::withBuiltins();
                                        registry.registerFilter("marker", [](const FilterOptions&) {
                                            return std::unique_ptr<IFilter>(new MarkerFilter("m"));
                                        });
                                        return registry;
                                    }());
    ASSERT_TRUE(chain);
    EXPECT_TRUE(chain.value().retainDocuments());

    chain.value().setRetainDocuments(false);
    ASSERT_TRUE(chain.value().run(*store_, *cache_));
    EXPECT_EQ(cache_->cachedCount(), 0u);
}

// 测试7: 布尔与字符串选项
TEST_F(FilterChainTest, OptionParsing) {
    const FilterOptions options = {{"a", "YES"}, {"b", "off"}, {"c", "1"}, {"bad", "sure"}, {"s", "x"}};
    EXPECT_TRUE(boolOption(options, "a", false));
    EXPECT_FALSE(boolOption(options, "b", true));
    EXPECT_TRUE(boolOption(options, "c", false));
    EXPECT_TRUE(boolOption(options, "missing", true));
    EXPECT_THROW(boolOption(options, "bad", true), core::ParameterException);
    EXPECT_EQ(stringOption(options, "s", "y"), "x");
    EXPECT_EQ(stringOption(options, "missing", "y"), "y");
}

}} // namespace ryuri::filter
