#include <gtest/gtest.h>

#include "site.hpp"
#include "test_helpers.hpp"

using namespace mdblog;



namespace {
    class Pipeline : public ::testing::Test {
    protected:
        void SetUp() override {
            config.css_source = dir.path / "style.css";
            config.md_sources = dir.path / "md";
            config.rendered_outputs = dir.path / "out";

            test::write_file(config.css_source, "body{color:red}");
            std::filesystem::create_directories(config.md_sources);
            std::filesystem::create_directories(config.rendered_outputs);
        }

        void add_source(const std::string &name, const std::string &markdown) {
            test::write_file(config.md_sources / name, markdown);
        }

        std::string output(const std::string &name) {
            return test::read_file(config.rendered_outputs / name);
        }

        std::size_t output_count() {
            std::size_t count = 0;
            for (auto &&entry : std::filesystem::directory_iterator(config.rendered_outputs)) {
                (void)entry;
                count++;
            }
            return count;
        }

        test::TempDir dir;
        SiteConfig config;
    };
}



TEST_F(Pipeline, SinglePostSite) {
    add_source("hello.md", "# Hello\nWorld");

    auto summary = run_pipeline(config, test::ordering_from({{"hello.md", 1}}));

    ASSERT_FALSE(summary.is_error());
    EXPECT_EQ(summary.value().state, PipelineState::done);
    EXPECT_EQ(summary.value().documents_found, 1u);
    EXPECT_EQ(summary.value().documents_skipped, 0u);

    auto page = output("hello.html");
    EXPECT_NE(page.find("<style>body{color:red}"), std::string::npos);
    EXPECT_NE(page.find("<h1>Hello</h1>"), std::string::npos);

    auto index = output("index.html");
    EXPECT_NE(index.find("<a href=\"./hello.html\">Hello</a>"), std::string::npos);
    EXPECT_EQ(test::count_occurrences(index, "<a href"), 1u);
}

TEST_F(Pipeline, EmptySourceDirectory) {
    auto summary = run_pipeline(config, test::ordering_from({}));

    ASSERT_FALSE(summary.is_error());
    EXPECT_EQ(summary.value().state, PipelineState::done);
    EXPECT_TRUE(summary.value().pages.empty());
    EXPECT_EQ(output_count(), 1u);
    EXPECT_EQ(test::count_occurrences(output("index.html"), "<a href"), 0u);
}

TEST_F(Pipeline, IndexFollowsCreationOrder) {
    add_source("first.md", "# First\n");
    add_source("second.md", "# Second\n");
    add_source("also-second.md", "# Also second\n");

    auto summary = run_pipeline(config, test::ordering_from({{"second.md", 20}, {"first.md", 10}, {"also-second.md", 20}}));

    ASSERT_FALSE(summary.is_error());
    auto pages = summary.value().pages;
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0].title, "First");
    EXPECT_EQ(pages[1].title, "Also second");
    EXPECT_EQ(pages[2].title, "Second");

    auto index = output("index.html");
    EXPECT_LT(index.find("./first.html"), index.find("./also-second.html"));
    EXPECT_LT(index.find("./also-second.html"), index.find("./second.html"));
}

TEST_F(Pipeline, UnwritablePageIsLeftOutOfIndex) {
    add_source("a.md", "# A\n");
    add_source("b.md", "# B\n");
    add_source("c.md", "# C\n");
    std::filesystem::create_directories(config.rendered_outputs / "b.html");

    auto summary = run_pipeline(config, test::ordering_from({{"a.md", 1}, {"b.md", 2}, {"c.md", 3}}));

    ASSERT_FALSE(summary.is_error());
    EXPECT_EQ(summary.value().documents_found, 3u);
    EXPECT_EQ(summary.value().documents_skipped, 1u);
    ASSERT_EQ(summary.value().pages.size(), 2u);

    auto index = output("index.html");
    EXPECT_NE(index.find("./a.html"), std::string::npos);
    EXPECT_EQ(index.find("./b.html"), std::string::npos);
    EXPECT_NE(index.find("./c.html"), std::string::npos);
}

TEST_F(Pipeline, IndexSourceDoesNotReplaceIndex) {
    add_source("index.md", "# Home\n\nWelcome.\n");
    add_source("hello.md", "# Hello\n");

    auto summary = run_pipeline(config, test::ordering_from({{"index.md", 1}, {"hello.md", 2}}));

    ASSERT_FALSE(summary.is_error());
    EXPECT_EQ(summary.value().documents_found, 2u);
    EXPECT_EQ(summary.value().documents_skipped, 1u);
    ASSERT_EQ(summary.value().pages.size(), 1u);
    EXPECT_EQ(summary.value().pages[0].url, "./hello.html");

    auto index = output("index.html");
    EXPECT_EQ(index.find("./index.html"), std::string::npos);
    EXPECT_EQ(index.find("Welcome."), std::string::npos);
    EXPECT_EQ(test::count_occurrences(index, "<a href"), 1u);
}

TEST_F(Pipeline, FileWithoutOrderingKeyIsSkipped) {
    add_source("known.md", "# Known\n");
    add_source("unknown.md", "# Unknown\n");

    auto summary = run_pipeline(config, test::ordering_from({{"known.md", 1}}));

    ASSERT_FALSE(summary.is_error());
    EXPECT_EQ(summary.value().documents_found, 1u);
    EXPECT_FALSE(std::filesystem::exists(config.rendered_outputs / "unknown.html"));
}

TEST_F(Pipeline, PostWithoutHeadingUsesFileName) {
    add_source("notes-on-cpp.md", "Only a paragraph.\n");

    auto summary = run_pipeline(config, test::ordering_from({{"notes-on-cpp.md", 1}}));

    ASSERT_FALSE(summary.is_error());
    ASSERT_EQ(summary.value().pages.size(), 1u);
    EXPECT_EQ(summary.value().pages[0].title, "notes on cpp");
    EXPECT_NE(output("index.html").find(">notes on cpp</a>"), std::string::npos);
}

TEST_F(Pipeline, RerunGivesIdenticalOutput) {
    add_source("one.md", "# One\n\nSome \"text\" -- here.\n");
    add_source("two.md", "# Two\n\n| a | b |\n|---|---|\n| 1 | 2 |\n");
    auto ordering = test::ordering_from({{"one.md", 1}, {"two.md", 2}});

    ASSERT_FALSE(run_pipeline(config, ordering).is_error());
    auto first_index = output("index.html");
    auto first_one = output("one.html");
    auto first_two = output("two.html");

    std::filesystem::remove_all(config.rendered_outputs);
    std::filesystem::create_directories(config.rendered_outputs);

    ASSERT_FALSE(run_pipeline(config, ordering).is_error());
    EXPECT_EQ(output("index.html"), first_index);
    EXPECT_EQ(output("one.html"), first_one);
    EXPECT_EQ(output("two.html"), first_two);
}

TEST_F(Pipeline, ParallelAndSequentialRunsAgree) {
    std::map<std::string, int> seconds;
    for (int i = 0; i < 16; i++) {
        auto name = "post" + std::to_string(i) + ".md";
        add_source(name, "# Post " + std::to_string(i) + "\n\nBody.\n");
        seconds[name] = 100 - i;
    }

    config.max_jobs = 1;
    ASSERT_FALSE(run_pipeline(config, test::ordering_from(seconds)).is_error());
    auto sequential = output("index.html");

    config.max_jobs = 8;
    ASSERT_FALSE(run_pipeline(config, test::ordering_from(seconds)).is_error());
    EXPECT_EQ(output("index.html"), sequential);
    EXPECT_LT(sequential.find("./post15.html"), sequential.find("./post0.html"));
}

TEST_F(Pipeline, CustomTemplatesFromFiles) {
    test::write_file(dir.path / "page.tmpl", "<article>{{ content }}</article>");
    test::write_file(dir.path / "index.tmpl", "{% for page in pages %}{{ page.url }};{% endfor %}");
    config.page_template = dir.path / "page.tmpl";
    config.index_template = dir.path / "index.tmpl";
    config.base_url = "/blog/";
    add_source("post.md", "# Post\n");

    ASSERT_FALSE(run_pipeline(config, test::ordering_from({{"post.md", 1}})).is_error());

    EXPECT_EQ(output("index.html"), "/blog/post.html;");
    EXPECT_EQ(output("post.html").rfind("<article>", 0), 0u);
}



TEST_F(Pipeline, MissingStylesheetIsFatal) {
    config.css_source = dir.path / "missing.css";
    add_source("hello.md", "# Hello\n");

    EXPECT_TRUE(run_pipeline(config, test::ordering_from({{"hello.md", 1}})).is_error());
    EXPECT_EQ(output_count(), 0u);
}

TEST_F(Pipeline, MissingSourceDirectoryIsFatal) {
    config.md_sources = dir.path / "nope";

    EXPECT_TRUE(run_pipeline(config, test::ordering_from({})).is_error());
    EXPECT_EQ(output_count(), 0u);
}

TEST_F(Pipeline, MissingOutputDirectoryIsFatal) {
    config.rendered_outputs = dir.path / "nope";
    add_source("hello.md", "# Hello\n");

    EXPECT_TRUE(run_pipeline(config, test::ordering_from({{"hello.md", 1}})).is_error());
    EXPECT_FALSE(std::filesystem::exists(config.rendered_outputs));
}

TEST_F(Pipeline, BrokenTemplateWritesNothing) {
    test::write_file(dir.path / "index.tmpl", "{% for page in pages %}unterminated");
    config.index_template = dir.path / "index.tmpl";
    add_source("hello.md", "# Hello\n");

    EXPECT_TRUE(run_pipeline(config, test::ordering_from({{"hello.md", 1}})).is_error());
    EXPECT_EQ(output_count(), 0u);
}

TEST_F(Pipeline, PageTemplateRenderErrorIsFatal) {
    test::write_file(dir.path / "page.tmpl", "{{ undefined_variable }}");
    config.page_template = dir.path / "page.tmpl";
    add_source("hello.md", "# Hello\n");

    EXPECT_TRUE(run_pipeline(config, test::ordering_from({{"hello.md", 1}})).is_error());
    EXPECT_FALSE(std::filesystem::exists(config.rendered_outputs / "index.html"));
}



TEST(PipelineStates, HaveReadableNames) {
    EXPECT_STREQ(to_string(PipelineState::init), "init");
    EXPECT_STREQ(to_string(PipelineState::pages_rendered), "pages rendered");
    EXPECT_STREQ(to_string(PipelineState::failed), "failed");
}
