#include <gtest/gtest.h>

#include "core/orchestrator/orchestrator.hpp"
#include "test_utils.hpp"

using treecp::core::Orchestrator;
using treecp::infra::Config;
using treecp::infra::ErrorCode;
using treecp::test::RecordingSink;
using treecp::test::TempDir;
using treecp::test::list_tree;
using treecp::test::read_file;
using treecp::test::write_file;

TEST(OrchestratorTest, SingleSourceReportsProgressAndFinishes)
{
    TempDir tmp;
    write_file(tmp / "src/a.txt", "a");
    write_file(tmp / "src/b/c.txt", "c");
    write_file(tmp / "src/b/d/e.txt", "e");

    Config config;
    RecordingSink sink;
    Orchestrator orchestrator(config, sink);

    auto result = orchestrator.copy(tmp / "src", tmp / "dst");

    ASSERT_TRUE(result.ok()) << result.error->message;
    EXPECT_EQ(result.files_copied, 3u);
    EXPECT_EQ(sink.total(), 3u);
    EXPECT_EQ(sink.advanced(), 3u);
    EXPECT_EQ(sink.finish_calls(), 1);
    EXPECT_EQ(read_file(tmp / "dst/b/d/e.txt"), "e");
}

TEST(OrchestratorTest, CountingFailurePreventsAnyCopy)
{
    TempDir tmp;
    Config config;
    RecordingSink sink;
    Orchestrator orchestrator(config, sink);

    auto result = orchestrator.copy(tmp / "missing", tmp / "dst");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, ErrorCode::ReadError);
    EXPECT_EQ(result.files_copied, 0u);
    EXPECT_EQ(sink.set_total_calls(), 0);
    EXPECT_FALSE(std::filesystem::exists(tmp / "dst"));
}

TEST(OrchestratorTest, CopyErrorSkipsFinish)
{
    TempDir tmp;
    write_file(tmp / "src/a.txt", "a");
    std::filesystem::create_symlink(tmp / "nowhere", tmp / "src/b_dangling");
    write_file(tmp / "src/c.txt", "c");

    Config config;
    RecordingSink sink;
    Orchestrator orchestrator(config, sink);

    auto result = orchestrator.copy(tmp / "src", tmp / "dst");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, ErrorCode::SourceOpenError);
    EXPECT_EQ(result.files_copied, 1u);
    EXPECT_EQ(sink.total(), 3u);
    EXPECT_EQ(sink.advanced(), 1u);
    EXPECT_EQ(sink.finish_calls(), 0);
}

TEST(OrchestratorTest, MultipleSourcesMergeIntoOneDestination)
{
    TempDir tmp;
    write_file(tmp / "A/x.txt", "from A");
    write_file(tmp / "B/y.txt", "from B");

    Config config;
    RecordingSink sink;
    Orchestrator orchestrator(config, sink);

    auto result = orchestrator.copy_multiple({tmp / "A", tmp / "B"}, tmp / "D");

    ASSERT_TRUE(result.ok()) << result.error->message;
    EXPECT_EQ(result.files_copied, 2u);
    EXPECT_EQ(read_file(tmp / "D/x.txt"), "from A");
    EXPECT_EQ(read_file(tmp / "D/y.txt"), "from B");
    EXPECT_EQ(sink.set_total_calls(), 1);
    EXPECT_EQ(sink.total(), 2u);
    EXPECT_EQ(sink.advanced(), 2u);
    EXPECT_EQ(sink.finish_calls(), 1);
}

TEST(OrchestratorTest, MultipleSourcesWithNestedTrees)
{
    TempDir tmp;
    write_file(tmp / "A/docs/one.txt", "1");
    write_file(tmp / "A/docs/two.txt", "2");
    write_file(tmp / "B/src/main.cpp", "main");
    write_file(tmp / "C/top.txt", "top");

    Config config;
    RecordingSink sink;
    Orchestrator orchestrator(config, sink);

    auto result = orchestrator.copy_multiple({tmp / "A", tmp / "B", tmp / "C"}, tmp / "out/merged");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.files_copied, 4u);
    EXPECT_EQ(list_tree(tmp / "out/merged"),
              (std::vector<std::string>{"docs", "docs/one.txt", "docs/two.txt", "src", "src/main.cpp", "top.txt"}));
}

TEST(OrchestratorTest, MultipleSourcesCountingFailureAbortsBeforeCopy)
{
    TempDir tmp;
    write_file(tmp / "A/x.txt", "x");

    Config config;
    RecordingSink sink;
    Orchestrator orchestrator(config, sink);

    auto result = orchestrator.copy_multiple({tmp / "A", tmp / "missing"}, tmp / "D");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, ErrorCode::ReadError);
    EXPECT_EQ(result.files_copied, 0u);
    EXPECT_FALSE(std::filesystem::exists(tmp / "D"));
}

TEST(OrchestratorTest, MultipleSourcesDestinationError)
{
    TempDir tmp;
    write_file(tmp / "A/x.txt", "x");
    write_file(tmp / "blocker", "x");

    Config config;
    RecordingSink sink;
    Orchestrator orchestrator(config, sink);

    auto result = orchestrator.copy_multiple({tmp / "A"}, tmp / "blocker/D");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, ErrorCode::DestinationError);
    EXPECT_EQ(result.files_copied, 0u);
}

TEST(OrchestratorTest, MultipleFailuresSurfaceSmallestSourcePath)
{
    TempDir tmp;
    write_file(tmp / "A/ok.txt", "ok");
    std::filesystem::create_directories(tmp / "target");
    write_file(tmp / "B/good.txt", "good");
    std::filesystem::create_directory_symlink(tmp / "target", tmp / "B/z_bad");
    write_file(tmp / "C/fine.txt", "fine");
    std::filesystem::create_symlink(tmp / "nowhere", tmp / "C/z_dangling");

    Config config;
    RecordingSink sink;
    Orchestrator orchestrator(config, sink);

    // C идёт первым во входе, но путь B меньше
    auto result = orchestrator.copy_multiple({tmp / "C", tmp / "A", tmp / "B"}, tmp / "D");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, ErrorCode::TransferError);
    EXPECT_EQ(result.files_copied, 3u);
    EXPECT_EQ(sink.advanced(), 3u);
    EXPECT_EQ(sink.finish_calls(), 1);
}
