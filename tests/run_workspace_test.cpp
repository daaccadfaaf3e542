#include <gtest/gtest.h>
#include "core/run_workspace.hpp"
#include "core/analysis_error.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class RunWorkspaceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        root_ = (fs::temp_directory_path() / ("run_workspace_test_" + std::to_string(::getpid()))).string();
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string root_;
};

TEST_F(RunWorkspaceTest, CreatesUniqueDirectoriesPerRun)
{
    RunWorkspace first(root_);
    RunWorkspace second(root_);

    EXPECT_NE(first.id(), second.id());
    EXPECT_TRUE(fs::is_directory(first.path()));
    EXPECT_TRUE(fs::is_directory(second.path()));
    EXPECT_EQ(fs::path(first.path()).parent_path(), fs::path(root_));
}

TEST_F(RunWorkspaceTest, ReleaseRemovesContentsOnce)
{
    RunWorkspace workspace(root_, "fixed-id");
    fs::create_directories(workspace.subdir("frames"));
    std::ofstream(fs::path(workspace.subdir("frames")) / "frame_0001.png") << "x";

    EXPECT_FALSE(workspace.release().has_value());
    EXPECT_FALSE(fs::exists(workspace.path()));
    EXPECT_TRUE(workspace.released());
    EXPECT_FALSE(workspace.release().has_value());
}

TEST_F(RunWorkspaceTest, DestructorRemovesDirectory)
{
    std::string path;
    {
        RunWorkspace workspace(root_);
        path = workspace.path();
        ASSERT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(RunWorkspaceTest, UnusableRootIsResourceError)
{
    fs::create_directories(root_);
    std::string blocker = (fs::path(root_) / "file").string();
    std::ofstream(blocker) << "not a directory";

    try
    {
        RunWorkspace workspace(blocker);
        FAIL() << "expected AnalysisError";
    }
    catch (const AnalysisError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::RESOURCE);
        EXPECT_EQ(e.code(), RunError::WorkspaceUnavailable);
    }
}
