#include <fstream>
#include <filesystem>

#include "sandbox/SandboxWorkspace.hpp"
#include "domain/Errors.hpp"
#include "domain/TreeSearch.hpp"
#include "utils/Ids.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

namespace fs = std::filesystem;

using ::testing::ElementsAre;

using namespace code_validation;  // NOLINT

class SandboxWorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("workspace_test_" + short_hex_id());
        workspace_ = std::make_unique<SandboxWorkspace>(root_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    std::unique_ptr<SandboxWorkspace> workspace_;
};

// NOLINTNEXTLINE
TEST_F(SandboxWorkspaceTest, CreateListAndGet) {
    ExecutionHandle handle = workspace_->create_execution({{"model.py", "print('hi')"}, {"train.csv", "a,b\n1,2\n"}});
    EXPECT_TRUE(is_valid_execution_id(handle.execution_id));
    EXPECT_THAT(handle.saved_files, ElementsAre("model.py", "train.csv"));
    EXPECT_TRUE(fs::is_directory(handle.directory));

    ExecutionListing listing = workspace_->list_files(handle.execution_id);
    EXPECT_EQ(listing.structure.name, handle.execution_id);
    EXPECT_EQ(listing.stats.total_files, 2u);
    EXPECT_EQ(listing.stats.total_size, 19u);
    EXPECT_EQ(listing.stats.execution_id, handle.execution_id);
    ASSERT_EQ(listing.structure.children.size(), 2u);
    EXPECT_EQ(listing.structure.children[0].name, "model.py");
    EXPECT_EQ(listing.structure.children[0].extension, std::optional<std::string>("py"));

    EXPECT_EQ(workspace_->get_file(handle.execution_id, "train.csv"), "a,b\n1,2\n");
}

// NOLINTNEXTLINE
TEST_F(SandboxWorkspaceTest, UploadNamesAreSanitized) {
    ExecutionHandle handle = workspace_->create_execution({{"../../etc/passwd", "x"}, {"my file.txt", "y"}});
    EXPECT_THAT(handle.saved_files, ElementsAre("passwd", "my_file.txt"));
    EXPECT_TRUE(fs::exists(fs::path(handle.directory) / "passwd"));
}

// NOLINTNEXTLINE
TEST_F(SandboxWorkspaceTest, EmptyUploadIsBadRequest) {
    EXPECT_THROW(workspace_->create_execution({}), BadRequest);
    EXPECT_THROW(workspace_->create_execution({{"..", "x"}}), BadRequest);
}

// NOLINTNEXTLINE
TEST_F(SandboxWorkspaceTest, UnknownExecutionIsNotFound) {
    EXPECT_THROW(workspace_->list_files("00000000-0000-4000-8000-000000000000"), NotFound);
    EXPECT_THROW(workspace_->list_files("../outside"), NotFound);
    EXPECT_THROW(workspace_->get_file("nope", "a.txt"), NotFound);
}

// NOLINTNEXTLINE
TEST_F(SandboxWorkspaceTest, MissingFileIsNotFound) {
    ExecutionHandle handle = workspace_->create_execution({{"a.txt", "a"}});
    EXPECT_THROW(workspace_->get_file(handle.execution_id, "b.txt"), NotFound);
}

// NOLINTNEXTLINE
TEST_F(SandboxWorkspaceTest, TraversalIsForbidden) {
    ExecutionHandle handle = workspace_->create_execution({{"a.txt", "a"}});
    std::ofstream(root_ / "secret.txt") << "secret";

    EXPECT_THROW(workspace_->get_file(handle.execution_id, "../secret.txt"), Forbidden);
    EXPECT_THROW(workspace_->get_file(handle.execution_id, "sub/../../secret.txt"), Forbidden);
    EXPECT_THROW(workspace_->get_file(handle.execution_id, "/etc/passwd"), Forbidden);
}

// NOLINTNEXTLINE
TEST_F(SandboxWorkspaceTest, SymlinkOutOfExecutionIsForbidden) {
    ExecutionHandle handle = workspace_->create_execution({{"a.txt", "a"}});
    std::ofstream(root_ / "secret.txt") << "secret";
    fs::create_symlink(root_ / "secret.txt", fs::path(handle.directory) / "link.txt");

    EXPECT_THROW(workspace_->get_file(handle.execution_id, "link.txt"), Forbidden);
}

// NOLINTNEXTLINE
TEST_F(SandboxWorkspaceTest, NestedFilesAreReachable) {
    ExecutionHandle handle = workspace_->create_execution({{"a.txt", "a"}});
    fs::path nested = fs::path(handle.directory) / "test_1" / "images";
    fs::create_directories(nested);
    std::ofstream(nested.parent_path() / "report.md") << "# Report";
    std::ofstream(nested / "plot.png") << "png";

    EXPECT_EQ(workspace_->get_file(handle.execution_id, "test_1/report.md"), "# Report");
    EXPECT_EQ(workspace_->get_file(handle.execution_id, "test_1/images/plot.png"), "png");

    ExecutionListing listing = workspace_->list_files(handle.execution_id);
    EXPECT_EQ(listing.stats.total_files, 3u);
    const FileNode* folder = find_directory(listing.structure, "test_1");
    ASSERT_NE(folder, nullptr);
    EXPECT_TRUE(has_file_child(*folder, "report.md"));
}

// NOLINTNEXTLINE
TEST_F(SandboxWorkspaceTest, SnapshotChildrenAreSorted) {
    fs::path dir = root_ / "manual";
    fs::create_directories(dir / "b_dir");
    std::ofstream(dir / "c.txt") << "c";
    std::ofstream(dir / "a.txt") << "a";

    FileNode node = SandboxWorkspace::snapshot(dir);
    ASSERT_EQ(node.children.size(), 3u);
    EXPECT_EQ(node.children[0].name, "a.txt");
    EXPECT_EQ(node.children[1].name, "b_dir");
    EXPECT_TRUE(node.children[1].is_directory());
    EXPECT_EQ(node.children[2].name, "c.txt");
}

}  // namespace
