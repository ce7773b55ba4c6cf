#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include "cli/cli.hpp"
#include "grid/grid_store.hpp"
#include "store/memory_backend.hpp"
#include "test_utils.hpp"

using gridstore::cli::CLI;
using gridstore::grid::GridStore;
using gridstore::store::MemoryBackend;
using gridstore::test::read_file;
using gridstore::test::write_file;

class CLITest : public ::testing::Test {
protected:
  MemoryBackend backend;
  std::istringstream input;
  std::ostringstream output;
  std::filesystem::path work_dir;
  std::unique_ptr<CLI> cli;

  void SetUp() override {
    work_dir = gridstore::test::make_temp_dir("cli_test");
    cli = std::make_unique<CLI>(backend, "fs", 4, input, output);
  }

  void TearDown() override {
    if (std::filesystem::exists(work_dir)) {
      std::filesystem::remove_all(work_dir);
    }
  }

  std::string run(const std::string& line) {
    output.str("");
    EXPECT_TRUE(cli->execute(line));
    return output.str();
  }

  std::string local_path(const std::string& name) const {
    return (work_dir / name).string();
  }

  static std::string slurp(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
  }
};

TEST_F(CLITest, PutStoresLocalFile) {
  std::ofstream(local_path("in.txt"), std::ios::binary) << "Hello, world!";

  std::string out = run("put " + local_path("in.txt") + " hello.txt");
  EXPECT_NE(out.find("(13 bytes)"), std::string::npos) << out;
  EXPECT_EQ(read_file(backend, "hello.txt"), "Hello, world!");
  EXPECT_EQ(backend.find_file("fs", "hello.txt")->chunk_size, 4u);
}

TEST_F(CLITest, PutOfUnreadableFileStoresNothing) {
  // A directory opens as a stream but every read from it fails
  std::string out = run("put " + work_dir.string() + " dir.bin");
  EXPECT_EQ(out.find("Stored"), std::string::npos) << out;
  EXPECT_NE(out.find("Error"), std::string::npos) << out;
  EXPECT_FALSE(GridStore::exists(backend, "dir.bin"));
  EXPECT_TRUE(GridStore::list(backend).empty());
}

TEST_F(CLITest, GetWritesLocalFile) {
  write_file(backend, "stored.bin", "payload", 3);

  std::string out = run("get stored.bin " + local_path("out.bin"));
  EXPECT_NE(out.find("Retrieved stored.bin"), std::string::npos) << out;
  EXPECT_EQ(slurp(local_path("out.bin")), "payload");

  out = run("get missing.bin " + local_path("none.bin"));
  EXPECT_NE(out.find("No such file: missing.bin"), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(local_path("none.bin")));
}

TEST_F(CLITest, ListCatExists) {
  write_file(backend, "a.txt", "first", 4);
  write_file(backend, "b.txt", "second", 4);

  EXPECT_EQ(run("ls"), "  a.txt\n  b.txt\n");
  EXPECT_EQ(run("cat b.txt"), "second\n");
  EXPECT_EQ(run("exists a.txt"), "yes\n");
  EXPECT_EQ(run("exists c.txt"), "no\n");
}

TEST_F(CLITest, StatShowsRecord) {
  write_file(backend, "hello.txt", "Hello, world!", 4);

  std::string out = run("stat hello.txt");
  EXPECT_NE(out.find("length:       13"), std::string::npos) << out;
  EXPECT_NE(out.find("chunk size:   4"), std::string::npos) << out;
  EXPECT_NE(out.find("md5:          6cd3556deb0da54bca060b4c39479839"), std::string::npos) << out;
  EXPECT_NE(out.find("UTC"), std::string::npos) << out;
}

TEST_F(CLITest, RemoveAndMove) {
  write_file(backend, "a.txt", "first", 4);
  write_file(backend, "b.txt", "second", 4);

  EXPECT_EQ(run("mv a.txt c.txt"), "Renamed a.txt to c.txt\n");
  EXPECT_EQ(run("mv a.txt d.txt"), "No such file: a.txt\n");
  EXPECT_EQ(run("rm b.txt c.txt"), "Removed 2 files\n");
  EXPECT_TRUE(GridStore::list(backend).empty());
}

TEST_F(CLITest, InvalidCommands) {
  EXPECT_NE(run("frobnicate").find("Unknown command"), std::string::npos);
  EXPECT_NE(run("mv onlyone").find("Unknown command"), std::string::npos);
  EXPECT_EQ(run(""), "");
  EXPECT_NE(run("put " + local_path("absent.txt")).find("Error opening file"), std::string::npos);
  EXPECT_FALSE(cli->execute("quit"));
}

TEST_F(CLITest, RunLoopsUntilQuit) {
  write_file(backend, "a.txt", "first", 4);
  input.str("exists a.txt\nquit\nexists a.txt\n");

  cli->run();
  EXPECT_EQ(output.str(), "GridStore> yes\nGridStore> ");
}
