#include <gtest/gtest.h>
#include "../src/index_source.hpp"
#include "../src/exception.hpp"
#include "../src/hash.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class IndexSourceTest : public ::testing::Test {
protected:
    fs::path work_dir;
    const std::string index = "Package: A\nDepends: B\n\nPackage: B\n";

    void SetUp() override {
        init_localization();
        set_quiet_mode(true);
        work_dir = fs::absolute("tmp_index_source_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);
        std::ofstream(work_dir / "Packages", std::ios::binary) << index;
    }

    void TearDown() override {
        fs::remove_all(work_dir);
        set_quiet_mode(false);
    }

    RunConfig local_config(const std::string& repo) {
        RunConfig cfg;
        cfg.package_name = "A";
        cfg.repo = repo;
        cfg.test = true;
        return cfg;
    }
};

TEST(IndexUrlTest, AppendsPackages) {
    EXPECT_EQ(resolve_index_url("http://deb.debian.org/debian/dists/stable/main/binary-amd64"),
              "http://deb.debian.org/debian/dists/stable/main/binary-amd64/Packages");
    EXPECT_EQ(resolve_index_url("http://mirror/binary-amd64/"), "http://mirror/binary-amd64/Packages");
}

TEST(IndexUrlTest, KeepsExplicitIndexFile) {
    EXPECT_EQ(resolve_index_url("http://mirror/binary-amd64/Packages"), "http://mirror/binary-amd64/Packages");
    EXPECT_EQ(resolve_index_url("http://mirror/binary-amd64/Packages.gz"), "http://mirror/binary-amd64/Packages.gz");
    EXPECT_EQ(resolve_index_url("http://mirror/binary-amd64/Packages.xz"), "http://mirror/binary-amd64/Packages.xz");
}

TEST(IndexUrlTest, LocalDetection) {
    EXPECT_TRUE(is_local_source("relative/Packages", true));
    EXPECT_TRUE(is_local_source("/srv/mirror/Packages", false));
    EXPECT_TRUE(is_local_source("file:///srv/mirror/Packages", false));
    EXPECT_FALSE(is_local_source("https://mirror/debian", false));
}

TEST_F(IndexSourceTest, ReadsLocalFile) {
    EXPECT_EQ(load_index_text(local_config((work_dir / "Packages").string())), index);
}

TEST_F(IndexSourceTest, DirectoryMeansPackagesInside) {
    EXPECT_EQ(resolve_local_index_path(work_dir.string()), work_dir / "Packages");
    EXPECT_EQ(load_index_text(local_config(work_dir.string())), index);
}

TEST_F(IndexSourceTest, FileScheme) {
    RunConfig cfg = local_config("file://" + (work_dir / "Packages").string());
    cfg.test = false;
    EXPECT_EQ(load_index_text(cfg), index);
}

TEST_F(IndexSourceTest, ReadsGzipIndex) {
    std::string cmd = "gzip -kf " + (work_dir / "Packages").string();
    ASSERT_EQ(std::system(cmd.c_str()), 0);
    EXPECT_EQ(load_index_text(local_config((work_dir / "Packages.gz").string())), index);
}

TEST_F(IndexSourceTest, ChecksumCoversCompressedBytes) {
    std::string cmd = "gzip -kf " + (work_dir / "Packages").string();
    ASSERT_EQ(std::system(cmd.c_str()), 0);
    RunConfig cfg = local_config((work_dir / "Packages.gz").string());
    cfg.sha256 = calculate_sha256(read_file_to_string(work_dir / "Packages.gz"));
    EXPECT_EQ(load_index_text(cfg), index);

    cfg.sha256 = calculate_sha256(index);
    EXPECT_THROW(load_index_text(cfg), PkgtreeException);
}

TEST_F(IndexSourceTest, ChecksumVerified) {
    RunConfig cfg = local_config((work_dir / "Packages").string());
    cfg.sha256 = calculate_sha256(index);
    EXPECT_EQ(load_index_text(cfg), index);

    cfg.sha256 = std::string(64, '0');
    EXPECT_THROW(load_index_text(cfg), PkgtreeException);
}

TEST_F(IndexSourceTest, MissingFileThrows) {
    EXPECT_THROW(load_index_text(local_config((work_dir / "absent").string())), PkgtreeException);
}
