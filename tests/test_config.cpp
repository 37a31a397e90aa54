#include <gtest/gtest.h>
#include "../src/config.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
        set_root_path("/");
    }

    void TearDown() override {
        set_root_path("/");
    }
};

TEST_F(ConfigTest, DefaultRoot) {
    EXPECT_EQ(ROOT_DIR, "/");
    EXPECT_EQ(CONFIG_DIR, fs::path(PKGTREE_CONF_DIR));
    EXPECT_EQ(L10N_DIR, fs::path(PKGTREE_L10N_DIR));
    EXPECT_EQ(REPO_CONF, fs::path(PKGTREE_CONF_DIR) / "repo.conf");
}

TEST_F(ConfigTest, CustomRoot) {
    std::string root = "/mnt/new_root";
    set_root_path(root);

    EXPECT_EQ(ROOT_DIR, fs::path(root));
    EXPECT_EQ(CONFIG_DIR, fs::path(root) / fs::path(PKGTREE_CONF_DIR).relative_path());
    EXPECT_EQ(REPO_CONF, CONFIG_DIR / "repo.conf");
}

TEST_F(ConfigTest, DefaultRepoFromConfig) {
    fs::path root = fs::absolute("tmp_config_test");
    fs::remove_all(root);
    set_root_path(root.string());
    fs::create_directories(CONFIG_DIR);

    std::ofstream(REPO_CONF) << "  http://mirror/debian/dists/stable/main/binary-amd64  \nignored\n";
    EXPECT_EQ(get_default_repo(), "http://mirror/debian/dists/stable/main/binary-amd64");

    std::ofstream(REPO_CONF) << "\n";
    EXPECT_THROW(get_default_repo(), PkgtreeException);

    fs::remove(REPO_CONF);
    EXPECT_THROW(get_default_repo(), PkgtreeException);

    fs::remove_all(root);
}
