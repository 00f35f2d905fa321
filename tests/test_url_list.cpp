#include <gtest/gtest.h>
#include "batchfetch/download_task.hpp"
#include "batchfetch/errors.hpp"
#include "batchfetch/url_list.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class UrlListTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_root = fs::absolute(std::string("tmp_url_list_test_") + info->name());
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
    }

    void TearDown() override {
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }
};

TEST_F(UrlListTest, BuiltInListIsTheFullDataset) {
    const auto& urls = batchfetch::nuScenesUrls();
    ASSERT_EQ(urls.size(), 11u);
    EXPECT_EQ(batchfetch::fileNameFromUrl(urls.front()), "v1.0-trainval01_blobs.tgz");
    EXPECT_EQ(batchfetch::fileNameFromUrl(urls.back()), "v1.0-trainval_meta.tgz");
    EXPECT_NO_THROW(batchfetch::validateUrlList(urls));
}

TEST_F(UrlListTest, ParseSkipsCommentsAndBlankLines) {
    std::istringstream in(
        "# nuScenes mini\n"
        "\n"
        "  https://example.com/v1.0-mini.tgz  \r\n"
        "\t# disabled: https://example.com/old.tgz\n"
        "https://example.com/v1.0-test_meta.tgz\n");

    const auto urls = batchfetch::parseUrlList(in);
    EXPECT_EQ(urls, (std::vector<std::string>{
        "https://example.com/v1.0-mini.tgz",
        "https://example.com/v1.0-test_meta.tgz"}));
}

TEST_F(UrlListTest, LoadFromFile) {
    const auto path = test_root / "urls.txt";
    {
        std::ofstream out(path);
        out << "https://example.com/a.tgz\nhttps://example.com/b.tgz\n";
    }
    EXPECT_EQ(batchfetch::loadUrlList(path).size(), 2u);
}

TEST_F(UrlListTest, MissingOrEmptyFileIsConfigError) {
    EXPECT_THROW(batchfetch::loadUrlList(test_root / "absent.txt"), batchfetch::ConfigError);

    const auto path = test_root / "empty.txt";
    {
        std::ofstream out(path);
        out << "# nothing here\n\n";
    }
    EXPECT_THROW(batchfetch::loadUrlList(path), batchfetch::ConfigError);
}
