#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "src/core/io/ImageLoader.hpp"
#include "src/core/io/StaticImageFrameSource.hpp"

using namespace target_finder;
using namespace target_finder::io;

class ImageIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "target_finder_io_test";
        std::filesystem::create_directories(tempDir);

        imagePath = (tempDir / "scene.png").string();
        cv::Mat image(60, 80, CV_8UC3, cv::Scalar(10, 120, 200));
        ASSERT_TRUE(cv::imwrite(imagePath, image));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tempDir, ec);
    }

    std::filesystem::path tempDir;
    std::string imagePath;
};

TEST_F(ImageIOTest, LoadsColourAndGrayscale) {
    cv::Mat colour = loadImage(imagePath);
    EXPECT_EQ(colour.size(), cv::Size(80, 60));
    EXPECT_EQ(colour.channels(), 3);
    EXPECT_EQ(colour.at<cv::Vec3b>(30, 40), cv::Vec3b(10, 120, 200));

    cv::Mat gray = loadImage(imagePath, true);
    EXPECT_EQ(gray.size(), cv::Size(80, 60));
    EXPECT_EQ(gray.channels(), 1);
}

TEST_F(ImageIOTest, MissingFileThrowsWithPath) {
    const std::string missing = (tempDir / "missing.png").string();
    try {
        loadImage(missing);
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Unable to open file"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find(missing), std::string::npos);
    }
    EXPECT_THROW(loadImage(""), std::runtime_error);
}

TEST_F(ImageIOTest, UndecodableFileThrows) {
    const auto path = tempDir / "notes.png";
    std::ofstream(path) << "not an image";

    EXPECT_THROW(loadImage(path.string()), std::runtime_error);
}

TEST_F(ImageIOTest, ScaleImageResizesProportionally) {
    cv::Mat image = loadImage(imagePath);

    EXPECT_EQ(scaleImage(image, 0.5).size(), cv::Size(40, 30));
    EXPECT_EQ(scaleImage(image, 1.5).size(), cv::Size(120, 90));
}

TEST_F(ImageIOTest, UnitScaleReturnsSameBuffer) {
    cv::Mat image = loadImage(imagePath);

    cv::Mat scaled = scaleImage(image, 1.0);

    EXPECT_EQ(scaled.data, image.data);
}

TEST_F(ImageIOTest, NonPositiveScaleThrows) {
    cv::Mat image = loadImage(imagePath);

    EXPECT_THROW(scaleImage(image, 0.0), std::invalid_argument);
    EXPECT_THROW(scaleImage(image, -2.0), std::invalid_argument);
}

TEST_F(ImageIOTest, StaticSourceYieldsImageOnEveryCall) {
    StaticImageFrameSource source(imagePath);

    EXPECT_FALSE(source.isStreaming());
    EXPECT_EQ(source.kind(), SourceKind::IMAGE_FILE);
    EXPECT_EQ(source.describe(), imagePath);

    cv::Mat first;
    cv::Mat second;
    ASSERT_TRUE(source.next(first));
    ASSERT_TRUE(source.next(second));
    EXPECT_EQ(first.size(), cv::Size(80, 60));
    EXPECT_EQ(second.size(), first.size());
}

TEST_F(ImageIOTest, StaticSourceFailsEarlyOnMissingFile) {
    EXPECT_THROW(StaticImageFrameSource((tempDir / "missing.png").string()), std::runtime_error);
}

TEST_F(ImageIOTest, StaticSourceReportsVanishedFile) {
    StaticImageFrameSource source(imagePath, true);
    std::filesystem::remove(imagePath);

    cv::Mat frame;
    EXPECT_FALSE(source.next(frame));
}
