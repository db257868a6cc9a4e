#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>

#include "src/core/config/YAMLConfigLoader.hpp"

using target_finder::FeatureAlgorithm;
using target_finder::config::RecognitionConfig;
using target_finder::config::YAMLConfigLoader;

namespace {

std::filesystem::path repoRoot() {
    return std::filesystem::path(__FILE__).parent_path().parent_path().parent_path().parent_path();
}

}

TEST(YAMLConfigLoader, EmptyDocumentKeepsDefaults) {
    auto cfg = YAMLConfigLoader::loadFromString("");

    EXPECT_TRUE(cfg.reference.find_path.empty());
    EXPECT_EQ(cfg.input.path, "webcam");
    EXPECT_DOUBLE_EQ(cfg.input.scale, 1.0);
    EXPECT_EQ(cfg.algorithm.family, FeatureAlgorithm::SIFT);
    EXPECT_FLOAT_EQ(cfg.matching.ratio_threshold, 0.7f);
    EXPECT_EQ(cfg.matching.min_matches, 4);
    EXPECT_EQ(cfg.scheduling.process_every, 1);
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST(YAMLConfigLoader, ParsesAllSections) {
    const char* yaml = R"YAML(
reference: { find: box.png, superpose: logo.png }
input: { path: scene.jpg, scale: 0.5, camera_index: 2, grayscale: true }
algorithm: { using: "ORB:800" }
matching: { ratio_threshold: 0.6, min_matches: 10, ransac_reprojection_threshold: 5.0 }
scheduling: { process_every: 3, report_interval_ms: 2000, key_wait_ms: 10 }
logging: { level: debug }
)YAML";
    auto cfg = YAMLConfigLoader::loadFromString(yaml);

    EXPECT_EQ(cfg.reference.find_path, "box.png");
    EXPECT_EQ(cfg.reference.superpose_path, "logo.png");
    EXPECT_EQ(cfg.input.path, "scene.jpg");
    EXPECT_DOUBLE_EQ(cfg.input.scale, 0.5);
    EXPECT_EQ(cfg.input.camera_index, 2);
    EXPECT_TRUE(cfg.input.grayscale);
    EXPECT_FALSE(cfg.input.useWebcam());
    EXPECT_EQ(cfg.algorithm.family, FeatureAlgorithm::ORB);
    EXPECT_EQ(cfg.algorithm.orb_num_features, 800);
    EXPECT_FLOAT_EQ(cfg.matching.ratio_threshold, 0.6f);
    EXPECT_EQ(cfg.matching.min_matches, 10);
    EXPECT_DOUBLE_EQ(cfg.matching.ransac_reprojection_threshold, 5.0);
    EXPECT_EQ(cfg.scheduling.process_every, 3);
    EXPECT_EQ(cfg.scheduling.report_interval_ms, 2000);
    EXPECT_EQ(cfg.scheduling.key_wait_ms, 10);
    EXPECT_EQ(cfg.logging.level, "debug");
}

TEST(YAMLConfigLoader, ExplicitAlgorithmKeysRefineUsing) {
    const char* yaml = R"YAML(
algorithm:
  using: SURF
  surf_hessian_threshold: 650
)YAML";
    auto cfg = YAMLConfigLoader::loadFromString(yaml);

    EXPECT_EQ(cfg.algorithm.family, FeatureAlgorithm::SURF);
    EXPECT_DOUBLE_EQ(cfg.algorithm.surf_hessian_threshold, 650.0);
}

TEST(YAMLConfigLoader, InvalidValuesAreRejected) {
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("scheduling: { process_every: 0 }"); (void)cfg; },
                 std::runtime_error);
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("matching: { ratio_threshold: 1.5 }"); (void)cfg; },
                 std::runtime_error);
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("matching: { min_matches: -1 }"); (void)cfg; },
                 std::runtime_error);
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("input: { scale: 0 }"); (void)cfg; },
                 std::runtime_error);
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("logging: { level: chatty }"); (void)cfg; },
                 std::runtime_error);
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("algorithm: { family: brisk }"); (void)cfg; },
                 std::runtime_error);
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("algorithm: { using: \"ORB:many\" }"); (void)cfg; },
                 std::runtime_error);
}

TEST(YAMLConfigLoader, MalformedYamlIsRuntimeError) {
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("input: [unterminated"); (void)cfg; },
                 std::runtime_error);
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("input: { scale: fast }"); (void)cfg; },
                 std::runtime_error);
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("- just\n- a list\n"); (void)cfg; },
                 std::runtime_error);
}

TEST(YAMLConfigLoader, ReferenceRequiredOnlyWhenAsked) {
    RecognitionConfig cfg;
    EXPECT_NO_THROW(YAMLConfigLoader::validate(cfg, false));
    EXPECT_THROW(YAMLConfigLoader::validate(cfg), std::runtime_error);

    cfg.reference.find_path = "box.png";
    EXPECT_NO_THROW(YAMLConfigLoader::validate(cfg));
}

TEST(YAMLConfigLoader, SavedConfigLoadsBack) {
    RecognitionConfig cfg;
    cfg.reference.find_path = "box.png";
    cfg.reference.superpose_path = "logo.png";
    cfg.input.path = "scene.png";
    cfg.input.scale = 0.5;
    cfg.algorithm.family = FeatureAlgorithm::ORB;
    cfg.algorithm.orb_num_features = 300;
    cfg.matching.min_matches = 12;
    cfg.scheduling.process_every = 4;

    auto reloaded = YAMLConfigLoader::loadFromString(YAMLConfigLoader::saveToString(cfg));

    EXPECT_EQ(reloaded.reference.find_path, "box.png");
    EXPECT_EQ(reloaded.reference.superpose_path, "logo.png");
    EXPECT_EQ(reloaded.input.path, "scene.png");
    EXPECT_DOUBLE_EQ(reloaded.input.scale, 0.5);
    EXPECT_EQ(reloaded.algorithm.family, FeatureAlgorithm::ORB);
    EXPECT_EQ(reloaded.algorithm.orb_num_features, 300);
    EXPECT_EQ(reloaded.matching.min_matches, 12);
    EXPECT_EQ(reloaded.scheduling.process_every, 4);
}

TEST(YAMLConfigLoader, MissingFileIsRuntimeError) {
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromFile("/nonexistent/target_finder.yaml"); (void)cfg; },
                 std::runtime_error);
}

TEST(YAMLConfigLoader, ShippedDefaultConfigLoads) {
    const auto path = repoRoot() / "config" / "target_finder.yaml";
    ASSERT_TRUE(std::filesystem::exists(path)) << path;

    auto cfg = YAMLConfigLoader::loadFromFile(path.string());

    EXPECT_EQ(cfg.input.path, "webcam");
    EXPECT_EQ(cfg.algorithm.family, FeatureAlgorithm::SIFT);
    EXPECT_EQ(cfg.matching.min_matches, 4);
    EXPECT_EQ(cfg.scheduling.key_wait_ms, 30);
}
