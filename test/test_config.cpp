// ============= test/test_config.cpp =============
#include "config.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

TEST(SimpleToml, ParsesSectionsAndValues) {
    SimpleToml toml;
    ASSERT_TRUE(toml.parse(R"(
# comentario
top = 1

[tracker]
min_hits = 4
min_iou = 0.25   # comentario al final

[recognition]
backend = "brute_force"
note = "a # dentro del string"
)"));

    EXPECT_EQ(toml.get_int("top"), 1);
    EXPECT_EQ(toml.get_int("tracker.min_hits"), 4);
    EXPECT_FLOAT_EQ(toml.get_float("tracker.min_iou"), 0.25f);
    EXPECT_EQ(toml.get("recognition.backend"), "brute_force");
    EXPECT_EQ(toml.get("recognition.note"), "a # dentro del string");
    EXPECT_TRUE(toml.has("tracker.min_hits"));
    EXPECT_FALSE(toml.has("min_hits"));
}

TEST(SimpleToml, DefaultsForMissingOrMalformedValues) {
    SimpleToml toml;
    toml.parse("[a]\nnumber = abc\nflag = maybe\non = true\noff = 0\n");

    EXPECT_EQ(toml.get("a.missing", "x"), "x");
    EXPECT_EQ(toml.get_int("a.number", 7), 7);
    EXPECT_FLOAT_EQ(toml.get_float("a.number", 1.5f), 1.5f);

    EXPECT_TRUE(toml.get_bool("a.missing", true));
    EXPECT_TRUE(toml.get_bool("a.flag", true));
    EXPECT_FALSE(toml.get_bool("a.flag", false));
    EXPECT_TRUE(toml.get_bool("a.on", false));
    EXPECT_FALSE(toml.get_bool("a.off", true));
}

TEST(PipelineConfig, DefaultsAreValid) {
    PipelineConfig cfg;
    EXPECT_NO_THROW(cfg.validate());

    EXPECT_EQ(cfg.tracker.min_hits, Config::DEFAULT_MIN_HITS);
    EXPECT_EQ(cfg.embed_interval, 15);
    EXPECT_FLOAT_EQ(cfg.index.accept_threshold, 0.55f);
    EXPECT_EQ(cfg.index.backend, BackendKind::Matrix);
    EXPECT_FLOAT_EQ(cfg.engagement.yaw, 20.0f);
    EXPECT_FLOAT_EQ(cfg.engagement.pitch, -10.0f);
    EXPECT_EQ(cfg.external_timeout_ms, 0);
}

TEST(PipelineConfig, ApplyConfigOverridesOnlyPresentKeys) {
    SimpleToml toml;
    toml.parse(R"(
[tracker]
min_hits = 2
max_lost_frames = 5

[recognition]
embedding_dim = 512
backend = "brute_force"
embed_interval = 10

[behavior]
enabled = false
yaw_threshold = 25

[pipeline]
external_timeout_ms = 200

[input]
sources = ["0", "rtsp://cam/stream", "clip.mp4"]
display = true
)");

    PipelineConfig cfg;
    apply_config(toml, cfg);

    EXPECT_EQ(cfg.tracker.min_hits, 2);
    EXPECT_EQ(cfg.tracker.max_lost_frames, 5);
    EXPECT_FLOAT_EQ(cfg.tracker.min_iou, Config::DEFAULT_MIN_IOU);
    EXPECT_EQ(cfg.index.embedding_dim, 512);
    EXPECT_EQ(cfg.index.backend, BackendKind::BruteForce);
    EXPECT_EQ(cfg.embed_interval, 10);
    EXPECT_FALSE(cfg.pose_enabled);
    EXPECT_FLOAT_EQ(cfg.engagement.yaw, 25.0f);
    EXPECT_FLOAT_EQ(cfg.engagement.pitch, Config::DEFAULT_PITCH_THRESHOLD);
    EXPECT_EQ(cfg.external_timeout_ms, 200);
    EXPECT_EQ(cfg.sources, std::vector<std::string>({"0", "rtsp://cam/stream", "clip.mp4"}));
    EXPECT_TRUE(cfg.display);
    EXPECT_EQ(cfg.db_path, Config::DEFAULT_DB_PATH);

    EXPECT_NO_THROW(cfg.validate());
}

TEST(PipelineConfig, UnknownBackendThrows) {
    SimpleToml toml;
    toml.parse("[recognition]\nbackend = \"hnsw\"\n");

    PipelineConfig cfg;
    EXPECT_THROW(apply_config(toml, cfg), std::invalid_argument);
}

TEST(PipelineConfig, ValidateRejectsOutOfRange) {
    PipelineConfig cfg;
    cfg.embed_interval = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = PipelineConfig();
    cfg.pose_interval = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = PipelineConfig();
    cfg.external_timeout_ms = -1;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = PipelineConfig();
    cfg.tracker.lost_grace_frames = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = PipelineConfig();
    cfg.engagement.pitch = 5.0f;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(PipelineConfig, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("facepass_config_" + std::to_string(getpid()) + ".toml");
    {
        std::ofstream file(path);
        file << "[tracker]\nmin_hits = 5\n[database]\npath = \"/tmp/x.db\"\n";
    }

    PipelineConfig cfg;
    EXPECT_TRUE(load_pipeline_config(path.string(), cfg));
    EXPECT_EQ(cfg.tracker.min_hits, 5);
    EXPECT_EQ(cfg.db_path, "/tmp/x.db");

    std::filesystem::remove(path);

    PipelineConfig missing;
    EXPECT_FALSE(load_pipeline_config(path.string(), missing));
}

TEST(Utils, SplitListTrimsAndDropsEmpty) {
    EXPECT_EQ(split_list("a, b ,c"), std::vector<std::string>({"a", "b", "c"}));
    EXPECT_EQ(split_list("\"0\", , \"x.mp4\""), std::vector<std::string>({"0", "x.mp4"}));
    EXPECT_TRUE(split_list("").empty());
}

TEST(Utils, CameraIndex) {
    EXPECT_TRUE(is_camera_index("0"));
    EXPECT_TRUE(is_camera_index("12"));
    EXPECT_FALSE(is_camera_index(""));
    EXPECT_FALSE(is_camera_index("rtsp://cam"));
    EXPECT_FALSE(is_camera_index("video.mp4"));
}
