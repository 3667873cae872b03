#include "test_common.hpp"
#include "config_utils.hpp"
#include "options.hpp"

using autodeploy::test_support::TempDir;

static ConfigValues base_config() {
    ConfigValues cfg;
    cfg.scalars = {{"repoPath", "/srv/app"},
                   {"remoteRepo", "https://example.com/app.git"},
                   {"interval", "60000"},
                   {"branch", "main"}};
    return cfg;
}

TEST_CASE("YAML config loads scalars and lists") {
    TempDir dir("yaml_cfg");
    fs::path cfg_path = dir.path / "config.yaml";
    {
        std::ofstream ofs(cfg_path);
        ofs << "repoPath: /srv/app\n";
        ofs << "remoteRepo: git@example.com:team/app.git\n";
        ofs << "interval: 60000\n";
        ofs << "branch: main\n";
        ofs << "buildCommand:\n  - yarn\n  - build\n";
        ofs << "compress: yes\n";
        ofs << "logFile: ~\n";
    }
    ConfigValues cfg;
    std::string err;
    REQUIRE(load_yaml_config(cfg_path.string(), cfg, err));
    REQUIRE(cfg.scalars["repoPath"] == "/srv/app");
    REQUIRE(cfg.scalars["remoteRepo"] == "git@example.com:team/app.git");
    REQUIRE(cfg.scalars["interval"] == "60000");
    REQUIRE(cfg.scalars["compress"] == "true");
    REQUIRE(cfg.scalars["logFile"].empty());
    REQUIRE(cfg.lists["buildCommand"] == std::vector<std::string>{"yarn", "build"});
    REQUIRE(cfg.has("branch"));
    REQUIRE_FALSE(cfg.has("remote"));
}

TEST_CASE("JSON config loads scalars and lists") {
    TempDir dir("json_cfg");
    fs::path cfg_path = dir.path / "config.json";
    {
        std::ofstream ofs(cfg_path);
        ofs << R"({"repoPath": "/srv/app", "remoteRepo": "https://example.com/app.git",)"
            << R"( "interval": 60000, "branch": "main", "installCommand": ["npm", "ci"]})";
    }
    ConfigValues cfg;
    std::string err;
    REQUIRE(load_config_file(cfg_path.string(), cfg, err));
    REQUIRE(cfg.scalars["interval"] == "60000");
    REQUIRE(cfg.lists["installCommand"] == std::vector<std::string>{"npm", "ci"});
}

TEST_CASE("Config loaders report unreadable and malformed files") {
    TempDir dir("bad_cfg");
    ConfigValues cfg;
    std::string err;
    REQUIRE_FALSE(load_config_file((dir.path / "missing.yaml").string(), cfg, err));
    REQUIRE(err == "Failed to open file");

    fs::path list_root = dir.path / "list.yaml";
    std::ofstream(list_root) << "- a\n- b\n";
    err.clear();
    REQUIRE_FALSE(load_yaml_config(list_root.string(), cfg, err));
    REQUIRE(err == "Root YAML node is not a map");

    fs::path broken = dir.path / "broken.json";
    std::ofstream(broken) << "{\"repoPath\": ";
    err.clear();
    REQUIRE_FALSE(load_config_file(broken.string(), cfg, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("target_from_config builds a deployment target") {
    auto t = target_from_config(base_config());
    REQUIRE(t.repo_path == fs::path("/srv/app"));
    REQUIRE(t.remote_url == "https://example.com/app.git");
    REQUIRE(t.branch == "main");
    REQUIRE(t.interval == std::chrono::milliseconds(60000));
    REQUIRE(t.remote_name == "origin");
    REQUIRE(t.tracking_ref() == "origin/main");
    REQUIRE(t.build_file == "package.json");
    REQUIRE(t.install_command == std::vector<std::string>{"npm", "install"});
    REQUIRE(t.build_command == std::vector<std::string>{"npm", "run", "build"});
}

TEST_CASE("target_from_config rejects each missing required field") {
    for (const char* key : {"repoPath", "remoteRepo", "interval", "branch"}) {
        DYNAMIC_SECTION("missing " << key) {
            ConfigValues cfg = base_config();
            cfg.scalars.erase(key);
            try {
                target_from_config(cfg);
                FAIL("expected ConfigError");
            } catch (const ConfigError& e) {
                REQUIRE(std::string(e.what()).find(key) != std::string::npos);
                REQUIRE(e.kind() == ErrorKind::Config);
            }
        }
    }
}

TEST_CASE("target_from_config names every missing field at once") {
    ConfigValues cfg;
    cfg.scalars["branch"] = "";
    try {
        target_from_config(cfg);
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("repoPath, remoteRepo, interval, branch") != std::string::npos);
    }
}

TEST_CASE("target_from_config validates interval") {
    ConfigValues cfg = base_config();
    cfg.scalars["interval"] = "soon";
    REQUIRE_THROWS_AS(target_from_config(cfg), ConfigError);
    cfg.scalars["interval"] = "0";
    REQUIRE_THROWS_AS(target_from_config(cfg), ConfigError);
    cfg.scalars["interval"] = "-5";
    REQUIRE_THROWS_AS(target_from_config(cfg), ConfigError);
    cfg.scalars["interval"] = "30s";
    REQUIRE(target_from_config(cfg).interval == std::chrono::milliseconds(30000));
    cfg.scalars["interval"] = "2m";
    REQUIRE(target_from_config(cfg).interval == std::chrono::milliseconds(120000));
}

TEST_CASE("target_from_config caps interval at one year") {
    ConfigValues cfg = base_config();
    cfg.scalars["interval"] = std::to_string(deploy::kMaxInterval.count());
    REQUIRE(target_from_config(cfg).interval == deploy::kMaxInterval);
    cfg.scalars["interval"] = std::to_string(deploy::kMaxInterval.count() + 1);
    REQUIRE_THROWS_AS(target_from_config(cfg), ConfigError);
    // Fits in milliseconds but not in steady_clock nanoseconds.
    cfg.scalars["interval"] = "10000000000000";
    REQUIRE_THROWS_AS(target_from_config(cfg), ConfigError);
}

TEST_CASE("target_from_config applies optional overrides") {
    ConfigValues cfg = base_config();
    cfg.scalars["remote"] = "upstream";
    cfg.scalars["buildFile"] = "Makefile";
    cfg.scalars["installCommand"] = "  make   deps ";
    cfg.lists["buildCommand"] = {"make", "all"};
    auto t = target_from_config(cfg);
    REQUIRE(t.remote_name == "upstream");
    REQUIRE(t.tracking_ref() == "upstream/main");
    REQUIRE(t.build_file == "Makefile");
    REQUIRE(t.install_command == std::vector<std::string>{"make", "deps"});
    REQUIRE(t.build_command == std::vector<std::string>{"make", "all"});
}

TEST_CASE("target_from_config rejects empty optional values") {
    ConfigValues cfg = base_config();
    cfg.scalars["remote"] = "";
    REQUIRE_THROWS_AS(target_from_config(cfg), ConfigError);

    cfg = base_config();
    cfg.lists["buildCommand"] = {};
    REQUIRE_THROWS_AS(target_from_config(cfg), ConfigError);

    cfg = base_config();
    cfg.scalars["installCommand"] = "   ";
    REQUIRE_THROWS_AS(target_from_config(cfg), ConfigError);
}
