#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "config/ini_document.hpp"
#include "config/service_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("IniDocument reads DEFAULT keys case-insensitively", "[config][ini]") {
  camgate::config::IniDocument document;
  std::string error;
  REQUIRE(document.Parse("; comment\n"
                         "# another\n"
                         "Port = 9000\n"
                         "\n"
                         "[DEFAULT]\n"
                         "photo_folder_path : //photos\n"
                         "[other]\n"
                         "port = 1\n",
                         error));

  REQUIRE(document.Get("DEFAULT", "port").value_or("") == "9000");
  REQUIRE(document.Get("default", "PHOTO_FOLDER_PATH").value_or("") == "//photos");
  REQUIRE(document.Get("other", "port").value_or("") == "1");
  REQUIRE_FALSE(document.Get("DEFAULT", "missing").has_value());
}

TEST_CASE("IniDocument reports the failing line", "[config][ini]") {
  camgate::config::IniDocument document;
  std::string error;
  REQUIRE_FALSE(document.Parse("port = 1\nnot a pair\n", error));
  REQUIRE(error.find("line 2") != std::string::npos);
}

TEST_CASE("LoadServiceConfig applies defaults when the file is missing", "[config]") {
  const fs::path root = camgate::tests::common::CreateUniqueTempDir("camgate-config-missing");
  camgate::config::ServiceConfig config;
  std::string error;
  REQUIRE(camgate::config::LoadServiceConfig(root / "camgate.ini", config, error));

  REQUIRE_FALSE(config.config_file_found);
  REQUIRE(config.warnings.size() == 1U);
  REQUIRE(config.port == camgate::config::kDefaultPort);
  REQUIRE(config.capture_timeout == std::chrono::seconds(60));
  REQUIRE_FALSE(config.preview_last_photo);
  REQUIRE(config.photo_root.filename() == "photos");
  REQUIRE(config.placeholder_image_path == root / "dummy.jpg");
  REQUIRE(config.log_file_path == root / "camgate.log");
  REQUIRE(config.file_prefix == "CamGate");
  REQUIRE(config.foreground_commands.empty());

  camgate::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("LoadServiceConfig resolves every documented key", "[config]") {
  const fs::path root = camgate::tests::common::CreateUniqueTempDir("camgate-config-full");
  camgate::tests::common::WriteStringToFile(root / "camgate.ini",
                                            "[DEFAULT]\n"
                                            "port = 8123\n"
                                            "bind_address = 127.0.0.1\n"
                                            "photo_folder_path = //shots\n"
                                            "wait_x_seconds_on_ui_capture = 5\n"
                                            "preview_last_photo = yes\n"
                                            "dummy_file_path = assets/dummy.jpg\n"
                                            "log_file_path = /tmp/camgate-test.log\n"
                                            "file_prefix = Lab\n"
                                            "camera_index = 2\n"
                                            "foreground_command.2 = second\n"
                                            "foreground_command.1 = first\n"
                                            "foreground_command.10 = tenth\n");

  camgate::config::ServiceConfig config;
  std::string error;
  REQUIRE(camgate::config::LoadServiceConfig(root / "camgate.ini", config, error));

  REQUIRE(config.config_file_found);
  REQUIRE(config.warnings.empty());
  REQUIRE(config.port == 8123U);
  REQUIRE(config.bind_address == "127.0.0.1");
  REQUIRE(config.photo_root == root / "shots");
  REQUIRE(config.capture_timeout == std::chrono::seconds(5));
  REQUIRE(config.preview_last_photo);
  REQUIRE(config.placeholder_image_path == root / "assets" / "dummy.jpg");
  REQUIRE(config.log_file_path == fs::path("/tmp/camgate-test.log"));
  REQUIRE(config.file_prefix == "Lab");
  REQUIRE(config.camera_index == 2U);
  REQUIRE(config.foreground_commands ==
          std::vector<std::string>{"first", "second", "tenth"});

  camgate::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("LoadServiceConfig rejects invalid values", "[config]") {
  const fs::path root = camgate::tests::common::CreateUniqueTempDir("camgate-config-invalid");
  const fs::path ini = root / "camgate.ini";
  camgate::config::ServiceConfig config;
  std::string error;

  camgate::tests::common::WriteStringToFile(ini, "port = 70000\n");
  REQUIRE_FALSE(camgate::config::LoadServiceConfig(ini, config, error));
  REQUIRE(error.find("port") != std::string::npos);

  camgate::tests::common::WriteStringToFile(ini, "wait_x_seconds_on_ui_capture = 0\n");
  REQUIRE_FALSE(camgate::config::LoadServiceConfig(ini, config, error));
  REQUIRE(error.find("wait_x_seconds_on_ui_capture") != std::string::npos);

  camgate::tests::common::WriteStringToFile(ini, "preview_last_photo = maybe\n");
  REQUIRE_FALSE(camgate::config::LoadServiceConfig(ini, config, error));
  REQUIRE(error.find("preview_last_photo") != std::string::npos);

  camgate::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("ResolvePhotoRoot handles the default sentinel and relative prefix", "[config]") {
  const fs::path config_dir = "/srv/camgate";
  REQUIRE(camgate::config::ResolvePhotoRoot("//pics", config_dir) == fs::path("/srv/camgate/pics"));
  REQUIRE(camgate::config::ResolvePhotoRoot("/data/pics", config_dir) == fs::path("/data/pics"));
  REQUIRE(camgate::config::ResolvePhotoRoot("default", config_dir) ==
          (fs::current_path() / "photos").lexically_normal());
}
