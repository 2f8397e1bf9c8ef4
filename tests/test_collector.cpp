#include "test_helpers.hpp"

#include "AUG-CLI_CaseCollector.hpp"
#include "AUG-CLI_Loader.hpp"
#include "AUG-CLI_Validator.hpp"

#include <stdexcept>

using namespace AUG_CLI;

//===================================================================================================================//

static void testCollectCaseFolders() {
  std::cout << "  testCollectCaseFolders... ";

  std::string input = fixturePath("cases").toStdString();
  auto [imgs, masks] = CaseCollector::collectImagesAndMasks(input, "img.nrrd", "mask.nrrd");

  CHECK(imgs.size() == 2, "Case folders: two images");
  CHECK(masks.size() == 2, "Case folders: two masks");
  CHECK(imgs.size() == 2 && imgs[0] == input + "/case01/img.nrrd" && imgs[1] == input + "/case02/img.nrrd",
        "Case folders: images sorted by path");
  CHECK(masks.size() == 2 && masks[0] == input + "/case01/mask.nrrd", "Case folders: masks sorted by path");

  auto [imgsOnly, noMasks] = CaseCollector::collectImagesAndMasks(input, "img", "");
  CHECK(imgsOnly.size() == 2, "Case folders: prefix without extension defaults to nrrd");
  CHECK(noMasks.empty(), "Case folders: empty mask prefix collects nothing");

  CHECK_THROWS(CaseCollector::collectImagesAndMasks(input + "/does_not_exist", "img.nrrd", ""), std::runtime_error,
               "Case folders: missing input throws");
  std::cout << std::endl;
}

static void testCollectFlat() {
  std::cout << "  testCollectFlat... ";

  QString dir = freshTempDir("flat_cases");
  std::vector<float> data = {0, 1, 2, 3};
  writeAsciiNrrd(dir + "/p2_img.nrrd", {1, 2, 2}, data);
  writeAsciiNrrd(dir + "/p1_img.nrrd", {1, 2, 2}, data);
  writeAsciiNrrd(dir + "/P3_IMG.NRRD", {1, 2, 2}, data);
  writeAsciiNrrd(dir + "/p1_mask.nrrd", {1, 2, 2}, data);
  writeAsciiNrrd(dir + "/notes_img.txt", {1, 2, 2}, data);

  std::vector<std::string> imgs = CaseCollector::collectFiles(dir.toStdString(), "img.nrrd");
  CHECK(imgs.size() == 3, "Flat: suffix match is case-insensitive and extension-aware");
  CHECK(imgs.size() == 3 && imgs[0] == (dir + "/P3_IMG.NRRD").toStdString() &&
        imgs[1] == (dir + "/p1_img.nrrd").toStdString(), "Flat: sorted by path");

  CHECK(CaseCollector::collectFiles(dir.toStdString(), "mask.nrrd").size() == 1, "Flat: masks");
  CHECK(CaseCollector::collectFiles(dir.toStdString(), "").empty(), "Flat: empty prefix");
  std::cout << std::endl;
}

static void testResolveCase() {
  std::cout << "  testResolveCase... ";

  CaseIdentity flat = CaseCollector::resolveCase("/data/p1_img.nrrd", std::string("/data/p1_mask.nrrd"),
                                                 FilesStructure::FLAT, "img.nrrd");
  CHECK(flat.caseName == "p1", "Resolve: flat case name");
  CHECK(flat.imagePath == "/data/p1_img.nrrd", "Resolve: image path kept");
  CHECK(flat.maskPath.value_or("") == "/data/p1_mask.nrrd", "Resolve: mask path kept");

  CaseIdentity folders = CaseCollector::resolveCase("/data/case07/img.nrrd", std::nullopt,
                                                    FilesStructure::CASE_FOLDERS, "img.nrrd");
  CHECK(folders.caseName == "case07", "Resolve: case folder name");
  CHECK(!folders.maskPath.has_value(), "Resolve: no mask");

  CaseIdentity odd = CaseCollector::resolveCase("/data/scan.nrrd", std::nullopt, FilesStructure::FLAT, "img.nrrd");
  CHECK(odd.caseName == "scan", "Resolve: flat file without suffix uses its base name");

  CHECK_THROWS(CaseCollector::resolveCase("/data/x.nrrd", std::nullopt, FilesStructure::UNKNOWN, "img.nrrd"),
               std::runtime_error, "Resolve: unknown structure throws");
  std::cout << std::endl;
}

static void testSplitPrefixAndStructure() {
  std::cout << "  testSplitPrefixAndStructure... ";

  PrefixParts parts = CaseCollector::splitPrefix("img.nii.gz");
  CHECK(parts.stem == "img" && parts.extension == "nii.gz", "Prefix: split on first dot");
  CHECK(CaseCollector::splitPrefix("mask").fileName() == "mask.nrrd", "Prefix: default extension");

  CHECK(filesStructureFromString("Flat") == FilesStructure::FLAT, "Structure: flat");
  CHECK(filesStructureFromString("case-folders") == FilesStructure::CASE_FOLDERS, "Structure: case-folders");
  CHECK(filesStructureToString(FilesStructure::FLAT) == "flat", "Structure: toString");
  CHECK_THROWS(filesStructureFromString("nested"), std::runtime_error, "Structure: unknown throws");
  std::cout << std::endl;
}

//===================================================================================================================//

static AugmentConfig validConfig() {
  AugmentConfig config;
  config.imagesInputPath = fixturePath("cases").toStdString();
  config.imgPrefix = "img.nrrd";
  config.maskPrefix = "mask.nrrd";
  config.outputPath = tempDir().toStdString();
  config.previewPath = tempDir().toStdString() + "/preview";
  config.transforms = nlohmann::json::array({{{"type", "Flip"}}});
  return config;
}

static void testValidator() {
  std::cout << "  testValidator... ";

  bool valid = true;
  try {
    Validator::validateConfig(validConfig());
  } catch (const std::exception& e) {
    valid = false;
    std::cerr << e.what() << std::endl;
  }
  CHECK(valid, "Validator: complete config passes");

  AugmentConfig config = validConfig();
  config.imagesInputPath = "";
  CHECK_THROWS(Validator::validateConfig(config), std::runtime_error, "Validator: empty input path");

  config = validConfig();
  config.imagesInputPath += "/missing";
  CHECK_THROWS(Validator::validateConfig(config), std::runtime_error, "Validator: input path not a directory");

  config = validConfig();
  config.imgPrefix = "";
  CHECK_THROWS(Validator::validateConfig(config), std::runtime_error, "Validator: empty image prefix");

  config = validConfig();
  config.outputPath = "";
  CHECK_THROWS(Validator::validateConfig(config), std::runtime_error, "Validator: process needs an output path");
  config.mode = BatchMode::PREVIEW;
  try {
    Validator::validateConfig(config);
  } catch (const std::exception&) {
    valid = false;
  }
  CHECK(valid, "Validator: preview does not need an output path");

  config = validConfig();
  config.transforms = nlohmann::json::array();
  CHECK_THROWS(Validator::validateConfig(config), std::runtime_error, "Validator: no transforms");

  config = validConfig();
  config.device = "tpu:0";
  CHECK_THROWS(Validator::validateConfig(config), std::runtime_error, "Validator: invalid device");

  CHECK_THROWS(Validator::validateCollectedImagesAndMasks({}, {}), std::runtime_error, "Validator: no images");
  CHECK_THROWS(Validator::validateCollectedImagesAndMasks({"a", "b"}, {"m"}), std::runtime_error,
               "Validator: image and mask counts differ");

  bool imageOnly = true;
  try {
    Validator::validateCollectedImagesAndMasks({"a", "b"}, {});
  } catch (const std::exception&) {
    imageOnly = false;
  }
  CHECK(imageOnly, "Validator: image-only datasets pass");
  std::cout << std::endl;
}

//===================================================================================================================//

static void testParseConfig() {
  std::cout << "  testParseConfig... ";

  nlohmann::json json = {
    {"imagesInputPath", "cases"},
    {"imgPrefix", "img.nrrd"},
    {"maskPrefix", "mask.nrrd"},
    {"outputPath", "../out"},
    {"filesStructure", "flat"},
    {"device", "gpu:1"},
    {"seed", 7},
    {"transforms", nlohmann::json::array({{{"type", "RandFlip"}, {"prob", 1.0}}})}
  };

  AugmentConfig config = Loader::parseConfig(json, "/data/configs");
  CHECK(config.imagesInputPath == "/data/configs/cases", "Config: relative input resolved against config dir");
  CHECK(config.outputPath == "/data/out", "Config: output path cleaned");
  CHECK(config.previewPath == "/data/out/preview", "Config: preview defaults under the output path");
  CHECK(config.filesStructure == FilesStructure::FLAT, "Config: files structure");
  CHECK(config.mode == BatchMode::PROCESS, "Config: mode defaults to process");
  CHECK(config.seed.value_or(0) == 7, "Config: seed");
  CHECK(config.device == "gpu:1", "Config: device");
  CHECK(config.hasMasks(), "Config: masks configured");
  CHECK(config.transforms.size() == 1, "Config: transforms kept as descriptors");

  ConfigOverrides overrides;
  overrides.mode = "preview";
  overrides.outputPath = "/tmp/override_out";
  overrides.device = "cpu";
  overrides.seed = 11;

  AugmentConfig overridden = Loader::parseConfig(json, "/data/configs", overrides);
  CHECK(overridden.mode == BatchMode::PREVIEW, "Overrides: mode");
  CHECK(overridden.outputPath == "/tmp/override_out", "Overrides: output path");
  CHECK(overridden.previewPath == "/tmp/override_out/preview", "Overrides: preview follows the output path");
  CHECK(overridden.device == "cpu", "Overrides: device");
  CHECK(overridden.seed.value_or(0) == 11, "Overrides: seed");

  nlohmann::json minimal = {{"imgPrefix", "img.nrrd"}, {"imagesInputPath", "/abs/in"}};
  AugmentConfig defaults = Loader::parseConfig(minimal, "/data/configs");
  CHECK(defaults.outputPath.empty(), "Defaults: no output path");
  CHECK(defaults.previewPath == "/abs/in/preview", "Defaults: preview under the input path");
  CHECK(!defaults.hasMasks(), "Defaults: no mask prefix");
  CHECK(!defaults.seed.has_value(), "Defaults: no seed");
  CHECK(defaults.device == "CPU", "Defaults: CPU");

  CHECK_THROWS(Loader::parseConfig(nlohmann::json::array(), "/data"), std::runtime_error, "Config: not an object");
  CHECK_THROWS(Loader::parseConfig({{"mode", "train"}}, "/data"), std::runtime_error, "Config: invalid mode");
  std::cout << std::endl;
}

static void testLoadConfigFile() {
  std::cout << "  testLoadConfigFile... ";

  AugmentConfig config = Loader::loadConfig(fixturePath("process_config.json").toStdString());
  CHECK(config.imagesInputPath == fixturePath("cases").toStdString(), "Config file: input relative to the file");
  CHECK(config.filesStructure == FilesStructure::CASE_FOLDERS, "Config file: case folders");
  CHECK(config.transforms.size() == 2, "Config file: two transforms");

  CHECK_THROWS(Loader::loadConfig(fixturePath("missing.json").toStdString()), std::runtime_error,
               "Config file: missing file throws");

  QString broken = tempDir() + "/broken.json";
  QFile file(broken);
  if (file.open(QIODevice::WriteOnly)) {
    file.write("{ \"imgPrefix\": ");
    file.close();
  }
  CHECK_THROWS(Loader::loadConfig(broken.toStdString()), std::runtime_error, "Config file: parse error throws");
  std::cout << std::endl;
}

//===================================================================================================================//

void runCollectorTests() {
  testCollectCaseFolders();
  testCollectFlat();
  testResolveCase();
  testSplitPrefixAndStructure();
  testValidator();
  testParseConfig();
  testLoadConfigFile();
}
