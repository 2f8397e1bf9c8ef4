#include "test_helpers.hpp"

#include "AUG-CLI_BatchDriver.hpp"
#include "AUG-CLI_ProgressBar.hpp"
#include "AUG-CLI_SlicePreviewer.hpp"
#include "AUG-CLI_Transforms.hpp"
#include "AUG-CLI_VolumeLoader.hpp"
#include "AUG-CLI_VolumeStorage.hpp"

#include <algorithm>
#include <map>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace AUG_CLI;

namespace {

class RecordingSink : public CaseSink {
  public:
    void beginBatch() override { this->begun++; }
    void consume(const CaseUnit& unit) override { this->units.push_back(unit); }

    int begun = 0;
    std::vector<CaseUnit> units;
};

// Fails on images whose first sample is the marker value
class FailOnMarkerTransform : public DeterministicTransform {
  public:
    explicit FailOnMarkerTransform(float marker) : marker(marker) {}

    Volume operator()(const Volume& volume) const override {
      if (!volume.empty() && volume.data()[0] == this->marker) {
        throw std::runtime_error("marker volume rejected");
      }
      return volume;
    }

    std::optional<nlohmann::json> transformInfo() const override { return nlohmann::json{{"class", "FailOnMarker"}}; }

  private:
    float marker;
};

// Redirects std::cerr for the lifetime of the object
class CerrCapture {
  public:
    CerrCapture() : previous(std::cerr.rdbuf(this->buffer.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(this->previous); }

    std::string str() const { return this->buffer.str(); }

  private:
    std::ostringstream buffer;
    std::streambuf* previous;
};

struct Batch {
  BatchInput input;
  std::map<std::string, Volume> volumes;
  std::vector<std::string> requested;

  VolumeSource source() {
    return [this](const std::string& path) -> std::optional<Volume> {
      this->requested.push_back(path);
      auto it = this->volumes.find(path);
      if (it == this->volumes.end()) return std::nullopt;
      return it->second;
    };
  }

  bool wasRequested(const std::string& path) const {
    return std::find(this->requested.begin(), this->requested.end(), path) != this->requested.end();
  }
};

// Cases /virtual/caseN/{img,mask}.nrrd; case i's image starts at i * 100
Batch makeBatch(ulong cases, bool emptyMasks = false) {
  Batch batch;
  std::vector<float> labels(16, 0.0f);
  if (!emptyMasks) labels[5] = labels[10] = 1.0f;

  for (ulong i = 1; i <= cases; i++) {
    std::string dir = "/virtual/case" + std::to_string(i);
    batch.input.imgPaths.push_back(dir + "/img.nrrd");
    batch.input.maskPaths.push_back(dir + "/mask.nrrd");
    batch.volumes.emplace(dir + "/img.nrrd", rampVolume({1, 4, 4}, static_cast<float>(i * 100)));
    batch.volumes.emplace(dir + "/mask.nrrd", Volume({1, 4, 4}, labels));
  }

  batch.input.filesStructure = FilesStructure::CASE_FOLDERS;
  batch.input.imgPrefix = "img.nrrd";
  return batch;
}

}  // namespace

//===================================================================================================================//

static void testProcessFanOut() {
  std::cout << "  testProcessFanOut... ";

  Batch batch = makeBatch(2);
  batch.input.transformations = {makeTransform<RandFlipTransform>(1.0f), makeTransform<NormalizeIntensityTransform>()};

  RecordingSink sink;
  BatchDriver driver(BatchMode::PROCESS, sink, LogLevel::QUIET);
  driver.setVolumeSource(batch.source());

  std::vector<std::pair<ulong, ulong>> progress;
  std::vector<std::string> messages;
  driver.setProgressCallback([&](ulong current, ulong total) { progress.emplace_back(current, total); });
  driver.setCompletionCallback([&](const std::string& message) { messages.push_back(message); });

  CHECK(driver.getErrorPolicy() == CaseErrorPolicy::PROPAGATE, "Process: propagates by default");

  BatchSummary summary = driver.run(batch.input);

  CHECK(sink.begun == 1, "Process: sink notified once");
  CHECK(sink.units.size() == 4, "Process: one unit per case and transform");
  CHECK(summary.attempted == 2 && summary.succeeded == 2 && summary.failed == 0, "Process: summary counts");

  if (sink.units.size() == 4) {
    CHECK(sink.units[0].identity.caseName == "case1", "Process: case name from folder");
    CHECK(sink.units[0].transformName == "RandFlip", "Process: first unit is the flip");
    CHECK(sink.units[1].transformName == "NormalizeIntensity", "Process: second unit is normalize");
    CHECK(sink.units[2].identity.caseName == "case2", "Process: second case");
    CHECK(sink.units[0].mask.has_value(), "Process: mask paired with image");
    CHECK(sink.units[0].identity.maskPath.value_or("") == "/virtual/case1/mask.nrrd", "Process: original mask path");
    CHECK(sink.units[0].imageNodeName == "case1_RandFlip_img", "Process: image node name");
    CHECK(sink.units[0].maskNodeName == "case1_RandFlip_mask", "Process: mask node name");
  }

  CHECK(progress == (std::vector<std::pair<ulong, ulong>>{{1, 2}, {2, 2}}), "Process: one increment per case");
  CHECK(messages.size() == 1, "Process: one completion message");
  CHECK(messages.size() == 1 && std::regex_match(messages[0], std::regex(R"(Processing completed in \d+\.\d\d seconds)")),
        "Process: completion message format");
  CHECK(summary.message == BatchDriver::completionMessage(summary.elapsedSeconds), "Process: summary message");
  std::cout << std::endl;
}

static void testEmptyMaskHandling() {
  std::cout << "  testEmptyMaskHandling... ";

  Batch batch = makeBatch(1, true);
  batch.input.transformations = {makeTransform<FlipTransform>()};

  RecordingSink processSink;
  BatchDriver process(BatchMode::PROCESS, processSink, LogLevel::QUIET);
  process.setVolumeSource(batch.source());
  process.run(batch.input);

  CHECK(processSink.units.size() == 1, "Empty mask: image still handed over");
  CHECK(processSink.units.size() == 1 && !processSink.units[0].mask.has_value(),
        "Empty mask: all-zero mask not handed over in process mode");

  RecordingSink previewSink;
  BatchDriver preview(BatchMode::PREVIEW, previewSink, LogLevel::QUIET);
  preview.setVolumeSource(batch.source());
  preview.run(batch.input);

  CHECK(previewSink.units.size() == 1 && previewSink.units[0].mask.has_value(),
        "Empty mask: preview displays it anyway");
  std::cout << std::endl;
}

static void testPreviewTruncation() {
  std::cout << "  testPreviewTruncation... ";

  Batch batch = makeBatch(5);
  batch.input.transformations = {makeTransform<RandFlipTransform>(1.0f), makeTransform<FlipTransform>()};

  RecordingSink sink;
  BatchDriver driver(BatchMode::PREVIEW, sink, LogLevel::QUIET);
  driver.setVolumeSource(batch.source());

  ulong maxTotal = 0;
  ulong calls = 0;
  driver.setProgressCallback([&](ulong /*current*/, ulong total) {
    calls++;
    maxTotal = std::max(maxTotal, total);
  });

  BatchSummary summary = driver.run(batch.input);

  CHECK(summary.attempted == 1, "Preview: only the first case is run");
  CHECK(maxTotal == 1 && calls == 1, "Preview: progress maximum is 1");
  CHECK(sink.units.size() == 2, "Preview: one unit per transform of the first case");
  CHECK(!batch.wasRequested("/virtual/case2/img.nrrd"), "Preview: second case never loaded");

  bool firstCaseOnly = true;
  for (const auto& unit : sink.units) firstCaseOnly = firstCaseOnly && unit.identity.caseName == "case1";
  CHECK(firstCaseOnly, "Preview: units belong to case1");
  CHECK(driver.getErrorPolicy() == CaseErrorPolicy::LOG_AND_CONTINUE, "Preview: logs and continues by default");
  std::cout << std::endl;
}

static void testBatchAbort() {
  std::cout << "  testBatchAbort... ";

  Batch batch = makeBatch(3);
  batch.input.transformations = {makeTransform<FailOnMarkerTransform>(200.0f)};

  RecordingSink sink;
  BatchDriver driver(BatchMode::PROCESS, sink, LogLevel::QUIET);
  driver.setVolumeSource(batch.source());

  std::vector<ulong> progress;
  bool completed = false;
  driver.setProgressCallback([&](ulong current, ulong /*total*/) { progress.push_back(current); });
  driver.setCompletionCallback([&](const std::string& /*message*/) { completed = true; });

  bool thrown = false;
  try {
    driver.run(batch.input);
  } catch (const std::runtime_error& e) {
    thrown = std::string(e.what()) == "marker volume rejected";
  }

  CHECK(thrown, "Abort: case 2 exception surfaces to the caller");
  CHECK(sink.units.size() == 1 && sink.units[0].identity.caseName == "case1", "Abort: case 1 was handed over");
  CHECK(!batch.wasRequested("/virtual/case3/img.nrrd"), "Abort: case 3 never attempted");
  CHECK(progress == std::vector<ulong>({1}), "Abort: progress stops after case 1");
  CHECK(!completed, "Abort: no completion message");
  std::cout << std::endl;
}

static void testBatchContinue() {
  std::cout << "  testBatchContinue... ";

  Batch batch = makeBatch(3);
  batch.input.transformations = {makeTransform<FailOnMarkerTransform>(200.0f)};

  RecordingSink sink;
  BatchDriver driver(BatchMode::PROCESS, sink, LogLevel::ERROR);
  driver.setErrorPolicy(CaseErrorPolicy::LOG_AND_CONTINUE);
  driver.setVolumeSource(batch.source());

  std::vector<ulong> progress;
  std::string completion;
  driver.setProgressCallback([&](ulong current, ulong /*total*/) { progress.push_back(current); });
  driver.setCompletionCallback([&](const std::string& message) { completion = message; });

  BatchSummary summary;
  std::string errors;
  {
    CerrCapture capture;
    summary = driver.run(batch.input);
    errors = capture.str();
  }

  CHECK(sink.units.size() == 2, "Continue: cases 1 and 3 handed over");
  CHECK(sink.units.size() == 2 && sink.units[0].identity.caseName == "case1" &&
        sink.units[1].identity.caseName == "case3", "Continue: case order kept");
  CHECK(summary.attempted == 3 && summary.succeeded == 2 && summary.failed == 1, "Continue: summary counts");
  CHECK(errors.find("Error: case 2 (/virtual/case2/img.nrrd): marker volume rejected") != std::string::npos,
        "Continue: case 2 error logged");
  CHECK(progress == std::vector<ulong>({1, 2, 3}), "Continue: progress reaches the case count");
  CHECK(completion.rfind("Processing completed in ", 0) == 0, "Continue: completion still reported");
  std::cout << std::endl;
}

static void testPreviewFailureIsLogged() {
  std::cout << "  testPreviewFailureIsLogged... ";

  Batch batch = makeBatch(2);
  batch.input.transformations = {makeTransform<FailOnMarkerTransform>(100.0f)};

  RecordingSink sink;
  BatchDriver driver(BatchMode::PREVIEW, sink, LogLevel::QUIET);
  driver.setVolumeSource(batch.source());

  std::string completion;
  driver.setCompletionCallback([&](const std::string& message) { completion = message; });

  BatchSummary summary;
  std::string errors;
  bool thrown = false;
  {
    CerrCapture capture;
    try {
      summary = driver.run(batch.input);
    } catch (const std::exception&) {
      thrown = true;
    }
    errors = capture.str();
  }

  CHECK(!thrown, "Preview failure: not rethrown");
  CHECK(summary.failed == 1 && sink.units.empty(), "Preview failure: counted, nothing displayed");
  CHECK(errors.empty(), "Preview failure: quiet log level prints nothing");
  CHECK(!completion.empty(), "Preview failure: completion still reported");
  std::cout << std::endl;
}

//===================================================================================================================//

static void testVolumeStorageLayout() {
  std::cout << "  testVolumeStorageLayout... ";

  QString source = freshTempDir("storage_source");
  QString output = freshTempDir("storage_output");
  QString imgPath = source + "/caseA/scan.nrrd";
  QString maskPath = source + "/caseA/seg.nrrd";

  std::vector<float> labels = {0, 1, 1, 0, 0, 2, 0, 0};
  writeAsciiNrrd(imgPath, {2, 2, 2}, {0, 1, 2, 3, 4, 5, 6, 7}, "short");
  writeAsciiNrrd(maskPath, {2, 2, 2}, labels, "uint8");

  VolumeStorage storage(output.toStdString(), "scan.nrrd", "seg.nrrd", LogLevel::QUIET);

  CaseUnit unit;
  unit.identity = {"caseA", imgPath.toStdString(), maskPath.toStdString()};
  unit.transformName = "Flip";
  unit.image = FlipTransform()(rampVolume({2, 2, 2}, 0.5f)).to(Device::gpu(0));
  unit.mask = Volume({2, 2, 2}, labels);
  storage.consume(unit);

  QString dir = output + "/Augmentator/caseA/Flip";
  CHECK(QFile::exists(dir + "/scan.nrrd"), "Storage: image written under <out>/Augmentator/<case>/<transform>");
  CHECK(QFile::exists(dir + "/seg.nrrd"), "Storage: mask written beside the image");
  CHECK(storage.getFilesWritten() == 2, "Storage: two files written");

  auto image = VolumeLoader::load((dir + "/scan.nrrd").toStdString());
  CHECK(image.has_value() && image->data() == unit.image.data(), "Storage: image samples kept");
  CHECK(image.has_value() && image->metadata().componentType == "float", "Storage: image written as float");

  auto mask = VolumeLoader::load((dir + "/seg.nrrd").toStdString());
  CHECK(mask.has_value() && mask->data() == labels, "Storage: mask samples kept");
  CHECK(mask.has_value() && mask->metadata().componentType == "uint8", "Storage: mask keeps its label type");

  // Without a mask, only the image is written
  CaseUnit imageOnly = unit;
  imageOnly.transformName = "NormalizeIntensity";
  imageOnly.mask.reset();
  storage.consume(imageOnly);

  CHECK(QFile::exists(output + "/Augmentator/caseA/NormalizeIntensity/scan.nrrd"), "Storage: image-only unit");
  CHECK(!QFile::exists(output + "/Augmentator/caseA/NormalizeIntensity/seg.nrrd"), "Storage: no mask file");
  CHECK(VolumeStorage::outputRoot("/data/out") == "/data/out/Augmentator", "Storage: output root");

  // A transformed volume's own geometry wins over the source header
  QString flatPath = source + "/caseB/scan.nrrd";
  writeAsciiNrrd(flatPath, {1, 2, 3}, {0, 1, 2, 3, 4, 5}, "short");
  auto flat = VolumeLoader::load(flatPath.toStdString());
  CHECK(flat.has_value(), "Storage: anisotropic source loaded");
  if (flat.has_value()) {
    VolumeMetadata geometry = flat->metadata();
    geometry.spacing = {0.5, 2.0, 3.0};

    CaseUnit rotated;
    rotated.identity = {"caseB", flatPath.toStdString(), std::nullopt};
    rotated.transformName = "Rotate90";
    rotated.image = Rotate90Transform(1)(flat->withMetadata(geometry));
    storage.consume(rotated);

    auto reloaded = VolumeLoader::load((output + "/Augmentator/caseB/Rotate90/scan.nrrd").toStdString());
    CHECK(reloaded.has_value() && reloaded->shape() == std::vector<ulong>({1, 3, 2}), "Storage: rotated shape");
    CHECK(reloaded.has_value() && reloaded->metadata().spacing.size() == 3, "Storage: rotated spacing written");
    if (reloaded.has_value() && reloaded->metadata().spacing.size() == 3) {
      CHECK_NEAR(reloaded->metadata().spacing[0], 2.0, 1e-9, "Storage: rotated x spacing");
      CHECK_NEAR(reloaded->metadata().spacing[1], 0.5, 1e-9, "Storage: rotated y spacing");
    }
    CHECK(reloaded.has_value() && reloaded->metadata().componentType == "float", "Storage: rotated type from source");
  }
  std::cout << std::endl;
}

static void testSlicePreviewerNodes() {
  std::cout << "  testSlicePreviewerNodes... ";

  QString previewDir = freshTempDir("preview_nodes");
  QFile stale(previewDir + "/stale.png");
  if (stale.open(QIODevice::WriteOnly)) stale.close();

  SlicePreviewer previewer(previewDir.toStdString(), LogLevel::QUIET);
  previewer.beginBatch();
  CHECK(!QFile::exists(previewDir + "/stale.png"), "Preview: previous PNGs cleared");

  CaseUnit unit;
  unit.identity = {"case01", "/virtual/case01/img.nrrd", std::nullopt};
  unit.transformName = "RandFlip";
  unit.image = rampVolume({3, 4, 4});
  unit.mask = Volume({3, 4, 4}, std::vector<float>(48, 0.0f));
  unit.imageNodeName = BatchDriver::imageNodeName("case01", "RandFlip");
  unit.maskNodeName = BatchDriver::maskNodeName("case01", "RandFlip");
  previewer.consume(unit);

  CHECK(previewer.getNodeNames() == std::vector<std::string>({"case01_RandFlip_img", "case01_RandFlip_mask"}),
        "Preview: image and mask nodes registered");
  CHECK(QFile::exists(previewDir + "/case01_RandFlip_img.png"), "Preview: image node written");
  CHECK(QFile::exists(previewDir + "/case01_RandFlip_mask.png"), "Preview: all-zero mask node written");
  CHECK(previewer.nodePath("x") == (previewDir + "/x.png").toStdString(), "Preview: node path");
  std::cout << std::endl;
}

static void testProgressBarRendering() {
  std::cout << "  testProgressBarRendering... ";

  CHECK(ProgressBar::render("Augmenting cases:", 1, 4, 4) == "Augmenting cases: [█░░░] 1/4  25.0%",
        "Progress: quarter");
  CHECK(ProgressBar::render("Augmenting cases:", 4, 4, 4) == "Augmenting cases: [████] 4/4  100.0%",
        "Progress: complete");

  std::ostringstream out;
  ProgressBar bar("Cases:", 1000, 4, &out);
  bar.update(1, 2);
  bar.update(2, 2);
  CHECK(bar.getLastPrinted() == 2, "Progress: last printed is the total");
  CHECK(out.str().find("2/2") != std::string::npos, "Progress: final line printed");

  std::ostringstream silent;
  ProgressBar off("Cases:", 0, 4, &silent);
  off.update(1, 1);
  CHECK(silent.str().empty(), "Progress: zero reports print nothing");
  std::cout << std::endl;
}

//===================================================================================================================//

void runBatchDriverTests() {
  testProcessFanOut();
  testEmptyMaskHandling();
  testPreviewTruncation();
  testBatchAbort();
  testBatchContinue();
  testPreviewFailureIsLogged();
  testVolumeStorageLayout();
  testSlicePreviewerNodes();
  testProgressBarRendering();
}
