#ifndef AUG_CLI_BATCHDRIVER_HPP
#define AUG_CLI_BATCHDRIVER_HPP

#include "AUG-CLI_BatchMode.hpp"
#include "AUG-CLI_CaseCollector.hpp"
#include "AUG-CLI_Dataset.hpp"
#include "AUG-CLI_Device.hpp"
#include "AUG-CLI_LogLevel.hpp"
#include "AUG-CLI_Transform.hpp"
#include "AUG-CLI_Volume.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

//===================================================================================================================//

namespace AUG_CLI {

// What happens when a case throws.
enum class CaseErrorPolicy {
  PROPAGATE,         // Rethrow and stop the batch (later cases are not attempted)
  LOG_AND_CONTINUE   // Log to stderr and go on with the next case
};

// One per-case, per-transform output unit handed to a sink.
struct CaseUnit {
  CaseIdentity identity;
  std::string transformName;
  Volume image;
  std::optional<Volume> mask;
  std::string imageNodeName;  // {case}_{transform}_img
  std::string maskNodeName;   // {case}_{transform}_mask
};

// Consumer of the driver's output: storage (process) or display (preview).
class CaseSink {
  public:
    virtual ~CaseSink() = default;

    // Called once before the first case.
    virtual void beginBatch() {}

    virtual void consume(const CaseUnit& unit) = 0;
};

// Everything the dataset needs, plus what is required to name the cases.
struct BatchInput {
  std::vector<std::string> imgPaths;
  std::vector<std::string> maskPaths;  // Empty, or paired with imgPaths by index
  Transformations transformations;
  Device device = Device::cpu();
  FilesStructure filesStructure = FilesStructure::CASE_FOLDERS;
  std::string imgPrefix;
};

struct BatchSummary {
  ulong attempted = 0;
  ulong succeeded = 0;
  ulong failed = 0;
  double elapsedSeconds = 0.0;
  std::string message;  // "Processing completed in X.XX seconds"
};

using ProgressCallback = std::function<void(ulong current, ulong total)>;
using CompletionCallback = std::function<void(const std::string& message)>;

/**
 * Drives the augmentation dataset over a batch of cases and fans every transform result out to a sink.
 *
 * PROCESS runs every case; mask results that are all zero are not handed to the sink.
 * PREVIEW runs the first case only and hands every result over, masks included.
 * Progress is reported once per case (1-based) against the number of cases in the dataset.
 */
class BatchDriver {
  public:
    BatchDriver(BatchMode mode, CaseSink& sink, LogLevel logLevel = LogLevel::INFO);

    //-- Configuration --//
    void setErrorPolicy(CaseErrorPolicy errorPolicy) { this->errorPolicy = errorPolicy; }
    CaseErrorPolicy getErrorPolicy() const { return this->errorPolicy; }

    void setProgressCallback(ProgressCallback callback) { this->progressCallback = std::move(callback); }
    void setCompletionCallback(CompletionCallback callback) { this->completionCallback = std::move(callback); }

    // Replace the volume reader used by the dataset (defaults to VolumeLoader::load).
    void setVolumeSource(VolumeSource volumeSource) { this->volumeSource = std::move(volumeSource); }

    BatchMode getMode() const { return this->mode; }

    //-- Entry point --//
    BatchSummary run(const BatchInput& input);

    static std::string imageNodeName(const std::string& caseName, const std::string& transformName);
    static std::string maskNodeName(const std::string& caseName, const std::string& transformName);

    static std::string completionMessage(double elapsedSeconds);

  private:
    void runCase(const AugmentationDataset& dataset, const BatchInput& input, ulong idx);

    BatchMode mode;
    CaseSink& sink;
    LogLevel logLevel;
    CaseErrorPolicy errorPolicy;

    ProgressCallback progressCallback;
    CompletionCallback completionCallback;
    VolumeSource volumeSource;
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_BATCHDRIVER_HPP
