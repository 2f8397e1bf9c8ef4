#ifndef AUG_CLI_RUNNER_HPP
#define AUG_CLI_RUNNER_HPP

#include "AUG-CLI_AugmentConfig.hpp"
#include "AUG-CLI_BatchDriver.hpp"
#include "AUG-CLI_Device.hpp"
#include "AUG-CLI_LogLevel.hpp"

#include <QCommandLineParser>

#include <string>

//===================================================================================================================//

namespace AUG_CLI {

/**
 * Runner loads and validates the configuration, collects the cases and executes the
 * requested mode (process or preview) through the BatchDriver.
 */
class Runner {
  public:
    //-- Constructor --//
    Runner(const QCommandLineParser& parser, LogLevel logLevel);

    //-- Entry point --//
    int run();

    const AugmentConfig& getConfig() const { return this->config; }

  private:
    //-- Mode methods --//
    int runProcess(const BatchInput& input);
    int runPreview(const BatchInput& input);

    BatchInput buildBatchInput();
    BatchSummary runBatch(CaseSink& sink, const BatchInput& input);

    static ConfigOverrides overridesFromParser(const QCommandLineParser& parser);

    //-- Configuration --//
    const QCommandLineParser& parser;
    LogLevel logLevel;
    AugmentConfig config;
    Device device;
};

} // namespace AUG_CLI

#endif // AUG_CLI_RUNNER_HPP
