#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>

#include "AUG-CLI_LogLevel.hpp"
#include "AUG-CLI_Runner.hpp"

#include <iostream>

using namespace AUG_CLI;

void printUsage() {
  std::cout << "AUG-CLI - Medical image/mask augmentation Command Line Interface\n\n";
  std::cout << "Usage:\n";
  std::cout << "  AUG-CLI --config <file> --mode process [options]  # Augment every case to --output\n";
  std::cout << "  AUG-CLI --config <file> --mode preview [options]  # Preview the first case as PNG slices\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config, -c <file>        Path to JSON configuration file (required)\n";
  std::cout << "  --mode, -m <mode>          Mode: 'process' or 'preview' (overrides config file)\n";
  std::cout << "  --input, -i <dir>          Images input directory (overrides config file)\n";
  std::cout << "  --output, -o <dir>         Output directory (overrides config file)\n";
  std::cout << "  --device, -d <device>      Device: 'CPU' or 'GPU <index>' (overrides config file)\n";
  std::cout << "  --seed, -s <n>             Seed for the randomizable transforms (overrides config file)\n";
  std::cout << "  --log-level, -l <level>    quiet, error, warning, info (default) or debug\n";
  std::cout << "  --help, -h                 Show this help message\n";
}

int main(int argc, char *argv[]) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("AUG-CLI");
  QCoreApplication::setApplicationVersion("1.0");

  QCommandLineParser parser;
  parser.setApplicationDescription("Medical image/mask augmentation CLI");
  parser.addHelpOption();
  parser.addVersionOption();

  // Config file option
  QCommandLineOption configOption(
    QStringList() << "c" << "config",
    "Path to JSON configuration file.",
    "file"
  );
  parser.addOption(configOption);

  // Mode option (process or preview)
  QCommandLineOption modeOption(
    QStringList() << "m" << "mode",
    "Mode: 'process' or 'preview'.",
    "mode"
  );
  parser.addOption(modeOption);

  // Images input directory
  QCommandLineOption inputOption(
    QStringList() << "i" << "input",
    "Images input directory (overrides 'imagesInputPath').",
    "dir"
  );
  parser.addOption(inputOption);

  // Output directory for process mode
  QCommandLineOption outputOption(
    QStringList() << "o" << "output",
    "Output directory (overrides 'outputPath').",
    "dir"
  );
  parser.addOption(outputOption);

  // Device option ("CPU" or "GPU <index>")
  QCommandLineOption deviceOption(
    QStringList() << "d" << "device",
    "Device: 'CPU' or 'GPU <index>' (default: CPU).",
    "device"
  );
  parser.addOption(deviceOption);

  // Seed for reproducible randomizable transforms
  QCommandLineOption seedOption(
    QStringList() << "s" << "seed",
    "Seed for the randomizable transforms.",
    "n"
  );
  parser.addOption(seedOption);

  // Log level
  QCommandLineOption logLevelOption(
    QStringList() << "l" << "log-level",
    "Log level: 'quiet', 'error', 'warning', 'info' or 'debug' (default: info).",
    "level",
    "info"
  );
  parser.addOption(logLevelOption);

  parser.process(app);

  // Validate that --config is provided
  if (!parser.isSet(configOption)) {
    std::cerr << "Error: --config is required.\n\n";
    printUsage();
    return 1;
  }

  if (parser.isSet(modeOption)) {
    QString modeStr = parser.value(modeOption).toLower();
    if (modeStr != "process" && modeStr != "preview") {
      std::cerr << "Error: Mode must be 'process' or 'preview'.\n";
      return 1;
    }
  }

  try {
    LogLevel logLevel = logLevelFromString(parser.value(logLevelOption).toLower().toStdString());

    Runner runner(parser, logLevel);
    return runner.run();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
