#ifndef AUG_CLI_PROGRESSBAR_HPP
#define AUG_CLI_PROGRESSBAR_HPP

#include <ostream>
#include <string>

#include <sys/types.h>

namespace AUG_CLI {

// Terminal progress bar for case iteration.
// Prints: "Augmenting cases: [████████░░░░░░░░] 12/50  24.0%"
class ProgressBar {
  public:
    ProgressBar(std::string label = "Augmenting cases:", ulong progressReports = 1000, int barWidth = 40,
                std::ostream* out = nullptr);

    // Update and display progress (call from the batch progress callback).
    // progressReports controls frequency: how many updates to show. Always prints first and last item.
    void update(ulong current, ulong total);

    ulong getLastPrinted() const { return this->lastPrinted; }

    // One rendered line, without the leading carriage return
    static std::string render(const std::string& label, ulong current, ulong total, int barWidth = 40);

  private:
    //-- Configuration --//
    std::string label;
    ulong progressReports;
    int barWidth;
    std::ostream* out;

    ulong lastPrinted = 0;

    bool shouldPrint(ulong current, ulong total) const;
};

}  // namespace AUG_CLI

#endif  // AUG_CLI_PROGRESSBAR_HPP
