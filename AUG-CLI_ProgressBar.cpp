#include "AUG-CLI_ProgressBar.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace AUG_CLI {

//===================================================================================================================//
//-- Constructor --//
//===================================================================================================================//

ProgressBar::ProgressBar(std::string label, ulong progressReports, int barWidth, std::ostream* out)
    : label(std::move(label)), progressReports(progressReports), barWidth(barWidth), out(out) {
  if (this->out == nullptr) this->out = &std::cout;
}

//===================================================================================================================//
//-- Public Interface --//
//===================================================================================================================//

void ProgressBar::update(ulong current, ulong total) {
  if (!this->shouldPrint(current, total)) {
    return;
  }

  this->lastPrinted = current;

  // Pad with spaces to clear any leftover characters from previous longer lines
  *this->out << "\r" << render(this->label, current, total, this->barWidth) << "   " << std::flush;

  // Print newline when complete
  if (current == total) {
    *this->out << std::endl;
  }
}

//===================================================================================================================//
//-- Rendering --//
//===================================================================================================================//

std::string ProgressBar::render(const std::string& label, ulong current, ulong total, int barWidth) {
  float percent = (total > 0) ? static_cast<float>(current) / static_cast<float>(total) : 0.0f;
  percent = std::min(1.0f, std::max(0.0f, percent));
  int filledWidth = static_cast<int>(percent * barWidth);

  std::ostringstream out;
  out << label << " [";

  for (int i = 0; i < barWidth; i++) {
    out << (i < filledWidth ? "█" : "░");
  }

  out << "] " << current << "/" << total
      << "  " << std::fixed << std::setprecision(1) << (percent * 100.0f) << "%";

  return out.str();
}

bool ProgressBar::shouldPrint(ulong current, ulong total) const {
  // Compute reporting interval from progressReports (number of reports desired)
  ulong interval = (this->progressReports > 0) ? std::max(static_cast<ulong>(1), total / this->progressReports) : 0;

  // If progressReports is 0, suppress all output
  if (interval == 0) return false;

  // Throttle: only print at first, last, and every interval items
  return current == 1 || current == total || (current % interval) == 0;
}

}  // namespace AUG_CLI
