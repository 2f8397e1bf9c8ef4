#ifndef AUG_CLI_SLICEPREVIEWER_HPP
#define AUG_CLI_SLICEPREVIEWER_HPP

#include "AUG-CLI_BatchDriver.hpp"
#include "AUG-CLI_LogLevel.hpp"

#include <string>
#include <vector>

//===================================================================================================================//

namespace AUG_CLI {

// Display sink for preview mode: every node becomes <previewPath>/<nodeName>.png (middle slice).
class SlicePreviewer : public CaseSink {
  public:
    explicit SlicePreviewer(std::string previewPath, LogLevel logLevel = LogLevel::INFO);

    // Removes the PNGs of the previous preview and forgets its nodes.
    void beginBatch() override;

    void consume(const CaseUnit& unit) override;

    // Registered node names, in display order
    const std::vector<std::string>& getNodeNames() const { return this->nodeNames; }

    std::string nodePath(const std::string& nodeName) const;

  private:
    void showNode(const std::string& nodeName, const Volume& volume);

    std::string previewPath;
    LogLevel logLevel;
    std::vector<std::string> nodeNames;
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_SLICEPREVIEWER_HPP
