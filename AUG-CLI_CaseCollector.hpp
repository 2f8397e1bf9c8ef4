#ifndef AUG_CLI_CASECOLLECTOR_HPP
#define AUG_CLI_CASECOLLECTOR_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

//===================================================================================================================//

namespace AUG_CLI {

// How cases are laid out under the input directory.
enum class FilesStructure {
  CASE_FOLDERS,  // <input>/<case>/<prefix>
  FLAT,          // <input>/<case>_<prefix>
  UNKNOWN
};

const std::unordered_map<std::string, FilesStructure> filesStructureMap = {
  {"case-folders", FilesStructure::CASE_FOLDERS},
  {"flat", FilesStructure::FLAT},
};

FilesStructure filesStructureFromString(const std::string& name);
std::string filesStructureToString(FilesStructure structure);

// File prefix split into its stem and extension: "img.nrrd" -> {"img", "nrrd"}, "img" -> {"img", "nrrd"}.
struct PrefixParts {
  std::string stem;
  std::string extension;

  std::string fileName() const { return this->stem + "." + this->extension; }
};

// Canonical output identity of a case plus its untransformed source files.
struct CaseIdentity {
  std::string caseName;
  std::string imagePath;
  std::optional<std::string> maskPath;
};

class CaseCollector {
  public:
    // Recursively collect image and mask files under inputDir. Both lists are sorted by path.
    // An empty maskPrefix yields an empty mask list.
    static std::pair<std::vector<std::string>, std::vector<std::string>> collectImagesAndMasks(
      const std::string& inputDir, const std::string& imgPrefix, const std::string& maskPrefix);

    // Files under inputDir matching prefix, either named exactly <prefix> or <case>_<prefix>.
    static std::vector<std::string> collectFiles(const std::string& inputDir, const std::string& prefix);

    static CaseIdentity resolveCase(const std::string& imgPath, const std::optional<std::string>& maskPath,
                                    FilesStructure structure, const std::string& imgPrefix);

    static PrefixParts splitPrefix(const std::string& prefix);
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_CASECOLLECTOR_HPP
