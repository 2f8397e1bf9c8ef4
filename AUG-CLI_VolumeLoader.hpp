#ifndef AUG_CLI_VOLUMELOADER_HPP
#define AUG_CLI_VOLUMELOADER_HPP

#include "AUG-CLI_Volume.hpp"

#include <optional>
#include <string>

//===================================================================================================================//

namespace AUG_CLI {

/**
 * VolumeLoader: reads image/mask files into Volumes and writes Volumes back to disk.
 *
 * Volume formats (NRRD, NIfTI, MetaImage, ...) are read and written through ITK's ImageIO
 * factory, 1 to 4 dimensions, scalar pixels only. JPEG, PNG, BMP, TGA, GIF, PSD, HDR and PIC
 * are decoded with stb_image as single-slice volumes; PNG/JPEG/BMP outputs receive the middle slice.
 *
 * ITK image sizes are indexed fastest axis first; volume shapes are slowest axis first, so the
 * axis order is reversed on load and on save.
 */
class VolumeLoader {
public:
  // Load a volume. Returns std::nullopt for an empty path or any decode failure.
  static std::optional<Volume> load(const std::string& path);

  // Load a volume, throwing std::runtime_error on failure.
  static Volume readVolume(const std::string& path);

  // Read only the spatial metadata and sample type of a file (header only).
  static VolumeMetadata readMetadata(const std::string& path);

  // Save a volume through ITK (samples cast to metadata.componentType, compressed when the format
  // supports it), or its middle slice when the extension names a raster image.
  // Throws std::runtime_error when the file cannot be written.
  static void saveVolume(const Volume& volume, const std::string& path,
                         const VolumeMetadata& metadata, bool compress = true);

  // Save the middle slice (along the slowest axis) as an 8-bit image, min-max normalised.
  // Format determined by extension: .png, .jpg/.jpeg, .bmp (default: PNG).
  static void saveSlice(const Volume& volume, const std::string& path);

  // Resolve path relative to baseDirPath (directory).
  // Returns path unchanged if it is already absolute.
  static std::string resolvePath(const std::string& path, const std::string& baseDirPath);

private:
  static Volume readItk(const std::string& path);
  static Volume readRaster(const std::string& path);
  static void writeItk(const Volume& volume, const std::string& path,
                       const VolumeMetadata& metadata, bool compress);
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_VOLUMELOADER_HPP
