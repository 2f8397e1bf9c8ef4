#include "AUG-CLI_VolumeLoader.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <QDir>
#include <QFileInfo>

#include <itkImage.h>
#include <itkImageFileReader.h>
#include <itkImageFileWriter.h>
#include <itkImageIOBase.h>
#include <itkImageIOFactory.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <type_traits>

namespace AUG_CLI {

//===================================================================================================================//
//-- ITK helpers --//
//===================================================================================================================//

// ITK component names mapped to the sample type names used in VolumeMetadata.
static const std::map<std::string, std::string> componentTypeNames = {
  {"char", "int8"},           {"unsigned_char", "uint8"},
  {"short", "int16"},         {"unsigned_short", "uint16"},
  {"int", "int32"},           {"unsigned_int", "uint32"},
  {"long", "int64"},          {"unsigned_long", "uint64"},
  {"long_long", "int64"},     {"unsigned_long_long", "uint64"},
  {"float", "float"},         {"double", "double"}
};

// Extensions decoded by stb_image as single-slice volumes; everything else goes through ITK.
static const std::set<std::string> rasterExtensions = {
  "png", "jpg", "jpeg", "bmp", "tga", "gif", "psd", "hdr", "pic"
};

static constexpr unsigned int maxDimension = 4;

static std::string extensionOf(const std::string& path) {
  return QFileInfo(QString::fromStdString(path)).suffix().toLower().toStdString();
}

static bool isRaster(const std::string& path) {
  return rasterExtensions.count(extensionOf(path)) > 0;
}

//===================================================================================================================//

// Creates the ImageIO able to read path and reads its header.
static itk::ImageIOBase::Pointer openImageIO(const std::string& path) {
  itk::ImageIOBase::Pointer imageIO =
    itk::ImageIOFactory::CreateImageIO(path.c_str(), itk::IOFileModeEnum::ReadMode);

  if (!imageIO) {
    throw std::runtime_error("Unsupported volume format: " + path);
  }

  imageIO->SetFileName(path);
  imageIO->ReadImageInformation();

  if (imageIO->GetNumberOfComponents() != 1) {
    throw std::runtime_error("Only scalar volumes are supported, found " +
                             std::to_string(imageIO->GetNumberOfComponents()) + " components: " + path);
  }

  unsigned int dimension = imageIO->GetNumberOfDimensions();

  if (dimension < 1 || dimension > maxDimension) {
    throw std::runtime_error("Unsupported volume dimension " + std::to_string(dimension) + ": " + path);
  }

  // Reject degenerate or overflowing extents before the reader allocates the buffer
  std::vector<ulong> shape;
  for (unsigned int i = dimension; i-- > 0;) {
    ulong extent = static_cast<ulong>(imageIO->GetDimensions(i));
    if (extent == 0) {
      throw std::runtime_error("Volume has an empty axis: " + path);
    }
    shape.push_back(extent);
  }

  ulong bytes = 0;
  if (__builtin_mul_overflow(sampleCount(shape), static_cast<ulong>(sizeof(float)), &bytes)) {
    throw std::runtime_error("Volume is too large: " + path);
  }

  return imageIO;
}

static VolumeMetadata metadataFrom(const itk::ImageIOBase::Pointer& imageIO, const std::string& path) {
  std::string itkType = itk::ImageIOBase::GetComponentTypeAsString(imageIO->GetComponentType());
  auto it = componentTypeNames.find(itkType);

  if (it == componentTypeNames.end()) {
    throw std::runtime_error("Unsupported component type '" + itkType + "': " + path);
  }

  unsigned int dimension = imageIO->GetNumberOfDimensions();

  VolumeMetadata metadata;
  metadata.componentType = it->second;

  // ITK physical space is LPS
  if (dimension == 3) metadata.space = "left-posterior-superior";

  for (unsigned int i = 0; i < dimension; ++i) {
    metadata.spacing.push_back(imageIO->GetSpacing(i));
    metadata.origin.push_back(imageIO->GetOrigin(i));
    metadata.directions.push_back(imageIO->GetDirection(i));
  }

  return metadata;
}

//===================================================================================================================//

template <unsigned int Dimension>
static Volume readImage(const std::string& path, VolumeMetadata metadata) {
  using ImageType = itk::Image<float, Dimension>;
  using ReaderType = itk::ImageFileReader<ImageType>;

  typename ReaderType::Pointer reader = ReaderType::New();
  reader->SetFileName(path);
  reader->Update();

  typename ImageType::Pointer image = reader->GetOutput();
  typename ImageType::SizeType size = image->GetLargestPossibleRegion().GetSize();

  std::vector<ulong> shape(Dimension);
  for (unsigned int i = 0; i < Dimension; ++i) {
    shape[Dimension - 1 - i] = static_cast<ulong>(size[i]);
  }

  // Geometry of the decoded image, which ITK may have normalised from the header
  for (unsigned int i = 0; i < Dimension; ++i) {
    metadata.spacing[i] = image->GetSpacing()[i];
    metadata.origin[i] = image->GetOrigin()[i];
    metadata.directions[i].resize(Dimension);

    for (unsigned int j = 0; j < Dimension; ++j) {
      metadata.directions[i][j] = image->GetDirection()[j][i];
    }
  }

  const float* buffer = image->GetBufferPointer();
  std::vector<float> samples(buffer, buffer + sampleCount(shape));

  return Volume(std::move(shape), std::move(samples), Device::cpu(), std::move(metadata));
}

//===================================================================================================================//

template <typename TPixel>
static TPixel castSample(float value) {
  if constexpr (std::is_integral_v<TPixel>) {
    if (std::isnan(value)) return TPixel(0);

    double lo = static_cast<double>(std::numeric_limits<TPixel>::lowest());
    double hi = static_cast<double>(std::numeric_limits<TPixel>::max());
    double clamped = std::clamp(std::round(static_cast<double>(value)), lo, hi);

    // hi rounds up for 64-bit types
    if (clamped >= hi) return std::numeric_limits<TPixel>::max();
    return static_cast<TPixel>(clamped);
  } else {
    return static_cast<TPixel>(value);
  }
}

template <typename TPixel, unsigned int Dimension>
static void writeImage(const Volume& volume, const std::string& path, const VolumeMetadata& metadata,
                       bool compress) {
  using ImageType = itk::Image<TPixel, Dimension>;

  typename ImageType::SizeType size;
  typename ImageType::SpacingType spacing;
  typename ImageType::PointType origin;
  typename ImageType::DirectionType direction;

  spacing.Fill(1.0);
  origin.Fill(0.0);
  direction.SetIdentity();

  for (unsigned int i = 0; i < Dimension; ++i) {
    size[i] = volume.shape()[Dimension - 1 - i];
  }

  bool positiveSpacing = std::all_of(metadata.spacing.begin(), metadata.spacing.end(),
                                     [](double s) { return s > 0.0; });

  if (metadata.spacing.size() == Dimension && positiveSpacing) {
    for (unsigned int i = 0; i < Dimension; ++i) spacing[i] = metadata.spacing[i];
  }

  if (metadata.origin.size() == Dimension) {
    for (unsigned int i = 0; i < Dimension; ++i) origin[i] = metadata.origin[i];
  }

  bool fullDirections = metadata.directions.size() == Dimension &&
                        std::all_of(metadata.directions.begin(), metadata.directions.end(),
                                    [](const std::vector<double>& d) { return d.size() == Dimension; });

  if (fullDirections) {
    for (unsigned int i = 0; i < Dimension; ++i) {
      for (unsigned int j = 0; j < Dimension; ++j) direction[j][i] = metadata.directions[i][j];
    }
  }

  typename ImageType::RegionType region;
  region.SetSize(size);

  typename ImageType::Pointer image = ImageType::New();
  image->SetRegions(region);
  image->SetSpacing(spacing);
  image->SetOrigin(origin);
  image->SetDirection(direction);
  image->Allocate();

  TPixel* buffer = image->GetBufferPointer();
  const std::vector<float>& data = volume.data();

  for (size_t i = 0; i < data.size(); ++i) {
    buffer[i] = castSample<TPixel>(data[i]);
  }

  using WriterType = itk::ImageFileWriter<ImageType>;
  typename WriterType::Pointer writer = WriterType::New();
  writer->SetFileName(path);
  writer->SetInput(image);
  writer->SetUseCompression(compress);
  writer->Update();
}

template <typename TPixel>
static void writeTyped(const Volume& volume, const std::string& path, const VolumeMetadata& metadata,
                       bool compress) {
  switch (volume.ndim()) {
    case 1: writeImage<TPixel, 1>(volume, path, metadata, compress); break;
    case 2: writeImage<TPixel, 2>(volume, path, metadata, compress); break;
    case 3: writeImage<TPixel, 3>(volume, path, metadata, compress); break;
    case 4: writeImage<TPixel, 4>(volume, path, metadata, compress); break;
    default:
      throw std::runtime_error("Cannot write a " + std::to_string(volume.ndim()) + "D volume: " + path);
  }
}

//===================================================================================================================//
//-- Loading --//
//===================================================================================================================//

std::optional<Volume> VolumeLoader::load(const std::string& path) {
  if (path.empty()) {
    return std::nullopt;
  }

  try {
    return readVolume(path);
  } catch (const std::exception&) {
    // Unreadable input is a normal state for the pipeline, not an error
    return std::nullopt;
  }
}

//===================================================================================================================//

Volume VolumeLoader::readVolume(const std::string& path) {
  if (path.empty()) {
    throw std::runtime_error("Empty volume path");
  }

  if (!QFileInfo::exists(QString::fromStdString(path))) {
    throw std::runtime_error("Volume file does not exist: " + path);
  }

  if (isRaster(path)) {
    return readRaster(path);
  }

  return readItk(path);
}

//===================================================================================================================//

VolumeMetadata VolumeLoader::readMetadata(const std::string& path) {
  if (isRaster(path)) {
    VolumeMetadata metadata;
    metadata.componentType = "uint8";
    return metadata;
  }

  try {
    return metadataFrom(openImageIO(path), path);
  } catch (const itk::ExceptionObject& e) {
    throw std::runtime_error("Failed to read volume header: " + path + " (" + e.GetDescription() + ")");
  }
}

//===================================================================================================================//

Volume VolumeLoader::readItk(const std::string& path) {
  try {
    itk::ImageIOBase::Pointer imageIO = openImageIO(path);
    VolumeMetadata metadata = metadataFrom(imageIO, path);

    switch (imageIO->GetNumberOfDimensions()) {
      case 1: return readImage<1>(path, std::move(metadata));
      case 2: return readImage<2>(path, std::move(metadata));
      case 3: return readImage<3>(path, std::move(metadata));
      default: return readImage<4>(path, std::move(metadata));
    }
  } catch (const itk::ExceptionObject& e) {
    throw std::runtime_error("Failed to read volume: " + path + " (" + e.GetDescription() + ")");
  }
}

//===================================================================================================================//

Volume VolumeLoader::readRaster(const std::string& path) {
  int width = 0, height = 0, channels = 0;

  // Medical rasters are treated as single-channel intensity images
  unsigned char* pixels = stbi_load(path.c_str(), &width, &height, &channels, 1);

  if (!pixels) {
    throw std::runtime_error("Failed to load image: " + path + " (" + stbi_failure_reason() + ")");
  }

  std::vector<float> samples(static_cast<size_t>(width) * height);

  for (size_t i = 0; i < samples.size(); ++i) {
    samples[i] = static_cast<float>(pixels[i]);
  }

  stbi_image_free(pixels);

  VolumeMetadata metadata;
  metadata.componentType = "uint8";

  return Volume({1, static_cast<ulong>(height), static_cast<ulong>(width)}, std::move(samples), Device::cpu(),
                std::move(metadata));
}

//===================================================================================================================//
//-- Saving --//
//===================================================================================================================//

void VolumeLoader::saveVolume(const Volume& volume, const std::string& path,
                              const VolumeMetadata& metadata, bool compress) {
  if (isRaster(path)) {
    saveSlice(volume, path);
    return;
  }

  writeItk(volume, path, metadata, compress);
}

//===================================================================================================================//

void VolumeLoader::writeItk(const Volume& volume, const std::string& path,
                            const VolumeMetadata& metadata, bool compress) {
  const std::string& type = metadata.componentType;

  try {
    if (type == "int8") writeTyped<int8_t>(volume, path, metadata, compress);
    else if (type == "uint8") writeTyped<uint8_t>(volume, path, metadata, compress);
    else if (type == "int16") writeTyped<int16_t>(volume, path, metadata, compress);
    else if (type == "uint16") writeTyped<uint16_t>(volume, path, metadata, compress);
    else if (type == "int32") writeTyped<int32_t>(volume, path, metadata, compress);
    else if (type == "uint32") writeTyped<uint32_t>(volume, path, metadata, compress);
    else if (type == "int64") writeTyped<int64_t>(volume, path, metadata, compress);
    else if (type == "uint64") writeTyped<uint64_t>(volume, path, metadata, compress);
    else if (type == "float") writeTyped<float>(volume, path, metadata, compress);
    else if (type == "double") writeTyped<double>(volume, path, metadata, compress);
    else throw std::runtime_error("Unsupported component type '" + type + "': " + path);
  } catch (const itk::ExceptionObject& e) {
    throw std::runtime_error("Failed to write volume: " + path + " (" + e.GetDescription() + ")");
  }
}

//===================================================================================================================//

void VolumeLoader::saveSlice(const Volume& volume, const std::string& path) {
  if (volume.empty()) {
    throw std::runtime_error("Cannot save an empty volume: " + path);
  }

  const auto& shape = volume.shape();
  ulong w = shape.back();
  ulong h = (shape.size() >= 2) ? shape[shape.size() - 2] : 1;
  ulong planes = volume.size() / (w * h);
  ulong plane = planes / 2;

  const float* slice = volume.data().data() + plane * h * w;
  float lo = *std::min_element(slice, slice + h * w);
  float hi = *std::max_element(slice, slice + h * w);
  float range = hi - lo;

  std::vector<unsigned char> pixels(h * w);

  for (ulong i = 0; i < h * w; ++i) {
    float normalised = (range > 0.0f) ? (slice[i] - lo) / range : 0.0f;
    pixels[i] = static_cast<unsigned char>(normalised * 255.0f + 0.5f);
  }

  std::string ext = extensionOf(path);
  int iw = static_cast<int>(w);
  int ih = static_cast<int>(h);
  int result = 0;

  if (ext == "jpg" || ext == "jpeg") {
    result = stbi_write_jpg(path.c_str(), iw, ih, 1, pixels.data(), 90);
  } else if (ext == "bmp") {
    result = stbi_write_bmp(path.c_str(), iw, ih, 1, pixels.data());
  } else {
    // Default to PNG
    result = stbi_write_png(path.c_str(), iw, ih, 1, pixels.data(), iw);
  }

  if (!result) {
    throw std::runtime_error("Failed to save image: " + path);
  }
}

//===================================================================================================================//

std::string VolumeLoader::resolvePath(const std::string& path, const std::string& baseDirPath) {
  QFileInfo fileInfo(QString::fromStdString(path));
  if (fileInfo.isAbsolute()) {
    return path;
  }
  QDir baseDir(QString::fromStdString(baseDirPath));
  return baseDir.filePath(QString::fromStdString(path)).toStdString();
}

//===================================================================================================================//

} // namespace AUG_CLI
