#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ncpfm {

enum class ImageType {
    Cubemap,
    Equirect,
    Standard
};

// "cubemap", "equirect", "photo"
const char* image_type_value(ImageType type);
std::optional<ImageType> parse_image_type(std::string_view value);

namespace naming {
constexpr const char* PREFIX_SPLITTER = "_f_";
constexpr const char* ANONYMIZED_SUFFIX = "_anonymized";
constexpr const char* IMAGE_EXTENSION = "jpg";
}  // namespace naming

struct ImageNameStructure {
    std::string prefix;
    ImageType type = ImageType::Standard;
    bool anonymized = false;
    int64_t frame_index = 0;

    bool operator==(const ImageNameStructure& other) const = default;
};

// {prefix}_f_{frame_index}_{type}[_anonymized].jpg, or without "{prefix}_f_"
// when prefix is empty. Throws std::invalid_argument for a negative index.
std::string name_image(int64_t frame_index, ImageType type, bool anonymized,
                       const std::string& prefix = "");

// Inverse of name_image. The name is split on the last "_f_", so any
// directory part ends up in the prefix. Throws std::invalid_argument.
ImageNameStructure parse_image_name(const std::string& image_name);

// Frame index of a name or blob path. Directories are ignored.
int64_t frame_index_from_image_name(const std::string& image_name);

// Rebuild a name with a new type/anonymization. An existing prefix wins over
// the one passed in.
std::string rename_image(const std::string& image_name, ImageType type, bool anonymized,
                         const std::string& prefix = "");

std::string set_image_name_as_type(const std::string& image_name, ImageType type);

std::string set_image_name_as_anonymized(const std::string& image_name);

// .png, .jpg, .jpeg (case-insensitive)
bool has_allowed_image_extension(const std::string& path);

}  // namespace ncpfm
