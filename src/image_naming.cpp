#include "ncpfm/image_naming.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace ncpfm {

namespace {

constexpr std::array<const char*, 3> ALLOWED_IMAGE_EXTENSIONS = {".png", ".jpg", ".jpeg"};

// Position of the extension dot in the last path component, or npos
size_t extension_pos(const std::string& name) {
    size_t dot = name.rfind('.');
    size_t slash = name.rfind('/');
    if (dot == std::string::npos) return std::string::npos;
    if (slash != std::string::npos && dot < slash) return std::string::npos;
    return dot;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

struct SplitName {
    std::string prefix;
    std::string rest;       // "<index>_<type>[_anonymized]" without extension
    bool has_prefix = false;
};

SplitName split_name(const std::string& image_name) {
    SplitName out;
    std::string rest = image_name;
    size_t sep = image_name.rfind(naming::PREFIX_SPLITTER);
    if (sep != std::string::npos) {
        out.prefix = image_name.substr(0, sep);
        rest = image_name.substr(sep + std::char_traits<char>::length(naming::PREFIX_SPLITTER));
        out.has_prefix = true;
    }
    size_t dot = extension_pos(rest);
    if (dot != std::string::npos) rest.erase(dot);
    out.rest = rest;
    return out;
}

int64_t parse_frame_index(const std::string& token, const std::string& image_name) {
    if (token.empty() || token.size() > 18 ||
        !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Invalid image name format: " + image_name);
    }
    return std::stoll(token);
}

}  // anonymous namespace

const char* image_type_value(ImageType type) {
    switch (type) {
        case ImageType::Cubemap: return "cubemap";
        case ImageType::Equirect: return "equirect";
        case ImageType::Standard: return "photo";
    }
    return "photo";
}

std::optional<ImageType> parse_image_type(std::string_view value) {
    if (value == "cubemap") return ImageType::Cubemap;
    if (value == "equirect") return ImageType::Equirect;
    if (value == "photo") return ImageType::Standard;
    return std::nullopt;
}

std::string name_image(int64_t frame_index, ImageType type, bool anonymized,
                       const std::string& prefix) {
    if (frame_index < 0) {
        throw std::invalid_argument("frame index must be >= 0, got " + std::to_string(frame_index));
    }
    std::string name = std::to_string(frame_index) + "_" + image_type_value(type);
    if (!prefix.empty()) {
        name = prefix + naming::PREFIX_SPLITTER + name;
    }
    if (anonymized) {
        name += naming::ANONYMIZED_SUFFIX;
    }
    name += ".";
    name += naming::IMAGE_EXTENSION;
    return name;
}

ImageNameStructure parse_image_name(const std::string& image_name) {
    SplitName parts = split_name(image_name);
    auto tokens = split(parts.rest, '_');
    if (tokens.size() < 2 || tokens.size() > 3) {
        throw std::invalid_argument("Invalid image name format: " + image_name);
    }

    ImageNameStructure result;
    result.prefix = parts.prefix;
    result.frame_index = parse_frame_index(tokens[0], image_name);

    auto type = parse_image_type(tokens[1]);
    if (!type) {
        throw std::invalid_argument("Unknown image type '" + tokens[1] + "' in " + image_name);
    }
    result.type = *type;

    if (tokens.size() == 3) {
        if ("_" + tokens[2] != naming::ANONYMIZED_SUFFIX) {
            throw std::invalid_argument("Invalid image name format: " + image_name);
        }
        result.anonymized = true;
    }
    return result;
}

int64_t frame_index_from_image_name(const std::string& image_name) {
    size_t slash = image_name.find_last_of('/');
    SplitName parts = split_name(slash == std::string::npos ? image_name : image_name.substr(slash + 1));
    return parse_frame_index(split(parts.rest, '_')[0], image_name);
}

std::string rename_image(const std::string& image_name, ImageType type, bool anonymized,
                         const std::string& prefix) {
    SplitName parts = split_name(image_name);
    int64_t frame_index = parse_frame_index(split(parts.rest, '_')[0], image_name);
    return name_image(frame_index, type, anonymized, parts.has_prefix ? parts.prefix : prefix);
}

std::string set_image_name_as_type(const std::string& image_name, ImageType type) {
    bool anonymized = image_name.find(naming::ANONYMIZED_SUFFIX) != std::string::npos;
    return rename_image(image_name, type, anonymized);
}

std::string set_image_name_as_anonymized(const std::string& image_name) {
    if (image_name.find(naming::ANONYMIZED_SUFFIX) != std::string::npos) {
        return image_name;
    }
    size_t dot = extension_pos(image_name);
    if (dot == std::string::npos) {
        return image_name + naming::ANONYMIZED_SUFFIX;
    }
    return image_name.substr(0, dot) + naming::ANONYMIZED_SUFFIX + image_name.substr(dot);
}

bool has_allowed_image_extension(const std::string& path) {
    size_t dot = extension_pos(path);
    if (dot == std::string::npos) return false;
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return std::find(ALLOWED_IMAGE_EXTENSIONS.begin(), ALLOWED_IMAGE_EXTENSIONS.end(), ext) !=
           ALLOWED_IMAGE_EXTENSIONS.end();
}

}  // namespace ncpfm
