#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ncpfm {

struct Network {
    int64_t id = 0;
    std::string network_slot;
};

struct Camera {
    int64_t id = 0;
    std::string unique_id;
};

// One survey session
struct Record {
    int64_t id = 0;
    std::string unique_id;
    std::string network_uuid;
    std::string network_slug;
    std::string name;
    std::string type;
    std::optional<int> srid;
    std::string slot;
};

struct CalibrationVideo {
    int64_t id = 0;
    Camera camera;
    std::string title;
    std::string blob_name;
    std::string url;
    std::string type;
};

}  // namespace ncpfm
