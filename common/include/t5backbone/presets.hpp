#ifndef T5BACKBONE_PRESETS_HPP
#define T5BACKBONE_PRESETS_HPP

#include "t5backbone/config.hpp"
#include <map>
#include <string>
#include <vector>

namespace t5backbone {

struct PresetMetadata {
    std::string description;
    std::string official_name;
    std::string path;
    std::string model_card;
};

// A named architecture plus the files that hold its pretrained state.
struct Preset {
    BackboneConfig config;
    PresetMetadata metadata;
    std::string weights_file;
    std::string vocabulary_file;
};

using PresetMap = std::map<std::string, Preset>;

// Fresh copy of the registry on every call; callers may mutate it freely.
PresetMap backbone_presets();

// Copy of one entry. Throws PresetNotFoundError for an unknown name.
Preset get_preset(const std::string& name);

std::vector<std::string> preset_names();

}

#endif
