#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

#include "google/protobuf/text_format.h"

namespace rps::proto {

// Reads a binary or text proto from disk. Returns nullopt if the file is missing or neither
// format parses.
template <typename MsgType>
std::optional<MsgType> load_from_file(const std::filesystem::path &path) {
    std::cout << "Trying to read from: " << path << std::endl;
    if (!std::filesystem::exists(path)) {
        std::cout << "Does not exist!" << std::endl;
        return std::nullopt;
    }

    std::ifstream file_in(path, std::ios::binary | std::ios::in);
    std::stringstream sstream;
    sstream << file_in.rdbuf();

    MsgType out;

    if (out.ParseFromString(sstream.str())) {
        std::cout << "Found binary proto" << std::endl;
        return out;
    }

    if (google::protobuf::TextFormat::ParseFromString(sstream.str(), &out)) {
        std::cout << "Found text proto" << std::endl;
        return out;
    }

    std::cout << "couldn't parse as binary or text proto" << std::endl;
    return std::nullopt;
}

template <typename MsgType>
bool write_to_file(const MsgType &msg, const std::filesystem::path &path) {
    std::ofstream file_out(path, std::ios_base::binary | std::ios_base::trunc);
    if (!file_out || !msg.SerializeToOstream(&file_out)) {
        std::cout << "Failed to write to: " << path << std::endl;
        return false;
    }
    return true;
}

}  // namespace rps::proto
