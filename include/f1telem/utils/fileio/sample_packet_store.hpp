// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>

#include "../../packet/packet_variant.hpp"
#include "../../registry.hpp"

namespace f1telem::utils::fileio {

/**
 * @brief Directory of captured sample packets, one file per variant
 *
 * Each sample is stored as the packet's exact wire bytes in
 * `<directory>/<name>.bin`, where name is the packet variant name
 * ("motion", "car_telemetry", ...). Saving a variant again overwrites
 * the previous sample.
 *
 * Error Handling:
 * - File system failures throw std::runtime_error (errno in the message)
 * - Decode failures on load propagate as DecodeError
 */
class SamplePacketStore {
public:
    static constexpr const char* extension = ".bin";

    /**
     * @brief Open a store rooted at directory
     *
     * The directory is created on the first save if it does not exist.
     */
    explicit SamplePacketStore(std::filesystem::path directory)
        : directory_(std::move(directory)) {}

    const std::filesystem::path& directory() const noexcept { return directory_; }

    std::filesystem::path path_for(const std::string& name) const {
        return directory_ / (name + extension);
    }

    /**
     * @brief Encode a packet and store it under its variant name
     * @return Path of the written file
     */
    std::filesystem::path save(const Packet& pkt) const {
        auto bytes = encode_packet(pkt);
        return save_raw(packet_name(pkt), bytes);
    }

    /**
     * @brief Store the datagram a packet was decoded from under its variant name
     *
     * Keeps the captured bytes as received, including any event detail
     * bytes that a re-encode would zero.
     *
     * @throws std::invalid_argument if datagram does not have pkt's wire size
     */
    std::filesystem::path save(const Packet& pkt, std::span<const uint8_t> datagram) const {
        size_t expected = std::visit(
            [](const auto& p) { return wire_size<std::decay_t<decltype(p)>>(); }, pkt);
        if (datagram.size() != expected) {
            throw std::invalid_argument("Datagram of " + std::to_string(datagram.size()) +
                                        " bytes does not hold a " + packet_name(pkt) +
                                        " packet (" + std::to_string(expected) + " bytes)");
        }
        return save_raw(packet_name(pkt), datagram);
    }

    /**
     * @brief Store raw datagram bytes under name
     * @return Path of the written file
     * @throws std::runtime_error if the directory or file cannot be written
     */
    std::filesystem::path save_raw(const std::string& name, std::span<const uint8_t> bytes) const {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory: " + directory_.string() + " (" +
                                     ec.message() + ")");
        }

        auto file_path = path_for(name);
        int fd = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd < 0) {
            throw std::runtime_error("Failed to create file: " + file_path.string() +
                                     " (errno=" + std::to_string(errno) + ")");
        }

        size_t written = 0;
        while (written < bytes.size()) {
            ssize_t result = ::write(fd, bytes.data() + written, bytes.size() - written);
            if (result < 0) {
                if (errno == EINTR) {
                    continue;
                }
                int err = errno;
                ::close(fd);
                throw std::runtime_error("Failed to write file: " + file_path.string() +
                                         " (errno=" + std::to_string(err) + ")");
            }
            written += static_cast<size_t>(result);
        }

        if (::close(fd) < 0) {
            throw std::runtime_error("Failed to close file: " + file_path.string() +
                                     " (errno=" + std::to_string(errno) + ")");
        }
        return file_path;
    }

    /**
     * @brief Read the raw bytes stored under name
     * @throws std::runtime_error if the file cannot be read
     */
    std::vector<uint8_t> load_raw(const std::string& name) const {
        return read_file(path_for(name));
    }

    /**
     * @brief Load and decode the sample stored under name
     * @throws std::runtime_error if the file cannot be read
     * @throws DecodeError if the stored bytes do not decode
     */
    Packet load(const std::string& name, const PacketRegistry& registry) const {
        auto bytes = load_raw(name);
        return registry.decode(bytes);
    }

    /**
     * @brief Load and decode every `*.bin` sample in the directory
     *
     * @return Packets keyed by file stem
     * @throws std::runtime_error if the directory cannot be listed
     */
    std::map<std::string, Packet> load_all(const PacketRegistry& registry) const {
        std::error_code ec;
        std::filesystem::directory_iterator it(directory_, ec);
        if (ec) {
            throw std::runtime_error("Failed to list directory: " + directory_.string() + " (" +
                                     ec.message() + ")");
        }

        std::map<std::string, Packet> packets;
        for (const auto& entry : it) {
            if (!entry.is_regular_file() || entry.path().extension() != extension) {
                continue;
            }
            auto bytes = read_file(entry.path());
            packets.insert_or_assign(entry.path().stem().string(), registry.decode(bytes));
        }
        return packets;
    }

private:
    static std::vector<uint8_t> read_file(const std::filesystem::path& file_path) {
        std::FILE* file = std::fopen(file_path.c_str(), "rb");
        if (file == nullptr) {
            throw std::runtime_error("Failed to open file: " + file_path.string() +
                                     " (errno=" + std::to_string(errno) + ")");
        }

        std::vector<uint8_t> bytes;
        uint8_t chunk[4096];
        size_t count;
        while ((count = std::fread(chunk, 1, sizeof(chunk), file)) > 0) {
            bytes.insert(bytes.end(), chunk, chunk + count);
        }

        bool failed = std::ferror(file) != 0;
        std::fclose(file);
        if (failed) {
            throw std::runtime_error("Failed to read file: " + file_path.string());
        }
        return bytes;
    }

    std::filesystem::path directory_;
};

} // namespace f1telem::utils::fileio

namespace f1telem {

using utils::fileio::SamplePacketStore;

} // namespace f1telem
