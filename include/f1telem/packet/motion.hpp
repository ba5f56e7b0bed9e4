#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

/**
 * @brief Physics state of one car
 *
 * Direction vectors are normalised and scaled to int16 on the wire; divide
 * by 32767.0f to recover the float component.
 */
struct CarMotionData {
    float world_position_x;   // World space X position
    float world_position_y;   // World space Y position
    float world_position_z;   // World space Z position
    float world_velocity_x;   // Velocity in world space X
    float world_velocity_y;   // Velocity in world space Y
    float world_velocity_z;   // Velocity in world space Z
    int16_t world_forward_dir_x;
    int16_t world_forward_dir_y;
    int16_t world_forward_dir_z;
    int16_t world_right_dir_x;
    int16_t world_right_dir_y;
    int16_t world_right_dir_z;
    float g_force_lateral;
    float g_force_longitudinal;
    float g_force_vertical;
    float yaw;   // Radians
    float pitch; // Radians
    float roll;  // Radians

    bool operator==(const CarMotionData&) const = default;
};

template <>
struct RecordTraits<CarMotionData> {
    static constexpr const char* name = "CarMotionData";
    static constexpr auto fields = std::make_tuple(
        field("world_position_x", &CarMotionData::world_position_x),
        field("world_position_y", &CarMotionData::world_position_y),
        field("world_position_z", &CarMotionData::world_position_z),
        field("world_velocity_x", &CarMotionData::world_velocity_x),
        field("world_velocity_y", &CarMotionData::world_velocity_y),
        field("world_velocity_z", &CarMotionData::world_velocity_z),
        field("world_forward_dir_x", &CarMotionData::world_forward_dir_x),
        field("world_forward_dir_y", &CarMotionData::world_forward_dir_y),
        field("world_forward_dir_z", &CarMotionData::world_forward_dir_z),
        field("world_right_dir_x", &CarMotionData::world_right_dir_x),
        field("world_right_dir_y", &CarMotionData::world_right_dir_y),
        field("world_right_dir_z", &CarMotionData::world_right_dir_z),
        field("g_force_lateral", &CarMotionData::g_force_lateral),
        field("g_force_longitudinal", &CarMotionData::g_force_longitudinal),
        field("g_force_vertical", &CarMotionData::g_force_vertical),
        field("yaw", &CarMotionData::yaw),
        field("pitch", &CarMotionData::pitch),
        field("roll", &CarMotionData::roll));
};

static_assert(wire_size<CarMotionData>() == 60);

/**
 * @brief Motion packet (id 0)
 *
 * Motion for every car, followed by data that is only sent for the player's
 * car. All wheel arrays are ordered RL, RR, FL, FR.
 */
struct PacketMotionData {
    static constexpr PacketId id = PacketId::motion;

    PacketHeader header;
    std::array<CarMotionData, max_cars> car_motion_data;

    // Player car only
    std::array<float, wheel_count> suspension_position;
    std::array<float, wheel_count> suspension_velocity;
    std::array<float, wheel_count> suspension_acceleration;
    std::array<float, wheel_count> wheel_speed;
    std::array<float, wheel_count> wheel_slip;
    float local_velocity_x;
    float local_velocity_y;
    float local_velocity_z;
    float angular_velocity_x;
    float angular_velocity_y;
    float angular_velocity_z;
    float angular_acceleration_x;
    float angular_acceleration_y;
    float angular_acceleration_z;
    float front_wheels_angle; // Radians

    bool operator==(const PacketMotionData&) const = default;
};

template <>
struct RecordTraits<PacketMotionData> {
    static constexpr const char* name = "PacketMotionData";
    static constexpr auto fields = std::make_tuple(
        field("header", &PacketMotionData::header),
        field("car_motion_data", &PacketMotionData::car_motion_data),
        field("suspension_position", &PacketMotionData::suspension_position),
        field("suspension_velocity", &PacketMotionData::suspension_velocity),
        field("suspension_acceleration", &PacketMotionData::suspension_acceleration),
        field("wheel_speed", &PacketMotionData::wheel_speed),
        field("wheel_slip", &PacketMotionData::wheel_slip),
        field("local_velocity_x", &PacketMotionData::local_velocity_x),
        field("local_velocity_y", &PacketMotionData::local_velocity_y),
        field("local_velocity_z", &PacketMotionData::local_velocity_z),
        field("angular_velocity_x", &PacketMotionData::angular_velocity_x),
        field("angular_velocity_y", &PacketMotionData::angular_velocity_y),
        field("angular_velocity_z", &PacketMotionData::angular_velocity_z),
        field("angular_acceleration_x", &PacketMotionData::angular_acceleration_x),
        field("angular_acceleration_y", &PacketMotionData::angular_acceleration_y),
        field("angular_acceleration_z", &PacketMotionData::angular_acceleration_z),
        field("front_wheels_angle", &PacketMotionData::front_wheels_angle));
};

static_assert(wire_size<PacketMotionData>() == 1464);

} // namespace f1telem
