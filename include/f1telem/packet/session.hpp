#pragma once

#include <array>
#include <tuple>

#include <cstdint>

#include "../core/header.hpp"
#include "../core/record_traits.hpp"
#include "../core/wire_codec.hpp"
#include "../types.hpp"

namespace f1telem {

struct MarshalZone {
    float zone_start; // Fraction (0..1) of the lap where the zone starts
    int8_t zone_flag; // -1 = invalid/unknown, 0 = none, 1 = green, 2 = blue, 3 = yellow, 4 = red

    bool operator==(const MarshalZone&) const = default;
};

template <>
struct RecordTraits<MarshalZone> {
    static constexpr const char* name = "MarshalZone";
    static constexpr auto fields = std::make_tuple(field("zone_start", &MarshalZone::zone_start),
                                                   field("zone_flag", &MarshalZone::zone_flag));
};

struct WeatherForecastSample {
    uint8_t session_type;              // 0 = unknown, 1 = P1 ... 10 = R, 11 = R2, 12 = Time Trial
    uint8_t time_offset;               // Minutes ahead the forecast is for
    uint8_t weather;                   // 0 = clear ... 5 = storm
    int8_t track_temperature;          // Celsius
    int8_t track_temperature_change;   // 0 = up, 1 = down, 2 = no change
    int8_t air_temperature;            // Celsius
    int8_t air_temperature_change;     // 0 = up, 1 = down, 2 = no change
    uint8_t rain_percentage;           // 0-100

    bool operator==(const WeatherForecastSample&) const = default;
};

template <>
struct RecordTraits<WeatherForecastSample> {
    static constexpr const char* name = "WeatherForecastSample";
    static constexpr auto fields = std::make_tuple(
        field("session_type", &WeatherForecastSample::session_type),
        field("time_offset", &WeatherForecastSample::time_offset),
        field("weather", &WeatherForecastSample::weather),
        field("track_temperature", &WeatherForecastSample::track_temperature),
        field("track_temperature_change", &WeatherForecastSample::track_temperature_change),
        field("air_temperature", &WeatherForecastSample::air_temperature),
        field("air_temperature_change", &WeatherForecastSample::air_temperature_change),
        field("rain_percentage", &WeatherForecastSample::rain_percentage));
};

static_assert(wire_size<MarshalZone>() == 5);
static_assert(wire_size<WeatherForecastSample>() == 8);

/**
 * @brief Session packet (id 1)
 *
 * Only the first num_marshal_zones zones and the first
 * num_weather_forecast_samples samples are meaningful.
 */
struct PacketSessionData {
    static constexpr PacketId id = PacketId::session;

    PacketHeader header;
    uint8_t weather;            // 0 = clear, 1 = light cloud, 2 = overcast, 3 = light rain,
                                // 4 = heavy rain, 5 = storm
    int8_t track_temperature;   // Celsius
    int8_t air_temperature;     // Celsius
    uint8_t total_laps;
    uint16_t track_length;      // Metres
    uint8_t session_type;
    int8_t track_id;            // -1 for unknown
    uint8_t formula;            // 0 = F1 Modern, 1 = F1 Classic, 2 = F2, 3 = F1 Generic
    uint16_t session_time_left; // Seconds
    uint16_t session_duration;  // Seconds
    uint8_t pit_speed_limit;    // km/h
    uint8_t game_paused;
    uint8_t is_spectating;
    uint8_t spectator_car_index;
    uint8_t sli_pro_native_support;
    uint8_t num_marshal_zones;
    std::array<MarshalZone, max_marshal_zones> marshal_zones;
    uint8_t safety_car_status;  // 0 = none, 1 = full, 2 = virtual, 3 = formation lap
    uint8_t network_game;       // 0 = offline, 1 = online
    uint8_t num_weather_forecast_samples;
    std::array<WeatherForecastSample, max_weather_forecast_samples> weather_forecast_samples;
    uint8_t forecast_accuracy;  // 0 = perfect, 1 = approximate
    uint8_t ai_difficulty;      // 0-110
    uint32_t season_link_identifier;
    uint32_t weekend_link_identifier;
    uint32_t session_link_identifier;
    uint8_t pit_stop_window_ideal_lap;
    uint8_t pit_stop_window_latest_lap;
    uint8_t pit_stop_rejoin_position;
    uint8_t steering_assist;
    uint8_t braking_assist;     // 0 = off, 1 = low, 2 = medium, 3 = high
    uint8_t gearbox_assist;     // 1 = manual, 2 = manual & suggested gear, 3 = auto
    uint8_t pit_assist;
    uint8_t pit_release_assist;
    uint8_t ers_assist;
    uint8_t drs_assist;
    uint8_t dynamic_racing_line; // 0 = off, 1 = corners only, 2 = full
    uint8_t dynamic_racing_line_type; // 0 = 2D, 1 = 3D

    bool operator==(const PacketSessionData&) const = default;
};

template <>
struct RecordTraits<PacketSessionData> {
    static constexpr const char* name = "PacketSessionData";
    static constexpr auto fields = std::make_tuple(
        field("header", &PacketSessionData::header),
        field("weather", &PacketSessionData::weather),
        field("track_temperature", &PacketSessionData::track_temperature),
        field("air_temperature", &PacketSessionData::air_temperature),
        field("total_laps", &PacketSessionData::total_laps),
        field("track_length", &PacketSessionData::track_length),
        field("session_type", &PacketSessionData::session_type),
        field("track_id", &PacketSessionData::track_id),
        field("formula", &PacketSessionData::formula),
        field("session_time_left", &PacketSessionData::session_time_left),
        field("session_duration", &PacketSessionData::session_duration),
        field("pit_speed_limit", &PacketSessionData::pit_speed_limit),
        field("game_paused", &PacketSessionData::game_paused),
        field("is_spectating", &PacketSessionData::is_spectating),
        field("spectator_car_index", &PacketSessionData::spectator_car_index),
        field("sli_pro_native_support", &PacketSessionData::sli_pro_native_support),
        field("num_marshal_zones", &PacketSessionData::num_marshal_zones),
        field("marshal_zones", &PacketSessionData::marshal_zones),
        field("safety_car_status", &PacketSessionData::safety_car_status),
        field("network_game", &PacketSessionData::network_game),
        field("num_weather_forecast_samples", &PacketSessionData::num_weather_forecast_samples),
        field("weather_forecast_samples", &PacketSessionData::weather_forecast_samples),
        field("forecast_accuracy", &PacketSessionData::forecast_accuracy),
        field("ai_difficulty", &PacketSessionData::ai_difficulty),
        field("season_link_identifier", &PacketSessionData::season_link_identifier),
        field("weekend_link_identifier", &PacketSessionData::weekend_link_identifier),
        field("session_link_identifier", &PacketSessionData::session_link_identifier),
        field("pit_stop_window_ideal_lap", &PacketSessionData::pit_stop_window_ideal_lap),
        field("pit_stop_window_latest_lap", &PacketSessionData::pit_stop_window_latest_lap),
        field("pit_stop_rejoin_position", &PacketSessionData::pit_stop_rejoin_position),
        field("steering_assist", &PacketSessionData::steering_assist),
        field("braking_assist", &PacketSessionData::braking_assist),
        field("gearbox_assist", &PacketSessionData::gearbox_assist),
        field("pit_assist", &PacketSessionData::pit_assist),
        field("pit_release_assist", &PacketSessionData::pit_release_assist),
        field("ers_assist", &PacketSessionData::ers_assist),
        field("drs_assist", &PacketSessionData::drs_assist),
        field("dynamic_racing_line", &PacketSessionData::dynamic_racing_line),
        field("dynamic_racing_line_type", &PacketSessionData::dynamic_racing_line_type));
};

static_assert(wire_size<PacketSessionData>() == 625);

} // namespace f1telem
