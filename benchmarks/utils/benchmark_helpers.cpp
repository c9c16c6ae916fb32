/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::media_upload::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_mp4_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    static constexpr uint8_t header[] = {0x00, 0x00, 0x00, 0x18, 'f', 't',
                                         'y',  'p',  'i',  's',  'o', 'm'};
    auto data = generate_random_data(size, seed);
    for (std::size_t i = 0; i < sizeof(header) && i < data.size(); ++i) {
        data[i] = static_cast<std::byte>(header[i]);
    }
    return data;
}

// loopback_transport implementation

auto loopback_transport::post_form(const std::string& /*url*/,
                                   const form_fields& fields,
                                   const request_options& /*options*/)
    -> result<transport_response> {
    ++requests_;
    transport_response response;
    std::string command;
    for (const auto& [k, v] : fields) {
        if (k == "command") {
            command = v;
        }
    }
    if (command == "INIT") {
        response.status_code = 202;
        response.body = R"({"media_id":1,"media_id_string":"1","expires_after_secs":86400})";
    } else if (command == "FINALIZE") {
        response.status_code = 201;
        response.body = R"({"media_id":1,"media_id_string":"1","size":1})";
    } else {
        response.status_code = 204;
    }
    return response;
}

auto loopback_transport::post_json(const std::string& /*url*/,
                                   const std::string& /*body*/,
                                   const request_options& /*options*/)
    -> result<transport_response> {
    ++requests_;
    transport_response response;
    response.status_code = 200;
    return response;
}

auto loopback_transport::get_json(const std::string& /*url*/,
                                  const query_params& /*query*/,
                                  const request_options& /*options*/)
    -> result<transport_response> {
    ++requests_;
    transport_response response;
    response.status_code = 200;
    response.body = R"({"media_id_string":"1","processing_info":{"state":"succeeded"}})";
    return response;
}

// instant_timer_service implementation

auto instant_timer_service::now() const -> time_point {
    std::lock_guard lock(mutex_);
    return now_;
}

auto instant_timer_service::wait_for(std::chrono::milliseconds duration,
                                     const cancellation_token& token) -> bool {
    if (token.is_cancelled()) {
        return false;
    }
    std::lock_guard lock(mutex_);
    now_ += duration;
    return true;
}

// Formatting functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(sizes::MB) << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(sizes::KB) << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace kcenon::media_upload::benchmark
