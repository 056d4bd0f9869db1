#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace pcex {

// Frame decoding failures.
enum class DecodeErrc {
    too_small = 1,
    bad_magic,
    truncated_payload,
    checksum_mismatch,
    trailing_data,
    oversized_payload
};

// Channel setup and byte transport failures.
enum class TransportErrc {
    not_connected = 1,
    no_device_found,
    authorization_required,
    endpoint_not_found,
    channel_claim_failed,
    invalid_port,
    invalid_host,
    connect_failed,
    peer_closed,
    timed_out,
    address_in_use,
    io_failure
};

enum class ProtocolErrc {
    unexpected_response = 1,
    handshake_rejected,
    malformed_payload,
    payload_too_large
};

// Error codes carried by RESPONSE_ERROR. Values are part of the wire format.
enum class RemoteErrc : int32_t {
    success = 0,
    unknown_command = 1,
    invalid_path = 2,
    file_not_found = 3,
    permission_denied = 4,
    already_exists = 5,
    not_empty = 6,
    no_space = 7,
    io_error = 8,
    timeout = 9,
    protocol_error = 10
};

enum class TransferErrc {
    task_not_found = 1,
    task_finished,
    local_io,
    store_failure,
    cancelled
};

const std::error_category& decode_category() noexcept;
const std::error_category& transport_category() noexcept;
const std::error_category& protocol_category() noexcept;
const std::error_category& remote_category() noexcept;
const std::error_category& transfer_category() noexcept;

std::error_code make_error_code(DecodeErrc e) noexcept;
std::error_code make_error_code(TransportErrc e) noexcept;
std::error_code make_error_code(ProtocolErrc e) noexcept;
std::error_code make_error_code(RemoteErrc e) noexcept;
std::error_code make_error_code(TransferErrc e) noexcept;

// Wraps a raw wire error code without clamping unknown values.
inline std::error_code remote_error_code(int32_t code) noexcept {
    return std::error_code(code, remote_category());
}

struct Error {
    std::error_code code;
    std::string message;

    Error() = default;
    Error(std::error_code c, std::string msg = {}) : code(c), message(std::move(msg)) {}
    template <typename E, typename = std::enable_if_t<std::is_error_code_enum<E>::value>>
    Error(E e, std::string msg = {}) : code(make_error_code(e)), message(std::move(msg)) {}

    // Message followed by the category and code text, for logs and the CLI.
    std::string describe() const;
};

// Either a value or an Error. The error branch is selected by construction,
// not by the truthiness of the code (remote code 0 is still a failure).
template <typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }
    const Error& error() const { return std::get<1>(data_); }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)), failed_(true) {}

    bool ok() const { return !failed_; }
    explicit operator bool() const { return ok(); }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool failed_ = false;
};

} // namespace pcex

namespace std {
template <> struct is_error_code_enum<pcex::DecodeErrc> : true_type {};
template <> struct is_error_code_enum<pcex::TransportErrc> : true_type {};
template <> struct is_error_code_enum<pcex::ProtocolErrc> : true_type {};
template <> struct is_error_code_enum<pcex::RemoteErrc> : true_type {};
template <> struct is_error_code_enum<pcex::TransferErrc> : true_type {};
} // namespace std
